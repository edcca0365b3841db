#pragma once

#include "beamdiag/beam.hpp"
#include "beamdiag/piecewise_integrator.hpp"
#include "beamdiag/warnings.hpp"

#include <vector>

namespace beamdiag {

/**
 * @brief Thresholds above which a correction is reported as a warning
 */
struct CorrectorSettings {
    /// Largest residual allowed, relative to the largest absolute value of the quantity
    double relative_tolerance = 1e-4;

    /// Residuals below this absolute value are never reported
    double absolute_floor = 1e-12;
};

/**
 * @brief Continuous piecewise-linear function through anchor points
 *
 * Constant beyond the first and last anchors. Integrals are exact and
 * measured from the first anchor, which lets a moment correction be carried
 * into rotation and deflection without re-integrating.
 */
class PiecewiseLinearCorrection {
public:
    /**
     * @param xs Anchor coordinates, strictly increasing
     * @param values Correction value at each anchor
     */
    PiecewiseLinearCorrection(const std::vector<double>& xs, const std::vector<double>& values);

    double value(double x) const;

    /// ∫ c(s) ds from the first anchor to x
    double integral(double x) const;

    /// ∫∫ c from the first anchor to x
    double double_integral(double x) const;

    bool empty() const { return xs_.empty(); }

private:
    /// Index of the anchor segment starting at or before x
    size_t segment(double x) const;

    std::vector<double> xs_;
    std::vector<double> values_;
    std::vector<double> first_;   ///< integral at each anchor
    std::vector<double> second_;  ///< double integral at each anchor
};

/**
 * @brief Forces the integrated diagrams onto their known boundary values
 *
 * Moment correction: the moment at every support (and at both beam ends) is
 * known exactly from statics. The residual against it is interpolated
 * piecewise-linearly between those anchors and subtracted from M. The same
 * correction is integrated once and twice and removed from θ and y.
 * At simply supported beam ends the anchor value is zero; at intermediate
 * supports of a continuous beam it is the support moment implied by the
 * resolved reactions.
 *
 * Deflection correction: a least-squares line through the support deflections
 * supplies the missing constants of integration θ(0) and y(0). Whatever the
 * line leaves at the supports is then removed by a piecewise-linear fit
 * anchored at every support, applied to y only. Deflection is exactly zero at
 * every support afterwards.
 */
class BoundaryCorrector {
public:
    explicit BoundaryCorrector(const CorrectorSettings& settings = CorrectorSettings());

    /**
     * @brief Apply both corrections in place
     * @param beam Beam the diagram belongs to
     * @param reactions Reactions used for the integration
     * @param diagram Raw diagram, modified in place
     * @param warnings Receives correction warnings
     */
    void apply(const Beam& beam, const ReactionMap& reactions,
               RawDiagram& diagram, WarningList& warnings) const;

    /**
     * @brief Remove moment drift against the exact support moments
     * @return Largest absolute residual removed at an anchor [N·m]
     */
    double correct_moment(const Beam& beam, const ReactionMap& reactions,
                          RawDiagram& diagram, WarningList& warnings) const;

    /**
     * @brief Force zero deflection at every support
     * @return Largest absolute residual left by the rigid-body line [m]
     */
    double correct_deflection(RawDiagram& diagram, WarningList& warnings) const;

    const CorrectorSettings& settings() const { return settings_; }

private:
    bool exceeds(double residual, double reference) const;

    CorrectorSettings settings_;
};

} // namespace beamdiag
