#pragma once

#include "beamdiag/beam.hpp"
#include "beamdiag/diagram.hpp"

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace beamdiag {

/**
 * @brief Configuration for the fallback integrator
 */
struct FallbackSettings {
    /// Points of the uniform grid over [0, L]
    int points = 2001;

    /// Relative pivot threshold for the rank-revealing least-squares solve
    double rank_threshold = 1e-6;
};

/**
 * @brief Diagrams sampled on a uniform grid
 */
struct ContinuousDiagram {
    Eigen::VectorXd x;
    Eigen::VectorXd shear;
    Eigen::VectorXd moment;
    Eigen::VectorXd rotation;
    Eigen::VectorXd deflection;
};

/**
 * @brief Degraded whole-domain integration used when the node-aware path fails
 *
 * Shear is evaluated on a uniform grid from the closed-form load
 * contributions with H(0) = 1/2 at every discontinuity; moment, rotation and
 * deflection follow by cumulative trapezoid integration, with point moments
 * added as half-steps in the same way. No breakpoints are inserted, so jumps
 * are smeared over one grid interval.
 *
 * Redundant reactions come from the same flexibility formulation evaluated
 * on the grid, solved in the minimum-norm least-squares sense so a singular
 * matrix still yields an equilibrated answer. Deflection is forced to zero
 * only at the two extreme supports, using the nearest grid points. Both ends
 * are pinned, not just the last support, so the rigid-body rotation is fixed;
 * interior supports may show a small nonzero deflection.
 */
class FallbackIntegrator {
public:
    explicit FallbackIntegrator(const FallbackSettings& settings = FallbackSettings());

    /**
     * @brief Full fallback evaluation
     * @param beam Validated beam
     * @param cause Error that made the primary pipeline give up, copied into the warning
     * @return Result flagged with used_fallback and a FALLBACK_ENGAGED warning
     */
    DiagramResult evaluate(const Beam& beam, const BeamError& cause = BeamError()) const;

    /**
     * @brief Reactions for any valid beam, never throwing on a singular system
     */
    ReactionMap solve_reactions(const Beam& beam) const;

    /**
     * @brief Integrate on the uniform grid with the given reactions
     */
    ContinuousDiagram integrate(const Beam& beam, const ReactionMap& reactions) const;

    const FallbackSettings& settings() const { return settings_; }

private:
    /// Deflection of a two-support beam at the given positions, by interpolation
    Eigen::VectorXd deflections_at(const Beam& primary, const std::vector<double>& positions) const;

    FallbackSettings settings_;
};

} // namespace beamdiag
