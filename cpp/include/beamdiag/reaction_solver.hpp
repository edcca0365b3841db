#pragma once

#include "beamdiag/beam.hpp"
#include "beamdiag/boundary_corrector.hpp"
#include "beamdiag/piecewise_integrator.hpp"
#include "beamdiag/warnings.hpp"

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace beamdiag {

/**
 * @brief Thresholds for accepting a flexibility matrix
 *
 * The coefficients come from numerical integration and carry a relative
 * error of roughly 1e-7, so a reciprocal condition number below that level
 * no longer determines the redundants.
 */
struct FlexibilitySettings {
    /// Below this rcond the matrix is rejected with SolveError
    double singular_rcond = 1e-7;

    /// Below this rcond the solve proceeds with a warning
    double warning_rcond = 1e-4;
};

/**
 * @brief Reactions and the bookkeeping of how they were obtained
 */
struct ReactionSolution {
    ReactionMap reactions;

    SystemType system_type = SystemType::Determinate;

    /// Names of the redundant supports, in position order
    std::vector<std::string> redundant_supports;

    /// f(i, j): deflection at redundant i from a unit upward force at redundant j
    Eigen::MatrixXd flexibility;

    /// Deflection at each redundant position on the primary structure under the applied loads
    Eigen::VectorXd load_deflections;

    /// Reciprocal condition number of the flexibility matrix (1 if none)
    double rcond = 1.0;

    WarningList warnings;
};

/**
 * @brief Strategy interface for resolving support reactions
 */
class ReactionSolver {
public:
    virtual ~ReactionSolver() = default;

    /**
     * @brief Resolve the vertical reaction at every support
     * @param beam Validated beam
     * @return Reactions keyed by support name, positive upward
     */
    virtual ReactionSolution solve(const Beam& beam) const = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Closed-form statics for a beam with exactly two supports
 *
 * Moment equilibrium about the left support and vertical force
 * equilibrium:
 *   R_right = (Σ F (x - a_left) + Σ M0) / (a_right - a_left)
 *   R_left  = Σ F - R_right
 */
class DeterminateReactionSolver : public ReactionSolver {
public:
    /**
     * @throws std::invalid_argument if the beam does not have exactly two supports
     */
    ReactionSolution solve(const Beam& beam) const override;

    std::string name() const override { return "determinate"; }

    /**
     * @brief Reactions of the two supports only
     */
    static ReactionMap reactions(const Beam& beam);
};

/**
 * @brief Flexibility (force) method for three or more supports
 *
 * Primary structure: the two extreme supports. The n-2 intermediate
 * reactions are redundants. Unit loads are applied upward, so f has a
 * positive diagonal and compatibility
 *   f R + δ = 0
 * gives positive reactions for supports that hold the beam up.
 *
 * Each deflection is obtained by a full node-aware integration and boundary
 * correction of the primary structure, with the redundant positions inserted
 * as probe nodes.
 */
class FlexibilityReactionSolver : public ReactionSolver {
public:
    FlexibilityReactionSolver(double node_tolerance = COORDINATE_TOLERANCE,
                              const IntegratorSettings& integrator = IntegratorSettings(),
                              const CorrectorSettings& corrector = CorrectorSettings(),
                              const FlexibilitySettings& settings = FlexibilitySettings());

    /**
     * @throws SolveError SINGULAR_FLEXIBILITY_MATRIX if rcond < singular_rcond
     * @throws std::invalid_argument if the beam has fewer than three supports
     */
    ReactionSolution solve(const Beam& beam) const override;

    std::string name() const override { return "flexibility"; }

    /**
     * @brief Deflections of a two-support beam at the given positions
     *
     * The beam is solved statically, integrated and corrected; the values
     * are read at probe nodes inserted at the positions.
     */
    Eigen::VectorXd primary_deflections(const Beam& primary,
                                        const std::vector<double>& positions,
                                        WarningList& warnings) const;

    const FlexibilitySettings& settings() const { return settings_; }

private:
    double node_tolerance_;
    IntegratorSettings integrator_;
    CorrectorSettings corrector_;
    FlexibilitySettings settings_;
};

/**
 * @brief Combine solved redundant reactions with the primary structure
 *
 * Each redundant R_i acts as an upward point force on the primary structure;
 * the extreme reactions are the statics of the applied loads plus those forces.
 *
 * @param beam Beam with all supports
 * @param redundants Redundant reactions, in the order of the intermediate supports
 */
ReactionMap superpose_redundants(const Beam& beam, const Eigen::VectorXd& redundants);

} // namespace beamdiag
