#pragma once

#include "beamdiag/beam.hpp"
#include "beamdiag/warnings.hpp"

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace beamdiag {

/**
 * @brief Diagram quantity selector
 *
 * Sign conventions:
 * - Shear V: dV/dx = -w, positive upward on the left face
 * - Moment M: dM/dx = V, sagging positive
 * - Rotation θ = ∫ M/EI dx [rad]
 * - Deflection y = ∫ θ dx [m], positive upward
 */
enum class DiagramQuantity {
    Shear,
    Moment,
    Rotation,
    Deflection
};

std::string diagram_quantity_to_string(DiagramQuantity quantity);

/**
 * @brief Extremum location and value
 */
struct DiagramExtreme {
    double x = 0.0;      ///< Position along beam [m]
    double value = 0.0;  ///< Value at extremum

    DiagramExtreme() = default;
    DiagramExtreme(double pos, double val) : x(pos), value(val) {}
};

/**
 * @brief Exact state recorded at a breakpoint
 *
 * Shear and moment may jump at a node, so both one-sided limits are kept.
 * Rotation and deflection are continuous.
 */
struct NodeState {
    int node_id = 0;
    double x = 0.0;             ///< [m]
    double shear_left = 0.0;    ///< V just left of x [N]
    double shear_right = 0.0;   ///< V just right of x [N]
    double moment_left = 0.0;   ///< M just left of x [N·m]
    double moment_right = 0.0;  ///< M just right of x [N·m]
    double rotation = 0.0;      ///< [rad]
    double deflection = 0.0;    ///< [m]
    bool is_support = false;

    double shear_jump() const { return shear_right - shear_left; }
    double moment_jump() const { return moment_right - moment_left; }
};

/**
 * @brief Output of a diagram computation
 *
 * Sample arrays are parallel and ordered by x. Where V or M jumps, the
 * coordinate appears twice: first with the left limit, then with the
 * right limit.
 */
struct DiagramResult {
    Eigen::VectorXd x;
    Eigen::VectorXd shear;
    Eigen::VectorXd moment;
    Eigen::VectorXd rotation;
    Eigen::VectorXd deflection;

    /// Exact breakpoint states (empty when the fallback produced the result)
    std::vector<NodeState> nodes;

    ReactionMap reactions;

    SystemType system_type = SystemType::Determinate;
    int degree_of_indeterminacy = 0;

    /// Reciprocal condition number of the flexibility matrix (1 if none was built,
    /// 0 if it was rejected and the fallback produced the result)
    double flexibility_rcond = 1.0;

    bool used_fallback = false;

    WarningList warnings;

    size_t size() const { return static_cast<size_t>(x.size()); }

    const Eigen::VectorXd& values(DiagramQuantity quantity) const;

    DiagramExtreme max(DiagramQuantity quantity) const;
    DiagramExtreme min(DiagramQuantity quantity) const;

    /**
     * @brief Largest absolute value with its position (signed value is returned)
     */
    DiagramExtreme extreme(DiagramQuantity quantity) const;

    /**
     * @brief Linear interpolation of a quantity at x
     *
     * At a jump the right limit is returned. Outside [0, L] the end value is used.
     */
    double value_at(DiagramQuantity quantity, double x) const;

    /**
     * @brief Reaction of the named support [N]
     * @throws ValidationError UNKNOWN_SUPPORT
     */
    double reaction(const std::string& name) const;

    double reaction_sum() const;

    /// Node state within tolerance of x, nullptr if none
    const NodeState* node_at(double x, double tolerance = 1e-9) const;

    /// Coordinates of all breakpoints
    std::vector<double> event_positions() const;

    std::string summary() const;
};

} // namespace beamdiag
