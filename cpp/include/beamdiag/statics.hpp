#pragma once

#include "beamdiag/beam.hpp"

namespace beamdiag {

/**
 * @brief Closed-form internal actions from equilibrium of the free body [0, x]
 *
 * Given resolved reactions, shear and moment at any section follow directly
 * from statics:
 *   V(x) = Σ R_i H(x - a_i) + Σ loads shear contribution
 *   M(x) = Σ R_i (x - a_i) H(x - a_i) + Σ loads moment contribution
 *
 * These values are exact and are used as anchors when removing quadrature
 * drift from the integrated diagrams.
 */

/**
 * @brief Shear at x [N]
 * @param left_limit Evaluate just left of x, excluding jumps located at x
 */
double static_shear(const Beam& beam, const ReactionMap& reactions, double x,
                    bool left_limit = false);

/**
 * @brief Bending moment at x [N·m]
 */
double static_moment(const Beam& beam, const ReactionMap& reactions, double x,
                     bool left_limit = false);

/**
 * @brief Reaction of a support, throwing if the map has no entry for it
 * @throws ValidationError UNKNOWN_SUPPORT
 */
double reaction_of(const ReactionMap& reactions, const Support& support);

} // namespace beamdiag
