#include "beamdiag/statics.hpp"

namespace beamdiag {

double reaction_of(const ReactionMap& reactions, const Support& support) {
    auto it = reactions.find(support.name);
    if (it == reactions.end()) {
        throw ValidationError(BeamError::unknown_support(support.name));
    }
    return it->second;
}

double static_shear(const Beam& beam, const ReactionMap& reactions, double x, bool left_limit) {
    double V = 0.0;
    for (const auto& support : beam.supports()) {
        V += reaction_of(reactions, support) * step(x, support.position, left_limit);
    }
    for (const auto& load : beam.loads()) {
        V += load.shear_contribution(x, left_limit);
    }
    return V;
}

double static_moment(const Beam& beam, const ReactionMap& reactions, double x, bool left_limit) {
    double M = 0.0;
    for (const auto& support : beam.supports()) {
        M += reaction_of(reactions, support) * (x - support.position)
             * step(x, support.position, left_limit);
    }
    for (const auto& load : beam.loads()) {
        M += load.moment_contribution(x, left_limit);
    }
    return M;
}

} // namespace beamdiag
