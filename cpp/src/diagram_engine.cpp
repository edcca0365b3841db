#include "beamdiag/diagram_engine.hpp"
#include "beamdiag/node_set.hpp"

#include <algorithm>
#include <cmath>

namespace beamdiag {

namespace {

Eigen::VectorXd to_vector(const std::vector<double>& values) {
    return Eigen::Map<const Eigen::VectorXd>(values.data(), static_cast<Eigen::Index>(values.size()));
}

} // namespace

DiagramEngine::DiagramEngine(const DiagramSettings& settings)
    : settings_(settings) {
}

std::unique_ptr<ReactionSolver> DiagramEngine::make_solver(SystemType type) const {
    switch (type) {
        case SystemType::Determinate:
            return std::make_unique<DeterminateReactionSolver>();
        case SystemType::Indeterminate:
            return std::make_unique<FlexibilityReactionSolver>(
                settings_.node_tolerance, settings_.integrator,
                settings_.corrector, settings_.flexibility);
        case SystemType::Underconstrained:
        default:
            throw ValidationError(BeamError(ErrorCode::UNDERCONSTRAINED_SYSTEM,
                "No reaction solver for a beam with fewer than two supports"));
    }
}

ReactionSolution DiagramEngine::solve_reactions(const Beam& beam) const {
    beam.validate();
    return make_solver(beam.classify())->solve(beam);
}

DiagramResult DiagramEngine::integrate(const Beam& beam, const ReactionSolution& solution) const {
    NodeSetBuilder builder(settings_.node_tolerance);
    std::vector<DiagramNode> nodes = builder.build(beam);

    PiecewiseIntegrator integrator(settings_.integrator);
    RawDiagram raw = integrator.integrate(beam, nodes, solution.reactions);

    DiagramResult result;
    result.warnings.merge(solution.warnings);

    BoundaryCorrector corrector(settings_.corrector);
    corrector.apply(beam, solution.reactions, raw, result.warnings);

    result.x = to_vector(raw.x);
    result.shear = to_vector(raw.shear);
    result.moment = to_vector(raw.moment);
    result.rotation = to_vector(raw.rotation);
    result.deflection = to_vector(raw.deflection);
    result.nodes = raw.nodes;
    result.reactions = solution.reactions;
    result.flexibility_rcond = solution.rcond;
    return result;
}

void DiagramEngine::check_result(const Beam& beam, DiagramResult& result) const {
    double applied = beam.total_applied_force();
    double scale = 0.0;
    for (const auto& load : beam.loads()) scale += std::abs(load.resultant());

    double residual = result.reaction_sum() - applied;
    if (scale > 0.0 && std::abs(residual) > settings_.equilibrium_tolerance * scale) {
        result.warnings.add(BeamWarning::equilibrium_residual(residual, applied));
    }

    for (const auto& support : beam.supports()) {
        auto it = result.reactions.find(support.name);
        if (it != result.reactions.end() && it->second < -settings_.equilibrium_tolerance * scale) {
            result.warnings.add(BeamWarning::uplift(support.name, it->second));
        }
    }
}

DiagramResult DiagramEngine::compute(const Beam& beam) const {
    beam.validate();

    const SystemType type = beam.classify();
    DiagramResult result;

    try {
        ReactionSolution solution = make_solver(type)->solve(beam);
        result = integrate(beam, solution);
    } catch (const SolveError& e) {
        if (!settings_.enable_fallback) throw;

        FallbackIntegrator fallback(settings_.fallback);
        result = fallback.evaluate(beam, e.error());
        result.flexibility_rcond = 0.0;
    }

    result.system_type = type;
    result.degree_of_indeterminacy = std::max(beam.degree_of_indeterminacy(), 0);

    if (beam.loads().empty()) {
        result.warnings.add(BeamWarning::no_loads());
    }
    check_result(beam, result);
    return result;
}

} // namespace beamdiag
