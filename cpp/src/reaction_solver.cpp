#include "beamdiag/reaction_solver.hpp"
#include "beamdiag/flexibility_diagnostics.hpp"
#include "beamdiag/node_set.hpp"

#include <stdexcept>
#include <string>

namespace beamdiag {

namespace {

/// Resultant force and moment about a_left of a set of loads
void accumulate(const Load& load, double a_left, double& force, double& moment) {
    force += load.resultant();
    moment += load.moment_about(a_left);
}

ReactionMap two_support_reactions(const Support& left, const Support& right,
                                  double force, double moment) {
    double span = right.position - left.position;
    double R_right = moment / span;
    double R_left = force - R_right;

    ReactionMap reactions;
    reactions[left.name] = R_left;
    reactions[right.name] = R_right;
    return reactions;
}

} // namespace

// =============================================================================
// Determinate
// =============================================================================

ReactionMap DeterminateReactionSolver::reactions(const Beam& beam) {
    const auto& supports = beam.supports();
    if (supports.size() != 2) {
        throw std::invalid_argument("DeterminateReactionSolver: beam must have exactly two supports, has "
                                    + std::to_string(supports.size()));
    }

    const Support& left = supports.front();
    const Support& right = supports.back();

    double force = 0.0;
    double moment = 0.0;
    for (const auto& load : beam.loads()) {
        accumulate(load, left.position, force, moment);
    }
    return two_support_reactions(left, right, force, moment);
}

ReactionSolution DeterminateReactionSolver::solve(const Beam& beam) const {
    ReactionSolution solution;
    solution.system_type = SystemType::Determinate;
    solution.reactions = reactions(beam);
    return solution;
}

ReactionMap superpose_redundants(const Beam& beam, const Eigen::VectorXd& redundants) {
    const auto& supports = beam.supports();
    if (supports.size() < 2 ||
        redundants.size() != static_cast<Eigen::Index>(supports.size()) - 2) {
        throw std::invalid_argument("superpose_redundants: redundant count does not match supports");
    }

    const Support& left = supports.front();
    const Support& right = supports.back();

    double force = 0.0;
    double moment = 0.0;
    for (const auto& load : beam.loads()) {
        accumulate(load, left.position, force, moment);
    }
    // A redundant reaction is an upward force, i.e. a negative point force
    for (Eigen::Index i = 0; i < redundants.size(); ++i) {
        const Support& s = supports[static_cast<size_t>(i) + 1];
        accumulate(Load::point_force(s.position, -redundants(i)), left.position, force, moment);
    }

    ReactionMap reactions = two_support_reactions(left, right, force, moment);
    for (Eigen::Index i = 0; i < redundants.size(); ++i) {
        reactions[supports[static_cast<size_t>(i) + 1].name] = redundants(i);
    }
    return reactions;
}

// =============================================================================
// Flexibility method
// =============================================================================

FlexibilityReactionSolver::FlexibilityReactionSolver(double node_tolerance,
                                                     const IntegratorSettings& integrator,
                                                     const CorrectorSettings& corrector,
                                                     const FlexibilitySettings& settings)
    : node_tolerance_(node_tolerance),
      integrator_(integrator),
      corrector_(corrector),
      settings_(settings) {
}

Eigen::VectorXd FlexibilityReactionSolver::primary_deflections(const Beam& primary,
                                                               const std::vector<double>& positions,
                                                               WarningList& warnings) const {
    ReactionMap reactions = DeterminateReactionSolver::reactions(primary);

    NodeSetBuilder builder(node_tolerance_);
    std::vector<DiagramNode> nodes = builder.build(primary, positions);

    PiecewiseIntegrator integrator(integrator_);
    RawDiagram raw = integrator.integrate(primary, nodes, reactions);

    BoundaryCorrector corrector(corrector_);
    corrector.apply(primary, reactions, raw, warnings);

    Eigen::VectorXd deflections(static_cast<Eigen::Index>(positions.size()));
    for (size_t i = 0; i < positions.size(); ++i) {
        const NodeState* state = raw.node_at(positions[i], node_tolerance_);
        if (state == nullptr) {
            throw std::runtime_error("FlexibilityReactionSolver: no node at probe position "
                                     + std::to_string(positions[i]));
        }
        deflections(static_cast<Eigen::Index>(i)) = state->deflection;
    }
    return deflections;
}

ReactionSolution FlexibilityReactionSolver::solve(const Beam& beam) const {
    const auto& supports = beam.supports();
    if (supports.size() < 3) {
        throw std::invalid_argument("FlexibilityReactionSolver: needs at least three supports, has "
                                    + std::to_string(supports.size()));
    }

    ReactionSolution solution;
    solution.system_type = SystemType::Indeterminate;

    std::vector<double> positions;
    for (size_t i = 1; i + 1 < supports.size(); ++i) {
        positions.push_back(supports[i].position);
        solution.redundant_supports.push_back(supports[i].name);
    }
    const Eigen::Index m = static_cast<Eigen::Index>(positions.size());

    // Load term: primary structure under the applied loads
    Beam primary = beam.primary_structure();
    solution.load_deflections = primary_deflections(primary, positions, solution.warnings);

    // Flexibility coefficients: unit upward force at each redundant in turn
    Beam unloaded = primary;
    unloaded.clear_loads();
    solution.flexibility = Eigen::MatrixXd::Zero(m, m);
    for (Eigen::Index j = 0; j < m; ++j) {
        Beam unit = unloaded;
        unit.add_point_force(positions[static_cast<size_t>(j)], -1.0);
        solution.flexibility.col(j) = primary_deflections(unit, positions, solution.warnings);
    }

    FlexibilityDiagnostics diagnostics = FlexibilityAnalyzer::analyze(
        solution.flexibility, solution.redundant_supports, settings_.singular_rcond);
    solution.rcond = diagnostics.rcond;

    if (diagnostics.is_singular) {
        BeamError err = BeamError::singular_flexibility(diagnostics.rcond,
                                                        diagnostics.involved_supports);
        err.details["min_eigenvalue"] = std::to_string(diagnostics.min_eigenvalue);
        err.details["max_eigenvalue"] = std::to_string(diagnostics.max_eigenvalue);
        throw SolveError(err);
    }
    if (diagnostics.rcond < settings_.warning_rcond) {
        BeamWarning warn = BeamWarning::ill_conditioned(diagnostics.rcond);
        warn.involved_supports = diagnostics.involved_supports;
        solution.warnings.add(warn);
    }

    // Compatibility: f R + δ = 0
    Eigen::VectorXd redundants = solution.flexibility.fullPivLu().solve(-solution.load_deflections);
    solution.reactions = superpose_redundants(beam, redundants);
    return solution;
}

} // namespace beamdiag
