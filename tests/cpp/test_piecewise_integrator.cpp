/**
 * @file test_piecewise_integrator.cpp
 * @brief Tests for node-aware integration of shear, moment, rotation, deflection
 *
 * The integrator output is checked before any boundary correction. Shear is
 * exact for piecewise-linear intensities, moment is exact where shear is
 * piecewise linear, and rotation/deflection carry no integration constants.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "beamdiag/beam.hpp"
#include "beamdiag/node_set.hpp"
#include "beamdiag/piecewise_integrator.hpp"
#include "beamdiag/reaction_solver.hpp"
#include "beamdiag/statics.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

using namespace beamdiag;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

RawDiagram integrate_determinate(const Beam& beam,
                                 const IntegratorSettings& settings = IntegratorSettings()) {
    std::vector<DiagramNode> nodes = NodeSetBuilder().build(beam);
    PiecewiseIntegrator integrator(settings);
    return integrator.integrate(beam, nodes, DeterminateReactionSolver::reactions(beam));
}

bool near_node(const RawDiagram& raw, double x) {
    return raw.node_at(x, 1e-9) != nullptr;
}

} // namespace

// =============================================================================
// Jump Rules
// =============================================================================

TEST_CASE("PiecewiseIntegrator: point force and reaction jumps", "[PiecewiseIntegrator][jumps]") {
    Beam beam(6.0, 210e9, 8e-6);
    beam.add_support(0.0);
    beam.add_support(6.0);
    beam.add_point_force(3.0, 10.0);

    RawDiagram raw = integrate_determinate(beam);
    REQUIRE(raw.nodes.size() == 3);

    const NodeState& start = raw.nodes[0];
    REQUIRE_THAT(start.shear_left, WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(start.shear_right, WithinAbs(5.0, 1e-12));
    REQUIRE_THAT(start.shear_jump(), WithinAbs(5.0, 1e-12));
    REQUIRE(start.is_support);

    const NodeState& load = raw.nodes[1];
    REQUIRE_THAT(load.shear_left, WithinAbs(5.0, 1e-9));
    REQUIRE_THAT(load.shear_right, WithinAbs(-5.0, 1e-9));
    REQUIRE_THAT(load.shear_jump(), WithinAbs(-10.0, 1e-12));
    REQUIRE_THAT(load.moment_jump(), WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(load.moment_left, WithinAbs(15.0, 1e-9));

    const NodeState& end = raw.nodes[2];
    REQUIRE_THAT(end.shear_jump(), WithinAbs(5.0, 1e-12));
    REQUIRE_THAT(end.shear_right, WithinAbs(0.0, 1e-9));
    REQUIRE_THAT(end.moment_right, WithinAbs(0.0, 1e-9));
}

TEST_CASE("PiecewiseIntegrator: point moment jumps moment only", "[PiecewiseIntegrator][jumps]") {
    Beam beam(6.0, 210e9, 8e-6);
    beam.add_support(0.0);
    beam.add_support(6.0);
    beam.add_point_moment(3.0, 1000.0);

    RawDiagram raw = integrate_determinate(beam);
    const NodeState* node = raw.node_at(3.0);
    REQUIRE(node != nullptr);

    REQUIRE_THAT(node->moment_jump(), WithinAbs(1000.0, 1e-9));
    REQUIRE_THAT(node->shear_jump(), WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(node->moment_left, WithinAbs(-500.0, 1e-9));
    REQUIRE_THAT(node->moment_right, WithinAbs(500.0, 1e-9));
}

TEST_CASE("PiecewiseIntegrator: jumps are duplicated samples", "[PiecewiseIntegrator][sampling]") {
    Beam beam(6.0, 210e9, 8e-6);
    beam.add_support(0.0);
    beam.add_support(6.0);
    beam.add_point_force(3.0, 10.0);

    RawDiagram raw = integrate_determinate(beam);

    // 200 intervals per span; each of the three nodes carries a jump
    REQUIRE(raw.size() == 404);
    REQUIRE(std::is_sorted(raw.x.begin(), raw.x.end()));

    size_t duplicates = 0;
    for (size_t j = 1; j < raw.size(); ++j) {
        if (raw.x[j] == raw.x[j - 1]) {
            ++duplicates;
            // Rotation and deflection never jump
            REQUIRE(raw.rotation[j] == raw.rotation[j - 1]);
            REQUIRE(raw.deflection[j] == raw.deflection[j - 1]);
        }
    }
    REQUIRE(duplicates == 3);
}

TEST_CASE("PiecewiseIntegrator: no duplicate without a jump", "[PiecewiseIntegrator][sampling]") {
    Beam beam(10.0, 210e9, 8e-6);
    beam.add_support(0.0);
    beam.add_support(10.0);
    beam.add_uniform_load(0.0, 10.0, 2.0);
    beam.add_point_force(4.0, 0.0);

    RawDiagram raw = integrate_determinate(beam);

    REQUIRE(raw.node_at(4.0) != nullptr);
    size_t at_four = static_cast<size_t>(std::count(raw.x.begin(), raw.x.end(), 4.0));
    REQUIRE(at_four == 1);
}

TEST_CASE("PiecewiseIntegrator: sample density follows settings", "[PiecewiseIntegrator][sampling]") {
    Beam beam(10.0, 210e9, 8e-6);
    beam.add_support(0.0);
    beam.add_support(10.0);
    beam.add_point_force(9.99, 1.0);

    IntegratorSettings settings;
    settings.samples = 100;
    settings.min_samples_per_span = 6;
    RawDiagram raw = integrate_determinate(beam, settings);

    // Span [0, 9.99]: 100 intervals; span [9.99, 10]: the minimum of 6
    REQUIRE(raw.size() == 2 + 99 + 2 + 5 + 2);
}

// =============================================================================
// Accuracy Against Statics
// =============================================================================

TEST_CASE("PiecewiseIntegrator: shear matches statics between nodes", "[PiecewiseIntegrator][accuracy]") {
    Beam beam(10.0, 210e9, 8e-6);
    beam.add_support(1.0);
    beam.add_support(8.0);
    beam.add_point_force(3.0, 10.0);
    beam.add_linear_load(2.0, 6.0, 1.0, 4.0);
    beam.add_load(Load::triangular(5.0, 10.0, 2.0));
    beam.add_point_moment(7.0, -50.0);

    ReactionMap reactions = DeterminateReactionSolver::reactions(beam);
    RawDiagram raw = integrate_determinate(beam);

    double max_shear_error = 0.0;
    double max_moment_error = 0.0;
    double max_moment = 0.0;
    for (size_t j = 0; j < raw.size(); ++j) {
        if (near_node(raw, raw.x[j])) continue;
        max_shear_error = std::max(max_shear_error,
            std::abs(raw.shear[j] - static_shear(beam, reactions, raw.x[j])));
        max_moment_error = std::max(max_moment_error,
            std::abs(raw.moment[j] - static_moment(beam, reactions, raw.x[j])));
        max_moment = std::max(max_moment, std::abs(raw.moment[j]));
    }

    REQUIRE(max_shear_error < 1e-9);
    REQUIRE(max_moment_error < 1e-6 * max_moment);
}

TEST_CASE("PiecewiseIntegrator: uniform load moment is exact", "[PiecewiseIntegrator][accuracy]") {
    Beam beam(10.0, 210e9, 8e-6);
    beam.add_support(0.0);
    beam.add_support(10.0);
    beam.add_uniform_load(0.0, 10.0, 2.0);
    beam.add_point_force(5.0, 0.0);

    RawDiagram raw = integrate_determinate(beam);
    const NodeState* mid = raw.node_at(5.0);
    REQUIRE(mid != nullptr);
    REQUIRE_THAT(mid->shear_left, WithinAbs(0.0, 1e-9));
    REQUIRE_THAT(mid->moment_left, WithinAbs(25.0, 1e-9));
}

TEST_CASE("PiecewiseIntegrator: load edge merged into a node keeps the load", "[PiecewiseIntegrator][accuracy]") {
    // The load starts 0.5 mm from the support and merges into node 0
    Beam beam(10.0, 210e9, 8e-6);
    beam.add_support(0.0);
    beam.add_support(10.0);
    beam.add_uniform_load(0.0005, 10.0, 2.0);

    const double tolerance = 1e-3;
    std::vector<DiagramNode> nodes = NodeSetBuilder(tolerance).build(beam, {5.0});
    REQUIRE(nodes.size() == 3);

    ReactionMap reactions = DeterminateReactionSolver::reactions(beam);
    RawDiagram raw = PiecewiseIntegrator().integrate(beam, nodes, reactions);

    const NodeState* end = raw.node_at(10.0, tolerance);
    REQUIRE(end != nullptr);
    REQUIRE_THAT(end->shear_left, WithinAbs(-reactions.at("B"), 1e-9));
    REQUIRE_THAT(end->shear_right, WithinAbs(0.0, 1e-9));
    REQUIRE_THAT(end->moment_left, WithinAbs(0.0, 1e-5));

    const NodeState* mid = raw.node_at(5.0, tolerance);
    REQUIRE(mid != nullptr);
    REQUIRE_THAT(mid->moment_left, WithinAbs(static_moment(beam, reactions, 5.0, true), 1e-5));
    REQUIRE_THAT(mid->moment_left, WithinRel(25.0, 1e-3));
}

TEST_CASE("PiecewiseIntegrator: starts with zero rotation and deflection", "[PiecewiseIntegrator]") {
    Beam beam = Beam::with_rigidity(6.0, 1e4);
    beam.add_support(0.0);
    beam.add_support(6.0);
    beam.add_point_force(3.0, 10.0);

    RawDiagram raw = integrate_determinate(beam);

    REQUIRE(raw.rotation.front() == 0.0);
    REQUIRE(raw.deflection.front() == 0.0);

    // θ(x) = ∫ M / EI with M = 5x on [0, 3]: θ(3) = 22.5 / EI
    const NodeState* mid = raw.node_at(3.0);
    REQUIRE(mid != nullptr);
    REQUIRE_THAT(mid->rotation, WithinRel(22.5 / 1e4, 1e-9));
}

TEST_CASE("PiecewiseIntegrator: missing reaction is reported", "[PiecewiseIntegrator][errors]") {
    Beam beam(6.0, 210e9, 8e-6);
    beam.add_support(0.0, "A");
    beam.add_support(6.0, "B");

    ReactionMap reactions;
    reactions["A"] = 0.0;

    std::vector<DiagramNode> nodes = NodeSetBuilder().build(beam);
    PiecewiseIntegrator integrator;
    REQUIRE_THROWS_AS(integrator.integrate(beam, nodes, reactions), ValidationError);
}
