/**
 * @file test_node_set.cpp
 * @brief Tests for breakpoint collection and merging
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "beamdiag/beam.hpp"
#include "beamdiag/node_set.hpp"

#include <vector>

using namespace beamdiag;
using Catch::Matchers::WithinAbs;

namespace {

Beam mixed_beam() {
    Beam beam(10.0, 210e9, 8e-6);
    beam.add_support(0.0);
    beam.add_support(10.0);
    beam.add_point_force(3.0, 10.0);
    beam.add_uniform_load(2.0, 6.0, 1.5);
    beam.add_point_moment(6.0, 200.0);
    return beam;
}

} // namespace

TEST_CASE("NodeSetBuilder: collects every breakpoint in order", "[NodeSet]") {
    Beam beam = mixed_beam();
    NodeSetBuilder builder;
    std::vector<DiagramNode> nodes = builder.build(beam);

    std::vector<double> expected = {0.0, 2.0, 3.0, 6.0, 10.0};
    REQUIRE(nodes.size() == expected.size());
    for (size_t i = 0; i < nodes.size(); ++i) {
        REQUIRE_THAT(nodes[i].x, WithinAbs(expected[i], 1e-12));
        REQUIRE(nodes[i].id == static_cast<int>(i));
    }
}

TEST_CASE("NodeSetBuilder: annotates node events", "[NodeSet]") {
    Beam beam = mixed_beam();
    std::vector<DiagramNode> nodes = NodeSetBuilder().build(beam);

    REQUIRE(nodes[0].has_event(NodeEvent::BeamStart));
    REQUIRE(nodes[0].has_event(NodeEvent::Support));
    REQUIRE(nodes[0].is_support());

    REQUIRE(nodes[1].has_event(NodeEvent::DistributedStart));
    REQUIRE_FALSE(nodes[1].is_support());

    REQUIRE(nodes[2].has_event(NodeEvent::PointForce));
    REQUIRE(nodes[2].load_indices.size() == 1);
    REQUIRE(nodes[2].load_indices[0] == 0);

    // Distributed end and point moment share x = 6
    REQUIRE(nodes[3].has_event(NodeEvent::DistributedEnd));
    REQUIRE(nodes[3].has_event(NodeEvent::PointMoment));
    REQUIRE(nodes[3].load_indices.size() == 2);

    REQUIRE(nodes[4].has_event(NodeEvent::BeamEnd));
    REQUIRE(nodes[4].support_indices.size() == 1);
    REQUIRE(nodes[4].support_indices[0] == 1);
}

TEST_CASE("NodeSetBuilder: merges coordinates within tolerance", "[NodeSet][tolerance]") {
    Beam beam(10.0, 210e9, 8e-6);
    beam.add_support(0.0);
    beam.add_support(10.0);
    beam.add_point_force(4.0, 1.0);
    beam.add_point_force(4.0 + 1e-12, 2.0);
    beam.add_point_force(10.0 - 1e-12, 3.0);

    std::vector<DiagramNode> nodes = NodeSetBuilder(1e-9).build(beam);

    REQUIRE(nodes.size() == 3);
    REQUIRE(nodes[1].load_indices.size() == 2);

    // The end node sits exactly at L
    REQUIRE(nodes[2].x == 10.0);
    REQUIRE(nodes[2].has_event(NodeEvent::PointForce));
    REQUIRE(nodes[2].has_event(NodeEvent::BeamEnd));
}

TEST_CASE("NodeSetBuilder: a coarse tolerance merges more", "[NodeSet][tolerance]") {
    Beam beam(10.0, 210e9, 8e-6);
    beam.add_support(0.0);
    beam.add_support(10.0);
    beam.add_point_force(4.0, 1.0);
    beam.add_point_force(4.05, 1.0);

    REQUIRE(NodeSetBuilder(1e-9).build(beam).size() == 4);
    REQUIRE(NodeSetBuilder(0.1).build(beam).size() == 3);
}

TEST_CASE("NodeSetBuilder: probes become nodes", "[NodeSet][probe]") {
    Beam beam(10.0, 210e9, 8e-6);
    beam.add_support(0.0);
    beam.add_support(10.0);

    std::vector<DiagramNode> nodes = NodeSetBuilder().build(beam, {2.5, 7.5});

    REQUIRE(nodes.size() == 4);
    REQUIRE(nodes[1].has_event(NodeEvent::Probe));
    REQUIRE_FALSE(nodes[1].is_support());
    REQUIRE(NodeSetBuilder::find_node(nodes, 7.5, 1e-9) == 2);
    REQUIRE(NodeSetBuilder::find_node(nodes, 5.0, 1e-9) == -1);
}

TEST_CASE("NodeSetBuilder: supports away from the ends", "[NodeSet]") {
    Beam beam(12.0, 210e9, 8e-6);
    beam.add_support(2.0);
    beam.add_support(9.0);
    beam.add_point_force(12.0, 5.0);

    std::vector<DiagramNode> nodes = NodeSetBuilder().build(beam);

    REQUIRE(nodes.size() == 4);
    REQUIRE_FALSE(nodes[0].is_support());
    REQUIRE(nodes[1].is_support());
    REQUIRE(nodes[2].is_support());
    REQUIRE(nodes[3].has_event(NodeEvent::PointForce));
    REQUIRE(node_event_to_string(NodeEvent::Support) == "support");
}
