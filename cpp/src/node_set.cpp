#include "beamdiag/node_set.hpp"

#include <algorithm>
#include <cmath>

namespace beamdiag {

std::string node_event_to_string(NodeEvent event) {
    switch (event) {
        case NodeEvent::BeamStart: return "beam_start";
        case NodeEvent::BeamEnd: return "beam_end";
        case NodeEvent::Support: return "support";
        case NodeEvent::PointForce: return "point_force";
        case NodeEvent::PointMoment: return "point_moment";
        case NodeEvent::DistributedStart: return "distributed_start";
        case NodeEvent::DistributedEnd: return "distributed_end";
        case NodeEvent::Probe: return "probe";
        default: return "unknown";
    }
}

bool DiagramNode::has_event(NodeEvent event) const {
    return std::find(events.begin(), events.end(), event) != events.end();
}

void DiagramNode::add_event(NodeEvent event) {
    if (!has_event(event)) events.push_back(event);
}

namespace {

struct Breakpoint {
    double x;
    NodeEvent event;
    int support_index;
    int load_index;
};

} // namespace

NodeSetBuilder::NodeSetBuilder(double tolerance)
    : tolerance_(tolerance) {
}

std::vector<DiagramNode> NodeSetBuilder::build(const Beam& beam,
                                               const std::vector<double>& probes) const {
    std::vector<Breakpoint> points;
    points.push_back({0.0, NodeEvent::BeamStart, -1, -1});
    points.push_back({beam.length(), NodeEvent::BeamEnd, -1, -1});

    const auto& supports = beam.supports();
    for (size_t i = 0; i < supports.size(); ++i) {
        points.push_back({supports[i].position, NodeEvent::Support, static_cast<int>(i), -1});
    }

    const auto& loads = beam.loads();
    for (size_t i = 0; i < loads.size(); ++i) {
        const Load& load = loads[i];
        int idx = static_cast<int>(i);
        switch (load.type) {
            case LoadType::PointForce:
                points.push_back({load.position, NodeEvent::PointForce, -1, idx});
                break;
            case LoadType::PointMoment:
                points.push_back({load.position, NodeEvent::PointMoment, -1, idx});
                break;
            case LoadType::LinearDistributed:
                points.push_back({load.start, NodeEvent::DistributedStart, -1, idx});
                points.push_back({load.end, NodeEvent::DistributedEnd, -1, idx});
                break;
        }
    }

    for (double p : probes) {
        points.push_back({std::min(std::max(p, 0.0), beam.length()), NodeEvent::Probe, -1, -1});
    }

    std::stable_sort(points.begin(), points.end(),
        [](const Breakpoint& a, const Breakpoint& b) { return a.x < b.x; });

    std::vector<DiagramNode> nodes;
    for (const auto& bp : points) {
        if (nodes.empty() || std::abs(bp.x - nodes.back().x) > tolerance_) {
            DiagramNode node;
            node.id = static_cast<int>(nodes.size());
            node.x = bp.x;
            nodes.push_back(node);
        }

        DiagramNode& node = nodes.back();
        node.add_event(bp.event);
        if (bp.support_index >= 0) node.support_indices.push_back(bp.support_index);
        if (bp.load_index >= 0 &&
            std::find(node.load_indices.begin(), node.load_indices.end(), bp.load_index)
                == node.load_indices.end()) {
            node.load_indices.push_back(bp.load_index);
        }
    }

    // The last node must sit exactly at L even if merged with a nearby event
    if (!nodes.empty() && nodes.back().has_event(NodeEvent::BeamEnd)) {
        nodes.back().x = beam.length();
    }

    return nodes;
}

int NodeSetBuilder::find_node(const std::vector<DiagramNode>& nodes, double x, double tolerance) {
    for (const auto& node : nodes) {
        if (std::abs(node.x - x) <= tolerance) return node.id;
    }
    return -1;
}

} // namespace beamdiag
