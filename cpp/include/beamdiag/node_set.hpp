#pragma once

#include "beamdiag/beam.hpp"

#include <string>
#include <vector>

namespace beamdiag {

/**
 * @brief Reason a coordinate became a breakpoint
 */
enum class NodeEvent {
    BeamStart,
    BeamEnd,
    Support,           ///< Reaction applied here
    PointForce,        ///< Shear jump
    PointMoment,       ///< Moment jump
    DistributedStart,
    DistributedEnd,
    Probe              ///< Requested sample point without structural meaning
};

std::string node_event_to_string(NodeEvent event);

/**
 * @brief Breakpoint along the beam
 *
 * Carries every event that lands on the coordinate, together with the
 * indices of the supports and loads responsible for them.
 */
struct DiagramNode {
    int id = 0;                        ///< Position in the sorted node list
    double x = 0.0;                    ///< Coordinate [m]
    std::vector<NodeEvent> events;
    std::vector<int> support_indices;  ///< Into Beam::supports()
    std::vector<int> load_indices;     ///< Into Beam::loads()

    bool has_event(NodeEvent event) const;
    bool is_support() const { return !support_indices.empty(); }
    void add_event(NodeEvent event);
};

/**
 * @brief Builds the ordered breakpoint list of a beam
 *
 * The result is the sorted union of {0, L}, support positions, distributed
 * load ends and point load positions. Coordinates within the tolerance of
 * each other are merged into a single node whose events are the union.
 * Breakpoints are what keep jumps on exact sample points instead of
 * smearing them across a fixed grid.
 */
class NodeSetBuilder {
public:
    /**
     * @param tolerance Merge distance [m]. Default: 1e-9 m
     */
    explicit NodeSetBuilder(double tolerance = COORDINATE_TOLERANCE);

    /**
     * @brief Build nodes for a beam
     * @param beam Beam whose supports and loads define the breakpoints
     * @param probes Extra coordinates that must become nodes (e.g. redundant
     *        support positions read by the flexibility method)
     * @return Nodes sorted by x with consecutive ids starting at 0
     */
    std::vector<DiagramNode> build(const Beam& beam,
                                   const std::vector<double>& probes = {}) const;

    double tolerance() const { return tolerance_; }

    /**
     * @brief Index of the node at coordinate x, or -1 if none within tolerance
     */
    static int find_node(const std::vector<DiagramNode>& nodes, double x, double tolerance);

private:
    double tolerance_;
};

} // namespace beamdiag
