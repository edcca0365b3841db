#pragma once

#include "beamdiag/beam.hpp"
#include "beamdiag/diagram.hpp"
#include "beamdiag/node_set.hpp"

#include <vector>

namespace beamdiag {

/**
 * @brief Configuration for the piecewise integrator
 *
 * Usage:
 *   IntegratorSettings settings;
 *   settings.samples = 1000;     // denser output
 *   settings.subdivisions = 16;  // finer internal quadrature
 */
struct IntegratorSettings {
    /// Target number of output samples over the whole length, shared between
    /// spans in proportion to their length
    int samples = 400;

    /// Minimum number of output intervals in any span between two nodes
    int min_samples_per_span = 4;

    /// Trapezoid sub-steps per output interval
    int subdivisions = 8;
};

/**
 * @brief Raw integration output before boundary correction
 *
 * Uses growable arrays while integrating; DiagramEngine packs them into
 * Eigen vectors for the published result.
 */
struct RawDiagram {
    std::vector<double> x;
    std::vector<double> shear;
    std::vector<double> moment;
    std::vector<double> rotation;
    std::vector<double> deflection;

    /// One state per node, same order as the node list
    std::vector<NodeState> nodes;

    size_t size() const { return x.size(); }

    void push_sample(double xs, double V, double M, double theta, double y);

    /**
     * @brief State of the node at coordinate x, nullptr if none within tolerance
     */
    const NodeState* node_at(double xq, double tolerance = COORDINATE_TOLERANCE) const;
};

/**
 * @brief Node-aware integrator for shear, moment, rotation and deflection
 *
 * Walks the nodes from left to right. At each node the jumps are applied
 * exactly, in this order:
 * - support reaction R adds +R to V
 * - point force P adds -P to V
 * - point moment M0 adds +M0 to M
 *
 * Between nodes the distributed intensity is integrated with the trapezoid
 * rule on a sub-grid:
 *   V' = -w,  M' = V,  θ' = M / EI,  y' = θ
 *
 * Integration starts from V = M = θ = y = 0 at x = 0. The missing constants
 * of integration (θ(0), y(0)) and any quadrature drift are removed afterwards
 * by BoundaryCorrector.
 */
class PiecewiseIntegrator {
public:
    explicit PiecewiseIntegrator(const IntegratorSettings& settings = IntegratorSettings());

    /**
     * @brief Integrate a beam under its loads and the given reactions
     * @param beam Beam with supports and loads
     * @param nodes Breakpoints from NodeSetBuilder for this beam
     * @param reactions Reaction per support name
     * @return Raw samples and exact node states
     * @throws ValidationError UNKNOWN_SUPPORT if a support has no reaction
     */
    RawDiagram integrate(const Beam& beam,
                         const std::vector<DiagramNode>& nodes,
                         const ReactionMap& reactions) const;

    const IntegratorSettings& settings() const { return settings_; }

private:
    /// Number of output intervals for a span of given length
    int intervals_for_span(double span, double length) const;

    IntegratorSettings settings_;
};

} // namespace beamdiag
