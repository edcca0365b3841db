#include "beamdiag/piecewise_integrator.hpp"
#include "beamdiag/statics.hpp"

#include <algorithm>
#include <cmath>

namespace beamdiag {

void RawDiagram::push_sample(double xs, double V, double M, double theta, double y) {
    x.push_back(xs);
    shear.push_back(V);
    moment.push_back(M);
    rotation.push_back(theta);
    deflection.push_back(y);
}

const NodeState* RawDiagram::node_at(double xq, double tolerance) const {
    for (const auto& node : nodes) {
        if (std::abs(node.x - xq) <= tolerance) return &node;
    }
    return nullptr;
}

PiecewiseIntegrator::PiecewiseIntegrator(const IntegratorSettings& settings)
    : settings_(settings) {
}

int PiecewiseIntegrator::intervals_for_span(double span, double length) const {
    int n = static_cast<int>(std::lround(settings_.samples * span / length));
    return std::max(n, std::max(settings_.min_samples_per_span, 1));
}

RawDiagram PiecewiseIntegrator::integrate(const Beam& beam,
                                          const std::vector<DiagramNode>& nodes,
                                          const ReactionMap& reactions) const {
    RawDiagram raw;
    const double L = beam.length();
    const double EI = beam.EI();
    const auto& supports = beam.supports();
    const auto& loads = beam.loads();
    const int sub = std::max(settings_.subdivisions, 1);

    double V = 0.0;
    double M = 0.0;
    double theta = 0.0;
    double y = 0.0;

    raw.nodes.reserve(nodes.size());

    for (size_t k = 0; k < nodes.size(); ++k) {
        const DiagramNode& node = nodes[k];

        NodeState state;
        state.node_id = node.id;
        state.x = node.x;
        state.shear_left = V;
        state.moment_left = M;
        state.is_support = node.is_support();

        // Jumps: reactions, then point forces, then point moments
        for (int si : node.support_indices) {
            V += reaction_of(reactions, supports[si]);
        }
        for (int li : node.load_indices) {
            V += loads[li].shear_jump();
        }
        for (int li : node.load_indices) {
            M += loads[li].moment_jump();
        }

        state.shear_right = V;
        state.moment_right = M;
        state.rotation = theta;
        state.deflection = y;
        raw.nodes.push_back(state);

        raw.push_sample(node.x, state.shear_left, state.moment_left, theta, y);
        if (state.shear_right != state.shear_left || state.moment_right != state.moment_left) {
            raw.push_sample(node.x, V, M, theta, y);
        }

        if (k + 1 == nodes.size()) break;

        // Span [x0, x1]: a distributed load is active if it covers the midpoint.
        // Load edges merged into a node may lie up to the node tolerance inside
        // the span, so each sub-step integrates the load over its own range.
        const double x0 = node.x;
        const double x1 = nodes[k + 1].x;
        const double mid = 0.5 * (x0 + x1);
        std::vector<const Load*> active;
        for (const auto& load : loads) {
            if (load.is_distributed() && load.start < mid && mid < load.end) {
                active.push_back(&load);
            }
        }

        // Resultant of the active loads on [a, b], exact for linear intensities
        auto load_between = [&active](double a, double b) {
            double total = 0.0;
            for (const Load* load : active) {
                double lo = std::max(a, load->start);
                double hi = std::min(b, load->end);
                if (hi > lo) {
                    total += 0.5 * (hi - lo) * (load->intensity_at(lo) + load->intensity_at(hi));
                }
            }
            return total;
        };

        const int intervals = intervals_for_span(x1 - x0, L);
        const int steps = intervals * sub;
        const double h = (x1 - x0) / steps;

        double s_prev = x0;
        for (int i = 1; i <= steps; ++i) {
            double s = (i == steps) ? x1 : x0 + i * h;

            double V_new = V - load_between(s_prev, s);
            double M_new = M + 0.5 * h * (V + V_new);
            double theta_new = theta + 0.5 * h * (M + M_new) / EI;
            double y_new = y + 0.5 * h * (theta + theta_new);

            V = V_new;
            M = M_new;
            theta = theta_new;
            y = y_new;
            s_prev = s;

            // The span end is emitted as the next node's left limit
            if (i % sub == 0 && i != steps) {
                raw.push_sample(s, V, M, theta, y);
            }
        }
    }

    return raw;
}

} // namespace beamdiag
