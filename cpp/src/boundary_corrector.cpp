#include "beamdiag/boundary_corrector.hpp"
#include "beamdiag/statics.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace beamdiag {

// =============================================================================
// PiecewiseLinearCorrection
// =============================================================================

PiecewiseLinearCorrection::PiecewiseLinearCorrection(const std::vector<double>& xs,
                                                     const std::vector<double>& values)
    : xs_(xs), values_(values) {
    if (xs_.size() != values_.size()) {
        throw std::invalid_argument("PiecewiseLinearCorrection: anchor and value counts differ");
    }

    first_.assign(xs_.size(), 0.0);
    second_.assign(xs_.size(), 0.0);
    for (size_t k = 0; k + 1 < xs_.size(); ++k) {
        double d = xs_[k + 1] - xs_[k];
        if (!(d > 0.0)) {
            throw std::invalid_argument("PiecewiseLinearCorrection: anchors must be strictly increasing");
        }
        double c0 = values_[k];
        double m = (values_[k + 1] - values_[k]) / d;
        first_[k + 1] = first_[k] + c0 * d + m * d * d / 2.0;
        second_[k + 1] = second_[k] + first_[k] * d + c0 * d * d / 2.0 + m * d * d * d / 6.0;
    }
}

size_t PiecewiseLinearCorrection::segment(double x) const {
    auto it = std::upper_bound(xs_.begin(), xs_.end(), x);
    if (it == xs_.begin()) return 0;
    return std::min(static_cast<size_t>(it - xs_.begin()) - 1, xs_.size() - 1);
}

double PiecewiseLinearCorrection::value(double x) const {
    if (xs_.empty()) return 0.0;
    if (x <= xs_.front()) return values_.front();
    if (x >= xs_.back()) return values_.back();

    size_t k = segment(x);
    double m = (values_[k + 1] - values_[k]) / (xs_[k + 1] - xs_[k]);
    return values_[k] + m * (x - xs_[k]);
}

double PiecewiseLinearCorrection::integral(double x) const {
    if (xs_.empty()) return 0.0;
    if (x <= xs_.front()) return values_.front() * (x - xs_.front());
    if (x >= xs_.back()) return first_.back() + values_.back() * (x - xs_.back());

    size_t k = segment(x);
    double t = x - xs_[k];
    double m = (values_[k + 1] - values_[k]) / (xs_[k + 1] - xs_[k]);
    return first_[k] + values_[k] * t + m * t * t / 2.0;
}

double PiecewiseLinearCorrection::double_integral(double x) const {
    if (xs_.empty()) return 0.0;
    if (x <= xs_.front()) {
        double t = x - xs_.front();
        return values_.front() * t * t / 2.0;
    }
    if (x >= xs_.back()) {
        double t = x - xs_.back();
        return second_.back() + first_.back() * t + values_.back() * t * t / 2.0;
    }

    size_t k = segment(x);
    double t = x - xs_[k];
    double m = (values_[k + 1] - values_[k]) / (xs_[k + 1] - xs_[k]);
    return second_[k] + first_[k] * t + values_[k] * t * t / 2.0 + m * t * t * t / 6.0;
}

// =============================================================================
// BoundaryCorrector
// =============================================================================

BoundaryCorrector::BoundaryCorrector(const CorrectorSettings& settings)
    : settings_(settings) {
}

bool BoundaryCorrector::exceeds(double residual, double reference) const {
    return residual > settings_.absolute_floor &&
           residual > settings_.relative_tolerance * reference;
}

void BoundaryCorrector::apply(const Beam& beam, const ReactionMap& reactions,
                              RawDiagram& diagram, WarningList& warnings) const {
    correct_moment(beam, reactions, diagram, warnings);
    correct_deflection(diagram, warnings);
}

double BoundaryCorrector::correct_moment(const Beam& beam, const ReactionMap& reactions,
                                         RawDiagram& diagram, WarningList& warnings) const {
    if (diagram.nodes.empty()) return 0.0;

    // Anchors: both beam ends and every support, each node once
    std::vector<double> xs;
    std::vector<double> residuals;
    const size_t last = diagram.nodes.size() - 1;
    for (size_t i = 0; i < diagram.nodes.size(); ++i) {
        const NodeState& node = diagram.nodes[i];
        if (i != 0 && i != last && !node.is_support) continue;

        double r;
        if (i == last) {
            r = node.moment_right - static_moment(beam, reactions, node.x, false);
        } else {
            r = node.moment_left - static_moment(beam, reactions, node.x, true);
        }
        xs.push_back(node.x);
        residuals.push_back(r);
    }

    double max_residual = 0.0;
    for (double r : residuals) max_residual = std::max(max_residual, std::abs(r));

    PiecewiseLinearCorrection correction(xs, residuals);
    const double EI = beam.EI();

    for (size_t j = 0; j < diagram.size(); ++j) {
        double x = diagram.x[j];
        diagram.moment[j] -= correction.value(x);
        diagram.rotation[j] -= correction.integral(x) / EI;
        diagram.deflection[j] -= correction.double_integral(x) / EI;
    }
    for (auto& node : diagram.nodes) {
        double c = correction.value(node.x);
        node.moment_left -= c;
        node.moment_right -= c;
        node.rotation -= correction.integral(node.x) / EI;
        node.deflection -= correction.double_integral(node.x) / EI;
    }

    double reference = 0.0;
    for (double M : diagram.moment) reference = std::max(reference, std::abs(M));
    if (exceeds(max_residual, reference)) {
        warnings.add(BeamWarning::moment_correction(max_residual, reference));
    }

    return max_residual;
}

double BoundaryCorrector::correct_deflection(RawDiagram& diagram, WarningList& warnings) const {
    std::vector<NodeState*> anchors;
    for (auto& node : diagram.nodes) {
        if (node.is_support) anchors.push_back(&node);
    }
    if (anchors.empty()) return 0.0;

    // Least-squares rigid-body line through the support deflections
    const double n = static_cast<double>(anchors.size());
    double x_mean = 0.0;
    double y_mean = 0.0;
    for (const NodeState* a : anchors) {
        x_mean += a->x;
        y_mean += a->deflection;
    }
    x_mean /= n;
    y_mean /= n;

    double sxx = 0.0;
    double sxy = 0.0;
    for (const NodeState* a : anchors) {
        sxx += (a->x - x_mean) * (a->x - x_mean);
        sxy += (a->x - x_mean) * (a->deflection - y_mean);
    }
    const double slope = sxx > 0.0 ? sxy / sxx : 0.0;
    const double intercept = y_mean - slope * x_mean;

    for (size_t j = 0; j < diagram.size(); ++j) {
        diagram.deflection[j] -= intercept + slope * diagram.x[j];
        diagram.rotation[j] -= slope;
    }
    for (auto& node : diagram.nodes) {
        node.deflection -= intercept + slope * node.x;
        node.rotation -= slope;
    }

    // Whatever the line could not absorb is removed by an anchored fit
    std::vector<double> xs;
    std::vector<double> residuals;
    double max_residual = 0.0;
    for (const NodeState* a : anchors) {
        xs.push_back(a->x);
        residuals.push_back(a->deflection);
        max_residual = std::max(max_residual, std::abs(a->deflection));
    }

    PiecewiseLinearCorrection cleanup(xs, residuals);
    for (size_t j = 0; j < diagram.size(); ++j) {
        diagram.deflection[j] -= cleanup.value(diagram.x[j]);
    }
    for (auto& node : diagram.nodes) {
        node.deflection -= cleanup.value(node.x);
    }

    double reference = 0.0;
    for (double y : diagram.deflection) reference = std::max(reference, std::abs(y));
    if (exceeds(max_residual, reference)) {
        warnings.add(BeamWarning::deflection_correction(max_residual, reference));
    }

    return max_residual;
}

} // namespace beamdiag
