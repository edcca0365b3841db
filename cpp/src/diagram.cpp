#include "beamdiag/diagram.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace beamdiag {

std::string diagram_quantity_to_string(DiagramQuantity quantity) {
    switch (quantity) {
        case DiagramQuantity::Shear: return "shear";
        case DiagramQuantity::Moment: return "moment";
        case DiagramQuantity::Rotation: return "rotation";
        case DiagramQuantity::Deflection: return "deflection";
        default: return "unknown";
    }
}

const Eigen::VectorXd& DiagramResult::values(DiagramQuantity quantity) const {
    switch (quantity) {
        case DiagramQuantity::Shear: return shear;
        case DiagramQuantity::Moment: return moment;
        case DiagramQuantity::Rotation: return rotation;
        case DiagramQuantity::Deflection: return deflection;
    }
    return shear;
}

DiagramExtreme DiagramResult::max(DiagramQuantity quantity) const {
    const Eigen::VectorXd& v = values(quantity);
    if (v.size() == 0) return DiagramExtreme();
    Eigen::Index i;
    double value = v.maxCoeff(&i);
    return DiagramExtreme(x(i), value);
}

DiagramExtreme DiagramResult::min(DiagramQuantity quantity) const {
    const Eigen::VectorXd& v = values(quantity);
    if (v.size() == 0) return DiagramExtreme();
    Eigen::Index i;
    double value = v.minCoeff(&i);
    return DiagramExtreme(x(i), value);
}

DiagramExtreme DiagramResult::extreme(DiagramQuantity quantity) const {
    const Eigen::VectorXd& v = values(quantity);
    if (v.size() == 0) return DiagramExtreme();
    Eigen::Index i;
    v.cwiseAbs().maxCoeff(&i);
    return DiagramExtreme(x(i), v(i));
}

double DiagramResult::value_at(DiagramQuantity quantity, double xq) const {
    const Eigen::VectorXd& v = values(quantity);
    if (v.size() == 0) return 0.0;
    if (xq <= x(0)) return v(0);
    if (xq >= x(x.size() - 1)) return v(v.size() - 1);

    // First sample strictly to the right of xq
    const double* begin = x.data();
    const double* end = x.data() + x.size();
    Eigen::Index hi = std::upper_bound(begin, end, xq) - begin;
    Eigen::Index lo = hi - 1;

    double span = x(hi) - x(lo);
    if (span <= 0.0) return v(lo);
    double t = (xq - x(lo)) / span;
    return v(lo) + t * (v(hi) - v(lo));
}

double DiagramResult::reaction(const std::string& name) const {
    auto it = reactions.find(name);
    if (it == reactions.end()) {
        throw ValidationError(BeamError::unknown_support(name));
    }
    return it->second;
}

double DiagramResult::reaction_sum() const {
    double sum = 0.0;
    for (const auto& kv : reactions) sum += kv.second;
    return sum;
}

const NodeState* DiagramResult::node_at(double xq, double tolerance) const {
    for (const auto& node : nodes) {
        if (std::abs(node.x - xq) <= tolerance) return &node;
    }
    return nullptr;
}

std::vector<double> DiagramResult::event_positions() const {
    std::vector<double> positions;
    positions.reserve(nodes.size());
    for (const auto& node : nodes) positions.push_back(node.x);
    return positions;
}

std::string DiagramResult::summary() const {
    std::ostringstream oss;
    oss << std::setprecision(6);
    oss << "DiagramResult: " << system_type_to_string(system_type)
        << ", " << size() << " samples, " << nodes.size() << " nodes";
    if (used_fallback) oss << " (fallback)";
    oss << "\n  Reactions:";
    for (const auto& kv : reactions) {
        oss << " " << kv.first << "=" << kv.second;
    }

    const DiagramQuantity quantities[] = {DiagramQuantity::Shear, DiagramQuantity::Moment,
                                          DiagramQuantity::Rotation, DiagramQuantity::Deflection};
    for (DiagramQuantity q : quantities) {
        DiagramExtreme e = extreme(q);
        oss << "\n  max |" << diagram_quantity_to_string(q) << "| = " << e.value
            << " at x=" << e.x;
    }
    oss << "\n  " << warnings.summary();
    return oss.str();
}

} // namespace beamdiag
