#include "beamdiag/beam.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace beamdiag {

std::string system_type_to_string(SystemType type) {
    switch (type) {
        case SystemType::Underconstrained: return "underconstrained";
        case SystemType::Determinate: return "determinate";
        case SystemType::Indeterminate: return "indeterminate";
        default: return "unknown";
    }
}

std::string SystemReport::to_string() const {
    std::ostringstream oss;
    oss << (valid ? "Valid " : "Invalid ") << system_type_to_string(type) << " system";
    if (type == SystemType::Indeterminate) {
        oss << " (degree " << degree << ")";
    }
    for (const auto& err : errors) {
        oss << "\n" << err.to_string();
    }
    for (const auto& warn : warnings.warnings) {
        oss << "\n" << warn.to_string();
    }
    return oss.str();
}

namespace {

BeamError check_property(const std::string& name, double value) {
    if (!std::isfinite(value)) return BeamError::non_finite(name);
    if (value <= 0.0) return BeamError::non_positive_property(name, value);
    return BeamError();
}

} // namespace

Beam::Beam(double length, double E, double I, const BeamLimits& limits)
    : length_(length), E_(E), I_(I), EI_(E * I), limits_(limits) {
    for (const auto& err : {check_property("length", length),
                            check_property("E", E),
                            check_property("I", I)}) {
        if (err.is_error()) throw ValidationError(err);
    }
}

Beam Beam::with_rigidity(double length, double EI, const BeamLimits& limits) {
    BeamError err = check_property("EI", EI);
    if (err.is_error()) throw ValidationError(err);

    Beam beam(length, EI, 1.0, limits);
    beam.E_ = 0.0;
    beam.I_ = 0.0;
    beam.has_section_properties_ = false;
    return beam;
}

double Beam::E() const {
    if (!has_section_properties_) {
        throw std::logic_error("E is unknown: beam was defined by its flexural rigidity only");
    }
    return E_;
}

double Beam::I() const {
    if (!has_section_properties_) {
        throw std::logic_error("I is unknown: beam was defined by its flexural rigidity only");
    }
    return I_;
}

std::string Beam::next_support_name() const {
    for (size_t i = supports_.size();; ++i) {
        std::string candidate = i < 26 ? std::string(1, static_cast<char>('A' + i))
                                       : "S" + std::to_string(i + 1);
        if (find_support(candidate) == nullptr) return candidate;
    }
}

Support Beam::add_support(double position, const std::string& name) {
    std::string support_name = name.empty() ? next_support_name() : name;

    if (!std::isfinite(position)) {
        throw ValidationError(BeamError::non_finite("support position"));
    }
    if (position < 0.0 || position > length_) {
        throw ValidationError(BeamError::out_of_domain_support(support_name, position, length_));
    }
    if (static_cast<int>(supports_.size()) >= limits_.max_supports) {
        throw ValidationError(BeamError::entity_limit("supports", limits_.max_supports));
    }

    for (const auto& existing : supports_) {
        double distance = std::abs(existing.position - position);
        if (distance < SUPPORT_TOLERANCE || existing.name == support_name) {
            throw ValidationError(BeamError::duplicate_support(
                support_name, existing.name, position, distance));
        }
    }

    Support support(support_name, position);
    auto it = std::upper_bound(supports_.begin(), supports_.end(), support,
        [](const Support& a, const Support& b) { return a.position < b.position; });
    supports_.insert(it, support);
    return support;
}

int Beam::add_load(const Load& load) {
    int index = static_cast<int>(loads_.size());
    if (index >= limits_.max_loads) {
        throw ValidationError(BeamError::entity_limit("loads", limits_.max_loads));
    }
    BeamError err = load.check(length_, index);
    if (err.is_error()) throw ValidationError(err);

    loads_.push_back(load);
    return index;
}

int Beam::add_point_force(double position, double magnitude) {
    return add_load(Load::point_force(position, magnitude));
}

int Beam::add_point_moment(double position, double magnitude) {
    return add_load(Load::point_moment(position, magnitude));
}

int Beam::add_uniform_load(double start, double end, double intensity) {
    return add_load(Load::uniform(start, end, intensity));
}

int Beam::add_linear_load(double start, double end, double w_start, double w_end) {
    return add_load(Load::linear(start, end, w_start, w_end));
}

void Beam::clear_supports() {
    supports_.clear();
}

void Beam::clear_loads() {
    loads_.clear();
}

const Support* Beam::find_support(const std::string& name) const {
    for (const auto& s : supports_) {
        if (s.name == name) return &s;
    }
    return nullptr;
}

SystemType Beam::classify() const {
    if (supports_.size() < 2) return SystemType::Underconstrained;
    if (supports_.size() == 2) return SystemType::Determinate;
    return SystemType::Indeterminate;
}

int Beam::degree_of_indeterminacy() const {
    return static_cast<int>(supports_.size()) - 2;
}

SystemReport Beam::check() const {
    SystemReport report;
    report.type = classify();
    report.degree = degree_of_indeterminacy();

    std::vector<BeamError> property_errors{check_property("length", length_),
                                           check_property("EI", EI_)};
    if (has_section_properties_) {
        property_errors.push_back(check_property("E", E_));
        property_errors.push_back(check_property("I", I_));
    }
    for (const auto& err : property_errors) {
        if (err.is_error()) report.errors.push_back(err);
    }

    if (static_cast<int>(supports_.size()) > limits_.max_supports) {
        report.errors.push_back(BeamError::entity_limit("supports", limits_.max_supports));
    }
    if (static_cast<int>(loads_.size()) > limits_.max_loads) {
        report.errors.push_back(BeamError::entity_limit("loads", limits_.max_loads));
    }

    for (size_t i = 0; i < supports_.size(); ++i) {
        const Support& s = supports_[i];
        if (!(s.position >= 0.0 && s.position <= length_)) {
            report.errors.push_back(BeamError::out_of_domain_support(s.name, s.position, length_));
        }
        for (size_t j = 0; j < i; ++j) {
            double distance = std::abs(supports_[j].position - s.position);
            if (distance < SUPPORT_TOLERANCE || supports_[j].name == s.name) {
                report.errors.push_back(BeamError::duplicate_support(
                    s.name, supports_[j].name, s.position, distance));
            }
        }
    }

    for (size_t i = 0; i < loads_.size(); ++i) {
        BeamError err = loads_[i].check(length_, static_cast<int>(i));
        if (err.is_error()) report.errors.push_back(err);
    }

    if (report.type == SystemType::Underconstrained) {
        report.errors.push_back(BeamError::underconstrained(static_cast<int>(supports_.size())));
    }

    if (loads_.empty()) {
        report.warnings.add(BeamWarning::no_loads());
    }

    report.valid = report.errors.empty();
    return report;
}

void Beam::validate() const {
    SystemReport report = check();
    if (!report.valid) {
        throw ValidationError(report.errors.front());
    }
}

Beam Beam::primary_structure() const {
    Beam primary(*this);
    if (supports_.size() > 2) {
        primary.supports_ = {supports_.front(), supports_.back()};
    }
    return primary;
}

double Beam::total_applied_force() const {
    double total = 0.0;
    for (const auto& load : loads_) {
        total += load.resultant();
    }
    return total;
}

std::vector<std::string> Beam::load_summary() const {
    std::vector<std::string> summary;
    summary.reserve(loads_.size());
    for (const auto& load : loads_) {
        summary.push_back(load.description());
    }
    return summary;
}

} // namespace beamdiag
