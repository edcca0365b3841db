#include "beamdiag/load.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace beamdiag {

std::string load_type_to_string(LoadType type) {
    switch (type) {
        case LoadType::PointForce: return "PointForce";
        case LoadType::PointMoment: return "PointMoment";
        case LoadType::LinearDistributed: return "LinearDistributed";
        default: return "Unknown";
    }
}

double step(double x, double a, bool left_limit) {
    if (left_limit) {
        return (x > a + COORDINATE_TOLERANCE) ? 1.0 : 0.0;
    }
    return (x >= a - COORDINATE_TOLERANCE) ? 1.0 : 0.0;
}

Load Load::point_force(double position, double magnitude) {
    Load load;
    load.type = LoadType::PointForce;
    load.position = position;
    load.magnitude = magnitude;
    return load;
}

Load Load::point_moment(double position, double magnitude) {
    Load load;
    load.type = LoadType::PointMoment;
    load.position = position;
    load.magnitude = magnitude;
    return load;
}

Load Load::linear(double start, double end, double w_start, double w_end) {
    Load load;
    load.type = LoadType::LinearDistributed;
    load.start = start;
    load.end = end;
    load.w_start = w_start;
    load.w_end = w_end;
    return load;
}

Load Load::uniform(double start, double end, double intensity) {
    return linear(start, end, intensity, intensity);
}

Load Load::triangular(double start, double end, double peak, bool peak_at_end) {
    return peak_at_end ? linear(start, end, 0.0, peak) : linear(start, end, peak, 0.0);
}

double Load::resultant() const {
    switch (type) {
        case LoadType::PointForce: return magnitude;
        case LoadType::PointMoment: return 0.0;
        case LoadType::LinearDistributed: return 0.5 * (w_start + w_end) * (end - start);
    }
    return 0.0;
}

double Load::centroid() const {
    if (is_point()) return position;

    double sum = w_start + w_end;
    if (std::abs(sum) < 1e-14 * (std::abs(w_start) + std::abs(w_end) + 1e-300)) {
        return 0.5 * (start + end);
    }
    return start + (end - start) * (w_start + 2.0 * w_end) / (3.0 * sum);
}

double Load::moment_about(double x0) const {
    switch (type) {
        case LoadType::PointForce:
            return magnitude * (position - x0);
        case LoadType::PointMoment:
            return magnitude;
        case LoadType::LinearDistributed: {
            // First moment of w(s) = w_start + k (s - start) about x0
            double T = end - start;
            double k = (w_end - w_start) / T;
            double force = w_start * T + 0.5 * k * T * T;
            double first = w_start * T * T / 2.0 + k * T * T * T / 3.0;
            return first + (start - x0) * force;
        }
    }
    return 0.0;
}

double Load::intensity_at(double x) const {
    if (!is_distributed()) return 0.0;
    if (x < start - COORDINATE_TOLERANCE || x > end + COORDINATE_TOLERANCE) return 0.0;
    return w_start + (w_end - w_start) * (x - start) / (end - start);
}

double Load::shear_jump() const {
    return type == LoadType::PointForce ? -magnitude : 0.0;
}

double Load::moment_jump() const {
    return type == LoadType::PointMoment ? magnitude : 0.0;
}

double Load::shear_contribution(double x, bool left_limit) const {
    switch (type) {
        case LoadType::PointForce:
            return -magnitude * step(x, position, left_limit);
        case LoadType::PointMoment:
            return 0.0;
        case LoadType::LinearDistributed: {
            if (x <= start) return 0.0;
            double T = std::min(x, end) - start;
            double k = (w_end - w_start) / (end - start);
            return -(w_start * T + 0.5 * k * T * T);
        }
    }
    return 0.0;
}

double Load::moment_contribution(double x, bool left_limit) const {
    switch (type) {
        case LoadType::PointForce:
            return -magnitude * (x - position) * step(x, position, left_limit);
        case LoadType::PointMoment:
            return magnitude * step(x, position, left_limit);
        case LoadType::LinearDistributed: {
            if (x <= start) return 0.0;
            // -∫ w(s) (x - s) ds over [start, min(x, end)]
            double T = std::min(x, end) - start;
            double D = x - start;
            double k = (w_end - w_start) / (end - start);
            return -(w_start * (D * T - T * T / 2.0) + k * (D * T * T / 2.0 - T * T * T / 3.0));
        }
    }
    return 0.0;
}

BeamError Load::check(double length, int index) const {
    if (is_point()) {
        if (!std::isfinite(position)) return BeamError::non_finite("load position");
        if (!std::isfinite(magnitude)) return BeamError::non_finite("load magnitude");
        if (position < 0.0 || position > length) {
            return BeamError::out_of_domain_load(index, position, length);
        }
        return BeamError();
    }

    if (!std::isfinite(start) || !std::isfinite(end)) {
        return BeamError::non_finite("distributed load range");
    }
    if (!std::isfinite(w_start) || !std::isfinite(w_end)) {
        return BeamError::non_finite("distributed load intensity");
    }
    if (start < 0.0 || start > length) return BeamError::out_of_domain_load(index, start, length);
    if (end < 0.0 || end > length) return BeamError::out_of_domain_load(index, end, length);
    if (start >= end) return BeamError::invalid_range(index, start, end);
    return BeamError();
}

std::string Load::description() const {
    std::ostringstream oss;
    oss << std::setprecision(6);
    switch (type) {
        case LoadType::PointForce:
            oss << "Point force " << magnitude << " N at x=" << position << " m";
            break;
        case LoadType::PointMoment:
            oss << "Point moment " << magnitude << " N·m at x=" << position << " m";
            break;
        case LoadType::LinearDistributed:
            if (std::abs(w_start - w_end) < 1e-12) {
                oss << "Uniform load " << w_start << " N/m";
            } else if (std::abs(w_start) < 1e-12 || std::abs(w_end) < 1e-12) {
                oss << "Triangular load " << w_start << " -> " << w_end << " N/m";
            } else {
                oss << "Trapezoidal load " << w_start << " -> " << w_end << " N/m";
            }
            oss << " on [" << start << ", " << end << "] m";
            break;
    }
    return oss.str();
}

} // namespace beamdiag
