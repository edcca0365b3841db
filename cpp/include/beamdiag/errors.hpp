/**
 * @file errors.hpp
 * @brief Structured error handling for beamdiag.
 *
 * Errors are described by a machine-readable BeamError record and thrown
 * wrapped in one of the exception types below. Validation errors are raised
 * before any computation begins, solve errors while resolving reactions.
 */

#ifndef BEAMDIAG_ERRORS_HPP
#define BEAMDIAG_ERRORS_HPP

#include <string>
#include <vector>
#include <map>
#include <sstream>
#include <stdexcept>

namespace beamdiag {

/**
 * @brief Error codes for beamdiag failures.
 */
enum class ErrorCode {
    /// No error
    OK = 0,

    // === Validation Errors (100-199) ===

    /// Support within the binding tolerance of another support, or duplicate name
    DUPLICATE_SUPPORT = 100,

    /// Load coordinate outside [0, L]
    OUT_OF_DOMAIN_LOAD = 101,

    /// Support coordinate outside [0, L]
    OUT_OF_DOMAIN_SUPPORT = 102,

    /// Distributed load with start >= end
    INVALID_RANGE = 103,

    /// Length, E or I not strictly positive
    NON_POSITIVE_PROPERTY = 104,

    /// NaN or infinite input value
    NON_FINITE_VALUE = 105,

    /// Fewer than two supports
    UNDERCONSTRAINED_SYSTEM = 106,

    /// Too many supports or loads
    ENTITY_LIMIT_EXCEEDED = 107,

    /// Reaction requested for a support name that does not exist
    UNKNOWN_SUPPORT = 108,

    // === Solve Errors (200-299) ===

    /// Flexibility matrix singular or too ill-conditioned to trust
    SINGULAR_FLEXIBILITY_MATRIX = 200,

    // === Generic Errors (900-999) ===

    UNKNOWN_ERROR = 999
};

/**
 * @brief Convert error code to string representation.
 */
inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::DUPLICATE_SUPPORT: return "DUPLICATE_SUPPORT";
        case ErrorCode::OUT_OF_DOMAIN_LOAD: return "OUT_OF_DOMAIN_LOAD";
        case ErrorCode::OUT_OF_DOMAIN_SUPPORT: return "OUT_OF_DOMAIN_SUPPORT";
        case ErrorCode::INVALID_RANGE: return "INVALID_RANGE";
        case ErrorCode::NON_POSITIVE_PROPERTY: return "NON_POSITIVE_PROPERTY";
        case ErrorCode::NON_FINITE_VALUE: return "NON_FINITE_VALUE";
        case ErrorCode::UNDERCONSTRAINED_SYSTEM: return "UNDERCONSTRAINED_SYSTEM";
        case ErrorCode::ENTITY_LIMIT_EXCEEDED: return "ENTITY_LIMIT_EXCEEDED";
        case ErrorCode::UNKNOWN_SUPPORT: return "UNKNOWN_SUPPORT";
        case ErrorCode::SINGULAR_FLEXIBILITY_MATRIX: return "SINGULAR_FLEXIBILITY_MATRIX";
        case ErrorCode::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
        default: return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Structured error information.
 *
 * Contains machine-readable error code, human-readable message,
 * and the supports and loads involved in the failure.
 */
struct BeamError {
    /// Machine-readable error code
    ErrorCode code;

    /// Human-readable error message
    std::string message;

    /// Names of supports involved in the error
    std::vector<std::string> involved_supports;

    /// Indices (into Beam::loads()) of loads involved in the error
    std::vector<int> involved_loads;

    /// Additional key-value details for diagnostics
    std::map<std::string, std::string> details;

    /// Suggested fix for the error
    std::string suggestion;

    BeamError()
        : code(ErrorCode::OK), message("OK") {}

    BeamError(ErrorCode code, const std::string& message)
        : code(code), message(message) {}

    bool is_ok() const { return code == ErrorCode::OK; }

    bool is_error() const { return code != ErrorCode::OK; }

    std::string code_string() const { return error_code_to_string(code); }

    /**
     * @brief Get formatted error string for display.
     */
    std::string to_string() const {
        if (is_ok()) return "OK";

        std::string result = "[" + code_string() + "] " + message;

        if (!involved_supports.empty()) {
            result += "\n  Involved supports: ";
            for (size_t i = 0; i < involved_supports.size(); ++i) {
                if (i > 0) result += ", ";
                result += involved_supports[i];
            }
        }

        if (!involved_loads.empty()) {
            result += "\n  Involved loads: ";
            for (size_t i = 0; i < involved_loads.size(); ++i) {
                if (i > 0) result += ", ";
                result += std::to_string(involved_loads[i]);
            }
        }

        for (const auto& kv : details) {
            result += "\n  " + kv.first + ": " + kv.second;
        }

        if (!suggestion.empty()) {
            result += "\n  Suggestion: " + suggestion;
        }

        return result;
    }

    // === Factory methods for common errors ===

    static BeamError duplicate_support(const std::string& name, const std::string& existing,
                                       double position, double distance) {
        BeamError err(ErrorCode::DUPLICATE_SUPPORT,
            "Support '" + name + "' duplicates existing support '" + existing + "'");
        err.involved_supports = {existing, name};
        err.details["position"] = std::to_string(position) + " m";
        err.details["distance"] = std::to_string(distance) + " m";
        err.suggestion = "Supports must be at least 1 mm apart and have unique names.";
        return err;
    }

    static BeamError out_of_domain_load(int load_index, double coordinate, double length) {
        BeamError err(ErrorCode::OUT_OF_DOMAIN_LOAD,
            "Load coordinate lies outside the beam [0, L]");
        if (load_index >= 0) err.involved_loads.push_back(load_index);
        err.details["coordinate"] = std::to_string(coordinate) + " m";
        err.details["length"] = std::to_string(length) + " m";
        return err;
    }

    static BeamError out_of_domain_support(const std::string& name, double position,
                                           double length) {
        BeamError err(ErrorCode::OUT_OF_DOMAIN_SUPPORT,
            "Support position lies outside the beam [0, L]");
        err.involved_supports.push_back(name);
        err.details["position"] = std::to_string(position) + " m";
        err.details["length"] = std::to_string(length) + " m";
        return err;
    }

    static BeamError invalid_range(int load_index, double start, double end) {
        BeamError err(ErrorCode::INVALID_RANGE,
            "Distributed load start must be strictly less than its end");
        if (load_index >= 0) err.involved_loads.push_back(load_index);
        err.details["start"] = std::to_string(start) + " m";
        err.details["end"] = std::to_string(end) + " m";
        err.suggestion = "Swap start and end, or use a point force for a concentrated load.";
        return err;
    }

    static BeamError non_positive_property(const std::string& property, double value) {
        BeamError err(ErrorCode::NON_POSITIVE_PROPERTY,
            "Beam property '" + property + "' must be strictly positive");
        err.details["property"] = property;
        err.details["value"] = std::to_string(value);
        return err;
    }

    static BeamError non_finite(const std::string& what) {
        BeamError err(ErrorCode::NON_FINITE_VALUE,
            "Non-finite value supplied for " + what);
        err.details["field"] = what;
        return err;
    }

    static BeamError underconstrained(int n_supports) {
        BeamError err(ErrorCode::UNDERCONSTRAINED_SYSTEM,
            "Beam needs at least two supports");
        err.details["supports"] = std::to_string(n_supports);
        err.suggestion = "Add supports until there are at least two.";
        return err;
    }

    static BeamError entity_limit(const std::string& entity, int limit) {
        BeamError err(ErrorCode::ENTITY_LIMIT_EXCEEDED,
            "Too many " + entity + " on one beam");
        err.details["limit"] = std::to_string(limit);
        return err;
    }

    static BeamError unknown_support(const std::string& name) {
        BeamError err(ErrorCode::UNKNOWN_SUPPORT, "No support named '" + name + "'");
        err.involved_supports.push_back(name);
        return err;
    }

    static BeamError singular_flexibility(double rcond, const std::vector<std::string>& supports) {
        BeamError err(ErrorCode::SINGULAR_FLEXIBILITY_MATRIX,
            "Flexibility matrix is singular or too ill-conditioned to solve");
        err.involved_supports = supports;
        std::ostringstream oss;
        oss << rcond;
        err.details["rcond"] = oss.str();
        err.suggestion = "Check for redundant supports placed very close together.";
        return err;
    }
};

/**
 * @brief Base exception carrying a structured BeamError.
 */
class BeamDiagException : public std::runtime_error {
public:
    explicit BeamDiagException(const BeamError& error)
        : std::runtime_error(error.to_string()), error_(error) {}

    const BeamError& error() const { return error_; }
    ErrorCode code() const { return error_.code; }

private:
    BeamError error_;
};

/**
 * @brief Raised when a beam is malformed. Always fatal.
 */
class ValidationError : public BeamDiagException {
public:
    using BeamDiagException::BeamDiagException;
};

/**
 * @brief Raised when reactions cannot be resolved numerically.
 */
class SolveError : public BeamDiagException {
public:
    using BeamDiagException::BeamDiagException;
};

}  // namespace beamdiag

#endif  // BEAMDIAG_ERRORS_HPP
