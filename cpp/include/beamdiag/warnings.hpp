/**
 * @file warnings.hpp
 * @brief Non-fatal numerical and modelling warnings.
 *
 * Warnings never interrupt a calculation. They travel with the result and
 * the caller decides whether to treat any of them as a failure.
 */

#ifndef BEAMDIAG_WARNINGS_HPP
#define BEAMDIAG_WARNINGS_HPP

#include <string>
#include <vector>
#include <map>
#include <sstream>
#include <utility>

namespace beamdiag {

/**
 * @brief Warning codes.
 */
enum class WarningCode {
    // === Model Warnings (100-199) ===

    /// Beam has supports but no loads; all diagrams are zero
    NO_LOADS = 100,

    /// A support reaction is negative (support holds the beam down)
    UPLIFT_REACTION = 101,

    // === Solve Warnings (200-299) ===

    /// Flexibility matrix is poorly conditioned but still solved
    ILL_CONDITIONED_FLEXIBILITY = 200,

    /// Sum of reactions differs from the sum of applied forces
    EQUILIBRIUM_RESIDUAL = 201,

    // === Correction Warnings (300-399) ===

    /// Moment drift removed by the boundary corrector exceeded tolerance
    MOMENT_CORRECTION_EXCEEDED = 300,

    /// Deflection residual at supports exceeded tolerance
    DEFLECTION_CORRECTION_EXCEEDED = 301,

    // === Fallback Warnings (400-499) ===

    /// The continuous fallback integrator produced the result
    FALLBACK_ENGAGED = 400
};

enum class WarningSeverity {
    /// Minor issue, likely acceptable
    Low = 0,

    /// Potentially problematic, review recommended
    Medium = 1,

    /// Result accuracy is degraded
    High = 2
};

inline std::string warning_code_to_string(WarningCode code) {
    switch (code) {
        case WarningCode::NO_LOADS: return "NO_LOADS";
        case WarningCode::UPLIFT_REACTION: return "UPLIFT_REACTION";
        case WarningCode::ILL_CONDITIONED_FLEXIBILITY: return "ILL_CONDITIONED_FLEXIBILITY";
        case WarningCode::EQUILIBRIUM_RESIDUAL: return "EQUILIBRIUM_RESIDUAL";
        case WarningCode::MOMENT_CORRECTION_EXCEEDED: return "MOMENT_CORRECTION_EXCEEDED";
        case WarningCode::DEFLECTION_CORRECTION_EXCEEDED: return "DEFLECTION_CORRECTION_EXCEEDED";
        case WarningCode::FALLBACK_ENGAGED: return "FALLBACK_ENGAGED";
        default: return "UNKNOWN_WARNING";
    }
}

inline std::string severity_to_string(WarningSeverity severity) {
    switch (severity) {
        case WarningSeverity::Low: return "LOW";
        case WarningSeverity::Medium: return "MEDIUM";
        case WarningSeverity::High: return "HIGH";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Structured warning information.
 */
struct BeamWarning {
    /// Machine-readable warning code
    WarningCode code;

    /// Warning severity level
    WarningSeverity severity;

    /// Human-readable warning message
    std::string message;

    /// Names of supports involved in the warning
    std::vector<std::string> involved_supports;

    /// Additional key-value details for diagnostics
    std::map<std::string, std::string> details;

    /// Suggested fix for the warning
    std::string suggestion;

    BeamWarning(WarningCode code, WarningSeverity severity, const std::string& message)
        : code(code), severity(severity), message(message) {}

    std::string code_string() const { return warning_code_to_string(code); }

    std::string severity_string() const { return severity_to_string(severity); }

    /**
     * @brief Get formatted warning string for display.
     */
    std::string to_string() const {
        std::string result = "[" + severity_string() + "] [" + code_string() + "] " + message;

        if (!involved_supports.empty()) {
            result += "\n  Supports: ";
            for (size_t i = 0; i < involved_supports.size(); ++i) {
                if (i > 0) result += ", ";
                result += involved_supports[i];
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

    // === Factory methods for common warnings ===

    static BeamWarning no_loads() {
        BeamWarning warn(WarningCode::NO_LOADS, WarningSeverity::Low,
            "Beam carries no loads");
        warn.suggestion = "All diagrams and reactions are zero";
        return warn;
    }

    static BeamWarning uplift(const std::string& support, double reaction) {
        BeamWarning warn(WarningCode::UPLIFT_REACTION, WarningSeverity::Low,
            "Support reaction acts downward (uplift)");
        warn.involved_supports.push_back(support);
        warn.details["reaction"] = std::to_string(reaction);
        warn.suggestion = "The support must be able to hold the beam down";
        return warn;
    }

    static BeamWarning ill_conditioned(double rcond) {
        BeamWarning warn(WarningCode::ILL_CONDITIONED_FLEXIBILITY, WarningSeverity::Medium,
            "Flexibility matrix is poorly conditioned");
        std::ostringstream oss;
        oss << rcond;
        warn.details["rcond"] = oss.str();
        warn.suggestion = "Redundant reactions may be inaccurate. Check for supports placed "
                          "very close together";
        return warn;
    }

    static BeamWarning equilibrium_residual(double residual, double applied) {
        BeamWarning warn(WarningCode::EQUILIBRIUM_RESIDUAL, WarningSeverity::High,
            "Sum of reactions does not balance the applied forces");
        warn.details["residual"] = std::to_string(residual);
        warn.details["applied_total"] = std::to_string(applied);
        return warn;
    }

    static BeamWarning moment_correction(double residual, double reference) {
        BeamWarning warn(WarningCode::MOMENT_CORRECTION_EXCEEDED, WarningSeverity::Medium,
            "Boundary correction magnitude exceeded tolerance (moment)");
        warn.details["max_residual"] = std::to_string(residual);
        warn.details["max_abs_moment"] = std::to_string(reference);
        warn.suggestion = "Increase integrator samples or subdivisions";
        return warn;
    }

    static BeamWarning deflection_correction(double residual, double reference) {
        BeamWarning warn(WarningCode::DEFLECTION_CORRECTION_EXCEEDED, WarningSeverity::Medium,
            "Boundary correction magnitude exceeded tolerance (deflection)");
        warn.details["max_residual"] = std::to_string(residual);
        warn.details["max_abs_deflection"] = std::to_string(reference);
        warn.suggestion = "Increase integrator samples or subdivisions";
        return warn;
    }

    static BeamWarning fallback_engaged(const std::string& reason) {
        BeamWarning warn(WarningCode::FALLBACK_ENGAGED, WarningSeverity::High,
            "Fallback engaged: diagrams come from continuous integration");
        warn.details["reason"] = reason;
        warn.suggestion = "Jumps are smeared and deflection is only enforced at the "
                          "extreme supports";
        return warn;
    }
};

/**
 * @brief Collection of warnings attached to a result.
 */
class WarningList {
public:
    std::vector<BeamWarning> warnings;

    void add(const BeamWarning& warning) {
        warnings.push_back(warning);
    }

    void add(BeamWarning&& warning) {
        warnings.push_back(std::move(warning));
    }

    /**
     * @brief Append every warning of another list.
     */
    void merge(const WarningList& other) {
        warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
    }

    bool has_warnings() const { return !warnings.empty(); }

    size_t count() const { return warnings.size(); }

    bool contains(WarningCode code) const {
        for (const auto& w : warnings) {
            if (w.code == code) return true;
        }
        return false;
    }

    size_t count_by_severity(WarningSeverity severity) const {
        size_t count = 0;
        for (const auto& w : warnings) {
            if (w.severity == severity) ++count;
        }
        return count;
    }

    /**
     * @brief Get all warnings with given severity or higher.
     */
    std::vector<BeamWarning> get_by_min_severity(WarningSeverity min_severity) const {
        std::vector<BeamWarning> result;
        for (const auto& w : warnings) {
            if (static_cast<int>(w.severity) >= static_cast<int>(min_severity)) {
                result.push_back(w);
            }
        }
        return result;
    }

    void clear() { warnings.clear(); }

    std::string summary() const {
        if (warnings.empty()) return "No warnings";

        std::string result = std::to_string(warnings.size()) + " warning(s): ";
        result += std::to_string(count_by_severity(WarningSeverity::High)) + " high, ";
        result += std::to_string(count_by_severity(WarningSeverity::Medium)) + " medium, ";
        result += std::to_string(count_by_severity(WarningSeverity::Low)) + " low";
        return result;
    }
};

}  // namespace beamdiag

#endif  // BEAMDIAG_WARNINGS_HPP
