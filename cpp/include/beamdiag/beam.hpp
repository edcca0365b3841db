#pragma once

#include "beamdiag/errors.hpp"
#include "beamdiag/warnings.hpp"
#include "beamdiag/load.hpp"

#include <map>
#include <string>
#include <vector>

namespace beamdiag {

/// Minimum spacing between two supports [m]
const double SUPPORT_TOLERANCE = 1e-3;

/// Resolved vertical reaction per support name [N], positive upward
using ReactionMap = std::map<std::string, double>;

/**
 * @brief Structural classification of a beam
 */
enum class SystemType {
    Underconstrained,  ///< Fewer than two supports
    Determinate,       ///< Exactly two supports
    Indeterminate      ///< Three or more supports
};

std::string system_type_to_string(SystemType type);

/**
 * @brief Simple (roller) support providing one vertical reaction
 */
struct Support {
    std::string name;       ///< Unique support name
    double position = 0.0;  ///< Coordinate along the beam [m]

    Support() = default;
    Support(const std::string& n, double x) : name(n), position(x) {}
};

/**
 * @brief Upper bounds on model size
 *
 * Rejects pathological inputs before they produce excessive segment counts.
 */
struct BeamLimits {
    int max_supports = 32;
    int max_loads = 512;
};

/**
 * @brief Result of a non-throwing system check
 */
struct SystemReport {
    bool valid = false;
    SystemType type = SystemType::Underconstrained;
    int degree = 0;                  ///< Degree of static indeterminacy (n - 2)
    std::vector<BeamError> errors;   ///< Every validation failure found
    WarningList warnings;

    std::string to_string() const;
};

/**
 * @brief Straight prismatic Euler-Bernoulli beam with simple supports and loads
 *
 * Every mutation is validated immediately and throws ValidationError on
 * failure, so a Beam is never in an inconsistent state. Supports are kept
 * sorted by position. The beam knows nothing about how its diagrams are
 * computed; DiagramEngine takes it as a read-only input.
 *
 * Usage:
 *   Beam beam(6.0, 210e9, 8e-6);
 *   beam.add_support(0.0);
 *   beam.add_support(6.0);
 *   beam.add_point_force(3.0, 10.0);
 */
class Beam {
public:
    /**
     * @brief Construct a beam
     * @param length Span [m], > 0
     * @param E Young's modulus [Pa], > 0
     * @param I Second moment of area [m^4], > 0
     * @param limits Model size limits
     * @throws ValidationError NON_POSITIVE_PROPERTY or NON_FINITE_VALUE
     */
    Beam(double length, double E, double I, const BeamLimits& limits = BeamLimits());

    /**
     * @brief Construct a beam when only the flexural rigidity E·I is known
     *
     * E and I are then unknown: has_section_properties() is false and
     * E() and I() throw. Only EI() is available.
     */
    static Beam with_rigidity(double length, double EI, const BeamLimits& limits = BeamLimits());

    double length() const { return length_; }

    /// True if the beam was constructed from E and I separately
    bool has_section_properties() const { return has_section_properties_; }

    /**
     * @brief Young's modulus [Pa]
     * @throws std::logic_error if the beam was built with with_rigidity()
     */
    double E() const;

    /**
     * @brief Second moment of area [m^4]
     * @throws std::logic_error if the beam was built with with_rigidity()
     */
    double I() const;

    double EI() const { return EI_; }
    const BeamLimits& limits() const { return limits_; }

    const std::vector<Support>& supports() const { return supports_; }
    const std::vector<Load>& loads() const { return loads_; }

    /**
     * @brief Add a support
     * @param position Coordinate [m] in [0, L]
     * @param name Unique name; empty assigns the next free letter ("A", "B", ...)
     * @return Copy of the stored support
     * @throws ValidationError DUPLICATE_SUPPORT if within 1 mm of another support
     *         or the name is taken, OUT_OF_DOMAIN_SUPPORT, ENTITY_LIMIT_EXCEEDED
     */
    Support add_support(double position, const std::string& name = "");

    /**
     * @brief Add a load
     * @return Index of the load in loads()
     * @throws ValidationError OUT_OF_DOMAIN_LOAD, INVALID_RANGE, NON_FINITE_VALUE,
     *         ENTITY_LIMIT_EXCEEDED
     */
    int add_load(const Load& load);

    int add_point_force(double position, double magnitude);
    int add_point_moment(double position, double magnitude);
    int add_uniform_load(double start, double end, double intensity);
    int add_linear_load(double start, double end, double w_start, double w_end);

    void clear_supports();
    void clear_loads();

    /// Support with the given name, nullptr if none
    const Support* find_support(const std::string& name) const;

    /**
     * @brief Classify the system from its support count without solving
     */
    SystemType classify() const;

    /**
     * @brief Degree of static indeterminacy, n - 2 (negative if underconstrained)
     */
    int degree_of_indeterminacy() const;

    /**
     * @brief Re-check every invariant without throwing
     */
    SystemReport check() const;

    /**
     * @brief Re-check every invariant, throwing the first failure
     * @throws ValidationError
     */
    void validate() const;

    /**
     * @brief Determinate primary structure: same loads, only the two extreme supports
     */
    Beam primary_structure() const;

    /// Sum of all downward applied forces [N]
    double total_applied_force() const;

    /// Descriptions of all loads, in insertion order
    std::vector<std::string> load_summary() const;

private:
    std::string next_support_name() const;

    double length_;
    double E_;
    double I_;
    double EI_;
    bool has_section_properties_ = true;
    BeamLimits limits_;
    std::vector<Support> supports_;  ///< Sorted by position
    std::vector<Load> loads_;
};

} // namespace beamdiag
