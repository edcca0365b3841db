/**
 * @file test_beam_model.cpp
 * @brief Tests for Load, Beam validation and system classification
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "beamdiag/beam.hpp"
#include "beamdiag/load.hpp"
#include "beamdiag/errors.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

using namespace beamdiag;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;
using Catch::Matchers::ContainsSubstring;

namespace {

/// Run f and return the code of the ValidationError it throws
template <typename F>
ErrorCode validation_code(F&& f) {
    try {
        f();
    } catch (const ValidationError& e) {
        return e.code();
    }
    return ErrorCode::OK;
}

} // namespace

// =============================================================================
// Load Tests
// =============================================================================

TEST_CASE("Load: point force resultant and moment", "[Load][point]") {
    Load p = Load::point_force(3.0, 10.0);

    REQUIRE(p.is_point());
    REQUIRE_FALSE(p.is_distributed());
    REQUIRE_THAT(p.resultant(), WithinAbs(10.0, 1e-12));
    REQUIRE_THAT(p.centroid(), WithinAbs(3.0, 1e-12));
    REQUIRE_THAT(p.moment_about(1.0), WithinAbs(20.0, 1e-12));
    REQUIRE_THAT(p.shear_jump(), WithinAbs(-10.0, 1e-12));
    REQUIRE_THAT(p.moment_jump(), WithinAbs(0.0, 1e-12));
}

TEST_CASE("Load: point moment has no resultant", "[Load][point]") {
    Load m = Load::point_moment(2.0, 1000.0);

    REQUIRE_THAT(m.resultant(), WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(m.moment_about(0.0), WithinAbs(1000.0, 1e-12));
    REQUIRE_THAT(m.moment_about(5.0), WithinAbs(1000.0, 1e-12));
    REQUIRE_THAT(m.shear_jump(), WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(m.moment_jump(), WithinAbs(1000.0, 1e-12));
}

TEST_CASE("Load: triangular load resultant and centroid", "[Load][distributed]") {
    /**
     * Triangle rising from 0 to 2.5 N/m over [0, 4]:
     *   F = 0.5 * 2.5 * 4 = 5
     *   centroid at 2/3 of the base from the zero end
     */
    Load w = Load::triangular(0.0, 4.0, 2.5);

    REQUIRE(w.is_distributed());
    REQUIRE_THAT(w.w_start, WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(w.w_end, WithinAbs(2.5, 1e-12));
    REQUIRE_THAT(w.resultant(), WithinAbs(5.0, 1e-12));
    REQUIRE_THAT(w.centroid(), WithinAbs(8.0 / 3.0, 1e-12));
    REQUIRE_THAT(w.moment_about(0.0), WithinAbs(5.0 * 8.0 / 3.0, 1e-12));

    Load falling = Load::triangular(0.0, 4.0, 2.5, false);
    REQUIRE_THAT(falling.centroid(), WithinAbs(4.0 / 3.0, 1e-12));
}

TEST_CASE("Load: trapezoidal moment about arbitrary point", "[Load][distributed]") {
    Load w = Load::linear(2.0, 6.0, 1.0, 3.0);

    // F = 8, centroid = 2 + 4 * (1 + 6) / 12
    double F = 8.0;
    double xc = 2.0 + 4.0 * 7.0 / 12.0;
    REQUIRE_THAT(w.resultant(), WithinAbs(F, 1e-12));
    REQUIRE_THAT(w.centroid(), WithinAbs(xc, 1e-12));
    REQUIRE_THAT(w.moment_about(1.0), WithinAbs(F * (xc - 1.0), 1e-10));
}

TEST_CASE("Load: intensity is zero outside the loaded range", "[Load][distributed]") {
    Load w = Load::linear(2.0, 6.0, 1.0, 3.0);

    REQUIRE_THAT(w.intensity_at(1.0), WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(w.intensity_at(2.0), WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(w.intensity_at(4.0), WithinAbs(2.0, 1e-12));
    REQUIRE_THAT(w.intensity_at(6.0), WithinAbs(3.0, 1e-12));
    REQUIRE_THAT(w.intensity_at(7.0), WithinAbs(0.0, 1e-12));
}

TEST_CASE("Load: closed-form contributions of a uniform load", "[Load][distributed]") {
    Load w = Load::uniform(0.0, 10.0, 2.0);

    REQUIRE_THAT(w.shear_contribution(4.0), WithinAbs(-8.0, 1e-12));
    REQUIRE_THAT(w.moment_contribution(4.0), WithinAbs(-16.0, 1e-12));
    // Beyond the end the load acts as its resultant at the centroid
    Load partial = Load::uniform(0.0, 2.0, 3.0);
    REQUIRE_THAT(partial.shear_contribution(5.0), WithinAbs(-6.0, 1e-12));
    REQUIRE_THAT(partial.moment_contribution(5.0), WithinAbs(-6.0 * 4.0, 1e-12));
}

TEST_CASE("Load: point contributions use one-sided limits", "[Load][point]") {
    Load p = Load::point_force(3.0, 10.0);

    REQUIRE_THAT(p.shear_contribution(3.0, true), WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(p.shear_contribution(3.0, false), WithinAbs(-10.0, 1e-12));

    Load m = Load::point_moment(3.0, 50.0);
    REQUIRE_THAT(m.moment_contribution(3.0, true), WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(m.moment_contribution(3.0, false), WithinAbs(50.0, 1e-12));
}

TEST_CASE("Load: check reports domain and range errors", "[Load][validation]") {
    REQUIRE(Load::point_force(3.0, 1.0).check(6.0).is_ok());
    REQUIRE(Load::point_force(6.5, 1.0).check(6.0).code == ErrorCode::OUT_OF_DOMAIN_LOAD);
    REQUIRE(Load::point_moment(-0.1, 1.0).check(6.0).code == ErrorCode::OUT_OF_DOMAIN_LOAD);
    REQUIRE(Load::uniform(4.0, 2.0, 1.0).check(6.0).code == ErrorCode::INVALID_RANGE);
    REQUIRE(Load::uniform(2.0, 2.0, 1.0).check(6.0).code == ErrorCode::INVALID_RANGE);
    REQUIRE(Load::uniform(2.0, 7.0, 1.0).check(6.0).code == ErrorCode::OUT_OF_DOMAIN_LOAD);

    double nan = std::numeric_limits<double>::quiet_NaN();
    REQUIRE(Load::point_force(nan, 1.0).check(6.0).code == ErrorCode::NON_FINITE_VALUE);
    REQUIRE(Load::uniform(0.0, 1.0, nan).check(6.0).code == ErrorCode::NON_FINITE_VALUE);
}

TEST_CASE("Load: description names the load kind", "[Load]") {
    REQUIRE_THAT(Load::point_force(3.0, 10.0).description(), ContainsSubstring("Point force"));
    REQUIRE_THAT(Load::uniform(0.0, 1.0, 2.0).description(), ContainsSubstring("Uniform"));
    REQUIRE_THAT(Load::triangular(0.0, 1.0, 2.0).description(), ContainsSubstring("Triangular"));
    REQUIRE_THAT(Load::linear(0.0, 1.0, 1.0, 2.0).description(), ContainsSubstring("Trapezoidal"));
}

// =============================================================================
// Beam Construction Tests
// =============================================================================

TEST_CASE("Beam: construction stores properties", "[Beam][construction]") {
    Beam beam(6.0, 210e9, 8e-6);

    REQUIRE_THAT(beam.length(), WithinAbs(6.0, 1e-12));
    REQUIRE_THAT(beam.EI(), WithinRel(210e9 * 8e-6, 1e-12));
    REQUIRE(beam.supports().empty());
    REQUIRE(beam.loads().empty());
}

TEST_CASE("Beam: non-positive properties are rejected", "[Beam][validation]") {
    REQUIRE(validation_code([] { Beam(0.0, 210e9, 8e-6); }) == ErrorCode::NON_POSITIVE_PROPERTY);
    REQUIRE(validation_code([] { Beam(6.0, -1.0, 8e-6); }) == ErrorCode::NON_POSITIVE_PROPERTY);
    REQUIRE(validation_code([] { Beam(6.0, 210e9, 0.0); }) == ErrorCode::NON_POSITIVE_PROPERTY);
    REQUIRE(validation_code([] {
        Beam(std::numeric_limits<double>::infinity(), 210e9, 8e-6);
    }) == ErrorCode::NON_FINITE_VALUE);
    REQUIRE(validation_code([] { Beam::with_rigidity(6.0, 0.0); }) == ErrorCode::NON_POSITIVE_PROPERTY);
}

TEST_CASE("Beam: with_rigidity keeps the product", "[Beam][construction]") {
    Beam beam = Beam::with_rigidity(4.0, 1.5e6);
    REQUIRE_THAT(beam.EI(), WithinRel(1.5e6, 1e-12));
    REQUIRE_FALSE(beam.has_section_properties());
}

TEST_CASE("Beam: E and I are unknown when only the rigidity is given", "[Beam][construction]") {
    Beam rigidity_only = Beam::with_rigidity(4.0, 1.5e6);
    REQUIRE_THROWS_AS(rigidity_only.E(), std::logic_error);
    REQUIRE_THROWS_AS(rigidity_only.I(), std::logic_error);

    rigidity_only.add_support(0.0);
    rigidity_only.add_support(4.0);
    REQUIRE(rigidity_only.check().valid);

    Beam full(4.0, 210e9, 8e-6);
    REQUIRE(full.has_section_properties());
    REQUIRE_THAT(full.E(), WithinRel(210e9, 1e-12));
    REQUIRE_THAT(full.I(), WithinRel(8e-6, 1e-12));
    REQUIRE_THAT(full.EI(), WithinRel(1.68e6, 1e-12));
}

// =============================================================================
// Support Tests
// =============================================================================

TEST_CASE("Beam: supports are auto-named and kept sorted", "[Beam][support]") {
    Beam beam(10.0, 210e9, 8e-6);

    Support a = beam.add_support(0.0);
    Support b = beam.add_support(10.0);
    Support c = beam.add_support(5.0);

    REQUIRE(a.name == "A");
    REQUIRE(b.name == "B");
    REQUIRE(c.name == "C");

    const auto& supports = beam.supports();
    REQUIRE(supports.size() == 3);
    REQUIRE(supports[0].name == "A");
    REQUIRE(supports[1].name == "C");
    REQUIRE(supports[2].name == "B");
    REQUIRE_THAT(supports[1].position, WithinAbs(5.0, 1e-12));
}

TEST_CASE("Beam: explicit support names are kept", "[Beam][support]") {
    Beam beam(10.0, 210e9, 8e-6);
    beam.add_support(0.0, "left");
    beam.add_support(10.0, "right");

    REQUIRE(beam.find_support("left") != nullptr);
    REQUIRE(beam.find_support("right") != nullptr);
    REQUIRE(beam.find_support("A") == nullptr);
}

TEST_CASE("Beam: duplicate supports are rejected", "[Beam][support][validation]") {
    Beam beam(10.0, 210e9, 8e-6);
    beam.add_support(5.0, "mid");

    SECTION("within 1 mm") {
        try {
            beam.add_support(5.0005);
            FAIL("Expected ValidationError");
        } catch (const ValidationError& e) {
            REQUIRE(e.code() == ErrorCode::DUPLICATE_SUPPORT);
            REQUIRE(e.error().involved_supports.size() == 2);
            REQUIRE(e.error().involved_supports[0] == "mid");
        }
    }

    SECTION("same name") {
        REQUIRE(validation_code([&] { beam.add_support(8.0, "mid"); })
                == ErrorCode::DUPLICATE_SUPPORT);
    }

    SECTION("just beyond 1 mm is accepted") {
        REQUIRE_NOTHROW(beam.add_support(5.0011));
        REQUIRE(beam.supports().size() == 2);
    }

    // A rejected support leaves the beam unchanged
    REQUIRE(beam.find_support("mid") != nullptr);
}

TEST_CASE("Beam: supports outside the beam are rejected", "[Beam][support][validation]") {
    Beam beam(10.0, 210e9, 8e-6);

    REQUIRE(validation_code([&] { beam.add_support(-0.5); }) == ErrorCode::OUT_OF_DOMAIN_SUPPORT);
    REQUIRE(validation_code([&] { beam.add_support(10.5); }) == ErrorCode::OUT_OF_DOMAIN_SUPPORT);
    REQUIRE(validation_code([&] {
        beam.add_support(std::numeric_limits<double>::quiet_NaN());
    }) == ErrorCode::NON_FINITE_VALUE);
    REQUIRE(beam.supports().empty());
}

// =============================================================================
// Load Registration Tests
// =============================================================================

TEST_CASE("Beam: loads are validated on insertion", "[Beam][load][validation]") {
    Beam beam(6.0, 210e9, 8e-6);

    REQUIRE(beam.add_point_force(3.0, 10.0) == 0);
    REQUIRE(beam.add_uniform_load(0.0, 6.0, 2.0) == 1);

    try {
        beam.add_point_force(7.0, 1.0);
        FAIL("Expected ValidationError");
    } catch (const ValidationError& e) {
        REQUIRE(e.code() == ErrorCode::OUT_OF_DOMAIN_LOAD);
        REQUIRE(e.error().involved_loads.size() == 1);
        REQUIRE(e.error().involved_loads[0] == 2);
    }

    REQUIRE(validation_code([&] { beam.add_linear_load(4.0, 1.0, 1.0, 1.0); })
            == ErrorCode::INVALID_RANGE);
    REQUIRE(beam.loads().size() == 2);
}

TEST_CASE("Beam: total applied force sums resultants", "[Beam][load]") {
    Beam beam(6.0, 210e9, 8e-6);
    beam.add_point_force(3.0, 10.0);
    beam.add_uniform_load(0.0, 6.0, 2.0);
    beam.add_point_moment(1.0, 500.0);
    beam.add_load(Load::triangular(0.0, 4.0, 2.5));

    REQUIRE_THAT(beam.total_applied_force(), WithinAbs(10.0 + 12.0 + 5.0, 1e-12));
    REQUIRE(beam.load_summary().size() == 4);
}

TEST_CASE("Beam: entity limits are enforced", "[Beam][validation]") {
    BeamLimits limits;
    limits.max_supports = 2;
    limits.max_loads = 1;
    Beam beam(6.0, 210e9, 8e-6, limits);

    beam.add_support(0.0);
    beam.add_support(6.0);
    REQUIRE(validation_code([&] { beam.add_support(3.0); }) == ErrorCode::ENTITY_LIMIT_EXCEEDED);

    beam.add_point_force(3.0, 1.0);
    REQUIRE(validation_code([&] { beam.add_point_force(2.0, 1.0); })
            == ErrorCode::ENTITY_LIMIT_EXCEEDED);
}

// =============================================================================
// Classification Tests
// =============================================================================

TEST_CASE("Beam: classify by support count", "[Beam][classify]") {
    Beam beam(10.0, 210e9, 8e-6);
    REQUIRE(beam.classify() == SystemType::Underconstrained);

    beam.add_support(0.0);
    REQUIRE(beam.classify() == SystemType::Underconstrained);
    REQUIRE(beam.degree_of_indeterminacy() == -1);

    beam.add_support(10.0);
    REQUIRE(beam.classify() == SystemType::Determinate);
    REQUIRE(beam.degree_of_indeterminacy() == 0);

    beam.add_support(5.0);
    beam.add_support(7.5);
    REQUIRE(beam.classify() == SystemType::Indeterminate);
    REQUIRE(beam.degree_of_indeterminacy() == 2);

    REQUIRE(system_type_to_string(SystemType::Indeterminate) == "indeterminate");
}

TEST_CASE("Beam: check reports without throwing", "[Beam][check]") {
    Beam beam(10.0, 210e9, 8e-6);
    beam.add_support(0.0);

    SystemReport report = beam.check();
    REQUIRE_FALSE(report.valid);
    REQUIRE(report.type == SystemType::Underconstrained);
    REQUIRE(report.errors.size() == 1);
    REQUIRE(report.errors[0].code == ErrorCode::UNDERCONSTRAINED_SYSTEM);
    REQUIRE(report.warnings.contains(WarningCode::NO_LOADS));
    REQUIRE_THAT(report.to_string(), ContainsSubstring("Invalid"));

    beam.add_support(10.0);
    beam.add_uniform_load(0.0, 10.0, 1.0);
    report = beam.check();
    REQUIRE(report.valid);
    REQUIRE(report.type == SystemType::Determinate);
    REQUIRE_FALSE(report.warnings.has_warnings());
}

TEST_CASE("Beam: validate throws the first error", "[Beam][check]") {
    Beam beam(10.0, 210e9, 8e-6);
    beam.add_support(0.0);
    beam.add_point_force(5.0, 1.0);

    REQUIRE_THROWS_AS(beam.validate(), ValidationError);
    REQUIRE(validation_code([&] { beam.validate(); }) == ErrorCode::UNDERCONSTRAINED_SYSTEM);

    beam.add_support(10.0);
    REQUIRE_NOTHROW(beam.validate());
}

TEST_CASE("Beam: primary structure keeps the extreme supports", "[Beam][primary]") {
    Beam beam(10.0, 210e9, 8e-6);
    beam.add_support(0.0, "A");
    beam.add_support(4.0, "B");
    beam.add_support(7.0, "C");
    beam.add_support(10.0, "D");
    beam.add_uniform_load(0.0, 10.0, 3.0);

    Beam primary = beam.primary_structure();
    REQUIRE(primary.supports().size() == 2);
    REQUIRE(primary.supports()[0].name == "A");
    REQUIRE(primary.supports()[1].name == "D");
    REQUIRE(primary.loads().size() == 1);

    // The source beam is untouched
    REQUIRE(beam.supports().size() == 4);
}

TEST_CASE("Beam: clearing supports and loads", "[Beam]") {
    Beam beam(10.0, 210e9, 8e-6);
    beam.add_support(0.0);
    beam.add_support(10.0);
    beam.add_point_force(5.0, 1.0);

    beam.clear_loads();
    REQUIRE(beam.loads().empty());
    beam.clear_supports();
    REQUIRE(beam.supports().empty());

    // Names restart after clearing
    REQUIRE(beam.add_support(2.0).name == "A");
}

// =============================================================================
// Error Formatting Tests
// =============================================================================

TEST_CASE("BeamError: formatting and exception message", "[BeamError]") {
    BeamError err = BeamError::duplicate_support("B", "A", 5.0, 0.0005);

    REQUIRE(err.is_error());
    REQUIRE(err.code_string() == "DUPLICATE_SUPPORT");
    REQUIRE_THAT(err.to_string(), ContainsSubstring("DUPLICATE_SUPPORT"));
    REQUIRE_THAT(err.to_string(), ContainsSubstring("Suggestion"));

    ValidationError ex(err);
    REQUIRE_THAT(std::string(ex.what()), ContainsSubstring("duplicates existing support"));

    BeamError ok;
    REQUIRE(ok.is_ok());
    REQUIRE(ok.to_string() == "OK");
}
