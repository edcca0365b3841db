#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>

#include "beamdiag/errors.hpp"
#include "beamdiag/warnings.hpp"
#include "beamdiag/load.hpp"
#include "beamdiag/beam.hpp"
#include "beamdiag/node_set.hpp"
#include "beamdiag/diagram.hpp"
#include "beamdiag/piecewise_integrator.hpp"
#include "beamdiag/boundary_corrector.hpp"
#include "beamdiag/flexibility_diagnostics.hpp"
#include "beamdiag/reaction_solver.hpp"
#include "beamdiag/fallback_integrator.hpp"
#include "beamdiag/diagram_engine.hpp"

namespace py = pybind11;

/**
 * beamdiag C++ Python bindings module.
 * Exposes the beam model and the diagram engine to Python via pybind11.
 */
PYBIND11_MODULE(_beamdiag_cpp, m) {
    m.doc() = "beamdiag C++ core module - Shear, moment, rotation and deflection diagrams";

    m.attr("__version__") = "1.0.0";

    // ========================================================================
    // Errors & Warnings
    // ========================================================================

    py::enum_<beamdiag::ErrorCode>(m, "ErrorCode",
        "Error codes for invalid beams and failed solves")
        .value("OK", beamdiag::ErrorCode::OK, "No error")
        .value("DUPLICATE_SUPPORT", beamdiag::ErrorCode::DUPLICATE_SUPPORT,
               "Support within 1 mm of another support, or name already used")
        .value("OUT_OF_DOMAIN_LOAD", beamdiag::ErrorCode::OUT_OF_DOMAIN_LOAD,
               "Load coordinate outside [0, L]")
        .value("OUT_OF_DOMAIN_SUPPORT", beamdiag::ErrorCode::OUT_OF_DOMAIN_SUPPORT,
               "Support coordinate outside [0, L]")
        .value("INVALID_RANGE", beamdiag::ErrorCode::INVALID_RANGE,
               "Distributed load with start >= end")
        .value("NON_POSITIVE_PROPERTY", beamdiag::ErrorCode::NON_POSITIVE_PROPERTY,
               "Length, E or I not strictly positive")
        .value("NON_FINITE_VALUE", beamdiag::ErrorCode::NON_FINITE_VALUE,
               "NaN or infinite input")
        .value("UNDERCONSTRAINED_SYSTEM", beamdiag::ErrorCode::UNDERCONSTRAINED_SYSTEM,
               "Fewer than two supports")
        .value("ENTITY_LIMIT_EXCEEDED", beamdiag::ErrorCode::ENTITY_LIMIT_EXCEEDED,
               "Too many supports or loads")
        .value("UNKNOWN_SUPPORT", beamdiag::ErrorCode::UNKNOWN_SUPPORT,
               "No support with the requested name")
        .value("SINGULAR_FLEXIBILITY_MATRIX", beamdiag::ErrorCode::SINGULAR_FLEXIBILITY_MATRIX,
               "Flexibility matrix too ill-conditioned to solve")
        .value("UNKNOWN_ERROR", beamdiag::ErrorCode::UNKNOWN_ERROR, "Unknown error")
        .export_values();

    py::class_<beamdiag::BeamError>(m, "BeamError",
        "Structured error with code, message and diagnostic details")
        .def(py::init<>())
        .def(py::init<beamdiag::ErrorCode, const std::string&>(),
             py::arg("code"), py::arg("message"))
        .def_readwrite("code", &beamdiag::BeamError::code)
        .def_readwrite("message", &beamdiag::BeamError::message)
        .def_readwrite("involved_supports", &beamdiag::BeamError::involved_supports,
                       "Names of supports involved in the error")
        .def_readwrite("involved_loads", &beamdiag::BeamError::involved_loads,
                       "Indices of loads involved in the error")
        .def_readwrite("details", &beamdiag::BeamError::details)
        .def_readwrite("suggestion", &beamdiag::BeamError::suggestion)
        .def("is_ok", &beamdiag::BeamError::is_ok)
        .def("is_error", &beamdiag::BeamError::is_error)
        .def("code_string", &beamdiag::BeamError::code_string)
        .def("to_string", &beamdiag::BeamError::to_string)
        .def("__repr__", [](const beamdiag::BeamError &e) {
            if (e.is_ok()) return std::string("<BeamError OK>");
            return "<BeamError " + e.code_string() + ": " + e.message + ">";
        })
        .def("__str__", &beamdiag::BeamError::to_string)
        .def("__bool__", [](const beamdiag::BeamError &e) {
            return e.is_error();
        });

    py::register_exception<beamdiag::ValidationError>(m, "ValidationError", PyExc_ValueError);
    py::register_exception<beamdiag::SolveError>(m, "SolveError", PyExc_RuntimeError);

    py::enum_<beamdiag::WarningCode>(m, "WarningCode",
        "Warning codes for degraded or questionable results")
        .value("NO_LOADS", beamdiag::WarningCode::NO_LOADS, "Beam carries no loads")
        .value("UPLIFT_REACTION", beamdiag::WarningCode::UPLIFT_REACTION,
               "A support reaction acts downward")
        .value("ILL_CONDITIONED_FLEXIBILITY", beamdiag::WarningCode::ILL_CONDITIONED_FLEXIBILITY,
               "Flexibility matrix is poorly conditioned")
        .value("EQUILIBRIUM_RESIDUAL", beamdiag::WarningCode::EQUILIBRIUM_RESIDUAL,
               "Sum of reactions differs from sum of loads")
        .value("MOMENT_CORRECTION_EXCEEDED", beamdiag::WarningCode::MOMENT_CORRECTION_EXCEEDED,
               "Large moment drift removed")
        .value("DEFLECTION_CORRECTION_EXCEEDED", beamdiag::WarningCode::DEFLECTION_CORRECTION_EXCEEDED,
               "Large deflection residual removed at supports")
        .value("FALLBACK_ENGAGED", beamdiag::WarningCode::FALLBACK_ENGAGED,
               "Result produced by the fallback integrator")
        .export_values();

    py::enum_<beamdiag::WarningSeverity>(m, "WarningSeverity")
        .value("Low", beamdiag::WarningSeverity::Low)
        .value("Medium", beamdiag::WarningSeverity::Medium)
        .value("High", beamdiag::WarningSeverity::High)
        .export_values();

    py::class_<beamdiag::BeamWarning>(m, "BeamWarning")
        .def_readonly("code", &beamdiag::BeamWarning::code)
        .def_readonly("severity", &beamdiag::BeamWarning::severity)
        .def_readonly("message", &beamdiag::BeamWarning::message)
        .def_readonly("involved_supports", &beamdiag::BeamWarning::involved_supports)
        .def_readonly("details", &beamdiag::BeamWarning::details)
        .def_readonly("suggestion", &beamdiag::BeamWarning::suggestion)
        .def("code_string", &beamdiag::BeamWarning::code_string)
        .def("to_string", &beamdiag::BeamWarning::to_string)
        .def("__repr__", [](const beamdiag::BeamWarning &w) {
            return "<BeamWarning " + w.code_string() + ": " + w.message + ">";
        });

    py::class_<beamdiag::WarningList>(m, "WarningList")
        .def(py::init<>())
        .def_readonly("warnings", &beamdiag::WarningList::warnings)
        .def("has_warnings", &beamdiag::WarningList::has_warnings)
        .def("count", &beamdiag::WarningList::count)
        .def("contains", &beamdiag::WarningList::contains, py::arg("code"))
        .def("get_by_min_severity", &beamdiag::WarningList::get_by_min_severity,
             py::arg("min_severity"))
        .def("summary", &beamdiag::WarningList::summary)
        .def("__len__", &beamdiag::WarningList::count);

    // ========================================================================
    // Beam Model
    // ========================================================================

    py::enum_<beamdiag::LoadType>(m, "LoadType")
        .value("PointForce", beamdiag::LoadType::PointForce)
        .value("PointMoment", beamdiag::LoadType::PointMoment)
        .value("LinearDistributed", beamdiag::LoadType::LinearDistributed)
        .export_values();

    py::class_<beamdiag::Load>(m, "Load",
        "Point force, point moment or linearly varying distributed load")
        .def_readonly("type", &beamdiag::Load::type)
        .def_readonly("position", &beamdiag::Load::position, "Point loads: coordinate [m]")
        .def_readonly("magnitude", &beamdiag::Load::magnitude,
                      "Point loads: force [N] (downward positive) or moment [N·m]")
        .def_readonly("start", &beamdiag::Load::start)
        .def_readonly("end", &beamdiag::Load::end)
        .def_readonly("w_start", &beamdiag::Load::w_start)
        .def_readonly("w_end", &beamdiag::Load::w_end)
        .def_static("point_force", &beamdiag::Load::point_force,
                    py::arg("position"), py::arg("magnitude"))
        .def_static("point_moment", &beamdiag::Load::point_moment,
                    py::arg("position"), py::arg("magnitude"))
        .def_static("uniform", &beamdiag::Load::uniform,
                    py::arg("start"), py::arg("end"), py::arg("intensity"))
        .def_static("triangular", &beamdiag::Load::triangular,
                    py::arg("start"), py::arg("end"), py::arg("peak"),
                    py::arg("peak_at_end") = true)
        .def_static("linear", &beamdiag::Load::linear,
                    py::arg("start"), py::arg("end"), py::arg("w_start"), py::arg("w_end"))
        .def("resultant", &beamdiag::Load::resultant)
        .def("centroid", &beamdiag::Load::centroid)
        .def("moment_about", &beamdiag::Load::moment_about, py::arg("x0"))
        .def("intensity_at", &beamdiag::Load::intensity_at, py::arg("x"))
        .def("description", &beamdiag::Load::description)
        .def("__repr__", [](const beamdiag::Load &l) {
            return "<Load " + l.description() + ">";
        });

    py::class_<beamdiag::Support>(m, "Support")
        .def_readonly("name", &beamdiag::Support::name)
        .def_readonly("position", &beamdiag::Support::position)
        .def("__repr__", [](const beamdiag::Support &s) {
            return "<Support " + s.name + " x=" + std::to_string(s.position) + ">";
        });

    py::enum_<beamdiag::SystemType>(m, "SystemType")
        .value("Underconstrained", beamdiag::SystemType::Underconstrained)
        .value("Determinate", beamdiag::SystemType::Determinate)
        .value("Indeterminate", beamdiag::SystemType::Indeterminate)
        .export_values();

    py::class_<beamdiag::BeamLimits>(m, "BeamLimits")
        .def(py::init<>())
        .def_readwrite("max_supports", &beamdiag::BeamLimits::max_supports)
        .def_readwrite("max_loads", &beamdiag::BeamLimits::max_loads);

    py::class_<beamdiag::SystemReport>(m, "SystemReport")
        .def_readonly("valid", &beamdiag::SystemReport::valid)
        .def_readonly("type", &beamdiag::SystemReport::type)
        .def_readonly("degree", &beamdiag::SystemReport::degree)
        .def_readonly("errors", &beamdiag::SystemReport::errors)
        .def_readonly("warnings", &beamdiag::SystemReport::warnings)
        .def("to_string", &beamdiag::SystemReport::to_string);

    py::class_<beamdiag::Beam>(m, "Beam",
        "Straight prismatic beam on simple supports")
        .def(py::init<double, double, double, const beamdiag::BeamLimits&>(),
             py::arg("length"), py::arg("E"), py::arg("I"),
             py::arg("limits") = beamdiag::BeamLimits(),
             "Construct a beam of length L [m], modulus E [Pa] and inertia I [m^4]")
        .def_static("with_rigidity", &beamdiag::Beam::with_rigidity,
                    py::arg("length"), py::arg("EI"),
                    py::arg("limits") = beamdiag::BeamLimits())
        .def_property_readonly("length", &beamdiag::Beam::length)
        .def_property_readonly("has_section_properties", &beamdiag::Beam::has_section_properties)
        .def_property_readonly("E", &beamdiag::Beam::E,
                               "Young's modulus [Pa]; raises if only EI was given")
        .def_property_readonly("I", &beamdiag::Beam::I)
        .def_property_readonly("EI", &beamdiag::Beam::EI)
        .def_property_readonly("supports", &beamdiag::Beam::supports)
        .def_property_readonly("loads", &beamdiag::Beam::loads)
        .def("add_support", &beamdiag::Beam::add_support,
             py::arg("position"), py::arg("name") = "")
        .def("add_load", &beamdiag::Beam::add_load, py::arg("load"))
        .def("add_point_force", &beamdiag::Beam::add_point_force,
             py::arg("position"), py::arg("magnitude"))
        .def("add_point_moment", &beamdiag::Beam::add_point_moment,
             py::arg("position"), py::arg("magnitude"))
        .def("add_uniform_load", &beamdiag::Beam::add_uniform_load,
             py::arg("start"), py::arg("end"), py::arg("intensity"))
        .def("add_linear_load", &beamdiag::Beam::add_linear_load,
             py::arg("start"), py::arg("end"), py::arg("w_start"), py::arg("w_end"))
        .def("clear_supports", &beamdiag::Beam::clear_supports)
        .def("clear_loads", &beamdiag::Beam::clear_loads)
        .def("classify", &beamdiag::Beam::classify)
        .def("degree_of_indeterminacy", &beamdiag::Beam::degree_of_indeterminacy)
        .def("check", &beamdiag::Beam::check)
        .def("validate", &beamdiag::Beam::validate)
        .def("total_applied_force", &beamdiag::Beam::total_applied_force)
        .def("load_summary", &beamdiag::Beam::load_summary)
        .def("__repr__", [](const beamdiag::Beam &b) {
            return "<Beam L=" + std::to_string(b.length()) +
                   " supports=" + std::to_string(b.supports().size()) +
                   " loads=" + std::to_string(b.loads().size()) + ">";
        });

    // ========================================================================
    // Settings
    // ========================================================================

    py::class_<beamdiag::IntegratorSettings>(m, "IntegratorSettings")
        .def(py::init<>())
        .def_readwrite("samples", &beamdiag::IntegratorSettings::samples)
        .def_readwrite("min_samples_per_span", &beamdiag::IntegratorSettings::min_samples_per_span)
        .def_readwrite("subdivisions", &beamdiag::IntegratorSettings::subdivisions);

    py::class_<beamdiag::CorrectorSettings>(m, "CorrectorSettings")
        .def(py::init<>())
        .def_readwrite("relative_tolerance", &beamdiag::CorrectorSettings::relative_tolerance)
        .def_readwrite("absolute_floor", &beamdiag::CorrectorSettings::absolute_floor);

    py::class_<beamdiag::FlexibilitySettings>(m, "FlexibilitySettings")
        .def(py::init<>())
        .def_readwrite("singular_rcond", &beamdiag::FlexibilitySettings::singular_rcond)
        .def_readwrite("warning_rcond", &beamdiag::FlexibilitySettings::warning_rcond);

    py::class_<beamdiag::FallbackSettings>(m, "FallbackSettings",
        "Uniform-grid fallback. Deflection is pinned at both extreme supports only.")
        .def(py::init<>())
        .def_readwrite("points", &beamdiag::FallbackSettings::points)
        .def_readwrite("rank_threshold", &beamdiag::FallbackSettings::rank_threshold);

    py::class_<beamdiag::DiagramSettings>(m, "DiagramSettings")
        .def(py::init<>())
        .def_readwrite("integrator", &beamdiag::DiagramSettings::integrator)
        .def_readwrite("corrector", &beamdiag::DiagramSettings::corrector)
        .def_readwrite("flexibility", &beamdiag::DiagramSettings::flexibility)
        .def_readwrite("fallback", &beamdiag::DiagramSettings::fallback)
        .def_readwrite("node_tolerance", &beamdiag::DiagramSettings::node_tolerance)
        .def_readwrite("equilibrium_tolerance", &beamdiag::DiagramSettings::equilibrium_tolerance)
        .def_readwrite("enable_fallback", &beamdiag::DiagramSettings::enable_fallback);

    // ========================================================================
    // Results
    // ========================================================================

    py::enum_<beamdiag::DiagramQuantity>(m, "DiagramQuantity")
        .value("Shear", beamdiag::DiagramQuantity::Shear)
        .value("Moment", beamdiag::DiagramQuantity::Moment)
        .value("Rotation", beamdiag::DiagramQuantity::Rotation)
        .value("Deflection", beamdiag::DiagramQuantity::Deflection)
        .export_values();

    py::class_<beamdiag::DiagramExtreme>(m, "DiagramExtreme")
        .def_readonly("x", &beamdiag::DiagramExtreme::x)
        .def_readonly("value", &beamdiag::DiagramExtreme::value)
        .def("__repr__", [](const beamdiag::DiagramExtreme &e) {
            return "<DiagramExtreme x=" + std::to_string(e.x) +
                   " value=" + std::to_string(e.value) + ">";
        });

    py::class_<beamdiag::NodeState>(m, "NodeState",
        "Exact one-sided values at a breakpoint")
        .def_readonly("node_id", &beamdiag::NodeState::node_id)
        .def_readonly("x", &beamdiag::NodeState::x)
        .def_readonly("shear_left", &beamdiag::NodeState::shear_left)
        .def_readonly("shear_right", &beamdiag::NodeState::shear_right)
        .def_readonly("moment_left", &beamdiag::NodeState::moment_left)
        .def_readonly("moment_right", &beamdiag::NodeState::moment_right)
        .def_readonly("rotation", &beamdiag::NodeState::rotation)
        .def_readonly("deflection", &beamdiag::NodeState::deflection)
        .def_readonly("is_support", &beamdiag::NodeState::is_support)
        .def("shear_jump", &beamdiag::NodeState::shear_jump)
        .def("moment_jump", &beamdiag::NodeState::moment_jump);

    py::class_<beamdiag::DiagramResult>(m, "DiagramResult",
        "Sampled diagrams, reactions and diagnostics")
        .def_readonly("x", &beamdiag::DiagramResult::x)
        .def_readonly("shear", &beamdiag::DiagramResult::shear)
        .def_readonly("moment", &beamdiag::DiagramResult::moment)
        .def_readonly("rotation", &beamdiag::DiagramResult::rotation)
        .def_readonly("deflection", &beamdiag::DiagramResult::deflection)
        .def_readonly("nodes", &beamdiag::DiagramResult::nodes)
        .def_readonly("reactions", &beamdiag::DiagramResult::reactions)
        .def_readonly("system_type", &beamdiag::DiagramResult::system_type)
        .def_readonly("degree_of_indeterminacy", &beamdiag::DiagramResult::degree_of_indeterminacy)
        .def_readonly("flexibility_rcond", &beamdiag::DiagramResult::flexibility_rcond)
        .def_readonly("used_fallback", &beamdiag::DiagramResult::used_fallback,
                      "True if the uniform-grid fallback produced this result; "
                      "deflection is then zero only at the two extreme supports")
        .def_readonly("warnings", &beamdiag::DiagramResult::warnings)
        .def("max", &beamdiag::DiagramResult::max, py::arg("quantity"))
        .def("min", &beamdiag::DiagramResult::min, py::arg("quantity"))
        .def("extreme", &beamdiag::DiagramResult::extreme, py::arg("quantity"))
        .def("value_at", &beamdiag::DiagramResult::value_at,
             py::arg("quantity"), py::arg("x"))
        .def("reaction", &beamdiag::DiagramResult::reaction, py::arg("name"))
        .def("reaction_sum", &beamdiag::DiagramResult::reaction_sum)
        .def("event_positions", &beamdiag::DiagramResult::event_positions)
        .def("summary", &beamdiag::DiagramResult::summary)
        .def("__len__", &beamdiag::DiagramResult::size);

    py::class_<beamdiag::FlexibilityDiagnostics>(m, "FlexibilityDiagnostics")
        .def_readonly("is_singular", &beamdiag::FlexibilityDiagnostics::is_singular)
        .def_readonly("rcond", &beamdiag::FlexibilityDiagnostics::rcond)
        .def_readonly("min_eigenvalue", &beamdiag::FlexibilityDiagnostics::min_eigenvalue)
        .def_readonly("max_eigenvalue", &beamdiag::FlexibilityDiagnostics::max_eigenvalue)
        .def_readonly("involved_supports", &beamdiag::FlexibilityDiagnostics::involved_supports)
        .def("to_string", &beamdiag::FlexibilityDiagnostics::to_string);

    py::class_<beamdiag::ReactionSolution>(m, "ReactionSolution")
        .def_readonly("reactions", &beamdiag::ReactionSolution::reactions)
        .def_readonly("system_type", &beamdiag::ReactionSolution::system_type)
        .def_readonly("redundant_supports", &beamdiag::ReactionSolution::redundant_supports)
        .def_readonly("flexibility", &beamdiag::ReactionSolution::flexibility)
        .def_readonly("load_deflections", &beamdiag::ReactionSolution::load_deflections)
        .def_readonly("rcond", &beamdiag::ReactionSolution::rcond)
        .def_readonly("warnings", &beamdiag::ReactionSolution::warnings);

    // ========================================================================
    // Engine
    // ========================================================================

    py::class_<beamdiag::DiagramEngine>(m, "DiagramEngine",
        "Computes shear, moment, rotation and deflection diagrams")
        .def(py::init<const beamdiag::DiagramSettings&>(),
             py::arg("settings") = beamdiag::DiagramSettings())
        .def("compute", &beamdiag::DiagramEngine::compute, py::arg("beam"),
             "Validate the beam, resolve reactions and integrate all diagrams")
        .def("solve_reactions", &beamdiag::DiagramEngine::solve_reactions, py::arg("beam"))
        .def_property_readonly("settings",
            [](const beamdiag::DiagramEngine &e) { return e.settings(); });

    m.def("compute_diagrams",
          [](const beamdiag::Beam &beam) {
              return beamdiag::DiagramEngine().compute(beam);
          },
          py::arg("beam"),
          "Compute diagrams with default settings");
}
