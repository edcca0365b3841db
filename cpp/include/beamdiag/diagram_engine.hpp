#pragma once

#include "beamdiag/beam.hpp"
#include "beamdiag/boundary_corrector.hpp"
#include "beamdiag/diagram.hpp"
#include "beamdiag/fallback_integrator.hpp"
#include "beamdiag/piecewise_integrator.hpp"
#include "beamdiag/reaction_solver.hpp"

#include <memory>

namespace beamdiag {

/**
 * @brief Configuration for a diagram computation
 *
 * Usage:
 *   DiagramSettings settings;
 *   settings.integrator.samples = 1000;
 *   settings.enable_fallback = false;  // let SolveError reach the caller
 *   DiagramEngine engine(settings);
 */
struct DiagramSettings {
    IntegratorSettings integrator;
    CorrectorSettings corrector;
    FlexibilitySettings flexibility;
    FallbackSettings fallback;

    /// Breakpoints closer than this are merged [m]
    double node_tolerance = COORDINATE_TOLERANCE;

    /// Relative tolerance of the ΣR = ΣF check
    double equilibrium_tolerance = 1e-9;

    /// Substitute the fallback integrator when the reaction solve fails numerically
    bool enable_fallback = true;
};

/**
 * @brief Computes shear, moment, rotation and deflection diagrams of a beam
 *
 * Pipeline:
 *   validate -> solve reactions -> build nodes -> integrate -> correct -> package
 *
 * The reaction strategy is chosen from the support count: closed-form statics
 * for two supports, the flexibility method for three or more. If the
 * flexibility matrix is rejected, the fallback integrator produces the whole
 * result instead and the result carries a FALLBACK_ENGAGED warning.
 *
 * The engine holds no per-call state. The beam is read only, so independent
 * beams can be computed concurrently with one engine.
 */
class DiagramEngine {
public:
    explicit DiagramEngine(const DiagramSettings& settings = DiagramSettings());

    /**
     * @brief Compute all diagrams and reactions
     * @throws ValidationError if the beam is invalid (always before any work)
     * @throws SolveError only if the fallback is disabled
     */
    DiagramResult compute(const Beam& beam) const;

    /**
     * @brief Resolve reactions only
     * @throws ValidationError, SolveError
     */
    ReactionSolution solve_reactions(const Beam& beam) const;

    /**
     * @brief Strategy used for a given system type
     * @throws ValidationError UNDERCONSTRAINED_SYSTEM for fewer than two supports
     */
    std::unique_ptr<ReactionSolver> make_solver(SystemType type) const;

    const DiagramSettings& settings() const { return settings_; }
    DiagramSettings& settings() { return settings_; }

private:
    /// Node-aware pipeline for already resolved reactions
    DiagramResult integrate(const Beam& beam, const ReactionSolution& solution) const;

    /// Equilibrium and uplift checks on a finished result
    void check_result(const Beam& beam, DiagramResult& result) const;

    DiagramSettings settings_;
};

} // namespace beamdiag
