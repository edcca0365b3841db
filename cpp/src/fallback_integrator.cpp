#include "beamdiag/fallback_integrator.hpp"
#include "beamdiag/reaction_solver.hpp"
#include "beamdiag/statics.hpp"

#include <Eigen/QR>
#include <algorithm>
#include <cmath>

namespace beamdiag {

namespace {

/// Heaviside with H(0) = 1/2
double half_step(double x, double a) {
    return 0.5 * (step(x, a, true) + step(x, a, false));
}

Eigen::VectorXd cumulative_trapezoid(const Eigen::VectorXd& x, const Eigen::VectorXd& f) {
    Eigen::VectorXd result = Eigen::VectorXd::Zero(f.size());
    for (Eigen::Index i = 1; i < f.size(); ++i) {
        result(i) = result(i - 1) + 0.5 * (x(i) - x(i - 1)) * (f(i) + f(i - 1));
    }
    return result;
}

Eigen::Index nearest_index(const Eigen::VectorXd& x, double xq) {
    Eigen::Index idx;
    (x.array() - xq).abs().minCoeff(&idx);
    return idx;
}

double interpolate(const Eigen::VectorXd& x, const Eigen::VectorXd& v, double xq) {
    const Eigen::Index n = x.size();
    if (xq <= x(0)) return v(0);
    if (xq >= x(n - 1)) return v(n - 1);
    Eigen::Index hi = std::upper_bound(x.data(), x.data() + n, xq) - x.data();
    Eigen::Index lo = hi - 1;
    double t = (xq - x(lo)) / (x(hi) - x(lo));
    return v(lo) + t * (v(hi) - v(lo));
}

} // namespace

FallbackIntegrator::FallbackIntegrator(const FallbackSettings& settings)
    : settings_(settings) {
}

ContinuousDiagram FallbackIntegrator::integrate(const Beam& beam, const ReactionMap& reactions) const {
    const Eigen::Index n = std::max(settings_.points, 3);
    const double EI = beam.EI();

    ContinuousDiagram d;
    d.x = Eigen::VectorXd::LinSpaced(n, 0.0, beam.length());
    d.shear = Eigen::VectorXd::Zero(n);

    for (Eigen::Index i = 0; i < n; ++i) {
        double x = d.x(i);
        double V = 0.0;
        for (const auto& support : beam.supports()) {
            V += reaction_of(reactions, support) * half_step(x, support.position);
        }
        for (const auto& load : beam.loads()) {
            V += 0.5 * (load.shear_contribution(x, true) + load.shear_contribution(x, false));
        }
        d.shear(i) = V;
    }

    d.moment = cumulative_trapezoid(d.x, d.shear);
    for (const auto& load : beam.loads()) {
        double jump = load.moment_jump();
        if (jump == 0.0) continue;
        for (Eigen::Index i = 0; i < n; ++i) {
            d.moment(i) += jump * half_step(d.x(i), load.position);
        }
    }

    d.rotation = cumulative_trapezoid(d.x, d.moment / EI);
    d.deflection = cumulative_trapezoid(d.x, d.rotation);

    // y = 0 at the extreme supports only
    const auto& supports = beam.supports();
    if (supports.size() >= 2) {
        Eigen::Index i1 = nearest_index(d.x, supports.front().position);
        Eigen::Index i2 = nearest_index(d.x, supports.back().position);
        if (i1 != i2) {
            double y1 = d.deflection(i1);
            double slope = (d.deflection(i2) - y1) / (d.x(i2) - d.x(i1));
            double x1 = d.x(i1);
            d.deflection = (d.deflection.array() - y1 - slope * (d.x.array() - x1)).matrix();
            d.rotation = (d.rotation.array() - slope).matrix();
        }
    }

    return d;
}

Eigen::VectorXd FallbackIntegrator::deflections_at(const Beam& primary,
                                                   const std::vector<double>& positions) const {
    ContinuousDiagram d = integrate(primary, DeterminateReactionSolver::reactions(primary));
    Eigen::VectorXd result(static_cast<Eigen::Index>(positions.size()));
    for (size_t i = 0; i < positions.size(); ++i) {
        result(static_cast<Eigen::Index>(i)) = interpolate(d.x, d.deflection, positions[i]);
    }
    return result;
}

ReactionMap FallbackIntegrator::solve_reactions(const Beam& beam) const {
    const auto& supports = beam.supports();
    if (supports.size() <= 2) {
        return DeterminateReactionSolver::reactions(beam);
    }

    std::vector<double> positions;
    for (size_t i = 1; i + 1 < supports.size(); ++i) {
        positions.push_back(supports[i].position);
    }
    const Eigen::Index m = static_cast<Eigen::Index>(positions.size());

    Beam primary = beam.primary_structure();
    Eigen::VectorXd delta = deflections_at(primary, positions);

    Beam unloaded = primary;
    unloaded.clear_loads();
    Eigen::MatrixXd f(m, m);
    for (Eigen::Index j = 0; j < m; ++j) {
        Beam unit = unloaded;
        unit.add_point_force(positions[static_cast<size_t>(j)], -1.0);
        f.col(j) = deflections_at(unit, positions);
    }

    Eigen::CompleteOrthogonalDecomposition<Eigen::MatrixXd> cod(m, m);
    cod.setThreshold(settings_.rank_threshold);
    cod.compute(f);
    Eigen::VectorXd redundants = cod.solve(-delta);

    return superpose_redundants(beam, redundants);
}

DiagramResult FallbackIntegrator::evaluate(const Beam& beam, const BeamError& cause) const {
    DiagramResult result;
    result.system_type = beam.classify();
    result.degree_of_indeterminacy = std::max(beam.degree_of_indeterminacy(), 0);
    result.used_fallback = true;
    result.reactions = solve_reactions(beam);

    ContinuousDiagram d = integrate(beam, result.reactions);
    result.x = d.x;
    result.shear = d.shear;
    result.moment = d.moment;
    result.rotation = d.rotation;
    result.deflection = d.deflection;

    BeamWarning warn = BeamWarning::fallback_engaged(cause.is_ok() ? "requested" : cause.message);
    if (cause.is_error()) {
        warn.details["cause"] = cause.code_string();
        for (const auto& kv : cause.details) warn.details[kv.first] = kv.second;
        warn.involved_supports = cause.involved_supports;
    }
    result.warnings.add(warn);
    return result;
}

} // namespace beamdiag
