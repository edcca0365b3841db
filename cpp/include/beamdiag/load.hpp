#pragma once

#include "beamdiag/errors.hpp"

#include <string>

namespace beamdiag {

/// Coordinates closer than this are treated as coincident [m]
const double COORDINATE_TOLERANCE = 1e-9;

/**
 * @brief Kind of load carried by a Load
 */
enum class LoadType {
    PointForce,         ///< Concentrated force, positive downward [N]
    PointMoment,        ///< Concentrated moment, positive raises the right-hand side [N·m]
    LinearDistributed   ///< Linearly varying intensity over [start, end], positive downward [N/m]
};

std::string load_type_to_string(LoadType type);

/**
 * @brief Load applied to a beam
 *
 * A closed tagged variant over point force, point moment and linearly varying
 * distributed load. Every kind answers the same set of queries (resultant,
 * jumps, closed-form shear and moment contributions), so the integrators
 * never branch on the concrete kind.
 *
 * Sign convention:
 * - Downward forces and intensities are positive
 * - A point force P changes shear by -P at its position
 * - A point moment M0 changes bending moment by +M0 at its position
 *
 * Usage:
 *   Load p = Load::point_force(3.0, 10.0);
 *   Load w = Load::linear(0.0, 4.0, 0.0, 2.5);  // triangular, rising to the right
 */
struct Load {
    LoadType type = LoadType::PointForce;

    double position = 0.0;   ///< Point loads: application point [m]
    double magnitude = 0.0;  ///< Point loads: force [N] or moment [N·m]

    double start = 0.0;      ///< Distributed: start coordinate [m]
    double end = 0.0;        ///< Distributed: end coordinate [m]
    double w_start = 0.0;    ///< Distributed: intensity at start [N/m]
    double w_end = 0.0;      ///< Distributed: intensity at end [N/m]

    // Factories

    static Load point_force(double position, double magnitude);
    static Load point_moment(double position, double magnitude);
    static Load uniform(double start, double end, double intensity);
    static Load triangular(double start, double end, double peak, bool peak_at_end = true);
    static Load linear(double start, double end, double w_start, double w_end);

    bool is_point() const { return type != LoadType::LinearDistributed; }
    bool is_distributed() const { return type == LoadType::LinearDistributed; }

    /// Smallest coordinate the load touches [m]
    double min_coordinate() const { return is_point() ? position : start; }

    /// Largest coordinate the load touches [m]
    double max_coordinate() const { return is_point() ? position : end; }

    /**
     * @brief Net downward force [N]. Zero for a point moment.
     */
    double resultant() const;

    /**
     * @brief Line of action of the resultant [m]
     *
     * For a distributed load whose resultant vanishes the midpoint is returned.
     */
    double centroid() const;

    /**
     * @brief Static moment of the load about x0 [N·m]
     *
     * Forces contribute F·(x - x0), point moments contribute M0. This is the
     * quantity balanced by the reactions in the moment equilibrium equation.
     */
    double moment_about(double x0) const;

    /**
     * @brief Distributed intensity at x [N/m], zero for point loads and outside [start, end]
     */
    double intensity_at(double x) const;

    /// Change in shear caused at the load position
    double shear_jump() const;

    /// Change in bending moment caused at the load position
    double moment_jump() const;

    /**
     * @brief Contribution of this load to shear at x
     *
     * @param x Evaluation point [m]
     * @param left_limit Evaluate just left of x, excluding a jump located at x
     */
    double shear_contribution(double x, bool left_limit = false) const;

    /**
     * @brief Contribution of this load to bending moment at x
     */
    double moment_contribution(double x, bool left_limit = false) const;

    /**
     * @brief Check the load against a beam of given length
     * @param length Beam length [m]
     * @param index Index reported in the error (-1 if not yet added)
     * @return BeamError with code OK if the load fits on the beam
     */
    BeamError check(double length, int index = -1) const;

    /// One-line human readable description
    std::string description() const;
};

/**
 * @brief Heaviside step H(x - a) with coincidence tolerance
 *
 * @param left_limit If true, H is 0 at x == a; otherwise H is 1 there.
 */
double step(double x, double a, bool left_limit);

} // namespace beamdiag
