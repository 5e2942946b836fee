/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 *
 * Generation of TLEs from Cartesian states.
 */

#ifndef __TLEKIT_GENERATION_HPP
#define __TLEKIT_GENERATION_HPP

#include <tlekit/orbit.hpp>
#include <tlekit/tle.hpp>
#include <tlekit/vector.hpp>

#include <vector>

namespace tlekit {

/**
 * A TLE with the identification, mean motion derivatives and B* of a
 * template and the given mean elements. The revolution number is advanced
 * from the template's by the number of orbits between the two epochs.
 */
Tle buildTle(const KeplerianElements &elements, time_point epoch, const Tle &templateTle);

// ============================================================================
// Fixed Point
// ============================================================================

/**
 * Finds the mean elements whose initial SGP4/SDP4 state matches an
 * osculating state.
 *
 * Starting from the osculating equinoctial elements of the state, each
 * iteration propagates the current TLE to its own epoch and adds the scaled
 * difference between the target and recovered equinoctial elements.
 *
 * Convergence is not guaranteed. For exactly equatorial deep-space orbits
 * (26451 for example) the lunisolar inclination term pushes the inclination
 * below zero, the equinoctial map folds, and the iteration settles into a
 * two-cycle that no damping scale breaks. generate() then throws
 * TleGenerationException once the iteration limit is reached.
 *
 * Usage:
 *   FixedPointTleGenerator generator;
 *   Tle tle = generator.generate(pv, epoch, templateTle);
 */
class FixedPointTleGenerator {
public:
    static constexpr double EPSILON_DEFAULT = 1.0e-10;
    static constexpr int MAX_ITERATIONS_DEFAULT = 100;
    static constexpr double SCALE_DEFAULT = 1.0;

    /**
     * @param epsilon Relative convergence threshold
     * @param maxIterations Iteration budget
     * @param scale Fraction of the residual applied on each iteration, in (0, 1]
     * @throws std::invalid_argument if a setting is out of range
     */
    explicit FixedPointTleGenerator(double epsilon = EPSILON_DEFAULT,
                                    int maxIterations = MAX_ITERATIONS_DEFAULT,
                                    double scale = SCALE_DEFAULT);

    /**
     * @param state Position (m) and velocity (m/s) in TEME at epoch
     * @throws TleGenerationException if the iteration doesn't converge
     * @throws InvalidOrbitException if the state isn't on an elliptic orbit
     */
    Tle generate(const PV &state, time_point epoch, const Tle &templateTle) const;

private:
    double epsilon;
    int maxIterations;
    double scale;
};

// ============================================================================
// Least Squares
// ============================================================================

struct EphemerisSample {
    time_point date;
    PV pv;
};

struct LeastSquaresResult {
    Tle tle;
    double rms;         ///< RMS of the position residuals (m)
    int iterations;
    bool converged;
};

/**
 * Fits a TLE to an ephemeris with Levenberg-Marquardt, using the analytical
 * Jacobians of the propagation.
 *
 * The fitted TLE's epoch is the date of the first sample. Velocity residuals
 * are divided by the mean motion so that they are in metres like the
 * position residuals.
 */
class LeastSquaresTleGenerator {
public:
    static constexpr int MAX_ITERATIONS_DEFAULT = 40;

    /**
     * @param positionOnly Fit positions only
     * @param fitBStar Estimate B* along with the mean elements
     * @throws std::invalid_argument if maxIterations isn't positive
     */
    explicit LeastSquaresTleGenerator(int maxIterations = MAX_ITERATIONS_DEFAULT,
                                      bool positionOnly = false, bool fitBStar = false);

    /**
     * @throws TleGenerationException if there aren't enough samples
     */
    LeastSquaresResult generate(const std::vector<EphemerisSample> &samples, const Tle &templateTle) const;

private:
    int maxIterations;
    bool positionOnly;
    bool fitBStar;

    struct Evaluation;

    Tle initialGuess(const std::vector<EphemerisSample> &samples, const Tle &templateTle) const;
    Evaluation evaluate(const Tle &tle, const std::vector<EphemerisSample> &samples, double velocityScale) const;
};

} // namespace tlekit

#endif // __TLEKIT_GENERATION_HPP
