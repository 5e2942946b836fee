/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 *
 * SGP4 Near-Earth Propagation Module
 * Based on the Dundee-compliant NORAD SGP4/SDP4 theory (Spacetrack Report #3).
 */

#ifndef __TLEKIT_SGP4_HPP
#define __TLEKIT_SGP4_HPP

#include <tlekit/constants.hpp>
#include <tlekit/scalar.hpp>
#include <tlekit/tle.hpp>
#include <tlekit/vector.hpp>

namespace tlekit {

/** Number of independent variables tracked by the differentiating propagator. */
constexpr int TLE_FREE_PARAMETERS = 7;

using TleGradient = Gradient<TLE_FREE_PARAMETERS>;

// ============================================================================
// SGP4 Data Structures
// ============================================================================

/**
 * Mean elements of a TLE in the scalar type of the propagator.
 * Mean motion in rad/s, angles in radians.
 */
template <typename T>
struct MeanElements {
    T meanMotion;
    T e;
    T i;
    T raan;
    T pa;
    T meanAnomaly;
    T bStar;

    /** Elements of a TLE as constants (no derivatives). */
    static MeanElements fromTle(const Tle &tle) {
        return {T(tle.getMeanMotion()), T(tle.getE()), T(tle.getI()), T(tle.getRaan()),
                T(tle.getPerigeeArgument()), T(tle.getMeanAnomaly()), T(tle.getBStar())};
    }
};

/**
 * Terms shared by SGP4 and SDP4, computed once per TLE.
 * Distances in Earth radii, time in minutes.
 */
template <typename T>
struct CommonTerms {
    T xn0dp;      // Original (Brouwer) mean motion, rad/min
    T a0dp;       // Original semi-major axis
    T cosi0, sini0, theta2;
    T e0sq, beta02, beta0;
    T perige;     // Perigee altitude, km
    T s4;
    T tsi, eta, etasq, eeta;
    T coef, coef1;
    T c1, c2, c4;
    T xmdot;      // Mean anomaly rate
    T omgdot;     // Argument of perigee rate
    T xnodot;     // RAAN rate
    T xnodcf, t2cof;
};

/**
 * Mean elements after the secular (and, for SDP4, lunar-solar) updates.
 * These feed the shared reconstruction step.
 */
template <typename T>
struct SecularElements {
    T a;
    T e;
    T i;
    T omega;
    T xnode;
    T xl;         // Mean longitude
    T cosi0;
    T sini0;
};

/**
 * Recover original mean motion and semi-major axis and compute the secular
 * rates shared by both theories.
 *
 * @throws InvalidOrbitException if the elements are out of range or the
 *         perigee is below the decay radius
 */
template <typename T>
CommonTerms<T> initializeCommons(const MeanElements<T> &elements);

/**
 * Long-period periodics, Kepler's equation, short-period periodics and
 * rotation into TEME.
 *
 * @return Position (m) and velocity (m/s)
 * @throws InvalidOrbitException if the perturbed eccentricity is too large
 */
template <typename T>
PVCoordinates<T> computePVCoordinates(const SecularElements<T> &elements);

// ============================================================================
// SGP4 Kernel
// ============================================================================

/**
 * Near-Earth theory, used when the orbital period is below 225 minutes.
 */
template <typename T>
class NearEarth {
public:
    NearEarth(const MeanElements<T> &elements, const CommonTerms<T> &commons);

    /**
     * Secular gravity and atmospheric drag updates.
     *
     * @param tSince Minutes since epoch
     */
    SecularElements<T> propagate(const MeanElements<T> &elements, const CommonTerms<T> &commons,
                                 double tSince) const;

    /** True if the perigee is below 220 km and the drag model is truncated. */
    bool isSimplified() const { return lessThan220; }

private:
    bool lessThan220;
    T delM0;
    T d2, d3, d4;
    T t3cof, t4cof, t5cof;
    T sinM0;
    T omgcof;
    T xmcof;
    T c5;
};

} // namespace tlekit

#endif // __TLEKIT_SGP4_HPP
