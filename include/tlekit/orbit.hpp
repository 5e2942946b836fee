/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 *
 * Osculating orbit representations and the conversions between them.
 */

#ifndef __TLEKIT_ORBIT_HPP
#define __TLEKIT_ORBIT_HPP

#include <tlekit/constants.hpp>
#include <tlekit/vector.hpp>

namespace tlekit {

// ============================================================================
// Element Sets
// ============================================================================

/**
 * Classical Keplerian elements. Semi-major axis in metres, angles in radians.
 */
struct KeplerianElements {
    double a;
    double e;
    double i;
    double pa;            ///< Argument of perigee
    double raan;          ///< Right ascension of the ascending node
    double meanAnomaly;

    /** Keplerian mean motion (rad/s). */
    double getMeanMotion(double mu = MU) const;

    double getTrueAnomaly() const;
};

/**
 * Equinoctial elements, non-singular for circular and equatorial orbits.
 *
 *   ex = e cos(ω + Ω)          ey = e sin(ω + Ω)
 *   hx = tan(i/2) cos(Ω)       hy = tan(i/2) sin(Ω)
 *   lv = ν + ω + Ω (true longitude argument)
 */
struct EquinoctialElements {
    double a;
    double ex;
    double ey;
    double hx;
    double hy;
    double lv;

    double getE() const;

    /** Norm of the inclination vector, tan(i/2). */
    double getH() const;

    /** Eccentric longitude argument. */
    double getLE() const;

    /** Mean longitude argument. */
    double getLM() const;
};

// ============================================================================
// Anomalies
// ============================================================================

/**
 * Solve Kepler's equation M = E - e sin(E) for E.
 */
double meanToEccentricAnomaly(double meanAnomaly, double e);
double eccentricToMeanAnomaly(double eccentricAnomaly, double e);
double eccentricToTrueAnomaly(double eccentricAnomaly, double e);
double trueToEccentricAnomaly(double trueAnomaly, double e);
double meanToTrueAnomaly(double meanAnomaly, double e);
double trueToMeanAnomaly(double trueAnomaly, double e);

/** Keplerian mean motion (rad/s) for a semi-major axis in metres. */
double keplerianMeanMotion(double a, double mu = MU);

// ============================================================================
// Conversions
// ============================================================================

/**
 * Osculating equinoctial elements of a Cartesian state.
 *
 * @throws InvalidOrbitException if the state isn't on an elliptic orbit
 */
EquinoctialElements toEquinoctial(const PV &pv, double mu = MU);

EquinoctialElements toEquinoctial(const KeplerianElements &kep);

KeplerianElements toKeplerian(const EquinoctialElements &eq);

/**
 * @throws InvalidOrbitException if the state isn't on an elliptic orbit
 */
KeplerianElements toKeplerian(const PV &pv, double mu = MU);

PV toCartesian(const EquinoctialElements &eq, double mu = MU);
PV toCartesian(const KeplerianElements &kep, double mu = MU);

} // namespace tlekit

#endif // __TLEKIT_ORBIT_HPP
