/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 *
 * Physical constants of the NORAD SGP4/SDP4 theories (WGS-72 based).
 */

#ifndef __TLEKIT_CONSTANTS_HPP
#define __TLEKIT_CONSTANTS_HPP

#include <cmath>

namespace tlekit {

constexpr double TWO_PI = 2.0 * M_PI;
constexpr double ONE_THIRD = 1.0 / 3.0;
constexpr double TWO_THIRD = 2.0 / 3.0;

// Degree-radian conversion factors
constexpr double DEGREES_TO_RADIANS = M_PI / 180.0;
constexpr double RADIANS_TO_DEGREES = 180.0 / M_PI;

constexpr double MINUTES_PER_DAY = 1440.0;
constexpr double SECONDS_PER_DAY = 86400.0;

// ============================================================================
// Earth model
// ============================================================================

constexpr double XKE = 0.0743669161331734132;               // sqrt(GM) in Earth radii^1.5/min
constexpr double EARTH_RADIUS = 6378.135;                   // Equatorial radius (km)
constexpr double NORMALIZED_EQUATORIAL_RADIUS = 1.0;
constexpr double XJ2 = 1.082616e-3;                         // Second zonal harmonic
constexpr double XJ3 = -0.253881e-5;                        // Third zonal harmonic
constexpr double XJ4 = -0.165597e-5;                        // Fourth zonal harmonic
constexpr double CK2 = 0.5 * XJ2 * NORMALIZED_EQUATORIAL_RADIUS * NORMALIZED_EQUATORIAL_RADIUS;
constexpr double CK4 = -0.375 * XJ4 * NORMALIZED_EQUATORIAL_RADIUS * NORMALIZED_EQUATORIAL_RADIUS *
                       NORMALIZED_EQUATORIAL_RADIUS * NORMALIZED_EQUATORIAL_RADIUS;
constexpr double S = NORMALIZED_EQUATORIAL_RADIUS * (1.0 + 78.0 / EARTH_RADIUS);
constexpr double QOMS2T = 1.880279159015270643865e-9;       // ((120 - 78) / ER)^4
constexpr double A3OVK2 = -XJ3 / CK2 * NORMALIZED_EQUATORIAL_RADIUS *
                          NORMALIZED_EQUATORIAL_RADIUS * NORMALIZED_EQUATORIAL_RADIUS;

/** Gravitational parameter of the TLE model (m^3/s^2). */
constexpr double MU = XKE * XKE * EARTH_RADIUS * EARTH_RADIUS * EARTH_RADIUS * 1.0e9 / 3600.0;

/** Perigee radius (Earth radii) below which an orbit is considered decayed. */
constexpr double DECAY_RADIUS = 0.95;

// Julian dates
constexpr double UNIX_EPOCH_JD = 2440587.5;
constexpr double J2000_JD = 2451545.0;
constexpr double JD_1900 = 2415020.0;

} // namespace tlekit

#endif // __TLEKIT_CONSTANTS_HPP
