/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 *
 * SDP4 Deep-Space Propagation Module
 * Lunar-solar perturbations and geopotential resonance for orbits with a
 * period of 225 minutes or more.
 */

#ifndef __TLEKIT_SDP4_HPP
#define __TLEKIT_SDP4_HPP

#include <tlekit/sgp4.hpp>

#include <array>

namespace tlekit {

/**
 * Greenwich sidereal angle (radians, [0, 2π)) at a UTC Julian date.
 * Reference: The 1992 Astronomical Almanac, page B6.
 */
double thetaG(double jd);

/**
 * Geopotential resonance class of a deep-space orbit.
 */
enum class Resonance {
    None,
    HalfDay,    // 12 hour orbits with e >= 0.5
    OneDay      // Geosynchronous orbits
};

/**
 * Deep-space theory, used when the orbital period is 225 minutes or more.
 *
 * All the lunar-solar terms are computed once at construction. Resonant
 * orbits are integrated from epoch on every call, in steps of 720 minutes,
 * so propagation has no hidden state and can be called concurrently.
 */
template <typename T>
class DeepSpace {
public:
    /**
     * @param epochJd UTC Julian date of the TLE epoch
     */
    DeepSpace(const MeanElements<T> &elements, const CommonTerms<T> &commons, double epochJd);

    /**
     * Secular gravity, drag, deep-space secular and periodic updates.
     *
     * @param tSince Minutes since epoch
     * @throws SatelliteDecayedException if the semi-major axis drops below the decay radius
     */
    SecularElements<T> propagate(const MeanElements<T> &elements, const CommonTerms<T> &commons,
                                 double tSince) const;

    Resonance getResonance() const { return resonance; }

    /** Greenwich sidereal angle at epoch. */
    double getThetaG() const { return thgr; }

private:
    Resonance resonance;
    bool smallInclination;

    double thgr;
    double zmol;
    double zmos;

    T xnq;
    T omegaq;

    // Secular rates
    T sse, ssi, ssl, ssh, ssg;

    // Solar periodic coefficients
    T se2, si2, sl2, sgh2, sh2;
    T se3, si3, sl3, sgh3, sh3;
    T sl4, sgh4;

    // Lunar periodic coefficients
    T ee2, e3, xi2, xi3, xl2, xl3, xl4, xgh2, xgh3, xgh4, xh2, xh3;

    // Resonance terms
    T d2201{}, d2211{}, d3210{}, d3222{}, d4410{}, d4422{}, d5220{}, d5232{}, d5421{}, d5433{};
    T del1{}, del2{}, del3{};
    T xlamo{};
    T xfact{};
    T omgdot;

    std::array<T, 2> secularDerivatives(const T &xli, double atime) const;
};

} // namespace tlekit

#endif // __TLEKIT_SDP4_HPP
