/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 *
 * TLE propagation front end: selects SGP4 or SDP4 for a TLE and runs it.
 */

#ifndef __TLEKIT_PROPAGATOR_HPP
#define __TLEKIT_PROPAGATOR_HPP

#include <tlekit/sdp4.hpp>
#include <tlekit/sgp4.hpp>
#include <tlekit/tle.hpp>
#include <tlekit/vector.hpp>

#include <string>
#include <variant>

namespace tlekit {

enum class PropagationMethod {
    SGP4,   // Near-Earth, period < 225 minutes
    SDP4    // Deep space, period >= 225 minutes
};

std::string toString(PropagationMethod method);
std::string toString(Resonance resonance);

/**
 * Propagator for a single TLE.
 *
 * The model is chosen once at construction from the recovered mean motion.
 * Everything is immutable afterwards, so one instance may be shared by
 * several threads.
 *
 * Usage:
 *   Propagator propagator(tle);
 *   PV pv = propagator.propagate(600.0);   // seconds after epoch
 *
 * With T = TleGradient, the elements may be seeded as independent variables
 * and the resulting coordinates carry their partial derivatives.
 */
template <typename T>
class TlePropagator {
public:
    /**
     * Propagator for the elements of a TLE, taken as constants.
     *
     * @throws InvalidOrbitException if the TLE can't be propagated
     */
    explicit TlePropagator(const Tle &tle);

    /**
     * Propagator for explicitly provided mean elements. The TLE supplies the
     * epoch and identification.
     *
     * @throws InvalidOrbitException if the elements can't be propagated
     */
    TlePropagator(const Tle &tle, const MeanElements<T> &elements);

    /**
     * Position (m) and velocity (m/s) in TEME.
     *
     * @param seconds Time since the TLE epoch
     * @throws SatelliteDecayedException if the orbit decayed before that time
     * @throws InvalidOrbitException if the perturbed orbit is no longer elliptic
     */
    PVCoordinates<T> propagate(double seconds) const;

    PVCoordinates<T> propagate(time_point time) const;

    /** State at the TLE epoch. */
    PVCoordinates<T> getInitialState() const;

    const Tle& getTle() const { return tle; }
    const MeanElements<T>& getElements() const { return elements; }
    PropagationMethod getMethod() const;
    Resonance getResonance() const;

    /** Brouwer mean motion (rad/min). */
    double getOriginalMeanMotion() const { return value(commons.xn0dp); }

    /** Brouwer semi-major axis (Earth radii). */
    double getOriginalSemiMajorAxis() const { return value(commons.a0dp); }

private:
    using Kernel = std::variant<NearEarth<T>, DeepSpace<T>>;

    Tle tle;
    MeanElements<T> elements;
    CommonTerms<T> commons;
    Kernel kernel;

    static Kernel selectKernel(const Tle &tle, const MeanElements<T> &elements, const CommonTerms<T> &commons);
};

using Propagator = TlePropagator<double>;

/**
 * Seconds from the epoch of a TLE to a time.
 */
double secondsSinceEpoch(const Tle &tle, time_point time);

} // namespace tlekit

#endif // __TLEKIT_PROPAGATOR_HPP
