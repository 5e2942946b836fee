/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <tlekit/propagator.hpp>

#include <spdlog/spdlog.h>

using spdlog::debug;

namespace tlekit {

// Orbits with a period of 225 minutes or more use the deep-space model
constexpr double DEEP_SPACE_PERIOD = 1.0 / 6.4;   // days

std::string toString(const PropagationMethod method) {
    switch (method) {
        case PropagationMethod::SGP4: return "SGP4";
        case PropagationMethod::SDP4: return "SDP4";
    }
    return "Unknown";
}

std::string toString(const Resonance resonance) {
    switch (resonance) {
        case Resonance::None: return "None";
        case Resonance::HalfDay: return "12 Hour";
        case Resonance::OneDay: return "Synchronous";
    }
    return "Unknown";
}

double secondsSinceEpoch(const Tle &tle, const time_point time) {
    return std::chrono::duration<double>(time - tle.getEpoch()).count();
}

template <typename T>
TlePropagator<T>::TlePropagator(const Tle &tle) : TlePropagator(tle, MeanElements<T>::fromTle(tle)) {}

template <typename T>
TlePropagator<T>::TlePropagator(const Tle &tle, const MeanElements<T> &elements)
    : tle(tle),
      elements(elements),
      commons(initializeCommons(elements)),
      kernel(selectKernel(tle, elements, commons)) {}

template <typename T>
typename TlePropagator<T>::Kernel TlePropagator<T>::selectKernel(const Tle &tle, const MeanElements<T> &elements,
                                                                 const CommonTerms<T> &commons) {
    const double period = TWO_PI / (value(commons.xn0dp) * MINUTES_PER_DAY);
    if (period >= DEEP_SPACE_PERIOD) {
        DeepSpace<T> deep(elements, commons, tle.getEpochJulianDate());
        debug("Satellite {}: SDP4, period {:.2f} minutes, resonance {}",
              tle.getSatelliteNumber(), period * MINUTES_PER_DAY, toString(deep.getResonance()));
        return Kernel(std::in_place_type<DeepSpace<T>>, deep);
    }
    debug("Satellite {}: SGP4, period {:.2f} minutes", tle.getSatelliteNumber(), period * MINUTES_PER_DAY);
    return Kernel(std::in_place_type<NearEarth<T>>, elements, commons);
}

template <typename T>
PVCoordinates<T> TlePropagator<T>::propagate(const double seconds) const {
    const double minutes = seconds / 60.0;
    const SecularElements<T> secular = std::visit(
        [&](const auto &k) { return k.propagate(elements, commons, minutes); }, kernel);
    return computePVCoordinates(secular);
}

template <typename T>
PVCoordinates<T> TlePropagator<T>::propagate(const time_point time) const {
    return propagate(secondsSinceEpoch(tle, time));
}

template <typename T>
PVCoordinates<T> TlePropagator<T>::getInitialState() const {
    return propagate(0.0);
}

template <typename T>
PropagationMethod TlePropagator<T>::getMethod() const {
    return std::holds_alternative<DeepSpace<T>>(kernel) ? PropagationMethod::SDP4 : PropagationMethod::SGP4;
}

template <typename T>
Resonance TlePropagator<T>::getResonance() const {
    if (const auto *deep = std::get_if<DeepSpace<T>>(&kernel)) {
        return deep->getResonance();
    }
    return Resonance::None;
}

template class TlePropagator<double>;
template class TlePropagator<TleGradient>;

} // namespace tlekit
