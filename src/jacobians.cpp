/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <tlekit/jacobians.hpp>
#include <tlekit/exceptions.hpp>

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

using spdlog::debug;

namespace tlekit {

namespace {

/**
 * The TLE to propagate for a parameter snapshot: the B* driver value replaces
 * the TLE's own drag term.
 */
Tle snapshotTle(const Tle &tle, const ParameterSet &parameters) {
    const ParameterDriver *bStar = parameters.find(BSTAR);
    if (bStar == nullptr || bStar->getValue() == tle.getBStar()) {
        return tle;
    }
    return tle.withBStar(bStar->getValue());
}

std::vector<std::string> selectedTleParameters(const ParameterSet &parameters) {
    std::vector<std::string> names;
    for (const auto &driver : parameters.selected()) {
        if (driver.getName() != BSTAR) {
            throw UnknownParameterException(driver.getName(), BSTAR);
        }
        names.push_back(driver.getName());
    }
    return names;
}

MeanElements<TleGradient> seededElements(const Tle &tle, const bool bStarSelected) {
    MeanElements<TleGradient> elements;
    elements.meanMotion = TleGradient::variable(MEAN_MOTION_INDEX, tle.getMeanMotion());
    elements.e = TleGradient::variable(ECCENTRICITY_INDEX, tle.getE());
    elements.i = TleGradient::variable(INCLINATION_INDEX, tle.getI());
    elements.raan = TleGradient::variable(RAAN_INDEX, tle.getRaan());
    elements.pa = TleGradient::variable(PERIGEE_INDEX, tle.getPerigeeArgument());
    elements.meanAnomaly = TleGradient::variable(MEAN_ANOMALY_INDEX, tle.getMeanAnomaly());
    elements.bStar = bStarSelected ? TleGradient::variable(BSTAR_INDEX, tle.getBStar())
                                   : TleGradient::constant(tle.getBStar());
    return elements;
}

time_point dateAfterEpoch(const Tle &tle, const double seconds) {
    return tle.getEpoch() +
           std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::duration<double>(seconds));
}

template <typename F>
StateVector eightPointDerivative(F shifted, const double h) {
    auto difference = [&](const int k) -> StateVector {
        return toVector(shifted(k * h)) - toVector(shifted(-k * h));
    };
    return (-3.0 * difference(4) + 32.0 * difference(3) - 168.0 * difference(2) + 672.0 * difference(1)) /
           (840.0 * h);
}

} // namespace

StateVector toVector(const PV &pv) {
    StateVector v;
    v << pv.position.x, pv.position.y, pv.position.z, pv.velocity.x, pv.velocity.y, pv.velocity.z;
    return v;
}

// ============================================================================
// Analytical Jacobians
// ============================================================================

TlePartialDerivatives::TlePartialDerivatives(const Tle &tle, const ParameterSet &parameters)
    : tle(snapshotTle(tle, parameters)),
      parameters(parameters),
      selectedNames(selectedTleParameters(parameters)),
      propagator(this->tle, seededElements(this->tle, !selectedNames.empty())),
      dY1dY0(Eigen::MatrixXd::Identity(STATE_DIMENSION, STATE_DIMENSION)),
      dY1dP(Eigen::MatrixXd::Zero(STATE_DIMENSION, static_cast<Eigen::Index>(selectedNames.size()))) {}

void TlePartialDerivatives::setInitialJacobians(const Eigen::MatrixXd &stateJacobian,
                                                const Eigen::MatrixXd &parametersJacobian) {
    if (stateJacobian.rows() != STATE_DIMENSION || stateJacobian.cols() != STATE_DIMENSION) {
        throw DimensionMismatchException("initial state Jacobian", STATE_DIMENSION, STATE_DIMENSION,
                                         stateJacobian.rows(), stateJacobian.cols());
    }
    const long selected = getSelectedCount();
    if (parametersJacobian.rows() != STATE_DIMENSION || parametersJacobian.cols() != selected) {
        throw DimensionMismatchException("initial parameters Jacobian", STATE_DIMENSION, selected,
                                         parametersJacobian.rows(), parametersJacobian.cols());
    }
    dY1dY0 = stateJacobian;
    dY1dP = parametersJacobian;
}

StateWithDerivatives TlePartialDerivatives::propagate(const double seconds) const {
    const PVCoordinates<TleGradient> pv = propagator.propagate(seconds);
    const std::array<const TleGradient*, STATE_DIMENSION> components = {
        &pv.position.x, &pv.position.y, &pv.position.z,
        &pv.velocity.x, &pv.velocity.y, &pv.velocity.z
    };

    // d(state) / d(n, e, i, Ω, ω, M, B*)
    Eigen::Matrix<double, STATE_DIMENSION, TLE_FREE_PARAMETERS> dYdX;
    for (int row = 0; row < STATE_DIMENSION; ++row) {
        const auto &gradient = components[row]->getGradient();
        for (int col = 0; col < TLE_FREE_PARAMETERS; ++col) {
            dYdX(row, col) = gradient[col];
        }
    }
    const Eigen::MatrixXd dYdY1 = dYdX.leftCols<STATE_DIMENSION>();

    StateWithDerivatives state;
    state.date = dateAfterEpoch(tle, seconds);
    state.pv = toPV(pv);
    state.stateTransitionMatrix = dYdY1 * dY1dY0;
    state.parameterNames = selectedNames;
    if (!selectedNames.empty()) {
        Eigen::MatrixXd dYdP = dYdY1 * dY1dP;
        dYdP.col(0) += dYdX.col(BSTAR_INDEX);
        state.parametersJacobian = dYdP;
    }
    return state;
}

StateWithDerivatives TlePartialDerivatives::propagate(const time_point time) const {
    return propagate(secondsSinceEpoch(tle, time));
}

std::optional<Eigen::MatrixXd> TlePartialDerivatives::getStateTransitionMatrix(
        const StateWithDerivatives &state) const {
    return state.stateTransitionMatrix;
}

std::optional<Eigen::MatrixXd> TlePartialDerivatives::getParametersJacobian(
        const StateWithDerivatives &state) const {
    if (selectedNames.empty()) {
        return std::nullopt;
    }
    return state.parametersJacobian;
}

std::optional<Eigen::VectorXd> TlePartialDerivatives::getParametersJacobian(
        const StateWithDerivatives &state, const std::string &name) const {
    if (!parameters.get(name).isSelected() || !state.parametersJacobian) {
        return std::nullopt;
    }
    const auto it = std::find(state.parameterNames.begin(), state.parameterNames.end(), name);
    if (it == state.parameterNames.end()) {
        return std::nullopt;
    }
    const auto column = static_cast<Eigen::Index>(std::distance(state.parameterNames.begin(), it));
    return Eigen::VectorXd(state.parametersJacobian->col(column));
}

// ============================================================================
// Finite Differences
// ============================================================================

FiniteDifferenceJacobian::FiniteDifferenceJacobian(const Tle &tle, const ParameterSet &parameters,
                                                   const double stepFactor)
    : tle(snapshotTle(tle, parameters)), selectedDrivers(parameters.selected()), stepFactor(stepFactor) {
    // Eccentricity steps stay small enough to keep e positive at k = 4
    const double eStep = tle.getE() > 0.0 ? std::min(1.0e-5, 0.2 * tle.getE()) : 1.0e-5;
    steps = {1.0e-4 * tle.getMeanMotion(), eStep, 1.0e-5, 1.0e-5, 1.0e-5, 1.0e-5};
    for (double &step : steps) {
        step *= stepFactor;
    }

    // Drag effects shrink with altitude, so high orbits need a wider B* step to stay above rounding noise
    const double a = TlePropagator<double>(this->tle).getOriginalSemiMajorAxis();
    bStarStepScale = std::max(1.0, a * a);

    debug("Finite difference steps for satellite {}: n {:.3e}, e {:.3e}, angles {:.3e}, B* x{:.1f}",
          tle.getSatelliteNumber(), steps[MEAN_MOTION_INDEX], steps[ECCENTRICITY_INDEX], steps[MEAN_ANOMALY_INDEX],
          bStarStepScale);
}

PV FiniteDifferenceJacobian::propagateShifted(const int index, const double delta, const double seconds) const {
    MeanElements<double> elements = MeanElements<double>::fromTle(tle);
    elementAt(elements, index) += delta;
    return TlePropagator<double>(tle, elements).propagate(seconds);
}

Eigen::MatrixXd FiniteDifferenceJacobian::getStateTransitionMatrix(const double seconds) const {
    Eigen::MatrixXd stm(STATE_DIMENSION, STATE_DIMENSION);
    for (int col = 0; col < STATE_DIMENSION; ++col) {
        stm.col(col) = eightPointDerivative(
            [&](const double delta) { return propagateShifted(col, delta, seconds); }, steps[col]);
    }
    return stm;
}

Eigen::MatrixXd FiniteDifferenceJacobian::getParametersJacobian(const double seconds) const {
    Eigen::MatrixXd jacobian(STATE_DIMENSION, static_cast<Eigen::Index>(selectedDrivers.size()));
    for (std::size_t k = 0; k < selectedDrivers.size(); ++k) {
        const ParameterDriver &driver = selectedDrivers[k];
        if (driver.getName() != BSTAR) {
            throw UnknownParameterException(driver.getName(), BSTAR);
        }
        jacobian.col(static_cast<Eigen::Index>(k)) = eightPointDerivative(
            [&](const double delta) { return propagateShifted(BSTAR_INDEX, delta, seconds); },
            stepFactor * bStarStepScale * driver.getScale());
    }
    return jacobian;
}

} // namespace tlekit
