/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 *
 * Partial derivatives of the propagated state with respect to the mean
 * elements and the selected model parameters of a TLE.
 */

#ifndef __TLEKIT_JACOBIANS_HPP
#define __TLEKIT_JACOBIANS_HPP

#include <tlekit/parameters.hpp>
#include <tlekit/propagator.hpp>
#include <tlekit/tle.hpp>

#include <Eigen/Dense>

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace tlekit {

constexpr int STATE_DIMENSION = 6;

// Column of each free element in the Jacobians
constexpr int MEAN_MOTION_INDEX = 0;
constexpr int ECCENTRICITY_INDEX = 1;
constexpr int INCLINATION_INDEX = 2;
constexpr int RAAN_INDEX = 3;
constexpr int PERIGEE_INDEX = 4;
constexpr int MEAN_ANOMALY_INDEX = 5;
constexpr int BSTAR_INDEX = 6;

using StateVector = Eigen::Matrix<double, STATE_DIMENSION, 1>;

/** Position then velocity. */
StateVector toVector(const PV &pv);

/**
 * Element of a mean element set by Jacobian column index.
 */
template <typename T>
T& elementAt(MeanElements<T> &elements, const int index) {
    switch (index) {
        case MEAN_MOTION_INDEX: return elements.meanMotion;
        case ECCENTRICITY_INDEX: return elements.e;
        case INCLINATION_INDEX: return elements.i;
        case RAAN_INDEX: return elements.raan;
        case PERIGEE_INDEX: return elements.pa;
        case MEAN_ANOMALY_INDEX: return elements.meanAnomaly;
        case BSTAR_INDEX: return elements.bStar;
        default: throw std::out_of_range("Invalid element index: " + std::to_string(index));
    }
}

/**
 * A propagated state with the matrices that were computed along with it.
 * The matrices are empty when the state was produced without derivatives.
 */
struct StateWithDerivatives {
    time_point date;
    PV pv;
    std::optional<Eigen::MatrixXd> stateTransitionMatrix;   // 6x6
    std::optional<Eigen::MatrixXd> parametersJacobian;      // 6 x selected parameters
    std::vector<std::string> parameterNames;
};

/**
 * Analytical Jacobians of a TLE propagation.
 *
 * The state transition matrix is d(position, velocity) / d(n, e, i, Ω, ω, M)
 * and the parameters Jacobian is d(position, velocity) / d(selected parameters).
 * Both are obtained by propagating with derivative-carrying scalars seeded
 * on the mean elements, then composed with the initial Jacobians:
 *
 *   STM  = dY/dY1 * dY1/dY0
 *   dY/dP = dY/dY1 * dY1/dP + dY/dP
 *
 * The initial Jacobians default to identity and zero.
 *
 * Usage:
 *   ParameterSet parameters = ParameterSet::forTle(tle);
 *   parameters.get(BSTAR).setSelected(true);
 *   TlePartialDerivatives partials(tle, parameters);
 *   StateWithDerivatives state = partials.propagate(900.0);
 */
class TlePartialDerivatives {
public:
    /**
     * @param parameters Snapshot of the drivers; the selected B* value replaces the TLE's
     * @throws UnknownParameterException if a selected driver isn't a TLE parameter
     */
    TlePartialDerivatives(const Tle &tle, const ParameterSet &parameters);

    /**
     * @param dY1dY0 6x6 Jacobian of the mean elements with respect to the initial state
     * @param dY1dP 6 x (selected parameters) Jacobian of the mean elements with respect to the parameters
     * @throws DimensionMismatchException if a matrix has the wrong shape
     */
    void setInitialJacobians(const Eigen::MatrixXd &dY1dY0, const Eigen::MatrixXd &dY1dP);

    /**
     * @param seconds Time since the TLE epoch
     */
    StateWithDerivatives propagate(double seconds) const;

    StateWithDerivatives propagate(time_point time) const;

    std::optional<Eigen::MatrixXd> getStateTransitionMatrix(const StateWithDerivatives &state) const;

    /** Empty when no parameter is selected. */
    std::optional<Eigen::MatrixXd> getParametersJacobian(const StateWithDerivatives &state) const;

    /**
     * Column of a single parameter.
     *
     * @return Empty if the parameter exists but isn't selected
     * @throws UnknownParameterException if the parameter doesn't exist
     */
    std::optional<Eigen::VectorXd> getParametersJacobian(const StateWithDerivatives &state,
                                                         const std::string &name) const;

    const Tle& getTle() const { return tle; }
    const ParameterSet& getParameters() const { return parameters; }
    int getSelectedCount() const { return static_cast<int>(selectedNames.size()); }

private:
    Tle tle;
    ParameterSet parameters;
    std::vector<std::string> selectedNames;
    TlePropagator<TleGradient> propagator;
    Eigen::MatrixXd dY1dY0;
    Eigen::MatrixXd dY1dP;
};

/**
 * Reference Jacobians by 8-point central finite differences.
 *
 *   f' = (-3(f+4 - f-4) + 32(f+3 - f-3) - 168(f+2 - f-2) + 672(f+1 - f-1)) / (840 h)
 *
 * Each element is shifted by k times its step, the propagator rebuilt and
 * the state recomputed.
 */
class FiniteDifferenceJacobian {
public:
    /**
     * @param stepFactor Multiplier applied to every step
     */
    FiniteDifferenceJacobian(const Tle &tle, const ParameterSet &parameters, double stepFactor = 1.0);

    /** 6x6 with respect to (n, e, i, Ω, ω, M). */
    Eigen::MatrixXd getStateTransitionMatrix(double seconds) const;

    /** 6 x (selected parameters). */
    Eigen::MatrixXd getParametersJacobian(double seconds) const;

    /** Steps of (n, e, i, Ω, ω, M). */
    const std::array<double, STATE_DIMENSION>& getSteps() const { return steps; }

    /** Multiplier applied to the B* driver scale, the squared semi-major axis in Earth radii (at least 1). */
    double getBStarStepScale() const { return bStarStepScale; }

private:
    Tle tle;
    std::vector<ParameterDriver> selectedDrivers;
    double stepFactor;
    std::array<double, STATE_DIMENSION> steps;
    double bStarStepScale;

    PV propagateShifted(int index, double delta, double seconds) const;
};

} // namespace tlekit

#endif // __TLEKIT_JACOBIANS_HPP
