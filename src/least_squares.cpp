/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 *
 * Levenberg-Marquardt fit of a TLE to an ephemeris.
 */

#include <tlekit/generation.hpp>
#include <tlekit/exceptions.hpp>
#include <tlekit/jacobians.hpp>
#include <tlekit/parameters.hpp>

#include <cmath>
#include <stdexcept>

#include <Eigen/Dense>
#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::info;
using spdlog::warn;

namespace tlekit {

namespace {

constexpr double INITIAL_DAMPING = 1.0e-3;
constexpr double DAMPING_FACTOR = 10.0;
constexpr int MAX_DAMPING_ATTEMPTS = 10;
constexpr double COST_TOLERANCE = 1.0e-10;
constexpr double STEP_TOLERANCE = 1.0e-12;

/**
 * A TLE with the mean elements (and B*) shifted by a correction.
 */
Tle applyCorrection(const Tle &tle, const Eigen::VectorXd &dx) {
    Tle corrected = tle.withElements(tle.getEpoch(),
                                     tle.getMeanMotion() + dx(MEAN_MOTION_INDEX),
                                     tle.getE() + dx(ECCENTRICITY_INDEX),
                                     tle.getI() + dx(INCLINATION_INDEX),
                                     tle.getPerigeeArgument() + dx(PERIGEE_INDEX),
                                     tle.getRaan() + dx(RAAN_INDEX),
                                     tle.getMeanAnomaly() + dx(MEAN_ANOMALY_INDEX),
                                     tle.getRevolutionNumberAtEpoch());
    if (dx.size() > BSTAR_INDEX) {
        corrected = corrected.withBStar(tle.getBStar() + dx(BSTAR_INDEX));
    }
    return corrected;
}

Eigen::VectorXd parameterVector(const Tle &tle, const bool withBStar) {
    Eigen::VectorXd x(withBStar ? TLE_FREE_PARAMETERS : STATE_DIMENSION);
    x(MEAN_MOTION_INDEX) = tle.getMeanMotion();
    x(ECCENTRICITY_INDEX) = tle.getE();
    x(INCLINATION_INDEX) = tle.getI();
    x(RAAN_INDEX) = tle.getRaan();
    x(PERIGEE_INDEX) = tle.getPerigeeArgument();
    x(MEAN_ANOMALY_INDEX) = tle.getMeanAnomaly();
    if (withBStar) {
        x(BSTAR_INDEX) = tle.getBStar();
    }
    return x;
}

} // namespace

struct LeastSquaresTleGenerator::Evaluation {
    Eigen::VectorXd residuals;   // observed - computed
    Eigen::MatrixXd jacobian;    // d(computed) / d(parameters)
    double cost;
    double rms;
};

LeastSquaresTleGenerator::LeastSquaresTleGenerator(const int maxIterations, const bool positionOnly,
                                                   const bool fitBStar)
    : maxIterations(maxIterations), positionOnly(positionOnly), fitBStar(fitBStar) {
    if (maxIterations < 1) {
        throw std::invalid_argument("Iteration budget must be positive");
    }
}

Tle LeastSquaresTleGenerator::initialGuess(const std::vector<EphemerisSample> &samples,
                                           const Tle &templateTle) const {
    const EphemerisSample &first = samples.front();
    try {
        return FixedPointTleGenerator().generate(first.pv, first.date, templateTle);
    } catch (const TleGenerationException &err) {
        warn("No fixed point initial guess for satellite {}: {}", templateTle.getSatelliteNumber(), err.what());
    } catch (const InvalidOrbitException &err) {
        warn("No fixed point initial guess for satellite {}: {}", templateTle.getSatelliteNumber(), err.what());
    }
    return templateTle;
}

LeastSquaresTleGenerator::Evaluation LeastSquaresTleGenerator::evaluate(
        const Tle &tle, const std::vector<EphemerisSample> &samples, const double velocityScale) const {
    ParameterSet parameters = ParameterSet::forTle(tle);
    parameters.get(BSTAR).setSelected(fitBStar);
    const TlePartialDerivatives partials(tle, parameters);

    const int rowsPerSample = positionOnly ? 3 : STATE_DIMENSION;
    const int columns = fitBStar ? TLE_FREE_PARAMETERS : STATE_DIMENSION;
    const auto rows = static_cast<Eigen::Index>(samples.size()) * rowsPerSample;

    Evaluation evaluation;
    evaluation.residuals.resize(rows);
    evaluation.jacobian.resize(rows, columns);
    double positionSquares = 0.0;

    Eigen::Index row = 0;
    for (const auto &sample : samples) {
        const StateWithDerivatives state = partials.propagate(sample.date);
        StateVector difference = toVector(sample.pv) - toVector(state.pv);
        positionSquares += difference.head<3>().squaredNorm();

        Eigen::MatrixXd block(STATE_DIMENSION, columns);
        block.leftCols(STATE_DIMENSION) = *state.stateTransitionMatrix;
        if (fitBStar) {
            block.col(BSTAR_INDEX) = *partials.getParametersJacobian(state, BSTAR);
        }
        difference.tail<3>() *= velocityScale;
        block.bottomRows(3) *= velocityScale;

        evaluation.residuals.segment(row, rowsPerSample) = difference.head(rowsPerSample);
        evaluation.jacobian.middleRows(row, rowsPerSample) = block.topRows(rowsPerSample);
        row += rowsPerSample;
    }

    evaluation.cost = evaluation.residuals.squaredNorm();
    evaluation.rms = std::sqrt(positionSquares / static_cast<double>(samples.size()));
    return evaluation;
}

LeastSquaresResult LeastSquaresTleGenerator::generate(const std::vector<EphemerisSample> &samples,
                                                      const Tle &templateTle) const {
    const int rowsPerSample = positionOnly ? 3 : STATE_DIMENSION;
    const int columns = fitBStar ? TLE_FREE_PARAMETERS : STATE_DIMENSION;
    if (samples.empty() || static_cast<int>(samples.size()) * rowsPerSample < columns) {
        throw TleGenerationException(fmt::format("Not enough samples to fit {} parameters: {}",
                                                 columns, samples.size()), 0);
    }

    Tle current = initialGuess(samples, templateTle);

    // Velocity residuals in metres, with the same weight for every candidate
    const double velocityScale = 1.0 / current.getMeanMotion();

    Evaluation evaluation = evaluate(current, samples, velocityScale);
    double lambda = INITIAL_DAMPING;
    bool converged = false;
    int iteration = 0;

    debug("Least squares start for satellite {}: rms {:.3f} m", current.getSatelliteNumber(), evaluation.rms);

    while (!converged && iteration < maxIterations) {
        ++iteration;

        // Normal equations
        const Eigen::MatrixXd normal = evaluation.jacobian.transpose() * evaluation.jacobian;
        const Eigen::VectorXd gradient = evaluation.jacobian.transpose() * evaluation.residuals;

        bool accepted = false;
        Eigen::VectorXd dx;
        for (int attempt = 0; attempt < MAX_DAMPING_ATTEMPTS && !accepted; ++attempt) {
            Eigen::MatrixXd damped = normal;
            damped.diagonal() += lambda * normal.diagonal();
            dx = damped.ldlt().solve(gradient);

            try {
                Tle candidate = applyCorrection(current, dx);
                Evaluation candidateEvaluation = evaluate(candidate, samples, velocityScale);
                if (candidateEvaluation.cost < evaluation.cost) {
                    const double decrease = evaluation.cost - candidateEvaluation.cost;
                    converged = decrease <= COST_TOLERANCE * evaluation.cost;
                    current = candidate;
                    evaluation = candidateEvaluation;
                    lambda /= DAMPING_FACTOR;
                    accepted = true;
                } else {
                    lambda *= DAMPING_FACTOR;
                }
            } catch (const InvalidOrbitException &err) {
                debug("Least squares step rejected: {}", err.what());
                lambda *= DAMPING_FACTOR;
            } catch (const SatelliteDecayedException &err) {
                debug("Least squares step rejected: {}", err.what());
                lambda *= DAMPING_FACTOR;
            }
        }

        debug("Least squares iteration {}: rms {:.6f} m, lambda {:.1e}", iteration, evaluation.rms, lambda);

        if (!accepted) {
            // No descent direction left: at a minimum if the step is negligible
            const Eigen::VectorXd x = parameterVector(current, fitBStar);
            converged = (dx.array().abs() <= STEP_TOLERANCE * (1.0 + x.array().abs())).all();
            if (!converged) {
                warn("Least squares for satellite {} stalled after {} rejected steps",
                     current.getSatelliteNumber(), MAX_DAMPING_ATTEMPTS);
            }
            break;
        }
    }

    info("Least squares fit for satellite {}: rms {:.3f} m after {} iterations ({})",
         current.getSatelliteNumber(), evaluation.rms, iteration, converged ? "converged" : "not converged");

    return {current, evaluation.rms, iteration, converged};
}

} // namespace tlekit
