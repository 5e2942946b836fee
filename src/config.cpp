/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <tlekit/config.hpp>

namespace tlekit {

double Config::getEpsilon() const {
    return epsilon;
}

void Config::setEpsilon(const double e) {
    if (e >= 1.0e-15 && e <= 1.0e-3) {
        epsilon = e;
    } else if (e > 1.0e-3) {
        epsilon = 1.0e-3;
    } else {
        epsilon = 1.0e-15;
    }
}

int Config::getMaxIterations() const {
    return maxIterations;
}

void Config::setMaxIterations(const int iterations) {
    if (iterations > 0 && iterations <= 10000) {
        maxIterations = iterations;
    } else if (iterations > 10000) {
        maxIterations = 10000;
    } else {
        maxIterations = 1;
    }
}

double Config::getScale() const {
    return scale;
}

void Config::setScale(const double s) {
    if (s > 0.0 && s <= 1.0) {
        scale = s;
    } else if (s > 1.0) {
        scale = 1.0;
    } else {
        scale = 0.01;
    }
}

int Config::getLeastSquaresMaxIterations() const {
    return leastSquaresMaxIterations;
}

void Config::setLeastSquaresMaxIterations(const int iterations) {
    if (iterations > 0 && iterations <= 1000) {
        leastSquaresMaxIterations = iterations;
    } else if (iterations > 1000) {
        leastSquaresMaxIterations = 1000;
    } else {
        leastSquaresMaxIterations = 1;
    }
}

bool Config::getPositionOnly() const {
    return positionOnly;
}

void Config::setPositionOnly(bool p) {
    positionOnly = p;
}

bool Config::getFitBStar() const {
    return fitBStar;
}

void Config::setFitBStar(bool f) {
    fitBStar = f;
}

double Config::getStepFactor() const {
    return stepFactor;
}

void Config::setStepFactor(const double factor) {
    if (factor >= 1.0e-3 && factor <= 1.0e3) {
        stepFactor = factor;
    } else if (factor > 1.0e3) {
        stepFactor = 1.0e3;
    } else {
        stepFactor = 1.0e-3;
    }
}

bool Config::getVerbose() const {
    return verbose;
}

void Config::setVerbose(bool v) {
    verbose = v;
}

bool Config::hasTime() const {
    return time.has_value();
}

time_point Config::getTime() const {
    return time.value_or(std::chrono::system_clock::now());
}

void Config::setTime(const time_point tp) {
    time = tp;
}

FixedPointTleGenerator Config::makeFixedPointGenerator() const {
    return FixedPointTleGenerator(epsilon, maxIterations, scale);
}

LeastSquaresTleGenerator Config::makeLeastSquaresGenerator() const {
    return LeastSquaresTleGenerator(leastSquaresMaxIterations, positionOnly, fitBStar);
}

} // namespace tlekit
