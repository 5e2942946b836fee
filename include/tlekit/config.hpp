/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __TLEKIT_CONFIG_HPP
#define __TLEKIT_CONFIG_HPP

#include <tlekit/generation.hpp>
#include <tlekit/vector.hpp>

#include <optional>

namespace tlekit {

/**
 * Settings of the command line tool. Out of range values are clamped.
 */
class Config {
public:
    Config() = default;
    ~Config() = default;

    // Fixed point generation
    double getEpsilon() const;
    void setEpsilon(const double e);

    int getMaxIterations() const;
    void setMaxIterations(const int iterations);

    double getScale() const;
    void setScale(const double s);

    // Least squares generation
    int getLeastSquaresMaxIterations() const;
    void setLeastSquaresMaxIterations(const int iterations);

    bool getPositionOnly() const;
    void setPositionOnly(bool p);

    bool getFitBStar() const;
    void setFitBStar(bool f);

    // Finite differences
    double getStepFactor() const;
    void setStepFactor(const double factor);

    bool getVerbose() const;
    void setVerbose(bool);

    bool hasTime() const;
    time_point getTime() const;
    void setTime(const time_point tp);

    FixedPointTleGenerator makeFixedPointGenerator() const;
    LeastSquaresTleGenerator makeLeastSquaresGenerator() const;

private:
    double epsilon = FixedPointTleGenerator::EPSILON_DEFAULT;
    int maxIterations = FixedPointTleGenerator::MAX_ITERATIONS_DEFAULT;
    double scale = FixedPointTleGenerator::SCALE_DEFAULT;
    int leastSquaresMaxIterations = LeastSquaresTleGenerator::MAX_ITERATIONS_DEFAULT;
    bool positionOnly = false;
    bool fitBStar = false;
    double stepFactor = 1.0;
    bool verbose = false;
    std::optional<time_point> time;
};

}

#endif
