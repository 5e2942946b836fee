/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <tlekit/config.hpp>

#include <chrono>

namespace tlekit {
namespace {

class ConfigTest : public ::testing::Test {
protected:
    Config config;
};

TEST_F(ConfigTest, Defaults) {
    EXPECT_DOUBLE_EQ(config.getEpsilon(), 1.0e-10);
    EXPECT_EQ(config.getMaxIterations(), 100);
    EXPECT_DOUBLE_EQ(config.getScale(), 1.0);
    EXPECT_EQ(config.getLeastSquaresMaxIterations(), 40);
    EXPECT_FALSE(config.getPositionOnly());
    EXPECT_FALSE(config.getFitBStar());
    EXPECT_DOUBLE_EQ(config.getStepFactor(), 1.0);
    EXPECT_FALSE(config.getVerbose());
    EXPECT_FALSE(config.hasTime());
}

TEST_F(ConfigTest, EpsilonClamped) {
    config.setEpsilon(1.0e-6);
    EXPECT_DOUBLE_EQ(config.getEpsilon(), 1.0e-6);
    config.setEpsilon(0.5);
    EXPECT_DOUBLE_EQ(config.getEpsilon(), 1.0e-3);
    config.setEpsilon(0.0);
    EXPECT_DOUBLE_EQ(config.getEpsilon(), 1.0e-15);
}

TEST_F(ConfigTest, MaxIterationsClamped) {
    config.setMaxIterations(250);
    EXPECT_EQ(config.getMaxIterations(), 250);
    config.setMaxIterations(50000);
    EXPECT_EQ(config.getMaxIterations(), 10000);
    config.setMaxIterations(-3);
    EXPECT_EQ(config.getMaxIterations(), 1);
}

TEST_F(ConfigTest, ScaleClamped) {
    config.setScale(0.25);
    EXPECT_DOUBLE_EQ(config.getScale(), 0.25);
    config.setScale(2.0);
    EXPECT_DOUBLE_EQ(config.getScale(), 1.0);
    config.setScale(-1.0);
    EXPECT_DOUBLE_EQ(config.getScale(), 0.01);
}

TEST_F(ConfigTest, LeastSquaresIterationsClamped) {
    config.setLeastSquaresMaxIterations(5000);
    EXPECT_EQ(config.getLeastSquaresMaxIterations(), 1000);
    config.setLeastSquaresMaxIterations(0);
    EXPECT_EQ(config.getLeastSquaresMaxIterations(), 1);
}

TEST_F(ConfigTest, StepFactorClamped) {
    config.setStepFactor(1.0e6);
    EXPECT_DOUBLE_EQ(config.getStepFactor(), 1.0e3);
    config.setStepFactor(0.0);
    EXPECT_DOUBLE_EQ(config.getStepFactor(), 1.0e-3);
}

TEST_F(ConfigTest, Time) {
    const time_point t = std::chrono::sys_days{std::chrono::year{2024}/1/1};
    config.setTime(t);
    EXPECT_TRUE(config.hasTime());
    EXPECT_EQ(config.getTime(), t);
}

TEST_F(ConfigTest, GeneratorsUseSettings) {
    config.setMaxIterations(0);
    // A clamped budget still builds a valid generator
    EXPECT_NO_THROW(config.makeFixedPointGenerator());
    config.setLeastSquaresMaxIterations(-10);
    EXPECT_NO_THROW(config.makeLeastSquaresGenerator());
}

} // namespace
} // namespace tlekit
