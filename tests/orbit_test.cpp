/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <tlekit/orbit.hpp>
#include <tlekit/exceptions.hpp>

#include <cmath>

namespace tlekit {
namespace {

constexpr double TOLERANCE = 1e-10;

class OrbitTest : public ::testing::Test {
protected:
    // Molniya-like orbit
    KeplerianElements molniya{26600.0e3, 0.74, 63.4 * DEGREES_TO_RADIANS, 270.0 * DEGREES_TO_RADIANS,
                              40.0 * DEGREES_TO_RADIANS, 0.3};
};

TEST_F(OrbitTest, KeplerEquation) {
    const double e = 0.3;
    const double m = 1.2;
    const double ecc = meanToEccentricAnomaly(m, e);
    EXPECT_NEAR(ecc - e * std::sin(ecc), m, TOLERANCE);
    EXPECT_NEAR(eccentricToMeanAnomaly(ecc, e), m, TOLERANCE);
}

TEST_F(OrbitTest, KeplerEquationHighEccentricity) {
    const double e = 0.95;
    const double m = 0.05;
    const double ecc = meanToEccentricAnomaly(m, e);
    EXPECT_NEAR(ecc - e * std::sin(ecc), m, TOLERANCE);
}

TEST_F(OrbitTest, AnomalyConversionsKeepRevolution) {
    // Angles more than a turn away keep their revolution count
    const double m = 1.0 + 2.0 * TWO_PI;
    const double v = meanToTrueAnomaly(m, 0.1);
    EXPECT_NEAR(trueToMeanAnomaly(v, 0.1), m, TOLERANCE);
    EXPECT_GT(v, 2.0 * TWO_PI);
}

TEST_F(OrbitTest, CircularOrbitAnomaliesAgree) {
    EXPECT_NEAR(meanToTrueAnomaly(2.5, 0.0), 2.5, TOLERANCE);
    EXPECT_NEAR(trueToEccentricAnomaly(-1.0, 0.0), -1.0, TOLERANCE);
}

TEST_F(OrbitTest, CircularVelocity) {
    KeplerianElements circular{7000.0e3, 0.0, 0.5, 0.0, 0.0, 0.0};
    PV pv = toCartesian(circular);
    EXPECT_NEAR(pv.position.magnitude(), 7000.0e3, 1e-6);
    EXPECT_NEAR(pv.velocity.magnitude(), std::sqrt(MU / 7000.0e3), 1e-9);
    EXPECT_NEAR(pv.position.dot(pv.velocity), 0.0, 1e-3);
}

TEST_F(OrbitTest, CartesianKeplerianRoundTrip) {
    PV pv = toCartesian(molniya);
    KeplerianElements back = toKeplerian(pv);
    EXPECT_NEAR(back.a, molniya.a, 1e-5);
    EXPECT_NEAR(back.e, molniya.e, TOLERANCE);
    EXPECT_NEAR(back.i, molniya.i, TOLERANCE);
    EXPECT_NEAR(normalizeAngle(back.pa, molniya.pa), molniya.pa, 1e-9);
    EXPECT_NEAR(normalizeAngle(back.raan, molniya.raan), molniya.raan, 1e-9);
    EXPECT_NEAR(normalizeAngle(back.meanAnomaly, molniya.meanAnomaly), molniya.meanAnomaly, 1e-9);
}

TEST_F(OrbitTest, EquinoctialElements) {
    EquinoctialElements eq = toEquinoctial(molniya);
    EXPECT_NEAR(eq.getE(), molniya.e, TOLERANCE);
    EXPECT_NEAR(eq.getH(), std::tan(molniya.i / 2.0), TOLERANCE);
    EXPECT_NEAR(normalizeAngle(eq.getLM(), 0.0),
                normalizeAngle(molniya.pa + molniya.raan + molniya.meanAnomaly, 0.0), 1e-9);

    EquinoctialElements fromState = toEquinoctial(toCartesian(eq));
    EXPECT_NEAR(fromState.ex, eq.ex, TOLERANCE);
    EXPECT_NEAR(fromState.hy, eq.hy, TOLERANCE);
}

TEST_F(OrbitTest, KeplerianMeanMotion) {
    EXPECT_NEAR(keplerianMeanMotion(42164.0e3), 7.2921e-5, 1e-8);
    EXPECT_DOUBLE_EQ(molniya.getMeanMotion(), keplerianMeanMotion(molniya.a));
}

TEST_F(OrbitTest, HyperbolicStateThrows) {
    PV escape{{7000.0e3, 0.0, 0.0}, {0.0, 12000.0, 0.0}};
    EXPECT_THROW(toEquinoctial(escape), InvalidOrbitException);
}

} // namespace
} // namespace tlekit
