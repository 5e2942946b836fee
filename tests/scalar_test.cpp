/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <tlekit/scalar.hpp>
#include <tlekit/vector.hpp>

#include <cmath>
#include <stdexcept>

namespace tlekit {
namespace {

using G2 = Gradient<2>;

constexpr double TOLERANCE = 1e-12;

TEST(GradientTest, VariableSeedsUnitDerivative) {
    G2 x = G2::variable(0, 3.0);
    EXPECT_DOUBLE_EQ(x.getValue(), 3.0);
    EXPECT_DOUBLE_EQ(x.getPartialDerivative(0), 1.0);
    EXPECT_DOUBLE_EQ(x.getPartialDerivative(1), 0.0);
}

TEST(GradientTest, ConstantHasNoDerivatives) {
    G2 c = G2::constant(5.0);
    EXPECT_DOUBLE_EQ(c.getValue(), 5.0);
    EXPECT_DOUBLE_EQ(c.getPartialDerivative(0), 0.0);
    EXPECT_DOUBLE_EQ(c.getPartialDerivative(1), 0.0);
    EXPECT_EQ(G2::freeParameters(), 2);
}

TEST(GradientTest, IndexOutOfRangeThrows) {
    EXPECT_THROW(G2::variable(2, 1.0), std::out_of_range);
    EXPECT_THROW(G2::variable(-1, 1.0), std::out_of_range);
    EXPECT_THROW(G2(1.0).getPartialDerivative(3), std::out_of_range);
}

TEST(GradientTest, ProductRule) {
    G2 x = G2::variable(0, 2.0);
    G2 y = G2::variable(1, 3.0);
    G2 f = x * y + 4.0 * x;
    EXPECT_DOUBLE_EQ(f.getValue(), 14.0);
    EXPECT_DOUBLE_EQ(f.getPartialDerivative(0), 7.0);
    EXPECT_DOUBLE_EQ(f.getPartialDerivative(1), 2.0);
}

TEST(GradientTest, QuotientRule) {
    G2 x = G2::variable(0, 2.0);
    G2 y = G2::variable(1, 4.0);
    G2 f = x / y;
    EXPECT_DOUBLE_EQ(f.getValue(), 0.5);
    EXPECT_NEAR(f.getPartialDerivative(0), 0.25, TOLERANCE);
    EXPECT_NEAR(f.getPartialDerivative(1), -0.125, TOLERANCE);

    G2 g = 1.0 / y;
    EXPECT_NEAR(g.getPartialDerivative(1), -1.0 / 16.0, TOLERANCE);
}

TEST(GradientTest, ElementaryFunctions) {
    const double v = 0.3;
    G2 x = G2::variable(0, v);
    EXPECT_NEAR(sin(x).getPartialDerivative(0), std::cos(v), TOLERANCE);
    EXPECT_NEAR(cos(x).getPartialDerivative(0), -std::sin(v), TOLERANCE);
    EXPECT_NEAR(tan(x).getPartialDerivative(0), 1.0 / (std::cos(v) * std::cos(v)), TOLERANCE);
    EXPECT_NEAR(sqrt(x).getPartialDerivative(0), 0.5 / std::sqrt(v), TOLERANCE);
    EXPECT_NEAR(asin(x).getPartialDerivative(0), 1.0 / std::sqrt(1.0 - v * v), TOLERANCE);
    EXPECT_NEAR(acos(x).getPartialDerivative(0), -1.0 / std::sqrt(1.0 - v * v), TOLERANCE);
    EXPECT_NEAR(atan(x).getPartialDerivative(0), 1.0 / (1.0 + v * v), TOLERANCE);
    EXPECT_NEAR(exp(x).getPartialDerivative(0), std::exp(v), TOLERANCE);
    EXPECT_NEAR(log(x).getPartialDerivative(0), 1.0 / v, TOLERANCE);
    EXPECT_NEAR(pow(x, 1.5).getPartialDerivative(0), 1.5 * std::sqrt(v), TOLERANCE);
}

TEST(GradientTest, Atan2PartialDerivatives) {
    G2 y = G2::variable(0, 1.0);
    G2 x = G2::variable(1, 2.0);
    G2 a = atan2(y, x);
    EXPECT_NEAR(a.getValue(), std::atan2(1.0, 2.0), TOLERANCE);
    EXPECT_NEAR(a.getPartialDerivative(0), 2.0 / 5.0, TOLERANCE);
    EXPECT_NEAR(a.getPartialDerivative(1), -1.0 / 5.0, TOLERANCE);
}

TEST(GradientTest, AbsFlipsDerivativeSign) {
    G2 x = G2::variable(0, -2.0);
    G2 a = abs(x);
    EXPECT_DOUBLE_EQ(a.getValue(), 2.0);
    EXPECT_DOUBLE_EQ(a.getPartialDerivative(0), -1.0);
}

TEST(GradientTest, NormalizeAngleKeepsDerivatives) {
    G2 x = G2::variable(0, 7.0);
    G2 n = normalizeAngle(x, M_PI);
    EXPECT_NEAR(n.getValue(), 7.0 - TWO_PI, TOLERANCE);
    EXPECT_DOUBLE_EQ(n.getPartialDerivative(0), 1.0);

    EXPECT_NEAR(normalizeAngle(-0.5, M_PI), TWO_PI - 0.5, TOLERANCE);
    EXPECT_NEAR(normalizeAngle(4.0, 0.0), 4.0 - TWO_PI, TOLERANCE);
}

TEST(GradientTest, ValueOfDoubleAndGradient) {
    EXPECT_DOUBLE_EQ(value(1.5), 1.5);
    EXPECT_DOUBLE_EQ(value(G2::variable(1, 2.5)), 2.5);
}

TEST(VectorTest, GradientMagnitude) {
    G2 x = G2::variable(0, 3.0);
    G2 y = G2::variable(1, 4.0);
    Vector3<G2> v{x, y, G2(0.0)};
    G2 m = v.magnitude();
    EXPECT_NEAR(m.getValue(), 5.0, TOLERANCE);
    EXPECT_NEAR(m.getPartialDerivative(0), 0.6, TOLERANCE);
    EXPECT_NEAR(m.getPartialDerivative(1), 0.8, TOLERANCE);

    PV pv = toPV(PVCoordinates<G2>{v, v * G2(2.0)});
    EXPECT_DOUBLE_EQ(pv.velocity.y, 8.0);
}

TEST(VectorTest, CrossAndDot) {
    Vec3 a{1.0, 0.0, 0.0};
    Vec3 b{0.0, 1.0, 0.0};
    Vec3 c = a.cross(b);
    EXPECT_DOUBLE_EQ(c.z, 1.0);
    EXPECT_DOUBLE_EQ(a.dot(b), 0.0);
}

} // namespace
} // namespace tlekit
