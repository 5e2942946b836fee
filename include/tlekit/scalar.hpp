/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 *
 * Scalar algebra used by the propagation kernels.
 *
 * The SGP4/SDP4 formulas are written once as templates over a scalar type.
 * Two scalar types are supported:
 *   - double, for plain propagation
 *   - Gradient<N>, a forward-mode automatic differentiation number that
 *     carries N first-order partial derivatives along with its value
 *
 * Every function is provided in the tlekit namespace for both types, so
 * kernel code calls sqrt(x), sin(x), etc. unqualified. Branches in the
 * kernels must compare value(x) and never the scalar itself.
 */

#ifndef __TLEKIT_SCALAR_HPP
#define __TLEKIT_SCALAR_HPP

#include <tlekit/constants.hpp>

#include <array>
#include <cmath>
#include <stdexcept>
#include <string>

namespace tlekit {

/**
 * Value with first-order partial derivatives with respect to N independent
 * variables.
 */
template <int N>
class Gradient {
public:
    static_assert(N > 0, "Gradient needs at least one independent variable");

    Gradient() : val(0.0), grad{} {}

    // Implicit so that literal constants mix with derivative-carrying values.
    Gradient(const double v) : val(v), grad{} {}

    Gradient(const double v, const std::array<double, N> &g) : val(v), grad(g) {}

    /**
     * Create an independent variable.
     *
     * @param index Index of the variable, in [0, N)
     * @param v Value of the variable
     */
    static Gradient variable(const int index, const double v) {
        if (index < 0 || index >= N) {
            throw std::out_of_range("Gradient variable index out of range: " + std::to_string(index));
        }
        Gradient g(v);
        g.grad[index] = 1.0;
        return g;
    }

    static Gradient constant(const double v) {
        return Gradient(v);
    }

    static constexpr int freeParameters() {
        return N;
    }

    double getValue() const {
        return val;
    }

    const std::array<double, N>& getGradient() const {
        return grad;
    }

    double getPartialDerivative(const int index) const {
        if (index < 0 || index >= N) {
            throw std::out_of_range("Gradient derivative index out of range: " + std::to_string(index));
        }
        return grad[index];
    }

    Gradient operator-() const {
        Gradient r;
        r.val = -val;
        for (int k = 0; k < N; ++k) r.grad[k] = -grad[k];
        return r;
    }

    Gradient& operator+=(const Gradient &o) {
        val += o.val;
        for (int k = 0; k < N; ++k) grad[k] += o.grad[k];
        return *this;
    }

    Gradient& operator-=(const Gradient &o) {
        val -= o.val;
        for (int k = 0; k < N; ++k) grad[k] -= o.grad[k];
        return *this;
    }

    Gradient& operator*=(const Gradient &o) {
        for (int k = 0; k < N; ++k) grad[k] = grad[k] * o.val + val * o.grad[k];
        val *= o.val;
        return *this;
    }

    Gradient& operator/=(const Gradient &o) {
        const double inv = 1.0 / o.val;
        const double q = val / o.val;
        for (int k = 0; k < N; ++k) grad[k] = (grad[k] - q * o.grad[k]) * inv;
        val = q;
        return *this;
    }

    Gradient& operator+=(const double d) {
        val += d;
        return *this;
    }

    Gradient& operator-=(const double d) {
        val -= d;
        return *this;
    }

    Gradient& operator*=(const double d) {
        val *= d;
        for (int k = 0; k < N; ++k) grad[k] *= d;
        return *this;
    }

    Gradient& operator/=(const double d) {
        val /= d;
        for (int k = 0; k < N; ++k) grad[k] /= d;
        return *this;
    }

    /**
     * Apply the chain rule: value becomes f, derivatives are scaled by f'.
     */
    Gradient compose(const double f, const double fPrime) const {
        Gradient r;
        r.val = f;
        for (int k = 0; k < N; ++k) r.grad[k] = fPrime * grad[k];
        return r;
    }

private:
    double val;
    std::array<double, N> grad;
};

// ============================================================================
// Arithmetic
// ============================================================================

template <int N>
inline Gradient<N> operator+(Gradient<N> a, const Gradient<N> &b) { return a += b; }
template <int N>
inline Gradient<N> operator+(Gradient<N> a, const double b) { return a += b; }
template <int N>
inline Gradient<N> operator+(const double a, Gradient<N> b) { return b += a; }

template <int N>
inline Gradient<N> operator-(Gradient<N> a, const Gradient<N> &b) { return a -= b; }
template <int N>
inline Gradient<N> operator-(Gradient<N> a, const double b) { return a -= b; }
template <int N>
inline Gradient<N> operator-(const double a, const Gradient<N> &b) { return Gradient<N>(a) -= b; }

template <int N>
inline Gradient<N> operator*(Gradient<N> a, const Gradient<N> &b) { return a *= b; }
template <int N>
inline Gradient<N> operator*(Gradient<N> a, const double b) { return a *= b; }
template <int N>
inline Gradient<N> operator*(const double a, Gradient<N> b) { return b *= a; }

template <int N>
inline Gradient<N> operator/(Gradient<N> a, const Gradient<N> &b) { return a /= b; }
template <int N>
inline Gradient<N> operator/(Gradient<N> a, const double b) { return a /= b; }
template <int N>
inline Gradient<N> operator/(const double a, const Gradient<N> &b) { return Gradient<N>(a) /= b; }

// ============================================================================
// Real-valued access
// ============================================================================

inline double value(const double x) {
    return x;
}

template <int N>
inline double value(const Gradient<N> &x) {
    return x.getValue();
}

// ============================================================================
// Elementary functions, double
// ============================================================================

inline double sqrt(const double x) { return std::sqrt(x); }
inline double sin(const double x) { return std::sin(x); }
inline double cos(const double x) { return std::cos(x); }
inline double tan(const double x) { return std::tan(x); }
inline double asin(const double x) { return std::asin(x); }
inline double acos(const double x) { return std::acos(x); }
inline double atan(const double x) { return std::atan(x); }
inline double atan2(const double y, const double x) { return std::atan2(y, x); }
inline double pow(const double x, const double p) { return std::pow(x, p); }
inline double abs(const double x) { return std::fabs(x); }
inline double exp(const double x) { return std::exp(x); }
inline double log(const double x) { return std::log(x); }

// ============================================================================
// Elementary functions, Gradient
// ============================================================================

template <int N>
inline Gradient<N> sqrt(const Gradient<N> &x) {
    const double s = std::sqrt(x.getValue());
    return x.compose(s, 0.5 / s);
}

template <int N>
inline Gradient<N> sin(const Gradient<N> &x) {
    return x.compose(std::sin(x.getValue()), std::cos(x.getValue()));
}

template <int N>
inline Gradient<N> cos(const Gradient<N> &x) {
    return x.compose(std::cos(x.getValue()), -std::sin(x.getValue()));
}

template <int N>
inline Gradient<N> tan(const Gradient<N> &x) {
    const double t = std::tan(x.getValue());
    return x.compose(t, 1.0 + t * t);
}

template <int N>
inline Gradient<N> asin(const Gradient<N> &x) {
    const double v = x.getValue();
    return x.compose(std::asin(v), 1.0 / std::sqrt(1.0 - v * v));
}

template <int N>
inline Gradient<N> acos(const Gradient<N> &x) {
    const double v = x.getValue();
    return x.compose(std::acos(v), -1.0 / std::sqrt(1.0 - v * v));
}

template <int N>
inline Gradient<N> atan(const Gradient<N> &x) {
    const double v = x.getValue();
    return x.compose(std::atan(v), 1.0 / (1.0 + v * v));
}

template <int N>
inline Gradient<N> atan2(const Gradient<N> &y, const Gradient<N> &x) {
    const double yv = y.getValue();
    const double xv = x.getValue();
    const double r2 = xv * xv + yv * yv;
    std::array<double, N> g;
    for (int k = 0; k < N; ++k) {
        g[k] = (xv * y.getGradient()[k] - yv * x.getGradient()[k]) / r2;
    }
    return Gradient<N>(std::atan2(yv, xv), g);
}

template <int N>
inline Gradient<N> pow(const Gradient<N> &x, const double p) {
    const double v = x.getValue();
    return x.compose(std::pow(v, p), p * std::pow(v, p - 1.0));
}

template <int N>
inline Gradient<N> abs(const Gradient<N> &x) {
    return x.getValue() < 0.0 ? -x : x;
}

template <int N>
inline Gradient<N> exp(const Gradient<N> &x) {
    const double e = std::exp(x.getValue());
    return x.compose(e, e);
}

template <int N>
inline Gradient<N> log(const Gradient<N> &x) {
    return x.compose(std::log(x.getValue()), 1.0 / x.getValue());
}

/**
 * Normalize an angle into [center - π, center + π).
 * The shift is computed from the real value, so derivatives pass through unchanged.
 */
template <typename T>
inline T normalizeAngle(const T &a, const double center) {
    return a - TWO_PI * std::floor((value(a) + M_PI - center) / TWO_PI);
}

} // namespace tlekit

#endif // __TLEKIT_SCALAR_HPP
