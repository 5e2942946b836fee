/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __TLEKIT_VECTOR_HPP
#define __TLEKIT_VECTOR_HPP

#include <tlekit/scalar.hpp>

#include <chrono>

namespace tlekit {

using time_point = std::chrono::system_clock::time_point;

/**
 * 3D vector in Cartesian coordinates.
 */
template <typename T>
struct Vector3 {
    T x, y, z;

    Vector3 operator+(const Vector3& other) const {
        return {x + other.x, y + other.y, z + other.z};
    }

    Vector3 operator-(const Vector3& other) const {
        return {x - other.x, y - other.y, z - other.z};
    }

    Vector3 operator*(const T& scalar) const {
        return {x * scalar, y * scalar, z * scalar};
    }

    T magnitude() const {
        return sqrt(x*x + y*y + z*z);
    }

    T dot(const Vector3& other) const {
        return x * other.x + y * other.y + z * other.z;
    }

    Vector3 cross(const Vector3& other) const {
        return {
            y * other.z - z * other.y,
            z * other.x - x * other.z,
            x * other.y - y * other.x
        };
    }
};

using Vec3 = Vector3<double>;

/**
 * Position (m) and velocity (m/s) in the TEME frame.
 */
template <typename T>
struct PVCoordinates {
    Vector3<T> position;
    Vector3<T> velocity;
};

using PV = PVCoordinates<double>;

/** Real part of a derivative-carrying state. */
template <typename T>
inline PV toPV(const PVCoordinates<T> &pv) {
    return {
        {value(pv.position.x), value(pv.position.y), value(pv.position.z)},
        {value(pv.velocity.x), value(pv.velocity.y), value(pv.velocity.z)}
    };
}

} // namespace tlekit

#endif // __TLEKIT_VECTOR_HPP
