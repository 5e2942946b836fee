/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 *
 * JSON ephemeris files.
 *
 * {
 *   "satellite": 25544,
 *   "frame": "TEME",
 *   "samples": [
 *     { "time": "2008-09-20 12:25:40.104192",
 *       "position": [x, y, z],        (m)
 *       "velocity": [vx, vy, vz] }    (m/s)
 *   ]
 * }
 */

#ifndef __TLEKIT_EPHEMERIS_HPP
#define __TLEKIT_EPHEMERIS_HPP

#include <tlekit/generation.hpp>
#include <tlekit/propagator.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace tlekit {

/**
 * Sample a propagator every step seconds over a span starting at the TLE epoch.
 */
std::vector<EphemerisSample> sampleEphemeris(const Propagator &propagator, double stepSeconds, double spanSeconds);

/**
 * @throws std::runtime_error if the document is malformed
 */
std::vector<EphemerisSample> readEphemeris(std::istream &s);
std::vector<EphemerisSample> readEphemeris(const std::string &filepath);

void writeEphemeris(std::ostream &s, int satelliteNumber, const std::vector<EphemerisSample> &samples);

/** UTC time with microseconds: YYYY-MM-DD HH:MM:SS.ffffff */
std::string formatTime(time_point time);

/**
 * @throws std::runtime_error if the text isn't a YYYY-MM-DD HH:MM:SS time
 */
time_point parseTime(const std::string &text);

} // namespace tlekit

#endif // __TLEKIT_EPHEMERIS_HPP
