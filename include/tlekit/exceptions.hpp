/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __TLEKIT_EXCEPTIONS_HPP
#define __TLEKIT_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

namespace tlekit {

/**
 * Base exception class for all tlekit errors.
 */
class TleException : public std::runtime_error {
public:
    explicit TleException(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * Malformed TLE text, non-numeric field, or a value that doesn't fit its column.
 */
class TleFormatException : public TleException {
public:
    explicit TleFormatException(const std::string& msg) : TleException(msg) {}
};

/**
 * Exception thrown when a TLE line's checksum digit doesn't match its contents.
 */
class TleChecksumException : public TleFormatException {
public:
    TleChecksumException(int line, int expected, int actual)
        : TleFormatException("Checksum error on line " + std::to_string(line) +
                             ": expected " + std::to_string(expected) +
                             ", found " + std::to_string(actual)),
          lineNumber(line), expectedDigit(expected), actualDigit(actual) {}

    int getLine() const { return lineNumber; }
    int getExpected() const { return expectedDigit; }
    int getActual() const { return actualDigit; }

private:
    int lineNumber;
    int expectedDigit;
    int actualDigit;
};

/**
 * Exception thrown when orbital elements are invalid.
 */
class InvalidOrbitException : public TleException {
public:
    explicit InvalidOrbitException(const std::string& msg) : TleException(msg) {}
};

/**
 * Exception thrown when a satellite has decayed (re-entered atmosphere).
 */
class SatelliteDecayedException : public TleException {
public:
    explicit SatelliteDecayedException(double minutes)
        : TleException("Satellite has decayed at " + std::to_string(minutes) + " minutes from epoch"),
          minutesFromEpoch(minutes) {}

    double getMinutesFromEpoch() const { return minutesFromEpoch; }

private:
    double minutesFromEpoch;
};

/**
 * Exception thrown when TLE generation doesn't converge within its iteration budget.
 */
class TleGenerationException : public TleException {
public:
    TleGenerationException(const std::string& msg, int iterations)
        : TleException(msg), iterationCount(iterations) {}

    int getIterations() const { return iterationCount; }

private:
    int iterationCount;
};

/**
 * Exception thrown when a matrix doesn't have the expected shape.
 */
class DimensionMismatchException : public TleException {
public:
    DimensionMismatchException(const std::string& what,
                               long expectedRows, long expectedCols,
                               long actualRows, long actualCols)
        : TleException("Dimension mismatch for " + what + ": expected " +
                       std::to_string(expectedRows) + "x" + std::to_string(expectedCols) +
                       ", got " + std::to_string(actualRows) + "x" + std::to_string(actualCols)) {}
};

/**
 * Exception thrown when a parameter name isn't known.
 */
class UnknownParameterException : public TleException {
public:
    UnknownParameterException(const std::string& name, const std::string& known)
        : TleException("Unknown parameter " + name + ", known parameters: " + known),
          parameterName(name) {}

    const std::string& getName() const { return parameterName; }

private:
    std::string parameterName;
};

} // namespace tlekit

#endif // __TLEKIT_EXCEPTIONS_HPP
