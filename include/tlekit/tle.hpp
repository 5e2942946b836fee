/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __TLEKIT_TLE_HPP
#define __TLEKIT_TLE_HPP

#include <tlekit/constants.hpp>
#include <tlekit/exceptions.hpp>
#include <tlekit/vector.hpp>

#include <chrono>
#include <iostream>
#include <map>
#include <string>
#include <string_view>

namespace tlekit {

// ============================================================================
// TLE Record
// ============================================================================

/**
 * Immutable Two-Line Element set.
 *
 * Mean motion is stored in rad/s, its first derivative in rad/s² and its
 * second derivative in rad/s³. Angles are stored in radians. The epoch is
 * a UTC time_point with a resolution of 864 µs (the last digit of the epoch
 * field in the text format).
 *
 * Usage:
 *   Tle tle(line1, line2);
 *   Tle refit = tle.withBStar(1.0e-4);
 *
 * Satellite numbers above 99999 are written with the alpha-5 scheme, where
 * the leading digit is replaced by a letter (A = 10, ..., Z = 33, skipping I and O).
 */
class Tle {
public:
    /**
     * Parse a TLE from its two lines.
     *
     * @throws TleFormatException if a line is malformed, a field isn't numeric,
     *         or the two lines refer to different satellites
     * @throws TleChecksumException if a checksum digit is wrong
     */
    Tle(const std::string_view &line1, const std::string_view &line2);

    /**
     * Build a TLE from its fields.
     *
     * RAAN, argument of perigee and mean anomaly are normalized into [0, 2π).
     *
     * @throws InvalidOrbitException if mean motion, eccentricity or inclination are out of range
     * @throws TleFormatException if a field doesn't fit in the text format
     */
    Tle(int satelliteNumber, char classification,
        int launchYear, int launchNumber, const std::string &launchPiece,
        int ephemerisType, int elementNumber, time_point epoch,
        double meanMotion, double meanMotionFirstDerivative, double meanMotionSecondDerivative,
        double eccentricity, double inclination, double pa, double raan, double meanAnomaly,
        int revolutionNumberAtEpoch, double bStar);

    // Identification
    int getSatelliteNumber() const { return satelliteNumber; }
    char getClassification() const { return classification; }
    int getLaunchYear() const { return launchYear; }
    int getLaunchNumber() const { return launchNumber; }
    const std::string& getLaunchPiece() const { return launchPiece; }
    int getEphemerisType() const { return ephemerisType; }
    int getElementNumber() const { return elementNumber; }
    time_point getEpoch() const { return epoch; }

    // Mean elements
    double getMeanMotion() const { return meanMotion; }
    double getMeanMotionFirstDerivative() const { return meanMotionFirstDerivative; }
    double getMeanMotionSecondDerivative() const { return meanMotionSecondDerivative; }
    double getE() const { return eccentricity; }
    double getI() const { return inclination; }
    double getPerigeeArgument() const { return pa; }
    double getRaan() const { return raan; }
    double getMeanAnomaly() const { return meanAnomaly; }
    int getRevolutionNumberAtEpoch() const { return revolutionNumberAtEpoch; }
    double getBStar() const { return bStar; }

    // Exported values
    double getMeanMotionRevsPerDay() const;
    double getInclinationDegrees() const;
    double getRaanDegrees() const;
    double getPerigeeArgumentDegrees() const;
    double getMeanAnomalyDegrees() const;

    /** Julian date (UTC) of the epoch. */
    double getEpochJulianDate() const;

    const std::string& getLine1() const { return line1; }
    const std::string& getLine2() const { return line2; }

    /**
     * Copy of this TLE with a different drag term.
     */
    Tle withBStar(double newBStar) const;

    /**
     * Copy of this TLE with new mean elements, keeping identification,
     * mean motion derivatives and drag term.
     */
    Tle withElements(time_point newEpoch, double newMeanMotion, double newE, double newI,
                     double newPa, double newRaan, double newMeanAnomaly,
                     int newRevolutionNumber) const;

    /**
     * Print orbital element information to a stream.
     */
    void printInfo(std::ostream &os) const;

    bool operator==(const Tle &other) const;

    /**
     * Check the lines' format.
     *
     * @return false if a line has the wrong length or layout
     * @throws TleChecksumException if the layout is right but a checksum digit is wrong
     */
    static bool isFormatOk(const std::string_view &line1, const std::string_view &line2);

    /**
     * Mod-10 checksum of the first 68 characters of a line ('-' counts as 1).
     */
    static int checksum(const std::string_view &line);

private:
    int satelliteNumber;
    char classification;
    int launchYear;
    int launchNumber;
    std::string launchPiece;
    int ephemerisType;
    int elementNumber;
    time_point epoch;

    double meanMotion;
    double meanMotionFirstDerivative;
    double meanMotionSecondDerivative;
    double eccentricity;
    double inclination;
    double pa;
    double raan;
    double meanAnomaly;
    int revolutionNumberAtEpoch;
    double bStar;

    std::string line1;
    std::string line2;

    /** Range checks shared by both constructors, throws InvalidOrbitException. */
    void validateElements() const;
    void buildLine1();
    void buildLine2();
};

std::ostream& operator<<(std::ostream &os, const Tle &tle);

// ============================================================================
// TLE Catalog Files
// ============================================================================

/**
 * A TLE with the optional name line that preceded it in a catalog file.
 */
struct CatalogEntry {
    std::string name;
    Tle tle;
};

/**
 * Read two-line or three-line TLE sets from a stream into a catalog keyed by
 * satellite number. Entries that fail to parse are logged and skipped.
 *
 * @return Number of entries loaded
 */
int loadTleCatalog(std::istream &s, std::map<int, CatalogEntry> &catalog);
int loadTleCatalog(const std::string &filepath, std::map<int, CatalogEntry> &catalog);

void saveTleCatalog(std::ostream &s, const std::map<int, CatalogEntry> &catalog);

} // namespace tlekit

#endif // __TLEKIT_TLE_HPP
