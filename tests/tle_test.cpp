/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <tlekit/tle.hpp>

#include <chrono>
#include <cmath>
#include <map>
#include <sstream>
#include <string>

namespace tlekit {
namespace {

constexpr const char* LINE1_27421 = "1 27421U 02021A   02124.48976499 -.00021470  00000-0 -89879-2 0    20";
constexpr const char* LINE2_27421 = "2 27421  98.7490 199.5121 0001333 133.9522 226.1918 14.26113993    62";

// Geostationary
constexpr const char* LINE1_27508 = "1 27508U 02040A   12021.25695307 -.00000113  00000-0  10000-3 0  7326";
constexpr const char* LINE2_27508 = "2 27508   0.0571 356.7800 0005033 344.4621 218.7816  1.00271798 34501";

constexpr const char* LINE1_ISS = "1 25544U 98067A   08264.51782528 -.00002182  00000-0 -11606-4 0  2927";
constexpr const char* LINE2_ISS = "2 25544  51.6416 247.4627 0006703 130.5360 325.0288 15.72125391563537";

// Three-line catalog with a bad entry in the middle
constexpr const char* CATALOG =
    "ISS (ZARYA)\n"
    "1 25544U 98067A   08264.51782528 -.00002182  00000-0 -11606-4 0  2927\n"
    "2 25544  51.6416 247.4627 0006703 130.5360 325.0288 15.72125391563537\n"
    "BROKEN\n"
    "1 27421U 02021A   02124.48976499 -.00021470  00000-0 -89879-2 0    21\n"
    "2 27421  98.7490 199.5121 0001333 133.9522 226.1918 14.26113993    62\n"
    "1 27508U 02040A   12021.25695307 -.00000113  00000-0  10000-3 0  7326\n"
    "2 27508   0.0571 356.7800 0005033 344.4621 218.7816  1.00271798 34501\n";

using TleTick = std::chrono::duration<int64_t, std::ratio<27, 31250>>;

/** Rebuild a TLE from its fields so the lines are formatted from scratch. */
Tle rebuild(const Tle &tle) {
    return Tle(tle.getSatelliteNumber(), tle.getClassification(),
               tle.getLaunchYear(), tle.getLaunchNumber(), tle.getLaunchPiece(),
               tle.getEphemerisType(), tle.getElementNumber(), tle.getEpoch(),
               tle.getMeanMotion(), tle.getMeanMotionFirstDerivative(), tle.getMeanMotionSecondDerivative(),
               tle.getE(), tle.getI(), tle.getPerigeeArgument(), tle.getRaan(), tle.getMeanAnomaly(),
               tle.getRevolutionNumberAtEpoch(), tle.getBStar());
}

class TleTest : public ::testing::Test {
protected:
    Tle tle{LINE1_27421, LINE2_27421};
};

TEST_F(TleTest, ParseIdentification) {
    EXPECT_EQ(tle.getSatelliteNumber(), 27421);
    EXPECT_EQ(tle.getClassification(), 'U');
    EXPECT_EQ(tle.getLaunchYear(), 2002);
    EXPECT_EQ(tle.getLaunchNumber(), 21);
    EXPECT_EQ(tle.getLaunchPiece(), "A");
    EXPECT_EQ(tle.getEphemerisType(), 0);
    EXPECT_EQ(tle.getElementNumber(), 2);
    EXPECT_EQ(tle.getRevolutionNumberAtEpoch(), 6);
}

TEST_F(TleTest, ParseEpoch) {
    using namespace std::chrono;
    const time_point expected = sys_days{2002y/May/4} + duration_cast<system_clock::duration>(TleTick{48976499});
    EXPECT_EQ(tle.getEpoch(), expected);
}

TEST_F(TleTest, ParseMeanElements) {
    EXPECT_NEAR(tle.getMeanMotionRevsPerDay(), 14.26113993, 1e-10);
    EXPECT_NEAR(tle.getE(), 0.0001333, 1e-12);
    EXPECT_NEAR(tle.getInclinationDegrees(), 98.7490, 1e-10);
    EXPECT_NEAR(tle.getRaanDegrees(), 199.5121, 1e-10);
    EXPECT_NEAR(tle.getPerigeeArgumentDegrees(), 133.9522, 1e-10);
    EXPECT_NEAR(tle.getMeanAnomalyDegrees(), 226.1918, 1e-10);
}

TEST_F(TleTest, ParseDragTerms) {
    EXPECT_NEAR(tle.getBStar(), -0.0089879, 1e-15);
    // Stored as rad/s², field is half the derivative in rev/day²
    EXPECT_NEAR(tle.getMeanMotionFirstDerivative() * 1.86624e9 / M_PI, -0.00021470, 1e-15);
    EXPECT_DOUBLE_EQ(tle.getMeanMotionSecondDerivative(), 0.0);
}

TEST_F(TleTest, KeepsOriginalLines) {
    EXPECT_EQ(tle.getLine1(), LINE1_27421);
    EXPECT_EQ(tle.getLine2(), LINE2_27421);
}

TEST_F(TleTest, Equality) {
    Tle same(LINE1_27421, LINE2_27421);
    EXPECT_TRUE(tle == same);
    EXPECT_FALSE(tle == tle.withBStar(0.0));
}

TEST_F(TleTest, WithBStarKeepsElements) {
    Tle refit = tle.withBStar(1.0e-4);
    EXPECT_DOUBLE_EQ(refit.getBStar(), 1.0e-4);
    EXPECT_DOUBLE_EQ(refit.getMeanMotion(), tle.getMeanMotion());
    EXPECT_EQ(refit.getEpoch(), tle.getEpoch());
    EXPECT_NE(refit.getLine1(), tle.getLine1());
    EXPECT_EQ(refit.getLine1().substr(53, 8), " 10000-3");
}

TEST_F(TleTest, ChecksumDigit) {
    EXPECT_EQ(Tle::checksum(LINE1_27421), 0);
    EXPECT_EQ(Tle::checksum(LINE2_27421), 2);
}

TEST_F(TleTest, WrongChecksumThrows) {
    std::string line1 = LINE1_27421;
    line1[68] = '1';
    try {
        Tle bad(line1, LINE2_27421);
        FAIL() << "Expected TleChecksumException";
    } catch (const TleChecksumException &err) {
        EXPECT_EQ(err.getLine(), 1);
        EXPECT_EQ(err.getExpected(), 0);
        EXPECT_EQ(err.getActual(), 1);
    }
}

TEST_F(TleTest, MalformedLinesThrow) {
    // Non-numeric mean motion
    EXPECT_THROW(Tle(LINE1_27421, "2 27421  98.7490 199.5121 0001333 133.9522 226.1918 14*26113993    62"),
                 TleFormatException);
    // Missing classification
    EXPECT_THROW(Tle("1 27421 02021A   02124.48976499 -.00021470  00000-0 -89879-2 0    20", LINE2_27421),
                 TleFormatException);
    // Bad exponent field
    EXPECT_THROW(Tle("1 27421U 02021A   02124.48976499 -.00021470  00000-0 -89879 2 0    20", LINE2_27421),
                 TleFormatException);
    // Truncated line
    EXPECT_THROW(Tle(std::string(LINE1_27421).substr(0, 60), LINE2_27421), TleFormatException);
}

TEST_F(TleTest, MismatchedSatelliteNumbersThrow) {
    EXPECT_THROW(Tle(LINE1_27421, LINE2_27508), TleFormatException);
}

TEST_F(TleTest, ParsedElementsOutOfRangeThrow) {
    // Inclination of 190 degrees
    EXPECT_THROW(Tle(LINE1_ISS, "2 25544 190.0000 247.4627 0006703 130.5360 325.0288 15.72125391563534"),
                 InvalidOrbitException);
    // Zero mean motion
    EXPECT_THROW(Tle(LINE1_ISS, "2 25544  51.6416 247.4627 0006703 130.5360 325.0288  0.00000000563531"),
                 InvalidOrbitException);
}

TEST(TleCatalogTest, LoadSkipsOutOfRangeEntries) {
    std::istringstream in(std::string("BAD\n") + LINE1_ISS +
                          "\n2 25544 190.0000 247.4627 0006703 130.5360 325.0288 15.72125391563534\n" +
                          LINE1_27508 + "\n" + LINE2_27508 + "\n");
    std::map<int, CatalogEntry> catalog;
    EXPECT_EQ(loadTleCatalog(in, catalog), 1);
    EXPECT_FALSE(catalog.contains(25544));
    EXPECT_TRUE(catalog.contains(27508));
}

TEST_F(TleTest, FormatCheck) {
    EXPECT_TRUE(Tle::isFormatOk(LINE1_27421, LINE2_27421));
    EXPECT_FALSE(Tle::isFormatOk(LINE2_27421, LINE1_27421));
    EXPECT_FALSE(Tle::isFormatOk("", LINE2_27421));
}

TEST(TleFormattingTest, GeostationaryRoundTrip) {
    Tle parsed(LINE1_27508, LINE2_27508);
    Tle built = rebuild(parsed);
    EXPECT_EQ(built.getLine1(), LINE1_27508);
    EXPECT_EQ(built.getLine2(), LINE2_27508);
}

TEST(TleFormattingTest, IssRoundTrip) {
    Tle parsed(LINE1_ISS, LINE2_ISS);
    Tle built = rebuild(parsed);
    EXPECT_EQ(built.getLine1(), LINE1_ISS);
    EXPECT_EQ(built.getLine2(), LINE2_ISS);
}

TEST(TleFormattingTest, Alpha5SatelliteNumber) {
    using namespace std::chrono;
    const time_point epoch = sys_days{2012y/January/26} + duration_cast<system_clock::duration>(TleTick{96078249});
    const double revPerDay = M_PI / 43200.0;
    Tle tle(339999, 'U', 1971, 86, "J", 0, 908, epoch,
            12.26882470 * revPerDay, -0.00000004 * M_PI / 1.86624e9, 0.00001e-9 * M_PI / 5.3747712e13,
            0.0075476, 74.0161 * DEGREES_TO_RADIANS, 328.9888 * DEGREES_TO_RADIANS,
            228.9750 * DEGREES_TO_RADIANS, 30.6709 * DEGREES_TO_RADIANS,
            80454, 0.01234e-9);
    EXPECT_EQ(tle.getLine1(), "1 Z9999U 71086J   12026.96078249 -.00000004  00001-9  01234-9 0  9088");
    EXPECT_EQ(tle.getLine2(), "2 Z9999  74.0161 228.9750 0075476 328.9888  30.6709 12.26882470804541");

    Tle parsed(tle.getLine1(), tle.getLine2());
    EXPECT_EQ(parsed.getSatelliteNumber(), 339999);
}

TEST(TleFormattingTest, AnglesAreNormalized) {
    Tle base(LINE1_ISS, LINE2_ISS);
    Tle shifted = base.withElements(base.getEpoch(), base.getMeanMotion(), base.getE(), base.getI(),
                                    base.getPerigeeArgument() - TWO_PI, base.getRaan() + TWO_PI,
                                    -0.5, base.getRevolutionNumberAtEpoch());
    EXPECT_NEAR(shifted.getPerigeeArgument(), base.getPerigeeArgument(), 1e-12);
    EXPECT_NEAR(shifted.getRaan(), base.getRaan(), 1e-12);
    EXPECT_NEAR(shifted.getMeanAnomaly(), TWO_PI - 0.5, 1e-12);
}

TEST(TleFormattingTest, InvalidElementsThrow) {
    Tle base(LINE1_ISS, LINE2_ISS);
    EXPECT_THROW(base.withElements(base.getEpoch(), -1.0e-3, base.getE(), base.getI(), 0.0, 0.0, 0.0, 0),
                 InvalidOrbitException);
    EXPECT_THROW(base.withElements(base.getEpoch(), base.getMeanMotion(), 1.0075476, base.getI(), 0.0, 0.0, 0.0, 0),
                 InvalidOrbitException);
    EXPECT_THROW(base.withElements(base.getEpoch(), base.getMeanMotion(), base.getE(), 4.0, 0.0, 0.0, 0.0, 0),
                 InvalidOrbitException);
}

TEST(TleFormattingTest, TooLargeBStarThrows) {
    Tle base(LINE1_ISS, LINE2_ISS);
    EXPECT_THROW(base.withBStar(0.99999e11), TleFormatException);
}

TEST(TleCatalogTest, LoadSkipsBadEntries) {
    std::istringstream in(CATALOG);
    std::map<int, CatalogEntry> catalog;
    EXPECT_EQ(loadTleCatalog(in, catalog), 2);
    ASSERT_TRUE(catalog.contains(25544));
    ASSERT_TRUE(catalog.contains(27508));
    EXPECT_FALSE(catalog.contains(27421));
    EXPECT_EQ(catalog.at(25544).name, "ISS (ZARYA)");
    EXPECT_TRUE(catalog.at(27508).name.empty());
}

TEST(TleCatalogTest, SaveAndReload) {
    std::istringstream in(CATALOG);
    std::map<int, CatalogEntry> catalog;
    loadTleCatalog(in, catalog);

    std::ostringstream out;
    saveTleCatalog(out, catalog);

    std::istringstream reloadIn(out.str());
    std::map<int, CatalogEntry> reloaded;
    EXPECT_EQ(loadTleCatalog(reloadIn, reloaded), 2);
    EXPECT_TRUE(reloaded.at(25544).tle == catalog.at(25544).tle);
    EXPECT_EQ(reloaded.at(25544).name, "ISS (ZARYA)");
}

TEST(TleCatalogTest, MissingFileLoadsNothing) {
    std::map<int, CatalogEntry> catalog;
    EXPECT_EQ(loadTleCatalog("/nonexistent/tlekit/catalog.txt", catalog), 0);
    EXPECT_TRUE(catalog.empty());
}

TEST(TleInfoTest, PrintsElements) {
    Tle tle(LINE1_ISS, LINE2_ISS);
    std::ostringstream out;
    tle.printInfo(out);
    const std::string text = out.str();
    EXPECT_NE(text.find("25544"), std::string::npos);
    EXPECT_NE(text.find("2008-09-20"), std::string::npos);
}

} // namespace
} // namespace tlekit
