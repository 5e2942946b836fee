/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <tlekit/ephemeris.hpp>

#include <chrono>
#include <sstream>
#include <stdexcept>
#include <string>

namespace tlekit {
namespace {

constexpr const char* LINE1_ISS = "1 25544U 98067A   08264.51782528 -.00002182  00000-0 -11606-4 0  2927";
constexpr const char* LINE2_ISS = "2 25544  51.6416 247.4627 0006703 130.5360 325.0288 15.72125391563537";

constexpr const char* EPHEMERIS_JSON = R"({
  "satellite": 25544,
  "frame": "TEME",
  "samples": [
    { "time": "2008-09-20 12:25:40.104192",
      "position": [-6102443.0, -986332.0, -2820313.0],
      "velocity": [-1455.984, -5233.611, 5009.612] },
    { "time": "2008-09-20 12:26:40",
      "position": [-6144000.5, -1300000.25, -2510000],
      "velocity": [-1300.0, -5250.0, 5100.0] }
  ]
})";

class EphemerisTest : public ::testing::Test {
protected:
    Tle iss{LINE1_ISS, LINE2_ISS};
};

TEST_F(EphemerisTest, ParseTime) {
    using namespace std::chrono;
    const time_point t = parseTime("2008-09-20 12:25:40.104192");
    const time_point expected = sys_days{2008y/September/20} + hours(12) + minutes(25) + microseconds(40104192);
    EXPECT_EQ(t, expected);
    EXPECT_EQ(formatTime(t), "2008-09-20 12:25:40.104192");
}

TEST_F(EphemerisTest, InvalidTimeThrows) {
    EXPECT_THROW(parseTime("yesterday"), std::runtime_error);
}

TEST_F(EphemerisTest, ReadSamples) {
    std::istringstream in(EPHEMERIS_JSON);
    const auto samples = readEphemeris(in);
    ASSERT_EQ(samples.size(), 2u);
    EXPECT_DOUBLE_EQ(samples[0].pv.position.x, -6102443.0);
    EXPECT_DOUBLE_EQ(samples[1].pv.position.y, -1300000.25);
    EXPECT_DOUBLE_EQ(samples[1].pv.position.z, -2510000.0);
    EXPECT_DOUBLE_EQ(samples[0].pv.velocity.z, 5009.612);
    EXPECT_EQ(samples[1].date - samples[0].date,
              std::chrono::duration_cast<time_point::duration>(std::chrono::microseconds(59895808)));
}

TEST_F(EphemerisTest, MalformedDocumentsThrow) {
    std::istringstream notJson("samples: []");
    EXPECT_THROW(readEphemeris(notJson), std::runtime_error);

    std::istringstream noSamples(R"({"satellite": 1})");
    EXPECT_THROW(readEphemeris(noSamples), std::runtime_error);

    std::istringstream shortVector(R"({"samples": [{"time": "2008-09-20 12:00:00", "position": [1, 2], "velocity": [1, 2, 3]}]})");
    EXPECT_THROW(readEphemeris(shortVector), std::runtime_error);

    std::istringstream noTime(R"({"samples": [{"position": [1, 2, 3], "velocity": [1, 2, 3]}]})");
    EXPECT_THROW(readEphemeris(noTime), std::runtime_error);
}

TEST_F(EphemerisTest, MissingFileThrows) {
    EXPECT_THROW(readEphemeris(std::string("/nonexistent/tlekit/ephemeris.json")), std::runtime_error);
}

TEST_F(EphemerisTest, SampleSpan) {
    const Propagator propagator(iss);
    const auto samples = sampleEphemeris(propagator, 60.0, 600.0);
    ASSERT_EQ(samples.size(), 11u);
    EXPECT_EQ(samples.front().date, iss.getEpoch());
    EXPECT_EQ(samples.back().date - samples.front().date, std::chrono::minutes(10));
    EXPECT_THROW(sampleEphemeris(propagator, 0.0, 600.0), std::invalid_argument);
}

TEST_F(EphemerisTest, WriteThenRead) {
    const Propagator propagator(iss);
    const auto samples = sampleEphemeris(propagator, 300.0, 900.0);

    std::stringstream buffer;
    writeEphemeris(buffer, iss.getSatelliteNumber(), samples);
    EXPECT_NE(buffer.str().find("\"frame\": \"TEME\""), std::string::npos);

    const auto read = readEphemeris(buffer);
    ASSERT_EQ(read.size(), samples.size());
    for (size_t k = 0; k < read.size(); ++k) {
        EXPECT_NEAR((read[k].pv.position - samples[k].pv.position).magnitude(), 0.0, 1e-6);
        EXPECT_LE(std::chrono::abs(read[k].date - samples[k].date), std::chrono::microseconds(1));
    }
}

} // namespace
} // namespace tlekit
