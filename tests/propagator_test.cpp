/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <tlekit/orbit.hpp>
#include <tlekit/propagator.hpp>

#include <chrono>
#include <cmath>
#include <thread>
#include <vector>

namespace tlekit {
namespace {

// Geostationary with zero inclination (SDP4, synchronous resonance)
constexpr const char* LINE1_26451 = "1 26451U 00043A   10130.13784012 -.00000276  00000-0  10000-3 0  3866";
constexpr const char* LINE2_26451 = "2 26451 000.0000 266.1044 0001893 160.7642 152.5985 01.00271160 35865";

// GPS (SDP4, no resonance)
constexpr const char* LINE1_37753 = "1 37753U 11036A   12090.13205652 -.00000006  00000-0  00000+0 0  2272";
constexpr const char* LINE2_37753 = "2 37753  55.0032 176.5796 0004733  13.2285 346.8266  2.00565440  5153";

// Vanguard 1 (SGP4)
constexpr const char* LINE1_00005 = "1 00005U 58002B   00179.78495062  .00000023  00000-0  28098-4 0  4753";
constexpr const char* LINE2_00005 = "2 00005  34.2682 348.7242 1859667 331.7664  19.3264 10.82419157413667";

// Molniya 2-14 (SDP4, 12 hour resonance)
constexpr const char* LINE1_MOLNIYA = "1 08195U 75081A   06176.33215444  .00000099  00000-0  11873-3 0   813";
constexpr const char* LINE2_MOLNIYA = "2 08195  64.1586 279.0717 6877146 264.7651  20.2257  2.00491383225656";

constexpr const char* LINE1_ISS = "1 25544U 98067A   08264.51782528 -.00002182  00000-0 -11606-4 0  2927";
constexpr const char* LINE2_ISS = "2 25544  51.6416 247.4627 0006703 130.5360 325.0288 15.72125391563537";

double distance(const Vec3 &a, const Vec3 &b) {
    return (a - b).magnitude();
}

class PropagatorTest : public ::testing::Test {
protected:
    Tle geo{LINE1_26451, LINE2_26451};
    Tle gps{LINE1_37753, LINE2_37753};
    Tle vanguard{LINE1_00005, LINE2_00005};
    Tle iss{LINE1_ISS, LINE2_ISS};
    Tle molniya{LINE1_MOLNIYA, LINE2_MOLNIYA};
};

TEST_F(PropagatorTest, ModelSelection) {
    EXPECT_EQ(Propagator(iss).getMethod(), PropagationMethod::SGP4);
    EXPECT_EQ(Propagator(vanguard).getMethod(), PropagationMethod::SGP4);
    EXPECT_EQ(Propagator(gps).getMethod(), PropagationMethod::SDP4);
    EXPECT_EQ(Propagator(geo).getMethod(), PropagationMethod::SDP4);
}

TEST_F(PropagatorTest, ResonanceClassification) {
    EXPECT_EQ(Propagator(iss).getResonance(), Resonance::None);
    EXPECT_EQ(Propagator(gps).getResonance(), Resonance::None);
    EXPECT_EQ(Propagator(geo).getResonance(), Resonance::OneDay);
    EXPECT_EQ(Propagator(molniya).getMethod(), PropagationMethod::SDP4);
    EXPECT_EQ(Propagator(molniya).getResonance(), Resonance::HalfDay);
    EXPECT_EQ(toString(Resonance::HalfDay), "12 Hour");
    EXPECT_EQ(toString(Resonance::OneDay), "Synchronous");
    EXPECT_EQ(toString(PropagationMethod::SDP4), "SDP4");
}

TEST_F(PropagatorTest, ZeroInclinationGeostationary) {
    Propagator propagator(geo);
    PV pv = propagator.propagate(100.0);
    EXPECT_NEAR(pv.position.magnitude(), 42171546.979560345, 1.0e-3);
    EXPECT_NEAR(pv.velocity.magnitude(), 3074.1890089357994, 1.0e-6);
}

TEST_F(PropagatorTest, VanguardAtEpoch) {
    PV pv = Propagator(vanguard).getInitialState();
    EXPECT_NEAR(pv.position.x, 7022465.29266, 100.0);
    EXPECT_NEAR(pv.position.y, -1400082.96755, 100.0);
    EXPECT_NEAR(pv.position.z, 39.95155, 100.0);
    EXPECT_NEAR(pv.velocity.x, 1893.841015, 0.1);
    EXPECT_NEAR(pv.velocity.y, 6405.893759, 0.1);
    EXPECT_NEAR(pv.velocity.z, 4534.807250, 0.1);
}

TEST_F(PropagatorTest, GpsReturnsAfterOnePeriod) {
    Propagator propagator(gps);
    const EquinoctialElements start = toEquinoctial(propagator.getInitialState());
    const EquinoctialElements end = toEquinoctial(propagator.propagate(717.97 * 60.0));
    EXPECT_NEAR(start.a, 26560.0e3, 300.0e3);
    EXPECT_NEAR(end.a, start.a, 0.1);
    EXPECT_NEAR(end.ex, start.ex, 0.1);
    EXPECT_NEAR(end.ey, start.ey, 0.1);
    EXPECT_NEAR(end.hx, start.hx, 1.0e-3);
    EXPECT_NEAR(end.hy, start.hy, 1.0e-3);
    EXPECT_NEAR(normalizeAngle(end.getLM(), start.getLM()), start.getLM(), 1.0e-3);
}

TEST_F(PropagatorTest, MolniyaStaysOnItsOrbit) {
    Propagator propagator(molniya);
    for (int day = 0; day <= 10; ++day) {
        const KeplerianElements kep = toKeplerian(propagator.propagate(day * SECONDS_PER_DAY));
        EXPECT_NEAR(kep.a, 26560.0e3, 300.0e3) << "day " << day;
        EXPECT_NEAR(kep.e, molniya.getE(), 0.01) << "day " << day;
    }
}

TEST_F(PropagatorTest, TimePointMatchesSeconds) {
    Propagator propagator(iss);
    const auto time = iss.getEpoch() + std::chrono::minutes(45);
    PV byTime = propagator.propagate(time);
    PV bySeconds = propagator.propagate(2700.0);
    EXPECT_NEAR(distance(byTime.position, bySeconds.position), 0.0, 1e-6);
    EXPECT_NEAR(secondsSinceEpoch(iss, time), 2700.0, 1e-9);
}

TEST_F(PropagatorTest, BackwardPropagation) {
    Propagator propagator(iss);
    PV pv = propagator.propagate(-3600.0);
    EXPECT_NEAR(pv.position.magnitude(), 6720.0e3, 100.0e3);
    EXPECT_NEAR(pv.velocity.magnitude(), 7700.0, 200.0);
}

TEST_F(PropagatorTest, OriginalMeanMotion) {
    Propagator propagator(iss);
    // Brouwer mean motion is close to the Kozai value
    EXPECT_NEAR(propagator.getOriginalMeanMotion(), iss.getMeanMotion() * 60.0, 1e-3 * iss.getMeanMotion() * 60.0);
    EXPECT_GT(propagator.getOriginalSemiMajorAxis(), 1.0);
}

TEST_F(PropagatorTest, DecayedSatelliteThrows) {
    Propagator propagator(iss.withBStar(0.05));
    bool decayed = false;
    for (int day = 1; day <= 365 && !decayed; ++day) {
        try {
            propagator.propagate(day * SECONDS_PER_DAY);
        } catch (const SatelliteDecayedException &err) {
            EXPECT_GT(err.getMinutesFromEpoch(), 0.0);
            decayed = true;
        }
    }
    EXPECT_TRUE(decayed);
}

TEST_F(PropagatorTest, NoStateLongAfterDecay) {
    Propagator propagator(iss.withBStar(0.05));
    TlePropagator<TleGradient> gradientPropagator(iss.withBStar(0.05));
    // The drag polynomial changes sign here and the semi-major axis would grow again
    for (const double day : {12.0, 30.0, 365.0, 20000.0}) {
        EXPECT_THROW(propagator.propagate(day * SECONDS_PER_DAY), SatelliteDecayedException) << "day " << day;
        EXPECT_THROW(gradientPropagator.propagate(day * SECONDS_PER_DAY), SatelliteDecayedException) << "day " << day;
    }
}

TEST_F(PropagatorTest, PerigeeInsideEarthThrows) {
    Tle low = iss.withElements(iss.getEpoch(), iss.getMeanMotion(), 0.2, iss.getI(),
                               iss.getPerigeeArgument(), iss.getRaan(), iss.getMeanAnomaly(),
                               iss.getRevolutionNumberAtEpoch());
    EXPECT_THROW(Propagator{low}, InvalidOrbitException);
}

TEST_F(PropagatorTest, ConcurrentPropagation) {
    const Propagator propagator(gps);
    constexpr int THREADS = 4;
    constexpr int STEPS = 50;

    std::vector<PV> expected;
    for (int k = 0; k < STEPS; ++k) {
        expected.push_back(propagator.propagate(k * 600.0));
    }

    std::vector<std::vector<PV>> results(THREADS);
    std::vector<std::thread> workers;
    for (int t = 0; t < THREADS; ++t) {
        workers.emplace_back([&propagator, &results, t]() {
            for (int k = STEPS - 1; k >= 0; --k) {
                results[t].push_back(propagator.propagate(k * 600.0));
            }
        });
    }
    for (auto &worker : workers) {
        worker.join();
    }

    for (int t = 0; t < THREADS; ++t) {
        ASSERT_EQ(results[t].size(), static_cast<size_t>(STEPS));
        for (int k = 0; k < STEPS; ++k) {
            const PV &pv = results[t][STEPS - 1 - k];
            EXPECT_EQ(pv.position.x, expected[k].position.x);
            EXPECT_EQ(pv.velocity.z, expected[k].velocity.z);
        }
    }
}

TEST_F(PropagatorTest, GradientMatchesDoubleValues) {
    TlePropagator<TleGradient> gradientPropagator(gps);
    Propagator propagator(gps);
    PV expected = propagator.propagate(7200.0);
    PV actual = toPV(gradientPropagator.propagate(7200.0));
    EXPECT_NEAR(distance(actual.position, expected.position), 0.0, 1e-6);
    EXPECT_NEAR(distance(actual.velocity, expected.velocity), 0.0, 1e-9);
}

} // namespace
} // namespace tlekit
