/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <groundtrack/propagator.hpp>

#include <chrono>
#include <cmath>

namespace groundtrack {
namespace {

using namespace std::chrono;

constexpr const char* ISS_LINE1 = "1 25544U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  9993";
constexpr const char* ISS_LINE2 = "2 25544  51.6312 206.3646 0003723 184.1118 175.9840 15.49193835540850";

constexpr const char* SAT00005_LINE1 = "1 00005U 58002B   00179.78495062  .00000023  00000-0  28098-4 0  4753";
constexpr const char* SAT00005_LINE2 = "2 00005  34.2682 348.7242 1859667 331.7664  19.3264 10.82419157413667";

constexpr const char* SAT04632_LINE1 = "1 04632U 70093B   04031.91070959 -.00000084  00000-0  10000-3 0  9955";
constexpr const char* SAT04632_LINE2 = "2 04632  11.4628 273.1101 1450506 207.6000 143.9350  1.20231981 44145";

// Mean motion of 17.5 revolutions per day: the orbit is inside the Earth
constexpr const char* DECAYED_LINE1 = "1 99999U 25001A   25333.50000000  .00000000  00000+0  00000-0 0  9993";
constexpr const char* DECAYED_LINE2 = "2 99999  51.6000 100.0000 0001000   0.0000   0.0000 17.50000000    15";

class PropagatorTest : public ::testing::Test {
protected:
    ElementRecord iss = ElementRecord::parse(ISS_LINE1, ISS_LINE2);
    Propagator propagator{iss};
};

TEST_F(PropagatorTest, EpochMatchesRecord) {
    EXPECT_EQ(propagator.getEpoch(), iss.getEpoch());
}

TEST_F(PropagatorTest, ISSIsNearEarth) {
    EXPECT_FALSE(propagator.isDeepSpace());
}

TEST_F(PropagatorTest, ISSAltitudeAtEpoch) {
    auto sample = propagator.sample(iss.getEpoch());
    EXPECT_GT(sample.altInKilometers, 380.0);
    EXPECT_LT(sample.altInKilometers, 450.0);
}

TEST_F(PropagatorTest, LatitudeBoundedByInclination) {
    for (int minute = 0; minute <= 93; minute += 3) {
        auto sample = propagator.sample(iss.getEpoch() + minutes(minute));
        EXPECT_LE(std::fabs(sample.latInDegrees), 51.7);
        EXPECT_GE(sample.lonInDegrees, -180.0);
        EXPECT_LE(sample.lonInDegrees, 180.0);
    }
}

TEST_F(PropagatorTest, BeforeEpochIsAllowed) {
    auto state = propagator.propagate(iss.getEpoch() - hours(12));
    EXPECT_GT(state.position.magnitude(), 6700.0);
    EXPECT_LT(state.position.magnitude(), 6900.0);
}

TEST_F(PropagatorTest, PropagateIsDeterministic) {
    auto at = iss.getEpoch() + minutes(45);
    EXPECT_EQ(propagator.sample(at), propagator.sample(at));
}

TEST_F(PropagatorTest, OneShotMatchesPropagator) {
    auto at = iss.getEpoch() + minutes(17);
    auto expected = propagator.propagate(at);
    auto actual = propagate(iss, at);
    EXPECT_EQ(actual.position, expected.position);
    EXPECT_EQ(actual.velocity, expected.velocity);
}

TEST_F(PropagatorTest, OneOrbitReturnsNearStart) {
    // ISS period is 1440 / 15.49 = 92.95 minutes
    auto start = propagator.propagate(iss.getEpoch());
    auto later = propagator.propagate(iss.getEpoch() + duration_cast<microseconds>(duration<double, std::ratio<60>>(1440.0 / 15.49193835)));
    EXPECT_LT((later.position - start.position).magnitude(), 150.0);
}

TEST(PropagatorModelTest, VerificationVectorAt360Minutes) {
    auto record = ElementRecord::parse(SAT00005_LINE1, SAT00005_LINE2);
    auto state = propagate(record, record.getEpoch() + minutes(360));
    EXPECT_NEAR(state.position.x, -7154.03120202, 1e-3);
    EXPECT_NEAR(state.position.y, -3783.17682504, 1e-3);
    EXPECT_NEAR(state.position.z, -3536.19412294, 1e-3);
    EXPECT_NEAR(state.velocity.x, 4.741887409, 1e-6);
}

TEST(PropagatorModelTest, DeepSpaceSelected) {
    Propagator propagator(ElementRecord::parse(SAT04632_LINE1, SAT04632_LINE2));
    EXPECT_TRUE(propagator.isDeepSpace());
}

TEST(PropagatorModelTest, DecayedOrbitThrows) {
    auto record = ElementRecord::parse(DECAYED_LINE1, DECAYED_LINE2);
    EXPECT_THROW(Propagator{record}, SatelliteDecayed);
    EXPECT_THROW(propagate(record, record.getEpoch()), PropagationError);
}

} // namespace
} // namespace groundtrack
