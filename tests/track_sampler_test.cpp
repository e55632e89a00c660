/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <groundtrack/propagator.hpp>
#include <groundtrack/track_sampler.hpp>

#include <algorithm>
#include <chrono>
#include <limits>
#include <stdexcept>

namespace groundtrack {
namespace {

using namespace std::chrono;

constexpr const char* ISS_LINE1 = "1 25544U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  9993";
constexpr const char* ISS_LINE2 = "2 25544  51.6312 206.3646 0003723 184.1118 175.9840 15.49193835540850";

// Twelve hours later, with a different mean anomaly and node
constexpr const char* ISS_LATER_LINE1 = "1 25544U 98067A   25334.33453771  .00008010  00000+0  15237-3 0  9999";
constexpr const char* ISS_LATER_LINE2 = "2 25544  51.6312 204.0000 0003723 184.1118  10.0000 15.49193835540856";

// Eccentric orbit (e = 0.186) with a 133 minute period
constexpr const char* SAT00005_LINE1 = "1 00005U 58002B   00179.78495062  .00000023  00000-0  28098-4 0  4753";
constexpr const char* SAT00005_LINE2 = "2 00005  34.2682 348.7242 1859667 331.7664  19.3264 10.82419157413667";

constexpr const char* DECAYED_LINE1 = "1 99999U 25001A   25333.50000000  .00000000  00000+0  00000-0 0  9993";
constexpr const char* DECAYED_LINE2 = "2 99999  51.6000 100.0000 0001000   0.0000   0.0000 17.50000000    15";

class TrackSamplerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store.submit(25544, "ISS (ZARYA)", ISS_LINE1, ISS_LINE2);
        store.submit(5, "VANGUARD 1", SAT00005_LINE1, SAT00005_LINE2);
        store.submit(99999, "DECAYED", DECAYED_LINE1, DECAYED_LINE2);
    }

    void expectWellFormed(const std::vector<GeodeticSample> &samples, time_point start, time_point end, int points) {
        ASSERT_GE(samples.size(), 2);
        EXPECT_LE(samples.size(), static_cast<std::size_t>(points));
        EXPECT_EQ(samples.front().time, start);
        EXPECT_EQ(samples.back().time, end);
        for (std::size_t i = 1; i < samples.size(); ++i) {
            EXPECT_LT(samples[i - 1].time, samples[i].time);
        }
        for (const auto &sample : samples) {
            EXPECT_GE(sample.latInDegrees, -90.0);
            EXPECT_LE(sample.latInDegrees, 90.0);
            EXPECT_GE(sample.lonInDegrees, -180.0);
            EXPECT_LE(sample.lonInDegrees, 180.0);
            EXPECT_GE(sample.altInKilometers, 0.0);
        }
    }

    ElementStore store;
    TrackSampler sampler{store};
    time_point epoch = ElementRecord::parse(ISS_LINE1, ISS_LINE2).getEpoch();
    time_point epoch5 = ElementRecord::parse(SAT00005_LINE1, SAT00005_LINE2).getEpoch();
};

// ============================================================================
// Output Shape
// ============================================================================

TEST_F(TrackSamplerTest, WindowEndpointsAreSampledExactly) {
    auto start = epoch + minutes(5);
    auto end = start + minutes(90);
    auto samples = sampler.sample(25544, start, end, 180);
    expectWellFormed(samples, start, end, 180);
}

TEST_F(TrackSamplerTest, TwoPointsIsTheMinimum) {
    auto end = epoch + minutes(10);
    auto samples = sampler.sample(25544, epoch, end, 2);
    ASSERT_EQ(samples.size(), 2);
    EXPECT_EQ(samples.front().time, epoch);
    EXPECT_EQ(samples.back().time, end);
}

TEST_F(TrackSamplerTest, NeverExceedsTargetPointCount) {
    for (int points : {3, 7, 20, 64}) {
        auto samples = sampler.sample(5, epoch5, epoch5 + hours(6), points);
        expectWellFormed(samples, epoch5, epoch5 + hours(6), points);
    }
}

TEST_F(TrackSamplerTest, MaximumPointCountIsLimitedByClockResolution) {
    auto end = epoch + microseconds(1);
    auto samples = sampler.sample(25544, epoch, end, std::numeric_limits<int>::max());
    EXPECT_LE(samples.size(), 1001);
    expectWellFormed(samples, epoch, end, std::numeric_limits<int>::max());
}

TEST_F(TrackSamplerTest, MaximumPointCountStopsAtTimeBudget) {
    TrackSampler hurried(store, {.angularToleranceInDegrees = 0.5, .timeBudget = milliseconds(100)});
    EXPECT_THROW(hurried.sample(25544, epoch, epoch + minutes(90), std::numeric_limits<int>::max()),
                 PropagationDiverged);
}

TEST_F(TrackSamplerTest, LargeToleranceKeepsUniformGrid) {
    TrackSampler coarse(store, {.angularToleranceInDegrees = 45.0, .timeBudget = seconds(5)});
    auto samples = coarse.sample(25544, epoch, epoch + minutes(90), 20);
    EXPECT_EQ(samples.size(), 10);
}

TEST_F(TrackSamplerTest, Deterministic) {
    auto first = sampler.sample(5, epoch5, epoch5 + hours(3), 120);
    auto second = sampler.sample(5, epoch5, epoch5 + hours(3), 120);
    EXPECT_EQ(first, second);
}

TEST_F(TrackSamplerTest, SamplesMatchPropagator) {
    auto record = ElementRecord::parse(ISS_LINE1, ISS_LINE2);
    Propagator propagator(record);
    for (const auto &sample : sampler.sample(25544, epoch, epoch + minutes(45), 30)) {
        EXPECT_EQ(sample, propagator.sample(sample.time));
    }
}

// ============================================================================
// Adaptive Refinement
// ============================================================================

TEST_F(TrackSamplerTest, DenserNearPerigee) {
    auto start = epoch5 + minutes(30);
    auto end = start + minutes(133);
    auto samples = sampler.sample(5, start, end, 100);
    expectWellFormed(samples, start, end, 100);

    auto [lowest, highest] = std::minmax_element(samples.begin(), samples.end(),
        [](const GeodeticSample &a, const GeodeticSample &b) {
            return a.altInKilometers < b.altInKilometers;
        });
    auto countNear = [&](time_point t) {
        return std::count_if(samples.begin(), samples.end(), [&](const GeodeticSample &s) {
            return s.time >= t - minutes(10) && s.time <= t + minutes(10);
        });
    };

    EXPECT_GT(countNear(lowest->time), countNear(highest->time));
}

// ============================================================================
// Record Selection
// ============================================================================

TEST_F(TrackSamplerTest, EachSampleUsesRecordInEffect) {
    auto earlier = ElementRecord::parse(ISS_LINE1, ISS_LINE2);
    auto later = ElementRecord::parse(ISS_LATER_LINE1, ISS_LATER_LINE2);
    store.put(25544, later);

    Propagator earlierPropagator(earlier);
    Propagator laterPropagator(later);

    auto start = later.getEpoch() - hours(1);
    auto end = later.getEpoch() + hours(1);
    auto samples = sampler.sample(25544, start, end, 11);

    bool sawEarlier = false, sawLater = false;
    for (const auto &sample : samples) {
        if (sample.time < later.getEpoch()) {
            EXPECT_EQ(sample, earlierPropagator.sample(sample.time));
            sawEarlier = true;
        } else {
            EXPECT_EQ(sample, laterPropagator.sample(sample.time));
            sawLater = true;
        }
    }
    EXPECT_TRUE(sawEarlier);
    EXPECT_TRUE(sawLater);
}

TEST_F(TrackSamplerTest, WindowBeforeFirstEpochExtrapolates) {
    auto samples = sampler.sample(25544, epoch - hours(3), epoch - hours(2), 20);
    expectWellFormed(samples, epoch - hours(3), epoch - hours(2), 20);
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(TrackSamplerTest, EmptyWindow_Throws) {
    EXPECT_THROW(sampler.sample(25544, epoch, epoch, 10), std::invalid_argument);
    EXPECT_THROW(sampler.sample(25544, epoch, epoch - minutes(1), 10), std::invalid_argument);
}

TEST_F(TrackSamplerTest, TooFewPoints_Throws) {
    EXPECT_THROW(sampler.sample(25544, epoch, epoch + minutes(90), 1), std::invalid_argument);
}

TEST_F(TrackSamplerTest, UnknownObject_Throws) {
    EXPECT_THROW(sampler.sample(12345, epoch, epoch + minutes(90), 10), UnknownObject);
}

TEST_F(TrackSamplerTest, DecayedObject_Throws) {
    EXPECT_THROW(sampler.sample(99999, epoch, epoch + minutes(90), 10), SatelliteDecayed);
}

TEST_F(TrackSamplerTest, TimeBudgetExceeded_Throws) {
    TrackSampler hurried(store, {.angularToleranceInDegrees = 0.5, .timeBudget = milliseconds(-1)});
    EXPECT_THROW(hurried.sample(25544, epoch, epoch + minutes(90), 50), PropagationDiverged);
}

TEST_F(TrackSamplerTest, Options) {
    EXPECT_DOUBLE_EQ(sampler.getOptions().angularToleranceInDegrees, DEFAULT_ANGULAR_TOLERANCE_DEGREES);
    EXPECT_EQ(sampler.getOptions().timeBudget, DEFAULT_OBJECT_TIME_BUDGET);
}

} // namespace
} // namespace groundtrack
