/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE FrameClockTests
#include <boost/test/unit_test.hpp>

#include "core/FrameClock.hpp"
#include <cmath>
#include <stdexcept>

using namespace HiveEngine;

constexpr float EPSILON = 0.001f;

bool approxEqual(float a, float b, float epsilon = EPSILON) {
    return std::abs(a - b) < epsilon;
}

BOOST_AUTO_TEST_SUITE(FrameRateTests)

BOOST_AUTO_TEST_CASE(RejectsNonPositiveSettings) {
    BOOST_CHECK_THROW(FrameClock(0.0f), std::invalid_argument);
    BOOST_CHECK_THROW(FrameClock(60.0f, 0.0f), std::invalid_argument);
    BOOST_CHECK_THROW(FrameClock(-30.0f, 0.01f), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(StartsWithoutMeasurement) {
    FrameClock clock(60.0f, 0.02f);
    BOOST_CHECK_EQUAL(clock.getCurrentFPS(), 0.0f);
    BOOST_CHECK_EQUAL(clock.getFrameCount(), 0u);
    BOOST_CHECK(approxEqual(clock.getUpdateDeltaTime(), 0.02f));
    BOOST_CHECK(!clock.shouldUpdate());
}

BOOST_AUTO_TEST_CASE(FirstSampleSetsRateDirectly) {
    FrameClock clock;
    clock.recordFrameDuration(1.0 / 30.0);
    BOOST_CHECK(approxEqual(clock.getCurrentFPS(), 30.0f));
    BOOST_CHECK_CLOSE(clock.getLastFrameSeconds(), 1.0 / 30.0, 0.001);
}

BOOST_AUTO_TEST_CASE(LaterSamplesAreSmoothed) {
    FrameClock clock;
    clock.recordFrameDuration(1.0 / 30.0);
    clock.recordFrameDuration(1.0 / 60.0);
    BOOST_CHECK(approxEqual(clock.getCurrentFPS(), 30.9f, 0.01f));

    for (int i = 0; i < 500; ++i) {
        clock.recordFrameDuration(1.0 / 60.0);
    }
    BOOST_CHECK(approxEqual(clock.getCurrentFPS(), 60.0f, 0.01f));
}

BOOST_AUTO_TEST_CASE(NonPositiveDurationsAreIgnored) {
    FrameClock clock;
    clock.recordFrameDuration(0.02);
    clock.recordFrameDuration(0.0);
    clock.recordFrameDuration(-1.0);
    BOOST_CHECK(approxEqual(clock.getCurrentFPS(), 50.0f));
    BOOST_CHECK_CLOSE(clock.getLastFrameSeconds(), 0.02, 0.001);
}

BOOST_AUTO_TEST_CASE(InstantRateIsClamped) {
    FrameClock fast;
    fast.recordFrameDuration(1e-6);
    BOOST_CHECK(approxEqual(fast.getCurrentFPS(), 1000.0f));

    FrameClock slow;
    slow.recordFrameDuration(100.0);
    BOOST_CHECK(approxEqual(slow.getCurrentFPS(), 0.1f));
}

BOOST_AUTO_TEST_CASE(ReadableThroughFrameRateSource) {
    FrameClock clock;
    clock.recordFrameDuration(0.025);
    const IFrameRateSource &source = clock;
    BOOST_CHECK(approxEqual(source.getCurrentFPS(), 40.0f));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// CONTROL
// ============================================================================

BOOST_AUTO_TEST_SUITE(FrameControlTests)

BOOST_AUTO_TEST_CASE(TargetFpsIgnoresNonPositive) {
    FrameClock clock(60.0f);
    clock.setTargetFPS(30.0f);
    BOOST_CHECK(approxEqual(clock.getTargetFPS(), 30.0f));
    clock.setTargetFPS(0.0f);
    clock.setTargetFPS(-5.0f);
    BOOST_CHECK(approxEqual(clock.getTargetFPS(), 30.0f));
}

BOOST_AUTO_TEST_CASE(FirstFrameAccumulatesNothing) {
    FrameClock clock;
    clock.startFrame();
    BOOST_CHECK_EQUAL(clock.getFrameCount(), 1u);
    BOOST_CHECK(!clock.shouldUpdate());
    BOOST_CHECK_EQUAL(clock.getCurrentFPS(), 0.0f);
}

BOOST_AUTO_TEST_CASE(ResetClearsMeasurements) {
    FrameClock clock;
    clock.startFrame();
    clock.recordFrameDuration(0.02);

    clock.reset();
    BOOST_CHECK_EQUAL(clock.getCurrentFPS(), 0.0f);
    BOOST_CHECK_EQUAL(clock.getFrameCount(), 0u);
    BOOST_CHECK_EQUAL(clock.getLastFrameSeconds(), 0.0);
    BOOST_CHECK(!clock.shouldUpdate());
}

BOOST_AUTO_TEST_SUITE_END()
