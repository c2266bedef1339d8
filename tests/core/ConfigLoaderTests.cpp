/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE ConfigLoaderTests
#include <boost/test/unit_test.hpp>

#include "core/ConfigLoader.hpp"
#include <cmath>
#include <string>

using namespace HiveEngine;

constexpr float EPSILON = 0.001f;

bool approxEqual(float a, float b, float epsilon = EPSILON) {
    return std::abs(a - b) < epsilon;
}

struct ConfigFixture {
    SimulationConfig config;
};

// ============================================================================
// MERGING
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(ConfigMergeTests, ConfigFixture)

BOOST_AUTO_TEST_CASE(ShippedConfigLoads) {
    const std::string path = std::string(HIVE_SOURCE_DIR) + "/res/hive_config.json";
    BOOST_REQUIRE(ConfigLoader::loadFromFile(path, config));

    BOOST_CHECK_EQUAL(config.basicAgent.maxHealth, 2);
    BOOST_CHECK_EQUAL(config.tacticalAgent.maxHealth, 4);
    BOOST_CHECK(approxEqual(config.tacticalAgent.territoryRadius, 60.0f));
    BOOST_CHECK(approxEqual(config.scheduler.viewRadius, 192.0f));
    BOOST_CHECK(approxEqual(config.control.territorySize, 1024.0f));
}

BOOST_AUTO_TEST_CASE(PresentKeysOverrideOthersKeepValues) {
    const std::string json = R"({
        "basic_agent": {"speed": 3.5, "drain_rate": 4},
        "governor": {"initial_cap": 12},
        "control": {"auto_correct": false},
        "simulation": {"tactical_spawn_share": 0.5}
    })";
    BOOST_REQUIRE(ConfigLoader::loadFromString(json, config));

    BOOST_CHECK(approxEqual(config.basicAgent.speed, 3.5f));
    BOOST_CHECK(approxEqual(config.basicAgent.drainRate, 4.0f));
    BOOST_CHECK_EQUAL(config.basicAgent.maxHealth, 2);
    BOOST_CHECK(approxEqual(config.tacticalAgent.speed, 2.5f));
    BOOST_CHECK_EQUAL(config.governor.initialCap, 12);
    BOOST_CHECK(!config.control.autoCorrect);
    BOOST_CHECK(approxEqual(config.tacticalSpawnShare, 0.5f));
}

BOOST_AUTO_TEST_CASE(WrongTypesAreSkipped) {
    const std::string json =
        R"({"basic_agent": {"speed": "fast", "max_health": 5}, "control": {"auto_correct": 1}})";
    BOOST_REQUIRE(ConfigLoader::loadFromString(json, config));

    BOOST_CHECK(approxEqual(config.basicAgent.speed, 2.0f));
    BOOST_CHECK_EQUAL(config.basicAgent.maxHealth, 5);
    BOOST_CHECK(config.control.autoCorrect);
}

BOOST_AUTO_TEST_CASE(OutOfRangeIntegersAreSkipped) {
    const std::string json = R"({
        "basic_agent": {"max_health": 1e20, "speed": 3.0},
        "tactical_agent": {"reward": -1e12},
        "governor": {"initial_cap": 12}
    })";
    BOOST_REQUIRE(ConfigLoader::loadFromString(json, config));

    BOOST_CHECK_EQUAL(config.basicAgent.maxHealth, 2);
    BOOST_CHECK_EQUAL(config.tacticalAgent.reward, 4);
    BOOST_CHECK(approxEqual(config.basicAgent.speed, 3.0f));
    BOOST_CHECK_EQUAL(config.governor.initialCap, 12);
}

BOOST_AUTO_TEST_CASE(UnknownAndNonObjectSectionsAreSkipped) {
    BOOST_REQUIRE(ConfigLoader::loadFromString(
        R"({"mystery": {"speed": 9}, "scheduler": 5, "governor": {"unknown_key": 1}})", config));
    BOOST_CHECK(approxEqual(config.scheduler.viewRadius, 192.0f));
    BOOST_CHECK(approxEqual(config.basicAgent.speed, 2.0f));
}

BOOST_AUTO_TEST_CASE(EmptyObjectKeepsEverything) {
    BOOST_REQUIRE(ConfigLoader::loadFromString("{}", config));
    BOOST_CHECK(approxEqual(config.governor.checkInterval, 1.0f));
    BOOST_CHECK_EQUAL(config.control.maxControlledPerController, 100);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// REJECTION
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(ConfigRejectionTests, ConfigFixture)

BOOST_AUTO_TEST_CASE(InvalidValueLeavesConfigUntouched) {
    const std::string json =
        R"({"basic_agent": {"speed": 4.0}, "scheduler": {"view_radius": 0}})";
    BOOST_CHECK(!ConfigLoader::loadFromString(json, config));

    BOOST_CHECK(approxEqual(config.scheduler.viewRadius, 192.0f));
    BOOST_CHECK(approxEqual(config.basicAgent.speed, 2.0f));
}

BOOST_AUTO_TEST_CASE(RejectsCrossFieldViolations) {
    BOOST_CHECK(!ConfigLoader::loadFromString(
        R"({"governor": {"aggressive_fps": 60, "basic_fps": 55}})", config));
    BOOST_CHECK(!ConfigLoader::loadFromString(
        R"({"basic_agent": {"engagement_distance": 8, "disengage_distance": 5}})", config));
    BOOST_CHECK(!ConfigLoader::loadFromString(
        R"({"simulation": {"tactical_spawn_share": 1.5}})", config));
    BOOST_CHECK(!ConfigLoader::loadFromString(
        R"({"governor": {"initial_cap": 50}})", config));

    BOOST_CHECK(approxEqual(config.governor.aggressiveFps, 45.0f));
    BOOST_CHECK_EQUAL(config.governor.initialCap, 10);
}

BOOST_AUTO_TEST_CASE(RejectsMalformedDocuments) {
    BOOST_CHECK(!ConfigLoader::loadFromString(R"({"basic_agent": {"speed": })", config));
    BOOST_CHECK(!ConfigLoader::loadFromString("[1, 2]", config));
    BOOST_CHECK(!ConfigLoader::loadFromString("", config));
}

BOOST_AUTO_TEST_CASE(RejectsMissingFile) {
    BOOST_CHECK(!ConfigLoader::loadFromFile("no/such/hive_config.json", config));
    BOOST_CHECK(approxEqual(config.basicAgent.speed, 2.0f));
}

BOOST_AUTO_TEST_SUITE_END()
