/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE AgentRegistryTests
#include <boost/test/unit_test.hpp>

#include "managers/AgentRegistry.hpp"
#include "spatial/ChunkSpatialIndex.hpp"
#include "world/GridTerritoryAuthority.hpp"
#include <stdexcept>
#include <vector>

using namespace HiveEngine;

struct RegistryFixture {
    RegistryFixture() { registry.setSpatialIndex(&index); }

    // Runs agent updates with nothing to hunt
    void idle(ParasiteAgent &agent, float deltaTime, int ticks) {
        CandidateSet candidates;
        UnitLookup units;
        for (int i = 0; i < ticks; ++i) {
            agent.update(AgentUpdateContext{candidates, units, nullptr, deltaTime});
        }
    }

    AgentRegistry registry;
    ChunkSpatialIndex index;
};

// ============================================================================
// SPAWN AND REMOVE
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(SpawnTests, RegistryFixture)

BOOST_AUTO_TEST_CASE(RejectsInvalidConfig) {
    SimulationConfig config;
    config.scheduler.viewRadius = 0.0f;
    BOOST_CHECK_THROW(AgentRegistry{config}, std::invalid_argument);

    SimulationConfig badTuning;
    badTuning.tacticalAgent.speed = -1.0f;
    BOOST_CHECK_THROW(AgentRegistry{badTuning}, std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(SpawnAssignsIncreasingIds) {
    ParasiteAgent &first = registry.spawnAgent(AgentVariant::Basic, Vector3D(0.0f, 0.0f, 0.0f), 3);
    ParasiteAgent &second = registry.spawnAgent(AgentVariant::Tactical, Vector3D(5.0f, 0.0f, 5.0f));

    BOOST_CHECK_EQUAL(first.getId(), 1u);
    BOOST_CHECK_EQUAL(second.getId(), 2u);
    BOOST_CHECK_EQUAL(first.getTerritoryId(), 3u);
    BOOST_CHECK_EQUAL(second.getTerritoryId(), INVALID_TERRITORY);
    BOOST_CHECK_EQUAL(first.getState(), AgentState::Spawning);
    BOOST_CHECK_EQUAL(registry.getAgentCount(), 2u);
    BOOST_CHECK_EQUAL(registry.getCounters().spawned, 2u);
}

BOOST_AUTO_TEST_CASE(SpawnUsesVariantTuning) {
    ParasiteAgent &basic = registry.spawnAgent(AgentVariant::Basic, Vector3D());
    ParasiteAgent &tactical = registry.spawnAgent(AgentVariant::Tactical, Vector3D());

    BOOST_CHECK_EQUAL(basic.getMaxHealth(), 2);
    BOOST_CHECK_EQUAL(tactical.getMaxHealth(), 4);
    BOOST_CHECK_CLOSE(tactical.getTerritoryRadius(), 60.0f, 0.01f);
    BOOST_CHECK_EQUAL(registry.getCountByVariant(AgentVariant::Basic), 1u);
    BOOST_CHECK_EQUAL(registry.getCountByVariant(AgentVariant::Tactical), 1u);
    BOOST_CHECK_EQUAL(registry.getCountByVariant(AgentVariant::COUNT), 0u);
}

BOOST_AUTO_TEST_CASE(SpawnRegistersInSpatialIndex) {
    ParasiteAgent &agent = registry.spawnAgent(AgentVariant::Tactical, Vector3D(10.0f, 0.0f, 10.0f));
    BOOST_CHECK(index.contains(agent.getId(), SpatialTag::TacticalAgent));
    BOOST_CHECK(!index.contains(agent.getId(), SpatialTag::BasicAgent));
}

BOOST_AUTO_TEST_CASE(RemoveKeepsLookupConsistent) {
    registry.spawnAgent(AgentVariant::Basic, Vector3D());
    registry.spawnAgent(AgentVariant::Basic, Vector3D());
    registry.spawnAgent(AgentVariant::Tactical, Vector3D());

    BOOST_CHECK(registry.removeAgent(1));
    BOOST_CHECK(!registry.removeAgent(1));
    BOOST_CHECK(registry.getAgent(1) == nullptr);
    BOOST_CHECK(!index.contains(1, SpatialTag::BasicAgent));

    // The last agent was moved into the freed slot
    BOOST_REQUIRE(registry.getAgent(3) != nullptr);
    BOOST_CHECK_EQUAL(registry.getAgent(3)->getId(), 3u);
    BOOST_REQUIRE(registry.getAgent(2) != nullptr);
    BOOST_CHECK_EQUAL(registry.getAgentCount(), 2u);
    BOOST_CHECK_EQUAL(registry.getCounters().removed, 1u);
}

BOOST_AUTO_TEST_CASE(ForEachVisitsEveryAgent) {
    registry.spawnAgent(AgentVariant::Basic, Vector3D());
    registry.spawnAgent(AgentVariant::Tactical, Vector3D());
    registry.spawnAgent(AgentVariant::Basic, Vector3D());

    std::vector<AgentID> seen;
    const AgentRegistry &view = registry;
    view.forEachAgent([&](const ParasiteAgent &agent) { seen.push_back(agent.getId()); });
    BOOST_CHECK_EQUAL(seen.size(), 3u);
}

BOOST_AUTO_TEST_CASE(ClearEmptiesRegistryAndIndex) {
    registry.spawnAgent(AgentVariant::Basic, Vector3D());
    registry.spawnAgent(AgentVariant::Tactical, Vector3D());

    registry.clear();
    BOOST_CHECK(registry.empty());
    BOOST_CHECK_EQUAL(registry.getCountByVariant(AgentVariant::Tactical), 0u);
    BOOST_CHECK_EQUAL(index.getStats().entityCount, 0u);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// REAPING
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(ReapTests, RegistryFixture)

BOOST_AUTO_TEST_CASE(RemovePolicyDeletesDeadAgents) {
    registry.spawnAgent(AgentVariant::Basic, Vector3D());
    registry.spawnAgent(AgentVariant::Basic, Vector3D());
    registry.spawnAgent(AgentVariant::Tactical, Vector3D());

    registry.getAgent(1)->takeDamage(10);
    registry.getAgent(3)->takeDamage(10);
    BOOST_CHECK_EQUAL(registry.getAliveCount(), 1u);

    BOOST_CHECK_EQUAL(registry.reapDeadAgents(AgentRegistry::ReapPolicy::Remove), 2u);
    BOOST_CHECK_EQUAL(registry.getAgentCount(), 1u);
    BOOST_CHECK(registry.getAgent(2) != nullptr);
    BOOST_CHECK_EQUAL(registry.getCounters().destroyed, 2u);
    BOOST_CHECK_EQUAL(registry.getCounters().removed, 2u);
    BOOST_CHECK(!index.contains(3, SpatialTag::TacticalAgent));
}

BOOST_AUTO_TEST_CASE(RespawnPolicyRevivesAtHome) {
    const Vector3D home(30.0f, 0.0f, -30.0f);
    ParasiteAgent &agent = registry.spawnAgent(AgentVariant::Basic, home);
    agent.moveTowards(Vector3D(40.0f, 0.0f, -30.0f), 2.0f, 1.0f);
    agent.takeDamage(2);

    BOOST_CHECK_EQUAL(registry.reapDeadAgents(AgentRegistry::ReapPolicy::RespawnAtHome), 1u);
    BOOST_CHECK(agent.isAlive());
    BOOST_CHECK_EQUAL(agent.getHealth(), agent.getMaxHealth());
    BOOST_CHECK_CLOSE(agent.getPosition().getX(), 30.0f, 0.01f);
    BOOST_CHECK_EQUAL(registry.getAgentCount(), 1u);
    BOOST_CHECK_EQUAL(registry.getCounters().respawned, 1u);
}

BOOST_AUTO_TEST_CASE(StarvationIsCounted) {
    SimulationConfig config;
    config.basicAgent.maxLifetimeWithoutFeeding = 2.0f;
    AgentRegistry hungry(config);
    ParasiteAgent &agent = hungry.spawnAgent(AgentVariant::Basic, Vector3D());

    idle(agent, 1.0f, 3);
    BOOST_REQUIRE(agent.hasStarved());

    hungry.reapDeadAgents(AgentRegistry::ReapPolicy::Remove);
    BOOST_CHECK_EQUAL(hungry.getCounters().starved, 1u);
    BOOST_CHECK_EQUAL(hungry.getCounters().destroyed, 1u);
}

BOOST_AUTO_TEST_CASE(NothingToReap) {
    registry.spawnAgent(AgentVariant::Basic, Vector3D());
    BOOST_CHECK_EQUAL(registry.reapDeadAgents(AgentRegistry::ReapPolicy::Remove), 0u);
    BOOST_CHECK_EQUAL(registry.getAgentCount(), 1u);
}

BOOST_AUTO_TEST_CASE(DestroysOnlyAgentsInsideTerritory) {
    GridTerritoryAuthority authority(100.0f);
    Territory &home = authority.addTerritory(0, 0);
    authority.addTerritory(1, 0);

    registry.spawnAgent(AgentVariant::Basic, Vector3D(10.0f, 0.0f, 10.0f), home.id);
    registry.spawnAgent(AgentVariant::Tactical, Vector3D(-20.0f, 0.0f, 0.0f), home.id);
    registry.spawnAgent(AgentVariant::Basic, Vector3D(110.0f, 0.0f, 0.0f));

    BOOST_CHECK_EQUAL(registry.destroyAgentsInTerritory(authority, home.id), 2u);
    BOOST_CHECK(!registry.getAgent(1)->isAlive());
    BOOST_CHECK(!registry.getAgent(2)->isAlive());
    BOOST_CHECK(registry.getAgent(3)->isAlive());

    // Already dead agents are not counted twice
    BOOST_CHECK_EQUAL(registry.destroyAgentsInTerritory(authority, home.id), 0u);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// SPAWN MIX
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(SpawnVariantTests, RegistryFixture)

BOOST_AUTO_TEST_CASE(RollBelowShareIsTactical) {
    BOOST_CHECK_EQUAL(registry.selectSpawnVariant(0.0f), AgentVariant::Tactical);
    BOOST_CHECK_EQUAL(registry.selectSpawnVariant(0.2f), AgentVariant::Tactical);
    BOOST_CHECK_EQUAL(registry.selectSpawnVariant(0.3f), AgentVariant::Basic);
    BOOST_CHECK_EQUAL(registry.selectSpawnVariant(0.99f), AgentVariant::Basic);
}

BOOST_AUTO_TEST_CASE(AdjustmentIsBounded) {
    // +0.5 is clamped to +0.1, giving a 0.35 share
    BOOST_CHECK_EQUAL(registry.selectSpawnVariant(0.3f, 0.5f), AgentVariant::Tactical);
    BOOST_CHECK_EQUAL(registry.selectSpawnVariant(0.4f, 0.5f), AgentVariant::Basic);
    BOOST_CHECK_EQUAL(registry.selectSpawnVariant(0.2f, -0.5f), AgentVariant::Basic);
}

BOOST_AUTO_TEST_SUITE_END()
