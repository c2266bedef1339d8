/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE SwarmSimulationTests
#include <boost/test/unit_test.hpp>

#include "managers/SwarmSimulation.hpp"
#include "mocks/MockUnits.hpp"
#include "spatial/ChunkSpatialIndex.hpp"
#include "world/GridTerritoryAuthority.hpp"
#include <memory>
#include <vector>

using namespace HiveEngine;

// Two 200-unit territories, the western one controlled
class SwarmFixture {
public:
    SwarmFixture()
        : authority(200.0f),
          west(authority.addTerritory(0, 0)),
          east(authority.addTerritory(1, 0)),
          controller(authority.createController(west.id)) {
        simulation = std::make_unique<SwarmSimulation>(config, authority);
        simulation->setViewpointProvider(&viewpoint);
    }

    void step(float deltaTime, int count = 1) {
        for (int i = 0; i < count; ++i) {
            simulation->update(deltaTime, workers, protectors);
        }
    }

    SimulationConfig config;
    GridTerritoryAuthority authority;
    Territory &west;
    Territory &east;
    Controller &controller;
    MockViewpoint viewpoint;
    std::unique_ptr<SwarmSimulation> simulation;
    std::vector<IWorkerUnit *> workers;
    std::vector<IProtectorUnit *> protectors;
};

// ============================================================================
// SPAWNING AND TICKING
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(SimulationTickTests, SwarmFixture)

BOOST_AUTO_TEST_CASE(SpawnAssignsTerritoryAndController) {
    ParasiteAgent &home = simulation->spawnAgent(AgentVariant::Basic, Vector3D(10.0f, 0.0f, 10.0f));
    ParasiteAgent &away = simulation->spawnAgent(AgentVariant::Tactical, Vector3D(210.0f, 0.0f, 0.0f));
    ParasiteAgent &lost = simulation->spawnAgent(AgentVariant::Basic, Vector3D(0.0f, 0.0f, 900.0f));

    BOOST_CHECK_EQUAL(home.getTerritoryId(), west.id);
    BOOST_CHECK_EQUAL(away.getTerritoryId(), east.id);
    BOOST_CHECK_EQUAL(lost.getTerritoryId(), INVALID_TERRITORY);
    BOOST_CHECK(controller.controls(home.getId()));
    BOOST_CHECK_EQUAL(controller.getControlledCount(), 1u);
}

BOOST_AUTO_TEST_CASE(UpdateAdvancesAgents) {
    ParasiteAgent &agent = simulation->spawnAgent(AgentVariant::Basic, Vector3D());

    step(0.5f, 3);
    BOOST_CHECK_CLOSE(simulation->getSimTime(), 1.5f, 0.01f);
    BOOST_CHECK_CLOSE(agent.getSimTime(), 1.5f, 0.01f);
    BOOST_CHECK_EQUAL(agent.getState(), AgentState::Patrolling);
}

BOOST_AUTO_TEST_CASE(NegativeDeltaIsIgnored) {
    ParasiteAgent &agent = simulation->spawnAgent(AgentVariant::Basic, Vector3D());

    step(-1.0f);
    BOOST_CHECK_EQUAL(simulation->getSimTime(), 0.0f);
    BOOST_CHECK_EQUAL(agent.getSimTime(), 0.0f);
}

BOOST_AUTO_TEST_CASE(AgentsFeedOnWorkersEndToEnd) {
    ChunkSpatialIndex index;
    simulation->setSpatialIndex(&index);
    simulation->spawnAgent(AgentVariant::Basic, Vector3D());
    MockWorker worker(1, Vector3D(6.0f, 0.0f, 0.0f));
    workers.push_back(&worker);

    step(0.25f, 40);
    BOOST_CHECK_GT(worker.totalDrained, 0.0f);
    BOOST_CHECK(index.contains(1, SpatialTag::Worker));
}

BOOST_AUTO_TEST_CASE(SpatialIndexPicksUpExistingAgents) {
    simulation->spawnAgent(AgentVariant::Basic, Vector3D());
    simulation->spawnAgent(AgentVariant::Tactical, Vector3D(50.0f, 0.0f, 0.0f));

    ChunkSpatialIndex index;
    simulation->setSpatialIndex(&index);
    BOOST_CHECK(index.contains(1, SpatialTag::BasicAgent));
    BOOST_CHECK(index.contains(2, SpatialTag::TacticalAgent));

    const SimulationSnapshot snapshot = simulation->collectStatistics();
    BOOST_REQUIRE(snapshot.spatial.has_value());
    BOOST_CHECK_EQUAL(snapshot.spatial->entityCount, 2u);
    BOOST_CHECK_EQUAL(snapshot.controlledAgents, 1u);
}

BOOST_AUTO_TEST_CASE(DepartedUnitsLeaveSpatialIndex) {
    ChunkSpatialIndex index;
    simulation->setSpatialIndex(&index);

    for (UnitID id = 100; id < 150; ++id) {
        MockWorker shortLived(id, Vector3D(static_cast<float>(id), 0.0f, 0.0f));
        workers.assign(1, &shortLived);
        step(0.1f);
        BOOST_CHECK_EQUAL(index.getStats().entityCount, 1u);
    }
    BOOST_CHECK(index.contains(149, SpatialTag::Worker));
    BOOST_CHECK(!index.contains(148, SpatialTag::Worker));

    MockProtector protector(1, Vector3D(5.0f, 0.0f, 0.0f));
    workers.clear();
    protectors.push_back(&protector);
    step(0.1f);
    BOOST_CHECK_EQUAL(index.getStats().entityCount, 1u);
    BOOST_CHECK(index.contains(1, SpatialTag::Protector));

    protectors.clear();
    step(0.1f);
    BOOST_CHECK_EQUAL(index.getStats().entityCount, 0u);
}

BOOST_AUTO_TEST_CASE(SwitchingIndexReleasesSyncedUnits) {
    ChunkSpatialIndex first;
    ChunkSpatialIndex second;
    MockWorker worker(1, Vector3D());
    workers.push_back(&worker);

    simulation->setSpatialIndex(&first);
    step(0.1f);
    BOOST_CHECK(first.contains(1, SpatialTag::Worker));

    simulation->setSpatialIndex(&second);
    BOOST_CHECK(!first.contains(1, SpatialTag::Worker));
    step(0.1f);
    BOOST_CHECK(second.contains(1, SpatialTag::Worker));
}

BOOST_AUTO_TEST_CASE(GovernorReactsToFrameRate) {
    MockFrameRate frameRate(30.0f);
    simulation->setFrameRateSource(&frameRate);
    for (int i = 0; i < 10; ++i) {
        simulation->spawnAgent(AgentVariant::Basic, Vector3D(static_cast<float>(i), 0.0f, 0.0f));
    }

    step(0.5f, 2);
    BOOST_CHECK_EQUAL(simulation->getGovernor().getOptimizationLevel(), 2);
    BOOST_CHECK_EQUAL(simulation->collectStatistics().optimizationLevel, 2);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// TERRITORY CONTROL
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(SimulationControlTests, SwarmFixture)

BOOST_AUTO_TEST_CASE(PeriodicReconcileRepairsControl) {
    ParasiteAgent &agent = simulation->spawnAgent(AgentVariant::Basic, Vector3D());
    controller.removeControlledAgent(agent.getId());

    step(1.0f, 5);
    BOOST_CHECK_EQUAL(simulation->getLastReport().unattributed.size(), 1u);
    BOOST_CHECK(controller.controls(agent.getId()));
    BOOST_CHECK(simulation->reconcileNow().isConsistent());
}

BOOST_AUTO_TEST_CASE(ReconcileWithoutAutoCorrectOnlyReports) {
    config.control.autoCorrect = false;
    SwarmSimulation reportOnly(config, authority);
    ParasiteAgent &agent = reportOnly.spawnAgent(AgentVariant::Basic, Vector3D());
    controller.removeControlledAgent(agent.getId());

    BOOST_CHECK(!reportOnly.reconcileNow().isConsistent());
    BOOST_CHECK(!controller.controls(agent.getId()));
}

BOOST_AUTO_TEST_CASE(ControllerDestructionLiberatesTerritory) {
    simulation->spawnAgent(AgentVariant::Basic, Vector3D(10.0f, 0.0f, 0.0f));
    simulation->spawnAgent(AgentVariant::Tactical, Vector3D(-30.0f, 0.0f, 20.0f));
    simulation->spawnAgent(AgentVariant::Basic, Vector3D(200.0f, 0.0f, 0.0f));

    BOOST_CHECK_EQUAL(simulation->onControllerDestroyed(west.id), 2u);
    BOOST_CHECK_EQUAL(west.status, ControlStatus::Liberated);
    BOOST_CHECK(!controller.isActive());
    BOOST_CHECK_EQUAL(controller.getControlledCount(), 0u);
    BOOST_CHECK(!simulation->getReconciler().shouldSpawnInTerritory(west.id));

    // Default policy removes the dead on the next tick
    step(0.1f);
    BOOST_CHECK_EQUAL(simulation->getRegistry().getAgentCount(), 1u);
    BOOST_CHECK_EQUAL(simulation->getRegistry().getCounters().removed, 2u);
}

BOOST_AUTO_TEST_CASE(UnknownTerritoryDestroysNothing) {
    simulation->spawnAgent(AgentVariant::Basic, Vector3D());
    BOOST_CHECK_EQUAL(simulation->onControllerDestroyed(99), 0u);
    BOOST_CHECK_EQUAL(simulation->getRegistry().getAliveCount(), 1u);
}

BOOST_AUTO_TEST_CASE(RespawnPolicyBringsAgentsBack) {
    simulation->setReapPolicy(AgentRegistry::ReapPolicy::RespawnAtHome);
    ParasiteAgent &agent = simulation->spawnAgent(AgentVariant::Basic, Vector3D(10.0f, 0.0f, 0.0f));
    agent.takeDamage(5);

    step(0.1f);
    BOOST_CHECK(agent.isAlive());
    BOOST_CHECK_EQUAL(simulation->getRegistry().getCounters().respawned, 1u);
}

BOOST_AUTO_TEST_SUITE_END()
