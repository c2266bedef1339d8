/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE GridTerritoryAuthorityTests
#include <boost/test/unit_test.hpp>

#include "world/GridTerritoryAuthority.hpp"
#include <stdexcept>

using namespace HiveEngine;

struct AuthorityFixture {
    GridTerritoryAuthority authority{100.0f, 3};
};

// ============================================================================
// TERRITORY GRID
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(TerritoryGridTests, AuthorityFixture)

BOOST_AUTO_TEST_CASE(RejectsInvalidConstruction) {
    BOOST_CHECK_THROW(GridTerritoryAuthority(0.0f), std::invalid_argument);
    BOOST_CHECK_THROW(GridTerritoryAuthority(100.0f, 0), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(AssignsSequentialIdsAndCenters) {
    Territory &home = authority.addTerritory(0, 0);
    Territory &east = authority.addTerritory(1, 0);
    Territory &north = authority.addTerritory(0, -2);

    BOOST_CHECK_EQUAL(home.id, 1u);
    BOOST_CHECK_EQUAL(east.id, 2u);
    BOOST_CHECK_EQUAL(north.id, 3u);
    BOOST_CHECK_CLOSE(east.center.getX(), 100.0f, 0.01f);
    BOOST_CHECK_CLOSE(north.center.getZ(), -200.0f, 0.01f);
    BOOST_CHECK_EQUAL(home.status, ControlStatus::Contested);
    BOOST_CHECK_EQUAL(authority.getTerritoryCount(), 3u);
}

BOOST_AUTO_TEST_CASE(AddingExistingCellReturnsSameTerritory) {
    Territory &first = authority.addTerritory(2, 2);
    Territory &again = authority.addTerritory(2, 2);

    BOOST_CHECK_EQUAL(&first, &again);
    BOOST_CHECK_EQUAL(authority.getTerritoryCount(), 1u);
}

BOOST_AUTO_TEST_CASE(LooksUpTerritoryByPosition) {
    Territory &home = authority.addTerritory(0, 0);
    Territory &east = authority.addTerritory(1, 0);

    BOOST_CHECK_EQUAL(authority.getTerritoryAt(0.0f, 0.0f), &home);
    BOOST_CHECK_EQUAL(authority.getTerritoryAt(-50.0f, 49.0f), &home);
    BOOST_CHECK_EQUAL(authority.getTerritoryAt(50.0f, 0.0f), &east);
    BOOST_CHECK_EQUAL(authority.getTerritoryAt(140.0f, -20.0f), &east);
    BOOST_CHECK(authority.getTerritoryAt(0.0f, 75.0f) == nullptr);
    BOOST_CHECK(home.contains(10.0f, -10.0f));
    BOOST_CHECK(!home.contains(50.0f, 0.0f));
}

BOOST_AUTO_TEST_CASE(ListsAndFindsTerritories) {
    authority.addTerritory(0, 0);
    Territory &east = authority.addTerritory(1, 0);

    BOOST_CHECK_EQUAL(authority.getAllTerritories().size(), 2u);
    BOOST_CHECK_EQUAL(authority.getTerritory(east.id), &east);
    BOOST_CHECK(authority.getTerritory(99) == nullptr);
}

BOOST_AUTO_TEST_CASE(ClearResetsIds) {
    authority.addTerritory(0, 0);
    authority.createController(1);
    authority.clear();

    BOOST_CHECK_EQUAL(authority.getTerritoryCount(), 0u);
    BOOST_CHECK(authority.getControllers().empty());
    BOOST_CHECK_EQUAL(authority.addTerritory(5, 5).id, 1u);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// CONTROLLERS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(ControllerTests, AuthorityFixture)

BOOST_AUTO_TEST_CASE(CreatingControllerTakesTerritory) {
    Territory &home = authority.addTerritory(0, 0);
    Controller &controller = authority.createController(home.id);

    BOOST_CHECK_EQUAL(home.status, ControlStatus::ControllerOwned);
    BOOST_CHECK_EQUAL(home.controller, &controller);
    BOOST_CHECK_EQUAL(controller.getTerritoryId(), home.id);
    BOOST_CHECK(controller.isActive());
    BOOST_CHECK_EQUAL(authority.getController(controller.getId()), &controller);
    BOOST_CHECK_EQUAL(authority.getControllers().size(), 1u);
}

BOOST_AUTO_TEST_CASE(ControllerForUnknownTerritoryThrows) {
    BOOST_CHECK_THROW(authority.createController(42), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(RemovingControllerLiberatesTerritory) {
    Territory &home = authority.addTerritory(0, 0);
    authority.createController(home.id);

    BOOST_CHECK(authority.removeController(home.id));
    BOOST_CHECK_EQUAL(home.status, ControlStatus::Liberated);
    BOOST_CHECK(home.controller == nullptr);
    BOOST_CHECK(authority.getControllers().empty());
    BOOST_CHECK(!authority.removeController(home.id));
}

BOOST_AUTO_TEST_CASE(ControlledSetRespectsCapacity) {
    Territory &home = authority.addTerritory(0, 0);
    Controller &controller = authority.createController(home.id);

    BOOST_CHECK(controller.addControlledAgent(1));
    BOOST_CHECK(controller.addControlledAgent(2));
    BOOST_CHECK(controller.addControlledAgent(3));
    BOOST_CHECK(!controller.addControlledAgent(4));
    BOOST_CHECK_EQUAL(controller.getControlledCount(), 3u);
    BOOST_CHECK_EQUAL(home.agentCount, 3u);

    // Re-adding an existing agent is not a capacity failure
    BOOST_CHECK(controller.addControlledAgent(2));
}

BOOST_AUTO_TEST_CASE(RemovingAgentsUpdatesTerritoryCount) {
    Territory &home = authority.addTerritory(0, 0);
    Controller &controller = authority.createController(home.id);
    controller.addControlledAgent(1);
    controller.addControlledAgent(2);

    BOOST_CHECK(controller.removeControlledAgent(1));
    BOOST_CHECK(!controller.removeControlledAgent(1));
    BOOST_CHECK(!controller.controls(1));
    BOOST_CHECK(controller.controls(2));
    BOOST_CHECK_EQUAL(home.agentCount, 1u);

    controller.clearControlledAgents();
    BOOST_CHECK_EQUAL(home.agentCount, 0u);
}

BOOST_AUTO_TEST_CASE(InactiveControllerRefusesAgents) {
    Territory &home = authority.addTerritory(0, 0);
    Controller &controller = authority.createController(home.id);
    controller.setVulnerable(true);
    BOOST_CHECK(controller.isVulnerable());

    controller.setActive(false);
    BOOST_CHECK(!controller.addControlledAgent(1));
    BOOST_CHECK(!controller.isVulnerable());
}

BOOST_AUTO_TEST_SUITE_END()
