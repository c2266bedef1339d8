/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TERRITORY_CONTROL_RECONCILER_HPP
#define TERRITORY_CONTROL_RECONCILER_HPP

/**
 * @file TerritoryControlReconciler.hpp
 * @brief Keeps controller membership consistent with where agents stand
 *
 * The rule: a living agent belongs to the controller of the territory it
 * occupies, if that controller is active, and to no other controller.
 *
 * validateConsistency() reports violations without changing anything.
 * recalculate() rebuilds every controller's set from scratch. Membership is
 * otherwise only changed by transferControl().
 */

#include "ai/AgentConfig.hpp"
#include "world/Territory.hpp"
#include <vector>

namespace HiveEngine {

class AgentRegistry;

/**
 * @brief Findings of one validation pass. Each agent appears in at most one list.
 */
struct ConsistencyReport {
    struct WrongControl {
        AgentID agent;
        ControllerID expected;   // Active controller of the territory the agent is in
        ControllerID actual;     // Controller holding the agent
    };

    struct DuplicateControl {
        AgentID agent;
        std::vector<ControllerID> controllers;
    };

    std::vector<AgentID> orphaned;               // Held by a controller but belongs to none
    std::vector<WrongControl> wronglyControlled;
    std::vector<DuplicateControl> duplicates;
    std::vector<AgentID> unattributed;           // Belongs to a non-full controller but held by none

    [[nodiscard]] bool isConsistent() const {
        return orphaned.empty() && wronglyControlled.empty() && duplicates.empty() &&
               unattributed.empty();
    }

    [[nodiscard]] size_t issueCount() const {
        return orphaned.size() + wronglyControlled.size() + duplicates.size() +
               unattributed.size();
    }
};

struct TerritorialStats {
    size_t territoryCount{0};
    size_t controlledTerritories{0};     // Territories with an active controller
    size_t contestedTerritories{0};
    size_t liberatedTerritories{0};
    size_t controlledAgents{0};          // Sum of all controller set sizes
    size_t uncontrolledAgents{0};        // Living agents held by no controller
};

class TerritoryControlReconciler {
public:
    /**
     * @param authority Territory source, must outlive the reconciler
     * @param config Spawn multiplier and related settings
     */
    explicit TerritoryControlReconciler(ITerritoryAuthority& authority,
                                        const ControlConfig& config = ControlConfig{});

    /**
     * @brief Compares controller sets against agent positions
     *
     * Dead agents and ids no longer in the registry that a controller still
     * holds are reported as orphaned.
     */
    [[nodiscard]] ConsistencyReport validateConsistency(const AgentRegistry& registry) const;

    /**
     * @brief Clears every controller and re-attributes each living agent
     *
     * Territories without an active controller get agentCount set to the
     * number of living agents inside them.
     * @return Number of agents attributed to a controller
     */
    size_t recalculate(const AgentRegistry& registry);

    /**
     * @brief Moves an agent to a controller, removing it from all others
     * @return false if the controller is unknown or refuses the agent, in
     * which case no controller's membership changes
     */
    bool transferControl(AgentID agentId, ControllerID toControllerId);

    [[nodiscard]] TerritorialStats getTerritorialStats(const AgentRegistry& registry) const;

    // False for liberated or unknown territories
    [[nodiscard]] bool shouldSpawnInTerritory(TerritoryID territoryId) const;

    // controlledSpawnRateMultiplier with an active controller, 1.0 otherwise
    [[nodiscard]] float getSpawnRateMultiplier(TerritoryID territoryId) const;

    // Living agents physically inside the territory
    [[nodiscard]] std::vector<AgentID> getAgentsInTerritory(const AgentRegistry& registry,
                                                            TerritoryID territoryId) const;

    [[nodiscard]] Controller* findController(ControllerID controllerId) const;
    [[nodiscard]] Territory* findTerritory(TerritoryID territoryId) const;

private:
    // Active controller owning the territory at the agent's position, if any
    Controller* expectedControllerAt(const Vector3D& position) const;

    ITerritoryAuthority& m_authority;
    ControlConfig m_config;
};

} // namespace HiveEngine

#endif // TERRITORY_CONTROL_RECONCILER_HPP
