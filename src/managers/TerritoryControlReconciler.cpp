/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/TerritoryControlReconciler.hpp"
#include "ai/ParasiteAgent.hpp"
#include "core/Logger.hpp"
#include "managers/AgentRegistry.hpp"
#include <boost/container/flat_map.hpp>
#include <boost/container/small_vector.hpp>
#include <format>

namespace HiveEngine {

TerritoryControlReconciler::TerritoryControlReconciler(ITerritoryAuthority& authority,
                                                       const ControlConfig& config)
    : m_authority(authority), m_config(config) {}

Controller* TerritoryControlReconciler::expectedControllerAt(const Vector3D& position) const {
    Territory* territory = m_authority.getTerritoryAt(position.getX(), position.getZ());
    if (!territory || !territory->controller || !territory->controller->isActive()) {
        return nullptr;
    }
    return territory->controller;
}

ConsistencyReport
TerritoryControlReconciler::validateConsistency(const AgentRegistry& registry) const {
    ConsistencyReport report;

    // agent -> every controller holding it, ordered by agent id
    boost::container::flat_map<AgentID, boost::container::small_vector<Controller*, 2>> holders;
    for (Territory* territory : m_authority.getAllTerritories()) {
        Controller* controller = territory->controller;
        if (!controller) {
            continue;
        }
        for (AgentID agentId : controller->getControlledAgents()) {
            holders[agentId].push_back(controller);
        }
    }

    for (const auto& [agentId, controllers] : holders) {
        if (controllers.size() > 1) {
            ConsistencyReport::DuplicateControl duplicate{agentId, {}};
            for (const Controller* controller : controllers) {
                duplicate.controllers.push_back(controller->getId());
            }
            report.duplicates.push_back(std::move(duplicate));
            continue;
        }

        const ParasiteAgent* agent = registry.getAgent(agentId);
        if (!agent || !agent->isAlive()) {
            report.orphaned.push_back(agentId);
            continue;
        }

        const Controller* expected = expectedControllerAt(agent->getPosition());
        if (!expected) {
            report.orphaned.push_back(agentId);
        } else if (expected != controllers.front()) {
            report.wronglyControlled.push_back(
                {agentId, expected->getId(), controllers.front()->getId()});
        }
    }

    registry.forEachAgent([&](const ParasiteAgent& agent) {
        if (!agent.isAlive() || holders.find(agent.getId()) != holders.end()) {
            return;
        }
        // Overflow beyond a full controller's capacity is expected, not a mismatch
        const Controller* expected = expectedControllerAt(agent.getPosition());
        if (expected && expected->getControlledCount() < expected->getMaxControlled()) {
            report.unattributed.push_back(agent.getId());
        }
    });

    return report;
}

size_t TerritoryControlReconciler::recalculate(const AgentRegistry& registry) {
    const std::vector<Territory*> territories = m_authority.getAllTerritories();
    for (Territory* territory : territories) {
        if (territory->controller) {
            territory->controller->clearControlledAgents();
        }
        territory->agentCount = 0;
    }

    size_t attributed = 0;
    registry.forEachAgent([&](const ParasiteAgent& agent) {
        if (!agent.isAlive()) {
            return;
        }
        const Vector3D& pos = agent.getPosition();
        Territory* territory = m_authority.getTerritoryAt(pos.getX(), pos.getZ());
        if (!territory) {
            return;
        }
        Controller* controller = territory->controller;
        if (controller && controller->isActive()) {
            if (controller->addControlledAgent(agent.getId())) {
                ++attributed;
            }
        } else {
            ++territory->agentCount;
        }
    });

    TERRITORY_DEBUG(std::format("Recalculated control: {} agents attributed across {} territories",
                                attributed, territories.size()));
    return attributed;
}

bool TerritoryControlReconciler::transferControl(AgentID agentId, ControllerID toControllerId) {
    Controller* target = findController(toControllerId);
    if (!target) {
        TERRITORY_WARN(std::format("transferControl: unknown controller {}", toControllerId));
        return false;
    }
    if (!target->isActive()) {
        TERRITORY_DEBUG(std::format("transferControl: controller {} inactive", toControllerId));
        return false;
    }

    // A refused transfer leaves the current holder untouched
    if (!target->addControlledAgent(agentId)) {
        return false;
    }
    for (Territory* territory : m_authority.getAllTerritories()) {
        Controller* controller = territory->controller;
        if (controller && controller != target) {
            controller->removeControlledAgent(agentId);
        }
    }
    return true;
}

TerritorialStats
TerritoryControlReconciler::getTerritorialStats(const AgentRegistry& registry) const {
    TerritorialStats stats;
    const std::vector<Territory*> territories = m_authority.getAllTerritories();
    stats.territoryCount = territories.size();

    for (const Territory* territory : territories) {
        switch (territory->status) {
        case ControlStatus::Liberated:
            ++stats.liberatedTerritories;
            break;
        case ControlStatus::Contested:
            ++stats.contestedTerritories;
            break;
        default:
            break;
        }
        if (territory->controller) {
            if (territory->controller->isActive()) {
                ++stats.controlledTerritories;
            }
            stats.controlledAgents += territory->controller->getControlledCount();
        }
    }

    registry.forEachAgent([&](const ParasiteAgent& agent) {
        if (!agent.isAlive()) {
            return;
        }
        for (const Territory* territory : territories) {
            if (territory->controller && territory->controller->controls(agent.getId())) {
                return;
            }
        }
        ++stats.uncontrolledAgents;
    });

    return stats;
}

bool TerritoryControlReconciler::shouldSpawnInTerritory(TerritoryID territoryId) const {
    const Territory* territory = findTerritory(territoryId);
    return territory && territory->status != ControlStatus::Liberated;
}

float TerritoryControlReconciler::getSpawnRateMultiplier(TerritoryID territoryId) const {
    const Territory* territory = findTerritory(territoryId);
    if (territory && territory->controller && territory->controller->isActive()) {
        return m_config.controlledSpawnRateMultiplier;
    }
    return 1.0f;
}

std::vector<AgentID>
TerritoryControlReconciler::getAgentsInTerritory(const AgentRegistry& registry,
                                                 TerritoryID territoryId) const {
    std::vector<AgentID> agents;
    registry.forEachAgent([&](const ParasiteAgent& agent) {
        if (!agent.isAlive()) {
            return;
        }
        const Vector3D& pos = agent.getPosition();
        const Territory* territory = m_authority.getTerritoryAt(pos.getX(), pos.getZ());
        if (territory && territory->id == territoryId) {
            agents.push_back(agent.getId());
        }
    });
    return agents;
}

Controller* TerritoryControlReconciler::findController(ControllerID controllerId) const {
    for (Territory* territory : m_authority.getAllTerritories()) {
        if (territory->controller && territory->controller->getId() == controllerId) {
            return territory->controller;
        }
    }
    return nullptr;
}

Territory* TerritoryControlReconciler::findTerritory(TerritoryID territoryId) const {
    for (Territory* territory : m_authority.getAllTerritories()) {
        if (territory->id == territoryId) {
            return territory;
        }
    }
    return nullptr;
}

} // namespace HiveEngine
