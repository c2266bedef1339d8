/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/StatisticsCollector.hpp"
#include "core/Logger.hpp"
#include "managers/PerformanceGovernor.hpp"
#include <format>
#include <iterator>

namespace HiveEngine {

SimulationSnapshot StatisticsCollector::collect(const AgentRegistry& registry,
                                                const PerformanceGovernor* governor,
                                                ITerritoryAuthority* authority,
                                                const ChunkSpatialIndex* spatialIndex) const {
    SimulationSnapshot snapshot;
    snapshot.totalAgents = registry.getAgentCount();
    snapshot.lifecycle = registry.getCounters();

    registry.forEachAgent([&snapshot](const ParasiteAgent& agent) {
        ++snapshot.byVariant[static_cast<size_t>(agent.getVariant())];
        if (!agent.isAlive()) {
            ++snapshot.deadAgents;
            return;
        }
        ++snapshot.aliveAgents;
        ++snapshot.byState[static_cast<size_t>(agent.getState())];
        ++snapshot.byTier[static_cast<size_t>(agent.getFidelityTier())];
        ++snapshot.byTerritory[agent.getTerritoryId()];
    });

    if (authority) {
        for (const Territory* territory : authority->getAllTerritories()) {
            if (territory->controller) {
                snapshot.controlledAgents += territory->controller->getControlledCount();
            }
        }
    }

    if (governor) {
        const PerformanceGovernor::Stats stats = governor->getStats();
        snapshot.optimizationLevel = stats.optimizationLevel;
        snapshot.maxActiveAgents = stats.maxActiveAgents;
        snapshot.fps = stats.lastFps;
    }

    if (spatialIndex) {
        snapshot.spatial = spatialIndex->getStats();
    }

    return snapshot;
}

std::string StatisticsCollector::formatSummary(const SimulationSnapshot& snapshot) const {
    std::string out;
    auto it = std::back_inserter(out);

    std::format_to(it, "Agents: {} total, {} alive, {} dead ({} basic, {} tactical)\n",
                   snapshot.totalAgents, snapshot.aliveAgents, snapshot.deadAgents,
                   snapshot.countByVariant(AgentVariant::Basic),
                   snapshot.countByVariant(AgentVariant::Tactical));

    std::format_to(it, "States:");
    for (size_t i = 0; i < snapshot.byState.size(); ++i) {
        std::format_to(it, " {}={}", toString(static_cast<AgentState>(i)), snapshot.byState[i]);
    }
    std::format_to(it, "\nFidelity:");
    for (size_t i = 0; i < snapshot.byTier.size(); ++i) {
        std::format_to(it, " {}={}", toString(static_cast<FidelityTier>(i)), snapshot.byTier[i]);
    }

    std::format_to(it, "\nTerritories:");
    for (const auto& [territoryId, count] : snapshot.byTerritory) {
        std::format_to(it, " {}:{}", territoryId, count);
    }

    std::format_to(it, "\nControlled: {}\n", snapshot.controlledAgents);
    std::format_to(it, "Lifecycle: spawned={} destroyed={} starved={} respawned={} removed={}\n",
                   snapshot.lifecycle.spawned, snapshot.lifecycle.destroyed,
                   snapshot.lifecycle.starved, snapshot.lifecycle.respawned,
                   snapshot.lifecycle.removed);
    std::format_to(it, "Governor: level={} cap={} fps={:.1f}", snapshot.optimizationLevel,
                   snapshot.maxActiveAgents, snapshot.fps);

    if (snapshot.spatial) {
        std::format_to(it, "\nSpatial: {} entities in {} chunks ({:.2f} per chunk)",
                       snapshot.spatial->entityCount, snapshot.spatial->chunkCount,
                       snapshot.spatial->averagePerChunk);
    }
    return out;
}

void StatisticsCollector::logSnapshot([[maybe_unused]] const SimulationSnapshot& snapshot) const {
    STATS_INFO(formatSummary(snapshot));
}

} // namespace HiveEngine
