/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef STATISTICS_COLLECTOR_HPP
#define STATISTICS_COLLECTOR_HPP

#include "ai/AgentTypes.hpp"
#include "managers/AgentRegistry.hpp"
#include "spatial/ChunkSpatialIndex.hpp"
#include <array>
#include <boost/container/flat_map.hpp>
#include <optional>
#include <string>

namespace HiveEngine {

class PerformanceGovernor;

/**
 * @brief Point-in-time counts across the whole swarm
 */
struct SimulationSnapshot {
    size_t totalAgents{0};
    size_t aliveAgents{0};
    size_t deadAgents{0};

    std::array<size_t, static_cast<size_t>(AgentVariant::COUNT)> byVariant{};
    std::array<size_t, static_cast<size_t>(AgentState::COUNT)> byState{};
    std::array<size_t, static_cast<size_t>(FidelityTier::COUNT)> byTier{};
    boost::container::flat_map<TerritoryID, size_t> byTerritory;   // Living agents per assigned territory

    size_t controlledAgents{0};
    AgentRegistry::LifecycleCounters lifecycle;

    int optimizationLevel{0};
    int maxActiveAgents{0};
    float fps{0.0f};

    std::optional<ChunkSpatialIndex::Stats> spatial;

    size_t countByVariant(AgentVariant variant) const {
        return byVariant[static_cast<size_t>(variant)];
    }
    size_t countByState(AgentState state) const {
        return byState[static_cast<size_t>(state)];
    }
    size_t countByTier(FidelityTier tier) const {
        return byTier[static_cast<size_t>(tier)];
    }
};

/**
 * @brief Builds SimulationSnapshots and renders them for the log
 *
 * Every collaborator except the registry is optional; missing ones leave
 * their fields at defaults.
 */
class StatisticsCollector {
public:
    SimulationSnapshot collect(const AgentRegistry& registry,
                               const PerformanceGovernor* governor = nullptr,
                               ITerritoryAuthority* authority = nullptr,
                               const ChunkSpatialIndex* spatialIndex = nullptr) const;

    // One line per category
    std::string formatSummary(const SimulationSnapshot& snapshot) const;

    void logSnapshot(const SimulationSnapshot& snapshot) const;
};

} // namespace HiveEngine

#endif // STATISTICS_COLLECTOR_HPP
