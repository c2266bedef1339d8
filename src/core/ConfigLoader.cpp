/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/ConfigLoader.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <format>
#include <limits>
#include <stdexcept>

namespace HiveEngine {

namespace {

void readFloat(const JsonObject& section, [[maybe_unused]] const std::string& sectionName, const char* key,
               float& out) {
    auto it = section.find(key);
    if (it == section.end()) {
        return;
    }
    if (auto value = it->second.tryAsNumber()) {
        out = static_cast<float>(*value);
    } else {
        CONFIG_WARN(std::format("{}.{} should be a number, got {}; keeping {}", sectionName, key,
                                it->second.toString(), out));
    }
}

void readInt(const JsonObject& section, [[maybe_unused]] const std::string& sectionName, const char* key,
             int& out) {
    auto it = section.find(key);
    if (it == section.end()) {
        return;
    }
    if (auto value = it->second.tryAsNumber()) {
        if (!std::isfinite(*value) || *value < std::numeric_limits<int>::min() ||
            *value > std::numeric_limits<int>::max()) {
            CONFIG_WARN(std::format("{}.{} = {} does not fit an int; keeping {}", sectionName,
                                    key, *value, out));
            return;
        }
        out = static_cast<int>(*value);
    } else {
        CONFIG_WARN(std::format("{}.{} should be a number, got {}; keeping {}", sectionName, key,
                                it->second.toString(), out));
    }
}

void readBool(const JsonObject& section, [[maybe_unused]] const std::string& sectionName, const char* key,
              bool& out) {
    auto it = section.find(key);
    if (it == section.end()) {
        return;
    }
    if (auto value = it->second.tryAsBool()) {
        out = *value;
    } else {
        CONFIG_WARN(std::format("{}.{} should be a boolean, got {}; keeping {}", sectionName, key,
                                it->second.toString(), out));
    }
}

} // namespace

bool ConfigLoader::loadFromFile(const std::string& filepath, SimulationConfig& config) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        CONFIG_ERROR(std::format("Failed to load config from {}: {}", filepath,
                                 reader.getLastError()));
        return false;
    }
    return applyDocument(reader.getRoot(), config, filepath);
}

bool ConfigLoader::loadFromString(const std::string& json, SimulationConfig& config) {
    JsonReader reader;
    if (!reader.parse(json)) {
        CONFIG_ERROR(std::format("Failed to parse config: {}", reader.getLastError()));
        return false;
    }
    return applyDocument(reader.getRoot(), config, "<string>");
}

bool ConfigLoader::applyDocument(const JsonValue& root, SimulationConfig& config,
                                 const std::string& source) {
    const JsonObject* rootObj = root.tryAsObject();
    if (!rootObj) {
        CONFIG_ERROR(std::format("Config root is not a JSON object: {}", source));
        return false;
    }

    SimulationConfig merged = config;
    for (const auto& [sectionName, sectionValue] : *rootObj) {
        const JsonObject* section = sectionValue.tryAsObject();
        if (!section) {
            CONFIG_WARN(std::format("Section '{}' is not an object, skipping", sectionName));
            continue;
        }

        if (sectionName == "basic_agent") {
            readAgentTuning(*section, sectionName, merged.basicAgent);
        } else if (sectionName == "tactical_agent") {
            readAgentTuning(*section, sectionName, merged.tacticalAgent);
        } else if (sectionName == "scheduler") {
            readScheduler(*section, merged.scheduler);
        } else if (sectionName == "governor") {
            readGovernor(*section, merged.governor);
        } else if (sectionName == "control") {
            readControl(*section, merged.control);
        } else if (sectionName == "simulation") {
            readSimulation(*section, merged);
        } else {
            CONFIG_WARN(std::format("Unknown config section '{}', skipping", sectionName));
        }
    }

    try {
        validateConfig(merged);
    } catch (const std::invalid_argument& e) {
        CONFIG_ERROR(std::format("Invalid config in {}: {}", source, e.what()));
        return false;
    }

    config = merged;
    CONFIG_INFO(std::format("Loaded config from {}", source));
    return true;
}

void ConfigLoader::readAgentTuning(const JsonObject& section, const std::string& name,
                                   AgentTuning& tuning) {
    readInt(section, name, "max_health", tuning.maxHealth);
    readFloat(section, name, "regen_rate", tuning.regenRate);
    readFloat(section, name, "max_lifetime_without_feeding", tuning.maxLifetimeWithoutFeeding);
    readInt(section, name, "reward", tuning.reward);

    readFloat(section, name, "speed", tuning.speed);
    readFloat(section, name, "roam_height", tuning.roamHeight);
    readFloat(section, name, "default_terrain_height", tuning.defaultTerrainHeight);
    readFloat(section, name, "arrival_distance", tuning.arrivalDistance);
    readFloat(section, name, "spawn_delay", tuning.spawnDelay);
    readFloat(section, name, "patrol_pause_min", tuning.patrolPauseMin);
    readFloat(section, name, "patrol_pause_jitter", tuning.patrolPauseJitter);
    readFloat(section, name, "patrol_radius_fraction", tuning.patrolRadiusFraction);

    readFloat(section, name, "territory_radius", tuning.territoryRadius);
    readFloat(section, name, "pursuit_distance", tuning.pursuitDistance);
    readFloat(section, name, "engagement_distance", tuning.engagementDistance);
    readFloat(section, name, "disengage_distance", tuning.disengageDistance);
    readFloat(section, name, "search_radius_multiplier", tuning.searchRadiusMultiplier);

    readFloat(section, name, "drain_rate", tuning.drainRate);
    readFloat(section, name, "flee_threshold", tuning.fleeThreshold);
    readFloat(section, name, "flee_distance", tuning.fleeDistance);
    readFloat(section, name, "attack_damage", tuning.attackDamage);

    readFloat(section, name, "switch_cooldown", tuning.switchCooldown);
    readFloat(section, name, "lock_duration", tuning.lockDuration);
    readFloat(section, name, "retreat_threshold", tuning.retreatThreshold);
    readFloat(section, name, "initial_aggression", tuning.initialAggression);
    readFloat(section, name, "aggression_interval", tuning.aggressionInterval);
    readFloat(section, name, "secondary_class_gate", tuning.secondaryClassGate);
    readFloat(section, name, "min_speed_multiplier", tuning.minSpeedMultiplier);
    readFloat(section, name, "max_speed_multiplier", tuning.maxSpeedMultiplier);
    readFloat(section, name, "switch_score_margin", tuning.switchScoreMargin);
}

void ConfigLoader::readScheduler(const JsonObject& section, SchedulerConfig& scheduler) {
    readFloat(section, "scheduler", "view_radius", scheduler.viewRadius);
}

void ConfigLoader::readGovernor(const JsonObject& section, GovernorConfig& governor) {
    const std::string name = "governor";
    readFloat(section, name, "check_interval", governor.checkInterval);
    readFloat(section, name, "aggressive_fps", governor.aggressiveFps);
    readInt(section, name, "aggressive_min_agents", governor.aggressiveMinAgents);
    readFloat(section, name, "basic_fps", governor.basicFps);
    readInt(section, name, "basic_min_agents", governor.basicMinAgents);
    readFloat(section, name, "recovered_fps", governor.recoveredFps);
    readInt(section, name, "initial_cap", governor.initialCap);
    readInt(section, name, "recovery_ceiling", governor.recoveryCeiling);
    readInt(section, name, "aggressive_floor", governor.aggressiveFloor);
    readInt(section, name, "basic_floor", governor.basicFloor);
    readFloat(section, name, "aggressive_cap_factor", governor.aggressiveCapFactor);
    readFloat(section, name, "basic_cap_factor", governor.basicCapFactor);
    readInt(section, name, "absolute_min_cap", governor.absoluteMinCap);
    readInt(section, name, "absolute_max_cap", governor.absoluteMaxCap);
    readFloat(section, name, "basic_reduced_distance", governor.basicReducedDistance);
    readFloat(section, name, "basic_minimal_distance", governor.basicMinimalDistance);
    readFloat(section, name, "aggressive_reduced_distance", governor.aggressiveReducedDistance);
    readFloat(section, name, "aggressive_minimal_distance", governor.aggressiveMinimalDistance);
    readFloat(section, name, "tactical_priority_bonus", governor.tacticalPriorityBonus);
}

void ConfigLoader::readControl(const JsonObject& section, ControlConfig& control) {
    const std::string name = "control";
    readFloat(section, name, "reconcile_interval", control.reconcileInterval);
    readBool(section, name, "auto_correct", control.autoCorrect);
    readInt(section, name, "max_controlled_per_controller", control.maxControlledPerController);
    readFloat(section, name, "controlled_spawn_rate_multiplier",
              control.controlledSpawnRateMultiplier);
    readFloat(section, name, "territory_size", control.territorySize);
}

void ConfigLoader::readSimulation(const JsonObject& section, SimulationConfig& config) {
    readFloat(section, "simulation", "tactical_spawn_share", config.tacticalSpawnShare);
}

} // namespace HiveEngine
