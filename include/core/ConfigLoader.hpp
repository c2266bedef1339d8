/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include "ai/AgentConfig.hpp"
#include "utils/JsonReader.hpp"
#include <string>

namespace HiveEngine {

/**
 * @brief Reads a SimulationConfig from JSON
 *
 * Recognized sections: basic_agent, tactical_agent, scheduler, governor,
 * control and simulation. Keys use snake_case field names (max_health,
 * view_radius, ...). Missing keys keep their current value; keys with the
 * wrong JSON type are skipped with a warning.
 *
 * The merged result is validated before it is written back, so on failure
 * the caller's config is left untouched.
 */
class ConfigLoader {
public:
    /**
     * @brief Loads and merges a config file
     * @param filepath Path to the JSON file
     * @param config Updated in place on success
     * @return false if the file cannot be read, parsed or validated
     */
    static bool loadFromFile(const std::string& filepath, SimulationConfig& config);

    /**
     * @brief Same as loadFromFile() for an in-memory document
     */
    static bool loadFromString(const std::string& json, SimulationConfig& config);

private:
    static bool applyDocument(const JsonValue& root, SimulationConfig& config,
                              const std::string& source);

    static void readAgentTuning(const JsonObject& section, const std::string& name,
                                AgentTuning& tuning);
    static void readScheduler(const JsonObject& section, SchedulerConfig& scheduler);
    static void readGovernor(const JsonObject& section, GovernorConfig& governor);
    static void readControl(const JsonObject& section, ControlConfig& control);
    static void readSimulation(const JsonObject& section, SimulationConfig& config);
};

} // namespace HiveEngine

#endif // CONFIG_LOADER_HPP
