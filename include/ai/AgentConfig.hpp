/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef AGENT_CONFIG_HPP
#define AGENT_CONFIG_HPP

#include "ai/AgentTypes.hpp"
#include <string_view>

namespace HiveEngine
{

/**
 * Tuning for one agent variant
 *
 * All times are in simulation seconds, distances in world units on the
 * x/z ground plane. Basic and tactical defaults come from the factory
 * functions below; a zero value disables the corresponding feature where
 * noted.
 */
struct AgentTuning
{
    // Vitals
    int maxHealth = 2;                            // Hit points at spawn and respawn
    float regenRate = 0.0f;                       // HP per second while idling on patrol (0 = none)
    float maxLifetimeWithoutFeeding = 180.0f;     // Starves after this long without a feed (0 = never)
    int reward = 2;                               // Energy granted to whoever destroys the agent

    // Movement
    float speed = 2.0f;                           // Base movement speed (units/s)
    float roamHeight = 1.0f;                      // Height above terrain while moving
    float defaultTerrainHeight = 0.5f;            // Ground height when no terrain provider exists
    float arrivalDistance = 1.0f;                 // Patrol waypoint counts as reached below this
    float spawnDelay = 1.0f;                      // Time spent in Spawning
    float patrolPauseMin = 2.0f;                  // Pause at each waypoint: min + U[0, pauseJitter)
    float patrolPauseJitter = 2.0f;
    float patrolRadiusFraction = 0.8f;            // Waypoint radius as a fraction of territory radius

    // Territory and targeting
    float territoryRadius = 15.0f;                // Candidate range around the territory center
    float pursuitDistance = 15.0f;                // Target beyond this from the center is abandoned
    float engagementDistance = 3.0f;              // Start feeding within this distance
    float disengageDistance = 5.0f;               // Stop feeding beyond this distance
    float searchRadiusMultiplier = 1.5f;          // Scheduler query radius = territoryRadius * this

    // Feeding
    float drainRate = 3.0f;                       // Energy per second drained from workers
    float fleeThreshold = 0.4f;                   // Worker flees below this fraction of capacity
    float fleeDistance = 25.0f;                   // How far a fleeing worker runs
    float attackDamage = 0.0f;                    // Damage per second against protectors

    // Tactical only
    float switchCooldown = 1.5f;                  // Min time between target re-evaluations
    float lockDuration = 3.0f;                    // Same-class switches wait this long after a lock
    float retreatThreshold = 0.15f;               // Health fraction that collapses aggression
    float initialAggression = 0.85f;
    float aggressionInterval = 0.5f;              // Aggression recompute cadence
    float secondaryClassGate = 0.6f;              // Workers engaged only above this aggression
    float minSpeedMultiplier = 0.8f;
    float maxSpeedMultiplier = 1.2f;
    float switchScoreMargin = 0.2f;               // Base tactical score advantage needed to switch

    static AgentTuning basic()
    {
        return AgentTuning{};
    }

    static AgentTuning tactical()
    {
        AgentTuning t;
        t.maxHealth = 4;
        t.maxLifetimeWithoutFeeding = 0.0f;
        t.reward = 4;
        t.speed = 2.5f;
        t.territoryRadius = 60.0f;
        t.pursuitDistance = 75.0f;
        t.engagementDistance = 3.5f;
        t.disengageDistance = 5.0f;
        t.fleeThreshold = 0.35f;
        t.fleeDistance = 30.0f;
        t.attackDamage = 2.0f;
        return t;
    }

    static AgentTuning forVariant(AgentVariant variant)
    {
        return variant == AgentVariant::Tactical ? tactical() : basic();
    }
};

/**
 * Configuration for AgentUpdateScheduler
 */
struct SchedulerConfig
{
    float viewRadius = 192.0f;                    // Working-set radius around the viewpoint
};

/**
 * Configuration for PerformanceGovernor
 *
 * Levels: 0 = none, 1 = basic, 2 = aggressive.
 */
struct GovernorConfig
{
    float checkInterval = 1.0f;                   // Seconds between frame-rate checks

    // Level selection
    float aggressiveFps = 45.0f;                  // Level 2 below this fps ...
    int aggressiveMinAgents = 5;                  // ... with more than this many living agents
    float basicFps = 55.0f;                       // Level 1 below this fps ...
    int basicMinAgents = 7;                       // ... with more than this many living agents
    float recoveredFps = 58.0f;                   // Level 0 at or above this fps

    // Visible-agent cap
    int initialCap = 10;
    int recoveryCeiling = 10;                     // Cap grows back up to this
    int aggressiveFloor = 5;
    int basicFloor = 7;
    float aggressiveCapFactor = 0.7f;             // Cap <= living * factor at level 2
    float basicCapFactor = 0.85f;
    int absoluteMinCap = 1;                       // setMaxActiveAgents clamps to these
    int absoluteMaxCap = 20;

    // Fidelity bands (distance to viewpoint)
    float basicReducedDistance = 50.0f;
    float basicMinimalDistance = 100.0f;
    float aggressiveReducedDistance = 40.0f;
    float aggressiveMinimalDistance = 75.0f;
    float tacticalPriorityBonus = 1000.0f;        // Ranking bonus for tactical agents at level 2
};

/**
 * Configuration for territory control bookkeeping
 */
struct ControlConfig
{
    float reconcileInterval = 5.0f;               // Seconds between consistency passes
    bool autoCorrect = true;                      // recalculate() when a pass finds problems
    int maxControlledPerController = 100;
    float controlledSpawnRateMultiplier = 1.5f;   // Spawn rate in territories with an active controller
    float territorySize = 1024.0f;                // Edge length of a square territory
};

/**
 * Everything the simulation reads at startup
 */
struct SimulationConfig
{
    AgentTuning basicAgent = AgentTuning::basic();
    AgentTuning tacticalAgent = AgentTuning::tactical();
    SchedulerConfig scheduler;
    GovernorConfig governor;
    ControlConfig control;
    float tacticalSpawnShare = 0.25f;             // Fraction of spawns that are tactical

    const AgentTuning& tuningFor(AgentVariant variant) const
    {
        return variant == AgentVariant::Tactical ? tacticalAgent : basicAgent;
    }
};

/**
 * @brief Rejects tuning the agent state machine cannot run with
 * @param label Used in the exception message
 * @throws std::invalid_argument naming the offending field
 */
void validateTuning(const AgentTuning& tuning, std::string_view label);

/**
 * @brief Validates every section of a SimulationConfig
 * @throws std::invalid_argument naming the offending section and field
 */
void validateConfig(const SimulationConfig& config);

} // namespace HiveEngine

#endif // AGENT_CONFIG_HPP
