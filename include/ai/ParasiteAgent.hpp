/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PARASITE_AGENT_HPP
#define PARASITE_AGENT_HPP

#include "ai/AgentConfig.hpp"
#include "ai/AgentTypes.hpp"
#include "ai/TargetUnit.hpp"
#include "ai/TargetingStrategy.hpp"
#include "utils/Vector3D.hpp"
#include "world/WorldInterfaces.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <random>

namespace HiveEngine {

/**
 * @brief Tick-scoped inputs for one agent update.
 *
 * Everything referenced here is owned by the scheduler and only valid for
 * the duration of the update call.
 */
struct AgentUpdateContext {
  const CandidateSet &candidates;
  const UnitLookup &units;
  const ITerrainHeightProvider *terrain{nullptr};
  float deltaTime{0.0f};
};

/**
 * @brief One hostile agent running the Spawning/Patrolling/Hunting/Feeding/
 * Returning state machine.
 *
 * Variant differences live in the TargetingStrategy; this class holds the
 * shared engine. Time is simulation time accumulated from update() calls.
 */
class ParasiteAgent {
public:
  /**
   * @brief Creates an agent in the Spawning state
   * @param id Stable identifier
   * @param variant Basic or Tactical
   * @param spawnPosition Initial position, also the territory center
   * @param tuning Variant tuning
   * @param strategy Targeting policy owned by this agent
   * @param seed RNG seed for patrol waypoints (0 derives one from the id)
   * @throws std::invalid_argument on a null strategy or invalid tuning
   */
  ParasiteAgent(AgentID id, AgentVariant variant, const Vector3D &spawnPosition,
                const AgentTuning &tuning,
                std::unique_ptr<TargetingStrategy> strategy, uint32_t seed = 0);

  ParasiteAgent(const ParasiteAgent &) = delete;
  ParasiteAgent &operator=(const ParasiteAgent &) = delete;

  /**
   * @brief Advances the state machine by ctx.deltaTime
   *
   * Dead agents are not updated. Missing or invalid targets revert the agent
   * to Patrolling; nothing here throws.
   */
  void update(const AgentUpdateContext &ctx);

  /**
   * @brief Straight-line step toward destination on the x/z plane
   *
   * Moves speed * deltaTime without overshooting, glues y to the terrain and
   * turns to face the travel direction.
   * @return true if the agent actually moved
   */
  bool moveTowards(const Vector3D &destination, float speed, float deltaTime,
                   const ITerrainHeightProvider *terrain = nullptr);

  /**
   * @brief Random point around the territory center within the strategy's
   * patrol radius
   */
  Vector3D generatePatrolWaypoint();

  /**
   * @brief Applies damage, flooring health at zero
   * @return true if the agent is destroyed (health <= 0)
   */
  bool takeDamage(int damage);

  /**
   * @brief Restores full health at position, which becomes the new territory
   * center, and resumes patrolling
   */
  void respawn(const Vector3D &position);

  /**
   * @brief Reassigns the territory this agent patrols
   * @throws std::invalid_argument if radius is not positive
   */
  void setTerritory(TerritoryID territoryId, const Vector3D &center, float radius);

  // Identity and vitals
  AgentID getId() const { return m_id; }
  AgentVariant getVariant() const { return m_variant; }
  int getHealth() const { return m_health; }
  int getMaxHealth() const { return m_tuning.maxHealth; }
  float getHealthRatio() const {
    return static_cast<float>(m_health) / static_cast<float>(m_tuning.maxHealth);
  }
  bool isAlive() const { return m_health > 0; }
  bool hasStarved() const { return m_starved; }
  int getReward() const { return m_tuning.reward; }

  // Spatial state
  const Vector3D &getPosition() const { return m_position; }
  float getFacing() const { return m_facing; }
  bool hasMoved() const { return m_movedThisTick; }
  TerritoryID getTerritoryId() const { return m_territoryId; }
  const Vector3D &getTerritoryCenter() const { return m_territoryCenter; }
  float getTerritoryRadius() const { return m_territoryRadius; }
  const Vector3D &getPatrolTarget() const { return m_patrolTarget; }
  bool isPatrolPaused() const { return m_patrolPaused; }

  // Behavior state
  AgentState getState() const { return m_state; }
  const std::optional<TargetKey> &getLockedTarget() const { return m_lockedTarget; }
  float getSimTime() const { return m_simTime; }
  float getStateChangeTime() const { return m_stateChangeTime; }
  float getLastFeedTime() const { return m_lastFeedTime; }
  float getLastLockTime() const { return m_lastLockTime; }

  // Rendering fidelity, written by the PerformanceGovernor
  FidelityTier getFidelityTier() const { return m_fidelity; }
  void setFidelityTier(FidelityTier tier) { m_fidelity = tier; }

  const AgentTuning &getTuning() const { return m_tuning; }
  const TargetingStrategy &getStrategy() const { return *mp_strategy; }
  TargetingStrategy &getStrategy() { return *mp_strategy; }

private:
  void setState(AgentState newState);

  void updateSpawning();
  void updatePatrolling(const AgentUpdateContext &ctx);
  void updateHunting(const AgentUpdateContext &ctx);
  void updateFeeding(const AgentUpdateContext &ctx);
  void updateReturning(const AgentUpdateContext &ctx);

  void roam(const AgentUpdateContext &ctx);
  void feedOnWorker(TargetRef &target, float deltaTime);
  void attackProtector(TargetRef &target, float deltaTime);
  void regenerate(float deltaTime);

  void lockTarget(const TargetRef &target);
  void releaseTarget(AgentState nextState);

  float groundHeight(float x, float z, const ITerrainHeightProvider *terrain) const;

  AgentID m_id;
  AgentVariant m_variant;
  AgentTuning m_tuning;
  std::unique_ptr<TargetingStrategy> mp_strategy;

  Vector3D m_position;
  float m_facing{0.0f};
  bool m_movedThisTick{false};

  int m_health;
  float m_regenAccumulator{0.0f};
  bool m_starved{false};

  TerritoryID m_territoryId{INVALID_TERRITORY};
  Vector3D m_territoryCenter;
  float m_territoryRadius;

  AgentState m_state{AgentState::Spawning};
  std::optional<TargetKey> m_lockedTarget;

  Vector3D m_patrolTarget;
  bool m_patrolPaused{false};
  float m_pauseRemaining{0.0f};

  float m_simTime{0.0f};
  float m_stateChangeTime{0.0f};
  float m_lastFeedTime{0.0f};
  float m_lastLockTime{0.0f};

  FidelityTier m_fidelity{FidelityTier::Full};

  std::mt19937 m_rng;

  static constexpr float MIN_MOVE_DISTANCE = 0.1f;   // Closer than this counts as arrived
  static constexpr float MOVEMENT_EPSILON = 1e-4f;   // Smaller steps do not count as movement
  static constexpr float FACING_THRESHOLD = 0.1f;    // Radians before facing snaps
};

} // namespace HiveEngine

#endif // PARASITE_AGENT_HPP
