/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TARGETING_STRATEGY_HPP
#define TARGETING_STRATEGY_HPP

#include "ai/AgentConfig.hpp"
#include "ai/TargetUnit.hpp"
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace HiveEngine {

class ParasiteAgent;

/**
 * @brief Targeting and tuning policy plugged into ParasiteAgent.
 *
 * The agent owns the state machine; the strategy answers every question
 * whose answer differs between variants. A strategy instance belongs to one
 * agent and may keep per-agent timers (see clone()).
 */
class TargetingStrategy {
public:
  explicit TargetingStrategy(const AgentTuning &tuning) : m_tuning(tuning) {}
  virtual ~TargetingStrategy() = default;

  // =========================================================================
  // TARGETING
  // =========================================================================

  /**
   * @brief Classes this agent may lock, highest priority first
   */
  virtual std::span<const UnitClass> targetPriorityClasses() const = 0;

  /**
   * @brief Picks a target while patrolling
   * @return nullopt when nothing in range is engageable
   */
  virtual std::optional<TargetRef> selectTarget(const ParasiteAgent &agent,
                                                const CandidateSet &candidates) = 0;

  /**
   * @brief Periodic re-evaluation while hunting
   * @return A different target to switch to, or nullopt to keep the current one
   */
  virtual std::optional<TargetRef>
  reevaluateTarget([[maybe_unused]] const ParasiteAgent &agent,
                   [[maybe_unused]] const TargetRef &current,
                   [[maybe_unused]] const CandidateSet &candidates) {
    return std::nullopt;
  }

  /**
   * @brief Replacement when the current target strayed beyond pursuit range
   */
  virtual std::optional<TargetRef>
  retargetWithinTerritory([[maybe_unused]] const ParasiteAgent &agent,
                          [[maybe_unused]] const CandidateSet &candidates) {
    return std::nullopt;
  }

  // Eligible and in range
  virtual bool isTargetValid(const ParasiteAgent &agent,
                             const TargetRef &target) const;

  // =========================================================================
  // TUNING HOOKS
  // =========================================================================

  virtual float computeSpeed(const ParasiteAgent &agent) const;
  virtual float patrolRadius(const ParasiteAgent &agent) const;
  virtual float pursuitDistance(const ParasiteAgent &agent) const;
  virtual float drainRate(const ParasiteAgent &agent) const;
  virtual float fleeThreshold(const ParasiteAgent &agent) const;

  // Aggression in [0,1]; 0 for strategies without one
  virtual float getAggression() const { return 0.0f; }

  // =========================================================================
  // LIFECYCLE
  // =========================================================================

  // Called once per agent update before the state machine runs
  virtual void onTick([[maybe_unused]] const ParasiteAgent &agent,
                      [[maybe_unused]] const CandidateSet &candidates,
                      [[maybe_unused]] float deltaTime) {}

  virtual void onTargetLocked([[maybe_unused]] const ParasiteAgent &agent,
                              [[maybe_unused]] const TargetRef &target) {}

  virtual void reset() {}

  virtual std::string getName() const = 0;
  virtual std::unique_ptr<TargetingStrategy> clone() const = 0;

  const AgentTuning &getTuning() const { return m_tuning; }

  bool permitsClass(UnitClass unitClass) const;

protected:
  // Candidate within territoryRadius of the agent's territory center
  bool isWithinTerritoryRange(const ParasiteAgent &agent,
                              const TargetRef &target) const;

  AgentTuning m_tuning;
};

/**
 * @brief Creates the strategy matching an agent variant
 */
std::unique_ptr<TargetingStrategy> createStrategy(AgentVariant variant,
                                                  const AgentTuning &tuning);

} // namespace HiveEngine

#endif // TARGETING_STRATEGY_HPP
