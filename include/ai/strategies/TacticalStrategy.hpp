/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TACTICAL_STRATEGY_HPP
#define TACTICAL_STRATEGY_HPP

#include "ai/TargetingStrategy.hpp"

namespace HiveEngine {

/**
 * @brief Protector-first targeting driven by an aggression level.
 *
 * Aggression starts at tuning.initialAggression and is recomputed every
 * aggressionInterval seconds from health, nearby targets and recent locks,
 * blended 80/20 with the previous value. It scales speed, patrol radius,
 * pursuit distance, drain rate and the worker flee threshold, and gates
 * whether workers are engaged at all.
 */
class TacticalStrategy : public TargetingStrategy {
public:
  explicit TacticalStrategy(const AgentTuning &tuning = AgentTuning::tactical());

  std::span<const UnitClass> targetPriorityClasses() const override;

  // Nearest protector in territory, else nearest worker when aggressive enough
  std::optional<TargetRef> selectTarget(const ParasiteAgent &agent,
                                        const CandidateSet &candidates) override;

  /**
   * @brief Switch check, at most once per switchCooldown
   *
   * Worker targets are dropped for the nearest protector. A protector target
   * is replaced only after lockDuration and only by a protector scoring
   * clearly higher.
   */
  std::optional<TargetRef> reevaluateTarget(const ParasiteAgent &agent,
                                            const TargetRef &current,
                                            const CandidateSet &candidates) override;

  std::optional<TargetRef>
  retargetWithinTerritory(const ParasiteAgent &agent,
                          const CandidateSet &candidates) override;

  bool isTargetValid(const ParasiteAgent &agent,
                     const TargetRef &target) const override;

  float computeSpeed(const ParasiteAgent &agent) const override;
  float patrolRadius(const ParasiteAgent &agent) const override;
  float pursuitDistance(const ParasiteAgent &agent) const override;
  float drainRate(const ParasiteAgent &agent) const override;
  float fleeThreshold(const ParasiteAgent &agent) const override;

  float getAggression() const override { return m_aggression; }

  void onTick(const ParasiteAgent &agent, const CandidateSet &candidates,
              float deltaTime) override;
  void onTargetLocked(const ParasiteAgent &agent, const TargetRef &target) override;
  void reset() override;

  std::string getName() const override { return "Tactical"; }
  std::unique_ptr<TargetingStrategy> clone() const override;

  /**
   * @brief Desirability of a target: closeness plus class and weakness bonuses
   */
  float scoreTarget(const ParasiteAgent &agent, const TargetRef &target) const;

  // Aggression value the next recompute would blend toward
  float computeTargetAggression(const ParasiteAgent &agent,
                                const CandidateSet &candidates) const;

  // Test hook
  void setAggression(float aggression);

private:
  bool inEngagementRange(const ParasiteAgent &agent, const TargetRef &target) const;
  bool workersAllowed() const;
  std::optional<TargetRef> nearestOfClass(const ParasiteAgent &agent,
                                          const CandidateSet &candidates,
                                          UnitClass unitClass) const;

  float m_aggression;
  float m_aggressionTimer{0.0f};
  float m_switchCooldown{0.0f};
  bool m_hasLocked{false};

  static constexpr float BASE_AGGRESSION = 0.80f;
  static constexpr float AGGRESSION_CAP = 0.95f;
  static constexpr float AGGRESSION_BLEND = 0.2f;  // Weight of the new value
};

} // namespace HiveEngine

#endif // TACTICAL_STRATEGY_HPP
