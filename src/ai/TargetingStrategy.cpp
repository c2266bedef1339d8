/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/TargetingStrategy.hpp"
#include "ai/ParasiteAgent.hpp"
#include "ai/strategies/BasicStrategy.hpp"
#include "ai/strategies/TacticalStrategy.hpp"
#include <algorithm>
#include <format>
#include <stdexcept>

namespace HiveEngine {

bool TargetingStrategy::isTargetValid(const ParasiteAgent &agent,
                                      const TargetRef &target) const {
  if (!target.isEligible() || !permitsClass(target.getClass())) {
    return false;
  }
  // Anything the scheduler would still gather for this agent counts as in range
  const float searchRadius =
      agent.getTerritoryRadius() * m_tuning.searchRadiusMultiplier;
  return Vector3D::planarDistance(target.getPosition(),
                                  agent.getTerritoryCenter()) <= searchRadius;
}

float TargetingStrategy::computeSpeed([[maybe_unused]] const ParasiteAgent &agent) const {
  return m_tuning.speed;
}

float TargetingStrategy::patrolRadius(const ParasiteAgent &agent) const {
  return agent.getTerritoryRadius() * m_tuning.patrolRadiusFraction;
}

float TargetingStrategy::pursuitDistance(
    [[maybe_unused]] const ParasiteAgent &agent) const {
  return m_tuning.pursuitDistance;
}

float TargetingStrategy::drainRate([[maybe_unused]] const ParasiteAgent &agent) const {
  return m_tuning.drainRate;
}

float TargetingStrategy::fleeThreshold(
    [[maybe_unused]] const ParasiteAgent &agent) const {
  return m_tuning.fleeThreshold;
}

bool TargetingStrategy::permitsClass(UnitClass unitClass) const {
  const auto classes = targetPriorityClasses();
  return std::find(classes.begin(), classes.end(), unitClass) != classes.end();
}

bool TargetingStrategy::isWithinTerritoryRange(const ParasiteAgent &agent,
                                               const TargetRef &target) const {
  return Vector3D::planarDistance(target.getPosition(),
                                  agent.getTerritoryCenter()) <=
         agent.getTerritoryRadius();
}

std::unique_ptr<TargetingStrategy> createStrategy(AgentVariant variant,
                                                  const AgentTuning &tuning) {
  switch (variant) {
  case AgentVariant::Basic:
    return std::make_unique<BasicStrategy>(tuning);
  case AgentVariant::Tactical:
    return std::make_unique<TacticalStrategy>(tuning);
  default:
    throw std::invalid_argument(std::format(
        "No targeting strategy for variant {}", static_cast<int>(variant)));
  }
}

} // namespace HiveEngine
