/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/strategies/TacticalStrategy.hpp"
#include "ai/ParasiteAgent.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <array>
#include <format>

namespace HiveEngine {

namespace {
constexpr std::array<UnitClass, 2> TACTICAL_PRIORITY{UnitClass::Protector,
                                                     UnitClass::Worker};
}

TacticalStrategy::TacticalStrategy(const AgentTuning &tuning)
    : TargetingStrategy(tuning), m_aggression(tuning.initialAggression) {}

std::span<const UnitClass> TacticalStrategy::targetPriorityClasses() const {
  return TACTICAL_PRIORITY;
}

// ---------------------------------------------------------------------------
// Target selection
// ---------------------------------------------------------------------------

bool TacticalStrategy::inEngagementRange(const ParasiteAgent &agent,
                                         const TargetRef &target) const {
  return target.isEligible() && isWithinTerritoryRange(agent, target);
}

bool TacticalStrategy::workersAllowed() const {
  return m_aggression > m_tuning.secondaryClassGate;
}

std::optional<TargetRef>
TacticalStrategy::nearestOfClass(const ParasiteAgent &agent,
                                 const CandidateSet &candidates,
                                 UnitClass unitClass) const {
  std::optional<TargetRef> best;
  float bestDistSq = 0.0f;
  for (const TargetRef &candidate : candidates.ofClass(unitClass)) {
    if (!inEngagementRange(agent, candidate)) {
      continue;
    }
    const float distSq =
        Vector3D::planarDistanceSquared(agent.getPosition(), candidate.getPosition());
    if (!best || distSq < bestDistSq) {
      best = candidate;
      bestDistSq = distSq;
    }
  }
  return best;
}

std::optional<TargetRef>
TacticalStrategy::selectTarget(const ParasiteAgent &agent,
                               const CandidateSet &candidates) {
  if (auto protector = nearestOfClass(agent, candidates, UnitClass::Protector)) {
    return protector;
  }
  if (workersAllowed()) {
    return nearestOfClass(agent, candidates, UnitClass::Worker);
  }
  return std::nullopt;
}

std::optional<TargetRef>
TacticalStrategy::reevaluateTarget(const ParasiteAgent &agent,
                                   const TargetRef &current,
                                   const CandidateSet &candidates) {
  if (m_switchCooldown > 0.0f) {
    return std::nullopt;
  }
  m_switchCooldown = m_tuning.switchCooldown;

  if (current.getClass() == UnitClass::Worker) {
    // Protectors always outrank workers
    return nearestOfClass(agent, candidates, UnitClass::Protector);
  }

  if (agent.getSimTime() - agent.getLastLockTime() < m_tuning.lockDuration) {
    return std::nullopt;
  }

  const float margin = m_tuning.switchScoreMargin * (1.0f - 0.5f * m_aggression);
  const float currentScore = scoreTarget(agent, current);

  std::optional<TargetRef> best;
  float bestScore = currentScore + margin;
  for (const TargetRef &candidate : candidates.ofClass(UnitClass::Protector)) {
    if (candidate == current || !inEngagementRange(agent, candidate)) {
      continue;
    }
    const float score = scoreTarget(agent, candidate);
    if (score > bestScore) {
      best = candidate;
      bestScore = score;
    }
  }
  return best;
}

std::optional<TargetRef>
TacticalStrategy::retargetWithinTerritory(const ParasiteAgent &agent,
                                          const CandidateSet &candidates) {
  std::optional<TargetRef> best = nearestOfClass(agent, candidates, UnitClass::Protector);
  if (workersAllowed()) {
    auto worker = nearestOfClass(agent, candidates, UnitClass::Worker);
    if (worker &&
        (!best || Vector3D::planarDistanceSquared(agent.getPosition(),
                                                  worker->getPosition()) <
                      Vector3D::planarDistanceSquared(agent.getPosition(),
                                                      best->getPosition()))) {
      best = worker;
    }
  }
  return best;
}

bool TacticalStrategy::isTargetValid(const ParasiteAgent &agent,
                                     const TargetRef &target) const {
  return inEngagementRange(agent, target);
}

float TacticalStrategy::scoreTarget(const ParasiteAgent &agent,
                                    const TargetRef &target) const {
  const float maxDistance = agent.getTerritoryRadius();
  const float distance =
      Vector3D::planarDistance(agent.getPosition(), target.getPosition());
  float score = std::clamp(1.0f - distance / maxDistance, 0.0f, 1.0f);

  if (target.getClass() == UnitClass::Protector) {
    score += 0.5f;
  }
  score += 0.3f * (1.0f - std::clamp(target.getResourceFraction(), 0.0f, 1.0f));
  return score;
}

// ---------------------------------------------------------------------------
// Aggression-scaled tuning
// ---------------------------------------------------------------------------

float TacticalStrategy::computeSpeed([[maybe_unused]] const ParasiteAgent &agent) const {
  const float multiplier = std::clamp(0.85f + m_aggression * 0.3f,
                                      m_tuning.minSpeedMultiplier,
                                      m_tuning.maxSpeedMultiplier);
  return m_tuning.speed * multiplier;
}

float TacticalStrategy::patrolRadius(const ParasiteAgent &agent) const {
  return agent.getTerritoryRadius() * (0.65f + m_aggression * 0.25f);
}

float TacticalStrategy::pursuitDistance(
    [[maybe_unused]] const ParasiteAgent &agent) const {
  return m_tuning.pursuitDistance * m_aggression;
}

float TacticalStrategy::drainRate([[maybe_unused]] const ParasiteAgent &agent) const {
  return m_tuning.drainRate * (0.8f + m_aggression * 0.4f);
}

float TacticalStrategy::fleeThreshold(
    [[maybe_unused]] const ParasiteAgent &agent) const {
  return m_tuning.fleeThreshold + m_aggression * 0.1f;
}

float TacticalStrategy::computeTargetAggression(const ParasiteAgent &agent,
                                                const CandidateSet &candidates) const {
  float aggression = BASE_AGGRESSION;

  const float healthRatio = agent.getHealthRatio();
  if (healthRatio < m_tuning.retreatThreshold) {
    aggression *= 0.4f;
  } else if (healthRatio < 0.5f) {
    aggression *= 0.75f;
  }

  size_t targetsInRange = 0;
  bool protectorsPresent = false;
  for (const TargetRef &protector : candidates.ofClass(UnitClass::Protector)) {
    if (inEngagementRange(agent, protector)) {
      ++targetsInRange;
      protectorsPresent = true;
    }
  }
  for (const TargetRef &worker : candidates.ofClass(UnitClass::Worker)) {
    if (inEngagementRange(agent, worker)) {
      ++targetsInRange;
    }
  }

  if (targetsInRange > 2) {
    aggression = std::min(AGGRESSION_CAP, aggression * 1.15f);
  }
  if (protectorsPresent) {
    aggression = std::min(AGGRESSION_CAP, aggression * 1.08f);
  }
  if (m_hasLocked &&
      agent.getSimTime() - agent.getLastLockTime() < m_tuning.lockDuration) {
    aggression *= 0.95f;
  }
  return aggression;
}

void TacticalStrategy::setAggression(float aggression) {
  m_aggression = std::clamp(aggression, 0.0f, 1.0f);
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

void TacticalStrategy::onTick(const ParasiteAgent &agent,
                              const CandidateSet &candidates, float deltaTime) {
  m_switchCooldown = std::max(0.0f, m_switchCooldown - deltaTime);

  m_aggressionTimer += deltaTime;
  if (m_aggressionTimer < m_tuning.aggressionInterval) {
    return;
  }
  m_aggressionTimer = 0.0f;

  const float target = computeTargetAggression(agent, candidates);
  const float previous = m_aggression;
  m_aggression = std::clamp(previous * (1.0f - AGGRESSION_BLEND) +
                                target * AGGRESSION_BLEND,
                            0.0f, 1.0f);
  STRATEGY_DEBUG(std::format("Agent {} aggression {:.3f} -> {:.3f}", agent.getId(),
                             previous, m_aggression));
}

void TacticalStrategy::onTargetLocked([[maybe_unused]] const ParasiteAgent &agent,
                                      [[maybe_unused]] const TargetRef &target) {
  m_hasLocked = true;
  m_switchCooldown = m_tuning.switchCooldown;
}

void TacticalStrategy::reset() {
  m_aggression = m_tuning.initialAggression;
  m_aggressionTimer = 0.0f;
  m_switchCooldown = 0.0f;
  m_hasLocked = false;
}

std::unique_ptr<TargetingStrategy> TacticalStrategy::clone() const {
  auto copy = std::make_unique<TacticalStrategy>(m_tuning);
  copy->m_aggression = m_aggression;
  return copy;
}

} // namespace HiveEngine
