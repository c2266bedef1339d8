/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/ParasiteAgent.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <numbers>
#include <stdexcept>

namespace HiveEngine {

namespace {
uint32_t seedFromId(AgentID id) {
  // Knuth multiplicative hash keeps neighbouring ids on different sequences
  return static_cast<uint32_t>(id * 2654435761ULL) | 1u;
}
} // namespace

ParasiteAgent::ParasiteAgent(AgentID id, AgentVariant variant,
                             const Vector3D &spawnPosition,
                             const AgentTuning &tuning,
                             std::unique_ptr<TargetingStrategy> strategy,
                             uint32_t seed)
    : m_id(id), m_variant(variant), m_tuning(tuning),
      mp_strategy(std::move(strategy)), m_position(spawnPosition),
      m_health(tuning.maxHealth), m_territoryCenter(spawnPosition),
      m_territoryRadius(tuning.territoryRadius), m_patrolTarget(spawnPosition),
      m_rng(seed != 0 ? seed : seedFromId(id)) {
  if (!mp_strategy) {
    throw std::invalid_argument(
        std::format("Agent {} created without a targeting strategy", id));
  }
  validateTuning(m_tuning, toString(variant));

  m_patrolTarget = generatePatrolWaypoint();
}

// ---------------------------------------------------------------------------
// Update loop
// ---------------------------------------------------------------------------

void ParasiteAgent::update(const AgentUpdateContext &ctx) {
  if (!isAlive()) {
    return;
  }

  const float deltaTime = std::max(0.0f, ctx.deltaTime);
  m_simTime += deltaTime;
  m_movedThisTick = false;

  if (m_tuning.maxLifetimeWithoutFeeding > 0.0f &&
      m_simTime - m_lastFeedTime > m_tuning.maxLifetimeWithoutFeeding) {
    AGENT_DEBUG(std::format("Agent {} starved after {:.1f}s without feeding",
                            m_id, m_simTime - m_lastFeedTime));
    m_starved = true;
    m_health = 0;
    m_lockedTarget.reset();
    return;
  }

  mp_strategy->onTick(*this, ctx.candidates, deltaTime);

  switch (m_state) {
  case AgentState::Spawning:
    updateSpawning();
    break;
  case AgentState::Patrolling:
    updatePatrolling(ctx);
    break;
  case AgentState::Hunting:
    updateHunting(ctx);
    break;
  case AgentState::Feeding:
    updateFeeding(ctx);
    break;
  case AgentState::Returning:
    updateReturning(ctx);
    break;
  default:
    setState(AgentState::Patrolling);
    break;
  }
}

void ParasiteAgent::updateSpawning() {
  if (m_simTime - m_stateChangeTime >= m_tuning.spawnDelay) {
    setState(AgentState::Patrolling);
  }
}

void ParasiteAgent::updatePatrolling(const AgentUpdateContext &ctx) {
  if (auto target = mp_strategy->selectTarget(*this, ctx.candidates)) {
    lockTarget(*target);
    setState(AgentState::Hunting);
    return;
  }
  roam(ctx);
}

void ParasiteAgent::updateHunting(const AgentUpdateContext &ctx) {
  if (!m_lockedTarget) {
    setState(AgentState::Patrolling);
    return;
  }

  std::optional<TargetRef> target = ctx.units.resolve(*m_lockedTarget);
  if (!target) {
    releaseTarget(AgentState::Patrolling);
    return;
  }

  if (auto better = mp_strategy->reevaluateTarget(*this, *target, ctx.candidates)) {
    AGENT_DEBUG(std::format("Agent {} switching target {} -> {} ({})", m_id,
                            target->getId(), better->getId(),
                            toString(better->getClass())));
    lockTarget(*better);
    target = better;
  }

  if (!mp_strategy->isTargetValid(*this, *target)) {
    releaseTarget(AgentState::Patrolling);
    return;
  }

  const Vector3D targetPosition = target->getPosition();
  if (Vector3D::planarDistance(targetPosition, m_territoryCenter) >
      mp_strategy->pursuitDistance(*this)) {
    if (auto closer = mp_strategy->retargetWithinTerritory(*this, ctx.candidates)) {
      lockTarget(*closer);
    } else {
      releaseTarget(AgentState::Returning);
    }
    return;
  }

  if (Vector3D::planarDistance(m_position, targetPosition) <=
      m_tuning.engagementDistance) {
    setState(AgentState::Feeding);
    return;
  }

  moveTowards(targetPosition, mp_strategy->computeSpeed(*this), ctx.deltaTime,
              ctx.terrain);
}

void ParasiteAgent::updateFeeding(const AgentUpdateContext &ctx) {
  if (!m_lockedTarget) {
    setState(AgentState::Patrolling);
    return;
  }

  std::optional<TargetRef> target = ctx.units.resolve(*m_lockedTarget);
  if (!target || !target->isEligible()) {
    releaseTarget(AgentState::Patrolling);
    return;
  }

  if (Vector3D::planarDistance(m_position, target->getPosition()) >
      m_tuning.disengageDistance) {
    releaseTarget(AgentState::Patrolling);
    return;
  }

  if (target->getClass() == UnitClass::Protector) {
    attackProtector(*target, ctx.deltaTime);
  } else {
    feedOnWorker(*target, ctx.deltaTime);
  }
}

void ParasiteAgent::updateReturning(const AgentUpdateContext &ctx) {
  moveTowards(m_territoryCenter, mp_strategy->computeSpeed(*this), ctx.deltaTime,
              ctx.terrain);

  if (Vector3D::planarDistance(m_position, m_territoryCenter) <=
      m_territoryRadius * 0.5f) {
    setState(AgentState::Patrolling);
  }
}

// ---------------------------------------------------------------------------
// Patrol and feeding helpers
// ---------------------------------------------------------------------------

void ParasiteAgent::roam(const AgentUpdateContext &ctx) {
  if (m_patrolPaused) {
    m_pauseRemaining -= ctx.deltaTime;
    regenerate(ctx.deltaTime);
    if (m_pauseRemaining <= 0.0f) {
      m_patrolPaused = false;
      m_patrolTarget = generatePatrolWaypoint();
    }
    return;
  }

  if (Vector3D::planarDistance(m_position, m_patrolTarget) <
      m_tuning.arrivalDistance) {
    std::uniform_real_distribution<float> jitter(0.0f, m_tuning.patrolPauseJitter);
    m_patrolPaused = true;
    m_pauseRemaining = m_tuning.patrolPauseMin + jitter(m_rng);
    return;
  }

  moveTowards(m_patrolTarget, mp_strategy->computeSpeed(*this), ctx.deltaTime,
              ctx.terrain);
}

void ParasiteAgent::feedOnWorker(TargetRef &target, float deltaTime) {
  const float drained = target.consume(mp_strategy->drainRate(*this) * deltaTime);
  if (drained > 0.0f) {
    m_lastFeedTime = m_simTime;
  }

  if (target.getResourceFraction() < mp_strategy->fleeThreshold(*this)) {
    target.flee(m_position, m_tuning.fleeDistance);
    releaseTarget(AgentState::Patrolling);
  }
}

void ParasiteAgent::attackProtector(TargetRef &target, float deltaTime) {
  const float damage = m_tuning.attackDamage * deltaTime;
  const float health = target.getHealth().value_or(0.0f);
  const float threshold = damage * 3.0f;

  // Ease off near the kill so the final blow lands over a few ticks
  float applied = damage;
  if (threshold > 0.0f && health <= threshold) {
    applied = damage * std::max(0.3f, health / threshold);
  }

  target.consume(applied);
  m_lastFeedTime = m_simTime;

  if (target.getHealth().value_or(0.0f) <= 0.0f) {
    AGENT_DEBUG(std::format("Agent {} destroyed protector {}", m_id, target.getId()));
    releaseTarget(AgentState::Patrolling);
  }
}

void ParasiteAgent::regenerate(float deltaTime) {
  if (m_tuning.regenRate <= 0.0f || m_health >= m_tuning.maxHealth) {
    return;
  }

  m_regenAccumulator += m_tuning.regenRate * deltaTime;
  const int whole = static_cast<int>(m_regenAccumulator);
  if (whole > 0) {
    m_health = std::min(m_tuning.maxHealth, m_health + whole);
    m_regenAccumulator -= static_cast<float>(whole);
  }
}

// ---------------------------------------------------------------------------
// Movement
// ---------------------------------------------------------------------------

bool ParasiteAgent::moveTowards(const Vector3D &destination, float speed,
                                float deltaTime,
                                const ITerrainHeightProvider *terrain) {
  const float dx = destination.getX() - m_position.getX();
  const float dz = destination.getZ() - m_position.getZ();
  const float distance = std::sqrt(dx * dx + dz * dz);

  if (distance < MIN_MOVE_DISTANCE || speed <= 0.0f || deltaTime <= 0.0f) {
    return false;
  }

  const float step = std::min(speed * deltaTime, distance);
  if (step <= MOVEMENT_EPSILON) {
    return false;
  }

  const float ratio = step / distance;
  const float newX = m_position.getX() + dx * ratio;
  const float newZ = m_position.getZ() + dz * ratio;
  m_position = Vector3D(newX, groundHeight(newX, newZ, terrain) + m_tuning.roamHeight,
                        newZ);

  const float targetFacing = std::atan2(dx, dz);
  float diff = targetFacing - m_facing;
  while (diff > std::numbers::pi_v<float>)
    diff -= 2.0f * std::numbers::pi_v<float>;
  while (diff < -std::numbers::pi_v<float>)
    diff += 2.0f * std::numbers::pi_v<float>;
  if (std::abs(diff) > FACING_THRESHOLD) {
    m_facing = targetFacing;
  }

  m_movedThisTick = true;
  return true;
}

Vector3D ParasiteAgent::generatePatrolWaypoint() {
  std::uniform_real_distribution<float> angleDist(0.0f, 2.0f * std::numbers::pi_v<float>);
  std::uniform_real_distribution<float> unitDist(0.0f, 1.0f);

  const float angle = angleDist(m_rng);
  const float radius = std::clamp(mp_strategy->patrolRadius(*this), 0.0f,
                                  m_territoryRadius);
  const float distance = unitDist(m_rng) * radius;

  return Vector3D(m_territoryCenter.getX() + std::cos(angle) * distance,
                  m_territoryCenter.getY(),
                  m_territoryCenter.getZ() + std::sin(angle) * distance);
}

float ParasiteAgent::groundHeight(float x, float z,
                                  const ITerrainHeightProvider *terrain) const {
  return terrain != nullptr ? terrain->heightAt(x, z)
                            : m_tuning.defaultTerrainHeight;
}

// ---------------------------------------------------------------------------
// Health and lifecycle
// ---------------------------------------------------------------------------

bool ParasiteAgent::takeDamage(int damage) {
  if (damage <= 0 || !isAlive()) {
    return !isAlive();
  }

  m_health = std::max(0, m_health - damage);
  if (m_health == 0) {
    m_lockedTarget.reset();
    AGENT_DEBUG(std::format("Agent {} destroyed", m_id));
  }
  return m_health <= 0;
}

void ParasiteAgent::respawn(const Vector3D &position) {
  m_health = m_tuning.maxHealth;
  m_regenAccumulator = 0.0f;
  m_starved = false;
  m_position = position;
  m_territoryCenter = position;
  m_lastFeedTime = m_simTime;
  m_lockedTarget.reset();
  m_patrolPaused = false;
  m_pauseRemaining = 0.0f;
  mp_strategy->reset();
  m_patrolTarget = generatePatrolWaypoint();

  m_state = AgentState::Patrolling;
  m_stateChangeTime = m_simTime;
  AGENT_DEBUG(std::format("Agent {} respawned at ({:.1f}, {:.1f})", m_id,
                          position.getX(), position.getZ()));
}

void ParasiteAgent::setTerritory(TerritoryID territoryId, const Vector3D &center,
                                 float radius) {
  if (radius <= 0.0f) {
    throw std::invalid_argument(
        std::format("Agent {}: territory radius must be positive, got {}", m_id,
                    radius));
  }
  m_territoryId = territoryId;
  m_territoryCenter = center;
  m_territoryRadius = radius;
  m_patrolTarget = generatePatrolWaypoint();
}

// ---------------------------------------------------------------------------
// State bookkeeping
// ---------------------------------------------------------------------------

void ParasiteAgent::setState(AgentState newState) {
  if (newState == m_state) {
    return;
  }
  AGENT_DEBUG(std::format("Agent {}: {} -> {}", m_id, toString(m_state),
                          toString(newState)));
  m_state = newState;
  m_stateChangeTime = m_simTime;
}

void ParasiteAgent::lockTarget(const TargetRef &target) {
  m_lockedTarget = target.getKey();
  m_lastLockTime = m_simTime;
  mp_strategy->onTargetLocked(*this, target);
}

void ParasiteAgent::releaseTarget(AgentState nextState) {
  m_lockedTarget.reset();
  setState(nextState);
}

} // namespace HiveEngine
