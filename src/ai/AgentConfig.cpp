/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/AgentConfig.hpp"
#include <format>
#include <stdexcept>

namespace HiveEngine {

namespace {
void requirePositive(float value, std::string_view section, std::string_view field) {
  if (!(value > 0.0f)) {
    throw std::invalid_argument(
        std::format("{}.{} must be positive, got {}", section, field, value));
  }
}

void requireNonNegative(float value, std::string_view section,
                        std::string_view field) {
  if (!(value >= 0.0f)) {
    throw std::invalid_argument(
        std::format("{}.{} must not be negative, got {}", section, field, value));
  }
}

void requireFraction(float value, std::string_view section, std::string_view field) {
  if (!(value >= 0.0f && value <= 1.0f)) {
    throw std::invalid_argument(
        std::format("{}.{} must be within [0, 1], got {}", section, field, value));
  }
}
} // namespace

void validateTuning(const AgentTuning &tuning, std::string_view label) {
  if (tuning.maxHealth <= 0) {
    throw std::invalid_argument(
        std::format("{}.maxHealth must be positive, got {}", label, tuning.maxHealth));
  }
  requirePositive(tuning.speed, label, "speed");
  requirePositive(tuning.territoryRadius, label, "territoryRadius");
  requirePositive(tuning.pursuitDistance, label, "pursuitDistance");
  requirePositive(tuning.engagementDistance, label, "engagementDistance");
  requirePositive(tuning.searchRadiusMultiplier, label, "searchRadiusMultiplier");
  requirePositive(tuning.arrivalDistance, label, "arrivalDistance");

  requireNonNegative(tuning.regenRate, label, "regenRate");
  requireNonNegative(tuning.maxLifetimeWithoutFeeding, label,
                     "maxLifetimeWithoutFeeding");
  requireNonNegative(tuning.spawnDelay, label, "spawnDelay");
  requireNonNegative(tuning.patrolPauseMin, label, "patrolPauseMin");
  requireNonNegative(tuning.patrolPauseJitter, label, "patrolPauseJitter");
  requireNonNegative(tuning.drainRate, label, "drainRate");
  requireNonNegative(tuning.fleeDistance, label, "fleeDistance");
  requireNonNegative(tuning.attackDamage, label, "attackDamage");
  requireNonNegative(tuning.switchCooldown, label, "switchCooldown");
  requireNonNegative(tuning.lockDuration, label, "lockDuration");
  requirePositive(tuning.aggressionInterval, label, "aggressionInterval");

  requireFraction(tuning.patrolRadiusFraction, label, "patrolRadiusFraction");
  requireFraction(tuning.fleeThreshold, label, "fleeThreshold");
  requireFraction(tuning.retreatThreshold, label, "retreatThreshold");
  requireFraction(tuning.initialAggression, label, "initialAggression");
  requireFraction(tuning.secondaryClassGate, label, "secondaryClassGate");

  if (tuning.disengageDistance < tuning.engagementDistance) {
    throw std::invalid_argument(std::format(
        "{}.disengageDistance ({}) must not be below engagementDistance ({})", label,
        tuning.disengageDistance, tuning.engagementDistance));
  }
  if (tuning.minSpeedMultiplier <= 0.0f ||
      tuning.maxSpeedMultiplier < tuning.minSpeedMultiplier) {
    throw std::invalid_argument(
        std::format("{}: speed multipliers must satisfy 0 < min <= max, got [{}, {}]",
                    label, tuning.minSpeedMultiplier, tuning.maxSpeedMultiplier));
  }
}

void validateConfig(const SimulationConfig &config) {
  validateTuning(config.basicAgent, "basic_agent");
  validateTuning(config.tacticalAgent, "tactical_agent");

  requirePositive(config.scheduler.viewRadius, "scheduler", "viewRadius");

  const GovernorConfig &gov = config.governor;
  requirePositive(gov.checkInterval, "governor", "checkInterval");
  if (gov.absoluteMinCap < 1 || gov.absoluteMaxCap < gov.absoluteMinCap) {
    throw std::invalid_argument(
        std::format("governor cap bounds must satisfy 1 <= min <= max, got [{}, {}]",
                    gov.absoluteMinCap, gov.absoluteMaxCap));
  }
  if (gov.initialCap < gov.absoluteMinCap || gov.initialCap > gov.absoluteMaxCap) {
    throw std::invalid_argument(std::format(
        "governor.initialCap {} outside [{}, {}]", gov.initialCap,
        gov.absoluteMinCap, gov.absoluteMaxCap));
  }
  if (gov.aggressiveFps > gov.basicFps || gov.basicFps > gov.recoveredFps) {
    throw std::invalid_argument(std::format(
        "governor fps thresholds must be ordered aggressive <= basic <= recovered, "
        "got {} / {} / {}",
        gov.aggressiveFps, gov.basicFps, gov.recoveredFps));
  }
  requireFraction(gov.aggressiveCapFactor, "governor", "aggressiveCapFactor");
  requireFraction(gov.basicCapFactor, "governor", "basicCapFactor");

  requirePositive(config.control.reconcileInterval, "control", "reconcileInterval");
  requirePositive(config.control.territorySize, "control", "territorySize");
  if (config.control.maxControlledPerController <= 0) {
    throw std::invalid_argument(
        std::format("control.maxControlledPerController must be positive, got {}",
                    config.control.maxControlledPerController));
  }
  requireFraction(config.tacticalSpawnShare, "simulation", "tacticalSpawnShare");
}

} // namespace HiveEngine
