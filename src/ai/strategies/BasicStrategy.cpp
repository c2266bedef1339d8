/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/strategies/BasicStrategy.hpp"
#include "ai/ParasiteAgent.hpp"
#include <array>

namespace HiveEngine {

namespace {
constexpr std::array<UnitClass, 1> BASIC_PRIORITY{UnitClass::Worker};
}

BasicStrategy::BasicStrategy(const AgentTuning &tuning)
    : TargetingStrategy(tuning) {}

std::span<const UnitClass> BasicStrategy::targetPriorityClasses() const {
  return BASIC_PRIORITY;
}

std::optional<TargetRef> BasicStrategy::selectTarget(const ParasiteAgent &agent,
                                                     const CandidateSet &candidates) {
  for (const TargetRef &worker : candidates.ofClass(UnitClass::Worker)) {
    if (worker.isEligible() && isWithinTerritoryRange(agent, worker)) {
      return worker;
    }
  }
  return std::nullopt;
}

std::unique_ptr<TargetingStrategy> BasicStrategy::clone() const {
  return std::make_unique<BasicStrategy>(m_tuning);
}

} // namespace HiveEngine
