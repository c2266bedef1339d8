/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BASIC_STRATEGY_HPP
#define BASIC_STRATEGY_HPP

#include "ai/TargetingStrategy.hpp"

namespace HiveEngine {

/**
 * @brief Worker-only targeting with fixed tuning.
 *
 * Locks the first eligible worker inside the territory, never switches, and
 * heads home when the target strays beyond pursuit range.
 */
class BasicStrategy : public TargetingStrategy {
public:
  explicit BasicStrategy(const AgentTuning &tuning = AgentTuning::basic());

  std::span<const UnitClass> targetPriorityClasses() const override;

  std::optional<TargetRef> selectTarget(const ParasiteAgent &agent,
                                        const CandidateSet &candidates) override;

  std::string getName() const override { return "Basic"; }
  std::unique_ptr<TargetingStrategy> clone() const override;
};

} // namespace HiveEngine

#endif // BASIC_STRATEGY_HPP
