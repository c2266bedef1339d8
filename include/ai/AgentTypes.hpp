/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AGENT_TYPES_HPP
#define AGENT_TYPES_HPP

#include "utils/UniqueID.hpp"
#include <cstdint>
#include <ostream>

namespace HiveEngine {

using AgentID = UniqueID::IDType;
using ControllerID = UniqueID::IDType;
using UnitID = uint64_t;
using TerritoryID = uint32_t;

constexpr TerritoryID INVALID_TERRITORY = 0;

enum class AgentState : uint8_t {
  Spawning = 0,
  Patrolling,
  Hunting,
  Feeding,
  Returning,
  COUNT
};

enum class AgentVariant : uint8_t {
  Basic = 0,    // Drains workers only
  Tactical,     // Fights protectors first, workers when aggressive
  COUNT
};

enum class UnitClass : uint8_t {
  Worker = 0,
  Protector,
  COUNT
};

enum class FidelityTier : uint8_t {
  Full = 0,
  Reduced,
  Minimal,
  Hidden,
  COUNT
};

inline const char *toString(AgentState state) {
  switch (state) {
  case AgentState::Spawning:
    return "Spawning";
  case AgentState::Patrolling:
    return "Patrolling";
  case AgentState::Hunting:
    return "Hunting";
  case AgentState::Feeding:
    return "Feeding";
  case AgentState::Returning:
    return "Returning";
  default:
    return "Unknown";
  }
}

inline const char *toString(AgentVariant variant) {
  switch (variant) {
  case AgentVariant::Basic:
    return "Basic";
  case AgentVariant::Tactical:
    return "Tactical";
  default:
    return "Unknown";
  }
}

inline const char *toString(UnitClass unitClass) {
  switch (unitClass) {
  case UnitClass::Worker:
    return "Worker";
  case UnitClass::Protector:
    return "Protector";
  default:
    return "Unknown";
  }
}

inline const char *toString(FidelityTier tier) {
  switch (tier) {
  case FidelityTier::Full:
    return "Full";
  case FidelityTier::Reduced:
    return "Reduced";
  case FidelityTier::Minimal:
    return "Minimal";
  case FidelityTier::Hidden:
    return "Hidden";
  default:
    return "Unknown";
  }
}

// Stream operators for Boost.Test
inline std::ostream &operator<<(std::ostream &os, AgentState state) {
  return os << toString(state);
}
inline std::ostream &operator<<(std::ostream &os, AgentVariant variant) {
  return os << toString(variant);
}
inline std::ostream &operator<<(std::ostream &os, UnitClass unitClass) {
  return os << toString(unitClass);
}
inline std::ostream &operator<<(std::ostream &os, FidelityTier tier) {
  return os << toString(tier);
}

} // namespace HiveEngine

#endif // AGENT_TYPES_HPP
