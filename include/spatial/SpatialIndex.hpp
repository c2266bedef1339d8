/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPATIAL_INDEX_HPP
#define SPATIAL_INDEX_HPP

#include "ai/AgentTypes.hpp"
#include "utils/Vector3D.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace HiveEngine {

enum class SpatialTag : uint8_t {
  BasicAgent = 0,
  TacticalAgent,
  Worker,
  Protector
};

// Agents and units keep separate id spaces, so entries are keyed by (id, tag)
struct SpatialEntry {
  uint64_t id;
  SpatialTag tag;

  bool operator==(const SpatialEntry &other) const = default;
};

inline SpatialTag spatialTagFor(AgentVariant variant) {
  return variant == AgentVariant::Tactical ? SpatialTag::TacticalAgent
                                           : SpatialTag::BasicAgent;
}

inline SpatialTag spatialTagFor(UnitClass unitClass) {
  return unitClass == UnitClass::Protector ? SpatialTag::Protector
                                           : SpatialTag::Worker;
}

/**
 * @brief Proximity index consulted by the scheduler. Optional collaborator.
 */
class ISpatialIndex {
public:
  virtual ~ISpatialIndex() = default;

  virtual void insert(uint64_t id, SpatialTag tag, const Vector3D &position) = 0;
  virtual void remove(uint64_t id, SpatialTag tag) = 0;
  virtual void updatePosition(uint64_t id, SpatialTag tag,
                              const Vector3D &position) = 0;

  /**
   * @brief Appends entries within radius of center whose tag is in tags
   *
   * An empty tag list matches every tag. out is not cleared.
   */
  virtual void queryInRadius(const Vector3D &center, float radius,
                             std::span<const SpatialTag> tags,
                             std::vector<SpatialEntry> &out) const = 0;
};

} // namespace HiveEngine

#endif // SPATIAL_INDEX_HPP
