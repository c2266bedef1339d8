/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "spatial/ChunkSpatialIndex.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>

namespace HiveEngine {

ChunkSpatialIndex::ChunkSpatialIndex(float chunkSize) : m_chunkSize(chunkSize) {
  if (chunkSize <= 0.0f) {
    throw std::invalid_argument(
        std::format("Chunk size must be positive, got {}", chunkSize));
  }
}

ChunkSpatialIndex::ChunkCoord
ChunkSpatialIndex::chunkFor(const Vector3D &position) const {
  return ChunkCoord{static_cast<int>(std::floor(position.getX() / m_chunkSize)),
                    static_cast<int>(std::floor(position.getZ() / m_chunkSize))};
}

void ChunkSpatialIndex::insert(uint64_t id, SpatialTag tag,
                               const Vector3D &position) {
  const SpatialEntry entry{id, tag};
  if (m_records.find(entry) != m_records.end()) {
    updatePosition(id, tag, position);
    return;
  }

  const ChunkCoord chunk = chunkFor(position);
  m_records.emplace(entry, Record{position, chunk});
  m_chunks[chunk].push_back(entry);
}

void ChunkSpatialIndex::remove(uint64_t id, SpatialTag tag) {
  const SpatialEntry entry{id, tag};
  auto it = m_records.find(entry);
  if (it == m_records.end()) {
    return;
  }
  detachFromChunk(entry, it->second.chunk);
  m_records.erase(it);
}

void ChunkSpatialIndex::updatePosition(uint64_t id, SpatialTag tag,
                                       const Vector3D &position) {
  const SpatialEntry entry{id, tag};
  auto it = m_records.find(entry);
  if (it == m_records.end()) {
    SPATIAL_DEBUG(std::format("updatePosition for unknown entry {}, inserting", id));
    insert(id, tag, position);
    return;
  }

  Record &record = it->second;
  record.position = position;

  const ChunkCoord chunk = chunkFor(position);
  if (chunk == record.chunk) {
    return;
  }
  detachFromChunk(entry, record.chunk);
  m_chunks[chunk].push_back(entry);
  record.chunk = chunk;
}

void ChunkSpatialIndex::queryInRadius(const Vector3D &center, float radius,
                                      std::span<const SpatialTag> tags,
                                      std::vector<SpatialEntry> &out) const {
  if (radius < 0.0f) {
    return;
  }

  const float radiusSq = radius * radius;
  const int minX = static_cast<int>(std::floor((center.getX() - radius) / m_chunkSize));
  const int maxX = static_cast<int>(std::floor((center.getX() + radius) / m_chunkSize));
  const int minZ = static_cast<int>(std::floor((center.getZ() - radius) / m_chunkSize));
  const int maxZ = static_cast<int>(std::floor((center.getZ() + radius) / m_chunkSize));

  for (int cx = minX; cx <= maxX; ++cx) {
    for (int cz = minZ; cz <= maxZ; ++cz) {
      auto chunkIt = m_chunks.find(ChunkCoord{cx, cz});
      if (chunkIt == m_chunks.end()) {
        continue;
      }
      for (const SpatialEntry &entry : chunkIt->second) {
        if (!tags.empty() &&
            std::find(tags.begin(), tags.end(), entry.tag) == tags.end()) {
          continue;
        }
        const Record &record = m_records.at(entry);
        if (Vector3D::planarDistanceSquared(record.position, center) <= radiusSq) {
          out.push_back(entry);
        }
      }
    }
  }
}

bool ChunkSpatialIndex::contains(uint64_t id, SpatialTag tag) const {
  return m_records.find(SpatialEntry{id, tag}) != m_records.end();
}

ChunkSpatialIndex::Stats ChunkSpatialIndex::getStats() const {
  Stats stats;
  stats.entityCount = m_records.size();
  stats.chunkCount = m_chunks.size();
  if (stats.chunkCount > 0) {
    stats.averagePerChunk = static_cast<float>(stats.entityCount) /
                            static_cast<float>(stats.chunkCount);
  }
  return stats;
}

void ChunkSpatialIndex::clear() {
  m_records.clear();
  m_chunks.clear();
}

void ChunkSpatialIndex::detachFromChunk(const SpatialEntry &entry,
                                        const ChunkCoord &chunk) {
  auto chunkIt = m_chunks.find(chunk);
  if (chunkIt == m_chunks.end()) {
    return;
  }

  auto &entries = chunkIt->second;
  auto it = std::find(entries.begin(), entries.end(), entry);
  if (it != entries.end()) {
    // Order inside a chunk is irrelevant
    *it = entries.back();
    entries.pop_back();
  }
  if (entries.empty()) {
    m_chunks.erase(chunkIt);
  }
}

} // namespace HiveEngine
