/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CHUNK_SPATIAL_INDEX_HPP
#define CHUNK_SPATIAL_INDEX_HPP

#include "spatial/SpatialIndex.hpp"
#include <cstdint>
#include <functional>
#include <unordered_map>
#include <vector>

namespace HiveEngine {

/**
 * @brief Uniform chunk grid on the x/z plane.
 *
 * Each entry lives in exactly one chunk. updatePosition() only touches chunk
 * membership when the entry crosses a chunk border.
 */
class ChunkSpatialIndex : public ISpatialIndex {
public:
  struct Stats {
    size_t entityCount{0};
    size_t chunkCount{0};
    float averagePerChunk{0.0f};
  };

  explicit ChunkSpatialIndex(float chunkSize = 64.0f);

  void insert(uint64_t id, SpatialTag tag, const Vector3D &position) override;
  void remove(uint64_t id, SpatialTag tag) override;
  void updatePosition(uint64_t id, SpatialTag tag,
                      const Vector3D &position) override;
  void queryInRadius(const Vector3D &center, float radius,
                     std::span<const SpatialTag> tags,
                     std::vector<SpatialEntry> &out) const override;

  bool contains(uint64_t id, SpatialTag tag) const;
  Stats getStats() const;
  float getChunkSize() const { return m_chunkSize; }
  void clear();

private:
  struct ChunkCoord {
    int x;
    int z;
    bool operator==(const ChunkCoord &other) const = default;
  };
  struct ChunkCoordHash {
    size_t operator()(const ChunkCoord &c) const noexcept {
      return (static_cast<uint64_t>(static_cast<uint32_t>(c.x)) << 32) ^
             static_cast<uint32_t>(c.z);
    }
  };
  struct EntryHash {
    size_t operator()(const SpatialEntry &e) const noexcept {
      return std::hash<uint64_t>{}(e.id) ^
             (static_cast<size_t>(e.tag) << 56);
    }
  };
  struct Record {
    Vector3D position;
    ChunkCoord chunk;
  };

  ChunkCoord chunkFor(const Vector3D &position) const;
  void detachFromChunk(const SpatialEntry &entry, const ChunkCoord &chunk);

  float m_chunkSize;
  std::unordered_map<SpatialEntry, Record, EntryHash> m_records;
  std::unordered_map<ChunkCoord, std::vector<SpatialEntry>, ChunkCoordHash> m_chunks;
};

} // namespace HiveEngine

#endif // CHUNK_SPATIAL_INDEX_HPP
