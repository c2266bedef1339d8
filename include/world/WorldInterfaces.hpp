/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WORLD_INTERFACES_HPP
#define WORLD_INTERFACES_HPP

#include "utils/Vector3D.hpp"
#include <optional>

namespace HiveEngine {

class ITerrainHeightProvider {
public:
  virtual ~ITerrainHeightProvider() = default;
  virtual float heightAt(float x, float z) const = 0;
};

// Camera or player focus; nullopt when nothing is being observed
class IViewpointProvider {
public:
  virtual ~IViewpointProvider() = default;
  virtual std::optional<Vector3D> getViewpoint() const = 0;
};

class IFrameRateSource {
public:
  virtual ~IFrameRateSource() = default;
  virtual float getCurrentFPS() const = 0;
};

} // namespace HiveEngine

#endif // WORLD_INTERFACES_HPP
