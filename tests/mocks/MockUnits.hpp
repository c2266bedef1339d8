/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MOCK_UNITS_HPP
#define MOCK_UNITS_HPP

#include "ai/TargetUnit.hpp"
#include "world/WorldInterfaces.hpp"
#include <algorithm>
#include <optional>

// Worker with directly settable energy; records flee requests
class MockWorker : public HiveEngine::IWorkerUnit {
public:
  MockWorker(HiveEngine::UnitID id, const Vector3D &position, float energy = 10.0f,
             float capacity = 10.0f)
      : m_id(id), m_position(position), m_energy(energy), m_capacity(capacity) {}

  HiveEngine::UnitID getId() const override { return m_id; }
  Vector3D getPosition() const override { return m_position; }
  bool canBeTargeted() const override { return m_targetable && m_energy > 0.0f; }
  float getEnergy() const override { return m_energy; }
  float getEnergyCapacity() const override { return m_capacity; }

  float drainEnergy(float amount) override {
    const float drained = std::min(amount, m_energy);
    m_energy -= drained;
    totalDrained += drained;
    return drained;
  }

  void fleeFrom(const Vector3D &threat, float distance) override {
    ++fleeCount;
    lastFleeDistance = distance;
    const Vector3D away = (m_position - threat).normalized();
    m_position += Vector3D(away.getX(), 0.0f, away.getZ()) * distance;
  }

  void setPosition(const Vector3D &position) { m_position = position; }
  void setEnergy(float energy) { m_energy = energy; }
  void setTargetable(bool targetable) { m_targetable = targetable; }

  int fleeCount{0};
  float lastFleeDistance{0.0f};
  float totalDrained{0.0f};

private:
  HiveEngine::UnitID m_id;
  Vector3D m_position;
  float m_energy;
  float m_capacity;
  bool m_targetable{true};
};

class MockProtector : public HiveEngine::IProtectorUnit {
public:
  MockProtector(HiveEngine::UnitID id, const Vector3D &position, float health = 10.0f,
                float maxHealth = 10.0f)
      : m_id(id), m_position(position), m_health(health), m_maxHealth(maxHealth) {}

  HiveEngine::UnitID getId() const override { return m_id; }
  Vector3D getPosition() const override { return m_position; }
  float getHealth() const override { return m_health; }
  float getMaxHealth() const override { return m_maxHealth; }

  void takeDamage(float amount) override {
    totalDamage += amount;
    m_health = std::max(0.0f, m_health - amount);
  }

  void setPosition(const Vector3D &position) { m_position = position; }
  void setHealth(float health) { m_health = health; }

  float totalDamage{0.0f};

private:
  HiveEngine::UnitID m_id;
  Vector3D m_position;
  float m_health;
  float m_maxHealth;
};

class FlatTerrain : public HiveEngine::ITerrainHeightProvider {
public:
  explicit FlatTerrain(float height = 0.0f) : m_height(height) {}
  float heightAt(float, float) const override { return m_height; }

private:
  float m_height;
};

class MockViewpoint : public HiveEngine::IViewpointProvider {
public:
  explicit MockViewpoint(std::optional<Vector3D> position = Vector3D(0.0f, 0.0f, 0.0f))
      : m_position(position) {}
  std::optional<Vector3D> getViewpoint() const override { return m_position; }
  void setViewpoint(std::optional<Vector3D> position) { m_position = position; }

private:
  std::optional<Vector3D> m_position;
};

class MockFrameRate : public HiveEngine::IFrameRateSource {
public:
  explicit MockFrameRate(float fps = 60.0f) : m_fps(fps) {}
  float getCurrentFPS() const override { return m_fps; }
  void setFPS(float fps) { m_fps = fps; }

private:
  float m_fps;
};

#endif // MOCK_UNITS_HPP
