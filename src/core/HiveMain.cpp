/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/ConfigLoader.hpp"
#include "core/FrameClock.hpp"
#include "core/Logger.hpp"
#include "managers/SwarmSimulation.hpp"
#include "spatial/ChunkSpatialIndex.hpp"
#include "world/GridTerritoryAuthority.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <cmath>
#include <exception>
#include <format>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace {

const std::string DEMO_NAME{"Hive Swarm Demo"};
const std::string CONFIG_PATH{"res/hive_config.json"};
constexpr int DEMO_FRAMES{600};
constexpr int INITIAL_AGENTS{12};
constexpr int WORKER_COUNT{8};
constexpr int PROTECTOR_COUNT{3};

// Energy gatherer that slowly recharges
class DemoWorker : public HiveEngine::IWorkerUnit {
public:
  DemoWorker(HiveEngine::UnitID id, const Vector3D &position)
      : m_id(id), m_position(position) {}

  HiveEngine::UnitID getId() const override { return m_id; }
  Vector3D getPosition() const override { return m_position; }
  bool canBeTargeted() const override { return m_energy > 0.0f; }
  float getEnergy() const override { return m_energy; }
  float getEnergyCapacity() const override { return CAPACITY; }

  float drainEnergy(float amount) override {
    const float drained = std::min(amount, m_energy);
    m_energy -= drained;
    return drained;
  }

  void fleeFrom(const Vector3D &threat, float distance) override {
    const Vector3D away = (m_position - threat).normalized();
    m_position += Vector3D(away.getX(), 0.0f, away.getZ()) * distance;
  }

  void recharge(float deltaTime) {
    m_energy = std::min(CAPACITY, m_energy + RECHARGE_RATE * deltaTime);
  }

private:
  HiveEngine::UnitID m_id;
  Vector3D m_position;
  float m_energy{CAPACITY};

  static constexpr float CAPACITY = 20.0f;
  static constexpr float RECHARGE_RATE = 0.5f;
};

class DemoProtector : public HiveEngine::IProtectorUnit {
public:
  DemoProtector(HiveEngine::UnitID id, const Vector3D &position)
      : m_id(id), m_position(position) {}

  HiveEngine::UnitID getId() const override { return m_id; }
  Vector3D getPosition() const override { return m_position; }
  float getHealth() const override { return m_health; }
  float getMaxHealth() const override { return MAX_HEALTH; }
  void takeDamage(float amount) override { m_health = std::max(0.0f, m_health - amount); }

private:
  HiveEngine::UnitID m_id;
  Vector3D m_position;
  float m_health{MAX_HEALTH};

  static constexpr float MAX_HEALTH = 10.0f;
};

class FixedViewpoint : public HiveEngine::IViewpointProvider {
public:
  explicit FixedViewpoint(const Vector3D &position) : m_position(position) {}
  std::optional<Vector3D> getViewpoint() const override { return m_position; }

private:
  Vector3D m_position;
};

// Gentle rolling ground so height gluing is visible in the logs
class RollingTerrain : public HiveEngine::ITerrainHeightProvider {
public:
  float heightAt(float x, float z) const override {
    return 0.5f + 0.25f * std::sin(x * 0.05f) * std::cos(z * 0.05f);
  }
};

} // namespace

int main([[maybe_unused]] int argc, [[maybe_unused]] char *argv[]) {
  using namespace HiveEngine;

  SIMULATION_INFO(std::format("Initializing {}", DEMO_NAME));

  if (!SDL_Init(SDL_INIT_EVENTS)) {
    SIMULATION_CRITICAL(std::format("SDL_Init failed: {}", SDL_GetError()));
    return -1;
  }

  int exitCode = 0;
  try {
    SimulationConfig config;
    if (!ConfigLoader::loadFromFile(CONFIG_PATH, config)) {
      SIMULATION_WARN(std::format("Failed to load {} - using defaults", CONFIG_PATH));
    }

    GridTerritoryAuthority authority(
        config.control.territorySize,
        static_cast<size_t>(config.control.maxControlledPerController));
    Territory &home = authority.addTerritory(0, 0);
    authority.addTerritory(1, 0);
    authority.createController(home.id);

    SwarmSimulation simulation(config, authority);
    ChunkSpatialIndex spatialIndex;
    FixedViewpoint viewpoint(Vector3D(0.0f, 0.0f, 0.0f));
    RollingTerrain terrain;
    FrameClock clock(60.0f, 1.0f / 60.0f);

    simulation.setSpatialIndex(&spatialIndex);
    simulation.setViewpointProvider(&viewpoint);
    simulation.setTerrainProvider(&terrain);
    simulation.setFrameRateSource(&clock);
    simulation.setReapPolicy(AgentRegistry::ReapPolicy::RespawnAtHome);

    std::mt19937 rng(1337);
    std::uniform_real_distribution<float> spread(-40.0f, 40.0f);
    std::uniform_real_distribution<float> roll(0.0f, 1.0f);

    std::vector<std::unique_ptr<DemoWorker>> workers;
    std::vector<std::unique_ptr<DemoProtector>> protectors;
    for (int i = 0; i < WORKER_COUNT; ++i) {
      workers.push_back(std::make_unique<DemoWorker>(
          static_cast<UnitID>(i + 1), Vector3D(spread(rng), 0.5f, spread(rng))));
    }
    for (int i = 0; i < PROTECTOR_COUNT; ++i) {
      protectors.push_back(std::make_unique<DemoProtector>(
          static_cast<UnitID>(i + 1), Vector3D(spread(rng), 0.5f, spread(rng))));
    }

    for (int i = 0; i < INITIAL_AGENTS; ++i) {
      const AgentVariant variant = simulation.getRegistry().selectSpawnVariant(roll(rng));
      simulation.spawnAgent(variant, Vector3D(spread(rng), 1.5f, spread(rng)));
    }

    std::vector<IWorkerUnit *> workerViews;
    std::vector<IProtectorUnit *> protectorViews;

    for (int frame = 0; frame < DEMO_FRAMES; ++frame) {
      clock.startFrame();

      while (clock.shouldUpdate()) {
        const float dt = clock.getUpdateDeltaTime();

        workerViews.clear();
        for (auto &worker : workers) {
          worker->recharge(dt);
          workerViews.push_back(worker.get());
        }
        protectorViews.clear();
        for (auto &protector : protectors) {
          if (protector->getHealth() > 0.0f) {
            protectorViews.push_back(protector.get());
          }
        }

        simulation.update(dt, workerViews, protectorViews);
      }

      if (frame > 0 && frame % 120 == 0) {
        StatisticsCollector().logSnapshot(simulation.collectStatistics());
      }

      clock.endFrame();
    }

    // Controller falls: its territory is liberated and the agents inside die
    [[maybe_unused]] const size_t destroyed = simulation.onControllerDestroyed(home.id);
    if (!authority.removeController(home.id)) {
      SIMULATION_WARN(std::format("Territory {} had no controller to remove", home.id));
    }
    simulation.getRegistry().reapDeadAgents(AgentRegistry::ReapPolicy::Remove);

    SIMULATION_INFO(std::format("Controller of territory {} destroyed, {} agents lost", home.id,
                                destroyed));
    StatisticsCollector().logSnapshot(simulation.collectStatistics());
  } catch (const std::exception &e) {
    SIMULATION_CRITICAL(std::format("Fatal error: {}", e.what()));
    exitCode = -1;
  }

  SDL_Quit();
  return exitCode;
}
