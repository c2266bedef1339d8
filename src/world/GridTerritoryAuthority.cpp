/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/GridTerritoryAuthority.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <format>
#include <stdexcept>

namespace HiveEngine {

GridTerritoryAuthority::GridTerritoryAuthority(float territorySize,
                                               size_t maxControlledPerController)
    : m_territorySize(territorySize),
      m_maxControlled(maxControlledPerController) {
  if (territorySize <= 0.0f) {
    throw std::invalid_argument(
        std::format("Territory size must be positive, got {}", territorySize));
  }
  if (maxControlledPerController == 0) {
    throw std::invalid_argument("Controller capacity must be at least 1");
  }
}

GridTerritoryAuthority::GridCell
GridTerritoryAuthority::cellFor(float x, float z) const {
  // Cells are centered on multiples of the territory size
  const float half = m_territorySize * 0.5f;
  return GridCell{static_cast<int>(std::floor((x + half) / m_territorySize)),
                  static_cast<int>(std::floor((z + half) / m_territorySize))};
}

Territory &GridTerritoryAuthority::addTerritory(int gridX, int gridZ) {
  const GridCell cell{gridX, gridZ};
  auto it = m_cells.find(cell);
  if (it != m_cells.end()) {
    return *it->second;
  }

  auto territory = std::make_unique<Territory>();
  territory->id = m_nextTerritoryId++;
  territory->center = Vector3D(static_cast<float>(gridX) * m_territorySize, 0.0f,
                               static_cast<float>(gridZ) * m_territorySize);
  territory->size = m_territorySize;

  Territory &ref = *territory;
  m_cells.emplace(cell, territory.get());
  m_territories.push_back(std::move(territory));

  TERRITORY_DEBUG(std::format("Territory {} created at grid ({}, {})", ref.id,
                              gridX, gridZ));
  return ref;
}

Territory *GridTerritoryAuthority::getTerritory(TerritoryID id) {
  for (auto &territory : m_territories) {
    if (territory->id == id) {
      return territory.get();
    }
  }
  return nullptr;
}

Territory *GridTerritoryAuthority::getTerritoryAt(float x, float z) {
  auto it = m_cells.find(cellFor(x, z));
  return it != m_cells.end() ? it->second : nullptr;
}

std::vector<Territory *> GridTerritoryAuthority::getAllTerritories() {
  std::vector<Territory *> result;
  result.reserve(m_territories.size());
  for (auto &territory : m_territories) {
    result.push_back(territory.get());
  }
  return result;
}

Controller &GridTerritoryAuthority::createController(TerritoryID territoryId) {
  Territory *territory = getTerritory(territoryId);
  if (territory == nullptr) {
    throw std::invalid_argument(
        std::format("Cannot create controller: unknown territory {}", territoryId));
  }

  auto controller = std::make_unique<Controller>(m_controllerIds.generate(),
                                                 *territory, m_maxControlled);
  Controller &ref = *controller;
  m_controllers[territoryId] = std::move(controller);

  territory->controller = &ref;
  territory->status = ControlStatus::ControllerOwned;
  territory->agentCount = 0;

  TERRITORY_INFO(std::format("Controller {} now owns territory {}", ref.getId(),
                             territoryId));
  return ref;
}

bool GridTerritoryAuthority::removeController(TerritoryID territoryId) {
  auto it = m_controllers.find(territoryId);
  if (it == m_controllers.end()) {
    return false;
  }

  Territory &territory = it->second->getTerritory();
  territory.controller = nullptr;
  territory.status = ControlStatus::Liberated;
  territory.agentCount = 0;

  TERRITORY_INFO(std::format("Territory {} liberated (controller {} removed)",
                             territoryId, it->second->getId()));
  m_controllers.erase(it);
  return true;
}

Controller *GridTerritoryAuthority::getController(ControllerID controllerId) {
  for (auto &[territoryId, controller] : m_controllers) {
    if (controller->getId() == controllerId) {
      return controller.get();
    }
  }
  return nullptr;
}

std::vector<Controller *> GridTerritoryAuthority::getControllers() {
  std::vector<Controller *> result;
  result.reserve(m_controllers.size());
  for (auto &[territoryId, controller] : m_controllers) {
    result.push_back(controller.get());
  }
  return result;
}

void GridTerritoryAuthority::clear() {
  m_controllers.clear();
  m_cells.clear();
  m_territories.clear();
  m_nextTerritoryId = 1;
  m_controllerIds.reset();
}

} // namespace HiveEngine
