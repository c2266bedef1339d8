/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GRID_TERRITORY_AUTHORITY_HPP
#define GRID_TERRITORY_AUTHORITY_HPP

#include "world/Territory.hpp"
#include "utils/UniqueID.hpp"
#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>

namespace HiveEngine {

/**
 * @brief Square territories laid out on an x/z grid.
 *
 * Territory (gx, gz) is centered at (gx * size, 0, gz * size). Territories and
 * their controllers are owned here; pointers handed out stay valid until
 * clear() or, for controllers, removeController().
 */
class GridTerritoryAuthority : public ITerritoryAuthority {
public:
  explicit GridTerritoryAuthority(float territorySize = 1024.0f,
                                  size_t maxControlledPerController = 100);

  /**
   * @brief Creates the territory covering grid cell (gridX, gridZ)
   * @return The new or already existing territory
   */
  Territory &addTerritory(int gridX, int gridZ);

  Territory *getTerritory(TerritoryID id);
  Territory *getTerritoryAt(float x, float z) override;
  std::vector<Territory *> getAllTerritories() override;

  /**
   * @brief Puts a new active controller in charge of a territory
   * @throws std::invalid_argument if the territory does not exist
   *
   * Any previous controller of that territory is discarded.
   */
  Controller &createController(TerritoryID territoryId);

  /**
   * @brief Removes a territory's controller and marks it liberated
   * @return false if the territory had no controller
   */
  bool removeController(TerritoryID territoryId);

  Controller *getController(ControllerID controllerId);
  std::vector<Controller *> getControllers();

  size_t getTerritoryCount() const { return m_territories.size(); }
  float getTerritorySize() const { return m_territorySize; }

  void clear();

private:
  struct GridCell {
    int x;
    int z;
    bool operator==(const GridCell &other) const = default;
  };
  struct GridCellHash {
    size_t operator()(const GridCell &c) const noexcept {
      return (static_cast<uint64_t>(static_cast<uint32_t>(c.x)) << 32) ^
             static_cast<uint32_t>(c.z);
    }
  };

  GridCell cellFor(float x, float z) const;

  float m_territorySize;
  size_t m_maxControlled;
  TerritoryID m_nextTerritoryId{1};
  UniqueID m_controllerIds;
  std::vector<std::unique_ptr<Territory>> m_territories;
  std::unordered_map<GridCell, Territory *, GridCellHash> m_cells;
  std::unordered_map<TerritoryID, std::unique_ptr<Controller>> m_controllers;
};

} // namespace HiveEngine

#endif // GRID_TERRITORY_AUTHORITY_HPP
