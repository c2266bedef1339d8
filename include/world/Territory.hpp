/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TERRITORY_HPP
#define TERRITORY_HPP

#include "ai/AgentTypes.hpp"
#include "utils/Vector3D.hpp"
#include <boost/container/flat_set.hpp>
#include <cstdint>
#include <ostream>
#include <vector>

namespace HiveEngine {

class Controller;

enum class ControlStatus : uint8_t {
  Contested = 0,
  ControllerOwned,
  Liberated
};

inline const char *toString(ControlStatus status) {
  switch (status) {
  case ControlStatus::Contested:
    return "Contested";
  case ControlStatus::ControllerOwned:
    return "ControllerOwned";
  case ControlStatus::Liberated:
    return "Liberated";
  default:
    return "Unknown";
  }
}

inline std::ostream &operator<<(std::ostream &os, ControlStatus status) {
  return os << toString(status);
}

struct Territory {
  TerritoryID id{INVALID_TERRITORY};
  Vector3D center;
  float size{1024.0f};
  ControlStatus status{ControlStatus::Contested};
  Controller *controller{nullptr}; // Not owned
  uint32_t agentCount{0};          // Agents attributed by the last control pass

  bool contains(float x, float z) const {
    const float half = size * 0.5f;
    return x >= center.getX() - half && x < center.getX() + half &&
           z >= center.getZ() - half && z < center.getZ() + half;
  }
};

/**
 * @brief Territory-owning entity (queen) that claims agents as controlled.
 *
 * Membership is a set; ordering carries no meaning but flat_set keeps
 * comparisons between two passes deterministic.
 */
class Controller {
public:
  using ControlledSet = boost::container::flat_set<AgentID>;

  Controller(ControllerID id, Territory &territory, size_t maxControlled = 100);

  ControllerID getId() const { return m_id; }
  Territory &getTerritory() const { return *mp_territory; }
  TerritoryID getTerritoryId() const { return mp_territory->id; }

  bool isActive() const { return m_active; }
  void setActive(bool active) { m_active = active; }

  bool isVulnerable() const { return m_active && m_vulnerable; }
  void setVulnerable(bool vulnerable) { m_vulnerable = vulnerable; }

  /**
   * @brief Claims an agent
   * @return false when inactive or at capacity
   */
  bool addControlledAgent(AgentID agentId);

  bool removeControlledAgent(AgentID agentId);
  void clearControlledAgents();

  bool controls(AgentID agentId) const { return m_controlled.count(agentId) != 0; }
  const ControlledSet &getControlledAgents() const { return m_controlled; }
  size_t getControlledCount() const { return m_controlled.size(); }
  size_t getMaxControlled() const { return m_maxControlled; }

private:
  void syncTerritoryCount();

  ControllerID m_id;
  Territory *mp_territory;
  size_t m_maxControlled;
  ControlledSet m_controlled;
  bool m_active{true};
  bool m_vulnerable{false};
};

/**
 * @brief Ownership authority for territories. Owned outside the core.
 */
class ITerritoryAuthority {
public:
  virtual ~ITerritoryAuthority() = default;

  // nullptr when (x, z) is outside every territory
  virtual Territory *getTerritoryAt(float x, float z) = 0;
  virtual std::vector<Territory *> getAllTerritories() = 0;
};

} // namespace HiveEngine

#endif // TERRITORY_HPP
