/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/Territory.hpp"
#include "core/Logger.hpp"
#include <format>

namespace HiveEngine {

Controller::Controller(ControllerID id, Territory &territory,
                       size_t maxControlled)
    : m_id(id), mp_territory(&territory), m_maxControlled(maxControlled) {
  m_controlled.reserve(maxControlled);
}

bool Controller::addControlledAgent(AgentID agentId) {
  if (!m_active) {
    TERRITORY_DEBUG(std::format("Controller {} inactive, refusing agent {}",
                                m_id, agentId));
    return false;
  }
  if (controls(agentId)) {
    return true;
  }
  if (m_controlled.size() >= m_maxControlled) {
    TERRITORY_WARN(std::format("Controller {} at capacity ({}), refusing agent {}",
                               m_id, m_maxControlled, agentId));
    return false;
  }

  m_controlled.insert(agentId);
  syncTerritoryCount();
  return true;
}

bool Controller::removeControlledAgent(AgentID agentId) {
  const bool removed = m_controlled.erase(agentId) > 0;
  if (removed) {
    syncTerritoryCount();
  }
  return removed;
}

void Controller::clearControlledAgents() {
  m_controlled.clear();
  syncTerritoryCount();
}

void Controller::syncTerritoryCount() {
  mp_territory->agentCount = static_cast<uint32_t>(m_controlled.size());
}

} // namespace HiveEngine
