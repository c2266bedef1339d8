/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/TargetUnit.hpp"

namespace HiveEngine {

float TargetRef::getResourceFraction() const {
  if (const IWorkerUnit *worker = asWorker()) {
    const float capacity = worker->getEnergyCapacity();
    return capacity > 0.0f ? worker->getEnergy() / capacity : 0.0f;
  }
  const IProtectorUnit *protector = asProtector();
  const float maxHealth = protector->getMaxHealth();
  return maxHealth > 0.0f ? protector->getHealth() / maxHealth : 0.0f;
}

bool TargetRef::isEligible() const {
  if (const IWorkerUnit *worker = asWorker()) {
    return worker->canBeTargeted();
  }
  return asProtector()->getHealth() > 0.0f;
}

float TargetRef::consume(float amount) {
  if (amount <= 0.0f) {
    return 0.0f;
  }
  if (IWorkerUnit *worker = asWorker()) {
    return worker->drainEnergy(amount);
  }
  asProtector()->takeDamage(amount);
  return amount;
}

void TargetRef::flee(const Vector3D &threat, float distance) {
  if (IWorkerUnit *worker = asWorker()) {
    worker->fleeFrom(threat, distance);
  }
}

std::optional<TargetRef> UnitLookup::resolve(const TargetKey &key) const {
  if (key.unitClass == UnitClass::Worker) {
    auto it = workers.find(key.id);
    if (it != workers.end() && it->second != nullptr) {
      return TargetRef::worker(*it->second);
    }
  } else {
    auto it = protectors.find(key.id);
    if (it != protectors.end() && it->second != nullptr) {
      return TargetRef::protector(*it->second);
    }
  }
  return std::nullopt;
}

} // namespace HiveEngine
