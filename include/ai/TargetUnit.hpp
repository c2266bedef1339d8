/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TARGET_UNIT_HPP
#define TARGET_UNIT_HPP

#include "ai/AgentTypes.hpp"
#include "utils/Vector3D.hpp"
#include <boost/container/small_vector.hpp>
#include <optional>
#include <span>
#include <unordered_map>
#include <variant>

namespace HiveEngine {

/**
 * @brief Energy-carrying unit that agents drain. Owned outside the core.
 */
class IWorkerUnit {
public:
  virtual ~IWorkerUnit() = default;

  virtual UnitID getId() const = 0;
  virtual Vector3D getPosition() const = 0;
  virtual bool canBeTargeted() const = 0;
  virtual float getEnergy() const = 0;
  virtual float getEnergyCapacity() const = 0;

  /**
   * @brief Removes up to amount energy
   * @return Energy actually removed
   */
  virtual float drainEnergy(float amount) = 0;

  virtual void fleeFrom(const Vector3D &threat, float distance) = 0;
};

/**
 * @brief Combat unit that tactical agents attack. Owned outside the core.
 */
class IProtectorUnit {
public:
  virtual ~IProtectorUnit() = default;

  virtual UnitID getId() const = 0;
  virtual Vector3D getPosition() const = 0;
  virtual float getHealth() const = 0;
  virtual float getMaxHealth() const = 0;
  virtual void takeDamage(float amount) = 0;
};

/**
 * @brief Weak (class, id) key for a locked target.
 *
 * Agents store this instead of a pointer; it is resolved through the tick's
 * UnitLookup, so a destroyed unit simply stops resolving.
 */
struct TargetKey {
  UnitClass unitClass{UnitClass::Worker};
  UnitID id{0};

  bool operator==(const TargetKey &other) const = default;
};

/**
 * @brief Tagged view over one of the closed set of target classes.
 *
 * Valid only for the tick it was produced in.
 */
class TargetRef {
public:
  static TargetRef worker(IWorkerUnit &unit) { return TargetRef(&unit); }
  static TargetRef protector(IProtectorUnit &unit) { return TargetRef(&unit); }

  UnitClass getClass() const {
    return std::holds_alternative<IWorkerUnit *>(m_unit) ? UnitClass::Worker
                                                         : UnitClass::Protector;
  }

  UnitID getId() const {
    return std::visit([](const auto *unit) { return unit->getId(); }, m_unit);
  }

  TargetKey getKey() const { return TargetKey{getClass(), getId()}; }

  Vector3D getPosition() const {
    return std::visit([](const auto *unit) { return unit->getPosition(); },
                      m_unit);
  }

  // Workers carry no health
  std::optional<float> getHealth() const {
    if (const IProtectorUnit *protector = asProtector()) {
      return protector->getHealth();
    }
    return std::nullopt;
  }

  // Energy fraction for workers, health fraction for protectors
  float getResourceFraction() const;

  bool isEligible() const;

  /**
   * @brief Applies the class-specific consumption
   * @return Energy drained (worker) or damage applied (protector)
   */
  float consume(float amount);

  // No-op for protectors
  void flee(const Vector3D &threat, float distance);

  IWorkerUnit *asWorker() const {
    auto *const *unit = std::get_if<IWorkerUnit *>(&m_unit);
    return unit ? *unit : nullptr;
  }
  IProtectorUnit *asProtector() const {
    auto *const *unit = std::get_if<IProtectorUnit *>(&m_unit);
    return unit ? *unit : nullptr;
  }

  bool operator==(const TargetRef &other) const {
    return getClass() == other.getClass() && getId() == other.getId();
  }

private:
  using UnitPtr = std::variant<IWorkerUnit *, IProtectorUnit *>;

  explicit TargetRef(UnitPtr unit) : m_unit(unit) {}

  UnitPtr m_unit;
};

/**
 * @brief Candidates near one agent, grouped by class.
 */
struct CandidateSet {
  boost::container::small_vector<TargetRef, 16> workers;
  boost::container::small_vector<TargetRef, 8> protectors;

  std::span<const TargetRef> ofClass(UnitClass unitClass) const {
    if (unitClass == UnitClass::Protector) {
      return {protectors.data(), protectors.size()};
    }
    return {workers.data(), workers.size()};
  }

  size_t total() const { return workers.size() + protectors.size(); }

  void clear() {
    workers.clear();
    protectors.clear();
  }
};

/**
 * @brief id -> unit maps rebuilt once per tick by the scheduler.
 */
struct UnitLookup {
  std::unordered_map<UnitID, IWorkerUnit *> workers;
  std::unordered_map<UnitID, IProtectorUnit *> protectors;

  void clear() {
    workers.clear();
    protectors.clear();
  }

  std::optional<TargetRef> resolve(const TargetKey &key) const;
};

} // namespace HiveEngine

#endif // TARGET_UNIT_HPP
