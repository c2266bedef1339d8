/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef UNIQUE_ID_HPP
#define UNIQUE_ID_HPP

#include <atomic>
#include <cstdint>

namespace HiveEngine {

/**
 * @brief Monotonic id source for agents and controllers.
 *
 * Each generator instance hands out 1, 2, 3, ... so an AgentRegistry owns its
 * own sequence and tests stay reproducible. INVALID_ID (0) is never produced.
 */
class UniqueID {
public:
    using IDType = uint64_t;

    static constexpr IDType INVALID_ID = 0;

    IDType generate() { return m_nextID.fetch_add(1, std::memory_order_relaxed); }

    // Next id that generate() would return
    IDType peek() const { return m_nextID.load(std::memory_order_relaxed); }

    void reset() { m_nextID.store(1, std::memory_order_relaxed); }

private:
    std::atomic<IDType> m_nextID{1};
};

} // namespace HiveEngine

#endif // UNIQUE_ID_HPP
