#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

#include "core/Types.hpp"

namespace brickfall::controller {

/// Single-consumer channel merging the clock and player inputs.
/// Any number of producers may push (from any thread); one consumer drains.
/// Delivery order is enqueue order, no reordering.
class ActionQueue {
public:
    void push(core::Action action);

    /// Takes every pending action, oldest first, and empties the queue.
    std::vector<core::Action> drain();

    bool empty() const;
    std::size_t size() const;

private:
    mutable std::mutex m_mutex;
    std::deque<core::Action> m_pending;
};

} // namespace brickfall::controller
