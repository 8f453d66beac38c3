#include "controller/ActionQueue.hpp"

namespace brickfall::controller {

void ActionQueue::push(core::Action action)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_pending.push_back(action);
}

std::vector<core::Action> ActionQueue::drain()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<core::Action> out(m_pending.begin(), m_pending.end());
    m_pending.clear();
    return out;
}

bool ActionQueue::empty() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending.empty();
}

std::size_t ActionQueue::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending.size();
}

} // namespace brickfall::controller
