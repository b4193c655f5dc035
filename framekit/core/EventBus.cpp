#include "framekit/core/EventBus.hpp"

namespace framekit::core
{
void EventBus::Subscribe(EventType type, Handler handler)
{
    m_handlers[type].push_back(std::move(handler));
}

void EventBus::Publish(Event event)
{
    m_queue.push(std::move(event));
}

void EventBus::DispatchQueued()
{
    // Handlers may publish; those events are delivered in the same pass, after the current ones.
    while (!m_queue.empty())
    {
        Event event = std::move(m_queue.front());
        m_queue.pop();

        const auto it = m_handlers.find(event.type);
        if (it == m_handlers.end())
        {
            continue;
        }

        // Handlers subscribed during delivery take effect from the next event.
        const std::vector<Handler> handlers = it->second;
        for (const Handler& handler : handlers)
        {
            handler(event);
        }
    }
}
} // namespace framekit::core
