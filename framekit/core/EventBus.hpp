#pragma once

#include <functional>
#include <queue>
#include <string>
#include <unordered_map>
#include <vector>

#include <glm/vec2.hpp>

namespace framekit::core
{
enum class EventType
{
    Resize,  // value = new window size
    Scroll,  // value = pixel delta, target = frame host id (empty = any)
    Wheel,   // value = notches, position = cursor
    Click    // position = cursor
};

struct Event
{
    EventType type = EventType::Resize;
    std::string target;
    glm::vec2 value{0.0F, 0.0F};
    glm::vec2 position{0.0F, 0.0F};
};

// Queues events published from input callbacks and delivers them in publish order.
class EventBus
{
public:
    using Handler = std::function<void(const Event&)>;

    void Subscribe(EventType type, Handler handler);
    void Publish(Event event);
    void DispatchQueued();

    [[nodiscard]] std::size_t PendingCount() const { return m_queue.size(); }

private:
    struct EventTypeHash
    {
        std::size_t operator()(EventType type) const
        {
            return static_cast<std::size_t>(type);
        }
    };

    std::unordered_map<EventType, std::vector<Handler>, EventTypeHash> m_handlers;
    std::queue<Event> m_queue;
};
} // namespace framekit::core
