#pragma once

#include <memory>
#include <optional>
#include <string>

#include <glm/vec2.hpp>

#include "framekit/ui/FrameDelegate.hpp"
#include "framekit/ui/FrameGeometry.hpp"

namespace framekit::ui
{
struct ScrollFrameSettings
{
    glm::vec2 initialContentSize{0.0F, 0.0F};
    ScrollbarPolicy horizontalPolicy = ScrollbarPolicy::Auto;
    ScrollbarPolicy verticalPolicy = ScrollbarPolicy::Auto;

    // Caps on the size the frame asks its parent for; unset means "as large as the content".
    std::optional<float> maxWidth;
    std::optional<float> maxHeight;

    // Pixels scrolled per mouse wheel notch
    float wheelStep = 20.0F;

    // false mounts a plain container without viewport, scrollbars or wheel handling
    bool scroll = true;
};

// Fixed viewport over content that may exceed it. After every operation
// 0 <= offset <= max(0, content - viewport) holds on both axes, and the delegate
// has received the visible region followed by both scrollbar states.
class ScrollFrame
{
    struct CreateKey
    {
        explicit CreateKey() = default;
    };

public:
    // Returns nullptr (and fills outError) for negative or non-finite content sizes,
    // non-positive maximum sizes or a non-positive wheel step.
    [[nodiscard]] static std::unique_ptr<ScrollFrame> Create(
        FrameDelegate& delegate,
        const ScrollFrameSettings& settings,
        std::string* outError = nullptr);

    ScrollFrame(CreateKey, FrameDelegate& delegate, const ScrollFrameSettings& settings);

    ScrollFrame(const ScrollFrame&) = delete;
    ScrollFrame& operator=(const ScrollFrame&) = delete;

    void OnResize(float width, float height);
    void OnScroll(float deltaX, float deltaY);
    void OnContentResize(float width, float height);

    void ScrollTo(float offsetX, float offsetY);
    void ScrollToFraction(ScrollAxis axis, float fraction);

    // Wheel notches are applied only on axes that can scroll. Returns true if any were consumed.
    bool OnWheel(float notchesX, float notchesY);

    [[nodiscard]] glm::vec2 PreferredSize() const;

    [[nodiscard]] const Viewport& GetViewport() const { return m_viewport; }
    [[nodiscard]] const ContentBox& GetContent() const { return m_content; }
    [[nodiscard]] const ScrollbarState& Scrollbar(ScrollAxis axis) const
    {
        return axis == ScrollAxis::Horizontal ? m_horizontal : m_vertical;
    }
    [[nodiscard]] const ScrollFrameSettings& Settings() const { return m_settings; }

private:
    void Reconcile();

    FrameDelegate& m_delegate;
    ScrollFrameSettings m_settings;
    Viewport m_viewport;
    ContentBox m_content;
    ScrollbarState m_horizontal;
    ScrollbarState m_vertical;
};
} // namespace framekit::ui
