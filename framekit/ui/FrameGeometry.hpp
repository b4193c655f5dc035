#pragma once

#include <glm/vec2.hpp>

namespace framekit::ui
{
// Rendered pixel size of a container, updated on every resize
struct Viewport
{
    float width = 0.0F;
    float height = 0.0F;
};

// Full size of scrollable content and the top-left of the visible window inside it
struct ContentBox
{
    float width = 0.0F;
    float height = 0.0F;
    float offsetX = 0.0F;
    float offsetY = 0.0F;
};

// Fixed width:height ratio of an aspect-ratio frame's child
struct AspectConstraint
{
    float ratioW = 1.0F;
    float ratioH = 1.0F;
};

// Child box issued through FrameDelegate::PlaceChild, relative to the frame's content origin
struct Placement
{
    float x = 0.0F;
    float y = 0.0F;
    float width = 0.0F;
    float height = 0.0F;

    bool operator==(const Placement& other) const
    {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }
    bool operator!=(const Placement& other) const
    {
        return !(*this == other);
    }
};

enum class ScrollAxis
{
    Horizontal,
    Vertical
};

enum class ScrollbarPolicy
{
    Always,
    Auto,
    Never
};

// Thumb position/extent are 0-1 fractions of the scrollbar track
struct ScrollbarState
{
    float position = 0.0F;
    float extent = 1.0F;
    bool visible = false;
    bool enabled = false;

    bool operator==(const ScrollbarState& other) const
    {
        return position == other.position && extent == other.extent && visible == other.visible && enabled == other.enabled;
    }
    bool operator!=(const ScrollbarState& other) const
    {
        return !(*this == other);
    }
};

// Side or corner receiving the child when it is smaller than the outer box
enum class Anchor
{
    N,
    NE,
    E,
    SE,
    S,
    SW,
    W,
    NW,
    Center
};

// Negative and non-finite sizes become 0, everything else is floored to whole pixels.
[[nodiscard]] float SanitizeExtent(float value);

// Non-finite deltas become 0.
[[nodiscard]] float SanitizeDelta(float value);

[[nodiscard]] bool IsValidRatio(float ratioW, float ratioH);

[[nodiscard]] float MaxScrollOffset(float contentSize, float viewportSize);
[[nodiscard]] float ClampScrollOffset(float offset, float contentSize, float viewportSize);
[[nodiscard]] float ThumbExtent(float contentSize, float viewportSize);
[[nodiscard]] float ThumbPosition(float offset, float contentSize, float viewportSize);
[[nodiscard]] ScrollbarState ComputeScrollbar(ScrollbarPolicy policy, float offset, float contentSize, float viewportSize);

// Leftover-space fraction (0, 0.5 or 1 per axis) that an anchor assigns before the child.
[[nodiscard]] glm::vec2 AnchorFraction(Anchor anchor);

// Largest box with the constraint's ratio that fits in the outer box, positioned by the anchor.
// The derived dimension is floored to a whole pixel; offsets are left unrounded.
[[nodiscard]] Placement FitAspectBox(float outerW, float outerH, const AspectConstraint& constraint, Anchor anchor = Anchor::Center);
} // namespace framekit::ui
