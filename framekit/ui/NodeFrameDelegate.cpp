#include "framekit/ui/NodeFrameDelegate.hpp"

#include <algorithm>

namespace framekit::ui
{
namespace
{
float ContentWidth(const UINode& node)
{
    return node.layout.width.IsFixed() ? node.layout.width.value : node.measuredWidth;
}

float ContentHeight(const UINode& node)
{
    return node.layout.height.IsFixed() ? node.layout.height.value : node.measuredHeight;
}

void SetPlacement(UINode& node, const glm::vec4& placement)
{
    if (node.layout.position == Position::Managed && node.layout.placement == placement)
    {
        return;
    }
    node.layout.position = Position::Managed;
    node.layout.placement = placement;
    node.MarkLayoutDirty();
}
} // namespace

NodeFrameDelegate::NodeFrameDelegate(UINode& host, UINode& child, UINode* horizontalBar, UINode* verticalBar)
    : m_host(host), m_child(child), m_horizontalBar(horizontalBar), m_verticalBar(verticalBar)
{
    m_child.layout.position = Position::Managed;
}

void NodeFrameDelegate::PlaceChild(const Placement& placement)
{
    SetPlacement(m_child, glm::vec4{placement.x, placement.y, placement.width, placement.height});
}

void NodeFrameDelegate::SetVisibleRegion(float offsetX, float offsetY)
{
    m_host.state.scrollX = offsetX;
    m_host.state.scrollY = offsetY;
    SetPlacement(m_child, glm::vec4{-offsetX, -offsetY, ContentWidth(m_child), ContentHeight(m_child)});
}

void NodeFrameDelegate::SetScrollbar(ScrollAxis axis, const ScrollbarState& state)
{
    UINode* bar = Bar(axis);
    if (bar == nullptr)
    {
        return;
    }

    bar->visibility = state.visible ? Visibility::Visible : Visibility::Hidden;
    bar->state.value01 = state.position;
    bar->state.thumbExtent = state.extent;
    bar->state.disabled = !state.enabled;
    LayoutScrollbars();
}

void NodeFrameDelegate::LayoutScrollbars()
{
    // Overlay bars along the right and bottom edges, sharing the corner square when both show.
    const float width = m_host.computedRect.contentW;
    const float height = m_host.computedRect.contentH;
    const bool horizontalShown = m_horizontalBar != nullptr && m_horizontalBar->visibility == Visibility::Visible;
    const bool verticalShown = m_verticalBar != nullptr && m_verticalBar->visibility == Visibility::Visible;

    if (m_horizontalBar != nullptr)
    {
        const float length = std::max(0.0F, width - (verticalShown ? kScrollbarThickness : 0.0F));
        SetPlacement(*m_horizontalBar,
            glm::vec4{0.0F, std::max(0.0F, height - kScrollbarThickness), length, std::min(height, kScrollbarThickness)});
    }
    if (m_verticalBar != nullptr)
    {
        const float length = std::max(0.0F, height - (horizontalShown ? kScrollbarThickness : 0.0F));
        SetPlacement(*m_verticalBar,
            glm::vec4{std::max(0.0F, width - kScrollbarThickness), 0.0F, std::min(width, kScrollbarThickness), length});
    }
}
} // namespace framekit::ui
