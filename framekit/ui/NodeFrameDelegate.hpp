#pragma once

#include "framekit/ui/FrameDelegate.hpp"
#include "framekit/ui/UiNode.hpp"

namespace framekit::ui
{
// FrameDelegate on top of UINodes. The child and the optional scrollbar nodes must be
// direct children of the host and outlive the delegate.
class NodeFrameDelegate : public FrameDelegate
{
public:
    static constexpr float kScrollbarThickness = 10.0F;

    NodeFrameDelegate(UINode& host, UINode& child, UINode* horizontalBar = nullptr, UINode* verticalBar = nullptr);

    void PlaceChild(const Placement& placement) override;
    void SetScrollbar(ScrollAxis axis, const ScrollbarState& state) override;
    void SetVisibleRegion(float offsetX, float offsetY) override;

    [[nodiscard]] UINode& Host() const { return m_host; }
    [[nodiscard]] UINode& Child() const { return m_child; }
    [[nodiscard]] UINode* Bar(ScrollAxis axis) const
    {
        return axis == ScrollAxis::Horizontal ? m_horizontalBar : m_verticalBar;
    }

private:
    void LayoutScrollbars();

    UINode& m_host;
    UINode& m_child;
    UINode* m_horizontalBar = nullptr;
    UINode* m_verticalBar = nullptr;
};
} // namespace framekit::ui
