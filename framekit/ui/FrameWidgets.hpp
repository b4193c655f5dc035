#pragma once

#include <memory>
#include <string>

#include "framekit/ui/AspectRatioFrame.hpp"
#include "framekit/ui/NestedFrame.hpp"
#include "framekit/ui/NodeFrameDelegate.hpp"
#include "framekit/ui/ScrollFrame.hpp"

namespace framekit::ui
{
// A ScrollFrame mounted into a UiTree:
//   host (ScrollView) -> content (Container), hbar, vbar
// Without scrolling the host is a plain Container and is its own content.
// Widgets placed inside go under Content(), usually through NestedScope.
class ScrollFrameWidget
{
public:
    ScrollFrameWidget(UiTree& tree, UINode& host, UINode& content, UINode& horizontalBar, UINode& verticalBar);
    ScrollFrameWidget(UiTree& tree, UINode& host);
    ~ScrollFrameWidget();

    ScrollFrameWidget(const ScrollFrameWidget&) = delete;
    ScrollFrameWidget& operator=(const ScrollFrameWidget&) = delete;

    [[nodiscard]] bool Initialize(const ScrollFrameSettings& settings, std::string* outError);

    // Jumps the thumb of the scrollbar under (x, y) to the cursor. Returns false if no enabled bar is hit.
    bool PressScrollbar(float x, float y);

    [[nodiscard]] bool Scrolls() const { return m_frame != nullptr; }

    [[nodiscard]] UINode& Host() const { return m_host; }
    [[nodiscard]] UINode& Content() const { return m_content; }
    // Only valid while Scrolls()
    [[nodiscard]] ScrollFrame& Frame() const { return *m_frame; }
    [[nodiscard]] NodeFrameDelegate& Delegate() const { return *m_delegate; }

private:
    UiTree& m_tree;
    UINode& m_host;
    UINode& m_content;
    std::unique_ptr<NodeFrameDelegate> m_delegate;
    std::unique_ptr<ScrollFrame> m_frame;
    bool m_attached = false;
};

// An AspectRatioFrame mounted into a UiTree:
//   host (Container) -> child (Container)
class AspectRatioWidget
{
public:
    AspectRatioWidget(UiTree& tree, UINode& host, UINode& child);
    ~AspectRatioWidget();

    AspectRatioWidget(const AspectRatioWidget&) = delete;
    AspectRatioWidget& operator=(const AspectRatioWidget&) = delete;

    [[nodiscard]] bool Initialize(const AspectRatioSettings& settings, std::string* outError);

    [[nodiscard]] UINode& Host() const { return m_host; }
    [[nodiscard]] UINode& Child() const { return m_child; }
    [[nodiscard]] AspectRatioFrame& Frame() const { return *m_frame; }

private:
    UiTree& m_tree;
    UINode& m_host;
    UINode& m_child;
    std::unique_ptr<NodeFrameDelegate> m_delegate;
    std::unique_ptr<AspectRatioFrame> m_frame;
    bool m_attached = false;
};

// Both build their nodes under nested.Current(). An id already used by a node or a frame
// in the tree is rejected. On failure nothing is attached to the tree and nullptr is
// returned.
std::unique_ptr<ScrollFrameWidget> MountScrollFrame(
    NestedFrame& nested,
    const std::string& id,
    const ScrollFrameSettings& settings,
    std::string* outError = nullptr);

std::unique_ptr<AspectRatioWidget> MountAspectRatioFrame(
    NestedFrame& nested,
    const std::string& id,
    const AspectRatioSettings& settings,
    std::string* outError = nullptr);
} // namespace framekit::ui
