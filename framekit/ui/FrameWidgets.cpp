#include "framekit/ui/FrameWidgets.hpp"

#include <algorithm>
#include <initializer_list>

namespace framekit::ui
{
namespace
{
bool RejectUsedId(const UiTree& tree, const std::string& id, const char* kind, std::string* outError)
{
    if (tree.FindNode(id) == nullptr && !tree.HasFrame(id))
    {
        return false;
    }
    if (outError != nullptr)
    {
        *outError = std::string("Cannot mount ") + kind + " '" + id + "': id already in use";
    }
    return true;
}
} // namespace

ScrollFrameWidget::ScrollFrameWidget(UiTree& tree, UINode& host, UINode& content, UINode& horizontalBar, UINode& verticalBar)
    : m_tree(tree), m_host(host), m_content(content)
{
    m_delegate = std::make_unique<NodeFrameDelegate>(host, content, &horizontalBar, &verticalBar);
}

ScrollFrameWidget::ScrollFrameWidget(UiTree& tree, UINode& host)
    : m_tree(tree), m_host(host), m_content(host)
{
}

ScrollFrameWidget::~ScrollFrameWidget()
{
    if (m_attached)
    {
        m_tree.DetachFrame(m_host.id);
    }
}

bool ScrollFrameWidget::Initialize(const ScrollFrameSettings& settings, std::string* outError)
{
    if (!settings.scroll)
    {
        return true;
    }
    if (!m_delegate)
    {
        if (outError != nullptr)
        {
            *outError = "Node '" + m_host.id + "' was built without scrollbars";
        }
        return false;
    }

    m_frame = ScrollFrame::Create(*m_delegate, settings, outError);
    if (!m_frame)
    {
        return false;
    }

    ScrollFrame* frame = m_frame.get();
    FrameHooks hooks;
    hooks.contentNodeId = m_content.id;
    hooks.onContentResize = [frame](float width, float height) {
        frame->OnContentResize(width, height);
    };
    hooks.onResize = [frame](float width, float height) {
        frame->OnResize(width, height);
    };
    hooks.preferredSize = [frame]() {
        return frame->PreferredSize();
    };
    hooks.onWheel = [frame](float notchesX, float notchesY) {
        return frame->OnWheel(notchesX, notchesY);
    };
    if (!m_tree.AttachFrame(m_host.id, std::move(hooks)))
    {
        if (outError != nullptr)
        {
            *outError = "Node '" + m_host.id + "' already hosts a frame";
        }
        m_frame.reset();
        return false;
    }
    m_attached = true;
    return true;
}

bool ScrollFrameWidget::PressScrollbar(float x, float y)
{
    if (!m_frame)
    {
        return false;
    }

    for (ScrollAxis axis : {ScrollAxis::Horizontal, ScrollAxis::Vertical})
    {
        const UINode* bar = m_delegate->Bar(axis);
        if (bar == nullptr || bar->visibility != Visibility::Visible || bar->state.disabled || !bar->computedRect.Contains(x, y))
        {
            continue;
        }

        // Centre the thumb on the cursor.
        const ComputedRect& rect = bar->computedRect;
        const bool horizontal = axis == ScrollAxis::Horizontal;
        const float track = horizontal ? rect.w : rect.h;
        const float thumb = track * bar->state.thumbExtent;
        const float travel = track - thumb;
        if (travel <= 0.0F)
        {
            return false;
        }
        const float cursor = (horizontal ? x - rect.x : y - rect.y) - thumb * 0.5F;
        m_frame->ScrollToFraction(axis, std::clamp(cursor / travel, 0.0F, 1.0F));
        return true;
    }
    return false;
}

AspectRatioWidget::AspectRatioWidget(UiTree& tree, UINode& host, UINode& child)
    : m_tree(tree), m_host(host), m_child(child)
{
    m_delegate = std::make_unique<NodeFrameDelegate>(host, child);
}

AspectRatioWidget::~AspectRatioWidget()
{
    if (m_attached)
    {
        m_tree.DetachFrame(m_host.id);
    }
}

bool AspectRatioWidget::Initialize(const AspectRatioSettings& settings, std::string* outError)
{
    m_frame = AspectRatioFrame::Create(*m_delegate, settings, outError);
    if (!m_frame)
    {
        return false;
    }

    AspectRatioFrame* frame = m_frame.get();
    FrameHooks hooks;
    hooks.onResize = [frame](float width, float height) {
        frame->OnResize(width, height);
    };
    if (!m_tree.AttachFrame(m_host.id, std::move(hooks)))
    {
        if (outError != nullptr)
        {
            *outError = "Node '" + m_host.id + "' already hosts a frame";
        }
        m_frame.reset();
        return false;
    }
    m_attached = true;
    return true;
}

std::unique_ptr<ScrollFrameWidget> MountScrollFrame(
    NestedFrame& nested,
    const std::string& id,
    const ScrollFrameSettings& settings,
    std::string* outError)
{
    UINode* parent = nested.Current();
    if (parent == nullptr)
    {
        if (outError != nullptr)
        {
            *outError = "Cannot mount scroll frame '" + id + "': no parent";
        }
        return nullptr;
    }
    if (RejectUsedId(nested.Tree(), id, "scroll frame", outError))
    {
        return nullptr;
    }

    if (!settings.scroll)
    {
        auto plainNode = UINode::CreateContainer(id);
        auto plain = std::make_unique<ScrollFrameWidget>(nested.Tree(), *plainNode);
        if (!plain->Initialize(settings, outError))
        {
            return nullptr;
        }
        nested.Add(std::move(plainNode));
        return plain;
    }

    auto hostNode = UINode::CreateScrollView(id);
    UINode& host = *hostNode;
    UINode& content = *host.AddChild(UINode::CreateContainer(id + "_content"));
    UINode& horizontalBar = *host.AddChild(UINode::CreateScrollbar(id + "_hbar"));
    UINode& verticalBar = *host.AddChild(UINode::CreateScrollbar(id + "_vbar"));
    horizontalBar.layout.flexDirection = FlexDirection::Row;

    auto widget = std::make_unique<ScrollFrameWidget>(nested.Tree(), host, content, horizontalBar, verticalBar);
    if (!widget->Initialize(settings, outError))
    {
        return nullptr;
    }
    nested.Add(std::move(hostNode));
    return widget;
}

std::unique_ptr<AspectRatioWidget> MountAspectRatioFrame(
    NestedFrame& nested,
    const std::string& id,
    const AspectRatioSettings& settings,
    std::string* outError)
{
    UINode* parent = nested.Current();
    if (parent == nullptr)
    {
        if (outError != nullptr)
        {
            *outError = "Cannot mount aspect ratio frame '" + id + "': no parent";
        }
        return nullptr;
    }
    if (RejectUsedId(nested.Tree(), id, "aspect ratio frame", outError))
    {
        return nullptr;
    }

    auto hostNode = UINode::CreateContainer(id);
    UINode& host = *hostNode;
    UINode& child = *host.AddChild(UINode::CreateContainer(id + "_child"));

    auto widget = std::make_unique<AspectRatioWidget>(nested.Tree(), host, child);
    if (!widget->Initialize(settings, outError))
    {
        return nullptr;
    }
    nested.Add(std::move(hostNode));
    return widget;
}
} // namespace framekit::ui
