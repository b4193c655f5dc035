#include "framekit/ui/ScrollFrame.hpp"

#include <algorithm>
#include <cmath>

namespace framekit::ui
{
namespace
{
bool IsValidMaximum(const std::optional<float>& value)
{
    return !value.has_value() || (std::isfinite(*value) && *value > 0.0F);
}
} // namespace

std::unique_ptr<ScrollFrame> ScrollFrame::Create(
    FrameDelegate& delegate,
    const ScrollFrameSettings& settings,
    std::string* outError)
{
    const glm::vec2 content = settings.initialContentSize;
    if (!std::isfinite(content.x) || !std::isfinite(content.y) || content.x < 0.0F || content.y < 0.0F)
    {
        if (outError != nullptr)
        {
            *outError = "Invalid initial content size (must be finite and >= 0)";
        }
        return nullptr;
    }
    if (!IsValidMaximum(settings.maxWidth) || !IsValidMaximum(settings.maxHeight))
    {
        if (outError != nullptr)
        {
            *outError = "Invalid maximum viewport size (must be > 0)";
        }
        return nullptr;
    }
    if (!std::isfinite(settings.wheelStep) || settings.wheelStep <= 0.0F)
    {
        if (outError != nullptr)
        {
            *outError = "Invalid wheel step (must be > 0)";
        }
        return nullptr;
    }

    return std::make_unique<ScrollFrame>(CreateKey{}, delegate, settings);
}

ScrollFrame::ScrollFrame(CreateKey, FrameDelegate& delegate, const ScrollFrameSettings& settings)
    : m_delegate(delegate), m_settings(settings)
{
    m_content.width = SanitizeExtent(settings.initialContentSize.x);
    m_content.height = SanitizeExtent(settings.initialContentSize.y);
}

void ScrollFrame::OnResize(float width, float height)
{
    m_viewport.width = SanitizeExtent(width);
    m_viewport.height = SanitizeExtent(height);
    Reconcile();
}

void ScrollFrame::OnScroll(float deltaX, float deltaY)
{
    m_content.offsetX += SanitizeDelta(deltaX);
    m_content.offsetY += SanitizeDelta(deltaY);
    Reconcile();
}

void ScrollFrame::OnContentResize(float width, float height)
{
    m_content.width = SanitizeExtent(width);
    m_content.height = SanitizeExtent(height);
    Reconcile();
}

void ScrollFrame::ScrollTo(float offsetX, float offsetY)
{
    m_content.offsetX = SanitizeDelta(offsetX);
    m_content.offsetY = SanitizeDelta(offsetY);
    Reconcile();
}

void ScrollFrame::ScrollToFraction(ScrollAxis axis, float fraction)
{
    const float clamped = std::clamp(SanitizeDelta(fraction), 0.0F, 1.0F);
    if (axis == ScrollAxis::Horizontal)
    {
        m_content.offsetX = clamped * MaxScrollOffset(m_content.width, m_viewport.width);
    }
    else
    {
        m_content.offsetY = clamped * MaxScrollOffset(m_content.height, m_viewport.height);
    }
    Reconcile();
}

bool ScrollFrame::OnWheel(float notchesX, float notchesY)
{
    // A positive notch count means "towards the start", as GLFW reports wheel-up.
    const float deltaX = m_horizontal.enabled ? -SanitizeDelta(notchesX) * m_settings.wheelStep : 0.0F;
    const float deltaY = m_vertical.enabled ? -SanitizeDelta(notchesY) * m_settings.wheelStep : 0.0F;
    if (deltaX == 0.0F && deltaY == 0.0F)
    {
        return false;
    }
    OnScroll(deltaX, deltaY);
    return true;
}

glm::vec2 ScrollFrame::PreferredSize() const
{
    glm::vec2 size{m_content.width, m_content.height};
    if (m_settings.maxWidth.has_value())
    {
        size.x = std::min(size.x, *m_settings.maxWidth);
    }
    if (m_settings.maxHeight.has_value())
    {
        size.y = std::min(size.y, *m_settings.maxHeight);
    }
    return size;
}

void ScrollFrame::Reconcile()
{
    m_content.offsetX = ClampScrollOffset(m_content.offsetX, m_content.width, m_viewport.width);
    m_content.offsetY = ClampScrollOffset(m_content.offsetY, m_content.height, m_viewport.height);

    m_horizontal = ComputeScrollbar(m_settings.horizontalPolicy, m_content.offsetX, m_content.width, m_viewport.width);
    m_vertical = ComputeScrollbar(m_settings.verticalPolicy, m_content.offsetY, m_content.height, m_viewport.height);

    m_delegate.SetVisibleRegion(m_content.offsetX, m_content.offsetY);
    m_delegate.SetScrollbar(ScrollAxis::Horizontal, m_horizontal);
    m_delegate.SetScrollbar(ScrollAxis::Vertical, m_vertical);
}
} // namespace framekit::ui
