#include "framekit/ui/FrameGeometry.hpp"

#include <algorithm>
#include <cmath>

namespace framekit::ui
{
float SanitizeExtent(float value)
{
    if (!std::isfinite(value) || value <= 0.0F)
    {
        return 0.0F;
    }
    return std::floor(value);
}

float SanitizeDelta(float value)
{
    return std::isfinite(value) ? value : 0.0F;
}

bool IsValidRatio(float ratioW, float ratioH)
{
    return std::isfinite(ratioW) && std::isfinite(ratioH) && ratioW > 0.0F && ratioH > 0.0F;
}

float MaxScrollOffset(float contentSize, float viewportSize)
{
    return std::max(0.0F, contentSize - viewportSize);
}

float ClampScrollOffset(float offset, float contentSize, float viewportSize)
{
    if (!std::isfinite(offset))
    {
        offset = 0.0F;
    }
    return std::clamp(offset, 0.0F, MaxScrollOffset(contentSize, viewportSize));
}

float ThumbExtent(float contentSize, float viewportSize)
{
    if (contentSize <= viewportSize || contentSize <= 0.0F)
    {
        return 1.0F;
    }
    return viewportSize / contentSize;
}

float ThumbPosition(float offset, float contentSize, float viewportSize)
{
    const float range = MaxScrollOffset(contentSize, viewportSize);
    if (range <= 0.0F)
    {
        return 0.0F;
    }
    return std::clamp(offset / range, 0.0F, 1.0F);
}

ScrollbarState ComputeScrollbar(ScrollbarPolicy policy, float offset, float contentSize, float viewportSize)
{
    ScrollbarState state;
    state.enabled = contentSize > viewportSize;
    state.extent = ThumbExtent(contentSize, viewportSize);
    state.position = ThumbPosition(offset, contentSize, viewportSize);
    switch (policy)
    {
        case ScrollbarPolicy::Always:
            state.visible = true;
            break;
        case ScrollbarPolicy::Never:
            state.visible = false;
            break;
        case ScrollbarPolicy::Auto:
        default:
            state.visible = state.enabled;
            break;
    }
    return state;
}

glm::vec2 AnchorFraction(Anchor anchor)
{
    switch (anchor)
    {
        case Anchor::N:
            return {0.5F, 0.0F};
        case Anchor::NE:
            return {1.0F, 0.0F};
        case Anchor::E:
            return {1.0F, 0.5F};
        case Anchor::SE:
            return {1.0F, 1.0F};
        case Anchor::S:
            return {0.5F, 1.0F};
        case Anchor::SW:
            return {0.0F, 1.0F};
        case Anchor::W:
            return {0.0F, 0.5F};
        case Anchor::NW:
            return {0.0F, 0.0F};
        case Anchor::Center:
        default:
            return {0.5F, 0.5F};
    }
}

Placement FitAspectBox(float outerW, float outerH, const AspectConstraint& constraint, Anchor anchor)
{
    const double width = SanitizeExtent(outerW);
    const double height = SanitizeExtent(outerH);
    const double ratioW = constraint.ratioW;
    const double ratioH = constraint.ratioH;

    double renderedW = 0.0;
    double renderedH = 0.0;
    if (IsValidRatio(constraint.ratioW, constraint.ratioH))
    {
        const double candidateW = height * ratioW / ratioH;
        if (candidateW <= width)
        {
            renderedW = std::floor(candidateW);
            renderedH = height;
        }
        else
        {
            renderedW = width;
            renderedH = std::floor(width * ratioH / ratioW);
        }
    }

    const glm::vec2 fraction = AnchorFraction(anchor);
    Placement placement;
    placement.width = static_cast<float>(renderedW);
    placement.height = static_cast<float>(renderedH);
    placement.x = static_cast<float>((width - renderedW) * static_cast<double>(fraction.x));
    placement.y = static_cast<float>((height - renderedH) * static_cast<double>(fraction.y));
    return placement;
}
} // namespace framekit::ui
