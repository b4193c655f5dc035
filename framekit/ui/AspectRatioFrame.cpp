#include "framekit/ui/AspectRatioFrame.hpp"

namespace framekit::ui
{
namespace
{
std::string DescribeRatio(float ratioW, float ratioH)
{
    return std::to_string(ratioW) + ":" + std::to_string(ratioH);
}
} // namespace

std::unique_ptr<AspectRatioFrame> AspectRatioFrame::Create(
    FrameDelegate& delegate,
    const AspectRatioSettings& settings,
    std::string* outError)
{
    if (!IsValidRatio(settings.ratioW, settings.ratioH))
    {
        if (outError != nullptr)
        {
            *outError = "Invalid aspect ratio " + DescribeRatio(settings.ratioW, settings.ratioH) + " (both sides must be > 0)";
        }
        return nullptr;
    }

    AspectConstraint constraint;
    constraint.ratioW = settings.ratioW;
    constraint.ratioH = settings.ratioH;
    return std::make_unique<AspectRatioFrame>(CreateKey{}, delegate, constraint, settings.anchor, settings.keepRatio);
}

AspectRatioFrame::AspectRatioFrame(CreateKey, FrameDelegate& delegate, const AspectConstraint& constraint, Anchor anchor, bool keepRatio)
    : m_delegate(delegate), m_constraint(constraint), m_anchor(anchor), m_keepRatio(keepRatio)
{
}

Placement AspectRatioFrame::OnResize(float outerW, float outerH)
{
    m_outer.width = SanitizeExtent(outerW);
    m_outer.height = SanitizeExtent(outerH);
    Place();
    return m_placement;
}

bool AspectRatioFrame::SetAspectRatio(float ratioW, float ratioH, std::string* outError)
{
    if (!IsValidRatio(ratioW, ratioH))
    {
        if (outError != nullptr)
        {
            *outError = "Invalid aspect ratio " + DescribeRatio(ratioW, ratioH) + " (both sides must be > 0)";
        }
        return false;
    }

    m_constraint.ratioW = ratioW;
    m_constraint.ratioH = ratioH;
    m_keepRatio = true;
    Place();
    return true;
}

void AspectRatioFrame::ClearAspectRatio()
{
    m_keepRatio = false;
    Place();
}

void AspectRatioFrame::SetAnchor(Anchor anchor)
{
    m_anchor = anchor;
    Place();
}

void AspectRatioFrame::Place()
{
    if (m_keepRatio)
    {
        m_placement = FitAspectBox(m_outer.width, m_outer.height, m_constraint, m_anchor);
    }
    else
    {
        m_placement = Placement{0.0F, 0.0F, m_outer.width, m_outer.height};
    }
    m_delegate.PlaceChild(m_placement);
}
} // namespace framekit::ui
