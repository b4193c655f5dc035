#pragma once

#include <memory>
#include <string>

#include "framekit/ui/FrameDelegate.hpp"
#include "framekit/ui/FrameGeometry.hpp"

namespace framekit::ui
{
struct AspectRatioSettings
{
    float ratioW = 1.0F;
    float ratioH = 1.0F;
    Anchor anchor = Anchor::Center;
    // false: the child fills the outer box until SetAspectRatio is called
    bool keepRatio = true;
};

// Keeps its single child at a fixed width:height ratio inside the outer box.
// Every OnResize issues exactly one PlaceChild with the largest fitting box, or with the
// whole outer box while no ratio is kept.
class AspectRatioFrame
{
    struct CreateKey
    {
        explicit CreateKey() = default;
    };

public:
    // Returns nullptr (and fills outError) if either ratio component is not a positive finite number.
    [[nodiscard]] static std::unique_ptr<AspectRatioFrame> Create(
        FrameDelegate& delegate,
        const AspectRatioSettings& settings,
        std::string* outError = nullptr);

    AspectRatioFrame(CreateKey, FrameDelegate& delegate, const AspectConstraint& constraint, Anchor anchor, bool keepRatio);

    AspectRatioFrame(const AspectRatioFrame&) = delete;
    AspectRatioFrame& operator=(const AspectRatioFrame&) = delete;

    Placement OnResize(float outerW, float outerH);

    // These re-place the child with the last outer size.
    [[nodiscard]] bool SetAspectRatio(float ratioW, float ratioH, std::string* outError = nullptr);
    void ClearAspectRatio();
    void SetAnchor(Anchor anchor);

    [[nodiscard]] const AspectConstraint& Constraint() const { return m_constraint; }
    [[nodiscard]] Anchor GetAnchor() const { return m_anchor; }
    [[nodiscard]] bool KeepsRatio() const { return m_keepRatio; }
    [[nodiscard]] const Viewport& Outer() const { return m_outer; }
    [[nodiscard]] const Placement& LastPlacement() const { return m_placement; }

private:
    void Place();

    FrameDelegate& m_delegate;
    AspectConstraint m_constraint;
    Anchor m_anchor = Anchor::Center;
    bool m_keepRatio = true;
    Viewport m_outer;
    Placement m_placement;
};
} // namespace framekit::ui
