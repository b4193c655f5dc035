#pragma once

#include "framekit/ui/FrameGeometry.hpp"

namespace framekit::ui
{
// Command sink a frame component drives. The host toolkit implements it on top of its
// container primitive; frames never touch toolkit nodes directly.
class FrameDelegate
{
public:
    virtual ~FrameDelegate() = default;

    virtual void PlaceChild(const Placement& placement) = 0;
    virtual void SetScrollbar(ScrollAxis axis, const ScrollbarState& state) = 0;
    virtual void SetVisibleRegion(float offsetX, float offsetY) = 0;
};
} // namespace framekit::ui
