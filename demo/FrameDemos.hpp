#pragma once

#include <memory>
#include <string>
#include <vector>

#include "demo/DemoOptions.hpp"
#include "framekit/core/EventBus.hpp"
#include "framekit/ui/FrameSerialization.hpp"
#include "framekit/ui/FrameWidgets.hpp"

namespace framekit::demo
{
// Builds the requested demos side by side under the tree root and keeps their frames alive.
class FrameDemos
{
public:
    bool Build(ui::UiTree& tree, const std::vector<DemoKind>& kinds, const ui::FrameConfig& config, std::string* outError);
    void Subscribe(core::EventBus& eventBus);

    // Appends one more row to the scroll demo list.
    bool AddListEntry();

    [[nodiscard]] ui::ScrollFrameWidget* Scroll() const { return m_scroll.get(); }
    [[nodiscard]] ui::AspectRatioWidget* Aspect() const { return m_aspect.get(); }
    [[nodiscard]] int NextItemIndex() const { return m_nextItem; }

private:
    bool BuildNestedDemo(ui::NestedFrame& nested, std::string* outError);
    bool BuildScrollDemo(ui::NestedFrame& nested, const ui::FrameConfig& config, std::string* outError);
    bool BuildAspectDemo(ui::NestedFrame& nested, const ui::FrameConfig& config, std::string* outError);

    ui::UiTree* m_tree = nullptr;
    std::unique_ptr<ui::ScrollFrameWidget> m_scroll;
    std::unique_ptr<ui::AspectRatioWidget> m_aspect;
    int m_nextItem = 100;
};
} // namespace framekit::demo
