#pragma once

#include "framekit/platform/Window.hpp"
#include "framekit/ui/UiTree.hpp"

namespace framekit::ui
{
// Draws a laid-out UiTree with the Dear ImGui background draw list.
class TreeRenderer
{
public:
    TreeRenderer() = default;
    ~TreeRenderer();

    TreeRenderer(const TreeRenderer&) = delete;
    TreeRenderer& operator=(const TreeRenderer&) = delete;

    bool Initialize(platform::Window& window);
    void Shutdown();

    void BeginFrame();
    void Draw(const UiTree& tree);
    void EndFrame();

private:
    void DrawNode(const UINode& node);
    void DrawScrollbar(const UINode& node);

    bool m_initialized = false;
};
} // namespace framekit::ui
