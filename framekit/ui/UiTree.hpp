#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

#include <glm/vec2.hpp>

#include "framekit/ui/UiNode.hpp"

namespace framekit::ui
{
// Callback types for node interactions
using OnClickCallback = std::function<void(UINode&)>;
using OnClickSimpleCallback = std::function<void()>;

// Hooks a frame component registers on the node that hosts it. The tree fires
// onContentResize during the measure pass and onResize during the arrange pass,
// each only when the reported size differs from the previous report.
struct FrameHooks
{
    // Node whose measured size is reported through onContentResize (empty = none)
    std::string contentNodeId;

    std::function<void(float, float)> onContentResize;
    std::function<void(float, float)> onResize;
    // Intrinsic size the frame asks its parent for (unset = regular measurement)
    std::function<glm::vec2()> preferredSize;
    // Returns true if the wheel notches were consumed
    std::function<bool(float, float)> onWheel;
};

// UI Tree - manages retained UI node hierarchy
class UiTree
{
public:
    UiTree();
    ~UiTree();

    // Non-copyable
    UiTree(const UiTree&) = delete;
    UiTree& operator=(const UiTree&) = delete;

    void SetScreenSize(int width, int height);
    [[nodiscard]] int ScreenWidth() const { return m_screenWidth; }
    [[nodiscard]] int ScreenHeight() const { return m_screenHeight; }

    // Root node access
    [[nodiscard]] UINode* GetRoot()
    {
        return m_root.get();
    }
    [[nodiscard]] const UINode* GetRoot() const
    {
        return m_root.get();
    }
    void RebuildNodeIndex();

    // Node lookup by ID
    [[nodiscard]] UINode* FindNode(const std::string& id);
    [[nodiscard]] const UINode* FindNode(const std::string& id) const;

    // Frame wiring. A node hosts at most one frame; AttachFrame returns false if
    // nodeId already has one and leaves the existing binding untouched.
    [[nodiscard]] bool AttachFrame(const std::string& nodeId, FrameHooks hooks);
    void DetachFrame(const std::string& nodeId);
    [[nodiscard]] bool HasFrame(const std::string& nodeId) const;

    // Callbacks binding
    void BindOnClick(const std::string& nodeId, OnClickCallback callback);
    void BindOnClick(const std::string& nodeId, OnClickSimpleCallback callback);
    bool TriggerClick(const std::string& nodeId);

    // Input routing, coordinates in screen pixels
    [[nodiscard]] UINode* PickNode(float x, float y);
    void UpdateHover(float x, float y);
    bool Click(float x, float y);
    bool DispatchWheel(float x, float y, float notchesX, float notchesY);

    // Layout pass - computes positions and sizes
    [[nodiscard]] bool NeedsLayout() const;
    void ComputeLayout();

private:
    struct FrameBinding
    {
        FrameHooks hooks;
        glm::vec2 lastContentSize{-1.0F, -1.0F};
        glm::vec2 lastViewportSize{-1.0F, -1.0F};
    };

    void MeasureNode(UINode& node);
    void ArrangeNode(UINode& node, float x, float y, float availableWidth, float availableHeight);
    void ArrangeFlowChildren(UINode& node);
    void ArrangeOutOfFlowChildren(UINode& node);
    UINode* HitTest(UINode& node, float x, float y);
    void ClearHover(UINode& node);

    std::unique_ptr<UINode> m_root;
    std::unordered_map<std::string, UINode*> m_nodeIndex;
    std::unordered_map<std::string, OnClickCallback> m_clickCallbacks;
    std::unordered_map<std::string, FrameBinding> m_frames;

    int m_screenWidth = 0;
    int m_screenHeight = 0;
    bool m_screenDirty = true;

    UINode* m_hoveredNode = nullptr;
};
} // namespace framekit::ui
