#pragma once

#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <glm/vec4.hpp>

namespace framekit::ui
{
// Node types
enum class UINodeType
{
    Container,
    Panel,
    Text,
    Button,
    ScrollView,
    Scrollbar,
    Spacer
};

// Node visibility
enum class Visibility
{
    Visible,   // Rendered and participates in layout
    Hidden,    // Not rendered but participates in layout
    Collapsed  // Not rendered and does not participate in layout
};

// Layout display mode
enum class Display
{
    Flex,
    None
};

// Positioning mode
enum class Position
{
    Relative,
    Managed  // Placed by the owning frame through its delegate, excluded from flow
};

// Flex direction
enum class FlexDirection
{
    Row,
    Column
};

// Cross-axis alignment
enum class AlignItems
{
    FlexStart,
    FlexEnd,
    Center,
    Stretch
};

// Size value (can be auto, pixels or percent of the parent content box)
struct SizeValue
{
    enum class Unit
    {
        Auto,
        Px,
        Percent
    };

    float value = 0.0F;
    Unit unit = Unit::Auto;

    static SizeValue Auto()
    {
        return {0.0F, Unit::Auto};
    }
    static SizeValue Px(float v)
    {
        return {v, Unit::Px};
    }
    static SizeValue Percent(float v)
    {
        return {v, Unit::Percent};
    }

    [[nodiscard]] bool IsAuto() const
    {
        return unit == Unit::Auto;
    }
    [[nodiscard]] bool IsFixed() const
    {
        return unit == Unit::Px;
    }
};

// Edge insets (padding, margin)
struct EdgeInsets
{
    float top = 0.0F;
    float right = 0.0F;
    float bottom = 0.0F;
    float left = 0.0F;

    EdgeInsets() = default;
    EdgeInsets(float t, float r, float b, float l) : top(t), right(r), bottom(b), left(l)
    {
    }

    static EdgeInsets All(float v)
    {
        return EdgeInsets(v, v, v, v);
    }
    static EdgeInsets Symmetric(float v, float h)
    {
        return EdgeInsets(v, h, v, h);
    }
};

// Layout properties for a node
struct LayoutProps
{
    Display display = Display::Flex;
    Position position = Position::Relative;

    // Flex container properties
    FlexDirection flexDirection = FlexDirection::Column;
    AlignItems alignItems = AlignItems::Stretch;
    float gap = 0.0F;

    // Box model
    EdgeInsets padding;
    EdgeInsets margin;

    // Sizing
    SizeValue width = SizeValue::Auto();
    SizeValue height = SizeValue::Auto();
    SizeValue minWidth;
    SizeValue maxWidth;
    SizeValue minHeight;
    SizeValue maxHeight;

    // Flex child properties
    float flexGrow = 0.0F;

    // Managed placement (x, y, w, h) relative to the parent content box
    glm::vec4 placement{0.0F, 0.0F, 0.0F, 0.0F};
};

// Node runtime state
struct NodeState
{
    bool hover = false;
    bool disabled = false;

    // ScrollView visible region offset
    float scrollX = 0.0F;
    float scrollY = 0.0F;

    // Scrollbar thumb (position and extent as 0-1 fractions)
    float value01 = 0.0F;
    float thumbExtent = 1.0F;
};

// Computed rectangle after layout
struct ComputedRect
{
    float x = 0.0F;
    float y = 0.0F;
    float w = 0.0F;
    float h = 0.0F;
    float contentX = 0.0F;  // Content area (after padding)
    float contentY = 0.0F;
    float contentW = 0.0F;
    float contentH = 0.0F;

    [[nodiscard]] bool Contains(float px, float py) const
    {
        return px >= x && py >= y && px <= x + w && py <= y + h;
    }
};

// UINode is the retained-mode container primitive every frame is built from
class UINode
{
public:
    // Identification
    std::string id;

    UINodeType type = UINodeType::Container;

    // Tree structure
    std::vector<std::unique_ptr<UINode>> children;
    UINode* parent = nullptr;

    Visibility visibility = Visibility::Visible;
    LayoutProps layout;

    // Inline style
    std::optional<glm::vec4> backgroundColor;
    glm::vec4 textColor{0.1F, 0.1F, 0.1F, 1.0F};
    float fontSize = 14.0F;

    // Text content (for Text and Button nodes)
    std::string text;

    NodeState state;

    // Computed values (after layout)
    ComputedRect computedRect;
    float measuredWidth = 0.0F;
    float measuredHeight = 0.0F;

    bool layoutDirty = true;

    UINode() = default;
    explicit UINode(std::string nodeId, UINodeType nodeType = UINodeType::Container)
        : id(std::move(nodeId)), type(nodeType)
    {
    }

    // Non-copyable, movable
    UINode(const UINode&) = delete;
    UINode& operator=(const UINode&) = delete;
    UINode(UINode&&) = default;
    UINode& operator=(UINode&&) = default;

    ~UINode() = default;

    // Tree manipulation
    UINode* AddChild(std::unique_ptr<UINode> child)
    {
        if (!child)
            return nullptr;
        child->parent = this;
        children.push_back(std::move(child));
        MarkLayoutDirty();
        return children.back().get();
    }

    UINode* FindDescendant(std::string_view descendantId) const
    {
        for (const auto& child : children)
        {
            if (!child)
            {
                continue;
            }
            if (child->id == descendantId)
                return child.get();
            if (auto found = child->FindDescendant(descendantId))
                return found;
        }
        return nullptr;
    }

    // True if this node is `ancestor` or lies below it
    [[nodiscard]] bool IsWithin(const UINode& ancestor) const
    {
        for (const UINode* node = this; node != nullptr; node = node->parent)
        {
            if (node == &ancestor)
                return true;
        }
        return false;
    }

    void MarkLayoutDirty()
    {
        layoutDirty = true;
        for (UINode* node = parent; node != nullptr && !node->layoutDirty; node = node->parent)
        {
            node->layoutDirty = true;
        }
    }

    // Helper factory methods
    static std::unique_ptr<UINode> CreateContainer(std::string id)
    {
        return std::make_unique<UINode>(std::move(id), UINodeType::Container);
    }

    static std::unique_ptr<UINode> CreatePanel(std::string id, const glm::vec4& color)
    {
        auto node = std::make_unique<UINode>(std::move(id), UINodeType::Panel);
        node->backgroundColor = color;
        return node;
    }

    static std::unique_ptr<UINode> CreateText(std::string id, std::string textContent)
    {
        auto node = std::make_unique<UINode>(std::move(id), UINodeType::Text);
        node->text = std::move(textContent);
        return node;
    }

    static std::unique_ptr<UINode> CreateButton(std::string id, std::string label)
    {
        auto node = std::make_unique<UINode>(std::move(id), UINodeType::Button);
        node->text = std::move(label);
        return node;
    }

    static std::unique_ptr<UINode> CreateScrollView(std::string id)
    {
        return std::make_unique<UINode>(std::move(id), UINodeType::ScrollView);
    }

    static std::unique_ptr<UINode> CreateScrollbar(std::string id)
    {
        auto node = std::make_unique<UINode>(std::move(id), UINodeType::Scrollbar);
        node->layout.position = Position::Managed;
        node->visibility = Visibility::Hidden;
        return node;
    }

    static std::unique_ptr<UINode> CreateSpacer(std::string id, float size)
    {
        auto node = std::make_unique<UINode>(std::move(id), UINodeType::Spacer);
        node->layout.width = SizeValue::Px(size);
        node->layout.height = SizeValue::Px(size);
        return node;
    }
};

} // namespace framekit::ui
