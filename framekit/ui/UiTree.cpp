#include "framekit/ui/UiTree.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace framekit::ui
{
namespace
{
float EstimateTextContentWidth(const UINode& node)
{
    if (node.text.empty())
    {
        return 0.0F;
    }
    const float charWidth = std::max(6.0F, node.fontSize) * 0.6F;
    float maxWidth = 0.0F;
    std::size_t lineStart = 0;
    while (lineStart <= node.text.size())
    {
        const std::size_t lineEnd = node.text.find('\n', lineStart);
        const std::size_t glyphCount = (lineEnd == std::string::npos) ? (node.text.size() - lineStart) : (lineEnd - lineStart);
        maxWidth = std::max(maxWidth, static_cast<float>(glyphCount) * charWidth);
        if (lineEnd == std::string::npos)
        {
            break;
        }
        lineStart = lineEnd + 1;
    }
    return std::max(1.0F, maxWidth);
}

float EstimateTextContentHeight(const UINode& node)
{
    const int lineCount = 1 + static_cast<int>(std::count(node.text.begin(), node.text.end(), '\n'));
    return std::max(1.0F, std::max(6.0F, node.fontSize) * 1.4F * static_cast<float>(lineCount));
}

bool IsTextLike(const UINode& node)
{
    return node.type == UINodeType::Text || node.type == UINodeType::Button;
}

bool IsInFlow(const UINode& node)
{
    return node.visibility != Visibility::Collapsed
        && node.layout.display != Display::None
        && node.layout.position == Position::Relative;
}

float ResolveSize(const SizeValue& value, float reference, float autoFallback)
{
    switch (value.unit)
    {
        case SizeValue::Unit::Px:
            return value.value;
        case SizeValue::Unit::Percent:
            return reference * value.value / 100.0F;
        case SizeValue::Unit::Auto:
        default:
            return autoFallback;
    }
}

float ClampWidth(const UINode& node, float width)
{
    if (node.layout.minWidth.IsFixed())
        width = std::max(width, node.layout.minWidth.value);
    if (node.layout.maxWidth.IsFixed())
        width = std::min(width, node.layout.maxWidth.value);
    return std::max(0.0F, width);
}

float ClampHeight(const UINode& node, float height)
{
    if (node.layout.minHeight.IsFixed())
        height = std::max(height, node.layout.minHeight.value);
    if (node.layout.maxHeight.IsFixed())
        height = std::min(height, node.layout.maxHeight.value);
    return std::max(0.0F, height);
}
} // namespace

UiTree::UiTree()
{
    m_root = std::make_unique<UINode>("root", UINodeType::Container);
    m_root->layout.width = SizeValue::Percent(100.0F);
    m_root->layout.height = SizeValue::Percent(100.0F);
    RebuildNodeIndex();
}

UiTree::~UiTree() = default;

void UiTree::SetScreenSize(int width, int height)
{
    width = std::max(0, width);
    height = std::max(0, height);
    if (width == m_screenWidth && height == m_screenHeight)
    {
        return;
    }
    m_screenWidth = width;
    m_screenHeight = height;
    m_screenDirty = true;

    if (m_root)
    {
        m_root->MarkLayoutDirty();
    }
}

void UiTree::RebuildNodeIndex()
{
    m_nodeIndex.clear();
    if (!m_root)
    {
        return;
    }

    std::function<void(UINode*)> indexNode = [&](UINode* node) {
        if (!node->id.empty())
        {
            m_nodeIndex[node->id] = node;
        }
        for (const auto& child : node->children)
        {
            if (child)
            {
                indexNode(child.get());
            }
        }
    };
    indexNode(m_root.get());
}

UINode* UiTree::FindNode(const std::string& id)
{
    auto it = m_nodeIndex.find(id);
    if (it != m_nodeIndex.end())
    {
        return it->second;
    }
    if (!m_root)
    {
        return nullptr;
    }
    return m_root->id == id ? m_root.get() : m_root->FindDescendant(id);
}

const UINode* UiTree::FindNode(const std::string& id) const
{
    auto it = m_nodeIndex.find(id);
    if (it != m_nodeIndex.end())
    {
        return it->second;
    }
    if (!m_root)
    {
        return nullptr;
    }
    return m_root->id == id ? m_root.get() : m_root->FindDescendant(id);
}

bool UiTree::AttachFrame(const std::string& nodeId, FrameHooks hooks)
{
    FrameBinding binding;
    binding.hooks = std::move(hooks);
    if (!m_frames.emplace(nodeId, std::move(binding)).second)
    {
        return false;
    }
    if (UINode* node = FindNode(nodeId))
    {
        node->MarkLayoutDirty();
    }
    return true;
}

void UiTree::DetachFrame(const std::string& nodeId)
{
    m_frames.erase(nodeId);
}

bool UiTree::HasFrame(const std::string& nodeId) const
{
    return m_frames.find(nodeId) != m_frames.end();
}

void UiTree::BindOnClick(const std::string& nodeId, OnClickCallback callback)
{
    m_clickCallbacks[nodeId] = std::move(callback);
}

void UiTree::BindOnClick(const std::string& nodeId, OnClickSimpleCallback callback)
{
    m_clickCallbacks[nodeId] = [cb = std::move(callback)](UINode&) {
        cb();
    };
}

bool UiTree::TriggerClick(const std::string& nodeId)
{
    UINode* node = FindNode(nodeId);
    if (node == nullptr)
    {
        return false;
    }
    const auto it = m_clickCallbacks.find(nodeId);
    if (it == m_clickCallbacks.end() || !it->second)
    {
        return false;
    }
    it->second(*node);
    return true;
}

UINode* UiTree::PickNode(float x, float y)
{
    return m_root ? HitTest(*m_root, x, y) : nullptr;
}

void UiTree::UpdateHover(float x, float y)
{
    if (!m_root)
    {
        return;
    }
    ClearHover(*m_root);
    m_hoveredNode = PickNode(x, y);
    if (m_hoveredNode)
    {
        m_hoveredNode->state.hover = true;
    }
}

bool UiTree::Click(float x, float y)
{
    for (UINode* node = PickNode(x, y); node != nullptr; node = node->parent)
    {
        if (node->state.disabled)
        {
            return false;
        }
        if (m_clickCallbacks.find(node->id) != m_clickCallbacks.end())
        {
            return TriggerClick(node->id);
        }
    }
    return false;
}

bool UiTree::DispatchWheel(float x, float y, float notchesX, float notchesY)
{
    // Bubble from the innermost node under the cursor to the first frame that consumes it.
    for (UINode* node = PickNode(x, y); node != nullptr; node = node->parent)
    {
        const auto it = m_frames.find(node->id);
        if (it == m_frames.end() || !it->second.hooks.onWheel)
        {
            continue;
        }
        if (it->second.hooks.onWheel(notchesX, notchesY))
        {
            return true;
        }
    }
    return false;
}

UINode* UiTree::HitTest(UINode& node, float x, float y)
{
    // Skip invisible nodes
    if (node.visibility == Visibility::Hidden || node.visibility == Visibility::Collapsed)
    {
        return nullptr;
    }

    // Skip if display is none
    if (node.layout.display == Display::None)
    {
        return nullptr;
    }

    // Scroll views clip their children to the viewport
    if (node.type == UINodeType::ScrollView && !node.computedRect.Contains(x, y))
    {
        return nullptr;
    }

    // Check children first (reverse order for z-index)
    for (auto it = node.children.rbegin(); it != node.children.rend(); ++it)
    {
        if (!(*it))
        {
            continue;
        }
        UINode* hit = HitTest(**it, x, y);
        if (hit)
        {
            return hit;
        }
    }

    // Check self
    if (node.computedRect.Contains(x, y))
    {
        return &node;
    }

    return nullptr;
}

void UiTree::ClearHover(UINode& node)
{
    node.state.hover = false;
    for (const auto& child : node.children)
    {
        if (child)
        {
            ClearHover(*child);
        }
    }
}

bool UiTree::NeedsLayout() const
{
    return m_screenDirty || (m_root && m_root->layoutDirty);
}

void UiTree::ComputeLayout()
{
    if (!m_root)
    {
        return;
    }

    // Measure pass
    MeasureNode(*m_root);

    // Arrange pass
    const float screenW = static_cast<float>(m_screenWidth);
    const float screenH = static_cast<float>(m_screenHeight);
    const float rootW = ClampWidth(*m_root, ResolveSize(m_root->layout.width, screenW, screenW));
    const float rootH = ClampHeight(*m_root, ResolveSize(m_root->layout.height, screenH, screenH));
    ArrangeNode(*m_root, 0.0F, 0.0F, rootW, rootH);
    m_screenDirty = false;
}

void UiTree::MeasureNode(UINode& node)
{
    if (node.visibility == Visibility::Collapsed || node.layout.display == Display::None)
    {
        return;
    }

    // Measure children first
    for (const auto& child : node.children)
    {
        if (child)
        {
            MeasureNode(*child);
        }
    }

    const auto measuredChildWidth = [](const UINode& child) {
        if (child.layout.width.IsFixed())
        {
            return child.layout.width.value;
        }
        return child.measuredWidth;
    };
    const auto measuredChildHeight = [](const UINode& child) {
        if (child.layout.height.IsFixed())
        {
            return child.layout.height.value;
        }
        return child.measuredHeight;
    };

    // Calculate intrinsic content size (without this node's padding)
    float intrinsicContentWidth = 0.0F;
    float intrinsicContentHeight = 0.0F;

    if (IsTextLike(node))
    {
        intrinsicContentWidth = EstimateTextContentWidth(node);
        intrinsicContentHeight = EstimateTextContentHeight(node);
    }
    else if (node.type != UINodeType::Spacer)
    {
        const bool rowLayout = node.layout.flexDirection == FlexDirection::Row;
        const float gap = std::max(0.0F, node.layout.gap);
        int flowCount = 0;
        for (const auto& child : node.children)
        {
            if (!child || !IsInFlow(*child))
            {
                continue;
            }
            ++flowCount;
            const float childW = measuredChildWidth(*child) + child->layout.margin.left + child->layout.margin.right;
            const float childH = measuredChildHeight(*child) + child->layout.margin.top + child->layout.margin.bottom;
            if (rowLayout)
            {
                intrinsicContentWidth += childW;
                intrinsicContentHeight = std::max(intrinsicContentHeight, childH);
            }
            else
            {
                intrinsicContentWidth = std::max(intrinsicContentWidth, childW);
                intrinsicContentHeight += childH;
            }
        }
        const float gapTotal = gap * static_cast<float>(std::max(0, flowCount - 1));
        if (rowLayout)
        {
            intrinsicContentWidth += gapTotal;
        }
        else
        {
            intrinsicContentHeight += gapTotal;
        }
    }

    // A frame reports its content size first, then may replace the intrinsic size.
    const auto frameIt = m_frames.find(node.id);
    if (frameIt != m_frames.end())
    {
        FrameBinding& binding = frameIt->second;
        if (!binding.hooks.contentNodeId.empty() && binding.hooks.onContentResize)
        {
            const UINode* content = node.FindDescendant(binding.hooks.contentNodeId);
            if (content != nullptr)
            {
                const glm::vec2 contentSize{measuredChildWidth(*content), measuredChildHeight(*content)};
                if (contentSize != binding.lastContentSize)
                {
                    binding.lastContentSize = contentSize;
                    binding.hooks.onContentResize(contentSize.x, contentSize.y);
                }
            }
        }
        if (binding.hooks.preferredSize)
        {
            const glm::vec2 preferred = binding.hooks.preferredSize();
            intrinsicContentWidth = preferred.x;
            intrinsicContentHeight = preferred.y;
        }
    }

    const float intrinsicWidth = intrinsicContentWidth + std::max(0.0F, node.layout.padding.left + node.layout.padding.right);
    const float intrinsicHeight = intrinsicContentHeight + std::max(0.0F, node.layout.padding.top + node.layout.padding.bottom);

    node.measuredWidth = ClampWidth(node, intrinsicWidth);
    node.measuredHeight = ClampHeight(node, intrinsicHeight);
}

void UiTree::ArrangeNode(UINode& node, float x, float y, float width, float height)
{
    if (node.visibility == Visibility::Collapsed || node.layout.display == Display::None)
    {
        node.computedRect = ComputedRect{};
        node.layoutDirty = false;
        return;
    }

    // Set computed rect
    node.computedRect.x = x;
    node.computedRect.y = y;
    node.computedRect.w = std::max(0.0F, width);
    node.computedRect.h = std::max(0.0F, height);

    // Calculate content rect (after padding)
    node.computedRect.contentX = x + node.layout.padding.left;
    node.computedRect.contentY = y + node.layout.padding.top;
    node.computedRect.contentW = std::max(0.0F, node.computedRect.w - node.layout.padding.left - node.layout.padding.right);
    node.computedRect.contentH = std::max(0.0F, node.computedRect.h - node.layout.padding.top - node.layout.padding.bottom);

    // Frames place their managed children before those children are arranged.
    const auto frameIt = m_frames.find(node.id);
    if (frameIt != m_frames.end() && frameIt->second.hooks.onResize)
    {
        FrameBinding& binding = frameIt->second;
        const glm::vec2 viewportSize{node.computedRect.contentW, node.computedRect.contentH};
        if (viewportSize != binding.lastViewportSize)
        {
            binding.lastViewportSize = viewportSize;
            binding.hooks.onResize(viewportSize.x, viewportSize.y);
        }
    }

    if (!node.children.empty())
    {
        ArrangeFlowChildren(node);
        ArrangeOutOfFlowChildren(node);
    }
    node.layoutDirty = false;
}

void UiTree::ArrangeFlowChildren(UINode& node)
{
    const bool isRow = node.layout.flexDirection == FlexDirection::Row;
    const float mainSize = isRow ? node.computedRect.contentW : node.computedRect.contentH;
    const float crossSize = isRow ? node.computedRect.contentH : node.computedRect.contentW;

    std::vector<std::size_t> flowChildren;
    flowChildren.reserve(node.children.size());
    std::vector<float> finalMain(node.children.size(), 0.0F);

    float totalBaseMain = 0.0F;
    float totalFlexGrow = 0.0F;

    for (std::size_t i = 0; i < node.children.size(); ++i)
    {
        if (!node.children[i] || !IsInFlow(*node.children[i]))
        {
            continue;
        }
        const UINode& child = *node.children[i];
        flowChildren.push_back(i);

        const SizeValue& mainValue = isRow ? child.layout.width : child.layout.height;
        const float autoMain = isRow ? child.measuredWidth : child.measuredHeight;
        float basis = std::max(0.0F, ResolveSize(mainValue, mainSize, autoMain));
        if (IsTextLike(child))
        {
            basis = std::max(basis, autoMain);
        }
        basis = isRow ? ClampWidth(child, basis) : ClampHeight(child, basis);

        finalMain[i] = basis;
        totalBaseMain += basis + (isRow ? child.layout.margin.left + child.layout.margin.right
                                        : child.layout.margin.top + child.layout.margin.bottom);
        totalFlexGrow += std::max(0.0F, child.layout.flexGrow);
    }

    const float gap = std::max(0.0F, node.layout.gap);
    const float gapTotal = gap * static_cast<float>(std::max(0, static_cast<int>(flowChildren.size()) - 1));
    const float remainingMain = mainSize - totalBaseMain - gapTotal;
    if (remainingMain > 0.0F && totalFlexGrow > 0.0F)
    {
        for (std::size_t index : flowChildren)
        {
            const float grow = std::max(0.0F, node.children[index]->layout.flexGrow);
            finalMain[index] += remainingMain * (grow / totalFlexGrow);
        }
    }

    float cursor = isRow ? node.computedRect.contentX : node.computedRect.contentY;
    for (std::size_t index : flowChildren)
    {
        UINode& child = *node.children[index];
        const float marginMainStart = isRow ? child.layout.margin.left : child.layout.margin.top;
        const float marginMainEnd = isRow ? child.layout.margin.right : child.layout.margin.bottom;
        const float marginCrossStart = isRow ? child.layout.margin.top : child.layout.margin.left;
        const float marginCrossEnd = isRow ? child.layout.margin.bottom : child.layout.margin.right;

        const SizeValue& crossValue = isRow ? child.layout.height : child.layout.width;
        const float availableCross = std::max(0.0F, crossSize - marginCrossStart - marginCrossEnd);
        const float autoCross = node.layout.alignItems == AlignItems::Stretch
            ? availableCross
            : (isRow ? child.measuredHeight : child.measuredWidth);
        float childCross = std::max(0.0F, ResolveSize(crossValue, crossSize, autoCross));
        childCross = isRow ? ClampHeight(child, childCross) : ClampWidth(child, childCross);

        float crossOffset = 0.0F;
        switch (node.layout.alignItems)
        {
            case AlignItems::Center:
                crossOffset = (availableCross - childCross) * 0.5F;
                break;
            case AlignItems::FlexEnd:
                crossOffset = availableCross - childCross;
                break;
            case AlignItems::FlexStart:
            case AlignItems::Stretch:
            default:
                break;
        }

        const float crossStart = (isRow ? node.computedRect.contentY : node.computedRect.contentX) + marginCrossStart + crossOffset;
        const float mainStart = cursor + marginMainStart;
        if (isRow)
        {
            ArrangeNode(child, mainStart, crossStart, finalMain[index], childCross);
        }
        else
        {
            ArrangeNode(child, crossStart, mainStart, childCross, finalMain[index]);
        }
        cursor = mainStart + finalMain[index] + marginMainEnd + gap;
    }
}

void UiTree::ArrangeOutOfFlowChildren(UINode& node)
{
    for (const auto& childPtr : node.children)
    {
        if (!childPtr)
        {
            continue;
        }
        UINode& child = *childPtr;
        if (child.visibility == Visibility::Collapsed || child.layout.display == Display::None)
        {
            continue;
        }

        if (child.layout.position == Position::Managed)
        {
            const glm::vec4& placement = child.layout.placement;
            ArrangeNode(child,
                node.computedRect.contentX + placement.x,
                node.computedRect.contentY + placement.y,
                placement.z,
                placement.w);
        }
    }
}
} // namespace framekit::ui
