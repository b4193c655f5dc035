#include "demo/FrameDemos.hpp"

namespace framekit::demo
{
namespace
{
const glm::vec4 kYellow{1.0F, 1.0F, 0.0F, 1.0F};
const glm::vec4 kBlue{0.0F, 0.0F, 1.0F, 1.0F};
const glm::vec4 kRed{1.0F, 0.0F, 0.0F, 1.0F};
const glm::vec4 kLightBlue{0.68F, 0.85F, 0.9F, 1.0F};
const glm::vec4 kBisque{1.0F, 0.89F, 0.77F, 1.0F};
const glm::vec4 kGreen{0.0F, 0.5F, 0.0F, 1.0F};
const glm::vec4 kGray{0.75F, 0.75F, 0.75F, 1.0F};

constexpr float kLabelWidth = 70.0F;

std::unique_ptr<ui::UINode> MakeLabel(const std::string& id, const std::string& text, const glm::vec4& color)
{
    auto label = ui::UINode::CreateText(id, text);
    label->backgroundColor = color;
    label->layout.width = ui::SizeValue::Px(kLabelWidth);
    return label;
}

std::string ListEntryText(int index)
{
    return std::string(50, '*') + std::to_string(index);
}

bool CheckEntered(const ui::NestedScope& scope, std::string* outError)
{
    if (scope.Entered())
    {
        return true;
    }
    if (outError != nullptr)
    {
        *outError = scope.Error();
    }
    return false;
}

// A row container with padding, like a horizontally packed frame
void MakeRow(ui::UINode& node)
{
    node.layout.flexDirection = ui::FlexDirection::Row;
    node.layout.alignItems = ui::AlignItems::FlexStart;
    node.layout.padding = ui::EdgeInsets::Symmetric(2.0F, 5.0F);
}
} // namespace

bool FrameDemos::Build(ui::UiTree& tree, const std::vector<DemoKind>& kinds, const ui::FrameConfig& config, std::string* outError)
{
    m_tree = &tree;
    ui::UINode* root = tree.GetRoot();
    if (root == nullptr)
    {
        if (outError != nullptr)
        {
            *outError = "Tree has no root";
        }
        return false;
    }
    root->layout.flexDirection = ui::FlexDirection::Row;
    root->layout.gap = 8.0F;
    root->layout.padding = ui::EdgeInsets::All(8.0F);

    ui::NestedFrame nested(tree);
    for (DemoKind kind : kinds)
    {
        const std::string name = DemoKindToText(kind);
        ui::NestedScope column(nested, name + "_demo");
        if (!CheckEntered(column, outError))
        {
            return false;
        }
        column.Node()->layout.flexGrow = 1.0F;
        column.Node()->layout.gap = 4.0F;
        nested.Add(ui::UINode::CreateText(name + "_title", name + "-Test"));

        bool built = false;
        switch (kind)
        {
            case DemoKind::NestedFrame:
                built = BuildNestedDemo(nested, outError);
                break;
            case DemoKind::ScrollFrame:
                built = BuildScrollDemo(nested, config, outError);
                break;
            case DemoKind::AspectRatioFrame:
                built = BuildAspectDemo(nested, config, outError);
                break;
        }
        if (!built)
        {
            return false;
        }
    }
    return true;
}

bool FrameDemos::BuildNestedDemo(ui::NestedFrame& nested, std::string* outError)
{
    ui::NestedScope outer(nested, "nested_outer");
    if (!CheckEntered(outer, outError))
    {
        return false;
    }
    outer.Node()->backgroundColor = kBlue;
    outer.Node()->layout.padding = ui::EdgeInsets::All(5.0F);
    outer.Node()->layout.alignItems = ui::AlignItems::FlexStart;

    {
        ui::NestedScope x(nested, "nested_x");
        MakeRow(*x.Node());
        nested.Add(MakeLabel("label_x", "x", kYellow));

        // Entered without a scope of its own; leaving the scope above drops both levels.
        ui::UINode* x1 = nested.Enter("nested_x1", outError);
        if (x1 == nullptr)
        {
            return false;
        }
        MakeRow(*x1);
        nested.Add(MakeLabel("label_x1", "x1", kYellow));
    }

    {
        ui::NestedScope x2(nested, "nested_x2");
        MakeRow(*x2.Node());
        nested.Add(MakeLabel("label_x2", "x2", kYellow));
    }

    {
        ui::NestedScope grid(nested, "nested_y");
        grid.Node()->backgroundColor = kRed;
        grid.Node()->layout.padding = ui::EdgeInsets::All(5.0F);
        grid.Node()->layout.alignItems = ui::AlignItems::FlexEnd;
        nested.Add(MakeLabel("label_y", "y", kYellow));

        ui::NestedScope cell(nested, "nested_y_cell");
        MakeRow(*cell.Node());
        nested.Add(MakeLabel("label_y1", "y1", kYellow));
        nested.Add(MakeLabel("label_y2", "y2", kYellow));
    }

    // Plain container added without entering it
    auto plain = ui::UINode::CreateContainer("nested_a");
    MakeRow(*plain);
    plain->AddChild(MakeLabel("label_a", "a", kYellow));
    nested.Add(std::move(plain));

    {
        ui::NestedScope z(nested, "nested_z");
        MakeRow(*z.Node());
        nested.Add(MakeLabel("label_z", "z", kYellow));
    }
    return true;
}

bool FrameDemos::BuildScrollDemo(ui::NestedFrame& nested, const ui::FrameConfig& config, std::string* outError)
{
    {
        ui::NestedScope outer(nested, "scroll_outer");
        if (!CheckEntered(outer, outError))
        {
            return false;
        }
        outer.Node()->layout.flexGrow = 1.0F;
        outer.Node()->backgroundColor = kGreen;

        {
            ui::NestedScope a(nested, "scroll_pad_a");
            ui::NestedScope b(nested, "scroll_pad_b");
        }
        {
            ui::NestedScope c(nested, "scroll_pad_c");
        }

        m_scroll = ui::MountScrollFrame(nested, "scroll_frame", config.scrollFrame, outError);
        if (!m_scroll)
        {
            return false;
        }
        m_scroll->Host().layout.flexGrow = 1.0F;
        m_scroll->Host().backgroundColor = kGray;
        ui::UINode& content = m_scroll->Content();
        content.backgroundColor = kRed;
        content.layout.alignItems = ui::AlignItems::FlexStart;

        ui::NestedScope list(nested, content);
        if (!CheckEntered(list, outError))
        {
            return false;
        }
        for (int i = 0; i < config.initialItems; ++i)
        {
            auto entry = ui::UINode::CreateText("scroll_item_" + std::to_string(i), ListEntryText(i));
            entry->backgroundColor = kLightBlue;
            nested.Add(std::move(entry));
        }
    }

    nested.Add(MakeLabel("scroll_label_x", "x", kYellow));
    ui::UINode* button = nested.Add(ui::UINode::CreateButton("scroll_add_entry", "Add list entry"));
    if (button == nullptr)
    {
        return false;
    }
    button->layout.padding = ui::EdgeInsets::Symmetric(4.0F, 8.0F);
    button->textColor = glm::vec4{1.0F, 1.0F, 1.0F, 1.0F};
    m_tree->BindOnClick("scroll_add_entry", [this]() {
        (void)AddListEntry();
    });
    return true;
}

bool FrameDemos::BuildAspectDemo(ui::NestedFrame& nested, const ui::FrameConfig& config, std::string* outError)
{
    {
        ui::NestedScope outer(nested, "aspect_outer");
        if (!CheckEntered(outer, outError))
        {
            return false;
        }
        outer.Node()->layout.flexGrow = 1.0F;

        {
            ui::NestedScope a(nested, "aspect_pad_a");
            ui::NestedScope b(nested, "aspect_pad_b");
        }
        {
            ui::NestedScope c(nested, "aspect_pad_c");
        }

        m_aspect = ui::MountAspectRatioFrame(nested, "aspect_frame", config.aspectRatio, outError);
        if (!m_aspect)
        {
            return false;
        }
        m_aspect->Host().layout.flexGrow = 1.0F;
        m_aspect->Host().backgroundColor = kBlue;
        m_aspect->Child().backgroundColor = kBisque;
        m_aspect->Child().layout.alignItems = ui::AlignItems::Center;

        ui::NestedScope inner(nested, m_aspect->Child());
        if (!CheckEntered(inner, outError))
        {
            return false;
        }
        nested.Add(ui::UINode::CreateText("aspect_inner", "inner content"));
    }

    auto outerLabel = ui::UINode::CreateText("aspect_outer_label", "outer content");
    outerLabel->backgroundColor = kRed;
    nested.Add(std::move(outerLabel));
    return true;
}

void FrameDemos::Subscribe(core::EventBus& eventBus)
{
    eventBus.Subscribe(core::EventType::Scroll, [this](const core::Event& event) {
        if (m_scroll && m_scroll->Scrolls() && (event.target.empty() || event.target == m_scroll->Host().id))
        {
            m_scroll->Frame().OnScroll(event.value.x, event.value.y);
        }
    });
    eventBus.Subscribe(core::EventType::Click, [this](const core::Event& event) {
        if (m_scroll)
        {
            (void)m_scroll->PressScrollbar(event.position.x, event.position.y);
        }
    });
}

bool FrameDemos::AddListEntry()
{
    if (!m_scroll)
    {
        return false;
    }
    auto entry = ui::UINode::CreateText("scroll_item_" + std::to_string(m_nextItem), ListEntryText(m_nextItem));
    entry->backgroundColor = kLightBlue;
    m_scroll->Content().AddChild(std::move(entry));
    ++m_nextItem;
    return true;
}
} // namespace framekit::demo
