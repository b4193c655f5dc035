#include "framekit/ui/NestedFrame.hpp"

#include <iostream>

namespace framekit::ui
{
NestedFrame::NestedFrame(UiTree& tree, UINode* parent)
    : m_tree(tree), m_base(parent != nullptr ? parent : tree.GetRoot())
{
}

UINode* NestedFrame::Current() const
{
    return m_stack.empty() ? m_base : m_stack.back();
}

UINode* NestedFrame::Enter(const std::string& id, std::string* outError)
{
    UINode* parent = Current();
    if (parent == nullptr)
    {
        if (outError != nullptr)
        {
            *outError = "Cannot enter '" + id + "': tree has no root";
        }
        return nullptr;
    }

    UINode* container = parent->AddChild(UINode::CreateContainer(id));
    m_stack.push_back(container);
    return container;
}

UINode* NestedFrame::Enter(UINode& container, std::string* outError)
{
    UINode* parent = Current();
    if (parent == nullptr || !container.IsWithin(*parent))
    {
        if (outError != nullptr)
        {
            *outError = "Cannot enter '" + container.id + "': not below the current parent";
        }
        return nullptr;
    }

    m_stack.push_back(&container);
    return &container;
}

bool NestedFrame::Exit(std::string* outError)
{
    if (m_stack.empty())
    {
        if (outError != nullptr)
        {
            *outError = "Parent stack underflow: exit without matching enter";
        }
        return false;
    }

    m_stack.pop_back();
    if (m_stack.empty())
    {
        m_tree.RebuildNodeIndex();
    }
    return true;
}

bool NestedFrame::ExitTo(std::size_t depth, std::string* outError)
{
    if (depth > m_stack.size())
    {
        if (outError != nullptr)
        {
            *outError = "Cannot exit to depth " + std::to_string(depth) + " from depth " + std::to_string(m_stack.size());
        }
        return false;
    }

    while (m_stack.size() > depth)
    {
        if (!Exit(outError))
        {
            return false;
        }
    }
    return true;
}

UINode* NestedFrame::Add(std::unique_ptr<UINode> widget)
{
    UINode* parent = Current();
    if (parent == nullptr || !widget)
    {
        return nullptr;
    }
    return parent->AddChild(std::move(widget));
}

NestedScope::NestedScope(NestedFrame& frame, const std::string& id)
    : m_frame(frame), m_depth(frame.Depth())
{
    m_node = m_frame.Enter(id, &m_error);
}

NestedScope::NestedScope(NestedFrame& frame, UINode& container)
    : m_frame(frame), m_depth(frame.Depth())
{
    m_node = m_frame.Enter(container, &m_error);
}

NestedScope::~NestedScope()
{
    std::string error;
    if (!m_frame.ExitTo(m_depth, &error))
    {
        std::cerr << "[NestedFrame] " << error << "\n";
    }
}
} // namespace framekit::ui
