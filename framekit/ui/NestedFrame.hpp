#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "framekit/ui/UiNode.hpp"
#include "framekit/ui/UiTree.hpp"

namespace framekit::ui
{
// Builds a node hierarchy by entering and leaving containers. Widgets added while a
// container is entered are parented to it; with nothing entered they go to the base parent.
class NestedFrame
{
public:
    // A null parent means the tree root.
    explicit NestedFrame(UiTree& tree, UINode* parent = nullptr);

    NestedFrame(const NestedFrame&) = delete;
    NestedFrame& operator=(const NestedFrame&) = delete;

    // Creates a container under the current parent and makes it current.
    UINode* Enter(const std::string& id, std::string* outError = nullptr);
    // Makes an existing node current. It must be the current parent or lie below it.
    UINode* Enter(UINode& container, std::string* outError = nullptr);

    bool Exit(std::string* outError = nullptr);
    bool ExitTo(std::size_t depth, std::string* outError = nullptr);

    UINode* Add(std::unique_ptr<UINode> widget);

    [[nodiscard]] UINode* Current() const;
    [[nodiscard]] UINode* Base() const { return m_base; }
    [[nodiscard]] std::size_t Depth() const { return m_stack.size(); }
    [[nodiscard]] bool Empty() const { return m_stack.empty(); }
    [[nodiscard]] UiTree& Tree() const { return m_tree; }

private:
    UiTree& m_tree;
    UINode* m_base = nullptr;
    std::vector<UINode*> m_stack;
};

// Enters on construction and restores the previous depth on destruction,
// including when the enclosing scope is left by an exception.
class NestedScope
{
public:
    NestedScope(NestedFrame& frame, const std::string& id);
    NestedScope(NestedFrame& frame, UINode& container);
    ~NestedScope();

    NestedScope(const NestedScope&) = delete;
    NestedScope& operator=(const NestedScope&) = delete;

    [[nodiscard]] UINode* Node() const { return m_node; }
    [[nodiscard]] bool Entered() const { return m_node != nullptr; }
    [[nodiscard]] const std::string& Error() const { return m_error; }

private:
    NestedFrame& m_frame;
    std::size_t m_depth = 0;
    UINode* m_node = nullptr;
    std::string m_error;
};
} // namespace framekit::ui
