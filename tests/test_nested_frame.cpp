#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "framekit/ui/NestedFrame.hpp"

using namespace framekit::ui;

TEST(NestedFrame, WidgetsGoToTheEnteredContainer)
{
    UiTree tree;
    NestedFrame nested(tree);
    EXPECT_EQ(nested.Current(), tree.GetRoot());

    UINode* outer = nested.Enter("outer");
    ASSERT_NE(outer, nullptr);
    UINode* label = nested.Add(UINode::CreateText("label", "x"));
    UINode* inner = nested.Enter("inner");
    ASSERT_NE(inner, nullptr);
    UINode* deep = nested.Add(UINode::CreateText("deep", "x1"));

    EXPECT_EQ(label->parent, outer);
    EXPECT_EQ(inner->parent, outer);
    EXPECT_EQ(deep->parent, inner);
    EXPECT_EQ(outer->parent, tree.GetRoot());
    EXPECT_EQ(nested.Depth(), 2U);

    ASSERT_TRUE(nested.Exit());
    EXPECT_EQ(nested.Current(), outer);
    ASSERT_TRUE(nested.Exit());
    EXPECT_TRUE(nested.Empty());
}

TEST(NestedFrame, ExitOnEmptyStackReportsUnderflow)
{
    UiTree tree;
    NestedFrame nested(tree);
    std::string error;
    EXPECT_FALSE(nested.Exit(&error));
    EXPECT_NE(error.find("underflow"), std::string::npos);
    EXPECT_TRUE(nested.Empty());
}

TEST(NestedFrame, ExitToDropsSeveralLevels)
{
    UiTree tree;
    NestedFrame nested(tree);
    UINode* outer = nested.Enter("outer");
    nested.Enter("a");
    nested.Enter("b");
    ASSERT_EQ(nested.Depth(), 3U);

    ASSERT_TRUE(nested.ExitTo(1));
    EXPECT_EQ(nested.Current(), outer);

    std::string error;
    EXPECT_FALSE(nested.ExitTo(4, &error));
    EXPECT_FALSE(error.empty());
    EXPECT_EQ(nested.Depth(), 1U);
}

TEST(NestedFrame, OutermostExitIndexesNewNodes)
{
    UiTree tree;
    NestedFrame nested(tree);
    nested.Enter("panel");
    nested.Add(UINode::CreateText("caption", "hello"));
    ASSERT_TRUE(nested.Exit());

    const UINode* caption = tree.FindNode("caption");
    ASSERT_NE(caption, nullptr);
    EXPECT_EQ(caption->parent->id, "panel");
}

TEST(NestedFrame, EnterExistingNodeMustBeBelowCurrent)
{
    UiTree tree;
    NestedFrame nested(tree);
    UINode* left = nested.Enter("left");
    UINode* leftChild = nested.Add(UINode::CreateContainer("left_child"));
    ASSERT_TRUE(nested.Exit());
    UINode* right = nested.Enter("right");
    ASSERT_NE(right, nullptr);

    std::string error;
    EXPECT_EQ(nested.Enter(*leftChild, &error), nullptr);
    EXPECT_FALSE(error.empty());
    EXPECT_EQ(nested.Depth(), 1U);

    ASSERT_TRUE(nested.Exit());
    EXPECT_EQ(nested.Enter(*left), left);
    EXPECT_EQ(nested.Enter(*leftChild), leftChild);
    EXPECT_EQ(nested.Add(UINode::CreateText("t", "x"))->parent, leftChild);
    EXPECT_TRUE(nested.ExitTo(0));
}

TEST(NestedFrame, ScopeRestoresDepthOnNormalExit)
{
    UiTree tree;
    NestedFrame nested(tree);
    {
        NestedScope outer(nested, "outer");
        ASSERT_TRUE(outer.Entered());
        {
            NestedScope inner(nested, "inner");
            EXPECT_EQ(nested.Depth(), 2U);
            EXPECT_EQ(inner.Node()->parent, outer.Node());
        }
        EXPECT_EQ(nested.Depth(), 1U);
    }
    EXPECT_TRUE(nested.Empty());
}

TEST(NestedFrame, ScopeRestoresDepthWhenBuildCodeThrows)
{
    UiTree tree;
    NestedFrame nested(tree);
    try
    {
        NestedScope outer(nested, "outer");
        NestedScope inner(nested, "inner");
        throw std::runtime_error("widget construction failed");
    }
    catch (const std::runtime_error&)
    {
    }
    EXPECT_TRUE(nested.Empty());
    EXPECT_EQ(nested.Current(), tree.GetRoot());
}

TEST(NestedFrame, ScopeDropsLevelsEnteredWithoutScope)
{
    UiTree tree;
    NestedFrame nested(tree);
    {
        NestedScope outer(nested, "outer");
        nested.Enter("stale_a");
        nested.Enter("stale_b");
        EXPECT_EQ(nested.Depth(), 3U);
    }
    EXPECT_TRUE(nested.Empty());
}

TEST(NestedFrame, ScopeCanWrapAnExplicitParent)
{
    UiTree tree;
    auto host = UINode::CreateContainer("host");
    UINode* hostPtr = tree.GetRoot()->AddChild(std::move(host));

    NestedFrame nested(tree, hostPtr);
    EXPECT_EQ(nested.Base(), hostPtr);
    {
        NestedScope scope(nested, "child");
        EXPECT_EQ(scope.Node()->parent, hostPtr);
    }
    EXPECT_EQ(nested.Add(UINode::CreateSpacer("gap", 4.0F))->parent, hostPtr);
}

TEST(NestedFrame, RandomBalancedSequencesEndEmpty)
{
    std::mt19937 rng(7U);
    std::bernoulli_distribution enterDist(0.55);

    for (int run = 0; run < 50; ++run)
    {
        UiTree tree;
        NestedFrame nested(tree);
        std::vector<UINode*> expectedStack;
        int counter = 0;

        for (int step = 0; step < 100; ++step)
        {
            if (expectedStack.empty() || enterDist(rng))
            {
                UINode* container = nested.Enter("c" + std::to_string(counter++));
                ASSERT_NE(container, nullptr);
                UINode* expectedParent = expectedStack.empty() ? tree.GetRoot() : expectedStack.back();
                ASSERT_EQ(container->parent, expectedParent);
                expectedStack.push_back(container);

                UINode* widget = nested.Add(UINode::CreateText("w" + std::to_string(counter++), "w"));
                ASSERT_EQ(widget->parent, container);
            }
            else
            {
                ASSERT_TRUE(nested.Exit());
                expectedStack.pop_back();
            }
            ASSERT_EQ(nested.Depth(), expectedStack.size());
        }

        while (!expectedStack.empty())
        {
            ASSERT_TRUE(nested.Exit());
            expectedStack.pop_back();
        }
        EXPECT_TRUE(nested.Empty());
        EXPECT_EQ(nested.Current(), tree.GetRoot());
    }
}
