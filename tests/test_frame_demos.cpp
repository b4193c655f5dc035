#include <string>

#include <gtest/gtest.h>

#include "demo/FrameDemos.hpp"

using namespace framekit;

namespace
{
const std::vector<demo::DemoKind> kAllDemos{
    demo::DemoKind::NestedFrame,
    demo::DemoKind::ScrollFrame,
    demo::DemoKind::AspectRatioFrame,
};
} // namespace

TEST(FrameDemos, BuildsAllDemosSideBySide)
{
    ui::UiTree tree;
    tree.SetScreenSize(1500, 600);
    demo::FrameDemos demos;
    std::string error;
    ASSERT_TRUE(demos.Build(tree, kAllDemos, ui::FrameConfig{}, &error)) << error;
    tree.ComputeLayout();

    const ui::UINode* nested = tree.FindNode("NestedFrame_demo");
    const ui::UINode* scroll = tree.FindNode("ScrollFrame_demo");
    const ui::UINode* aspect = tree.FindNode("AspectRatioFrame_demo");
    ASSERT_NE(nested, nullptr);
    ASSERT_NE(scroll, nullptr);
    ASSERT_NE(aspect, nullptr);
    EXPECT_LT(nested->computedRect.x, scroll->computedRect.x);
    EXPECT_LT(scroll->computedRect.x, aspect->computedRect.x);
}

TEST(FrameDemos, NestedDemoParentsFollowScopes)
{
    ui::UiTree tree;
    demo::FrameDemos demos;
    ASSERT_TRUE(demos.Build(tree, {demo::DemoKind::NestedFrame}, ui::FrameConfig{}, nullptr));

    EXPECT_EQ(tree.FindNode("label_x1")->parent->id, "nested_x1");
    EXPECT_EQ(tree.FindNode("nested_x1")->parent->id, "nested_x");
    EXPECT_EQ(tree.FindNode("nested_x2")->parent->id, "nested_outer");
    EXPECT_EQ(tree.FindNode("label_y2")->parent->id, "nested_y_cell");
    EXPECT_EQ(tree.FindNode("nested_a")->parent->id, "nested_outer");
    EXPECT_EQ(tree.FindNode("nested_z")->parent->id, "nested_outer");
}

TEST(FrameDemos, AddListEntryGrowsScrollContent)
{
    ui::UiTree tree;
    tree.SetScreenSize(800, 600);
    demo::FrameDemos demos;
    ui::FrameConfig config;
    config.initialItems = 3;
    ASSERT_TRUE(demos.Build(tree, {demo::DemoKind::ScrollFrame}, config, nullptr));
    tree.ComputeLayout();

    ui::ScrollFrameWidget* scroll = demos.Scroll();
    ASSERT_NE(scroll, nullptr);
    ASSERT_EQ(scroll->Content().children.size(), 3U);
    const float before = scroll->Frame().GetContent().height;

    const ui::UINode* button = tree.FindNode("scroll_add_entry");
    ASSERT_NE(button, nullptr);
    EXPECT_TRUE(tree.Click(button->computedRect.x + 2.0F, button->computedRect.y + 2.0F));
    EXPECT_EQ(demos.NextItemIndex(), 101);
    ASSERT_EQ(scroll->Content().children.size(), 4U);
    EXPECT_EQ(scroll->Content().children.back()->text, std::string(50, '*') + "100");

    tree.ComputeLayout();
    EXPECT_GT(scroll->Frame().GetContent().height, before);
}

TEST(FrameDemos, AspectDemoKeepsConfiguredRatio)
{
    ui::UiTree tree;
    tree.SetScreenSize(600, 400);
    demo::FrameDemos demos;
    ASSERT_TRUE(demos.Build(tree, {demo::DemoKind::AspectRatioFrame}, ui::FrameConfig{}, nullptr));
    tree.ComputeLayout();

    ui::AspectRatioWidget* aspect = demos.Aspect();
    ASSERT_NE(aspect, nullptr);
    const ui::ComputedRect& child = aspect->Child().computedRect;
    ASSERT_GT(child.h, 0.0F);
    EXPECT_NEAR(child.w / child.h, 2.0F, 2.0F / child.h);
    EXPECT_LE(child.w, aspect->Host().computedRect.w);
    EXPECT_LE(child.h, aspect->Host().computedRect.h);
}

TEST(FrameDemos, InvalidConfigFailsBuild)
{
    ui::UiTree tree;
    demo::FrameDemos demos;
    ui::FrameConfig config;
    config.scrollFrame.wheelStep = -1.0F;
    std::string error;
    EXPECT_FALSE(demos.Build(tree, {demo::DemoKind::ScrollFrame}, config, &error));
    EXPECT_FALSE(error.empty());
}
