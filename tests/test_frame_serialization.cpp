#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "framekit/ui/FrameSerialization.hpp"
#include "framekit/ui/UiTree.hpp"

using namespace framekit::ui;

namespace
{
std::filesystem::path TempConfigPath(const std::string& name)
{
    return std::filesystem::temp_directory_path() / "framekit_tests" / name;
}
} // namespace

TEST(FrameSerialization, AnchorTextRoundTrip)
{
    for (Anchor anchor : {Anchor::N, Anchor::NE, Anchor::E, Anchor::SE, Anchor::S, Anchor::SW, Anchor::W, Anchor::NW, Anchor::Center})
    {
        EXPECT_EQ(AnchorFromText(AnchorToText(anchor), Anchor::N == anchor ? Anchor::S : Anchor::N), anchor);
    }
    EXPECT_EQ(AnchorFromText("SE"), Anchor::SE);
    EXPECT_EQ(AnchorFromText("middle", Anchor::W), Anchor::W);
}

TEST(FrameSerialization, ScrollbarPolicyText)
{
    EXPECT_EQ(ScrollbarPolicyFromText("always"), ScrollbarPolicy::Always);
    EXPECT_EQ(ScrollbarPolicyFromText("Never"), ScrollbarPolicy::Never);
    EXPECT_EQ(ScrollbarPolicyFromText("sometimes", ScrollbarPolicy::Never), ScrollbarPolicy::Never);
    EXPECT_EQ(ScrollbarPolicyToText(ScrollbarPolicy::Auto), "auto");
}

TEST(FrameSerialization, ParseKeepsDefaultsForMissingAndWrongTypedKeys)
{
    FrameConfig config;
    std::string error;
    ASSERT_TRUE(ParseFrameConfig(R"({
        "window": { "width": "wide", "vsync": false },
        "aspect_ratio": { "ratio_w": 16, "ratio_h": 9, "anchor": "nw" },
        "scroll_frame": { "vertical_policy": "always", "max_width": null, "wheel_step": 0 },
        "unknown": 3
    })", config, &error)) << error;

    EXPECT_EQ(config.windowWidth, FrameConfig{}.windowWidth);
    EXPECT_FALSE(config.vsync);
    EXPECT_FLOAT_EQ(config.aspectRatio.ratioW, 16.0F);
    EXPECT_FLOAT_EQ(config.aspectRatio.ratioH, 9.0F);
    EXPECT_EQ(config.aspectRatio.anchor, Anchor::NW);
    EXPECT_EQ(config.scrollFrame.verticalPolicy, ScrollbarPolicy::Always);
    EXPECT_EQ(config.scrollFrame.horizontalPolicy, ScrollbarPolicy::Auto);
    EXPECT_FALSE(config.scrollFrame.maxWidth.has_value());
    ASSERT_TRUE(config.scrollFrame.maxHeight.has_value());
    EXPECT_FLOAT_EQ(*config.scrollFrame.maxHeight, 150.0F);
    EXPECT_FLOAT_EQ(config.scrollFrame.wheelStep, 20.0F);
}

TEST(FrameSerialization, ParseClampsAndRejectsInvalidRatio)
{
    FrameConfig config;
    ASSERT_TRUE(ParseFrameConfig(R"({
        "window": { "width": 10, "height": 10 },
        "aspect_ratio": { "ratio_w": 0, "ratio_h": 9 },
        "scroll_frame": { "initial_items": -4 }
    })", config));
    EXPECT_EQ(config.windowWidth, 320);
    EXPECT_EQ(config.windowHeight, 200);
    EXPECT_FLOAT_EQ(config.aspectRatio.ratioW, 2.0F);
    EXPECT_FLOAT_EQ(config.aspectRatio.ratioH, 1.0F);
    EXPECT_EQ(config.initialItems, 0);
}

TEST(FrameSerialization, ParseRejectsMalformedJson)
{
    FrameConfig config;
    config.windowWidth = 999;
    std::string error;
    EXPECT_FALSE(ParseFrameConfig("{ \"window\": ", config, &error));
    EXPECT_FALSE(error.empty());
    EXPECT_EQ(config.windowWidth, 999);

    EXPECT_FALSE(ParseFrameConfig("[1, 2]", config, &error));
}

TEST(FrameSerialization, SerializedConfigParsesBack)
{
    FrameConfig config;
    config.title = "Frames";
    config.aspectRatio.anchor = Anchor::SW;
    config.scrollFrame.maxWidth.reset();
    config.scrollFrame.horizontalPolicy = ScrollbarPolicy::Never;
    config.initialItems = 7;

    FrameConfig parsed;
    ASSERT_TRUE(ParseFrameConfig(SerializeFrameConfig(config), parsed));
    EXPECT_EQ(parsed.title, "Frames");
    EXPECT_EQ(parsed.aspectRatio.anchor, Anchor::SW);
    EXPECT_FALSE(parsed.scrollFrame.maxWidth.has_value());
    EXPECT_EQ(parsed.scrollFrame.horizontalPolicy, ScrollbarPolicy::Never);
    EXPECT_EQ(parsed.initialItems, 7);
}

TEST(FrameSerialization, LoadWritesDefaultsWhenMissing)
{
    const std::filesystem::path path = TempConfigPath("missing.json");
    std::filesystem::remove(path);

    FrameConfig config;
    config.windowWidth = 1;
    ASSERT_TRUE(LoadFrameConfig(path.string(), config));
    EXPECT_EQ(config.windowWidth, FrameConfig{}.windowWidth);
    EXPECT_TRUE(std::filesystem::exists(path));
}

TEST(FrameSerialization, LoadReplacesMalformedFile)
{
    const std::filesystem::path path = TempConfigPath("broken.json");
    std::filesystem::create_directories(path.parent_path());
    {
        std::ofstream file(path);
        file << "{ not json";
    }

    FrameConfig config;
    std::string error;
    EXPECT_FALSE(LoadFrameConfig(path.string(), config, &error));
    EXPECT_FALSE(error.empty());
    EXPECT_EQ(config.initialItems, FrameConfig{}.initialItems);

    std::string error2;
    EXPECT_TRUE(LoadFrameConfig(path.string(), config, &error2)) << error2;
}

TEST(FrameSerialization, LayoutDumpListsComputedRects)
{
    UiTree tree;
    tree.SetScreenSize(200, 100);
    UINode* panel = tree.GetRoot()->AddChild(UINode::CreatePanel("panel", glm::vec4{1.0F}));
    panel->layout.height = SizeValue::Px(40.0F);
    tree.ComputeLayout();

    const nlohmann::json dump = nlohmann::json::parse(SerializeLayout(*tree.GetRoot()));
    EXPECT_EQ(dump["id"], "root");
    ASSERT_EQ(dump["children"].size(), 1U);
    EXPECT_EQ(dump["children"][0]["type"], "Panel");
    EXPECT_FLOAT_EQ(dump["children"][0]["rect"][2].get<float>(), 200.0F);
    EXPECT_FLOAT_EQ(dump["children"][0]["rect"][3].get<float>(), 40.0F);
}

TEST(FrameSerialization, FrameModesRoundTrip)
{
    FrameConfig config;
    std::string error;
    ASSERT_TRUE(ParseFrameConfig(R"({
        "aspect_ratio": { "keep_ratio": false },
        "scroll_frame": { "scroll": false }
    })", config, &error)) << error;
    EXPECT_FALSE(config.aspectRatio.keepRatio);
    EXPECT_FALSE(config.scrollFrame.scroll);

    FrameConfig reparsed;
    ASSERT_TRUE(ParseFrameConfig(SerializeFrameConfig(config), reparsed, &error)) << error;
    EXPECT_FALSE(reparsed.aspectRatio.keepRatio);
    EXPECT_FALSE(reparsed.scrollFrame.scroll);

    EXPECT_TRUE(FrameConfig{}.aspectRatio.keepRatio);
    EXPECT_TRUE(FrameConfig{}.scrollFrame.scroll);
}
