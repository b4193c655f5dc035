#pragma once

#include <string>

#include "framekit/ui/AspectRatioFrame.hpp"
#include "framekit/ui/ScrollFrame.hpp"
#include "framekit/ui/UiNode.hpp"

namespace framekit::ui
{
// Settings read from the demo config file
// Format:
// {
//   "window": { "width": 1280, "height": 720, "vsync": true, "title": "..." },
//   "aspect_ratio": { "ratio_w": 2, "ratio_h": 1, "anchor": "center", "keep_ratio": true },
//   "scroll_frame": {
//     "scroll": true, "max_width": 500, "max_height": 150,
//     "horizontal_policy": "auto", "vertical_policy": "auto",
//     "wheel_step": 20, "initial_items": 20
//   }
// }
struct FrameConfig
{
    int windowWidth = 1280;
    int windowHeight = 720;
    bool vsync = true;
    std::string title = "FrameKit";

    AspectRatioSettings aspectRatio{2.0F, 1.0F, Anchor::Center, true};
    ScrollFrameSettings scrollFrame = DefaultScrollSettings();
    int initialItems = 20;

    static ScrollFrameSettings DefaultScrollSettings()
    {
        ScrollFrameSettings settings;
        settings.maxWidth = 500.0F;
        settings.maxHeight = 150.0F;
        return settings;
    }
};

std::string NodeTypeToString(UINodeType type);

// Unknown text maps to the fallback.
Anchor AnchorFromText(const std::string& text, Anchor fallback = Anchor::Center);
std::string AnchorToText(Anchor anchor);
ScrollbarPolicy ScrollbarPolicyFromText(const std::string& text, ScrollbarPolicy fallback = ScrollbarPolicy::Auto);
std::string ScrollbarPolicyToText(ScrollbarPolicy policy);

// Missing keys and keys of the wrong type keep their defaults; out-of-range values are clamped.
// Returns false only if the content is not a JSON object.
bool ParseFrameConfig(const std::string& jsonContent, FrameConfig& outConfig, std::string* outError = nullptr);

// A missing file is created with defaults. A malformed file is reported, replaced with
// defaults and false is returned; outConfig then holds the defaults.
bool LoadFrameConfig(const std::string& filePath, FrameConfig& outConfig, std::string* outError = nullptr);
bool SaveFrameConfig(const std::string& filePath, const FrameConfig& config, std::string* outError = nullptr);
std::string SerializeFrameConfig(const FrameConfig& config);

// JSON dump of ids, types, visibility and computed rects of a laid-out subtree
std::string SerializeLayout(const UINode& root);
} // namespace framekit::ui
