#include "framekit/ui/FrameSerialization.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

namespace framekit::ui
{
namespace
{
using json = nlohmann::json;

constexpr int kMinWindowWidth = 320;
constexpr int kMinWindowHeight = 200;
constexpr int kMaxInitialItems = 10000;
constexpr float kMaxWheelStep = 500.0F;

std::string ToLower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

std::string VisibilityToString(Visibility visibility)
{
    switch (visibility)
    {
        case Visibility::Hidden:
            return "hidden";
        case Visibility::Collapsed:
            return "collapsed";
        case Visibility::Visible:
        default:
            return "visible";
    }
}

void ParseMaximum(const json& section, const char* key, std::optional<float>& out)
{
    if (!section.contains(key))
    {
        return;
    }
    const json& value = section[key];
    if (value.is_null())
    {
        out.reset();
    }
    else if (value.is_number())
    {
        const float maximum = value.get<float>();
        if (maximum > 0.0F)
        {
            out = maximum;
        }
        else
        {
            out.reset();
        }
    }
}

void ParseWindow(const json& section, FrameConfig& config)
{
    if (section.contains("width") && section["width"].is_number_integer())
    {
        config.windowWidth = section["width"].get<int>();
    }
    if (section.contains("height") && section["height"].is_number_integer())
    {
        config.windowHeight = section["height"].get<int>();
    }
    if (section.contains("vsync") && section["vsync"].is_boolean())
    {
        config.vsync = section["vsync"].get<bool>();
    }
    if (section.contains("title") && section["title"].is_string())
    {
        config.title = section["title"].get<std::string>();
    }
}

void ParseAspectRatio(const json& section, FrameConfig& config)
{
    float ratioW = config.aspectRatio.ratioW;
    float ratioH = config.aspectRatio.ratioH;
    if (section.contains("ratio_w") && section["ratio_w"].is_number())
    {
        ratioW = section["ratio_w"].get<float>();
    }
    if (section.contains("ratio_h") && section["ratio_h"].is_number())
    {
        ratioH = section["ratio_h"].get<float>();
    }
    if (IsValidRatio(ratioW, ratioH))
    {
        config.aspectRatio.ratioW = ratioW;
        config.aspectRatio.ratioH = ratioH;
    }
    if (section.contains("anchor") && section["anchor"].is_string())
    {
        config.aspectRatio.anchor = AnchorFromText(section["anchor"].get<std::string>(), config.aspectRatio.anchor);
    }
    if (section.contains("keep_ratio") && section["keep_ratio"].is_boolean())
    {
        config.aspectRatio.keepRatio = section["keep_ratio"].get<bool>();
    }
}

void ParseScrollFrame(const json& section, FrameConfig& config)
{
    ScrollFrameSettings& scroll = config.scrollFrame;
    if (section.contains("scroll") && section["scroll"].is_boolean())
    {
        scroll.scroll = section["scroll"].get<bool>();
    }
    ParseMaximum(section, "max_width", scroll.maxWidth);
    ParseMaximum(section, "max_height", scroll.maxHeight);
    if (section.contains("horizontal_policy") && section["horizontal_policy"].is_string())
    {
        scroll.horizontalPolicy = ScrollbarPolicyFromText(section["horizontal_policy"].get<std::string>(), scroll.horizontalPolicy);
    }
    if (section.contains("vertical_policy") && section["vertical_policy"].is_string())
    {
        scroll.verticalPolicy = ScrollbarPolicyFromText(section["vertical_policy"].get<std::string>(), scroll.verticalPolicy);
    }
    if (section.contains("wheel_step") && section["wheel_step"].is_number())
    {
        scroll.wheelStep = section["wheel_step"].get<float>();
    }
    if (section.contains("initial_items") && section["initial_items"].is_number_integer())
    {
        config.initialItems = section["initial_items"].get<int>();
    }
}

void ClampConfig(FrameConfig& config)
{
    config.windowWidth = std::max(kMinWindowWidth, config.windowWidth);
    config.windowHeight = std::max(kMinWindowHeight, config.windowHeight);
    config.initialItems = std::clamp(config.initialItems, 0, kMaxInitialItems);
    if (!(config.scrollFrame.wheelStep > 0.0F))
    {
        config.scrollFrame.wheelStep = ScrollFrameSettings{}.wheelStep;
    }
    config.scrollFrame.wheelStep = std::min(config.scrollFrame.wheelStep, kMaxWheelStep);
}

void SerializeNode(json& j, const UINode& node)
{
    j["id"] = node.id;
    j["type"] = NodeTypeToString(node.type);
    j["visibility"] = VisibilityToString(node.visibility);
    j["rect"] = {node.computedRect.x, node.computedRect.y, node.computedRect.w, node.computedRect.h};
    if (node.type == UINodeType::ScrollView)
    {
        j["scroll"] = {node.state.scrollX, node.state.scrollY};
    }
    if (node.type == UINodeType::Scrollbar)
    {
        j["thumb"] = {node.state.value01, node.state.thumbExtent};
        j["disabled"] = node.state.disabled;
    }

    if (!node.children.empty())
    {
        json childrenJson = json::array();
        for (const auto& child : node.children)
        {
            if (child)
            {
                json childJson;
                SerializeNode(childJson, *child);
                childrenJson.push_back(std::move(childJson));
            }
        }
        j["children"] = std::move(childrenJson);
    }
}
} // namespace

std::string NodeTypeToString(UINodeType type)
{
    switch (type)
    {
        case UINodeType::Panel:
            return "Panel";
        case UINodeType::Text:
            return "Text";
        case UINodeType::Button:
            return "Button";
        case UINodeType::ScrollView:
            return "ScrollView";
        case UINodeType::Scrollbar:
            return "Scrollbar";
        case UINodeType::Spacer:
            return "Spacer";
        case UINodeType::Container:
        default:
            return "Container";
    }
}

Anchor AnchorFromText(const std::string& text, Anchor fallback)
{
    const std::string value = ToLower(text);
    if (value == "n")
        return Anchor::N;
    if (value == "ne")
        return Anchor::NE;
    if (value == "e")
        return Anchor::E;
    if (value == "se")
        return Anchor::SE;
    if (value == "s")
        return Anchor::S;
    if (value == "sw")
        return Anchor::SW;
    if (value == "w")
        return Anchor::W;
    if (value == "nw")
        return Anchor::NW;
    if (value == "center")
        return Anchor::Center;
    return fallback;
}

std::string AnchorToText(Anchor anchor)
{
    switch (anchor)
    {
        case Anchor::N:
            return "n";
        case Anchor::NE:
            return "ne";
        case Anchor::E:
            return "e";
        case Anchor::SE:
            return "se";
        case Anchor::S:
            return "s";
        case Anchor::SW:
            return "sw";
        case Anchor::W:
            return "w";
        case Anchor::NW:
            return "nw";
        case Anchor::Center:
        default:
            return "center";
    }
}

ScrollbarPolicy ScrollbarPolicyFromText(const std::string& text, ScrollbarPolicy fallback)
{
    const std::string value = ToLower(text);
    if (value == "always")
        return ScrollbarPolicy::Always;
    if (value == "auto")
        return ScrollbarPolicy::Auto;
    if (value == "never")
        return ScrollbarPolicy::Never;
    return fallback;
}

std::string ScrollbarPolicyToText(ScrollbarPolicy policy)
{
    switch (policy)
    {
        case ScrollbarPolicy::Always:
            return "always";
        case ScrollbarPolicy::Never:
            return "never";
        case ScrollbarPolicy::Auto:
        default:
            return "auto";
    }
}

bool ParseFrameConfig(const std::string& jsonContent, FrameConfig& outConfig, std::string* outError)
{
    json root;
    try
    {
        root = json::parse(jsonContent);
    }
    catch (const json::parse_error& e)
    {
        if (outError != nullptr)
        {
            *outError = std::string("Invalid frame config JSON: ") + e.what();
        }
        return false;
    }

    if (!root.is_object())
    {
        if (outError != nullptr)
        {
            *outError = "Frame config root must be a JSON object";
        }
        return false;
    }

    FrameConfig config;
    if (root.contains("window") && root["window"].is_object())
    {
        ParseWindow(root["window"], config);
    }
    if (root.contains("aspect_ratio") && root["aspect_ratio"].is_object())
    {
        ParseAspectRatio(root["aspect_ratio"], config);
    }
    if (root.contains("scroll_frame") && root["scroll_frame"].is_object())
    {
        ParseScrollFrame(root["scroll_frame"], config);
    }
    ClampConfig(config);

    outConfig = std::move(config);
    return true;
}

bool LoadFrameConfig(const std::string& filePath, FrameConfig& outConfig, std::string* outError)
{
    outConfig = FrameConfig{};

    const std::filesystem::path path(filePath);
    if (!std::filesystem::exists(path))
    {
        return SaveFrameConfig(filePath, outConfig, outError);
    }

    std::ifstream file(path);
    if (!file.is_open())
    {
        if (outError != nullptr)
        {
            *outError = "Failed to open frame config: " + filePath;
        }
        return false;
    }

    const std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    file.close();

    std::string parseError;
    if (!ParseFrameConfig(content, outConfig, &parseError))
    {
        if (outError != nullptr)
        {
            *outError = parseError + ". Using defaults.";
        }
        outConfig = FrameConfig{};
        (void)SaveFrameConfig(filePath, outConfig, nullptr);
        return false;
    }
    return true;
}

std::string SerializeFrameConfig(const FrameConfig& config)
{
    json root;
    root["window"] = {
        {"width", config.windowWidth},
        {"height", config.windowHeight},
        {"vsync", config.vsync},
        {"title", config.title},
    };
    root["aspect_ratio"] = {
        {"ratio_w", config.aspectRatio.ratioW},
        {"ratio_h", config.aspectRatio.ratioH},
        {"anchor", AnchorToText(config.aspectRatio.anchor)},
        {"keep_ratio", config.aspectRatio.keepRatio},
    };

    const ScrollFrameSettings& scroll = config.scrollFrame;
    json scrollJson;
    scrollJson["scroll"] = scroll.scroll;
    scrollJson["max_width"] = scroll.maxWidth.has_value() ? json(*scroll.maxWidth) : json(nullptr);
    scrollJson["max_height"] = scroll.maxHeight.has_value() ? json(*scroll.maxHeight) : json(nullptr);
    scrollJson["horizontal_policy"] = ScrollbarPolicyToText(scroll.horizontalPolicy);
    scrollJson["vertical_policy"] = ScrollbarPolicyToText(scroll.verticalPolicy);
    scrollJson["wheel_step"] = scroll.wheelStep;
    scrollJson["initial_items"] = config.initialItems;
    root["scroll_frame"] = std::move(scrollJson);
    return root.dump(2);
}

bool SaveFrameConfig(const std::string& filePath, const FrameConfig& config, std::string* outError)
{
    const std::filesystem::path path(filePath);
    if (path.has_parent_path())
    {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    std::ofstream file(path);
    if (!file.is_open())
    {
        if (outError != nullptr)
        {
            *outError = "Failed to write frame config: " + filePath;
        }
        return false;
    }
    file << SerializeFrameConfig(config) << "\n";
    return true;
}

std::string SerializeLayout(const UINode& root)
{
    json rootJson;
    SerializeNode(rootJson, root);
    return rootJson.dump(2);
}
} // namespace framekit::ui
