#pragma once

#include <optional>
#include <string>
#include <vector>

namespace framekit::demo
{
enum class DemoKind
{
    NestedFrame,
    ScrollFrame,
    AspectRatioFrame
};

std::optional<DemoKind> DemoKindFromText(const std::string& text);
std::string DemoKindToText(DemoKind kind);

struct DemoOptions
{
    // Unique, in NestedFrame, ScrollFrame, AspectRatioFrame order
    std::vector<DemoKind> demos;
    std::string configPath = "config/frames_demo.json";
    int maxFrames = 0;
    bool showHelp = false;
};

// Returns false with a message for unknown flags or names, missing values and a missing -t.
bool ParseDemoArgs(int argc, const char* const* argv, DemoOptions& outOptions, std::string* outError = nullptr);
std::string DemoUsage(const std::string& program);
} // namespace framekit::demo
