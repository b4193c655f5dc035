#include "demo/DemoOptions.hpp"

#include <algorithm>
#include <cstdlib>

namespace framekit::demo
{
namespace
{
bool ParseFrameCount(const std::string& text, int& outValue)
{
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return c >= '0' && c <= '9'; }))
    {
        return false;
    }
    if (text.size() > 9)
    {
        return false;
    }
    outValue = std::atoi(text.c_str());
    return true;
}

void SetError(std::string* outError, const std::string& message)
{
    if (outError != nullptr)
    {
        *outError = message;
    }
}
} // namespace

std::optional<DemoKind> DemoKindFromText(const std::string& text)
{
    if (text == "NestedFrame")
        return DemoKind::NestedFrame;
    if (text == "ScrollFrame")
        return DemoKind::ScrollFrame;
    if (text == "AspectRatioFrame")
        return DemoKind::AspectRatioFrame;
    return std::nullopt;
}

std::string DemoKindToText(DemoKind kind)
{
    switch (kind)
    {
        case DemoKind::ScrollFrame:
            return "ScrollFrame";
        case DemoKind::AspectRatioFrame:
            return "AspectRatioFrame";
        case DemoKind::NestedFrame:
        default:
            return "NestedFrame";
    }
}

bool ParseDemoArgs(int argc, const char* const* argv, DemoOptions& outOptions, std::string* outError)
{
    DemoOptions options;
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i] != nullptr ? argv[i] : "";
        if (arg == "-h" || arg == "--help")
        {
            options.showHelp = true;
            continue;
        }

        const bool takesValue = arg == "-t" || arg == "--test" || arg == "-c" || arg == "--config" || arg == "--frames";
        if (!takesValue)
        {
            SetError(outError, "Unknown argument: " + arg);
            return false;
        }
        if (i + 1 >= argc || argv[i + 1] == nullptr)
        {
            SetError(outError, "Missing value for " + arg);
            return false;
        }
        const std::string value = argv[++i];

        if (arg == "-t" || arg == "--test")
        {
            const std::optional<DemoKind> kind = DemoKindFromText(value);
            if (!kind.has_value())
            {
                SetError(outError, "Unknown test '" + value + "' (choose from NestedFrame, ScrollFrame, AspectRatioFrame)");
                return false;
            }
            if (std::find(options.demos.begin(), options.demos.end(), *kind) == options.demos.end())
            {
                options.demos.push_back(*kind);
            }
        }
        else if (arg == "-c" || arg == "--config")
        {
            options.configPath = value;
        }
        else if (!ParseFrameCount(value, options.maxFrames))
        {
            SetError(outError, "Invalid frame count: " + value);
            return false;
        }
    }

    if (!options.showHelp && options.demos.empty())
    {
        SetError(outError, "At least one -t/--test is required");
        return false;
    }

    std::sort(options.demos.begin(), options.demos.end());
    outOptions = std::move(options);
    return true;
}

std::string DemoUsage(const std::string& program)
{
    return "usage: " + program + " -t {NestedFrame,ScrollFrame,AspectRatioFrame} [-t ...] [-c CONFIG] [--frames N]\n"
        "  -t, --test     demo to show; repeat to show several side by side\n"
        "  -c, --config   config file (default config/frames_demo.json)\n"
        "      --frames   exit after N frames (0 = run until closed)\n"
        "  -h, --help     show this help\n";
}
} // namespace framekit::demo
