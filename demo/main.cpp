#include <iostream>
#include <string>

#include "demo/DemoOptions.hpp"
#include "demo/FrameDemos.hpp"
#include "framekit/core/App.hpp"

int main(int argc, char** argv)
{
    using namespace framekit;

    const std::string program = argc > 0 && argv[0] != nullptr ? argv[0] : "framekit_demo";

    demo::DemoOptions options;
    std::string error;
    if (!demo::ParseDemoArgs(argc, argv, options, &error))
    {
        std::cerr << error << "\n" << demo::DemoUsage(program);
        return 2;
    }
    if (options.showHelp)
    {
        std::cout << demo::DemoUsage(program);
        return 0;
    }

    core::AppOptions appOptions;
    appOptions.configPath = options.configPath;
    appOptions.maxFrames = options.maxFrames;

    // Frames hold references into the app's tree and must go first.
    core::App app;
    demo::FrameDemos demos;
    const bool ok = app.Run(appOptions, [&](ui::UiTree& tree, core::EventBus& eventBus, const ui::FrameConfig& config, std::string* outError) {
        if (!demos.Build(tree, options.demos, config, outError))
        {
            return false;
        }
        demos.Subscribe(eventBus);
        return true;
    });
    return ok ? 0 : 1;
}
