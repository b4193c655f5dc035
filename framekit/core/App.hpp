#pragma once

#include <functional>
#include <string>

#include "framekit/core/EventBus.hpp"
#include "framekit/platform/Input.hpp"
#include "framekit/platform/Window.hpp"
#include "framekit/ui/FrameSerialization.hpp"
#include "framekit/ui/TreeRenderer.hpp"
#include "framekit/ui/UiTree.hpp"

namespace framekit::core
{
struct AppOptions
{
    std::string configPath = "config/frames_demo.json";
    // Stop after this many frames; 0 runs until the window is closed
    int maxFrames = 0;
};

class App
{
public:
    // Fills the tree once the window exists. Returning false aborts Run.
    using SceneBuilder = std::function<bool(ui::UiTree&, EventBus&, const ui::FrameConfig&, std::string*)>;

    App() = default;
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    // Returns false if initialization or the scene builder failed.
    bool Run(const AppOptions& options, const SceneBuilder& buildScene);

    [[nodiscard]] ui::UiTree& Tree() { return m_tree; }
    [[nodiscard]] EventBus& Events() { return m_eventBus; }
    [[nodiscard]] const ui::FrameConfig& Config() const { return m_config; }

private:
    static constexpr float kKeyScrollStep = 40.0F;

    bool Initialize(const AppOptions& options);
    void Shutdown();
    [[nodiscard]] bool LoadDemoConfig(const std::string    bool LoadDemoConfig(const std::string& path); path);
    void SubscribeDefaultHandlers();
    void PublishInputEvents();
    void RenderFrame();

    platform::Window m_window;
    platform::Input m_input;
    ui::TreeRenderer m_renderer;
    ui::UiTree m_tree;
    EventBus m_eventBus;
    ui::FrameConfig m_config;
};
} // namespace framekit::core
