#include "framekit/core/App.hpp"

#include <iostream>

#include <glad/glad.h>
#include <GLFW/glfw3.h>

namespace framekit::core
{
App::~App()
{
    Shutdown();
}

bool App::Run(const AppOptions& options, const SceneBuilder& buildScene)
{
    std::cout << "[App] FrameKit demo\n";

    if (!Initialize(options))
    {
        Shutdown();
        return false;
    }

    std::string error;
    if (buildScene && !buildScene(m_tree, m_eventBus, m_config, &error))
    {
        std::cerr << "[App] Failed to build scene: " << error << "\n";
        Shutdown();
        return false;
    }
    m_tree.RebuildNodeIndex();

    int frameCount = 0;
    while (!m_window.ShouldClose())
    {
        m_window.PollEvents();
        m_input.Update(m_window.NativeHandle());

        if (m_input.IsKeyPressed(GLFW_KEY_ESCAPE))
        {
            m_window.SetShouldClose(true);
        }

        PublishInputEvents();
        m_eventBus.DispatchQueued();

        const glm::vec2 mouse = m_input.MousePosition();
        if (m_tree.NeedsLayout())
        {
            m_tree.ComputeLayout();
        }
        m_tree.UpdateHover(mouse.x, mouse.y);

        RenderFrame();
        m_window.SwapBuffers();

        ++frameCount;
        if (options.maxFrames > 0 && frameCount >= options.maxFrames)
        {
            break;
        }
    }

    std::cout << "[App] Exiting after " << frameCount << " frames\n";
    Shutdown();
    return true;
}

bool App::Initialize(const AppOptions& options)
{
    if (!LoadDemoConfig(options.configPath))
    {
        std::cout << "[App] Continuing with default frame settings.\n";
    }

    platform::WindowSettings windowSettings;
    windowSettings.width = m_config.windowWidth;
    windowSettings.height = m_config.windowHeight;
    windowSettings.vsync = m_config.vsync;
    windowSettings.title = m_config.title;

    if (!m_window.Initialize(windowSettings))
    {
        return false;
    }

    if (!gladLoadGL(reinterpret_cast<GLADloadfunc>(glfwGetProcAddress)))
    {
        std::cerr << "[App] Failed to initialize GLAD.\n";
        return false;
    }

    const unsigned char* glVersion = glGetString(GL_VERSION);
    std::cout << "[App] OpenGL version: " << (glVersion != nullptr ? reinterpret_cast<const char*>(glVersion) : "unknown") << "\n";

    // Callbacks are installed before ImGui so its GLFW backend chains them.
    m_window.SetResizeCallback([this](int width, int height) {
        Event event;
        event.type = EventType::Resize;
        event.value = glm::vec2{static_cast<float>(width), static_cast<float>(height)};
        m_eventBus.Publish(std::move(event));
    });
    m_window.SetScrollCallback([this](double offsetX, double offsetY) {
        m_input.AddWheel(static_cast<float>(offsetX), static_cast<float>(offsetY));
    });

    if (!m_renderer.Initialize(m_window))
    {
        std::cerr << "[App] Failed to initialize Dear ImGui.\n";
        return false;
    }

    SubscribeDefaultHandlers();
    m_tree.SetScreenSize(m_window.WindowWidth(), m_window.WindowHeight());
    return true;
}

void App::Shutdown()
{
    m_renderer.Shutdown();
    m_window.Shutdown();
}

bool App::LoadDemoConfig(const std::string& path)
{
    std::string error;
    if (!LoadFrameConfig(path, m_config, &error))
    {
        std::cerr << "[FrameConfig] " << error << "\n";
        return false;
    }
    std::cout << "[FrameConfig] Loaded " << path << "\n";
    return true;
}

void App::SubscribeDefaultHandlers()
{
    m_eventBus.Subscribe(EventType::Resize, [this](const Event& event) {
        m_tree.SetScreenSize(static_cast<int>(event.value.x), static_cast<int>(event.value.y));
    });
    m_eventBus.Subscribe(EventType::Wheel, [this](const Event& event) {
        (void)m_tree.DispatchWheel(event.position.x, event.position.y, event.value.x, event.value.y);
    });
    m_eventBus.Subscribe(EventType::Click, [this](const Event& event) {
        (void)m_tree.Click(event.position.x, event.position.y);
    });
}

void App::PublishInputEvents()
{
    const glm::vec2 mouse = m_input.MousePosition();

    const glm::vec2 wheel = m_input.WheelDelta();
    if (wheel.x != 0.0F || wheel.y != 0.0F)
    {
        Event event;
        event.type = EventType::Wheel;
        event.value = wheel;
        event.position = mouse;
        m_eventBus.Publish(std::move(event));
    }

    if (m_input.IsMousePressed(GLFW_MOUSE_BUTTON_LEFT))
    {
        Event event;
        event.type = EventType::Click;
        event.position = mouse;
        m_eventBus.Publish(std::move(event));
    }

    glm::vec2 keyScroll{0.0F, 0.0F};
    if (m_input.IsKeyPressed(GLFW_KEY_UP))
        keyScroll.y -= kKeyScrollStep;
    if (m_input.IsKeyPressed(GLFW_KEY_DOWN))
        keyScroll.y += kKeyScrollStep;
    if (m_input.IsKeyPressed(GLFW_KEY_LEFT))
        keyScroll.x -= kKeyScrollStep;
    if (m_input.IsKeyPressed(GLFW_KEY_RIGHT))
        keyScroll.x += kKeyScrollStep;
    if (keyScroll.x != 0.0F || keyScroll.y != 0.0F)
    {
        Event event;
        event.type = EventType::Scroll;
        event.value = keyScroll;
        event.position = mouse;
        m_eventBus.Publish(std::move(event));
    }
}

void App::RenderFrame()
{
    glViewport(0, 0, m_window.FramebufferWidth(), m_window.FramebufferHeight());
    glClearColor(1.0F, 0.75F, 0.8F, 1.0F);
    glClear(GL_COLOR_BUFFER_BIT);

    m_renderer.BeginFrame();
    m_renderer.Draw(m_tree);
    m_renderer.EndFrame();
}
} // namespace framekit::core
