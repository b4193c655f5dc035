#pragma once

#include <functional>
#include <string>

struct GLFWwindow;

namespace framekit::platform
{
struct WindowSettings
{
    int width = 1280;
    int height = 720;
    bool vsync = true;
    std::string title = "FrameKit";
};

class Window
{
public:
    Window() = default;
    ~Window();

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    bool Initialize(const WindowSettings& settings);
    void Shutdown();

    void PollEvents() const;
    void SwapBuffers() const;

    [[nodiscard]] bool ShouldClose() const;
    void SetShouldClose(bool shouldClose) const;

    [[nodiscard]] GLFWwindow* NativeHandle() const { return m_window; }

    void SetVSync(bool enabled) const;

    [[nodiscard]] int FramebufferWidth() const { return m_fbWidth; }
    [[nodiscard]] int FramebufferHeight() const { return m_fbHeight; }
    [[nodiscard]] int WindowWidth() const { return m_windowWidth; }
    [[nodiscard]] int WindowHeight() const { return m_windowHeight; }

    // Window size in screen coordinates, the space cursor positions are reported in
    void SetResizeCallback(std::function<void(int, int)> callback);
    // Wheel offsets in notches
    void SetScrollCallback(std::function<void(double, double)> callback);

private:
    static void FramebufferResizeCallback(GLFWwindow* window, int width, int height);
    static void WindowResizeCallback(GLFWwindow* window, int width, int height);
    static void ScrollCallback(GLFWwindow* window, double offsetX, double offsetY);

    GLFWwindow* m_window = nullptr;
    std::function<void(int, int)> m_resizeCallback;
    std::function<void(double, double)> m_scrollCallback;

    int m_windowWidth = 1280;
    int m_windowHeight = 720;
    int m_fbWidth = 1280;
    int m_fbHeight = 720;
};
} // namespace framekit::platform
