#include "framekit/platform/Window.hpp"

#include <iostream>

#include <GLFW/glfw3.h>

namespace framekit::platform
{
Window::~Window()
{
    Shutdown();
}

bool Window::Initialize(const WindowSettings& settings)
{
    if (glfwInit() != GLFW_TRUE)
    {
        std::cerr << "[Window] Failed to initialize GLFW.\n";
        return false;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 4);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 5);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
#if defined(__APPLE__)
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
#endif

    m_windowWidth = settings.width;
    m_windowHeight = settings.height;
    m_window = glfwCreateWindow(m_windowWidth, m_windowHeight, settings.title.c_str(), nullptr, nullptr);

    if (m_window == nullptr)
    {
        std::cerr << "[Window] Failed to create GLFW window.\n";
        glfwTerminate();
        return false;
    }

    glfwMakeContextCurrent(m_window);
    glfwSetWindowUserPointer(m_window, this);
    glfwSetFramebufferSizeCallback(m_window, FramebufferResizeCallback);
    glfwSetWindowSizeCallback(m_window, WindowResizeCallback);
    glfwSetScrollCallback(m_window, ScrollCallback);
    glfwGetFramebufferSize(m_window, &m_fbWidth, &m_fbHeight);
    glfwGetWindowSize(m_window, &m_windowWidth, &m_windowHeight);

    SetVSync(settings.vsync);
    return true;
}

void Window::Shutdown()
{
    if (m_window != nullptr)
    {
        glfwDestroyWindow(m_window);
        m_window = nullptr;
        glfwTerminate();
    }
}

void Window::PollEvents() const
{
    glfwPollEvents();
}

void Window::SwapBuffers() const
{
    if (m_window != nullptr)
    {
        glfwSwapBuffers(m_window);
    }
}

bool Window::ShouldClose() const
{
    return m_window == nullptr || glfwWindowShouldClose(m_window) == GLFW_TRUE;
}

void Window::SetShouldClose(bool shouldClose) const
{
    if (m_window != nullptr)
    {
        glfwSetWindowShouldClose(m_window, shouldClose ? GLFW_TRUE : GLFW_FALSE);
    }
}

void Window::SetVSync(bool enabled) const
{
    glfwSwapInterval(enabled ? 1 : 0);
}

void Window::SetResizeCallback(std::function<void(int, int)> callback)
{
    m_resizeCallback = std::move(callback);
}

void Window::SetScrollCallback(std::function<void(double, double)> callback)
{
    m_scrollCallback = std::move(callback);
}

void Window::FramebufferResizeCallback(GLFWwindow* window, int width, int height)
{
    Window* self = static_cast<Window*>(glfwGetWindowUserPointer(window));
    if (self == nullptr)
    {
        return;
    }

    self->m_fbWidth = width;
    self->m_fbHeight = height;
}

void Window::WindowResizeCallback(GLFWwindow* window, int width, int height)
{
    Window* self = static_cast<Window*>(glfwGetWindowUserPointer(window));
    if (self == nullptr)
    {
        return;
    }

    self->m_windowWidth = width;
    self->m_windowHeight = height;
    if (self->m_resizeCallback)
    {
        self->m_resizeCallback(width, height);
    }
}

void Window::ScrollCallback(GLFWwindow* window, double offsetX, double offsetY)
{
    Window* self = static_cast<Window*>(glfwGetWindowUserPointer(window));
    if (self == nullptr || !self->m_scrollCallback)
    {
        return;
    }
    self->m_scrollCallback(offsetX, offsetY);
}
} // namespace framekit::platform
