#ifdef PULSEPLOT_USE_GLFW

    #include "glfw_adapter.hpp"

    #define GLFW_INCLUDE_NONE
    #define GLFW_INCLUDE_VULKAN
    #include <GLFW/glfw3.h>
    #include <imgui_impl_glfw.h>
    #include <pulseplot/logger.hpp>

namespace pulseplot::ui
{

static void glfw_error_callback(int code, const char* description)
{
    PULSEPLOT_LOG_ERROR("display", "GLFW error {}: {}", code, description);
}

GlfwAdapter::~GlfwAdapter()
{
    shutdown();
}

bool GlfwAdapter::init(uint32_t width, uint32_t height, const std::string& title)
{
    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit())
    {
        PULSEPLOT_LOG_ERROR("display", "Failed to initialize GLFW");
        return false;
    }
    initialized_ = true;

    if (!glfwVulkanSupported())
    {
        PULSEPLOT_LOG_ERROR("display", "GLFW: Vulkan not supported");
        shutdown();
        return false;
    }

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);

    window_ = glfwCreateWindow(
        static_cast<int>(width), static_cast<int>(height), title.c_str(), nullptr, nullptr);
    if (!window_)
    {
        PULSEPLOT_LOG_ERROR("display", "Failed to create GLFW window");
        shutdown();
        return false;
    }

    glfwSetWindowUserPointer(window_, this);
    glfwSetFramebufferSizeCallback(window_, framebuffer_size_callback);
    glfwSetKeyCallback(window_, key_callback);
    return true;
}

void GlfwAdapter::shutdown()
{
    if (window_)
    {
        glfwDestroyWindow(window_);
        window_ = nullptr;
    }
    if (initialized_)
    {
        glfwTerminate();
        initialized_ = false;
    }
}

void GlfwAdapter::poll_events()
{
    glfwPollEvents();
}

bool GlfwAdapter::should_close() const
{
    return window_ ? glfwWindowShouldClose(window_) : true;
}

void GlfwAdapter::set_title(const std::string& title)
{
    if (window_)
        glfwSetWindowTitle(window_, title.c_str());
}

void GlfwAdapter::framebuffer_size(uint32_t& width, uint32_t& height) const
{
    int w = 0, h = 0;
    if (window_)
        glfwGetFramebufferSize(window_, &w, &h);
    width  = static_cast<uint32_t>(w);
    height = static_cast<uint32_t>(h);
}

bool GlfwAdapter::take_resized()
{
    bool r   = resized_;
    resized_ = false;
    return r;
}

// ─── Static callback trampolines ────────────────────────────────────────────

void GlfwAdapter::framebuffer_size_callback(GLFWwindow* window, int /*width*/, int /*height*/)
{
    auto* adapter = static_cast<GlfwAdapter*>(glfwGetWindowUserPointer(window));
    if (adapter)
        adapter->resized_ = true;
}

void GlfwAdapter::key_callback(GLFWwindow* window, int key, int scancode, int action, int mods)
{
    // Our callbacks replace ImGui's, so forward explicitly
    ImGui_ImplGlfw_KeyCallback(window, key, scancode, action, mods);

    auto* adapter = static_cast<GlfwAdapter*>(glfwGetWindowUserPointer(window));
    if (adapter && adapter->on_key_)
        adapter->on_key_(key, action, mods);
}

}   // namespace pulseplot::ui

#endif   // PULSEPLOT_USE_GLFW
