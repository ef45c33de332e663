#pragma once

#ifdef PULSEPLOT_USE_GLFW

    #include <cstdint>
    #include <functional>
    #include <string>

struct GLFWwindow;

namespace pulseplot::ui
{

class GlfwAdapter
{
   public:
    using KeyCallback = std::function<void(int key, int action, int mods)>;

    GlfwAdapter() = default;
    ~GlfwAdapter();

    GlfwAdapter(const GlfwAdapter&)            = delete;
    GlfwAdapter& operator=(const GlfwAdapter&) = delete;

    // Initialize GLFW and create a Vulkan-capable window (no GL context)
    bool init(uint32_t width, uint32_t height, const std::string& title);

    // Destroy the window and terminate GLFW
    void shutdown();

    void poll_events();
    bool should_close() const;
    void set_title(const std::string& title);

    GLFWwindow* window() const { return window_; }

    void framebuffer_size(uint32_t& width, uint32_t& height) const;
    bool take_resized();

    void set_key_callback(KeyCallback cb) { on_key_ = std::move(cb); }

   private:
    GLFWwindow* window_      = nullptr;
    bool        initialized_ = false;
    bool        resized_     = false;
    KeyCallback on_key_;

    static void framebuffer_size_callback(GLFWwindow* window, int width, int height);
    static void key_callback(GLFWwindow* window, int key, int scancode, int action, int mods);
};

}   // namespace pulseplot::ui

#endif   // PULSEPLOT_USE_GLFW
