#pragma once

#ifdef PULSEPLOT_USE_GLFW

    #include <memory>
    #include <pulseplot/color.hpp>
    #include <pulseplot/display.hpp>
    #include <string>

namespace pulseplot::vk
{
class VkContext;
}

namespace pulseplot::ui
{

class GlfwAdapter;

struct PlotWindowConfig
{
    std::string title   = "Real-time Plot";
    std::string x_label = "Time (seconds)";
    std::string y_label = "Value";
    Color       line_color{colors::blue};
    float       line_width = 2.0f;
    uint32_t    width      = 1000;
    uint32_t    height     = 600;
};

// Interactive line plot: GLFW window, Vulkan swapchain, ImGui draw lists.
// Closes on window close, 'q' or Escape.
class PlotWindow : public DisplaySurface
{
   public:
    explicit PlotWindow(PlotWindowConfig config);
    ~PlotWindow() override;

    PlotWindow(const PlotWindow&)            = delete;
    PlotWindow& operator=(const PlotWindow&) = delete;

    // Creates the window and GPU resources.  Returns false if either fails.
    bool init();

    bool present(const ViewUpdate& update) override;
    bool should_close() const override;
    void close() override;

   private:
    struct Impl;

    PlotWindowConfig             config_;
    std::unique_ptr<GlfwAdapter> glfw_;
    std::unique_ptr<vk::VkContext> vk_;
    std::unique_ptr<Impl>        impl_;
    bool                         quit_requested_ = false;
    bool                         closed_         = false;
    std::string                  last_title_;

    void draw_plot(const ViewUpdate& update);
    bool render_frame();
    void rebuild_swapchain();
};

}   // namespace pulseplot::ui

#endif   // PULSEPLOT_USE_GLFW
