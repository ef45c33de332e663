#ifdef PULSEPLOT_USE_GLFW

    #include "plot_window.hpp"

    #include "../render/vulkan/vk_context.hpp"
    #include "glfw_adapter.hpp"
    #include "ticks.hpp"

    #define GLFW_INCLUDE_NONE
    #define GLFW_INCLUDE_VULKAN
    #include <GLFW/glfw3.h>
    #include <imgui.h>
    #include <imgui_impl_glfw.h>
    #include <imgui_impl_vulkan.h>
    #include <cstdio>
    #include <pulseplot/logger.hpp>
    #include <stdexcept>
    #include <vector>

namespace pulseplot::ui
{

namespace
{

constexpr uint32_t MIN_IMAGE_COUNT = 2;

// Pixel margins around the plot area: left, top, right, bottom
constexpr float MARGIN_LEFT   = 70.0f;
constexpr float MARGIN_TOP    = 40.0f;
constexpr float MARGIN_RIGHT  = 20.0f;
constexpr float MARGIN_BOTTOM = 50.0f;

ImU32 to_imgui(const Color& c)
{
    return ImGui::ColorConvertFloat4ToU32(ImVec4(c.r, c.g, c.b, c.a));
}

}   // anonymous namespace

struct PlotWindow::Impl
{
    ImGui_ImplVulkanH_Window window_data{};
    ImGuiContext*            imgui_context   = nullptr;
    bool                     glfw_backend_up = false;
    bool                     vk_backend_up   = false;
    bool                     swapchain_dirty = false;
};

PlotWindow::PlotWindow(PlotWindowConfig config) : config_(std::move(config)) {}

PlotWindow::~PlotWindow()
{
    close();
}

bool PlotWindow::init()
{
    glfw_ = std::make_unique<GlfwAdapter>();
    if (!glfw_->init(config_.width, config_.height, config_.title))
        return false;

    glfw_->set_key_callback(
        [this](int key, int action, int /*mods*/)
        {
            if (action == GLFW_PRESS && (key == GLFW_KEY_Q || key == GLFW_KEY_ESCAPE))
            {
                PULSEPLOT_LOG_INFO("display", "Quit key pressed");
                quit_requested_ = true;
            }
        });

    try
    {
        vk_   = std::make_unique<vk::VkContext>(glfw_->window());
        impl_ = std::make_unique<Impl>();

        auto& wd   = impl_->window_data;
        wd.Surface = vk_->surface();

        const VkFormat request_formats[] = {VK_FORMAT_B8G8R8A8_UNORM,
                                            VK_FORMAT_R8G8B8A8_UNORM,
                                            VK_FORMAT_B8G8R8_UNORM,
                                            VK_FORMAT_R8G8B8_UNORM};
        wd.SurfaceFormat = ImGui_ImplVulkanH_SelectSurfaceFormat(vk_->physical_device(),
                                                                 wd.Surface,
                                                                 request_formats,
                                                                 IM_ARRAYSIZE(request_formats),
                                                                 VK_COLORSPACE_SRGB_NONLINEAR_KHR);
        VkPresentModeKHR present_modes[] = {VK_PRESENT_MODE_FIFO_KHR};
        wd.PresentMode                   = ImGui_ImplVulkanH_SelectPresentMode(
            vk_->physical_device(), wd.Surface, present_modes, IM_ARRAYSIZE(present_modes));

        uint32_t w = 0, h = 0;
        glfw_->framebuffer_size(w, h);
        ImGui_ImplVulkanH_CreateOrResizeWindow(vk_->instance(),
                                               vk_->physical_device(),
                                               vk_->device(),
                                               &wd,
                                               vk_->queue_family(),
                                               nullptr,
                                               static_cast<int>(w),
                                               static_cast<int>(h),
                                               MIN_IMAGE_COUNT);

        IMGUI_CHECKVERSION();
        impl_->imgui_context = ImGui::CreateContext();
        ImGui::SetCurrentContext(impl_->imgui_context);
        ImGui::GetIO().IniFilename = nullptr;
        ImGui::StyleColorsLight();

        // Callbacks stay with GlfwAdapter, which forwards keys to ImGui
        ImGui_ImplGlfw_InitForVulkan(glfw_->window(), false);
        impl_->glfw_backend_up = true;

        ImGui_ImplVulkan_InitInfo ii{};
        ii.Instance       = vk_->instance();
        ii.PhysicalDevice = vk_->physical_device();
        ii.Device         = vk_->device();
        ii.QueueFamily    = vk_->queue_family();
        ii.Queue          = vk_->queue();
        ii.DescriptorPool = vk_->descriptor_pool();
        ii.MinImageCount  = MIN_IMAGE_COUNT;
        ii.ImageCount     = wd.ImageCount;
        ii.RenderPass     = wd.RenderPass;
        ii.MSAASamples    = VK_SAMPLE_COUNT_1_BIT;

        ImGui_ImplVulkan_Init(&ii);
        ImGui_ImplVulkan_CreateFontsTexture();
        impl_->vk_backend_up = true;
    }
    catch (const std::exception& e)
    {
        PULSEPLOT_LOG_ERROR("display", "Plot window initialization failed: {}", e.what());
        close();
        return false;
    }

    PULSEPLOT_LOG_INFO("display", "Plot window open: {}", config_.title);
    return true;
}

bool PlotWindow::should_close() const
{
    if (closed_ || quit_requested_)
        return true;
    return glfw_ ? glfw_->should_close() : true;
}

bool PlotWindow::present(const ViewUpdate& update)
{
    if (closed_ || !impl_)
        return false;

    glfw_->poll_events();
    if (should_close())
        return true;

    std::string title = config_.title + " - " + update.rate_label;
    if (title != last_title_)
    {
        glfw_->set_title(title);
        last_title_ = std::move(title);
    }

    if (glfw_->take_resized() || impl_->swapchain_dirty)
        rebuild_swapchain();

    uint32_t w = 0, h = 0;
    glfw_->framebuffer_size(w, h);
    if (w == 0 || h == 0)
        return true;   // minimized

    try
    {
        ImGui::SetCurrentContext(impl_->imgui_context);
        ImGui_ImplVulkan_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();
        draw_plot(update);
        ImGui::Render();
        return render_frame();
    }
    catch (const std::exception& e)
    {
        PULSEPLOT_LOG_ERROR("display", "Frame failed: {}", e.what());
        return false;
    }
}

void PlotWindow::draw_plot(const ViewUpdate& update)
{
    const ImGuiViewport* vp = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(vp->Pos);
    ImGui::SetNextWindowSize(vp->Size);
    ImGui::Begin("##plot",
                 nullptr,
                 ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove
                     | ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoBringToFrontOnFocus);

    ImDrawList* dl = ImGui::GetWindowDrawList();

    const ImVec2 p0(vp->Pos.x + MARGIN_LEFT, vp->Pos.y + MARGIN_TOP);
    const ImVec2 p1(vp->Pos.x + vp->Size.x - MARGIN_RIGHT,
                    vp->Pos.y + vp->Size.y - MARGIN_BOTTOM);
    const float  pw = p1.x - p0.x;
    const float  ph = p1.y - p0.y;

    dl->AddRectFilled(vp->Pos,
                      ImVec2(vp->Pos.x + vp->Size.x, vp->Pos.y + vp->Size.y),
                      to_imgui(colors::white));
    if (pw <= 1.0f || ph <= 1.0f)
    {
        ImGui::End();
        return;
    }

    const auto&  b      = update.bounds;
    const double xrange = b.x_max - b.x_min;
    const double yrange = b.y_max - b.y_min;
    auto         to_px  = [&](double x, double y)
    {
        float px = p0.x + static_cast<float>((x - b.x_min) / xrange) * pw;
        float py = p1.y - static_cast<float>((y - b.y_min) / yrange) * ph;
        return ImVec2(px, py);
    };

    const ImU32 grid_col = to_imgui(colors::light_gray);
    const ImU32 text_col = to_imgui(colors::dark_gray);

    // Grid and tick labels
    auto xt = generate_ticks(b.x_min, b.x_max);
    for (size_t i = 0; i < xt.positions.size(); ++i)
    {
        float px = to_px(xt.positions[i], b.y_min).x;
        dl->AddLine(ImVec2(px, p0.y), ImVec2(px, p1.y), grid_col);
        ImVec2 sz = ImGui::CalcTextSize(xt.labels[i].c_str());
        dl->AddText(ImVec2(px - sz.x * 0.5f, p1.y + 4.0f), text_col, xt.labels[i].c_str());
    }
    auto yt = generate_ticks(b.y_min, b.y_max);
    for (size_t i = 0; i < yt.positions.size(); ++i)
    {
        float py = to_px(b.x_min, yt.positions[i]).y;
        dl->AddLine(ImVec2(p0.x, py), ImVec2(p1.x, py), grid_col);
        ImVec2 sz = ImGui::CalcTextSize(yt.labels[i].c_str());
        dl->AddText(ImVec2(p0.x - sz.x - 6.0f, py - sz.y * 0.5f), text_col, yt.labels[i].c_str());
    }
    dl->AddRect(p0, p1, to_imgui(colors::gray));

    // Series, clipped to the plot area
    if (update.x.size() >= 2 && xrange > 0.0 && yrange > 0.0)
    {
        std::vector<ImVec2> points;
        points.reserve(update.x.size());
        for (size_t i = 0; i < update.x.size(); ++i)
        {
            if (update.x[i] < b.x_min)
                continue;
            points.push_back(to_px(update.x[i], update.y[i]));
        }
        dl->PushClipRect(p0, p1, true);
        if (points.size() >= 2)
            dl->AddPolyline(points.data(),
                            static_cast<int>(points.size()),
                            to_imgui(config_.line_color),
                            ImDrawFlags_None,
                            config_.line_width);
        dl->PopClipRect();
    }

    // Title, axis labels, readout
    std::string heading = config_.title + " - " + update.rate_label;
    ImVec2      hsz     = ImGui::CalcTextSize(heading.c_str());
    dl->AddText(ImVec2(p0.x + (pw - hsz.x) * 0.5f, vp->Pos.y + 12.0f),
                to_imgui(colors::black),
                heading.c_str());

    ImVec2 xsz = ImGui::CalcTextSize(config_.x_label.c_str());
    dl->AddText(ImVec2(p0.x + (pw - xsz.x) * 0.5f, p1.y + 26.0f), text_col, config_.x_label.c_str());
    dl->AddText(ImVec2(vp->Pos.x + 6.0f, p0.y - 20.0f), text_col, config_.y_label.c_str());

    std::string readout;
    if (update.latest_value)
    {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "Latest: %.2f", *update.latest_value);
        readout = buf;
    }
    if (!update.status.empty())
        readout += readout.empty() ? update.status : "   " + update.status;
    if (!readout.empty())
        dl->AddText(ImVec2(p0.x + 8.0f, p0.y + 6.0f), text_col, readout.c_str());

    ImGui::End();
}

bool PlotWindow::render_frame()
{
    ImDrawData* draw_data = ImGui::GetDrawData();
    auto&       wd        = impl_->window_data;
    VkDevice    device    = vk_->device();

    VkSemaphore image_acquired = wd.FrameSemaphores[wd.SemaphoreIndex].ImageAcquiredSemaphore;
    VkSemaphore render_done    = wd.FrameSemaphores[wd.SemaphoreIndex].RenderCompleteSemaphore;

    VkResult err = vkAcquireNextImageKHR(
        device, wd.Swapchain, UINT64_MAX, image_acquired, VK_NULL_HANDLE, &wd.FrameIndex);
    if (err == VK_ERROR_OUT_OF_DATE_KHR || err == VK_SUBOPTIMAL_KHR)
    {
        impl_->swapchain_dirty = true;
        return true;
    }
    vk::check(err, "vkAcquireNextImageKHR");

    ImGui_ImplVulkanH_Frame* fd = &wd.Frames[wd.FrameIndex];
    vk::check(vkWaitForFences(device, 1, &fd->Fence, VK_TRUE, UINT64_MAX), "vkWaitForFences");
    vk::check(vkResetFences(device, 1, &fd->Fence), "vkResetFences");
    vk::check(vkResetCommandPool(device, fd->CommandPool, 0), "vkResetCommandPool");

    VkCommandBufferBeginInfo begin{};
    begin.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    begin.flags |= VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    vk::check(vkBeginCommandBuffer(fd->CommandBuffer, &begin), "vkBeginCommandBuffer");

    wd.ClearValue.color = {{1.0f, 1.0f, 1.0f, 1.0f}};

    VkRenderPassBeginInfo rp{};
    rp.sType                    = VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO;
    rp.renderPass               = wd.RenderPass;
    rp.framebuffer              = fd->Framebuffer;
    rp.renderArea.extent.width  = static_cast<uint32_t>(wd.Width);
    rp.renderArea.extent.height = static_cast<uint32_t>(wd.Height);
    rp.clearValueCount          = 1;
    rp.pClearValues             = &wd.ClearValue;
    vkCmdBeginRenderPass(fd->CommandBuffer, &rp, VK_SUBPASS_CONTENTS_INLINE);

    ImGui_ImplVulkan_RenderDrawData(draw_data, fd->CommandBuffer);

    vkCmdEndRenderPass(fd->CommandBuffer);
    vk::check(vkEndCommandBuffer(fd->CommandBuffer), "vkEndCommandBuffer");

    VkPipelineStageFlags wait_stage = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    VkSubmitInfo         submit{};
    submit.sType                = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    submit.waitSemaphoreCount   = 1;
    submit.pWaitSemaphores      = &image_acquired;
    submit.pWaitDstStageMask    = &wait_stage;
    submit.commandBufferCount   = 1;
    submit.pCommandBuffers      = &fd->CommandBuffer;
    submit.signalSemaphoreCount = 1;
    submit.pSignalSemaphores    = &render_done;
    vk::check(vkQueueSubmit(vk_->queue(), 1, &submit, fd->Fence), "vkQueueSubmit");

    VkPresentInfoKHR present{};
    present.sType              = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
    present.waitSemaphoreCount = 1;
    present.pWaitSemaphores    = &render_done;
    present.swapchainCount     = 1;
    present.pSwapchains        = &wd.Swapchain;
    present.pImageIndices      = &wd.FrameIndex;
    err                        = vkQueuePresentKHR(vk_->queue(), &present);
    if (err == VK_ERROR_OUT_OF_DATE_KHR || err == VK_SUBOPTIMAL_KHR)
        impl_->swapchain_dirty = true;
    else
        vk::check(err, "vkQueuePresentKHR");

    wd.SemaphoreIndex = (wd.SemaphoreIndex + 1) % wd.ImageCount;
    return true;
}

void PlotWindow::rebuild_swapchain()
{
    uint32_t w = 0, h = 0;
    glfw_->framebuffer_size(w, h);
    if (w == 0 || h == 0)
        return;

    ImGui_ImplVulkan_SetMinImageCount(MIN_IMAGE_COUNT);
    ImGui_ImplVulkanH_CreateOrResizeWindow(vk_->instance(),
                                           vk_->physical_device(),
                                           vk_->device(),
                                           &impl_->window_data,
                                           vk_->queue_family(),
                                           nullptr,
                                           static_cast<int>(w),
                                           static_cast<int>(h),
                                           MIN_IMAGE_COUNT);
    impl_->window_data.FrameIndex = 0;
    impl_->swapchain_dirty        = false;
    PULSEPLOT_LOG_DEBUG("display", "Swapchain rebuilt: {}x{}", w, h);
}

void PlotWindow::close()
{
    if (closed_)
        return;
    closed_ = true;

    if (vk_)
        vk_->wait_idle();

    if (impl_)
    {
        if (impl_->imgui_context)
            ImGui::SetCurrentContext(impl_->imgui_context);
        if (impl_->vk_backend_up)
            ImGui_ImplVulkan_Shutdown();
        if (impl_->glfw_backend_up)
            ImGui_ImplGlfw_Shutdown();
        if (impl_->imgui_context)
            ImGui::DestroyContext(impl_->imgui_context);
        if (vk_ && impl_->window_data.Swapchain != VK_NULL_HANDLE)
        {
            // Surface is owned by VkContext
            impl_->window_data.Surface = VK_NULL_HANDLE;
            ImGui_ImplVulkanH_DestroyWindow(
                vk_->instance(), vk_->device(), &impl_->window_data, nullptr);
        }
        impl_.reset();
    }

    vk_.reset();
    if (glfw_)
    {
        glfw_->shutdown();
        glfw_.reset();
    }
    PULSEPLOT_LOG_DEBUG("display", "Plot window closed");
}

}   // namespace pulseplot::ui

#endif   // PULSEPLOT_USE_GLFW
