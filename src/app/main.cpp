#include "../acq/port_discovery.hpp"
#include "../acq/serial_port.hpp"
#include "../ui/console_display.hpp"
#include "cli.hpp"

#ifdef PULSEPLOT_USE_OPENCV
    #include "../acq/camera_source.hpp"
#endif

#ifdef PULSEPLOT_USE_GLFW
    #include "../ui/plot_window.hpp"
    #include <pulseplot/color.hpp>
#endif

#include <atomic>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <pulseplot/logger.hpp>
#include <pulseplot/render_driver.hpp>
#include <string>
#include <vector>

namespace
{

std::atomic<bool> g_stop{false};

void signal_handler(int /*sig*/)
{
    g_stop.store(true, std::memory_order_relaxed);
}

constexpr int EXIT_OK    = 0;
constexpr int EXIT_FATAL = 1;
constexpr int EXIT_USAGE = 2;

int list_ports()
{
    auto ports = pulseplot::acq::enumerate_ports();
    if (ports.empty())
    {
        std::cout << "No serial ports found\n";
        return EXIT_OK;
    }
    for (const auto& p : ports)
    {
        std::cout << p.device;
        if (!p.description.empty())
            std::cout << "  " << p.description;
        if (!p.driver.empty())
            std::cout << "  [" << p.driver << "]";
        if (pulseplot::acq::is_known_controller(p))
            std::cout << "  *";
        std::cout << "\n";
    }
    return EXIT_OK;
}

int list_cameras()
{
#ifdef PULSEPLOT_USE_OPENCV
    auto cams = pulseplot::acq::list_cameras();
    if (cams.empty())
        std::cout << "No cameras found\n";
    for (const auto& c : cams)
        std::cout << "camera " << c.index << ": " << c.width << "x" << c.height << " @ " << c.fps
                  << " fps\n";
    return EXIT_OK;
#else
    PULSEPLOT_LOG_ERROR("app", "Built without camera support");
    return EXIT_FATAL;
#endif
}

std::unique_ptr<pulseplot::SampleSource> open_source(const pulseplot::RunConfig& config,
                                                     pulseplot::SampleClock&     clock)
{
    using pulseplot::SourceKind;
    switch (config.source)
    {
        case SourceKind::Serial:
            return pulseplot::acq::open_serial_source(config.serial, clock);
        case SourceKind::Stdin:
            return pulseplot::acq::open_stdin_source(clock);
        case SourceKind::Camera:
#ifdef PULSEPLOT_USE_OPENCV
            return pulseplot::acq::open_camera_source(config.camera, clock);
#else
            PULSEPLOT_LOG_ERROR("app", "Built without camera support");
            return nullptr;
#endif
    }
    return nullptr;
}

std::unique_ptr<pulseplot::DisplaySurface> open_display(const pulseplot::RunConfig& config)
{
    const bool  camera = config.source == pulseplot::SourceKind::Camera;
    std::string title  = camera ? "Real-time PPG Signal" : "Real-time Arduino Data";

    if (!config.headless)
    {
#ifdef PULSEPLOT_USE_GLFW
        auto window = std::make_unique<pulseplot::ui::PlotWindow>(pulseplot::ui::PlotWindowConfig{
            .title      = title,
            .x_label    = "Time (seconds)",
            .y_label    = camera ? "Intensity" : "Value",
            .line_color = camera ? pulseplot::colors::red : pulseplot::colors::blue,
        });
        if (!window->init())
            return nullptr;
        return window;
#else
        PULSEPLOT_LOG_WARN("app", "Built without a window backend, running headless");
#endif
    }
    return std::make_unique<pulseplot::ui::ConsoleDisplay>(title);
}

int exit_code_for(pulseplot::StopReason reason)
{
    using pulseplot::StopReason;
    switch (reason)
    {
        case StopReason::None:
        case StopReason::UserRequest:
        case StopReason::EndOfStream:
        case StopReason::DurationElapsed:
            return EXIT_OK;
        case StopReason::SourceUnavailable:
        case StopReason::SourceFailure:
        case StopReason::DisplayFailure:
        case StopReason::TickError:
            return EXIT_FATAL;
    }
    return EXIT_FATAL;
}

}   // anonymous namespace

int main(int argc, char* argv[])
{
    pulseplot::Logger::instance().add_sink(pulseplot::sinks::console_sink());

    pulseplot::app::CommandLine cl;
    try
    {
        cl = pulseplot::app::parse_command_line(std::vector<std::string>(argv + 1, argv + argc));
    }
    catch (const pulseplot::app::UsageError& e)
    {
        std::cerr << "pulseplot: " << e.what() << "\n\n" << pulseplot::app::usage_text();
        return EXIT_USAGE;
    }

    pulseplot::Logger::instance().set_level(cl.config.log_level);
    if (!cl.config.log_file.empty())
        pulseplot::Logger::instance().add_sink(pulseplot::sinks::file_sink(cl.config.log_file));

    switch (cl.command)
    {
        case pulseplot::app::Command::Help:
            std::cout << pulseplot::app::usage_text();
            return EXIT_OK;
        case pulseplot::app::Command::ListPorts:
            return list_ports();
        case pulseplot::app::Command::ListCameras:
            return list_cameras();
        case pulseplot::app::Command::Run:
            break;
    }

    const auto& config = cl.config;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    pulseplot::SampleClock clock;
    auto                   source = open_source(config, clock);
    if (!source)
    {
        PULSEPLOT_LOG_ERROR("app", "Acquisition unavailable ({})", pulseplot::to_string(config.source));
        return EXIT_FATAL;
    }

    auto display = open_display(config);
    if (!display)
    {
        source->close();
        PULSEPLOT_LOG_ERROR("app", "Could not open a display");
        return EXIT_FATAL;
    }

    pulseplot::StopReason reason = pulseplot::StopReason::None;
    try
    {
        pulseplot::RunContext   ctx(*source, clock, config.buffer.capacity, config.view);
        pulseplot::RenderDriver driver(ctx,
                                       *display,
                                       pulseplot::DriverConfig{
                                           .tick_interval_ms = config.tick_interval_ms,
                                           .max_per_drain    = config.max_per_drain,
                                           .max_run_seconds  = config.max_run_seconds,
                                       });
        reason = driver.run(&g_stop);
    }
    catch (const std::exception& e)
    {
        source->close();
        PULSEPLOT_LOG_ERROR("app", "Fatal: {}", e.what());
        return EXIT_FATAL;
    }

    PULSEPLOT_LOG_INFO("app", "Stopped: {}", pulseplot::to_string(reason));
    return exit_code_for(reason);
}
