#include <cstdlib>
#include <pulseplot/config.hpp>
#include <string_view>

namespace pulseplot
{

RunConfig RunConfig::for_source(SourceKind kind)
{
    RunConfig config;
    config.source = kind;
    switch (kind)
    {
        case SourceKind::Serial:
        case SourceKind::Stdin:
            config.buffer.capacity = 1000;
            config.view            = ViewConfig::serial_preset();
            break;
        case SourceKind::Camera:
            // 500 points is ten seconds at 50 Hz
            config.buffer.capacity = 500;
            config.view            = ViewConfig::camera_preset();
            break;
    }
    return config;
}

const char* to_string(SourceKind kind)
{
    switch (kind)
    {
        case SourceKind::Serial:
            return "serial";
        case SourceKind::Camera:
            return "camera";
        case SourceKind::Stdin:
            return "stdin";
    }
    return "unknown";
}

void apply_environment(RunConfig& config)
{
    if (const char* level = std::getenv("PULSEPLOT_LOG_LEVEL"))
    {
        if (auto parsed = Logger::level_from_string(level))
            config.log_level = *parsed;
        else
            PULSEPLOT_LOG_WARN("app", "Ignoring unknown PULSEPLOT_LOG_LEVEL '{}'", level);
    }

    if (const char* headless = std::getenv("PULSEPLOT_HEADLESS"))
    {
        std::string_view v(headless);
        config.headless = !(v.empty() || v == "0" || v == "false");
    }
}

}   // namespace pulseplot
