#pragma once

#include <cstddef>
#include <pulseplot/logger.hpp>
#include <pulseplot/rolling_view.hpp>
#include <string>

namespace pulseplot
{

enum class SourceKind
{
    Serial,
    Camera,
    Stdin,
};

struct BufferConfig
{
    static constexpr std::size_t MAX_CAPACITY = 10'000'000;

    std::size_t capacity = 1000;
};

struct SerialConfig
{
    std::string port;              // empty → auto-discover
    int         baud            = 115200;
    int         read_timeout_ms = 10;
};

struct CameraConfig
{
    int index   = 0;
    int channel = 2;   // red in OpenCV's BGR order
};

struct RunConfig
{
    SourceKind   source = SourceKind::Serial;
    BufferConfig buffer;
    ViewConfig   view = ViewConfig::serial_preset();
    SerialConfig serial;
    CameraConfig camera;

    double      tick_interval_ms = 10.0;
    std::size_t max_per_drain    = 4096;
    double      max_run_seconds  = 0.0;
    bool        headless         = false;
    LogLevel    log_level        = LogLevel::Info;
    std::string log_file;   // empty = console only

    // Defaults for each acquisition variant (buffer size, view policy).
    static RunConfig for_source(SourceKind kind);
};

const char* to_string(SourceKind kind);

// PULSEPLOT_LOG_LEVEL and PULSEPLOT_HEADLESS override the given config.
void apply_environment(RunConfig& config);

}   // namespace pulseplot
