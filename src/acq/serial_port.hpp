#pragma once

#include <memory>
#include <pulseplot/config.hpp>
#include <pulseplot/sample_clock.hpp>
#include <pulseplot/sample_source.hpp>
#include <string>

namespace pulseplot::acq
{

// Raw 8N1 serial port opened non-blocking.
class SerialPort
{
   public:
    SerialPort() = default;
    ~SerialPort();

    SerialPort(SerialPort&& other) noexcept;
    SerialPort& operator=(SerialPort&& other) noexcept;
    SerialPort(const SerialPort&)            = delete;
    SerialPort& operator=(const SerialPort&) = delete;

    // Opens and configures the port.  Logs and returns false on failure.
    bool open(const std::string& path, int baud);
    void close();

    // Drops bytes received but not yet read.
    bool reset_input_buffer();

    bool               is_open() const { return fd_ >= 0; }
    const std::string& path() const { return path_; }

    // Transfers ownership of the descriptor to the caller.
    int release();

    static bool is_supported_baud(int baud);

   private:
    int         fd_ = -1;
    std::string path_;
};

// Resolves the port (auto-discovering when config.port is empty), opens it
// and wraps it in a line source.  Returns nullptr when no usable port exists.
std::unique_ptr<SampleSource> open_serial_source(const SerialConfig& config, SampleClock& clock);

// Line source over standard input, for piping recorded or simulated data.
std::unique_ptr<SampleSource> open_stdin_source(SampleClock& clock);

}   // namespace pulseplot::acq
