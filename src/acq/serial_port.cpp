#include "serial_port.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <pulseplot/logger.hpp>
#include <termios.h>
#include <unistd.h>

#include "line_stream_source.hpp"
#include "port_discovery.hpp"

namespace pulseplot::acq
{

static bool baud_to_speed(int baud, speed_t& speed)
{
    switch (baud)
    {
        case 9600:
            speed = B9600;
            return true;
        case 19200:
            speed = B19200;
            return true;
        case 38400:
            speed = B38400;
            return true;
        case 57600:
            speed = B57600;
            return true;
        case 115200:
            speed = B115200;
            return true;
        case 230400:
            speed = B230400;
            return true;
        case 460800:
            speed = B460800;
            return true;
        case 921600:
            speed = B921600;
            return true;
        default:
            return false;
    }
}

bool SerialPort::is_supported_baud(int baud)
{
    speed_t unused;
    return baud_to_speed(baud, unused);
}

SerialPort::~SerialPort()
{
    close();
}

SerialPort::SerialPort(SerialPort&& other) noexcept
    : fd_(other.fd_), path_(std::move(other.path_))
{
    other.fd_ = -1;
}

SerialPort& SerialPort::operator=(SerialPort&& other) noexcept
{
    if (this != &other)
    {
        close();
        fd_       = other.fd_;
        path_     = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

bool SerialPort::open(const std::string& path, int baud)
{
    close();

    speed_t speed;
    if (!baud_to_speed(baud, speed))
    {
        PULSEPLOT_LOG_ERROR("serial", "Unsupported baud rate {}", baud);
        return false;
    }

    int fd = ::open(path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0)
    {
        PULSEPLOT_LOG_ERROR("serial", "Cannot open {}: {}", path, std::strerror(errno));
        return false;
    }

    termios tty{};
    if (::tcgetattr(fd, &tty) != 0)
    {
        PULSEPLOT_LOG_ERROR("serial", "{} is not a terminal: {}", path, std::strerror(errno));
        ::close(fd);
        return false;
    }

    ::cfmakeraw(&tty);
    tty.c_cflag |= (CLOCAL | CREAD);
    tty.c_cflag &= ~(PARENB | CSTOPB | CSIZE);
    tty.c_cflag |= CS8;
    tty.c_cc[VMIN]  = 0;
    tty.c_cc[VTIME] = 0;
    ::cfsetispeed(&tty, speed);
    ::cfsetospeed(&tty, speed);

    if (::tcsetattr(fd, TCSANOW, &tty) != 0)
    {
        PULSEPLOT_LOG_ERROR("serial", "Cannot configure {}: {}", path, std::strerror(errno));
        ::close(fd);
        return false;
    }

    fd_   = fd;
    path_ = path;
    return true;
}

bool SerialPort::reset_input_buffer()
{
    if (fd_ < 0)
        return false;
    return ::tcflush(fd_, TCIFLUSH) == 0;
}

void SerialPort::close()
{
    if (fd_ >= 0)
    {
        ::close(fd_);
        fd_ = -1;
    }
}

int SerialPort::release()
{
    int fd = fd_;
    fd_    = -1;
    return fd;
}

std::unique_ptr<SampleSource> open_serial_source(const SerialConfig& config, SampleClock& clock)
{
    std::string path = config.port;
    if (path.empty())
    {
        auto port = find_controller_port(enumerate_ports());
        if (!port)
        {
            PULSEPLOT_LOG_ERROR("serial", "No Arduino found on any port");
            return nullptr;
        }
        PULSEPLOT_LOG_INFO("serial", "Found Arduino on port: {}", port->device);
        path = port->device;
    }

    PULSEPLOT_LOG_INFO("serial", "Connecting to {} at {} baud", path, config.baud);
    SerialPort port;
    if (!port.open(path, config.baud))
        return nullptr;
    if (!port.reset_input_buffer())
        PULSEPLOT_LOG_WARN("serial", "Could not flush pending input on {}", path);

    LineStreamSource::Options options;
    options.read_timeout_ms      = config.read_timeout_ms;
    options.eof_is_end_of_stream = false;
    return std::make_unique<LineStreamSource>(port.release(), clock, "serial " + path, options);
}

std::unique_ptr<SampleSource> open_stdin_source(SampleClock& clock)
{
    int flags = ::fcntl(STDIN_FILENO, F_GETFL, 0);
    if (flags >= 0)
        ::fcntl(STDIN_FILENO, F_SETFL, flags | O_NONBLOCK);

    LineStreamSource::Options options;
    options.owns_fd = false;
    return std::make_unique<LineStreamSource>(STDIN_FILENO, clock, "stdin", options);
}

}   // namespace pulseplot::acq
