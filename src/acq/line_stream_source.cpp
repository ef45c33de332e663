#include "line_stream_source.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <pulseplot/logger.hpp>
#include <string_view>
#include <unistd.h>
#include <variant>

namespace pulseplot::acq
{

LineStreamSource::LineStreamSource(int fd, SampleClock& clock, std::string name)
    : LineStreamSource(fd, clock, std::move(name), Options{})
{
}

LineStreamSource::LineStreamSource(int fd, SampleClock& clock, std::string name, Options options)
    : fd_(fd),
      clock_(clock),
      name_(std::move(name)),
      options_(options),
      decoder_(options.max_line_length)
{
}

LineStreamSource::~LineStreamSource()
{
    close();
}

long LineStreamSource::pump(int timeout_ms)
{
    if (fd_ < 0 || failed_)
        return 0;

    pollfd pfd{};
    pfd.fd     = fd_;
    pfd.events = POLLIN;

    int ready = ::poll(&pfd, 1, timeout_ms);
    if (ready < 0)
    {
        if (errno == EINTR)
            return 0;
        failed_  = true;
        failure_ = SourceFailure{std::string("poll failed: ") + std::strerror(errno), false};
        return 0;
    }
    if (ready == 0)
        return 0;

    // POLLHUP alone still goes through read(): a closed pipe reads as EOF
    if (!(pfd.revents & (POLLIN | POLLHUP)) && (pfd.revents & (POLLERR | POLLNVAL)))
    {
        decoder_.finish();
        failed_  = true;
        failure_ = SourceFailure{"device disconnected", false};
        return 0;
    }

    std::array<char, 4096> chunk{};
    ssize_t                n = ::read(fd_, chunk.data(), chunk.size());
    if (n > 0)
    {
        decoder_.feed(std::string_view(chunk.data(), static_cast<size_t>(n)));
        return static_cast<long>(n);
    }
    if (n == 0)
    {
        decoder_.finish();
        failed_ = true;
        if (options_.eof_is_end_of_stream)
            failure_ = SourceFailure{"end of stream", true};
        else
            failure_ = SourceFailure{"device disconnected", false};
        return 0;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
        return 0;

    decoder_.finish();
    failed_  = true;
    failure_ = SourceFailure{std::string("read failed: ") + std::strerror(errno), false};
    return 0;
}

bool LineStreamSource::has_more()
{
    if (fd_ < 0)
        return false;
    if (decoder_.has_line())
        return true;
    if (!failed_)
        pump(0);
    return decoder_.has_line() || (failed_ && !reported_);
}

ReadResult LineStreamSource::read_one()
{
    if (!decoder_.has_line() && !failed_)
        pump(options_.read_timeout_ms);

    if (decoder_.has_line())
    {
        std::string line   = decoder_.pop_line();
        auto        parsed = parse_sample_value(line);
        if (auto* err = std::get_if<DecodeError>(&parsed))
            return *err;
        return Sample{clock_.stamp(), std::get<double>(parsed)};
    }

    if (failed_)
    {
        reported_ = true;
        return failure_;
    }

    return DecodeError{"", "no complete line within read timeout"};
}

void LineStreamSource::close()
{
    if (fd_ < 0)
        return;
    if (options_.owns_fd)
        ::close(fd_);
    fd_ = -1;
    decoder_.clear();
    PULSEPLOT_LOG_INFO("serial", "{} closed", name_);
}

}   // namespace pulseplot::acq
