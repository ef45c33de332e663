#pragma once

#include <pulseplot/sample_clock.hpp>
#include <pulseplot/sample_source.hpp>
#include <string>

#include "line_decoder.hpp"

namespace pulseplot::acq
{

// Line-oriented sample source over a readable file descriptor: a serial
// port, a pipe, or stdin.  Each line carries one decimal integer.
class LineStreamSource : public SampleSource
{
   public:
    struct Options
    {
        int         read_timeout_ms = 10;
        bool        owns_fd         = true;
        std::size_t max_line_length = LineDecoder::DEFAULT_MAX_LINE_LENGTH;
        bool        eof_is_end_of_stream = true;   // false for devices: EOF means unplugged
    };

    LineStreamSource(int fd, SampleClock& clock, std::string name);
    LineStreamSource(int fd, SampleClock& clock, std::string name, Options options);
    ~LineStreamSource() override;

    LineStreamSource(const LineStreamSource&)            = delete;
    LineStreamSource& operator=(const LineStreamSource&) = delete;

    bool        has_more() override;
    ReadResult  read_one() override;
    void        close() override;
    bool        is_open() const override { return fd_ >= 0; }
    std::string describe() const override { return name_; }

    int fd() const { return fd_; }

   private:
    // Waits up to `timeout_ms` for input and reads what is there.  Returns
    // the number of bytes consumed; records a failure on EOF or I/O error.
    long pump(int timeout_ms);

    int           fd_;
    SampleClock&  clock_;
    std::string   name_;
    Options       options_;
    LineDecoder   decoder_;
    bool          failed_   = false;
    bool          reported_ = false;
    SourceFailure failure_;
};

}   // namespace pulseplot::acq
