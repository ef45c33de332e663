#pragma once

#include <pulseplot/sample.hpp>
#include <string>

namespace pulseplot
{

// Producer of timestamped scalar samples, polled by the acquisition loop.
class SampleSource
{
   public:
    virtual ~SampleSource() = default;

    // Non-blocking: true when read_one() can return without waiting for the
    // device.  A pending SourceFailure also counts as "more".
    virtual bool has_more() = 0;

    // Pulls and parses exactly one sample.  May block for at most the
    // source's short read timeout.
    virtual ReadResult read_one() = 0;

    // Releases the device or handle.  Idempotent.
    virtual void close() = 0;

    virtual bool is_open() const = 0;

    // Human-readable identity, e.g. "serial /dev/ttyACM0".
    virtual std::string describe() const = 0;

    // Optional live status for the display (camera frame rate, ...).
    virtual std::string status_text() const { return {}; }
};

}   // namespace pulseplot
