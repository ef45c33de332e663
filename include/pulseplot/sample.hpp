#pragma once

#include <string>
#include <variant>

namespace pulseplot
{

// One scalar reading.  `timestamp` is seconds since the run's first
// successful read.
struct Sample
{
    double timestamp = 0.0;
    double value     = 0.0;
};

// A single malformed input unit (one line, one frame).  Recoverable: the
// input is skipped and acquisition continues.
struct DecodeError
{
    std::string input;
    std::string reason;
};

// The underlying device or stream is gone.  Not recoverable for this run.
struct SourceFailure
{
    std::string reason;
    bool        end_of_stream = false;   // orderly EOF rather than an I/O error
};

using ReadResult = std::variant<Sample, DecodeError, SourceFailure>;

}   // namespace pulseplot
