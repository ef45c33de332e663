#pragma once

#include <cstddef>
#include <cstdint>
#include <pulseplot/fwd.hpp>
#include <string>

namespace pulseplot
{

struct DrainResult
{
    std::size_t ingested = 0;
    std::size_t skipped  = 0;   // decode errors and rejected samples
    bool        source_failed = false;
    bool        end_of_stream = false;
    std::string failure;
};

// Moves every currently-available sample from a source into the buffer.
// Runs on the render thread, inside a tick.
class AcquisitionLoop
{
   public:
    static constexpr std::size_t DEFAULT_MAX_PER_DRAIN = 4096;

    explicit AcquisitionLoop(SampleBuffer& buffer,
                             std::size_t   max_per_drain = DEFAULT_MAX_PER_DRAIN);

    // Never throws.  Stops at the first "nothing available", at the first
    // source failure, or after max_per_drain reads, whichever comes first.
    DrainResult drain(SampleSource& source) noexcept;

    uint64_t total_ingested() const { return total_ingested_; }
    uint64_t total_skipped() const { return total_skipped_; }

    std::size_t max_per_drain() const { return max_per_drain_; }

   private:
    SampleBuffer& buffer_;
    std::size_t   max_per_drain_;
    uint64_t      total_ingested_ = 0;
    uint64_t      total_skipped_  = 0;
};

}   // namespace pulseplot
