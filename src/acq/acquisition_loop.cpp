#include <exception>
#include <pulseplot/acquisition.hpp>
#include <pulseplot/logger.hpp>
#include <pulseplot/sample_buffer.hpp>
#include <pulseplot/sample_source.hpp>
#include <type_traits>
#include <variant>

namespace pulseplot
{

AcquisitionLoop::AcquisitionLoop(SampleBuffer& buffer, std::size_t max_per_drain)
    : buffer_(buffer), max_per_drain_(max_per_drain > 0 ? max_per_drain : 1)
{
}

DrainResult AcquisitionLoop::drain(SampleSource& source) noexcept
{
    DrainResult result;

    try
    {
        std::size_t reads = 0;
        while (reads < max_per_drain_ && source.is_open() && source.has_more())
        {
            ++reads;
            ReadResult read = source.read_one();

            if (auto* sample = std::get_if<Sample>(&read))
            {
                if (buffer_.append(*sample))
                {
                    ++result.ingested;
                    PULSEPLOT_LOG_DEBUG(
                        "acq", "Read: {} at time {}s", sample->value, sample->timestamp);
                }
                else
                {
                    ++result.skipped;
                    PULSEPLOT_LOG_WARN("acq",
                                       "Rejected sample {} at {}s (non-finite or out of order)",
                                       sample->value,
                                       sample->timestamp);
                }
            }
            else if (auto* bad = std::get_if<DecodeError>(&read))
            {
                ++result.skipped;
                PULSEPLOT_LOG_WARN("acq", "Error reading data: {} (input: '{}')", bad->reason,
                                   bad->input);
            }
            else if (auto* failure = std::get_if<SourceFailure>(&read))
            {
                result.source_failed = true;
                result.end_of_stream = failure->end_of_stream;
                result.failure       = failure->reason;
                if (failure->end_of_stream)
                    PULSEPLOT_LOG_INFO("acq", "{}: {}", source.describe(), failure->reason);
                else
                    PULSEPLOT_LOG_ERROR("acq", "{}: {}", source.describe(), failure->reason);
                break;
            }
        }

        if (reads == max_per_drain_)
            PULSEPLOT_LOG_DEBUG("acq", "Drain capped at {} reads; remainder deferred", reads);
    }
    catch (const std::exception& e)
    {
        // Treated as "no sample this cycle"; the source stays in charge of
        // reporting a hard failure on its next read.
        ++result.skipped;
        PULSEPLOT_LOG_ERROR("acq", "Error reading from {}: {}", source.describe(), e.what());
    }

    total_ingested_ += result.ingested;
    total_skipped_ += result.skipped;
    return result;
}

}   // namespace pulseplot
