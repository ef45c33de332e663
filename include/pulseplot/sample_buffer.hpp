#pragma once

#include <cstddef>
#include <cstdint>
#include <pulseplot/sample.hpp>
#include <span>
#include <vector>

namespace pulseplot
{

// Fixed-capacity, time-ordered sample store with FIFO eviction.
//
// Storage is mirrored: every slot is written twice, at `i` and `i + capacity`,
// so the retained window is always one contiguous run of memory.  append()
// is O(1) and contents()/times()/values() return views without copying.
// Views are invalidated by the next append().
class SampleBuffer
{
   public:
    explicit SampleBuffer(std::size_t capacity);

    // Appends to the tail, evicting the oldest sample when full.  Returns
    // false (and leaves the buffer untouched) for non-finite samples or a
    // timestamp older than the current tail.
    bool append(const Sample& sample);

    std::span<const Sample> contents() const;
    std::span<const double> times() const;
    std::span<const double> values() const;

    const Sample& front() const;
    const Sample& back() const;

    std::size_t size() const { return size_; }
    std::size_t capacity() const { return capacity_; }
    bool        empty() const { return size_ == 0; }
    bool        full() const { return size_ == capacity_; }

    // Samples accepted since construction, including the evicted ones.
    uint64_t total_appended() const { return total_appended_; }

   private:
    std::size_t start_index() const;

    std::size_t         capacity_;
    std::size_t         write_          = 0;
    std::size_t         size_           = 0;
    uint64_t            total_appended_ = 0;
    std::vector<Sample> samples_;
    std::vector<double> times_;
    std::vector<double> values_;
};

}   // namespace pulseplot
