#include <cmath>
#include <pulseplot/sample_buffer.hpp>
#include <stdexcept>

namespace pulseplot
{

SampleBuffer::SampleBuffer(std::size_t capacity)
    : capacity_(capacity),
      samples_(capacity * 2),
      times_(capacity * 2, 0.0),
      values_(capacity * 2, 0.0)
{
    if (capacity == 0)
        throw std::invalid_argument("SampleBuffer capacity must be greater than zero");
}

bool SampleBuffer::append(const Sample& sample)
{
    if (!std::isfinite(sample.timestamp) || !std::isfinite(sample.value))
        return false;
    if (size_ > 0 && sample.timestamp < back().timestamp)
        return false;

    const std::size_t mirror = write_ + capacity_;
    samples_[write_] = sample;
    samples_[mirror] = sample;
    times_[write_]   = sample.timestamp;
    times_[mirror]   = sample.timestamp;
    values_[write_]  = sample.value;
    values_[mirror]  = sample.value;

    write_ = (write_ + 1) % capacity_;
    if (size_ < capacity_)
        ++size_;
    ++total_appended_;
    return true;
}

std::size_t SampleBuffer::start_index() const
{
    return (write_ + capacity_ - size_) % capacity_;
}

std::span<const Sample> SampleBuffer::contents() const
{
    return {samples_.data() + start_index(), size_};
}

std::span<const double> SampleBuffer::times() const
{
    return {times_.data() + start_index(), size_};
}

std::span<const double> SampleBuffer::values() const
{
    return {values_.data() + start_index(), size_};
}

const Sample& SampleBuffer::front() const
{
    if (size_ == 0)
        throw std::out_of_range("SampleBuffer::front on empty buffer");
    return samples_[start_index()];
}

const Sample& SampleBuffer::back() const
{
    if (size_ == 0)
        throw std::out_of_range("SampleBuffer::back on empty buffer");
    return samples_[start_index() + size_ - 1];
}

}   // namespace pulseplot
