#pragma once

#include <cstddef>
#include <deque>
#include <pulseplot/sample.hpp>
#include <string>
#include <string_view>
#include <variant>

namespace pulseplot::acq
{

// Splits a byte stream into trimmed text lines.  Blank lines are dropped.
// Once a line reaches `max_line_length` bytes without a newline, that prefix
// is emitted (it fails to parse) and the rest of the line is discarded up to
// the next newline.
class LineDecoder
{
   public:
    static constexpr std::size_t DEFAULT_MAX_LINE_LENGTH = 256;

    explicit LineDecoder(std::size_t max_line_length = DEFAULT_MAX_LINE_LENGTH);

    void feed(std::string_view bytes);

    // Flushes a trailing unterminated line (end of stream).
    void finish();

    bool        has_line() const { return !lines_.empty(); }
    std::size_t pending_lines() const { return lines_.size(); }
    std::string pop_line();

    void clear();

   private:
    void emit(std::string line);

    std::size_t             max_line_length_;
    std::string             partial_;
    std::deque<std::string> lines_;
    bool                    discarding_ = false;
};

// One line → one value.  The wire format is a single decimal integer.
std::variant<double, DecodeError> parse_sample_value(std::string_view line);

}   // namespace pulseplot::acq
