#include "line_decoder.hpp"

#include <cctype>
#include <charconv>
#include <system_error>

namespace pulseplot::acq
{

static std::string_view trim(std::string_view s)
{
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(b, e - b);
}

LineDecoder::LineDecoder(std::size_t max_line_length)
    : max_line_length_(max_line_length > 0 ? max_line_length : DEFAULT_MAX_LINE_LENGTH)
{
}

void LineDecoder::emit(std::string line)
{
    auto trimmed = trim(line);
    if (trimmed.empty())
        return;
    lines_.emplace_back(trimmed);
}

void LineDecoder::feed(std::string_view bytes)
{
    for (char c : bytes)
    {
        if (c == '\n')
        {
            if (discarding_)
                discarding_ = false;
            else
                emit(std::move(partial_));
            partial_.clear();
            continue;
        }

        if (discarding_)
            continue;

        partial_.push_back(c);
        if (partial_.size() >= max_line_length_)
        {
            emit(std::move(partial_));
            partial_.clear();
            discarding_ = true;
        }
    }
}

void LineDecoder::finish()
{
    discarding_ = false;
    if (!partial_.empty())
    {
        emit(std::move(partial_));
        partial_.clear();
    }
}

std::string LineDecoder::pop_line()
{
    if (lines_.empty())
        return {};
    std::string line = std::move(lines_.front());
    lines_.pop_front();
    return line;
}

void LineDecoder::clear()
{
    discarding_ = false;
    partial_.clear();
    lines_.clear();
}

std::variant<double, DecodeError> parse_sample_value(std::string_view line)
{
    std::string_view text = trim(line);
    if (text.empty())
        return DecodeError{std::string(line), "empty line"};

    // Accept an explicit '+' sign; from_chars does not
    std::string_view digits = text;
    if (digits.front() == '+')
    {
        digits.remove_prefix(1);
        if (digits.empty() || digits.front() == '-')
            return DecodeError{std::string(text), "not a decimal integer"};
    }

    long long value = 0;
    auto [ptr, ec]  = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec == std::errc::result_out_of_range)
        return DecodeError{std::string(text), "value out of range"};
    if (ec != std::errc() || ptr != digits.data() + digits.size())
        return DecodeError{std::string(text), "not a decimal integer"};

    return static_cast<double>(value);
}

}   // namespace pulseplot::acq
