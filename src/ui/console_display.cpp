#include "console_display.hpp"

#include <pulseplot/logger.hpp>

namespace pulseplot::ui
{

ConsoleDisplay::ConsoleDisplay(std::string title, std::chrono::milliseconds report_interval)
    : title_(std::move(title)), report_interval_(report_interval)
{
}

bool ConsoleDisplay::present(const ViewUpdate& update)
{
    ++presented_;

    auto now = Clock::now();
    if (reported_once_ && now - last_report_ < report_interval_)
        return true;
    reported_once_ = true;
    last_report_   = now;

    if (update.latest_value)
    {
        PULSEPLOT_LOG_INFO("display",
                           "{} - {} | {} pts, last {} | x [{}, {}] y [{}, {}] {}",
                           title_,
                           update.rate_label,
                           update.x.size(),
                           *update.latest_value,
                           update.bounds.x_min,
                           update.bounds.x_max,
                           update.bounds.y_min,
                           update.bounds.y_max,
                           update.status);
    }
    else
    {
        PULSEPLOT_LOG_INFO("display", "{} - waiting for data", title_);
    }
    return true;
}

void ConsoleDisplay::close()
{
    if (closed_)
        return;
    closed_ = true;
    PULSEPLOT_LOG_DEBUG("display", "{} closed after {} frames", title_, presented_);
}

}   // namespace pulseplot::ui
