#pragma once

#include <chrono>
#include <pulseplot/display.hpp>
#include <string>

namespace pulseplot::ui
{

// Headless display: logs the current view once per report interval.
class ConsoleDisplay : public DisplaySurface
{
   public:
    explicit ConsoleDisplay(std::string title,
                            std::chrono::milliseconds report_interval = std::chrono::seconds(1));

    bool present(const ViewUpdate& update) override;
    bool should_close() const override { return false; }
    void close() override;

    uint64_t presented() const { return presented_; }

   private:
    using Clock = std::chrono::steady_clock;

    std::string               title_;
    std::chrono::milliseconds report_interval_;
    Clock::time_point         last_report_{};
    bool                      reported_once_ = false;
    uint64_t                  presented_     = 0;
    bool                      closed_        = false;
};

}   // namespace pulseplot::ui
