#pragma once

// DisplaySurface that keeps a copy of every presented update.  Hooks let a
// test act from inside present() (request a stop, fail, throw).

#include <functional>
#include <pulseplot/display.hpp>
#include <vector>

namespace pulseplot::test
{

struct PresentedFrame
{
    std::vector<double>   x;
    std::vector<double>   y;
    ViewBounds            bounds;
    std::string           rate_label;
    std::optional<double> latest_value;
    std::string           status;
    uint64_t              tick = 0;
};

class RecordingDisplay : public DisplaySurface
{
   public:
    using PresentHook = std::function<bool(const ViewUpdate&)>;

    bool present(const ViewUpdate& u) override
    {
        frames_.push_back(PresentedFrame{{u.x.begin(), u.x.end()},
                                         {u.y.begin(), u.y.end()},
                                         u.bounds,
                                         u.rate_label,
                                         u.latest_value,
                                         u.status,
                                         u.tick});
        if (on_present_)
            return on_present_(u);
        return true;
    }

    bool should_close() const override { return close_requested_; }
    void close() override { ++close_calls_; }

    void set_on_present(PresentHook hook) { on_present_ = std::move(hook); }
    void request_close() { close_requested_ = true; }

    const std::vector<PresentedFrame>& frames() const { return frames_; }
    int                                close_calls() const { return close_calls_; }

   private:
    std::vector<PresentedFrame> frames_;
    PresentHook                 on_present_;
    bool                        close_requested_ = false;
    int                         close_calls_     = 0;
};

}   // namespace pulseplot::test
