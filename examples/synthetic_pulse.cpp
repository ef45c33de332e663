#include <cmath>
#include <pulseplot/logger.hpp>
#include <pulseplot/render_driver.hpp>

#ifdef PULSEPLOT_USE_GLFW
    #include "ui/plot_window.hpp"
#else
    #include "ui/console_display.hpp"
#endif

// Simulated finger-on-camera trace: a 72 bpm pulse on a slowly drifting
// baseline, produced at 50 Hz of run time.
class SyntheticPulse : public pulseplot::SampleSource
{
   public:
    explicit SyntheticPulse(pulseplot::SampleClock& clock) : clock_(clock) {}

    bool has_more() override
    {
        if (!open_)
            return false;
        return !clock_.started() || clock_.elapsed() >= next_t_;
    }

    pulseplot::ReadResult read_one() override
    {
        double t = clock_.stamp();
        next_t_  = t + 0.02;

        double beat  = std::fmod(t * 1.2, 1.0);
        double pulse = std::exp(-std::pow((beat - 0.2) / 0.05, 2.0)) * 6.0
                       + std::exp(-std::pow((beat - 0.45) / 0.08, 2.0)) * 2.0;
        double drift = 3.0 * std::sin(t * 0.3);
        return pulseplot::Sample{t, 140.0 + drift + pulse};
    }

    void        close() override { open_ = false; }
    bool        is_open() const override { return open_; }
    std::string describe() const override { return "synthetic pulse"; }

   private:
    pulseplot::SampleClock& clock_;
    double                  next_t_ = 0.0;
    bool                    open_   = true;
};

int main()
{
    pulseplot::Logger::instance().add_sink(pulseplot::sinks::console_sink());

    pulseplot::SampleClock clock;
    SyntheticPulse         source(clock);
    pulseplot::RunContext  ctx(source, clock, 500, pulseplot::ViewConfig::camera_preset());

#ifdef PULSEPLOT_USE_GLFW
    pulseplot::ui::PlotWindow display({
        .title      = "Synthetic PPG",
        .y_label    = "Intensity",
        .line_color = pulseplot::colors::red,
    });
    if (!display.init())
        return 1;
#else
    pulseplot::ui::ConsoleDisplay display("Synthetic PPG");
#endif

    pulseplot::RenderDriver driver(ctx, display, {.max_run_seconds = 30.0});
    driver.run();
    return 0;
}
