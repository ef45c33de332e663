#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>
#include <pulseplot/config.hpp>
#include <pulseplot/sample_clock.hpp>
#include <pulseplot/sample_source.hpp>
#include <string>
#include <vector>

namespace pulseplot::acq
{

// PPG proxy: mean intensity of one colour channel over the whole frame.
double channel_mean(const cv::Mat& frame, int channel);

// Frame-driven sample source.  Each grabbed frame is reduced to one scalar.
// has_more() only checks the grab pacing; read_one() grabs and blocks until
// the camera delivers the frame.  At most one frame is grabbed per
// `min_grab_interval`.
class CameraSource : public SampleSource
{
   public:
    CameraSource(std::unique_ptr<cv::VideoCapture> capture,
                 SampleClock&                      clock,
                 CameraConfig                      config);
    ~CameraSource() override;

    CameraSource(const CameraSource&)            = delete;
    CameraSource& operator=(const CameraSource&) = delete;

    bool        has_more() override;
    ReadResult  read_one() override;
    void        close() override;
    bool        is_open() const override;
    std::string describe() const override;
    std::string status_text() const override;

    void   set_min_grab_interval(std::chrono::duration<double> interval) { min_grab_interval_ = interval; }

   private:
    using Clock = std::chrono::steady_clock;

    void update_fps_meter();

    std::unique_ptr<cv::VideoCapture> capture_;
    SampleClock&                      clock_;
    CameraConfig                      config_;
    cv::Mat                           frame_;

    bool              failed_   = false;
    bool              reported_ = false;
    std::string       failure_reason_;
    Clock::time_point last_grab_{};
    bool              grabbed_once_ = false;
    std::chrono::duration<double> min_grab_interval_{0.010};

    double            reported_fps_ = 0.0;
    double            measured_fps_ = 0.0;
    uint64_t          frames_in_second_ = 0;
    Clock::time_point fps_window_start_{};
};

struct CameraInfo
{
    int    index  = 0;
    int    width  = 0;
    int    height = 0;
    double fps    = 0.0;
};

// Opens camera `config.index`.  Returns nullptr (after logging) when the
// device cannot be opened.
std::unique_ptr<SampleSource> open_camera_source(const CameraConfig& config, SampleClock& clock);

// Probes indices [0, max_index) and returns the cameras that deliver a frame.
std::vector<CameraInfo> list_cameras(int max_index = 10);

}   // namespace pulseplot::acq
