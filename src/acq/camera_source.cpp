#include "camera_source.hpp"

#include <cstdio>
#include <pulseplot/logger.hpp>

namespace pulseplot::acq
{

double channel_mean(const cv::Mat& frame, int channel)
{
    cv::Scalar mean = cv::mean(frame);
    int        c    = (channel >= 0 && channel < frame.channels()) ? channel : 0;
    return mean[c];
}

CameraSource::CameraSource(std::unique_ptr<cv::VideoCapture> capture,
                           SampleClock&                      clock,
                           CameraConfig                      config)
    : capture_(std::move(capture)), clock_(clock), config_(config)
{
    if (capture_ && capture_->isOpened())
    {
        reported_fps_ = capture_->get(cv::CAP_PROP_FPS);
        // Half a frame period keeps the grab loop at the camera's own pace
        if (reported_fps_ > 0.0)
            min_grab_interval_ = std::chrono::duration<double>(0.5 / reported_fps_);
    }
    fps_window_start_ = Clock::now();
}

CameraSource::~CameraSource()
{
    close();
}

bool CameraSource::is_open() const
{
    return capture_ && capture_->isOpened();
}

std::string CameraSource::describe() const
{
    return "camera " + std::to_string(config_.index);
}

std::string CameraSource::status_text() const
{
    char buf[48];
    std::snprintf(buf, sizeof(buf), "FPS: %.1f", measured_fps_);
    return buf;
}

void CameraSource::update_fps_meter()
{
    ++frames_in_second_;
    auto now     = Clock::now();
    auto elapsed = std::chrono::duration<double>(now - fps_window_start_).count();
    if (elapsed >= 1.0)
    {
        measured_fps_ = static_cast<double>(frames_in_second_) / elapsed;
        PULSEPLOT_LOG_INFO("camera", "Current FPS: {}", measured_fps_);
        frames_in_second_ = 0;
        fps_window_start_ = now;
    }
}

bool CameraSource::has_more()
{
    if (failed_)
        return !reported_;
    if (!is_open())
        return false;
    return !grabbed_once_ || Clock::now() - last_grab_ >= min_grab_interval_;
}

ReadResult CameraSource::read_one()
{
    if (failed_)
    {
        reported_ = true;
        return SourceFailure{failure_reason_, false};
    }
    if (!is_open())
        return DecodeError{"", "no frame ready"};

    last_grab_    = Clock::now();
    grabbed_once_ = true;
    if (!capture_->grab() || !capture_->retrieve(frame_) || frame_.empty())
    {
        failed_         = true;
        reported_       = true;
        failure_reason_ = "Failed to read frame";
        return SourceFailure{failure_reason_, false};
    }

    update_fps_meter();
    return Sample{clock_.stamp(), channel_mean(frame_, config_.channel)};
}

void CameraSource::close()
{
    if (!capture_)
        return;
    if (capture_->isOpened())
    {
        capture_->release();
        PULSEPLOT_LOG_INFO("camera", "Video capture closed");
    }
    capture_.reset();
}

std::unique_ptr<SampleSource> open_camera_source(const CameraConfig& config, SampleClock& clock)
{
    PULSEPLOT_LOG_INFO("camera", "Initializing camera {}...", config.index);
    auto capture = std::make_unique<cv::VideoCapture>(config.index);
    if (!capture->isOpened())
    {
        PULSEPLOT_LOG_ERROR("camera", "Could not open camera {}", config.index);
        return nullptr;
    }

    PULSEPLOT_LOG_INFO("camera",
                       "Resolution: {}x{}, FPS: {}",
                       capture->get(cv::CAP_PROP_FRAME_WIDTH),
                       capture->get(cv::CAP_PROP_FRAME_HEIGHT),
                       capture->get(cv::CAP_PROP_FPS));
    return std::make_unique<CameraSource>(std::move(capture), clock, config);
}

std::vector<CameraInfo> list_cameras(int max_index)
{
    std::vector<CameraInfo> found;
    for (int i = 0; i < max_index; ++i)
    {
        cv::VideoCapture cap(i);
        if (!cap.isOpened())
        {
            PULSEPLOT_LOG_DEBUG("camera", "Could not open camera {}", i);
            continue;
        }

        cv::Mat frame;
        if (!cap.read(frame) || frame.empty())
        {
            PULSEPLOT_LOG_INFO("camera", "Camera {} opened but couldn't read frame", i);
            cap.release();
            continue;
        }

        CameraInfo info;
        info.index  = i;
        info.width  = static_cast<int>(cap.get(cv::CAP_PROP_FRAME_WIDTH));
        info.height = static_cast<int>(cap.get(cv::CAP_PROP_FRAME_HEIGHT));
        info.fps    = cap.get(cv::CAP_PROP_FPS);
        PULSEPLOT_LOG_INFO(
            "camera", "Camera {} is available: {}x{} @ {} fps", i, info.width, info.height, info.fps);
        found.push_back(info);
        cap.release();
    }

    if (found.empty())
        PULSEPLOT_LOG_INFO("camera", "No cameras were found");
    else
        PULSEPLOT_LOG_INFO("camera", "Found {} camera(s)", found.size());
    return found;
}

}   // namespace pulseplot::acq
