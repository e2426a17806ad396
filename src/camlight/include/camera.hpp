#pragma once
#include <string>
#include <opencv2/videoio.hpp>
#include "capabilities.hpp"
#include "config.hpp"

struct CameraConfig {
    int index = cfg::CAM_INDEX;
    std::string pipeline;   // GStreamer pipeline; overrides index when set
    int width  = cfg::CAM_WIDTH;
    int height = cfg::CAM_HEIGHT;
    int fps    = cfg::CAM_FPS;
};

// libcamerasrc ! ... ! appsink pipeline for the Pi camera at the given size
std::string libcamera_pipeline(int width, int height, int fps);

// cv::VideoCapture backed camera.
class OpenCvFrameSource : public FrameSource {
public:
    explicit OpenCvFrameSource(const CameraConfig& config = CameraConfig());

    bool open(std::string& err);
    bool capture(Frame& frame, std::string& err) override;

private:
    CameraConfig config_;
    cv::VideoCapture cap_;
};
