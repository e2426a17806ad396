#include "camera.hpp"
#include "utils.hpp"
#include <sstream>

std::string libcamera_pipeline(int width, int height, int fps) {
    std::ostringstream gst;
    gst << "libcamerasrc ! video/x-raw,width=" << width
        << ",height=" << height
        << ",framerate=" << fps << "/1 ! "
        << "videoconvert ! video/x-raw,format=BGR ! appsink drop=true max-buffers=1";
    return gst.str();
}

OpenCvFrameSource::OpenCvFrameSource(const CameraConfig& config)
    : config_(config) {}

bool OpenCvFrameSource::open(std::string& err) {
    try {
        if (!config_.pipeline.empty()) {
            cap_.open(config_.pipeline, cv::CAP_GSTREAMER);
        } else {
            cap_.open(config_.index);
            if (cap_.isOpened()) {
                cap_.set(cv::CAP_PROP_FRAME_WIDTH, config_.width);
                cap_.set(cv::CAP_PROP_FRAME_HEIGHT, config_.height);
                cap_.set(cv::CAP_PROP_FPS, config_.fps);
            }
        }
    } catch (const cv::Exception& e) {
        err = e.what();
        return false;
    }
    if (!cap_.isOpened()) {
        err = "cannot open camera";
        return false;
    }
    log_info("camera: opened %dx%d",
             (int)cap_.get(cv::CAP_PROP_FRAME_WIDTH), (int)cap_.get(cv::CAP_PROP_FRAME_HEIGHT));
    return true;
}

bool OpenCvFrameSource::capture(Frame& frame, std::string& err) {
    if (!cap_.isOpened()) {
        err = "camera not open";
        return false;
    }
    cv::Mat img;
    try {
        if (!cap_.read(img) || img.empty()) {
            err = "read failed";
            return false;
        }
    } catch (const cv::Exception& e) {
        err = e.what();
        return false;
    }
    frame.image = img;
    frame.format = format_for(img);
    return true;
}
