#pragma once
#include <cstdint>
#include <opencv2/core.hpp>

enum class PixelFormat { Gray8, Bgr888, Bgra8888 };

// One captured image. Treated as immutable once handed to FrameHub.
struct Frame {
    cv::Mat image;
    PixelFormat format = PixelFormat::Bgr888;
    uint64_t sequence = 0;

    int width() const { return image.cols; }
    int height() const { return image.rows; }
    bool empty() const { return image.empty(); }
};

struct MotionState {
    bool detected = false;
    uint64_t sequence = 0; // frame the state was computed from
};

// Pixel format implied by the channel count of an 8-bit image.
inline PixelFormat format_for(const cv::Mat& m) {
    switch (m.channels()) {
        case 1:  return PixelFormat::Gray8;
        case 4:  return PixelFormat::Bgra8888;
        default: return PixelFormat::Bgr888;
    }
}
