#include "motion.hpp"
#include <opencv2/imgproc.hpp>

MotionDetector::MotionDetector(const MotionConfig& config)
    : config_(config) {}

void MotionDetector::reset() {
    reference_.release();
    cyclesSinceRefresh_ = 0;
}

cv::Mat MotionDetector::to_gray(const Frame& frame) const {
    cv::Mat gray;
    switch (frame.format) {
        case PixelFormat::Gray8:    gray = frame.image.clone(); break;
        case PixelFormat::Bgra8888: cv::cvtColor(frame.image, gray, cv::COLOR_BGRA2GRAY); break;
        case PixelFormat::Bgr888:   cv::cvtColor(frame.image, gray, cv::COLOR_BGR2GRAY); break;
    }

    // Resize for performance if needed
    if (config_.width > 0 && config_.height > 0 &&
        (gray.cols != config_.width || gray.rows != config_.height)) {
        cv::resize(gray, gray, cv::Size(config_.width, config_.height), 0, 0, cv::INTER_AREA);
    }
    if (config_.blur > 1) {
        int k = config_.blur | 1; // kernel must be odd
        cv::GaussianBlur(gray, gray, cv::Size(k, k), 0);
    }
    return gray;
}

bool MotionDetector::analyze(const Frame& frame, MotionState& out, std::string& err) {
    out = MotionState();
    out.sequence = frame.sequence;
    if (frame.empty()) return true;

    int type = frame.image.type();
    if (type != CV_8UC1 && type != CV_8UC3 && type != CV_8UC4) {
        err = "unsupported pixel type " + cv::typeToString(type);
        return false;
    }

    try {
        cv::Mat gray = to_gray(frame);

        // First frame, or the source changed size: seed the reference
        if (reference_.empty() || reference_.size() != gray.size()) {
            reference_ = gray;
            cyclesSinceRefresh_ = 0;
            return true;
        }

        cv::Mat diff;
        cv::absdiff(gray, reference_, diff);
        cv::threshold(diff, diff, config_.thresh, 255, cv::THRESH_BINARY);

        // Count changed pixels
        double changeRatio = (cv::countNonZero(diff) * 1.0) / (diff.rows * diff.cols);
        out.detected = changeRatio > config_.minChange;

        // Refresh the reference on a fixed cadence, independent of the decision
        if (++cyclesSinceRefresh_ >= config_.referenceInterval) {
            reference_ = gray;
            cyclesSinceRefresh_ = 0;
        }
    } catch (const cv::Exception& e) {
        err = e.what();
        out.detected = false;
        return false;
    }
    return true;
}

MotionState MotionDetector::detect(const Frame& frame) {
    MotionState state;
    std::string err;
    analyze(frame, state, err);
    return state;
}
