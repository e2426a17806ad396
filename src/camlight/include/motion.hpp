#pragma once
#include <opencv2/core.hpp>
#include <string>
#include "config.hpp"
#include "frame.hpp"

struct MotionConfig {
    int width  = cfg::MOTION_WIDTH;   // analysis size, 0 keeps the frame size
    int height = cfg::MOTION_HEIGHT;
    int blur   = cfg::MOTION_BLUR;
    double thresh    = cfg::MOTION_THRESH;
    double minChange = cfg::MOTION_MIN_CHANGE;
    int referenceInterval = cfg::REFERENCE_INTERVAL;
};

// Frame differencing against a reference that is refreshed every
// referenceInterval cycles rather than every frame, so slow drift is
// absorbed without erasing genuine motion.
class MotionDetector {
public:
    explicit MotionDetector(const MotionConfig& config = MotionConfig());

    // Returns false with err set for frames it cannot analyze (not 8-bit
    // gray, BGR or BGRA); the reference is left untouched.
    bool analyze(const Frame& frame, MotionState& out, std::string& err);

    // analyze() for frames known to be valid; an unusable frame reads as no motion.
    MotionState detect(const Frame& frame);

    bool has_reference() const { return !reference_.empty(); }
    void reset();

private:
    cv::Mat to_gray(const Frame& frame) const;

    MotionConfig config_;
    cv::Mat reference_;
    int cyclesSinceRefresh_ = 0;
};
