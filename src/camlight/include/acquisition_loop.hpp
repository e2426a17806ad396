#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include "capabilities.hpp"
#include "config.hpp"
#include "device_controller.hpp"
#include "frame_hub.hpp"
#include "motion.hpp"

struct AcquisitionConfig {
    int fps = cfg::CAM_FPS;
    int max_failures = cfg::MAX_CAPTURE_FAILURES;   // consecutive, then Failed
    std::chrono::milliseconds retry_delay{cfg::CAPTURE_RETRY_MS};
};

// The single producer: capture -> detect -> publish -> notify the controller
// on motion transitions. Nothing else calls FrameSource except
// capture_snapshot(), which takes the same source lock.
class AcquisitionLoop {
public:
    enum class State { Idle, Running, Failed, Stopped };

    AcquisitionLoop(FrameSource& source, MotionDetector& detector, FrameHub& hub,
                    DeviceController& device, const AcquisitionConfig& config = AcquisitionConfig());
    ~AcquisitionLoop();

    AcquisitionLoop(const AcquisitionLoop&) = delete;
    AcquisitionLoop& operator=(const AcquisitionLoop&) = delete;

    bool start();
    void stop();

    // One synchronous cycle. Must not be mixed with a running thread.
    // Returns false if the source failed or produced a frame that cannot be analyzed.
    bool run_cycle();

    // Full-resolution capture outside the regular cadence.
    bool capture_snapshot(Frame& out, std::string& err);

    State state() const { return state_.load(); }
    uint64_t frames_published() const { return published_.load(); }
    int consecutive_failures() const { return failures_.load(); }

    static const char* state_name(State s);

private:
    void thread_fn();
    bool cycle_failed(const std::string& err);

    FrameSource& source_;
    MotionDetector& detector_;
    FrameHub& hub_;
    DeviceController& device_;
    AcquisitionConfig config_;

    std::mutex source_m_;          // serializes FrameSource access
    uint64_t next_sequence_ = 1;
    bool last_detected_ = false;

    std::atomic<State> state_{State::Idle};
    std::atomic<bool> run_{false};
    std::atomic<uint64_t> published_{0};
    std::atomic<int> failures_{0};
    std::thread th_;
};
