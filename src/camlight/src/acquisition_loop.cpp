#include "acquisition_loop.hpp"
#include "utils.hpp"
#include <utility>

AcquisitionLoop::AcquisitionLoop(FrameSource& source, MotionDetector& detector, FrameHub& hub,
                                 DeviceController& device, const AcquisitionConfig& config)
    : source_(source), detector_(detector), hub_(hub), device_(device), config_(config) {
    if (config_.fps <= 0) config_.fps = cfg::CAM_FPS;
}

AcquisitionLoop::~AcquisitionLoop() {
    stop();
}

const char* AcquisitionLoop::state_name(State s) {
    switch (s) {
        case State::Idle:    return "idle";
        case State::Running: return "running";
        case State::Failed:  return "failed";
        case State::Stopped: return "stopped";
    }
    return "unknown";
}

bool AcquisitionLoop::start() {
    if (state_ == State::Failed) {
        log_error("acquisition: loop failed earlier, restart the process");
        return false;
    }
    if (run_) return true;
    if (th_.joinable()) th_.join();
    run_ = true;
    state_ = State::Running;
    th_ = std::thread(&AcquisitionLoop::thread_fn, this);
    log_info("acquisition: started at %d fps target", config_.fps);
    return true;
}

void AcquisitionLoop::stop() {
    run_ = false;
    if (th_.joinable()) th_.join();
    if (state_ == State::Running) state_ = State::Stopped;
}

bool AcquisitionLoop::cycle_failed(const std::string& err) {
    int n = ++failures_;
    if (n == 1 || n % config_.fps == 0)
        log_warn("acquisition: source unavailable (%d/%d): %s", n, config_.max_failures, err.c_str());
    if (n >= config_.max_failures) {
        state_ = State::Failed;
        log_error("acquisition: %d consecutive capture failures, giving up", n);
    }
    return false;
}

bool AcquisitionLoop::run_cycle() {
    Frame frame;
    std::string err;
    bool ok;
    {
        std::lock_guard<std::mutex> lk(source_m_);
        ok = source_.capture(frame, err);
    }
    if (!ok || frame.empty()) return cycle_failed(err.empty() ? "empty frame" : err);

    // A frame the detector rejects counts as a failed capture
    frame.sequence = next_sequence_;
    MotionState motion;
    if (!detector_.analyze(frame, motion, err)) return cycle_failed(err);
    failures_ = 0;
    next_sequence_++;

    bool transitioned = motion.detected != last_detected_;
    last_detected_ = motion.detected;

    if (hub_.publish(std::move(frame), motion)) published_++;

    if (transitioned) {
        if (motion.detected) log_info("Motion detected at %s", now_timestamp().c_str());
        else                 log_info("Motion cleared at %s", now_timestamp().c_str());
        device_.on_motion_transition(motion.detected);
    }
    return true;
}

bool AcquisitionLoop::capture_snapshot(Frame& out, std::string& err) {
    std::lock_guard<std::mutex> lk(source_m_);
    if (!source_.capture(out, err)) return false;
    if (out.empty()) { err = "empty frame"; return false; }
    return true;
}

void AcquisitionLoop::thread_fn() {
    using clock = std::chrono::steady_clock;
    const auto period = std::chrono::microseconds(1000000 / config_.fps);
    auto next_tick = clock::now();

    while (run_) {
        if (!run_cycle()) {
            if (state_ == State::Failed) break;
            // short sleep on read failure to avoid busy loop
            std::this_thread::sleep_for(config_.retry_delay);
            next_tick = clock::now();
            continue;
        }

        // maintain target fps; an overrun cycle just makes the loop slower
        next_tick += period;
        auto now = clock::now();
        if (next_tick > now) std::this_thread::sleep_until(next_tick);
        else next_tick = now;
    }
    run_ = false;
}
