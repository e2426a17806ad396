#include "frame_hub.hpp"
#include "utils.hpp"
#include <utility>

bool FrameHub::publish(Frame frame, const MotionState& motion) {
    if (frame.sequence != motion.sequence) {
        log_error("FrameHub: motion state for frame %llu paired with frame %llu, dropped",
                  (unsigned long long)motion.sequence, (unsigned long long)frame.sequence);
        return false;
    }
    // Build outside the lock; the critical section is a pointer swap
    auto next = std::make_shared<const Published>(Published{std::move(frame), motion});
    PublishedPtr old;
    {
        std::lock_guard<std::mutex> lk(m_);
        old = std::move(latest_);
        latest_ = std::move(next);
    }
    cv_.notify_all();
    // `old` is released here, outside the lock
    return true;
}

FrameHub::PublishedPtr FrameHub::read_latest() const {
    std::lock_guard<std::mutex> lk(m_);
    return latest_;
}

MotionState FrameHub::read_motion() const {
    std::lock_guard<std::mutex> lk(m_);
    return latest_ ? latest_->motion : MotionState{};
}

uint64_t FrameHub::latest_sequence() const {
    std::lock_guard<std::mutex> lk(m_);
    return latest_ ? latest_->frame.sequence : 0;
}

FrameHub::PublishedPtr FrameHub::wait_newer(uint64_t after_sequence,
                                            std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lk(m_);
    cv_.wait_for(lk, timeout, [&] {
        return latest_ && latest_->frame.sequence > after_sequence;
    });
    return latest_;
}
