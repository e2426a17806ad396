#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include "frame.hpp"

// Single-writer / multi-reader holder of the latest frame and its motion
// state. Readers get an immutable (frame, motion) pair by shared_ptr and do
// their work outside the lock; publish() only swaps a pointer.
class FrameHub {
public:
    struct Published {
        Frame frame;
        MotionState motion;
    };
    using PublishedPtr = std::shared_ptr<const Published>;

    // Producer only. Rejects a motion state computed from another frame.
    bool publish(Frame frame, const MotionState& motion);

    // nullptr until the first publish
    PublishedPtr read_latest() const;
    MotionState read_motion() const;
    uint64_t latest_sequence() const;

    // Blocks until a frame newer than after_sequence is published or the
    // timeout expires; returns the latest pair either way (may be stale or null).
    PublishedPtr wait_newer(uint64_t after_sequence, std::chrono::milliseconds timeout) const;

private:
    mutable std::mutex m_;
    mutable std::condition_variable cv_;
    PublishedPtr latest_;
};
