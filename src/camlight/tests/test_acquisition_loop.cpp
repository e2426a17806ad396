#include <gtest/gtest.h>
#include <chrono>
#include <thread>

#include "acquisition_loop.hpp"
#include "mocks/mock_capabilities.hpp"

using namespace std::chrono_literals;
using mocks::solid;
using mocks::with_square;

class AcquisitionLoopTests : public ::testing::Test {
    protected:
        static MotionConfig motion_config() {
            MotionConfig c;
            c.width = 0;
            c.height = 0;
            c.blur = 0;
            c.minChange = 0.01;
            c.referenceInterval = 1000;
            return c;
        }
        static AcquisitionConfig loop_config() {
            AcquisitionConfig c;
            c.fps = 60;
            c.max_failures = 5;
            c.retry_delay = 1ms;
            return c;
        }

        void SetUp() override { dispatcher.start(); }
        void TearDown() override { dispatcher.stop(); }

        mocks::MockFrameSource source;
        mocks::MockOutputDevice device;
        mocks::MockNotifier notifier;
        NotifyDispatcher dispatcher{notifier};
        DeviceController controller{device, dispatcher};
        MotionDetector detector{motion_config()};
        FrameHub hub;
        AcquisitionLoop loop{source, detector, hub, controller, loop_config()};
};

TEST_F(AcquisitionLoopTests, CyclePublishesFrameAndMotionTogether) {
    source.push(solid(64, 48, 30));
    ASSERT_TRUE(loop.run_cycle());

    auto p = hub.read_latest();
    ASSERT_NE(p, nullptr);
    ASSERT_EQ(p->frame.sequence, 1u);
    ASSERT_EQ(p->motion.sequence, 1u);
    ASSERT_FALSE(p->motion.detected);
    ASSERT_EQ(p->frame.width(), 64);
    ASSERT_EQ(p->frame.height(), 48);
    ASSERT_EQ(p->frame.format, PixelFormat::Bgr888);
}

TEST_F(AcquisitionLoopTests, SequenceNumbersIncrease) {
    source.push(solid(32, 32, 30));
    for (int i = 0; i < 5; i++) ASSERT_TRUE(loop.run_cycle());
    ASSERT_EQ(hub.latest_sequence(), 5u);
    ASSERT_EQ(loop.frames_published(), 5u);
}

TEST_F(AcquisitionLoopTests, MotionTransitionsDriveTheDevice) {
    source.push(solid(100, 100, 40));
    source.push(with_square(100, 100, 40, 20, 20, 30));
    source.push(with_square(100, 100, 40, 20, 20, 30));
    source.push(solid(100, 100, 40));

    ASSERT_TRUE(loop.run_cycle());   // seeds the reference
    ASSERT_EQ(device.attempts(), 0u);

    ASSERT_TRUE(loop.run_cycle());   // motion starts
    ASSERT_TRUE(hub.read_motion().detected);
    ASSERT_EQ(controller.state().command.kind, DeviceCommand::Kind::Color);

    ASSERT_TRUE(loop.run_cycle());   // still moving, no new transition
    ASSERT_EQ(device.attempts(), 1u);

    ASSERT_TRUE(loop.run_cycle());   // motion clears
    ASSERT_FALSE(hub.read_motion().detected);
    ASSERT_EQ(controller.state().command.kind, DeviceCommand::Kind::Off);

    ASSERT_TRUE(dispatcher.wait_idle(2s));
    auto sent = notifier.sent();
    ASSERT_EQ(sent.size(), 2u);
    ASSERT_TRUE(sent[0].auto_mode);
    ASSERT_TRUE(sent[1].auto_mode);
}

TEST_F(AcquisitionLoopTests, CaptureFailureIsRetriedNextCycle) {
    source.push(solid(32, 32, 30));
    source.fail_next(2);

    ASSERT_FALSE(loop.run_cycle());
    ASSERT_FALSE(loop.run_cycle());
    ASSERT_EQ(loop.consecutive_failures(), 2);
    ASSERT_NE(loop.state(), AcquisitionLoop::State::Failed);
    ASSERT_EQ(hub.read_latest(), nullptr);

    ASSERT_TRUE(loop.run_cycle());
    ASSERT_EQ(loop.consecutive_failures(), 0);
    ASSERT_EQ(hub.latest_sequence(), 1u);
}

TEST_F(AcquisitionLoopTests, ExhaustedRetriesAreTerminal) {
    source.fail_always(true);
    ASSERT_TRUE(loop.start());
    for (int i = 0; i < 200 && loop.state() != AcquisitionLoop::State::Failed; i++)
        std::this_thread::sleep_for(5ms);

    ASSERT_EQ(loop.state(), AcquisitionLoop::State::Failed);
    ASSERT_EQ(loop.consecutive_failures(), 5);
    ASSERT_FALSE(loop.start());
    loop.stop();
    ASSERT_EQ(loop.state(), AcquisitionLoop::State::Failed);
}

TEST_F(AcquisitionLoopTests, BackgroundThreadPublishesUntilStopped) {
    source.push(solid(32, 32, 30));
    ASSERT_TRUE(loop.start());
    ASSERT_EQ(loop.state(), AcquisitionLoop::State::Running);
    std::this_thread::sleep_for(200ms);
    loop.stop();

    uint64_t published = loop.frames_published();
    ASSERT_GE(published, 3u);
    ASSERT_LE(published, 40u);   // paced near 60 Hz, not free-running
    ASSERT_EQ(loop.state(), AcquisitionLoop::State::Stopped);
    ASSERT_EQ(hub.latest_sequence(), published);
}

TEST_F(AcquisitionLoopTests, SnapshotAndLoopNeverCaptureConcurrently) {
    source.push(solid(32, 32, 30));
    source.set_delay(2ms);
    ASSERT_TRUE(loop.start());

    int ok = 0;
    for (int i = 0; i < 20; i++) {
        Frame f;
        std::string err;
        if (loop.capture_snapshot(f, err)) ok++;
    }
    loop.stop();

    ASSERT_EQ(ok, 20);
    ASSERT_FALSE(source.overlapped());
    ASSERT_GT(loop.frames_published(), 0u);
}

TEST_F(AcquisitionLoopTests, UnanalyzableFrameCountsAsCaptureFailure) {
    // Two-channel frames (YUYV and friends) cannot be reduced to gray
    source.push(cv::Mat(48, 64, CV_8UC2, cv::Scalar(30, 30)));
    source.push(solid(64, 48, 30));

    ASSERT_FALSE(loop.run_cycle());
    ASSERT_EQ(loop.consecutive_failures(), 1);
    ASSERT_EQ(loop.frames_published(), 0u);
    ASSERT_EQ(hub.read_latest(), nullptr);

    ASSERT_TRUE(loop.run_cycle());
    ASSERT_EQ(loop.consecutive_failures(), 0);
    ASSERT_EQ(hub.latest_sequence(), 1u);   // the rejected frame consumed no sequence
    ASSERT_EQ(loop.frames_published(), 1u);
}

TEST_F(AcquisitionLoopTests, RunningLoopSurvivesUnanalyzableFrames) {
    source.push(cv::Mat(48, 64, CV_8UC2, cv::Scalar(0, 0)));
    ASSERT_TRUE(loop.start());
    for (int i = 0; i < 200 && loop.state() == AcquisitionLoop::State::Running; i++)
        std::this_thread::sleep_for(5ms);
    ASSERT_EQ(loop.state(), AcquisitionLoop::State::Failed);
    ASSERT_EQ(loop.frames_published(), 0u);
    loop.stop();
}
