#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "frame_hub.hpp"

namespace {

Frame make_frame(uint64_t seq) {
    Frame f;
    f.image = cv::Mat(8, 8, CV_8UC1, cv::Scalar((double)(seq % 256)));
    f.format = PixelFormat::Gray8;
    f.sequence = seq;
    return f;
}

MotionState make_motion(uint64_t seq) {
    return MotionState{seq % 2 == 1, seq};
}

} // namespace

class FrameHubTests : public ::testing::Test {
    protected:
        FrameHub hub;
};

TEST_F(FrameHubTests, NothingAvailableBeforeFirstPublish) {
    ASSERT_EQ(hub.read_latest(), nullptr);
    ASSERT_FALSE(hub.read_motion().detected);
    ASSERT_EQ(hub.read_motion().sequence, 0u);
    ASSERT_EQ(hub.latest_sequence(), 0u);
}

TEST_F(FrameHubTests, ReadReturnsLastPublishedPair) {
    ASSERT_TRUE(hub.publish(make_frame(1), make_motion(1)));
    ASSERT_TRUE(hub.publish(make_frame(2), make_motion(2)));

    auto p = hub.read_latest();
    ASSERT_NE(p, nullptr);
    ASSERT_EQ(p->frame.sequence, 2u);
    ASSERT_EQ(p->motion.sequence, 2u);
    ASSERT_FALSE(p->motion.detected);
    ASSERT_EQ(hub.read_motion().sequence, 2u);
}

TEST_F(FrameHubTests, MismatchedMotionStateIsRejected) {
    ASSERT_TRUE(hub.publish(make_frame(1), make_motion(1)));
    ASSERT_FALSE(hub.publish(make_frame(2), make_motion(1)));
    ASSERT_EQ(hub.latest_sequence(), 1u);
}

TEST_F(FrameHubTests, HeldPairIsUnaffectedByLaterPublishes) {
    hub.publish(make_frame(1), make_motion(1));
    auto held = hub.read_latest();
    for (uint64_t s = 2; s < 50; s++) hub.publish(make_frame(s), make_motion(s));

    ASSERT_EQ(held->frame.sequence, 1u);
    ASSERT_EQ(held->frame.image.at<uchar>(0, 0), 1);
    ASSERT_EQ(hub.latest_sequence(), 49u);
}

TEST_F(FrameHubTests, WaitNewerTimesOutWithoutPublish) {
    hub.publish(make_frame(3), make_motion(3));
    auto start = std::chrono::steady_clock::now();
    auto p = hub.wait_newer(3, std::chrono::milliseconds(50));
    auto waited = std::chrono::steady_clock::now() - start;

    ASSERT_NE(p, nullptr);
    ASSERT_EQ(p->frame.sequence, 3u);
    ASSERT_GE(waited, std::chrono::milliseconds(40));
}

TEST_F(FrameHubTests, WaitNewerWakesOnPublish) {
    std::thread producer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        hub.publish(make_frame(1), make_motion(1));
    });
    auto p = hub.wait_newer(0, std::chrono::seconds(5));
    producer.join();
    ASSERT_NE(p, nullptr);
    ASSERT_EQ(p->frame.sequence, 1u);
}

TEST_F(FrameHubTests, ConcurrentReadersNeverSeeTornPairs) {
    constexpr uint64_t kFrames = 5000;
    constexpr int kReaders = 8;
    std::atomic<bool> done{false};
    std::atomic<int> torn{0};
    std::atomic<int> regressions{0};

    std::vector<std::thread> readers;
    for (int r = 0; r < kReaders; r++) {
        readers.emplace_back([&] {
            uint64_t last = 0;
            while (!done) {
                auto p = hub.read_latest();
                if (!p) continue;
                const uint64_t seq = p->frame.sequence;
                if (p->motion.sequence != seq ||
                    p->motion.detected != (seq % 2 == 1) ||
                    p->frame.image.at<uchar>(0, 0) != seq % 256) {
                    torn++;
                }
                if (seq < last) regressions++;
                last = seq;
            }
        });
    }

    for (uint64_t s = 1; s <= kFrames; s++) {
        EXPECT_TRUE(hub.publish(make_frame(s), make_motion(s)));
    }
    done = true;
    for (auto& t : readers) t.join();

    ASSERT_EQ(torn.load(), 0);
    ASSERT_EQ(regressions.load(), 0);
    ASSERT_EQ(hub.latest_sequence(), kFrames);
}
