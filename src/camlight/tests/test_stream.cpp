#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <cstring>
#include <string>
#include <thread>
#include <vector>
#include <opencv2/imgcodecs.hpp>

#include "stream.hpp"
#include "mocks/mock_capabilities.hpp"

using namespace std::chrono_literals;

class StreamMultiplexerTests : public ::testing::Test {
    protected:
        static PreviewConfig preview_config() {
            PreviewConfig c;
            c.width = 32;
            c.height = 24;
            c.jpeg_quality = 70;
            c.wait = 100ms;
            return c;
        }

        void publish(uint64_t seq) {
            Frame f;
            f.image = mocks::with_square(64, 48, 40, (int)(seq % 30), 4, 10);
            f.format = PixelFormat::Bgr888;
            f.sequence = seq;
            hub.publish(std::move(f), MotionState{false, seq});
        }

        FrameHub hub;
        StreamMultiplexer mux{hub, preview_config()};
};

TEST_F(StreamMultiplexerTests, UnitIsSelfDelimitedJpeg) {
    publish(1);
    auto session = mux.open_session();
    StreamUnit unit;
    ASSERT_TRUE(session->next(unit));
    ASSERT_EQ(unit.sequence, 1u);

    std::string text(unit.bytes.begin(), unit.bytes.end());
    const std::string prefix = "--frame\r\nContent-Type: image/jpeg\r\nContent-Length: ";
    ASSERT_EQ(text.compare(0, prefix.size(), prefix), 0);

    size_t header_end = text.find("\r\n\r\n");
    ASSERT_NE(header_end, std::string::npos);
    size_t length = std::stoul(text.substr(prefix.size(), header_end - prefix.size()));
    size_t body = header_end + 4;
    ASSERT_EQ(unit.bytes.size(), body + length + 2);
    ASSERT_EQ(unit.bytes[body], 0xFF);
    ASSERT_EQ(unit.bytes[body + 1], 0xD8);
    ASSERT_EQ(text.substr(text.size() - 2), "\r\n");

    std::vector<unsigned char> jpeg(unit.bytes.begin() + body, unit.bytes.begin() + body + length);
    cv::Mat decoded = cv::imdecode(jpeg, cv::IMREAD_COLOR);
    ASSERT_EQ(decoded.cols, 32);
    ASSERT_EQ(decoded.rows, 24);
}

TEST_F(StreamMultiplexerTests, NextWaitsForANewerFrame) {
    publish(1);
    auto session = mux.open_session();
    StreamUnit unit;
    ASSERT_TRUE(session->next(unit));
    ASSERT_FALSE(session->next(unit));

    std::thread producer([&] {
        std::this_thread::sleep_for(20ms);
        publish(2);
    });
    bool got = session->next(unit);
    producer.join();
    ASSERT_TRUE(got);
    ASSERT_EQ(unit.sequence, 2u);
}

TEST_F(StreamMultiplexerTests, SlowViewerSkipsToLatest) {
    auto session = mux.open_session();
    for (uint64_t s = 1; s <= 5; s++) publish(s);
    StreamUnit unit;
    ASSERT_TRUE(session->next(unit));
    ASSERT_EQ(unit.sequence, 5u);
}

TEST_F(StreamMultiplexerTests, EncodeFailureOnlyAffectsThatViewer) {
    auto healthy = mux.open_session();
    auto flaky = mux.open_session(
        [](const Frame& f, std::vector<unsigned char>& out, std::string& err) {
            if (f.sequence == 2) { err = "simulated encoder fault"; return false; }
            out.assign({0xFF, 0xD8, 0xFF, 0xD9});
            return true;
        });
    StreamUnit unit;

    publish(1);
    ASSERT_TRUE(healthy->next(unit));
    ASSERT_TRUE(flaky->next(unit));

    publish(2);
    ASSERT_TRUE(healthy->next(unit));
    ASSERT_EQ(unit.sequence, 2u);
    ASSERT_FALSE(flaky->next(unit));
    ASSERT_EQ(flaky->skipped(), 1u);
    ASSERT_EQ(healthy->skipped(), 0u);

    publish(3);
    ASSERT_TRUE(flaky->next(unit));
    ASSERT_EQ(unit.sequence, 3u);
    ASSERT_TRUE(healthy->next(unit));
    ASSERT_EQ(unit.sequence, 3u);
}

TEST_F(StreamMultiplexerTests, CountsActiveViewers) {
    ASSERT_EQ(mux.viewers(), 0);
    {
        auto a = mux.open_session();
        auto b = mux.open_session();
        ASSERT_EQ(mux.viewers(), 2);
    }
    ASSERT_EQ(mux.viewers(), 0);
}

TEST_F(StreamMultiplexerTests, LivePreviewFrame) {
    std::vector<unsigned char> jpeg;
    std::string err;
    ASSERT_FALSE(mux.live_preview_frame(jpeg, err));
    ASSERT_FALSE(err.empty());

    publish(1);
    ASSERT_TRUE(mux.live_preview_frame(jpeg, err));
    cv::Mat decoded = cv::imdecode(jpeg, cv::IMREAD_COLOR);
    ASSERT_EQ(decoded.cols, 32);
    ASSERT_EQ(decoded.rows, 24);
}

TEST_F(StreamMultiplexerTests, TenViewersDoNotHoldBackA60HzProducer) {
    constexpr int kViewers = 10;
    constexpr uint64_t kFrames = 120;
    std::atomic<bool> done{false};
    std::atomic<int> regressions{0};
    std::vector<int> received(kViewers, 0);

    std::vector<std::thread> viewers;
    for (int v = 0; v < kViewers; v++) {
        viewers.emplace_back([&, v] {
            auto session = mux.open_session();
            StreamUnit unit;
            uint64_t last = 0;
            while (!done) {
                if (!session->next(unit)) continue;
                if (unit.sequence < last) regressions++;
                last = unit.sequence;
                received[v]++;
                // viewers run at different speeds
                std::this_thread::sleep_for(std::chrono::milliseconds(v * 3));
            }
        });
    }

    auto worst = std::chrono::steady_clock::duration::zero();
    for (uint64_t s = 1; s <= kFrames; s++) {
        auto t0 = std::chrono::steady_clock::now();
        publish(s);
        auto took = std::chrono::steady_clock::now() - t0;
        if (took > worst) worst = took;
        std::this_thread::sleep_for(16ms);
    }
    done = true;
    for (auto& t : viewers) t.join();

    EXPECT_EQ(regressions.load(), 0);
    EXPECT_LT(worst, 20ms);
    for (int v = 0; v < kViewers; v++) EXPECT_GT(received[v], 0) << "viewer " << v;
}
