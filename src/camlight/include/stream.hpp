#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "config.hpp"
#include "frame_hub.hpp"

struct PreviewConfig {
    int width  = cfg::PREVIEW_WIDTH;
    int height = cfg::PREVIEW_HEIGHT;
    int jpeg_quality = cfg::JPEG_QUALITY;
    std::chrono::milliseconds wait{cfg::STREAM_WAIT_MS};
};

bool encode_jpeg(const cv::Mat& img, std::vector<unsigned char>& out, int quality, std::string& err);

// Downscale to the preview size and JPEG-encode.
bool encode_preview(const Frame& frame, const PreviewConfig& config,
                    std::vector<unsigned char>& out, std::string& err);

// One self-delimited multipart unit:
// --frame\r\nContent-Type: image/jpeg\r\nContent-Length: N\r\n\r\n<jpeg>\r\n
void append_multipart(std::vector<unsigned char>& out, const std::vector<unsigned char>& jpeg);

struct StreamUnit {
    uint64_t sequence = 0;
    std::vector<unsigned char> bytes;   // multipart unit
};

class StreamMultiplexer;

// One viewer's lazy, infinite sequence of preview units. Each session reads
// the hub at its own pace; frames published while it was busy are skipped.
class StreamSession {
public:
    using Encoder = std::function<bool(const Frame&, std::vector<unsigned char>&, std::string&)>;

    ~StreamSession();
    StreamSession(const StreamSession&) = delete;
    StreamSession& operator=(const StreamSession&) = delete;

    // Next unit for a frame newer than the last one delivered. Returns false
    // if none could be produced within the configured wait.
    bool next(StreamUnit& unit);

    uint64_t last_sequence() const { return last_sequence_; }
    size_t skipped() const { return skipped_; }

private:
    friend class StreamMultiplexer;
    StreamSession(StreamMultiplexer& mux, Encoder encoder);

    StreamMultiplexer& mux_;
    Encoder encoder_;
    uint64_t last_sequence_ = 0;
    size_t skipped_ = 0;
};

class StreamMultiplexer {
public:
    explicit StreamMultiplexer(const FrameHub& hub, const PreviewConfig& config = PreviewConfig());

    // An empty encoder means encode_preview with this multiplexer's config.
    std::unique_ptr<StreamSession> open_session(StreamSession::Encoder encoder = nullptr);

    // Single preview JPEG of the latest frame.
    bool live_preview_frame(std::vector<unsigned char>& jpeg, std::string& err) const;

    int viewers() const { return viewers_.load(); }
    const PreviewConfig& config() const { return config_; }

    static constexpr const char* BOUNDARY = "frame";

private:
    friend class StreamSession;

    const FrameHub& hub_;
    PreviewConfig config_;
    std::atomic<int> viewers_{0};
};
