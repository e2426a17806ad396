#include "stream.hpp"
#include "utils.hpp"
#include <cstdio>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <utility>

bool encode_jpeg(const cv::Mat& img, std::vector<unsigned char>& out, int quality, std::string& err) {
    std::vector<int> p = {cv::IMWRITE_JPEG_QUALITY, quality};
    try {
        if (!cv::imencode(".jpg", img, out, p)) {
            err = "imencode failed";
            return false;
        }
    } catch (const cv::Exception& e) {
        err = e.what();
        return false;
    }
    return true;
}

bool encode_preview(const Frame& frame, const PreviewConfig& config,
                    std::vector<unsigned char>& out, std::string& err) {
    if (frame.empty()) { err = "empty frame"; return false; }
    try {
        cv::Mat img = frame.image;
        if (config.width > 0 && config.height > 0 &&
            (img.cols != config.width || img.rows != config.height)) {
            cv::resize(frame.image, img, cv::Size(config.width, config.height), 0, 0, cv::INTER_AREA);
        }
        if (frame.format == PixelFormat::Bgra8888) {
            cv::Mat bgr;
            cv::cvtColor(img, bgr, cv::COLOR_BGRA2BGR);
            img = bgr;
        }
        return encode_jpeg(img, out, config.jpeg_quality, err);
    } catch (const cv::Exception& e) {
        err = e.what();
        return false;
    }
}

void append_multipart(std::vector<unsigned char>& out, const std::vector<unsigned char>& jpeg) {
    char head[128];
    int n = snprintf(head, sizeof(head),
                     "--%s\r\nContent-Type: image/jpeg\r\nContent-Length: %zu\r\n\r\n",
                     StreamMultiplexer::BOUNDARY, jpeg.size());
    out.insert(out.end(), head, head + n);
    out.insert(out.end(), jpeg.begin(), jpeg.end());
    static const char crlf[2] = {'\r', '\n'};
    out.insert(out.end(), crlf, crlf + 2);
}

StreamSession::StreamSession(StreamMultiplexer& mux, Encoder encoder)
    : mux_(mux), encoder_(std::move(encoder)) {
    int n = ++mux_.viewers_;
    log_info("stream: viewer joined (%d active)", n);
}

StreamSession::~StreamSession() {
    int n = --mux_.viewers_;
    log_info("stream: viewer left (%d active)", n);
}

bool StreamSession::next(StreamUnit& unit) {
    const auto deadline = std::chrono::steady_clock::now() + mux_.config_.wait;
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) return false;

        FrameHub::PublishedPtr latest = mux_.hub_.wait_newer(last_sequence_, remaining);
        if (!latest || latest->frame.sequence <= last_sequence_) return false;
        last_sequence_ = latest->frame.sequence;

        std::vector<unsigned char> jpeg;
        std::string err;
        if (!encoder_(latest->frame, jpeg, err)) {
            // Skip this frame for this viewer only
            skipped_++;
            log_warn("stream: frame %llu not encoded: %s",
                     (unsigned long long)latest->frame.sequence, err.c_str());
            continue;
        }

        unit.sequence = latest->frame.sequence;
        unit.bytes.clear();
        unit.bytes.reserve(jpeg.size() + 96);
        append_multipart(unit.bytes, jpeg);
        return true;
    }
}

StreamMultiplexer::StreamMultiplexer(const FrameHub& hub, const PreviewConfig& config)
    : hub_(hub), config_(config) {}

std::unique_ptr<StreamSession> StreamMultiplexer::open_session(StreamSession::Encoder encoder) {
    if (!encoder) {
        PreviewConfig pc = config_;
        encoder = [pc](const Frame& f, std::vector<unsigned char>& out, std::string& err) {
            return encode_preview(f, pc, out, err);
        };
    }
    return std::unique_ptr<StreamSession>(new StreamSession(*this, std::move(encoder)));
}

bool StreamMultiplexer::live_preview_frame(std::vector<unsigned char>& jpeg, std::string& err) const {
    FrameHub::PublishedPtr latest = hub_.read_latest();
    if (!latest) { err = "no frame available yet"; return false; }
    return encode_preview(latest->frame, config_, jpeg, err);
}
