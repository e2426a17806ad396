#include "pipeline.hpp"
#include "utils.hpp"
#include <utility>

CamPipeline::CamPipeline(FrameSource& source, OutputDevice& device, Notifier& notifier,
                         const PipelineConfig& config)
    : config_(config),
      detector_(config.motion),
      notify_(notifier),
      device_(device, notify_, config.device),
      refresher_(device_, config.led_refresh),
      loop_(source, detector_, hub_, device_, config.acquisition),
      mux_(hub_, config.preview) {}

CamPipeline::~CamPipeline() {
    stop();
}

bool CamPipeline::start() {
    notify_.start();
    refresher_.start();
    if (!loop_.start()) {
        log_error("pipeline: acquisition loop did not start");
        return false;
    }
    return true;
}

void CamPipeline::stop() {
    loop_.stop();
    refresher_.stop();
    notify_.stop();
}

bool CamPipeline::live_preview_frame(std::vector<unsigned char>& jpeg, std::string& err) const {
    return mux_.live_preview_frame(jpeg, err);
}

bool CamPipeline::capture_snapshot(std::vector<unsigned char>& jpeg, std::string& err) {
    Frame frame;
    std::string cap_err;
    if (!loop_.capture_snapshot(frame, cap_err)) {
        // Fall back to the last published full-resolution frame
        FrameHub::PublishedPtr latest = hub_.read_latest();
        if (!latest) {
            err = "No frame available";
            return false;
        }
        log_warn("snapshot: capture failed (%s), using frame %llu", cap_err.c_str(),
                 (unsigned long long)latest->frame.sequence);
        frame = latest->frame;
    }

    PreviewConfig full;
    full.width = 0;
    full.height = 0;
    full.jpeg_quality = config_.snapshot_quality;
    if (!encode_preview(frame, full, jpeg, err)) return false;

    device_.flash();

    DeviceState st = device_.state();
    std::string ts = now_timestamp_filename();
    Notification n;
    n.title = "Pi Cam Snapshot";
    n.auto_mode = st.auto_mode;
    n.message = "Snapshot captured at " + ts + ".\nLED: " + color_name(st.command.output()) +
                "\nAuto LED: " + (st.auto_mode ? "Enabled" : "Disabled");
    n.attachment = jpeg;
    notify_.post(std::move(n));

    log_info("snapshot: %dx%d, %zu bytes", frame.width(), frame.height(), jpeg.size());
    return true;
}

DeviceState CamPipeline::set_device_color(int red, int green, int blue) {
    return device_.set_color(clamp_rgb(red, green, blue));
}

DeviceState CamPipeline::turn_device_off() {
    return device_.turn_off();
}

bool CamPipeline::toggle_auto_mode() {
    return device_.toggle_auto_mode();
}
