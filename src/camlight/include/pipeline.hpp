#pragma once
#include <string>
#include <vector>
#include "acquisition_loop.hpp"
#include "capabilities.hpp"
#include "device_controller.hpp"
#include "frame_hub.hpp"
#include "motion.hpp"
#include "notify.hpp"
#include "stream.hpp"

struct PipelineConfig {
    MotionConfig motion;
    AcquisitionConfig acquisition;
    DeviceConfig device;
    PreviewConfig preview;
    int snapshot_quality = 95;
    std::chrono::milliseconds led_refresh{cfg::LED_REFRESH_MS};
};

// Owns the shared state objects and the long-lived threads, and exposes the
// operations the HTTP layer translates requests into.
class CamPipeline {
public:
    CamPipeline(FrameSource& source, OutputDevice& device, Notifier& notifier,
                const PipelineConfig& config = PipelineConfig());
    ~CamPipeline();

    CamPipeline(const CamPipeline&) = delete;
    CamPipeline& operator=(const CamPipeline&) = delete;

    bool start();
    void stop();

    bool live_preview_frame(std::vector<unsigned char>& jpeg, std::string& err) const;
    std::unique_ptr<StreamSession> open_stream() { return mux_.open_session(); }
    MotionState motion_status() const { return hub_.read_motion(); }

    // Full-resolution JPEG; flashes the light and sends it as a notification.
    bool capture_snapshot(std::vector<unsigned char>& jpeg, std::string& err);

    DeviceState set_device_color(int red, int green, int blue);
    DeviceState turn_device_off();
    bool toggle_auto_mode();
    DeviceState device_state() const { return device_.state(); }

    AcquisitionLoop::State loop_state() const { return loop_.state(); }
    int viewers() const { return mux_.viewers(); }

    FrameHub& hub() { return hub_; }
    AcquisitionLoop& loop() { return loop_; }
    DeviceController& device() { return device_; }
    NotifyDispatcher& notifications() { return notify_; }

private:
    PipelineConfig config_;
    FrameHub hub_;
    MotionDetector detector_;
    NotifyDispatcher notify_;
    DeviceController device_;
    DeviceRefresher refresher_;
    AcquisitionLoop loop_;
    StreamMultiplexer mux_;
};
