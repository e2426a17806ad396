#include "camera.hpp"
#include "config.hpp"
#include "http_server.hpp"
#include "led.hpp"
#include "notify.hpp"
#include "pipeline.hpp"
#include "routes.hpp"
#include "utils.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <thread>
#include <utility>

static std::atomic<bool> g_stop{false};

static void on_signal(int) { g_stop = true; }

static void usage(const char* argv0) {
    fprintf(stderr,
            "usage: %s [--camera INDEX] [--pipeline GST] [--libcamera] [--port N] [--no-led]\n",
            argv0);
}

int main(int argc, char** argv){
    CameraConfig cam_cfg;
    HttpServerConfig http_cfg;
    bool use_led = true;

    for (int i = 1; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--camera" && i + 1 < argc) cam_cfg.index = atoi(argv[++i]);
        else if (a == "--pipeline" && i + 1 < argc) cam_cfg.pipeline = argv[++i];
        else if (a == "--libcamera") cam_cfg.pipeline = libcamera_pipeline(cam_cfg.width, cam_cfg.height, cam_cfg.fps);
        else if (a == "--port" && i + 1 < argc) http_cfg.port = atoi(argv[++i]);
        else if (a == "--no-led") use_led = false;
        else { usage(argv[0]); return 2; }
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    std::string err;
    OpenCvFrameSource camera(cam_cfg);
    if (!camera.open(err)) {
        log_error("Failed to open camera: %s", err.c_str());
        return 1;
    }

    std::unique_ptr<OutputDevice> led;
    if (use_led) {
        auto pwm = std::make_unique<PwmRgbLed>();
        if (!pwm->init(err)) {
            log_error("Failed to init LED: %s", err.c_str());
            return 1;
        }
        led = std::move(pwm);
    } else {
        led = std::make_unique<LogOutputDevice>();
    }

    LogNotifier notifier;
    CamPipeline pipeline(camera, *led, notifier);
    if (!pipeline.start()) {
        log_error("Failed to start camera pipeline");
        return 1;
    }

    HttpServer srv(http_cfg);
    register_routes(srv, pipeline);
    if (!srv.start()) {
        log_error("Failed to start HTTP server");
        pipeline.stop();
        return 1;
    }
    log_info("Open http://<pi-ip>:%d/", http_cfg.port);

    int rc = 0;
    while (!g_stop) {
        if (pipeline.loop_state() == AcquisitionLoop::State::Failed) {
            log_error("camera lost, exiting for restart");
            rc = 1;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    srv.stop();
    pipeline.stop();
    return rc;
}
