#pragma once
#include <cstddef>
#include <string>

namespace cfg {
// Network
inline constexpr int SERVER_PORT = 5000;
inline constexpr int HTTP_BACKLOG = 16;
inline constexpr size_t HTTP_MAX_HEADER_BYTES = 64 * 1024;
inline constexpr size_t HTTP_MAX_BODY_BYTES   = 16 * 1024; // form posts only
inline constexpr int HTTP_DRAIN_TIMEOUT_S = 3;

// Camera (full resolution, used for snapshots and motion)
inline constexpr int CAM_INDEX  = 0;
inline constexpr int CAM_WIDTH  = 1920;
inline constexpr int CAM_HEIGHT = 1080;
inline constexpr int CAM_FPS    = 60;   // acquisition loop target cadence

// Live preview
inline constexpr int PREVIEW_WIDTH  = 1280;
inline constexpr int PREVIEW_HEIGHT = 720;
inline constexpr int JPEG_QUALITY   = 80;
inline constexpr int STREAM_WAIT_MS = 500; // max wait for a newer frame per unit

// Motion detection
inline constexpr int    MOTION_WIDTH       = 480;   // analysis size, 0 = full frame
inline constexpr int    MOTION_HEIGHT      = 270;
inline constexpr int    MOTION_BLUR        = 5;     // gaussian kernel, 0 = off
inline constexpr double MOTION_THRESH      = 25.0;  // per-pixel intensity delta
inline constexpr double MOTION_MIN_CHANGE  = 0.0025; // ~5000 px of a 1080p frame
inline constexpr int    REFERENCE_INTERVAL = 30;    // cycles between reference refreshes

// Acquisition
inline constexpr int MAX_CAPTURE_FAILURES = 300; // ~5s of consecutive failures at 60Hz
inline constexpr int CAPTURE_RETRY_MS     = 10;

// LED (percent intensities)
inline constexpr int MOTION_COLOR_R = 0;
inline constexpr int MOTION_COLOR_G = 0;
inline constexpr int MOTION_COLOR_B = 100;
inline constexpr bool DEFAULT_AUTO_MODE = true;
inline constexpr int LED_REFRESH_MS = 100;
inline constexpr int FLASH_MS       = 2000;
inline constexpr int LED_FAILURE_LOG_EVERY = 50; // ~5s of refresh retries

// sysfs PWM channels for the common-anode RGB LED
inline const std::string PWM_CHIP = "/sys/class/pwm/pwmchip0";
inline constexpr int PWM_RED      = 0;
inline constexpr int PWM_GREEN    = 1;
inline constexpr int PWM_BLUE     = 2;
inline constexpr int PWM_PERIOD_NS = 500000; // 2 kHz

// Notifications
inline constexpr int NOTIFY_TIMEOUT_MS = 5000;
inline constexpr size_t NOTIFY_QUEUE_MAX = 8;
}
