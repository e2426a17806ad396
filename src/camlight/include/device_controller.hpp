#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include "capabilities.hpp"
#include "color.hpp"
#include "config.hpp"
#include "notify.hpp"

struct DeviceCommand {
    enum class Kind { Off, Color };
    Kind kind = Kind::Off;
    Rgb color;   // meaningful only for Kind::Color

    static DeviceCommand off() { return DeviceCommand{}; }
    static DeviceCommand of(const Rgb& c) { return DeviceCommand{Kind::Color, c}; }

    Rgb output() const { return kind == Kind::Color ? color : RGB_OFF; }
    bool operator==(const DeviceCommand& o) const { return kind == o.kind && output() == o.output(); }
    bool operator!=(const DeviceCommand& o) const { return !(*this == o); }
};

struct DeviceState {
    DeviceCommand command;
    bool auto_mode = cfg::DEFAULT_AUTO_MODE;
};

struct DeviceConfig {
    Rgb motion_color{cfg::MOTION_COLOR_R, cfg::MOTION_COLOR_G, cfg::MOTION_COLOR_B};
    bool auto_mode = cfg::DEFAULT_AUTO_MODE;
    std::chrono::milliseconds flash_duration{cfg::FLASH_MS};
};

std::string describe(const DeviceCommand& cmd);

// Single source of truth for the light. Every transition and every write to
// the OutputDevice happens under one mutex. Device write failures are logged
// and the logical state advances anyway; refresh() re-asserts it later.
class DeviceController {
public:
    DeviceController(OutputDevice& device, NotifyDispatcher& notify,
                     const DeviceConfig& config = DeviceConfig());

    DeviceState set_color(const Rgb& color);
    DeviceState turn_off();
    bool toggle_auto_mode();

    // Called by the acquisition loop when `detected` flips. No-op unless
    // auto mode is enabled.
    void on_motion_transition(bool detected);

    // White override for config.flash_duration; the command is untouched.
    void flash();

    // Writes the effective output if it differs from what the device last
    // accepted, or if the last write failed.
    void refresh();

    DeviceState state() const;
    bool flashing() const;
    size_t write_failures() const { return write_failures_.load(); }
    size_t logged_write_failures() const { return logged_failures_.load(); }

private:
    using Clock = std::chrono::steady_clock;

    void apply_locked(const DeviceCommand& cmd);
    Rgb effective_output_locked(Clock::time_point now) const;
    void write_locked(const Rgb& out);
    Notification make_notification_locked() const;

    OutputDevice& device_;
    NotifyDispatcher& notify_;
    DeviceConfig config_;

    mutable std::mutex m_;
    DeviceState state_;
    Clock::time_point flash_until_{};
    Rgb last_written_;
    bool last_write_ok_ = false;
    size_t failing_streak_ = 0;    // consecutive failed writes, for log pacing
    std::atomic<size_t> write_failures_{0};
    std::atomic<size_t> logged_failures_{0};
};

// Centralized LED update: calls DeviceController::refresh() on a fixed period.
class DeviceRefresher {
public:
    DeviceRefresher(DeviceController& controller,
                    std::chrono::milliseconds period = std::chrono::milliseconds(cfg::LED_REFRESH_MS));
    ~DeviceRefresher();

    void start();
    void stop();

private:
    void loop();

    DeviceController& controller_;
    std::chrono::milliseconds period_;
    std::mutex m_;
    std::condition_variable cv_;
    bool run_ = false;
    std::thread th_;
};
