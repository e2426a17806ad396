#include "device_controller.hpp"
#include "utils.hpp"

std::string describe(const DeviceCommand& cmd) {
    if (cmd.kind == DeviceCommand::Kind::Off) return "Off";
    return "Manual(" + color_name(cmd.color) + ")";
}

static const char* auto_label(bool on) { return on ? "Enabled" : "Disabled"; }

DeviceController::DeviceController(OutputDevice& device, NotifyDispatcher& notify,
                                   const DeviceConfig& config)
    : device_(device), notify_(notify), config_(config) {
    state_.command = DeviceCommand::off();
    state_.auto_mode = config_.auto_mode;
}

DeviceState DeviceController::set_color(const Rgb& color) {
    std::lock_guard<std::mutex> lk(m_);
    apply_locked(DeviceCommand::of(clamp_rgb(color.red, color.green, color.blue)));
    return state_;
}

DeviceState DeviceController::turn_off() {
    std::lock_guard<std::mutex> lk(m_);
    apply_locked(DeviceCommand::off());
    return state_;
}

bool DeviceController::toggle_auto_mode() {
    std::lock_guard<std::mutex> lk(m_);
    state_.auto_mode = !state_.auto_mode;
    log_info("device: auto mode %s", auto_label(state_.auto_mode));
    return state_.auto_mode;
}

void DeviceController::on_motion_transition(bool detected) {
    std::lock_guard<std::mutex> lk(m_);
    if (!state_.auto_mode) return;
    log_info("device: motion %s, auto transition", detected ? "started" : "cleared");
    apply_locked(detected ? DeviceCommand::of(config_.motion_color) : DeviceCommand::off());
}

void DeviceController::flash() {
    std::lock_guard<std::mutex> lk(m_);
    flash_until_ = Clock::now() + config_.flash_duration;
    write_locked(RGB_WHITE);
}

void DeviceController::refresh() {
    std::lock_guard<std::mutex> lk(m_);
    Rgb out = effective_output_locked(Clock::now());
    if (last_write_ok_ && out == last_written_) return;
    write_locked(out);
}

DeviceState DeviceController::state() const {
    std::lock_guard<std::mutex> lk(m_);
    return state_;
}

bool DeviceController::flashing() const {
    std::lock_guard<std::mutex> lk(m_);
    return Clock::now() < flash_until_;
}

void DeviceController::apply_locked(const DeviceCommand& cmd) {
    state_.command = cmd;
    log_info("device: -> %s (auto %s)", describe(cmd).c_str(), auto_label(state_.auto_mode));

    // A running flash keeps the light white; refresh() restores the command after it
    Rgb out = effective_output_locked(Clock::now());
    write_locked(out);

    notify_.post(make_notification_locked());
}

Rgb DeviceController::effective_output_locked(Clock::time_point now) const {
    if (now < flash_until_) return RGB_WHITE;
    return state_.command.output();
}

void DeviceController::write_locked(const Rgb& out) {
    std::string err;
    if (device_.write(out, err)) {
        if (failing_streak_ > 0)
            log_info("device: writes recovered after %zu failures", failing_streak_);
        failing_streak_ = 0;
        last_written_ = out;
        last_write_ok_ = true;
        return;
    }
    last_write_ok_ = false;
    write_failures_++;
    size_t n = ++failing_streak_;
    if (n == 1 || n % cfg::LED_FAILURE_LOG_EVERY == 0) {
        logged_failures_++;
        log_error("device: write %s failed (%zu in a row), light may be out of sync: %s",
                  color_name(out).c_str(), n, err.c_str());
    }
}

Notification DeviceController::make_notification_locked() const {
    Notification n;
    n.title = "LED Status";
    n.auto_mode = state_.auto_mode;
    if (state_.command.kind == DeviceCommand::Kind::Off)
        n.message = "LED turned off (Off).";
    else
        n.message = "LED set to " + color_name(state_.command.color) + ".";
    n.message += std::string("\nAuto LED: ") + auto_label(state_.auto_mode);
    return n;
}

DeviceRefresher::DeviceRefresher(DeviceController& controller, std::chrono::milliseconds period)
    : controller_(controller), period_(period) {}

DeviceRefresher::~DeviceRefresher() {
    stop();
}

void DeviceRefresher::start() {
    std::lock_guard<std::mutex> lk(m_);
    if (run_) return;
    run_ = true;
    th_ = std::thread(&DeviceRefresher::loop, this);
}

void DeviceRefresher::stop() {
    {
        std::lock_guard<std::mutex> lk(m_);
        run_ = false;
    }
    cv_.notify_all();
    if (th_.joinable()) th_.join();
}

void DeviceRefresher::loop() {
    std::unique_lock<std::mutex> lk(m_);
    while (run_) {
        lk.unlock();
        controller_.refresh();
        lk.lock();
        cv_.wait_for(lk, period_, [&] { return !run_; });
    }
}
