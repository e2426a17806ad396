#include "led.hpp"
#include "color.hpp"
#include "utils.hpp"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <sys/stat.h>
#include <thread>

static bool write_sysfs(const std::string& path, const std::string& value, std::string& err) {
    std::ofstream out(path);
    if (!out) {
        err = path + ": " + strerror(errno);
        return false;
    }
    out << value;
    out.flush();
    if (!out) {
        err = path + ": write failed";
        return false;
    }
    return true;
}

static bool exists(const std::string& path) {
    struct stat st{};
    return stat(path.c_str(), &st) == 0;
}

double pwm_duty(int percent, bool common_anode) {
    double v = percent / 100.0;
    if (v < 0.0) v = 0.0;
    if (v > 1.0) v = 1.0;
    if (!common_anode) return v;
    double out = 1.0 - v;
    // Clamp values near full off
    if (out > 0.98) out = 1.0;
    return out;
}

PwmRgbLed::PwmRgbLed(const PwmLedConfig& config)
    : config_(config) {}

PwmRgbLed::~PwmRgbLed() {
    cleanup();
}

std::string PwmRgbLed::channel_dir(int channel) const {
    return config_.chip + "/pwm" + std::to_string(channel);
}

bool PwmRgbLed::init(std::string& err) {
    for (int ch : {config_.red, config_.green, config_.blue}) {
        std::string dir = channel_dir(ch);
        if (!exists(dir)) {
            if (!write_sysfs(config_.chip + "/export", std::to_string(ch), err)) return false;
            // udev needs a moment to hand the new files over
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        if (!write_sysfs(dir + "/period", std::to_string(config_.period_ns), err)) return false;
        if (!write_sysfs(dir + "/enable", "1", err)) return false;
    }
    initialized_ = true;
    log_info("led: pwm channels %d/%d/%d on %s", config_.red, config_.green, config_.blue,
             config_.chip.c_str());
    return write(RGB_OFF, err);
}

void PwmRgbLed::cleanup() {
    if (!initialized_) return;
    std::string err;
    if (!write(RGB_OFF, err)) log_warn("led: cleanup: %s", err.c_str());
    initialized_ = false;
}

bool PwmRgbLed::set_channel(int channel, int percent, std::string& err) {
    long duty = (long)(pwm_duty(percent, config_.common_anode) * config_.period_ns);
    return write_sysfs(channel_dir(channel) + "/duty_cycle", std::to_string(duty), err);
}

bool PwmRgbLed::write(const Rgb& color, std::string& err) {
    if (!initialized_) {
        err = "pwm not initialized";
        return false;
    }
    bool ok = set_channel(config_.red, color.red, err);
    ok = set_channel(config_.green, color.green, err) && ok;
    ok = set_channel(config_.blue, color.blue, err) && ok;
    return ok;
}

bool LogOutputDevice::write(const Rgb& color, std::string&) {
    log_info("led: %s (%d%%, %d%%, %d%%)", color_name(color).c_str(), color.red, color.green, color.blue);
    return true;
}
