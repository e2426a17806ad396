#pragma once
#include <string>
#include "capabilities.hpp"
#include "config.hpp"

struct PwmLedConfig {
    std::string chip = cfg::PWM_CHIP;
    int red   = cfg::PWM_RED;
    int green = cfg::PWM_GREEN;
    int blue  = cfg::PWM_BLUE;
    int period_ns = cfg::PWM_PERIOD_NS;
    bool common_anode = true;
};

// Duty fraction for one channel. A common-anode LED is lit by pulling the
// pin low, so the output is inverted; values close to off snap to fully off.
double pwm_duty(int percent, bool common_anode);

// RGB LED on three Linux sysfs PWM channels.
class PwmRgbLed : public OutputDevice {
public:
    explicit PwmRgbLed(const PwmLedConfig& config = PwmLedConfig());
    ~PwmRgbLed() override;

    bool init(std::string& err);
    void cleanup();

    bool write(const Rgb& color, std::string& err) override;

private:
    bool set_channel(int channel, int percent, std::string& err);
    std::string channel_dir(int channel) const;

    PwmLedConfig config_;
    bool initialized_ = false;
};

// Used with --no-led: records the color in the log only.
class LogOutputDevice : public OutputDevice {
public:
    bool write(const Rgb& color, std::string& err) override;
};
