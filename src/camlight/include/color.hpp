#pragma once
#include <string>

// LED intensities in percent, 0..100 per channel.
struct Rgb {
    int red = 0;
    int green = 0;
    int blue = 0;

    bool operator==(const Rgb& o) const { return red == o.red && green == o.green && blue == o.blue; }
    bool operator!=(const Rgb& o) const { return !(*this == o); }
};

inline constexpr Rgb RGB_OFF{0, 0, 0};
inline constexpr Rgb RGB_WHITE{100, 100, 100};

Rgb clamp_rgb(int red, int green, int blue);

// Preset label ("Blue", "Violet", ...) or "Custom (r%, g%, b%)".
std::string color_name(const Rgb& c);
