#include "color.hpp"
#include <algorithm>
#include <cstdio>

namespace {

struct Preset { Rgb rgb; const char* name; };

const Preset kPresets[] = {
    {{0, 0, 100},     "Blue"},
    {{50, 0, 50},     "Violet"},
    {{0, 100, 0},     "Green"},
    {{100, 0, 0},     "Red"},
    {{100, 100, 0},   "Yellow"},
    {{100, 100, 100}, "White"},
    {{0, 0, 0},       "Off"},
};

int clamp_pct(int v) { return std::min(100, std::max(0, v)); }

// Presets are matched at 10% granularity.
int round_to_tenth(int v) { return ((v + 5) / 10) * 10; }

} // namespace

Rgb clamp_rgb(int red, int green, int blue) {
    return Rgb{clamp_pct(red), clamp_pct(green), clamp_pct(blue)};
}

std::string color_name(const Rgb& c) {
    Rgb rounded{round_to_tenth(c.red), round_to_tenth(c.green), round_to_tenth(c.blue)};
    for (const auto& p : kPresets) {
        if (p.rgb == rounded) return p.name;
    }
    char buf[64];
    snprintf(buf, sizeof(buf), "Custom (%d%%, %d%%, %d%%)", c.red, c.green, c.blue);
    return buf;
}
