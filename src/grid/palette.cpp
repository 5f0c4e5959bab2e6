// Gridlight palette lookups
#include <algorithm>
#include <cctype>
#include "palette.hpp"

namespace gridlight {
namespace grid {

static const char* const COLOR_NAMES[PAD_COLOR_COUNT] = {
    "OFF", "WHITE", "YELLOW", "LIGHTBLUE", "PURPLE", "DARKBLUE", "GREEN", "RED"
};

const char* colorName(PadColor color) {
    if (color >= PAD_COLOR_COUNT) return COLOR_NAMES[PAD_OFF];
    return COLOR_NAMES[color];
}

static bool lookupColor(const std::string& name, PadColor& out) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return (char)std::toupper(c); });
    for (int i = 0; i < PAD_COLOR_COUNT; ++i) {
        if (upper == COLOR_NAMES[i]) {
            out = (PadColor)i;
            return true;
        }
    }
    return false;
}

PadColor normalizeColor(const std::string& name) {
    PadColor color = PAD_OFF;
    if (!lookupColor(name, color)) return PAD_OFF;
    return color;
}

bool isValidColorName(const std::string& name) {
    PadColor color;
    return lookupColor(name, color);
}

const std::vector<PadColor>& allColors() {
    static const std::vector<PadColor> colors = {
        PAD_OFF, PAD_WHITE, PAD_YELLOW, PAD_LIGHTBLUE,
        PAD_PURPLE, PAD_DARKBLUE, PAD_GREEN, PAD_RED
    };
    return colors;
}

}} // namespace gridlight::grid
