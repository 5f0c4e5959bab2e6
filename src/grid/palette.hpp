// Gridlight: fixed pad color palette
#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace gridlight {
namespace grid {

// Order matches the device velocity table (OFF first)
enum PadColor : uint8_t {
    PAD_OFF = 0,
    PAD_WHITE,
    PAD_YELLOW,
    PAD_LIGHTBLUE,
    PAD_PURPLE,
    PAD_DARKBLUE,
    PAD_GREEN,
    PAD_RED,
    PAD_COLOR_COUNT
};

// Canonical uppercase name ("OFF", "WHITE", ...)
const char* colorName(PadColor color);

// Case-insensitive lookup; anything unknown resolves to PAD_OFF
PadColor normalizeColor(const std::string& name);

bool isValidColorName(const std::string& name);

// OFF followed by the lit colors, in palette order
const std::vector<PadColor>& allColors();

}} // namespace gridlight::grid
