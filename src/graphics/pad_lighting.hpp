#pragma once
#include <rack.hpp>
#include "../grid/palette.hpp"

using namespace rack;

namespace gridlight {
namespace graphics {

// ============================================================================
// PAD LIGHTING
// ============================================================================

struct RGBColor {
    float r, g, b;

    RGBColor(float red = 0.f, float green = 0.f, float blue = 0.f) : r(red), g(green), b(blue) {}

    NVGcolor toNVG(float alpha = 1.f) const {
        return nvgRGBAf(r, g, b, alpha);
    }

    RGBColor operator*(float brightness) const {
        return RGBColor(r * brightness, g * brightness, b * brightness);
    }
};

class PadLighting {
public:
    // Approximation of how the device LEDs render each palette entry
    static RGBColor colorFor(grid::PadColor color) {
        switch (color) {
            case grid::PAD_WHITE:     return RGBColor(0.95f, 0.95f, 0.92f);
            case grid::PAD_YELLOW:    return RGBColor(1.00f, 0.86f, 0.10f);
            case grid::PAD_LIGHTBLUE: return RGBColor(0.35f, 0.80f, 1.00f);
            case grid::PAD_PURPLE:    return RGBColor(0.70f, 0.25f, 0.95f);
            case grid::PAD_DARKBLUE:  return RGBColor(0.10f, 0.20f, 0.90f);
            case grid::PAD_GREEN:     return RGBColor(0.15f, 0.90f, 0.25f);
            case grid::PAD_RED:       return RGBColor(0.95f, 0.12f, 0.10f);
            default:                  return RGBColor(0.f, 0.f, 0.f);
        }
    }

    // Unlit pad body
    static NVGcolor offColor() {
        return nvgRGBA(28, 28, 32, 255);
    }

    static NVGcolor padFill(grid::PadColor color, float brightness = 1.f) {
        if (color == grid::PAD_OFF) return offColor();
        return (colorFor(color) * clamp(brightness, 0.f, 1.f)).toNVG();
    }

    // Set RGB lights on a module
    static void setRGBLight(Module* module, int lightId, const RGBColor& color) {
        if (module) {
            module->lights[lightId].setBrightness(color.r);
            module->lights[lightId + 1].setBrightness(color.g);
            module->lights[lightId + 2].setBrightness(color.b);
        }
    }
};

}} // namespace gridlight::graphics
