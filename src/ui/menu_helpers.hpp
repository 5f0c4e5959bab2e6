#pragma once
#include <rack.hpp>
#include <functional>
#include <string>

using namespace rack;

namespace gridlight {
namespace ui {

// ============================================================================
// CONTEXT MENU SLIDER HELPERS
// ============================================================================

// Generic Quantity implementation using lambdas for flexibility
template<typename TModule, typename SetterFunc, typename GetterFunc>
class LambdaQuantity : public Quantity {
private:
    TModule* module;
    SetterFunc setter;
    GetterFunc getter;
    float minValue;
    float maxValue;
    float defaultValue;
    float displayScale;
    int displayPrecision;
    std::string label;
    std::string unit;

public:
    LambdaQuantity(TModule* mod, SetterFunc setterFunc, GetterFunc getterFunc,
                   float minVal, float maxVal, float defVal, float dispScale,
                   const std::string& lbl, const std::string& unt, int precision)
        : module(mod), setter(setterFunc), getter(getterFunc),
          minValue(minVal), maxValue(maxVal), defaultValue(defVal),
          displayScale(dispScale), displayPrecision(precision), label(lbl), unit(unt) {}

    void setValue(float v) override {
        if (module) {
            setter(module, clamp(v, minValue, maxValue));
        }
    }

    float getValue() override {
        return module ? getter(module) : defaultValue;
    }

    float getMinValue() override { return minValue; }
    float getMaxValue() override { return maxValue; }
    float getDefaultValue() override { return defaultValue; }

    float getDisplayValue() override { return getValue() * displayScale; }
    void setDisplayValue(float v) override { setValue(v / displayScale); }
    int getDisplayPrecision() override { return displayPrecision; }

    std::string getLabel() override { return label; }
    std::string getUnit() override { return unit; }
};

template<typename TModule, typename SetterFunc, typename GetterFunc>
struct LambdaSlider : rack::ui::Slider {
    LambdaSlider(TModule* module, SetterFunc setter, GetterFunc getter,
                 float minVal, float maxVal, float defVal, float displayScale,
                 const std::string& label, const std::string& unit,
                 int precision, float width) {
        quantity = new LambdaQuantity<TModule, SetterFunc, GetterFunc>(
            module, setter, getter, minVal, maxVal, defVal, displayScale, label, unit, precision
        );
        box.size.x = width;
    }
    ~LambdaSlider() {
        delete quantity;
    }
};

template<typename TModule, typename SetterFunc, typename GetterFunc>
rack::ui::Slider* createFloatSlider(
    TModule* module,
    SetterFunc setter,
    GetterFunc getter,
    float minVal,
    float maxVal,
    float defaultVal,
    const std::string& label,
    const std::string& unit = "",
    float displayScale = 1.f,
    int precision = 5,
    float width = 200.f
) {
    return new LambdaSlider<TModule, SetterFunc, GetterFunc>(
        module, setter, getter,
        minVal, maxVal, defaultVal, displayScale,
        label, unit, precision, width
    );
}

// ============================================================================
// TEXT ENTRY
// ============================================================================

// Menu text field that hands its text to onSubmit on Enter and closes the menu
struct MenuTextEntry : rack::ui::TextField {
    std::function<void(const std::string&)> onSubmit;

    MenuTextEntry(const std::string& initial, const std::string& hint,
                  std::function<void(const std::string&)> submit, float width = 180.f)
        : onSubmit(submit) {
        box.size.x = width;
        placeholder = hint;
        setText(initial);
        selectAll();
    }

    void onSelectKey(const SelectKeyEvent& e) override {
        if (e.action == GLFW_PRESS && (e.key == GLFW_KEY_ENTER || e.key == GLFW_KEY_KP_ENTER)) {
            if (onSubmit) onSubmit(getText());
            rack::ui::MenuOverlay* overlay = getAncestorOfType<rack::ui::MenuOverlay>();
            if (overlay) overlay->requestDelete();
            e.consume(this);
        }
        if (!e.getTarget())
            rack::ui::TextField::onSelectKey(e);
    }
};

}} // namespace gridlight::ui
