// PadAnimator UI widgets
#pragma once
#include <rack.hpp>
#include "view.hpp"

using namespace rack;

namespace gridlight { namespace animator {

// Name, frame position, delay and device status
struct AnimatorDisplayWidget : TransparentWidget {
    PadAnimatorView* view;
    std::shared_ptr<Font> font;
    explicit AnimatorDisplayWidget(PadAnimatorView* v) : view(v) {}
    void draw(const DrawArgs& args) override;
};

// 8x8 pad grid. Left click paints with the brush, right click erases.
// Dragging with a button held keeps painting.
struct PadGridWidget : Widget {
    PadAnimatorView* view = nullptr;
    PadAnimatorController* ctrl = nullptr;
    int dragButton = -1;
    int lastDragPad = -1;
    Vec dragPos;

    PadGridWidget(PadAnimatorView* v, PadAnimatorController* c) : view(v), ctrl(c) {
        box.size = Vec(200.0f, 200.0f);
    }

    int padAt(Vec pos) const;
    Vec resolveMouseLocal(const Vec& fallback);
    void applyAt(int pad, int button);
    void onButton(const event::Button& e) override;
    void onDragStart(const event::DragStart& e) override;
    void onDragMove(const event::DragMove& e) override;
    void onDragEnd(const event::DragEnd& e) override;
    void drawLayer(const DrawArgs& args, int layer) override;
    void draw(const DrawArgs& args) override;
    void drawPads(const DrawArgs& args, const grid::PadGrid& colors, bool lit);
};

// Row of frame thumbnails around the edit frame; click selects
struct FrameStripWidget : Widget {
    PadAnimatorView* view = nullptr;
    PadAnimatorController* ctrl = nullptr;
    static constexpr int VISIBLE_FRAMES = 6;

    FrameStripWidget(PadAnimatorView* v, PadAnimatorController* c) : view(v), ctrl(c) {
        box.size = Vec(200.0f, 30.0f);
    }

    int firstVisibleFrame() const;
    void onButton(const event::Button& e) override;
    void draw(const DrawArgs& args) override;
};

}} // namespace gridlight::animator
