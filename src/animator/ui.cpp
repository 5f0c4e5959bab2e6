// PadAnimator UI widgets
#include <rack.hpp>
#include "ui.hpp"
#include "../graphics/pad_lighting.hpp"

using namespace rack;
using gridlight::graphics::PadLighting;

namespace gridlight { namespace animator {

static void drawScreenBase(const Widget::DrawArgs& args, float w, float h, float r) {
    nvgBeginPath(args.vg);
    nvgRoundedRect(args.vg, 0.0f, 0.0f, w, h, r);
    nvgFillColor(args.vg, nvgRGBA(8, 8, 10, 255));
    nvgFill(args.vg);

    // Inset edge shadow
    NVGpaint inset = nvgBoxGradient(args.vg, 1.5f, 1.5f, w - 3.0f, h - 3.0f,
                                    r - 2.5f, 6.0f, nvgRGBA(0, 0, 0, 55), nvgRGBA(0, 0, 0, 0));
    nvgBeginPath(args.vg);
    nvgRoundedRect(args.vg, 1.0f, 1.0f, w - 2.0f, h - 2.0f, r - 1.0f);
    nvgRoundedRect(args.vg, 3.5f, 3.5f, w - 7.0f, h - 7.0f, std::max(0.0f, r - 3.5f));
    nvgPathWinding(args.vg, NVG_HOLE);
    nvgFillPaint(args.vg, inset);
    nvgFill(args.vg);
}

// ---------------------------------------------------------------------------
// AnimatorDisplayWidget

void AnimatorDisplayWidget::draw(const DrawArgs& args) {
    if (!view) return;

    if (!font) {
        font = APP->window->loadFont(asset::system("res/fonts/ShareTechMono-Regular.ttf"));
        if (!font)
            font = APP->window->loadFont(asset::system("res/fonts/DejaVuSans.ttf"));
    }
    if (!font) return;

    nvgSave(args.vg);
    float w = box.size.x, h = box.size.y;
    drawScreenBase(args, w, h, 4.0f);

    nvgFontFaceId(args.vg, font->handle);
    nvgTextAlign(args.vg, NVG_ALIGN_LEFT | NVG_ALIGN_TOP);
    nvgFontSize(args.vg, 10.0f);
    nvgFillColor(args.vg, nvgRGBA(220, 232, 210, 230));

    std::string name = view->getSequenceName();
    if (view->isSequenceModified()) name += "*";
    nvgText(args.vg, 6.0f, 5.0f, name.c_str(), NULL);

    int count = view->getFrameCount();
    int edit = view->getEditFrameIndex();
    std::string frameLine;
    if (view->isPlaying()) {
        frameLine = string::f("PLAY %d/%d", view->getPlayingFrameIndex() + 1, count);
    }
    else if (view->isPaused()) {
        frameLine = string::f("PAUSE %d/%d", view->getPlayingFrameIndex() + 1, count);
    }
    else {
        frameLine = count > 0 ? string::f("EDIT %d/%d", edit + 1, count) : std::string("NO FRAMES");
    }
    frameLine += string::f("  %dms", view->getFrameDelayMs());
    nvgText(args.vg, 6.0f, 17.0f, frameLine.c_str(), NULL);

    bool connected = view->isDeviceConnected();
    nvgFillColor(args.vg, connected ? nvgRGBA(120, 230, 140, 230) : nvgRGBA(200, 120, 110, 230));
    std::string device = connected ? view->getDeviceName() : std::string("no device");
    nvgText(args.vg, 6.0f, 29.0f, device.c_str(), NULL);

    std::string status = view->getStatusMessage();
    if (!status.empty()) {
        nvgFontSize(args.vg, 8.5f);
        nvgFillColor(args.vg, nvgRGBA(180, 180, 190, 200));
        nvgText(args.vg, 6.0f, 41.0f, status.c_str(), NULL);
    }
    nvgRestore(args.vg);
}

// ---------------------------------------------------------------------------
// PadGridWidget

int PadGridWidget::padAt(Vec pos) const {
    if (pos.x < 0 || pos.y < 0 || pos.x >= box.size.x || pos.y >= box.size.y) return -1;
    int col = (int)(pos.x / box.size.x * grid::GRID_COLS);
    int row = (int)(pos.y / box.size.y * grid::GRID_ROWS);
    col = rack::clamp(col, 0, grid::GRID_COLS - 1);
    row = rack::clamp(row, 0, grid::GRID_ROWS - 1);
    return grid::padIndex(row, col);
}

Vec PadGridWidget::resolveMouseLocal(const Vec& fallback) {
    if (!(APP && APP->scene))
        return fallback;

    Vec scenePos = APP->scene->getMousePos();
    Vec widgetOrigin = getAbsoluteOffset(Vec());
    float zoom = getAbsoluteZoom();
    if (zoom <= 0.f) {
        zoom = 1.f;
    }

    Vec local = scenePos.minus(widgetOrigin).div(zoom);
    if (!local.isFinite())
        return fallback;

    return local;
}

void PadGridWidget::applyAt(int pad, int button) {
    if (!ctrl || pad < 0) return;
    if (button == GLFW_MOUSE_BUTTON_LEFT) ctrl->paintPad(pad);
    else if (button == GLFW_MOUSE_BUTTON_RIGHT) ctrl->erasePad(pad);
}

void PadGridWidget::onButton(const event::Button& e) {
    if (e.action != GLFW_PRESS) return;
    if (!view || !ctrl) return;
    if (e.button != GLFW_MOUSE_BUTTON_LEFT && e.button != GLFW_MOUSE_BUTTON_RIGHT) return;

    int pad = padAt(e.pos);
    applyAt(pad, e.button);
    dragButton = e.button;
    lastDragPad = pad;
    dragPos = e.pos;
    e.consume(this);
}

void PadGridWidget::onDragStart(const event::DragStart& e) {
    if (e.button != dragButton) dragButton = e.button;
}

void PadGridWidget::onDragMove(const event::DragMove& e) {
    if (dragButton < 0) return;
    dragPos = resolveMouseLocal(dragPos.plus(e.mouseDelta));
    int pad = padAt(dragPos);
    if (pad < 0 || pad == lastDragPad) return;
    lastDragPad = pad;
    applyAt(pad, dragButton);
}

void PadGridWidget::onDragEnd(const event::DragEnd& e) {
    dragButton = -1;
    lastDragPad = -1;
}

void PadGridWidget::draw(const DrawArgs& args) {
    drawScreenBase(args, box.size.x, box.size.y, 5.0f);
    // Unlit pads when there is no module (library browser)
    if (!view) drawPads(args, grid::blankGrid(), false);
    Widget::draw(args);
}

void PadGridWidget::drawLayer(const DrawArgs& args, int layer) {
    if (layer == 1 && view) drawPads(args, view->getDisplayGrid(), true);
    Widget::drawLayer(args, layer);
}

void PadGridWidget::drawPads(const DrawArgs& args, const grid::PadGrid& colors, bool lit) {
    const float margin = 6.0f;
    float cellW = (box.size.x - 2.f * margin) / grid::GRID_COLS;
    float cellH = (box.size.y - 2.f * margin) / grid::GRID_ROWS;
    float gap = std::max(1.5f, cellW * 0.12f);

    nvgSave(args.vg);
    for (int row = 0; row < grid::GRID_ROWS; ++row) {
        for (int col = 0; col < grid::GRID_COLS; ++col) {
            grid::PadColor c = colors[grid::padIndex(row, col)];
            float x = margin + col * cellW + gap * 0.5f;
            float y = margin + row * cellH + gap * 0.5f;
            float w = cellW - gap;
            float h = cellH - gap;

            if (lit && c != grid::PAD_OFF) {
                // Soft halo
                NVGcolor glow = PadLighting::colorFor(c).toNVG(0.35f);
                NVGpaint halo = nvgBoxGradient(args.vg, x, y, w, h, 2.0f, gap * 2.0f, glow, nvgRGBA(0, 0, 0, 0));
                nvgBeginPath(args.vg);
                nvgRect(args.vg, x - gap, y - gap, w + 2.f * gap, h + 2.f * gap);
                nvgFillPaint(args.vg, halo);
                nvgFill(args.vg);
            }

            nvgBeginPath(args.vg);
            nvgRoundedRect(args.vg, x, y, w, h, 2.0f);
            nvgFillColor(args.vg, lit ? PadLighting::padFill(c) : PadLighting::offColor());
            nvgFill(args.vg);
            nvgStrokeWidth(args.vg, 0.6f);
            nvgStrokeColor(args.vg, nvgRGBA(255, 255, 255, 18));
            nvgStroke(args.vg);
        }
    }
    nvgRestore(args.vg);
}

// ---------------------------------------------------------------------------
// FrameStripWidget

int FrameStripWidget::firstVisibleFrame() const {
    if (!view) return 0;
    int count = view->getFrameCount();
    int focus = view->isPlaying() ? view->getPlayingFrameIndex() : view->getEditFrameIndex();
    int first = focus - VISIBLE_FRAMES / 2;
    first = std::min(first, count - VISIBLE_FRAMES);
    return std::max(first, 0);
}

void FrameStripWidget::onButton(const event::Button& e) {
    if (e.action != GLFW_PRESS || e.button != GLFW_MOUSE_BUTTON_LEFT) return;
    if (!view || !ctrl) return;
    float slotW = box.size.x / VISIBLE_FRAMES;
    int slot = rack::clamp((int)(e.pos.x / slotW), 0, VISIBLE_FRAMES - 1);
    int index = firstVisibleFrame() + slot;
    if (index < view->getFrameCount()) ctrl->selectFrame(index);
    e.consume(this);
}

void FrameStripWidget::draw(const DrawArgs& args) {
    drawScreenBase(args, box.size.x, box.size.y, 3.0f);
    if (!view) return;

    int count = view->getFrameCount();
    int edit = view->getEditFrameIndex();
    int playing = view->isPlaying() ? view->getPlayingFrameIndex() : -1;
    int first = firstVisibleFrame();
    float slotW = box.size.x / VISIBLE_FRAMES;
    float thumb = std::min(slotW - 6.0f, box.size.y - 6.0f);
    float cell = thumb / grid::GRID_COLS;

    nvgSave(args.vg);
    for (int slot = 0; slot < VISIBLE_FRAMES; ++slot) {
        int index = first + slot;
        if (index >= count) break;
        grid::PadGrid colors;
        if (!view->getFrameGrid(index, colors)) continue;

        float x0 = slot * slotW + (slotW - thumb) * 0.5f;
        float y0 = (box.size.y - thumb) * 0.5f;
        for (int pad = 0; pad < grid::PAD_COUNT; ++pad) {
            if (colors[pad] == grid::PAD_OFF) continue;
            nvgBeginPath(args.vg);
            nvgRect(args.vg, x0 + (pad % grid::GRID_COLS) * cell, y0 + (pad / grid::GRID_COLS) * cell, cell, cell);
            nvgFillColor(args.vg, PadLighting::padFill(colors[pad]));
            nvgFill(args.vg);
        }

        nvgBeginPath(args.vg);
        nvgRect(args.vg, x0 - 1.0f, y0 - 1.0f, thumb + 2.0f, thumb + 2.0f);
        if (index == playing) {
            nvgStrokeColor(args.vg, nvgRGBA(120, 230, 140, 220));
            nvgStrokeWidth(args.vg, 1.4f);
        }
        else if (index == edit) {
            nvgStrokeColor(args.vg, nvgRGBA(240, 220, 120, 220));
            nvgStrokeWidth(args.vg, 1.4f);
        }
        else {
            nvgStrokeColor(args.vg, nvgRGBA(255, 255, 255, 30));
            nvgStrokeWidth(args.vg, 0.6f);
        }
        nvgStroke(args.vg);
    }
    nvgRestore(args.vg);
}

}} // namespace gridlight::animator
