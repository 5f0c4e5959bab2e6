// Gridlight frame storage
#include <stdexcept>
#include "frame.hpp"

namespace gridlight {
namespace grid {

PadGrid blankGrid() {
    PadGrid grid;
    grid.fill(PAD_OFF);
    return grid;
}

Frame::Frame() : cells(blankGrid()) {}

Frame::Frame(const PadGrid& colors) : cells(colors) {}

Frame::Frame(const std::vector<std::string>& names) : cells(blankGrid()) {
    if ((int)names.size() != PAD_COUNT) return;
    for (int i = 0; i < PAD_COUNT; ++i) {
        cells[i] = normalizeColor(names[i]);
    }
}

bool Frame::set(int index, PadColor color) {
    if (!isValidPad(index)) return false;
    if (color >= PAD_COLOR_COUNT) color = PAD_OFF;
    if (cells[index] == color) return false;
    cells[index] = color;
    return true;
}

bool Frame::set(int index, const std::string& name) {
    return set(index, normalizeColor(name));
}

PadColor Frame::get(int index) const {
    if (!isValidPad(index)) {
        throw std::out_of_range("pad index " + std::to_string(index) + " outside 0..63");
    }
    return cells[index];
}

std::vector<std::string> Frame::colorNames() const {
    std::vector<std::string> names;
    names.reserve(PAD_COUNT);
    for (PadColor c : cells) names.push_back(colorName(c));
    return names;
}

Frame Frame::clone() const {
    return Frame(cells);
}

void Frame::fill(PadColor color) {
    if (color >= PAD_COLOR_COUNT) color = PAD_OFF;
    cells.fill(color);
}

bool Frame::isBlank() const {
    for (PadColor c : cells) {
        if (c != PAD_OFF) return false;
    }
    return true;
}

}} // namespace gridlight::grid
