// Gridlight: one 8x8 frame of pad colors
#pragma once
#include <array>
#include <string>
#include <vector>
#include "palette.hpp"

namespace gridlight {
namespace grid {

constexpr int GRID_ROWS = 8;
constexpr int GRID_COLS = 8;
constexpr int PAD_COUNT = GRID_ROWS * GRID_COLS;

// Row-major, index = row * GRID_COLS + col
typedef std::array<PadColor, PAD_COUNT> PadGrid;

PadGrid blankGrid();

inline int padIndex(int row, int col) { return row * GRID_COLS + col; }
inline bool isValidPad(int index) { return index >= 0 && index < PAD_COUNT; }

// Always holds exactly PAD_COUNT colors. Copies are explicit (clone) at
// the sequence boundary but the type itself is a plain value.
class Frame {
public:
    Frame();
    explicit Frame(const PadGrid& colors);
    // A source of the wrong length is discarded and the frame stays blank
    explicit Frame(const std::vector<std::string>& names);

    // Returns true only when the stored value changed. Out-of-range
    // indices are ignored.
    bool set(int index, PadColor color);
    bool set(int index, const std::string& name);

    // Throws std::out_of_range for an invalid index
    PadColor get(int index) const;

    const PadGrid& colors() const { return cells; }
    std::vector<std::string> colorNames() const;

    Frame clone() const;
    void fill(PadColor color);
    void clear() { fill(PAD_OFF); }
    bool isBlank() const;

    bool operator==(const Frame& other) const { return cells == other.cells; }
    bool operator!=(const Frame& other) const { return cells != other.cells; }

private:
    PadGrid cells;
};

}} // namespace gridlight::grid
