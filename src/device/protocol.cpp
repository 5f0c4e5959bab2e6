// Gridlight device protocol encoder
#include <stdexcept>
#include "protocol.hpp"

namespace gridlight {
namespace device {

using namespace gridlight::grid;

constexpr int NOTE_ROW_STRIDE = 16;

static const int COLOR_VELOCITIES[PAD_COLOR_COUNT] = {
    0,   // OFF
    1,   // WHITE
    17,  // YELLOW
    33,  // LIGHTBLUE
    49,  // PURPLE
    65,  // DARKBLUE
    81,  // GREEN
    97   // RED
};

DeviceCommand DeviceCommand::noteOff(int channel, int note) {
    DeviceCommand c;
    c.kind = NOTE_OFF;
    c.channel = channel;
    c.note = note;
    return c;
}

DeviceCommand DeviceCommand::noteOn(int channel, int note, int velocity) {
    DeviceCommand c;
    c.kind = NOTE_ON;
    c.channel = channel;
    c.note = note;
    c.velocity = velocity;
    return c;
}

DeviceCommand DeviceCommand::wait(int64_t us) {
    DeviceCommand c;
    c.kind = WAIT;
    c.waitUs = us;
    return c;
}

bool DeviceCommand::operator==(const DeviceCommand& other) const {
    if (kind != other.kind) return false;
    if (kind == WAIT) return waitUs == other.waitUs;
    return channel == other.channel && note == other.note && velocity == other.velocity;
}

std::string DeviceCommand::toString() const {
    switch (kind) {
        case NOTE_ON:
            return "on ch" + std::to_string(channel) + " n" + std::to_string(note) + " v" + std::to_string(velocity);
        case NOTE_OFF:
            return "off ch" + std::to_string(channel) + " n" + std::to_string(note);
        default:
            return "wait " + std::to_string((long long)waitUs) + "us";
    }
}

int ProtocolEncoder::padNote(int pad) {
    if (!isValidPad(pad)) {
        throw std::out_of_range("pad index " + std::to_string(pad) + " outside 0..63");
    }
    return (pad / GRID_COLS) * NOTE_ROW_STRIDE + (pad % GRID_COLS);
}

int ProtocolEncoder::padIndexForNote(int note) {
    if (note < 0) return -1;
    int row = note / NOTE_ROW_STRIDE;
    int col = note % NOTE_ROW_STRIDE;
    if (row >= GRID_ROWS || col >= GRID_COLS) return -1;
    return padIndex(row, col);
}

int ProtocolEncoder::colorVelocity(PadColor color) {
    if (color >= PAD_COLOR_COUNT) return COLOR_VELOCITIES[PAD_OFF];
    return COLOR_VELOCITIES[color];
}

CommandList ProtocolEncoder::encodeSingle(int pad, PadColor color) const {
    int note = padNote(pad);
    CommandList out;
    out.push_back(DeviceCommand::noteOff(config.channel, note));
    if (color != PAD_OFF && color < PAD_COLOR_COUNT) {
        if (config.interCommandDelayUs > 0)
            out.push_back(DeviceCommand::wait(config.interCommandDelayUs));
        out.push_back(DeviceCommand::noteOn(config.channel, note, colorVelocity(color)));
    }
    return out;
}

CommandList ProtocolEncoder::encodeGrid(const PadGrid& colors) const {
    CommandList out;
    out.reserve(PAD_COUNT * 2 + 1);
    for (int pad = 0; pad < PAD_COUNT; ++pad) {
        out.push_back(DeviceCommand::noteOff(config.channel, padNote(pad)));
    }
    if (config.interCommandDelayUs > 0)
        out.push_back(DeviceCommand::wait(config.interCommandDelayUs * 2));
    for (int pad = 0; pad < PAD_COUNT; ++pad) {
        PadColor c = colors[pad];
        if (c == PAD_OFF || c >= PAD_COLOR_COUNT) continue;
        out.push_back(DeviceCommand::noteOn(config.channel, padNote(pad), colorVelocity(c)));
    }
    return out;
}

CommandList ProtocolEncoder::encodeGrid(const std::vector<std::string>& colorNames) const {
    if ((int)colorNames.size() != PAD_COUNT) {
        throw std::invalid_argument("grid needs 64 colors, got " + std::to_string(colorNames.size()));
    }
    return encodeGrid(Frame(colorNames).colors());
}

CommandList ProtocolEncoder::encodeClear() const {
    return encodeGrid(blankGrid());
}

}} // namespace gridlight::device
