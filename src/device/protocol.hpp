// Gridlight: pad grid -> MIDI note command encoding
#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "../grid/frame.hpp"

namespace gridlight {
namespace device {

// One step of a device batch: a note message or a pause
struct DeviceCommand {
    enum Kind { NOTE_OFF, NOTE_ON, WAIT };

    Kind kind;
    int channel;
    int note;
    int velocity;
    int64_t waitUs;

    DeviceCommand() : kind(NOTE_OFF), channel(0), note(0), velocity(0), waitUs(0) {}

    static DeviceCommand noteOff(int channel, int note);
    static DeviceCommand noteOn(int channel, int note, int velocity);
    static DeviceCommand wait(int64_t us);

    bool operator==(const DeviceCommand& other) const;
    std::string toString() const;
};

typedef std::vector<DeviceCommand> CommandList;

struct ProtocolConfig {
    int channel = 0;
    // Pause between the off and on halves of an update. The grid
    // update pauses twice this long. Zero omits the pauses.
    int64_t interCommandDelayUs = 1000;
};

class ProtocolEncoder {
public:
    ProtocolEncoder() {}
    explicit ProtocolEncoder(const ProtocolConfig& cfg) : config(cfg) {}

    const ProtocolConfig& getConfig() const { return config; }
    void setConfig(const ProtocolConfig& c) { config = c; }

    // Note off, then (for a lit color) a pause and the note on.
    // Throws std::out_of_range for a bad pad index.
    CommandList encodeSingle(int pad, grid::PadColor color) const;

    // All 64 note offs in pad order, a double pause, then note ons for
    // every lit pad in pad order
    CommandList encodeGrid(const grid::PadGrid& colors) const;
    // Throws std::invalid_argument unless exactly 64 names are given
    CommandList encodeGrid(const std::vector<std::string>& colorNames) const;

    CommandList encodeClear() const;

    // Row r, col c -> note 16 * r + c
    static int padNote(int pad);
    // -1 when the note is not on the grid
    static int padIndexForNote(int note);
    static int colorVelocity(grid::PadColor color);

private:
    ProtocolConfig config;
};

}} // namespace gridlight::device
