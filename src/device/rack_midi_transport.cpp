#include "rack_midi_transport.hpp"

using namespace rack;

namespace gridlight {
namespace device {

namespace {

struct RackMidiHandle : TransportHandle {
    std::unique_ptr<midi::Output> output;
    std::string name;

    RackMidiHandle(std::unique_ptr<midi::Output> out, const std::string& deviceName)
        : output(std::move(out)), name(deviceName) {}

    ~RackMidiHandle() {
        if (output) output->reset();
    }

    void send(const DeviceCommand& command) override {
        if (!isOpen()) {
            throw TransportError("MIDI port " + name + " is no longer available", true);
        }
        if (command.kind == DeviceCommand::WAIT) return;

        midi::Message msg;
        msg.setStatus(command.kind == DeviceCommand::NOTE_ON ? 0x9 : 0x8);
        msg.setChannel((uint8_t)command.channel);
        msg.setNote((uint8_t)command.note);
        msg.setValue((uint8_t)command.velocity);
        output->sendMessage(msg);
    }

    void close() override {
        if (!output) return;
        output->setDeviceId(-1);
        output.reset();
    }

    bool isOpen() const override {
        return output && output->getDevice();
    }
};

} // namespace

RackMidiTransport::RackMidiTransport(int id) : driverId(id) {
    if (driverId < 0) driverId = defaultDriverId();
}

int RackMidiTransport::defaultDriverId() {
    for (int id : midi::getDriverIds()) {
        if (id >= 0) return id;
    }
    return -1;
}

std::vector<std::pair<int, std::string>> RackMidiTransport::listDrivers() {
    std::vector<std::pair<int, std::string>> drivers;
    for (int id : midi::getDriverIds()) {
        midi::Driver* driver = midi::getDriver(id);
        if (driver) drivers.push_back(std::make_pair(id, driver->getName()));
    }
    return drivers;
}

std::vector<std::string> RackMidiTransport::listAvailableAddresses() {
    std::vector<std::string> names;
    midi::Driver* driver = midi::getDriver(driverId);
    if (!driver) return names;
    for (int id : driver->getOutputDeviceIds()) {
        names.push_back(driver->getOutputDeviceName(id));
    }
    return names;
}

std::unique_ptr<TransportHandle> RackMidiTransport::open(const std::string& address) {
    if (!midi::getDriver(driverId)) {
        throw TransportError("no MIDI driver selected");
    }

    std::unique_ptr<midi::Output> output(new midi::Output);
    output->setDriverId(driverId);

    int deviceId = -1;
    for (int id : output->getDeviceIds()) {
        if (output->getDeviceName(id) == address) {
            deviceId = id;
            break;
        }
    }
    if (deviceId < 0) {
        throw TransportError("MIDI output '" + address + "' not found");
    }

    output->setDeviceId(deviceId);
    // Commands carry their own channel
    output->setChannel(-1);
    if (!output->getDevice()) {
        throw TransportError("could not open MIDI output '" + address + "'");
    }
    return std::unique_ptr<TransportHandle>(new RackMidiHandle(std::move(output), address));
}

}} // namespace gridlight::device
