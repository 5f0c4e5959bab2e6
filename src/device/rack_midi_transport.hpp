// Gridlight: DeviceTransport over the Rack MIDI output drivers
#pragma once
#include <rack.hpp>
#include "transport.hpp"

namespace gridlight {
namespace device {

// Addresses are output device names of the selected driver
class RackMidiTransport : public DeviceTransport {
public:
    explicit RackMidiTransport(int driverId = -1);

    int getDriverId() const { return driverId; }
    void setDriverId(int id) { driverId = id; }

    std::vector<std::string> listAvailableAddresses() override;
    std::unique_ptr<TransportHandle> open(const std::string& address) override;

    // First hardware driver Rack offers, -1 if none
    static int defaultDriverId();
    // (id, name) of every MIDI driver
    static std::vector<std::pair<int, std::string>> listDrivers();

private:
    int driverId;
};

}} // namespace gridlight::device
