// Gridlight: abstract MIDI output transport
#pragma once
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "protocol.hpp"

namespace gridlight {
namespace device {

struct TransportError : std::runtime_error {
    // True when the port is gone and the handle is no longer usable
    bool connectionLost;

    TransportError(const std::string& what, bool lost = false)
        : std::runtime_error(what), connectionLost(lost) {}
};

// An open output port. Only NOTE_ON/NOTE_OFF commands reach send().
struct TransportHandle {
    virtual ~TransportHandle() {}
    virtual void send(const DeviceCommand& command) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;
};

struct DeviceTransport {
    virtual ~DeviceTransport() {}
    virtual std::vector<std::string> listAvailableAddresses() = 0;
    // Throws TransportError when the address cannot be opened
    virtual std::unique_ptr<TransportHandle> open(const std::string& address) = 0;
};

}} // namespace gridlight::device
