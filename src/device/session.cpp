// Gridlight device session
#include <chrono>
#include <thread>
#include <rack.hpp>
#include "session.hpp"

namespace gridlight {
namespace device {

DeviceSession::DeviceSession(std::unique_ptr<DeviceTransport> t, const ProtocolEncoder& e)
    : transport(std::move(t)), encoder(e) {}

DeviceSession::~DeviceSession() {
    // Owners may already be half torn down
    onStatus = nullptr;
    onError = nullptr;
    if (handle) disconnect(true);
}

void DeviceSession::reportStatus(bool connected, const std::string& message) {
    if (onStatus) onStatus(connected, message);
}

void DeviceSession::reportError(const std::string& message) {
    WARN("Gridlight device: %s", message.c_str());
    if (onError) onError(message);
}

void DeviceSession::wait(int64_t us) {
    if (us <= 0) return;
    if (waitFn) {
        waitFn(us);
        return;
    }
    std::this_thread::sleep_for(std::chrono::microseconds(us));
}

bool DeviceSession::isConnected() const {
    return handle && handle->isOpen();
}

std::vector<std::string> DeviceSession::listAvailableAddresses() {
    try {
        return transport->listAvailableAddresses();
    }
    catch (const std::exception& e) {
        reportError(std::string("MIDI port discovery error: ") + e.what());
        return std::vector<std::string>();
    }
}

bool DeviceSession::connect(const std::string& address) {
    if (address.empty()) {
        std::string msg = "Pad device port not found. Please select one manually.";
        reportError(msg);
        reportStatus(false, msg);
        return false;
    }

    if (isConnected()) {
        if (address == connectedAddress) {
            reportStatus(true, "Already connected to " + address);
            return true;
        }
        disconnect(true);
    }
    // A handle that closed underneath us
    handle.reset();
    connectedAddress.clear();

    try {
        handle = transport->open(address);
    }
    catch (const TransportError& e) {
        reportError("Error connecting to " + address + ": " + e.what());
    }
    catch (const std::exception& e) {
        reportError("Unexpected error connecting to " + address + ": " + e.what());
    }

    if (!handle || !handle->isOpen()) {
        handle.reset();
        reportStatus(false, "Failed to open " + address);
        return false;
    }

    connectedAddress = address;
    INFO("Gridlight: opened MIDI port %s", address.c_str());
    reportStatus(true, address);
    clearDevice();
    return true;
}

bool DeviceSession::connectAuto(const PortSelector& selector) {
    std::vector<std::string> available = listAvailableAddresses();
    if (available.empty()) {
        std::string msg = "No MIDI output ports found.";
        reportError(msg);
        reportStatus(false, msg);
        return false;
    }
    std::string port = selector.selectPort(available);
    if (port.empty()) {
        std::string msg = "Pad device port not automatically found. Please select manually.";
        reportError(msg);
        reportStatus(false, msg);
        return false;
    }
    return connect(port);
}

void DeviceSession::disconnect(bool clearFirst) {
    if (handle) {
        if (clearFirst && handle->isOpen()) {
            send(encoder.encodeClear());
            int64_t delayUs = encoder.getConfig().interCommandDelayUs;
            if (handle && delayUs > 0)
                wait(delayUs * 5 + DISCONNECT_SETTLE_EXTRA_US);
        }
        if (handle) {
            try {
                handle->close();
                INFO("Gridlight: closed MIDI port %s", connectedAddress.c_str());
            }
            catch (const std::exception& e) {
                reportError("Error closing MIDI port " + connectedAddress + ": " + e.what());
            }
        }
    }
    handle.reset();
    std::string old = connectedAddress;
    connectedAddress.clear();
    reportStatus(false, old.empty() ? "Disconnected" : "Disconnected from " + old);
}

void DeviceSession::dropConnection(const std::string& reason) {
    if (handle) {
        try {
            handle->close();
        }
        catch (const std::exception& e) {
            WARN("Gridlight: closing lost port %s failed: %s", connectedAddress.c_str(), e.what());
        }
    }
    handle.reset();
    std::string old = connectedAddress;
    connectedAddress.clear();
    reportStatus(false, "Connection to " + old + " lost: " + reason);
}

bool DeviceSession::send(const CommandList& commands) {
    if (!isConnected()) return false;

    bool ok = true;
    for (const DeviceCommand& command : commands) {
        if (command.kind == DeviceCommand::WAIT) {
            wait(command.waitUs);
            continue;
        }
        try {
            handle->send(command);
        }
        catch (const TransportError& e) {
            reportError(std::string("MIDI send error: ") + e.what());
            if (e.connectionLost) {
                dropConnection(e.what());
                return false;
            }
            ok = false;
        }
        catch (const std::exception& e) {
            reportError(std::string("MIDI send error: ") + e.what());
            ok = false;
        }
    }
    return ok;
}

bool DeviceSession::setPad(int pad, grid::PadColor color) {
    if (!isConnected()) return false;
    if (!grid::isValidPad(pad)) {
        WARN("Gridlight: invalid pad index %d", pad);
        return false;
    }
    return send(encoder.encodeSingle(pad, color));
}

bool DeviceSession::showGrid(const grid::PadGrid& colors) {
    if (!isConnected()) return false;
    return send(encoder.encodeGrid(colors));
}

bool DeviceSession::clearDevice() {
    if (!isConnected()) return false;
    return send(encoder.encodeClear());
}

}} // namespace gridlight::device
