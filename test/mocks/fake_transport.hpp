/**
 * Gridlight - in-memory DeviceTransport for session tests
 *
 * Records every command sent to any handle it opens. Failures are
 * scripted through the shared FakeTransportState.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "device/transport.hpp"

namespace gridlight {
namespace test {

struct FakeTransportState {
    std::vector<std::string> ports;
    std::vector<device::DeviceCommand> sent;
    std::vector<std::string> opened;
    int closeCount = 0;

    bool failOpen = false;
    bool failList = false;
    // Throw on the Nth send (1-based), 0 never
    int failSendAt = 0;
    bool failSendLost = false;
    bool portVanished = false;
    int sendCount = 0;

    int countKind(device::DeviceCommand::Kind kind) const {
        int n = 0;
        for (const device::DeviceCommand& c : sent) if (c.kind == kind) ++n;
        return n;
    }
};

struct FakeHandle : device::TransportHandle {
    std::shared_ptr<FakeTransportState> state;
    bool open = true;

    explicit FakeHandle(std::shared_ptr<FakeTransportState> s) : state(s) {}

    void send(const device::DeviceCommand& command) override {
        ++state->sendCount;
        if (state->failSendAt > 0 && state->sendCount == state->failSendAt) {
            throw device::TransportError("scripted send failure", state->failSendLost);
        }
        state->sent.push_back(command);
    }

    void close() override {
        open = false;
        ++state->closeCount;
    }

    bool isOpen() const override { return open && !state->portVanished; }
};

struct FakeTransport : device::DeviceTransport {
    std::shared_ptr<FakeTransportState> state;

    explicit FakeTransport(std::shared_ptr<FakeTransportState> s) : state(s) {}

    std::vector<std::string> listAvailableAddresses() override {
        if (state->failList) throw device::TransportError("port scan failed");
        return state->ports;
    }

    std::unique_ptr<device::TransportHandle> open(const std::string& address) override {
        if (state->failOpen) throw device::TransportError("device busy");
        bool known = false;
        for (const std::string& p : state->ports) if (p == address) known = true;
        if (!known) throw device::TransportError("no such port: " + address);
        state->opened.push_back(address);
        state->portVanished = false;
        return std::unique_ptr<device::TransportHandle>(new FakeHandle(state));
    }
};

}} // namespace gridlight::test
