// Gridlight: one open connection to the pad device
#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include "protocol.hpp"
#include "transport.hpp"
#include "port_select.hpp"

namespace gridlight {
namespace device {

// Extra pause after the disconnect clear, on top of 5 inter-command delays
constexpr int64_t DISCONNECT_SETTLE_EXTRA_US = 50000;

class DeviceSession {
public:
    typedef std::function<void(bool connected, const std::string& message)> StatusCallback;
    typedef std::function<void(const std::string& message)> ErrorCallback;
    typedef std::function<void(int64_t us)> WaitFunction;

    DeviceSession(std::unique_ptr<DeviceTransport> transport, const ProtocolEncoder& encoder = ProtocolEncoder());
    ~DeviceSession();

    // An empty address means no device was found and fails.
    // Clears the grid once open.
    bool connect(const std::string& address);
    bool connectAuto(const PortSelector& selector);
    void disconnect(bool clearFirst = true);

    bool isConnected() const;
    const std::string& getConnectedAddress() const { return connectedAddress; }
    std::vector<std::string> listAvailableAddresses();

    // Forwards commands in order, executing pauses. Transport failures are
    // reported, never thrown. Returns false if the batch did not complete.
    bool send(const CommandList& commands);

    bool setPad(int pad, grid::PadColor color);
    bool showGrid(const grid::PadGrid& colors);
    bool clearDevice();

    ProtocolEncoder& getEncoder() { return encoder; }
    DeviceTransport& getTransport() { return *transport; }

    void setStatusCallback(StatusCallback cb) { onStatus = cb; }
    void setErrorCallback(ErrorCallback cb) { onError = cb; }
    // Defaults to sleeping the calling thread
    void setWaitFunction(WaitFunction fn) { waitFn = fn; }

private:
    std::unique_ptr<DeviceTransport> transport;
    std::unique_ptr<TransportHandle> handle;
    ProtocolEncoder encoder;
    std::string connectedAddress;

    StatusCallback onStatus;
    ErrorCallback onError;
    WaitFunction waitFn;

    void reportStatus(bool connected, const std::string& message);
    void reportError(const std::string& message);
    void wait(int64_t us);
    void dropConnection(const std::string& reason);
};

}} // namespace gridlight::device
