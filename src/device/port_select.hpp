// Gridlight: choosing an output port from the available names
#pragma once
#include <string>
#include <vector>

namespace gridlight {
namespace device {

struct PortSelector {
    virtual ~PortSelector() {}
    // Empty string when nothing suitable is available
    virtual std::string selectPort(const std::vector<std::string>& available) const = 0;
};

// First port whose name contains any keyword, case-insensitively.
// Ports are scanned in the order given; keywords in list order per port.
struct KeywordPortSelector : PortSelector {
    std::vector<std::string> keywords;

    KeywordPortSelector();
    explicit KeywordPortSelector(const std::vector<std::string>& keywords);

    std::string selectPort(const std::vector<std::string>& available) const override;
};

// "smartpad", "midiplus", "usb midi"
const std::vector<std::string>& defaultDeviceKeywords();

}} // namespace gridlight::device
