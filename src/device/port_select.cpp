#include <algorithm>
#include <cctype>
#include "port_select.hpp"

namespace gridlight {
namespace device {

const std::vector<std::string>& defaultDeviceKeywords() {
    static const std::vector<std::string> keywords = {"smartpad", "midiplus", "usb midi"};
    return keywords;
}

static std::string lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return out;
}

KeywordPortSelector::KeywordPortSelector() : keywords(defaultDeviceKeywords()) {}

KeywordPortSelector::KeywordPortSelector(const std::vector<std::string>& kw) : keywords(kw) {}

std::string KeywordPortSelector::selectPort(const std::vector<std::string>& available) const {
    for (const std::string& port : available) {
        std::string name = lower(port);
        for (const std::string& keyword : keywords) {
            if (keyword.empty()) continue;
            if (name.find(lower(keyword)) != std::string::npos) return port;
        }
    }
    return "";
}

}} // namespace gridlight::device
