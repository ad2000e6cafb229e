#include "device_enumeration.h"

#include <algorithm>
#include <cctype>

namespace Glide::Editor::Platform {

namespace {

std::string toLower(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

bool contains(const std::string& haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

int devicePriority(std::string_view name) {
    auto lower = toLower(name);
    if (contains(lower, "usb")) return 1;
    if (contains(lower, "mouse")) return 2;
    if (contains(lower, "optical")) return 3;
    return kOtherDevicePriority;
}

std::vector<std::string> rankPointerDevices(const std::vector<std::string>& names) {
    std::vector<std::string> pointers;
    for (const auto& name : names) {
        auto lower = toLower(name);
        if (contains(lower, "mouse") || contains(lower, "touchpad")) {
            pointers.push_back(name);
        }
    }

    std::stable_sort(pointers.begin(), pointers.end(),
        [](const std::string& a, const std::string& b) {
            return devicePriority(a) < devicePriority(b);
        });
    return pointers;
}

std::vector<std::string> splitLines(std::string_view text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();

        auto line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        if (!line.empty()) lines.emplace_back(line);

        start = end + 1;
    }
    return lines;
}

std::string chooseInitialDevice(const std::vector<std::string>& devices,
                                const std::string& preferred) {
    if (!preferred.empty()) {
        if (devices.empty() ||
            std::find(devices.begin(), devices.end(), preferred) != devices.end()) {
            return preferred;
        }
    }
    return devices.empty() ? std::string{} : devices.front();
}

} // namespace Glide::Editor::Platform
