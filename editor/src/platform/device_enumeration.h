#pragma once

// ==============================================================================
// Pointer Device Enumeration Helpers
// ==============================================================================
// Pure helpers behind DeviceConfigurator::listPointerDevices().
//
// Filter: names containing "mouse" or "touchpad" (case-insensitive).
// Ranking: "usb" (1) < "mouse" (2) < "optical" (3) < anything else (100),
//          stable, so ties keep the order reported by the system.
// ==============================================================================

#include <string>
#include <string_view>
#include <vector>

namespace Glide::Editor::Platform {

inline constexpr int kOtherDevicePriority = 100;

/// Shown in the device menu when nothing was found.
inline constexpr const char* kNoDevicePlaceholder = "No pointer device found";

/// Priority of a device name (lower sorts first).
int devicePriority(std::string_view name);

/// Keep pointer-class names and order them by priority.
std::vector<std::string> rankPointerDevices(const std::vector<std::string>& names);

/// Split command output into lines, dropping empty ones and trailing '\r'.
std::vector<std::string> splitLines(std::string_view text);

/// @brief Device the editor starts with.
/// The preferred name wins when it is listed (or the list is empty but a name
/// was configured); otherwise the first ranked device. Empty if there is none.
std::string chooseInitialDevice(const std::vector<std::string>& devices,
                                const std::string& preferred);

} // namespace Glide::Editor::Platform
