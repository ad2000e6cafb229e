#pragma once

// =============================================================================
// DeviceBinding - Which Pointer Device the Editor Drives
// =============================================================================
// Extracted from EditorController for testability (humble object pattern).
// Owns the DeviceConfigurator, the enumerated device list and the current
// selection; no VSTGUI dependency.
// =============================================================================

#include "device_configurator.h"

#include <glide/core/curve_model.h>

#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace Glide::Editor::Platform {

class DeviceBinding {
public:
    DeviceBinding(std::unique_ptr<DeviceConfigurator> configurator,
                  std::string preferredDevice);

    /// Re-enumerate devices and pick the initial selection.
    /// @return false if enumeration failed (the list is then empty)
    bool refreshDevices(std::error_code& ec);

    /// Select by index into devices(). Out-of-range indices are ignored.
    bool selectDevice(size_t index);

    /// Push the model's output values to the current device.
    /// Without a device nothing is run and false is returned with @p ec clear.
    bool apply(const Core::CurveModel& model, std::error_code& ec);

    [[nodiscard]] const std::vector<std::string>& devices() const { return devices_; }
    [[nodiscard]] const std::string& currentDevice() const { return currentDevice_; }
    [[nodiscard]] bool hasDevice() const { return !currentDevice_.empty(); }

    /// Index of the current device in devices(), or -1.
    [[nodiscard]] int currentIndex() const;

    [[nodiscard]] bool isSupported() const { return configurator_->isSupported(); }
    [[nodiscard]] std::string getLastError() const { return lastError_; }

private:
    std::unique_ptr<DeviceConfigurator> configurator_;
    std::string preferredDevice_;
    std::vector<std::string> devices_;
    std::string currentDevice_;
    std::string lastError_;
};

} // namespace Glide::Editor::Platform
