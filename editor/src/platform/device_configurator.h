#pragma once

// ==============================================================================
// DeviceConfigurator - Push Acceleration Curves to a Pointer Device
// ==============================================================================
// Injectable capability selected once at construction time:
//   Linux:     XInputDeviceConfigurator (libinput custom acceleration via xinput)
//   elsewhere: NullDeviceConfigurator   (no-op)
//
// Failures are reported through std::error_code (Glide::Core::CurveError) plus
// getLastError(); the caller's curve model is never touched.
// ==============================================================================

#include "command_runner.h"

#include <glide/core/curve_error.h>

#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace Glide::Editor::Platform {

// libinput properties as exposed by xinput
inline constexpr const char* kCustomMotionPointsProperty = "libinput Accel Custom Motion Points";
inline constexpr const char* kCustomMotionStepProperty = "libinput Accel Custom Motion Step";
inline constexpr const char* kProfileEnabledProperty = "libinput Accel Profile Enabled";

class DeviceConfigurator {
public:
    virtual ~DeviceConfigurator() = default;

    /// @brief Install @p values (output speeds, "0.00" format) as the custom curve.
    /// @return true on success; on failure @p ec holds the CurveError
    virtual bool applyCurve(const std::string& device,
                            const std::vector<std::string>& values,
                            std::error_code& ec) = 0;

    /// Names of pointer-class devices, ranked (see device_enumeration.h).
    /// Failures degrade to an empty list with @p ec set.
    virtual std::vector<std::string> listPointerDevices(std::error_code& ec) = 0;

    /// false for the no-op implementation.
    [[nodiscard]] virtual bool isSupported() const = 0;

    /// Human-readable description of the last failure (empty after success).
    [[nodiscard]] std::string getLastError() const { return lastError_; }

protected:
    std::string lastError_;
};

class NullDeviceConfigurator final : public DeviceConfigurator {
public:
    bool applyCurve(const std::string& device,
                    const std::vector<std::string>& values,
                    std::error_code& ec) override;

    std::vector<std::string> listPointerDevices(std::error_code& ec) override;

    [[nodiscard]] bool isSupported() const override { return false; }
};

class XInputDeviceConfigurator final : public DeviceConfigurator {
public:
    explicit XInputDeviceConfigurator(std::unique_ptr<CommandRunner> runner,
                                      std::string xinputExecutable = "xinput");

    bool applyCurve(const std::string& device,
                    const std::vector<std::string>& values,
                    std::error_code& ec) override;

    std::vector<std::string> listPointerDevices(std::error_code& ec) override;

    [[nodiscard]] bool isSupported() const override { return true; }

private:
    /// Run one xinput invocation; sets lastError_ and ec on failure.
    bool runXInput(const std::vector<std::string>& args, std::error_code& ec,
                   std::string* output = nullptr);

    std::unique_ptr<CommandRunner> runner_;
    std::string xinputExecutable_;
};

/// Platform-appropriate configurator (XInput on Linux, no-op elsewhere).
std::unique_ptr<DeviceConfigurator> makeDeviceConfigurator(const std::string& xinputExecutable);

} // namespace Glide::Editor::Platform
