#include "device_configurator.h"
#include "device_enumeration.h"

#include <utility>

namespace Glide::Editor::Platform {

using Glide::Core::CurveError;

// =============================================================================
// NullDeviceConfigurator
// =============================================================================

bool NullDeviceConfigurator::applyCurve(const std::string& /*device*/,
                                        const std::vector<std::string>& /*values*/,
                                        std::error_code& ec) {
    ec.clear();
    lastError_.clear();
    return true;
}

std::vector<std::string> NullDeviceConfigurator::listPointerDevices(std::error_code& ec) {
    ec.clear();
    return {};
}

// =============================================================================
// XInputDeviceConfigurator
// =============================================================================

XInputDeviceConfigurator::XInputDeviceConfigurator(std::unique_ptr<CommandRunner> runner,
                                                   std::string xinputExecutable)
    : runner_(std::move(runner))
    , xinputExecutable_(std::move(xinputExecutable))
{
}

bool XInputDeviceConfigurator::runXInput(const std::vector<std::string>& args,
                                         std::error_code& ec,
                                         std::string* output) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(xinputExecutable_);
    argv.insert(argv.end(), args.begin(), args.end());

    auto result = runner_->run(argv);
    if (!result.launched) {
        ec = CurveError::ExternalCommand;
        lastError_ = "Could not run: " + describeCommand(argv);
        return false;
    }
    if (result.exitCode != 0) {
        ec = CurveError::ExternalCommand;
        lastError_ = "Command failed (exit " + std::to_string(result.exitCode) +
                     "): " + describeCommand(argv);
        return false;
    }

    if (output) {
        *output = std::move(result.output);
    }
    return true;
}

bool XInputDeviceConfigurator::applyCurve(const std::string& device,
                                          const std::vector<std::string>& values,
                                          std::error_code& ec) {
    ec.clear();
    lastError_.clear();

    std::string props;
    if (!runXInput({"list-props", device}, ec, &props)) {
        return false;
    }

    if (props.find(kCustomMotionPointsProperty) == std::string::npos ||
        props.find(kProfileEnabledProperty) == std::string::npos) {
        ec = CurveError::UnsupportedDevice;
        lastError_ = "The required properties are not supported by the device: " + device;
        return false;
    }

    std::vector<std::string> setPoints{"set-prop", device, kCustomMotionPointsProperty};
    setPoints.insert(setPoints.end(), values.begin(), values.end());
    if (!runXInput(setPoints, ec)) {
        return false;
    }

    if (!runXInput({"set-prop", device, kCustomMotionStepProperty, "1.0"}, ec)) {
        return false;
    }

    // Profile triple (adaptive, flat, custom): select custom
    return runXInput({"set-prop", device, kProfileEnabledProperty, "0", "0", "1"}, ec);
}

std::vector<std::string> XInputDeviceConfigurator::listPointerDevices(std::error_code& ec) {
    ec.clear();
    lastError_.clear();

    std::string output;
    if (!runXInput({"list", "--name-only"}, ec, &output)) {
        return {};
    }
    return rankPointerDevices(splitLines(output));
}

// =============================================================================
// Factory
// =============================================================================

std::unique_ptr<DeviceConfigurator> makeDeviceConfigurator(const std::string& xinputExecutable) {
#if defined(__linux__)
    return std::make_unique<XInputDeviceConfigurator>(
        std::make_unique<PosixCommandRunner>(), xinputExecutable);
#else
    (void)xinputExecutable;
    return std::make_unique<NullDeviceConfigurator>();
#endif
}

} // namespace Glide::Editor::Platform
