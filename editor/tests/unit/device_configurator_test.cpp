// ==============================================================================
// Tests for XInputDeviceConfigurator / NullDeviceConfigurator
// ==============================================================================

#include "platform/device_configurator.h"
#include "test_helpers/mock_command_runner.h"

#include <catch2/catch_test_macros.hpp>

#include <memory>

using namespace Glide::Editor::Platform;
using Glide::Core::CurveError;
using Glide::Testing::MockCommandRunner;

namespace {

const char* kSupportedProps =
    "Device 'USB Optical Mouse':\n"
    "\tDevice Enabled (187):\t1\n"
    "\tlibinput Accel Speed (322):\t0.000000\n"
    "\tlibinput Accel Profile Enabled (331):\t1, 0, 0\n"
    "\tlibinput Accel Custom Motion Points (335):\t0.000000, 1.000000\n"
    "\tlibinput Accel Custom Motion Step (337):\t1.000000\n";

const char* kLegacyProps =
    "Device 'PS/2 Generic Mouse':\n"
    "\tDevice Enabled (187):\t1\n"
    "\tlibinput Accel Speed (322):\t0.000000\n"
    "\tlibinput Accel Profile Enabled (331):\t1, 0\n";

struct Fixture {
    Fixture() {
        auto owned = std::make_unique<MockCommandRunner>();
        runner = owned.get();
        configurator = std::make_unique<XInputDeviceConfigurator>(std::move(owned), "xinput");
    }

    MockCommandRunner* runner = nullptr;  // owned by configurator
    std::unique_ptr<XInputDeviceConfigurator> configurator;
};

} // namespace

// =============================================================================
// applyCurve
// =============================================================================

TEST_CASE("applyCurve issues list-props then three set-prop calls", "[device_configurator]") {
    Fixture f;
    f.runner->expectOutput(kSupportedProps);

    std::error_code ec;
    bool ok = f.configurator->applyCurve("USB Optical Mouse", {"0.00", "0.50", "1.00"}, ec);

    REQUIRE(ok);
    REQUIRE_FALSE(ec);
    REQUIRE(f.configurator->getLastError().empty());
    REQUIRE(f.runner->calls.size() == 4);

    CHECK(f.runner->calls[0] ==
          std::vector<std::string>{"xinput", "list-props", "USB Optical Mouse"});
    CHECK(f.runner->calls[1] ==
          std::vector<std::string>{"xinput", "set-prop", "USB Optical Mouse",
                                   "libinput Accel Custom Motion Points",
                                   "0.00", "0.50", "1.00"});
    CHECK(f.runner->calls[2] ==
          std::vector<std::string>{"xinput", "set-prop", "USB Optical Mouse",
                                   "libinput Accel Custom Motion Step", "1.0"});
    CHECK(f.runner->calls[3] ==
          std::vector<std::string>{"xinput", "set-prop", "USB Optical Mouse",
                                   "libinput Accel Profile Enabled", "0", "0", "1"});
}

TEST_CASE("applyCurve rejects a device without custom acceleration", "[device_configurator]") {
    Fixture f;
    f.runner->expectOutput(kLegacyProps);

    std::error_code ec;
    bool ok = f.configurator->applyCurve("PS/2 Generic Mouse", {"0.00", "1.00"}, ec);

    REQUIRE_FALSE(ok);
    REQUIRE(ec == CurveError::UnsupportedDevice);
    REQUIRE(f.runner->calls.size() == 1);
    REQUIRE(f.configurator->getLastError().find("PS/2 Generic Mouse") != std::string::npos);
}

TEST_CASE("applyCurve reports a failing list-props as an external command error",
          "[device_configurator]") {
    Fixture f;
    f.runner->expectExit(1);

    std::error_code ec;
    REQUIRE_FALSE(f.configurator->applyCurve("Ghost Mouse", {"0.00"}, ec));
    REQUIRE(ec == CurveError::ExternalCommand);
    REQUIRE(f.runner->calls.size() == 1);
    REQUIRE_FALSE(f.configurator->getLastError().empty());
}

TEST_CASE("applyCurve stops at the first failing set-prop", "[device_configurator]") {
    Fixture f;
    f.runner->expectOutput(kSupportedProps);
    f.runner->expectOutput({});
    f.runner->expectExit(2);

    std::error_code ec;
    REQUIRE_FALSE(f.configurator->applyCurve("USB Optical Mouse", {"0.00", "1.00"}, ec));
    REQUIRE(ec == CurveError::ExternalCommand);
    // list-props, points, step; profile never attempted
    REQUIRE(f.runner->calls.size() == 3);
    REQUIRE(f.configurator->getLastError().find("Custom Motion Step") != std::string::npos);
}

TEST_CASE("applyCurve reports a missing xinput executable", "[device_configurator]") {
    Fixture f;
    f.runner->expectLaunchFailure();

    std::error_code ec;
    REQUIRE_FALSE(f.configurator->applyCurve("USB Optical Mouse", {"0.00"}, ec));
    REQUIRE(ec == CurveError::ExternalCommand);
    REQUIRE(f.configurator->getLastError().find("Could not run") != std::string::npos);
}

TEST_CASE("A successful apply clears the previous error", "[device_configurator]") {
    Fixture f;
    f.runner->expectExit(1);

    std::error_code ec;
    REQUIRE_FALSE(f.configurator->applyCurve("USB Optical Mouse", {"0.00"}, ec));
    REQUIRE_FALSE(f.configurator->getLastError().empty());

    f.runner->expectOutput(kSupportedProps);
    REQUIRE(f.configurator->applyCurve("USB Optical Mouse", {"0.00"}, ec));
    REQUIRE_FALSE(ec);
    REQUIRE(f.configurator->getLastError().empty());
}

TEST_CASE("A custom xinput executable is used for every call", "[device_configurator]") {
    auto owned = std::make_unique<MockCommandRunner>();
    auto* runner = owned.get();
    XInputDeviceConfigurator configurator(std::move(owned), "/opt/x11/bin/xinput");
    runner->expectOutput(kSupportedProps);

    std::error_code ec;
    REQUIRE(configurator.applyCurve("USB Optical Mouse", {"0.00"}, ec));
    for (const auto& call : runner->calls) {
        REQUIRE(call.front() == "/opt/x11/bin/xinput");
    }
}

// =============================================================================
// listPointerDevices
// =============================================================================

TEST_CASE("listPointerDevices filters and ranks the xinput list", "[device_configurator]") {
    Fixture f;
    f.runner->expectOutput(
        "Virtual core pointer\n"
        "Virtual core XTEST pointer\n"
        "SynPS/2 Synaptics TouchPad\n"
        "Logitech Optical Mouse\n"
        "Power Button\n"
        "USB Mouse\n"
        "AT Translated Set 2 keyboard\n");

    std::error_code ec;
    auto devices = f.configurator->listPointerDevices(ec);

    REQUIRE_FALSE(ec);
    REQUIRE(f.runner->calls.size() == 1);
    REQUIRE(f.runner->calls[0] == std::vector<std::string>{"xinput", "list", "--name-only"});
    REQUIRE(devices == std::vector<std::string>{
        "USB Mouse", "Logitech Optical Mouse", "SynPS/2 Synaptics TouchPad"});
}

TEST_CASE("listPointerDevices degrades to an empty list on failure", "[device_configurator]") {
    Fixture f;
    f.runner->expectLaunchFailure();

    std::error_code ec;
    auto devices = f.configurator->listPointerDevices(ec);

    REQUIRE(devices.empty());
    REQUIRE(ec == CurveError::ExternalCommand);
}

// =============================================================================
// NullDeviceConfigurator
// =============================================================================

TEST_CASE("NullDeviceConfigurator accepts everything and lists nothing",
          "[device_configurator]") {
    NullDeviceConfigurator configurator;
    std::error_code ec = CurveError::Decode;

    REQUIRE_FALSE(configurator.isSupported());
    REQUIRE(configurator.applyCurve("anything", {"0.00"}, ec));
    REQUIRE_FALSE(ec);

    ec = CurveError::Decode;
    REQUIRE(configurator.listPointerDevices(ec).empty());
    REQUIRE_FALSE(ec);
}

TEST_CASE("describeCommand quotes arguments containing spaces", "[device_configurator]") {
    REQUIRE(describeCommand({"xinput", "set-prop", "USB Mouse", "1.0"}) ==
            "xinput set-prop 'USB Mouse' 1.0");
}
