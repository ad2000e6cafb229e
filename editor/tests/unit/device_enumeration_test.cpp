// ==============================================================================
// Tests for device_enumeration.h
// ==============================================================================

#include "platform/device_enumeration.h"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace Glide::Editor::Platform;

TEST_CASE("devicePriority orders usb, mouse, optical, then the rest", "[device_enumeration]") {
    CHECK(devicePriority("USB Receiver Mouse") == 1);
    CHECK(devicePriority("Generic Mouse") == 2);
    CHECK(devicePriority("Optical Trackball") == 3);
    CHECK(devicePriority("Synaptics TouchPad") == kOtherDevicePriority);
}

TEST_CASE("devicePriority is case-insensitive", "[device_enumeration]") {
    CHECK(devicePriority("usb mouse") == devicePriority("USB MOUSE"));
    CHECK(devicePriority("MoUsE") == 2);
}

TEST_CASE("rankPointerDevices keeps only mice and touchpads", "[device_enumeration]") {
    auto ranked = rankPointerDevices({"Power Button", "Elan Touchpad", "Video Bus",
                                      "Wireless Mouse", "AT keyboard"});
    REQUIRE(ranked == std::vector<std::string>{"Wireless Mouse", "Elan Touchpad"});
}

TEST_CASE("rankPointerDevices keeps the reported order for equal priority",
          "[device_enumeration]") {
    auto ranked = rankPointerDevices({"Zeta Mouse", "Alpha Mouse", "Beta TouchPad",
                                      "Alpha TouchPad"});
    REQUIRE(ranked == std::vector<std::string>{"Zeta Mouse", "Alpha Mouse", "Beta TouchPad",
                                               "Alpha TouchPad"});
}

TEST_CASE("rankPointerDevices of an empty list is empty", "[device_enumeration]") {
    REQUIRE(rankPointerDevices({}).empty());
}

TEST_CASE("splitLines drops blank lines and carriage returns", "[device_enumeration]") {
    auto lines = splitLines("first\r\n\nsecond\nthird");
    REQUIRE(lines == std::vector<std::string>{"first", "second", "third"});
    REQUIRE(splitLines("").empty());
    REQUIRE(splitLines("\n\n").empty());
}

TEST_CASE("chooseInitialDevice honours a listed preference", "[device_enumeration]") {
    std::vector<std::string> devices{"USB Mouse", "Elan Touchpad"};
    REQUIRE(chooseInitialDevice(devices, "Elan Touchpad") == "Elan Touchpad");
}

TEST_CASE("chooseInitialDevice falls back to the first ranked device", "[device_enumeration]") {
    std::vector<std::string> devices{"USB Mouse", "Elan Touchpad"};
    REQUIRE(chooseInitialDevice(devices, "Unplugged Mouse") == "USB Mouse");
    REQUIRE(chooseInitialDevice(devices, "") == "USB Mouse");
}

TEST_CASE("chooseInitialDevice with no devices", "[device_enumeration]") {
    REQUIRE(chooseInitialDevice({}, "Configured Mouse") == "Configured Mouse");
    REQUIRE(chooseInitialDevice({}, "").empty());
}
