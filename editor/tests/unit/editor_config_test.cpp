// ==============================================================================
// Tests for editor_config.h
// ==============================================================================

#include "platform/editor_config.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <map>
#include <string>

using namespace Glide::Editor::Platform;
using Catch::Approx;

namespace {

EnvironmentLookup lookupFrom(const std::map<std::string, std::string>& env) {
    return [env](const char* name) -> const char* {
        auto it = env.find(name);
        return it == env.end() ? nullptr : it->second.c_str();
    };
}

} // namespace

TEST_CASE("EditorConfig defaults", "[editor_config]") {
    EditorConfig config;
    CHECK(config.canvasWidth == Approx(500.0));
    CHECK(config.canvasHeight == Approx(500.0));
    CHECK(config.canvasMargin == Approx(20.0));
    CHECK(config.pointRadius == Approx(6.0));
    CHECK(config.adjustStep == Approx(0.1));
    CHECK(config.lockLowSpeed);
    CHECK(config.humanReadableLabels);
    CHECK(config.preferredDevice.empty());
    CHECK(config.xinputExecutable == "xinput");
}

TEST_CASE("Environment overrides device and xinput executable", "[editor_config]") {
    EditorConfig config;
    applyEnvironmentOverrides(config, lookupFrom({
        {kPointerDeviceEnvVar, "Logitech USB Optical Mouse"},
        {kXInputEnvVar, "/usr/local/bin/xinput"},
    }));

    CHECK(config.preferredDevice == "Logitech USB Optical Mouse");
    CHECK(config.xinputExecutable == "/usr/local/bin/xinput");
}

TEST_CASE("Unset and empty variables keep the defaults", "[editor_config]") {
    EditorConfig config;
    applyEnvironmentOverrides(config, lookupFrom({{kXInputEnvVar, ""}}));

    CHECK(config.preferredDevice.empty());
    CHECK(config.xinputExecutable == "xinput");
}

TEST_CASE("A null lookup is ignored", "[editor_config]") {
    EditorConfig config;
    applyEnvironmentOverrides(config, EnvironmentLookup{});
    CHECK(config.xinputExecutable == "xinput");
}
