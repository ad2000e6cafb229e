#pragma once

// ==============================================================================
// EditorConfig - Startup Settings for the Curve Editor
// ==============================================================================
// Plain settings struct, defaults baked in. Environment overrides:
//   GLIDE_POINTER_DEVICE  preferred device name
//   GLIDE_XINPUT          xinput executable (name or path)
// ==============================================================================

#include <functional>
#include <string>

namespace Glide::Editor::Platform {

inline constexpr const char* kPointerDeviceEnvVar = "GLIDE_POINTER_DEVICE";
inline constexpr const char* kXInputEnvVar = "GLIDE_XINPUT";

struct EditorConfig {
    double canvasWidth = 500.0;
    double canvasHeight = 500.0;
    double canvasMargin = 20.0;
    double pointRadius = 6.0;
    double adjustStep = 0.1;

    bool lockLowSpeed = true;
    bool humanReadableLabels = true;

    std::string preferredDevice;
    std::string xinputExecutable = "xinput";
};

/// Returns the value of an environment variable, or nullptr when unset.
using EnvironmentLookup = std::function<const char*(const char*)>;

/// Apply environment overrides; unset or empty variables leave @p config alone.
void applyEnvironmentOverrides(EditorConfig& config, const EnvironmentLookup& lookup);

/// Defaults plus overrides from the process environment.
EditorConfig loadEditorConfig();

} // namespace Glide::Editor::Platform
