// ==============================================================================
// Core Data - Acceleration Curve Presets
// ==============================================================================
// Closed set of named control-point configurations.
//
//   DefaultLinear  (0,0) (0.5,0.5) (1,1)
//   WindowsLike    (0,0) (0.3,0.3) (0.6,1.2) (1,2.5)
//   BoostedMid     3-point base with the mid point raised to (0.5,1.5)
//   CappedHigh     3-point base with the high point raised to (1,2.5)
//
// The editor exposes presets as three toggles (CurveOptions). Boost and cap
// combine independently on the 3-point base; the Windows curve ignores both.
// ==============================================================================

#pragma once

#include <glide/core/control_point.h>

#include <array>
#include <cstdint>
#include <vector>

namespace Glide {
namespace Core {

enum class CurvePreset : uint8_t {
    DefaultLinear = 0,
    WindowsLike,
    BoostedMid,
    CappedHigh
};

/// Preset toggles as shown in the editor.
struct CurveOptions {
    bool windowsCurve = false;
    bool nonlinearBoost = false;
    bool accelerationCap = false;

    bool operator==(const CurveOptions&) const = default;
};

inline constexpr std::array<ControlPoint, 4> kWindowsCurve{{
    {0.0, 0.0},   // Low speed (min)
    {0.3, 0.3},   // Early acceleration start
    {0.6, 1.2},   // Advanced acceleration
    {1.0, 2.5},   // High speed cap
}};

inline constexpr ControlPoint kLowPoint{0.0, 0.0};
inline constexpr ControlPoint kMidPoint{0.5, 0.5};
inline constexpr ControlPoint kBoostedMidPoint{0.5, 1.5};
inline constexpr ControlPoint kHighPoint{1.0, 1.0};
inline constexpr ControlPoint kCappedHighPoint{1.0, 2.5};

/// Build the point sequence for a combination of toggles.
[[nodiscard]] inline std::vector<ControlPoint> presetPoints(const CurveOptions& options) {
    if (options.windowsCurve) {
        return {kWindowsCurve.begin(), kWindowsCurve.end()};
    }
    return {
        kLowPoint,
        options.nonlinearBoost ? kBoostedMidPoint : kMidPoint,
        options.accelerationCap ? kCappedHighPoint : kHighPoint
    };
}

/// Options equivalent to a named preset.
[[nodiscard]] constexpr CurveOptions optionsForPreset(CurvePreset preset) noexcept {
    switch (preset) {
        case CurvePreset::WindowsLike:
            return {.windowsCurve = true};
        case CurvePreset::BoostedMid:
            return {.nonlinearBoost = true};
        case CurvePreset::CappedHigh:
            return {.accelerationCap = true};
        case CurvePreset::DefaultLinear:
        default:
            return {};
    }
}

[[nodiscard]] inline std::vector<ControlPoint> presetPoints(CurvePreset preset) {
    return presetPoints(optionsForPreset(preset));
}

} // namespace Core
} // namespace Glide
