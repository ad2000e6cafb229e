// ==============================================================================
// Core Types - Control Point and Curve Bounds
// ==============================================================================

#pragma once

namespace Glide {
namespace Core {

// Normalized input speed range
inline constexpr double kInputMin = 0.0;
inline constexpr double kInputMax = 1.0;

// Normalized output speed range (extended to leave room for boost/cap)
inline constexpr double kOutputMin = 0.0;
inline constexpr double kOutputMax = 3.0;

/// Output change applied by a single Increase/Decrease command.
inline constexpr double kOutputAdjustStep = 0.1;

/// One vertex (input speed, output speed) of the acceleration curve.
struct ControlPoint {
    double input = 0.0;
    double output = 0.0;

    bool operator==(const ControlPoint&) const = default;
};

} // namespace Core
} // namespace Glide
