// ==============================================================================
// Core Utility - Canvas Coordinate Transforms
// ==============================================================================
// CanvasTransform maps curve space [kInputMin,kInputMax] x [kOutputMin,kOutputMax]
// onto a padded drawable rectangle (y grows downwards on screen).
// PlotTransform is the fixed origin/scale mapping used for decoded device curves.
// ==============================================================================

#pragma once

#include <glide/core/control_point.h>

namespace Glide {
namespace Core {

/// A position in display units.
struct DisplayPoint {
    double x = 0.0;
    double y = 0.0;
};

struct CanvasTransform {
    double left = 0.0;
    double top = 0.0;
    double width = 500.0;
    double height = 500.0;
    double margin = 20.0;

    [[nodiscard]] double drawableWidth() const noexcept { return width - 2.0 * margin; }
    [[nodiscard]] double drawableHeight() const noexcept { return height - 2.0 * margin; }

    [[nodiscard]] double drawableLeft() const noexcept { return left + margin; }
    [[nodiscard]] double drawableRight() const noexcept { return left + width - margin; }
    [[nodiscard]] double drawableTop() const noexcept { return top + margin; }
    [[nodiscard]] double drawableBottom() const noexcept { return top + height - margin; }

    /// Curve space -> display units.
    [[nodiscard]] DisplayPoint toCanvas(double input, double output) const noexcept {
        return {
            drawableLeft() + (input - kInputMin) / (kInputMax - kInputMin) * drawableWidth(),
            drawableBottom() - (output - kOutputMin) / (kOutputMax - kOutputMin) * drawableHeight()
        };
    }

    [[nodiscard]] DisplayPoint toCanvas(const ControlPoint& point) const noexcept {
        return toCanvas(point.input, point.output);
    }

    /// Display units -> curve space. Not clamped.
    [[nodiscard]] ControlPoint toFunction(double canvasX, double canvasY) const noexcept {
        double w = drawableWidth();
        double h = drawableHeight();
        if (w <= 0.0 || h <= 0.0) return {kInputMin, kOutputMin};

        return {
            (canvasX - drawableLeft()) / w * (kInputMax - kInputMin) + kInputMin,
            (drawableBottom() - canvasY) / h * (kOutputMax - kOutputMin) + kOutputMin
        };
    }
};

struct PlotTransform {
    double originX = 50.0;
    double originY = 450.0;
    double scaleX = 10.0;
    double scaleY = 10.0;

    [[nodiscard]] DisplayPoint toCanvas(double x, double y) const noexcept {
        return {originX + x * scaleX, originY - y * scaleY};
    }
};

} // namespace Core
} // namespace Glide
