// ==============================================================================
// Core Model - Piecewise-Linear Acceleration Curve
// ==============================================================================
// Ordered control points (input, output) of a pointer acceleration curve.
//
// Invariants (hold after every operation):
// - input values are non-decreasing by index
// - every input lies in [kInputMin, kInputMax], every output in [kOutputMin, kOutputMax]
// - a locked index is never mutated by movePoint or adjustSelected
//
// Only the low-speed point (index 0) can be locked; the lock is on by default.
// ==============================================================================

#pragma once

#include <glide/core/canvas_transform.h>
#include <glide/core/control_point.h>
#include <glide/core/curve_presets.h>
#include <glide/core/selection_set.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <optional>
#include <vector>

namespace Glide {
namespace Core {

class CurveModel {
public:
    CurveModel() : points_(presetPoints(CurvePreset::DefaultLinear)) {}

    // =========================================================================
    // Presets
    // =========================================================================

    /// Replace every point with a named preset.
    void applyPreset(CurvePreset preset) { points_ = presetPoints(preset); }

    /// Replace every point with the preset selected by the editor toggles.
    void applyOptions(const CurveOptions& options) { points_ = presetPoints(options); }

    // =========================================================================
    // Lock policy
    // =========================================================================

    void setLowSpeedLocked(bool locked) noexcept { lowSpeedLocked_ = locked; }
    [[nodiscard]] bool isLowSpeedLocked() const noexcept { return lowSpeedLocked_; }

    [[nodiscard]] bool isLocked(size_t index) const noexcept {
        return index == 0 && lowSpeedLocked_;
    }

    // =========================================================================
    // Editing
    // =========================================================================

    /// @brief Move one point, clamped to the bounds and between its neighbours.
    /// @return false if the index is locked or out of range, or a coordinate is
    ///         not finite (nothing changes)
    bool movePoint(size_t index, double proposedInput, double proposedOutput) {
        if (index >= points_.size() || isLocked(index)) return false;
        if (!std::isfinite(proposedInput) || !std::isfinite(proposedOutput)) return false;

        double input = std::clamp(proposedInput, kInputMin, kInputMax);
        double output = std::clamp(proposedOutput, kOutputMin, kOutputMax);

        if (index > 0 && input < points_[index - 1].input) {
            input = points_[index - 1].input;
        }
        if (index + 1 < points_.size() && input > points_[index + 1].input) {
            input = points_[index + 1].input;
        }

        points_[index] = {input, output};
        return true;
    }

    /// Add delta to the output of each selected, unlocked point (clamped).
    void adjustSelected(double delta, const SelectionSet& selection) {
        for (size_t index : selection) {
            if (index >= points_.size() || isLocked(index)) continue;
            auto& point = points_[index];
            point.output = std::clamp(point.output + delta, kOutputMin, kOutputMax);
        }
    }

    // =========================================================================
    // Queries
    // =========================================================================

    /// @brief First point whose rendered position lies within radius of (x, y).
    /// Lower indices win when several points overlap the query.
    [[nodiscard]] std::optional<size_t> hitTest(double queryX, double queryY, double radius,
                                                const CanvasTransform& transform) const {
        for (size_t i = 0; i < points_.size(); ++i) {
            auto pos = transform.toCanvas(points_[i]);
            double dx = pos.x - queryX;
            double dy = pos.y - queryY;
            if (dx * dx + dy * dy <= radius * radius) {
                return i;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] const std::vector<ControlPoint>& points() const noexcept { return points_; }
    [[nodiscard]] size_t size() const noexcept { return points_.size(); }
    [[nodiscard]] const ControlPoint& point(size_t index) const { return points_.at(index); }

private:
    std::vector<ControlPoint> points_;
    bool lowSpeedLocked_ = true;
};

} // namespace Core
} // namespace Glide
