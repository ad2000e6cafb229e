// ==============================================================================
// Core Rendering - Curve Projection onto a RenderSurface
// ==============================================================================
// Pure projection of model state into drawing primitives; re-invoked after
// every mutation. No toolkit dependency.
//
// Layers (drawn in this order by the editor):
//   renderGrid         - 11x11 grid lines and axis captions
//   renderCurve        - segments between control points, then the point handles
//   renderDecodedCurve - decoded device curve with "(x, y)" captions
// ==============================================================================

#pragma once

#include <glide/core/canvas_transform.h>
#include <glide/core/curve_labels.h>
#include <glide/core/curve_model.h>
#include <glide/core/fixed_point_decoder.h>
#include <glide/core/render_surface.h>
#include <glide/core/selection_set.h>

#include <span>

namespace Glide {
namespace Core {

inline constexpr int kGridDivisions = 10;
inline constexpr double kAxisCaptionOffset = 5.0;
inline constexpr double kOutputCaptionAngle = 90.0;
inline constexpr double kCurveLineWidth = 2.0;
inline constexpr double kSelectedOutlineWidth = 3.0;
inline constexpr double kDefaultOutlineWidth = 1.0;
inline constexpr double kDefaultPointRadius = 6.0;

[[nodiscard]] inline const char* inputAxisCaption(bool humanReadable) noexcept {
    return humanReadable ? "Input effort" : "Input Speed";
}

inline constexpr const char* kOutputAxisCaption = "Output Speed";

inline void renderGrid(RenderSurface& surface, const CanvasTransform& transform,
                       bool humanReadableLabels) {
    for (int i = 0; i <= kGridDivisions; ++i) {
        double fraction = static_cast<double>(i) / kGridDivisions;
        double x = transform.drawableLeft() + fraction * transform.drawableWidth();
        surface.drawLine({x, transform.drawableTop()}, {x, transform.drawableBottom()},
                         Colors::kGrid, 1.0);
    }
    for (int i = 0; i <= kGridDivisions; ++i) {
        double fraction = static_cast<double>(i) / kGridDivisions;
        double y = transform.drawableTop() + fraction * transform.drawableHeight();
        surface.drawLine({transform.drawableLeft(), y}, {transform.drawableRight(), y},
                         Colors::kGrid, 1.0);
    }

    surface.drawText({transform.left + transform.width * 0.5,
                      transform.drawableBottom() + kAxisCaptionOffset},
                     inputAxisCaption(humanReadableLabels), TextAnchor::North, Colors::kBlack, 0.0);
    surface.drawText({transform.drawableLeft() - kAxisCaptionOffset,
                      transform.top + transform.height * 0.5},
                     kOutputAxisCaption, TextAnchor::East, Colors::kBlack,
                     kOutputCaptionAngle);
}

inline void renderCurve(RenderSurface& surface, const CanvasTransform& transform,
                        const CurveModel& model, const SelectionSet& selection,
                        double pointRadius = kDefaultPointRadius) {
    const auto& points = model.points();

    for (size_t i = 0; i + 1 < points.size(); ++i) {
        surface.drawLine(transform.toCanvas(points[i]), transform.toCanvas(points[i + 1]),
                         Colors::kBlue, kCurveLineWidth);
    }

    for (size_t i = 0; i < points.size(); ++i) {
        auto center = transform.toCanvas(points[i]);
        DisplayRect bounds{center.x - pointRadius, center.y - pointRadius,
                           center.x + pointRadius, center.y + pointRadius};
        bool selected = selection.contains(i);
        surface.drawCircle(bounds, Colors::kRed,
                           selected ? Colors::kGreen : Colors::kBlack,
                           selected ? kSelectedOutlineWidth : kDefaultOutlineWidth);
    }
}

inline void renderDecodedCurve(RenderSurface& surface, std::span<const CurveSample> samples,
                               const PlotTransform& transform = {}) {
    for (size_t i = 0; i + 1 < samples.size(); ++i) {
        auto from = transform.toCanvas(samples[i].x, samples[i].y);
        auto to = transform.toCanvas(samples[i + 1].x, samples[i + 1].y);
        surface.drawLine(from, to, Colors::kBlue, kCurveLineWidth);
    }

    // Every sample is captioned, including the last one.
    for (const auto& sample : samples) {
        surface.drawText(transform.toCanvas(sample.x, sample.y),
                         formatSampleLabel(sample.x, sample.y),
                         TextAnchor::SouthEast, Colors::kBlack, 0.0);
    }
}

} // namespace Core
} // namespace Glide
