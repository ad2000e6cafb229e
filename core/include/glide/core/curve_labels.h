// ==============================================================================
// Core Utility - Control Point Labels and Value Formatting
// ==============================================================================

#pragma once

#include <glide/core/curve_model.h>

#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

namespace Glide {
namespace Core {

/// Human names for the points of a 3- or 4-point curve ("Point i" otherwise).
[[nodiscard]] inline std::vector<std::string> pointNames(size_t count) {
    if (count == 3) {
        return {"Low speed (min)", "Mid speed", "High speed (max)"};
    }
    if (count == 4) {
        return {"Low speed (min)", "Early accel", "Advanced accel", "High speed (max)"};
    }
    std::vector<std::string> names;
    names.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        names.push_back("Point " + std::to_string(i));
    }
    return names;
}

/// Two-decimal rendering used for both the values text and the device values.
[[nodiscard]] inline std::string formatTwoDecimals(double value) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2f", value);
    return buffer;
}

/// Multi-line "Control Points:" summary shown under the canvas.
[[nodiscard]] inline std::string formatValuesText(const CurveModel& model) {
    const auto& points = model.points();
    auto names = pointNames(points.size());

    std::string text = "Control Points:";
    for (size_t i = 0; i < points.size(); ++i) {
        text += "\n" + names[i] + ": (Input: " + formatTwoDecimals(points[i].input) +
                ", Output: " + formatTwoDecimals(points[i].output) + ")";
    }
    return text;
}

/// Output values as sent to the device ("0.00", "0.50", ...).
[[nodiscard]] inline std::vector<std::string> formatDeviceValues(const CurveModel& model) {
    std::vector<std::string> values;
    values.reserve(model.size());
    for (const auto& point : model.points()) {
        values.push_back(formatTwoDecimals(point.output));
    }
    return values;
}

/// "(x.xx, y.yy)" caption of a decoded curve sample.
[[nodiscard]] inline std::string formatSampleLabel(double x, double y) {
    return "(" + formatTwoDecimals(x) + ", " + formatTwoDecimals(y) + ")";
}

} // namespace Core
} // namespace Glide
