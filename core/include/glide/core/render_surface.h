// ==============================================================================
// Core Interface - Render Surface
// ==============================================================================
// Drawing primitives the curve renderer needs. The editor implements this on
// top of a VSTGUI CDrawContext; tests implement it with a recorder.
// ==============================================================================

#pragma once

#include <glide/core/canvas_transform.h>

#include <cstdint>
#include <string>

namespace Glide {
namespace Core {

struct RenderColor {
    uint8_t red = 0;
    uint8_t green = 0;
    uint8_t blue = 0;
    uint8_t alpha = 255;

    bool operator==(const RenderColor&) const = default;
};

namespace Colors {
inline constexpr RenderColor kBlack{0, 0, 0, 255};
inline constexpr RenderColor kWhite{255, 255, 255, 255};
inline constexpr RenderColor kRed{255, 0, 0, 255};
inline constexpr RenderColor kGreen{0, 128, 0, 255};
inline constexpr RenderColor kBlue{0, 0, 255, 255};
inline constexpr RenderColor kGrid{0xdd, 0xdd, 0xdd, 255};
} // namespace Colors

/// Which point of the text box sits on the requested position.
enum class TextAnchor : uint8_t {
    Center,
    North,      // top-center
    East,       // right-center
    SouthEast   // bottom-right
};

struct DisplayRect {
    double left = 0.0;
    double top = 0.0;
    double right = 0.0;
    double bottom = 0.0;
};

class RenderSurface {
public:
    virtual ~RenderSurface() = default;

    virtual void drawLine(const DisplayPoint& from, const DisplayPoint& to,
                          const RenderColor& color, double width) = 0;

    virtual void drawCircle(const DisplayRect& bounds, const RenderColor& fill,
                            const RenderColor& outline, double outlineWidth) = 0;

    /// @param angleDegrees counter-clockwise rotation about position (0 = horizontal)
    virtual void drawText(const DisplayPoint& position, const std::string& text,
                          TextAnchor anchor, const RenderColor& color,
                          double angleDegrees) = 0;
};

} // namespace Core
} // namespace Glide
