// ==============================================================================
// Core Data - Embedded Device Curve Tables
// ==============================================================================
// SmoothMouse "Windows" acceleration curve, one fixed-point record per point
// (see fixed_point_decoder.h for the record layout). Read-only fixtures that
// are handed to the decoder; nothing mutates them.
// ==============================================================================

#pragma once

#include <array>
#include <cstdint>

namespace Glide {
namespace Core {

inline constexpr std::array<uint8_t, 40> kSmoothMouseCurveX{
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x15, 0x6e, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x00, 0x40, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x29, 0xdc, 0x03, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x00, 0x00, 0x28, 0x00, 0x00, 0x00, 0x00, 0x00
};

inline constexpr std::array<uint8_t, 40> kSmoothMouseCurveY{
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0xfd, 0x11, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x00, 0x24, 0x04, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x00, 0xfc, 0x12, 0x00, 0x00, 0x00, 0x00, 0x00,
    0xc0, 0xbb, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00
};

} // namespace Core
} // namespace Glide
