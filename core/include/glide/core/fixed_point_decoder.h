// ==============================================================================
// Core Utility - Fixed-Point Curve Decoder
// ==============================================================================
// Decodes the 8-byte fixed-point records used by the Windows mouse driver
// (and the SmoothMouse curve tables) into real-valued samples.
//
// Record layout (little-endian):
//   bytes [0, 2)  unsigned 16-bit fraction   value / 65536
//   bytes [2, 4)  signed 16-bit integer part
//   bytes [4, 8)  padding, never inspected
//
// sample = integer_part + fraction / 65536.0
//
// The arithmetic is exact in double precision (32 significant bits).
// ==============================================================================

#pragma once

#include <glide/core/curve_error.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <system_error>
#include <vector>

namespace Glide {
namespace Core {

/// Bytes per encoded sample.
inline constexpr size_t kFixedPointRecordSize = 8;

/// Scale of the unsigned fractional field.
inline constexpr double kFixedPointFractionScale = 65536.0;

/// One (x, y) point of a decoded device curve.
struct CurveSample {
    double x = 0.0;
    double y = 0.0;
};

/// @brief Decode a single record starting at @p record.
/// @pre @p record points at (at least) kFixedPointRecordSize readable bytes.
[[nodiscard]] inline double decodeFixedPointRecord(const uint8_t* record) noexcept {
    const auto fraction = static_cast<uint16_t>(
        static_cast<uint16_t>(record[0]) | static_cast<uint16_t>(record[1] << 8));
    const auto integer = static_cast<int16_t>(static_cast<uint16_t>(
        static_cast<uint16_t>(record[2]) | static_cast<uint16_t>(record[3] << 8)));
    return static_cast<double>(integer) +
           static_cast<double>(fraction) / kFixedPointFractionScale;
}

/// @brief Decode a flat byte table into one value per 8-byte record.
///
/// @param bytes Byte table; its size must be a multiple of 8
/// @param ec    Cleared on success, CurveError::Decode on a malformed length
/// @return Decoded samples in record order (empty on error)
[[nodiscard]] inline std::vector<double> decodeFixedPointTable(
    std::span<const uint8_t> bytes, std::error_code& ec) {
    ec.clear();
    if (bytes.size() % kFixedPointRecordSize != 0) {
        ec = CurveError::Decode;
        return {};
    }

    std::vector<double> values;
    values.reserve(bytes.size() / kFixedPointRecordSize);
    for (size_t offset = 0; offset < bytes.size(); offset += kFixedPointRecordSize) {
        values.push_back(decodeFixedPointRecord(bytes.data() + offset));
    }
    return values;
}

/// @brief Pair decoded X and Y tables index-wise.
/// Fails with CurveError::MismatchedLength if the tables differ in length.
[[nodiscard]] inline std::vector<CurveSample> zipCurveAxes(
    std::span<const double> xs, std::span<const double> ys, std::error_code& ec) {
    ec.clear();
    if (xs.size() != ys.size()) {
        ec = CurveError::MismatchedLength;
        return {};
    }

    std::vector<CurveSample> samples;
    samples.reserve(xs.size());
    for (size_t i = 0; i < xs.size(); ++i) {
        samples.push_back({xs[i], ys[i]});
    }
    return samples;
}

/// @brief Decode both axis tables of a device curve and zip them.
/// The first failing step determines @p ec.
[[nodiscard]] inline std::vector<CurveSample> decodeCurve(
    std::span<const uint8_t> xBytes, std::span<const uint8_t> yBytes,
    std::error_code& ec) {
    auto xs = decodeFixedPointTable(xBytes, ec);
    if (ec) return {};

    auto ys = decodeFixedPointTable(yBytes, ec);
    if (ec) return {};

    return zipCurveAxes(xs, ys, ec);
}

} // namespace Core
} // namespace Glide
