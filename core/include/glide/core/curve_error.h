// ==============================================================================
// Core Utility - Curve Error Codes
// ==============================================================================
// Error taxonomy shared by the decoder, the curve zip step and the device
// configuration layer. Registered as a std::error_code enum so callers report
// failures through the same `std::error_code&` out-parameter pattern used for
// std::filesystem operations.
//
//   Decode            - byte table length is not a multiple of the record size
//   MismatchedLength  - decoded X and Y tables differ in length
//   UnsupportedDevice - device lacks the libinput custom-curve properties
//   ExternalCommand   - the device configuration tool could not be run or failed
// ==============================================================================

#pragma once

#include <cstdint>
#include <string>
#include <system_error>

namespace Glide {
namespace Core {

enum class CurveError : uint8_t {
    None = 0,
    Decode,
    MismatchedLength,
    UnsupportedDevice,
    ExternalCommand
};

class CurveErrorCategory final : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override {
        return "glide.curve";
    }

    [[nodiscard]] std::string message(int value) const override {
        switch (static_cast<CurveError>(value)) {
            case CurveError::None:
                return "success";
            case CurveError::Decode:
                return "byte table length is not a multiple of 8";
            case CurveError::MismatchedLength:
                return "decoded X and Y tables differ in length";
            case CurveError::UnsupportedDevice:
                return "device does not support libinput custom acceleration";
            case CurveError::ExternalCommand:
                return "device configuration command failed";
        }
        return "unknown curve error";
    }
};

[[nodiscard]] inline const std::error_category& curveErrorCategory() noexcept {
    static const CurveErrorCategory category;
    return category;
}

[[nodiscard]] inline std::error_code make_error_code(CurveError e) noexcept {
    return {static_cast<int>(e), curveErrorCategory()};
}

} // namespace Core
} // namespace Glide

template <>
struct std::is_error_code_enum<Glide::Core::CurveError> : std::true_type {};
