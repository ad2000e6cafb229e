// ==============================================================================
// curve_dump - Print a Decoded Fixed-Point Device Curve
// ==============================================================================
// Decodes an X table and a Y table of 8-byte Q16.16 records and prints one
// "x y" line per sample. Without arguments the embedded SmoothMouse tables
// are dumped.
//
// Usage:
//   curve_dump [x_table.bin y_table.bin]
//
// Exit codes: 0 success, 1 decode error or unreadable file, 2 usage error.
// ==============================================================================

#include <glide/core/curve_error.h>
#include <glide/core/embedded_curves.h>
#include <glide/core/fixed_point_decoder.h>

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

std::optional<std::vector<uint8_t>> readTable(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());
    if (file.bad()) {
        return std::nullopt;
    }
    return bytes;
}

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [x_table.bin y_table.bin]" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace Glide::Core;

    std::vector<uint8_t> xBytes(kSmoothMouseCurveX.begin(), kSmoothMouseCurveX.end());
    std::vector<uint8_t> yBytes(kSmoothMouseCurveY.begin(), kSmoothMouseCurveY.end());

    if (argc == 3) {
        auto x = readTable(argv[1]);
        if (!x) {
            std::cerr << "Error: cannot read " << argv[1] << std::endl;
            return kExitFailure;
        }
        auto y = readTable(argv[2]);
        if (!y) {
            std::cerr << "Error: cannot read " << argv[2] << std::endl;
            return kExitFailure;
        }
        xBytes = std::move(*x);
        yBytes = std::move(*y);
    } else if (argc != 1) {
        printUsage(argv[0]);
        return kExitUsage;
    }

    std::error_code ec;
    auto samples = decodeCurve(xBytes, yBytes, ec);
    if (ec) {
        std::cerr << "Error: " << ec.message() << std::endl;
        return kExitFailure;
    }

    for (const auto& sample : samples) {
        char line[64];
        std::snprintf(line, sizeof(line), "%.4f %.4f", sample.x, sample.y);
        std::cout << line << "\n";
    }
    std::cout.flush();
    return kExitOk;
}
