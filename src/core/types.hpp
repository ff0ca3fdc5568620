#pragma once

#include <cstdint>
#include <cmath>
#include <algorithm>
#include <string>

namespace ctune {

enum class ErrorCode {
    SUCCESS = 0,
    FILE_NOT_FOUND,
    INVALID_FORMAT,
    INVALID_ARGUMENT,
    CONFIG_ERROR
};

struct Result {
    ErrorCode error = ErrorCode::SUCCESS;
    std::string message;

    bool success() const { return error == ErrorCode::SUCCESS; }
    bool failure() const { return error != ErrorCode::SUCCESS; }

    static Result ok() { return {ErrorCode::SUCCESS, ""}; }
    static Result fail(ErrorCode code, const std::string& msg) { return {code, msg}; }
};

struct NormalizedRGB {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;

    NormalizedRGB() = default;
    NormalizedRGB(double r, double g, double b) : r(r), g(g), b(b) {}

    bool is_valid() const {
        return std::isfinite(r) && std::isfinite(g) && std::isfinite(b) &&
               r >= 0.0 && r <= 1.0 && g >= 0.0 && g <= 1.0 && b >= 0.0 && b <= 1.0;
    }
};

struct RGB {
    uint8_t r = 0, g = 0, b = 0;

    RGB() = default;
    RGB(uint8_t r, uint8_t g, uint8_t b) : r(r), g(g), b(b) {}

    static RGB from_normalized(const NormalizedRGB& n) {
        return RGB(
            static_cast<uint8_t>(std::clamp(std::round(n.r * 255.0), 0.0, 255.0)),
            static_cast<uint8_t>(std::clamp(std::round(n.g * 255.0), 0.0, 255.0)),
            static_cast<uint8_t>(std::clamp(std::round(n.b * 255.0), 0.0, 255.0))
        );
    }

    NormalizedRGB normalized() const {
        return {r / 255.0, g / 255.0, b / 255.0};
    }

    bool operator==(const RGB& o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const RGB& o) const { return !(*this == o); }
};

enum class Mode {
    Strict,
    Default,
    Relaxed
};

enum class ContrastLevel {
    Fails,
    MeetsStandard,
    MeetsHigh
};

enum class Readability {
    NotReadable,
    Readable,
    VeryReadable
};

enum class TuneStatus {
    AlreadyPasses,
    PassesStandard,
    PassesHigh,
    Failed
};

const char* mode_name(Mode mode);
bool parse_mode(const std::string& s, Mode& out);
const char* level_name(ContrastLevel level);
const char* readability_name(Readability r);
const char* status_name(TuneStatus status);

}
