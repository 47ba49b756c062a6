// =============================================================================
// Run Config Search - Error Handling Implementation
// =============================================================================

#include "run_config_search/error.h"

#include "run_config_search/common.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>

namespace rcs {

// =============================================================================
// Assert Failure
// =============================================================================

[[noreturn]] void assertFailed(const char* cond, const char* file, int line) {
    spdlog::critical("Assertion failed: {} at {}:{}", cond, file, line);
    std::fflush(stderr);
    std::abort();
}

// =============================================================================
// Error Code to String
// =============================================================================

std::string_view errorCodeToString(ErrorCode code) {
    switch (code) {
    case ErrorCode::kOk:
        return "OK";

    // Search space errors
    case ErrorCode::kDimensionMismatch:
        return "DimensionError";
    case ErrorCode::kInvalidCoordinate:
        return "InvalidCoordinate";

    // Configuration errors
    case ErrorCode::kInvalidConfiguration:
        return "ConfigurationError";
    case ErrorCode::kInvalidBounds:
        return "BoundsError";
    case ErrorCode::kUnknownModel:
        return "UnknownModel";

    // Naming errors
    case ErrorCode::kNamingCollision:
        return "NamingCollisionError";

    // Input errors
    case ErrorCode::kInvalidInput:
        return "InvalidInput";
    case ErrorCode::kParseError:
        return "ParseError";
    case ErrorCode::kIoError:
        return "IoError";

    // Internal errors
    case ErrorCode::kInternalError:
        return "InternalError";
    case ErrorCode::kNotImplemented:
        return "NotImplemented";

    default:
        return "UnknownError";
    }
}

// =============================================================================
// Error::toString
// =============================================================================

std::string Error::toString() const {
    if (isOk()) {
        return "OK";
    }

    auto code_str = errorCodeToString(code_);
    if (message_.empty()) {
        return std::string(code_str);
    }

    return fmt::format("{}: {}", code_str, message_);
}

}  // namespace rcs
