// =============================================================================
// Run Config Search - Search Configuration Implementation
// =============================================================================

#include "run_config_search/search/search_config.h"

#include <fmt/format.h>

#include <limits>

namespace rcs {
namespace search {

namespace {

int64_t clampValue(int64_t value, const std::optional<int64_t>& min, const std::optional<int64_t>& max) {
    if (max && value > *max) {
        value = *max;
    }
    if (min && value < *min) {
        value = *min;
    }
    return value;
}

Result<void> checkPair(std::string_view what, const std::optional<int64_t>& min,
                       const std::optional<int64_t>& max) {
    if (min && *min <= 0) {
        RCS_RETURN_ERROR(ErrorCode::kInvalidBounds,
                         fmt::format("min {} must be positive, got {}", what, *min));
    }
    if (max && *max <= 0) {
        RCS_RETURN_ERROR(ErrorCode::kInvalidBounds,
                         fmt::format("max {} must be positive, got {}", what, *max));
    }
    if (min && max && *min > *max) {
        RCS_RETURN_ERROR(ErrorCode::kInvalidBounds,
                         fmt::format("min {} ({}) exceeds max {} ({})", what, *min, what, *max));
    }
    return {};
}

}  // namespace

std::string_view concurrencyModeToString(ConcurrencyMode mode) {
    switch (mode) {
    case ConcurrencyMode::kFormula:
        return "formula";
    case ConcurrencyMode::kCoordinate:
        return "coordinate";
    }
    return "unknown";
}

Result<ConcurrencyMode> concurrencyModeFromString(std::string_view name) {
    if (name == "formula") {
        return ConcurrencyMode::kFormula;
    }
    if (name == "coordinate") {
        return ConcurrencyMode::kCoordinate;
    }
    RCS_RETURN_ERROR(ErrorCode::kInvalidConfiguration,
                     fmt::format("unknown concurrency mode '{}'", name));
}

// =============================================================================
// GlobalBounds
// =============================================================================

Result<void> GlobalBounds::validate() const {
    RCS_TRY(checkPair("model batch size", min_model_batch_size, max_model_batch_size));
    RCS_TRY(checkPair("instance count", min_instance_count, max_instance_count));
    RCS_TRY(checkPair("concurrency", min_concurrency, max_concurrency));
    if (concurrency_multiplier <= 0) {
        RCS_RETURN_ERROR(ErrorCode::kInvalidBounds,
                         fmt::format("concurrency multiplier must be positive, got {}",
                                     concurrency_multiplier));
    }
    return {};
}

int64_t GlobalBounds::clampBatchSize(int64_t value) const {
    return clampValue(value, min_model_batch_size, max_model_batch_size);
}

int64_t GlobalBounds::clampInstanceCount(int64_t value) const {
    return clampValue(value, min_instance_count, max_instance_count);
}

int64_t GlobalBounds::clampConcurrency(int64_t value) const {
    return clampValue(value, min_concurrency, max_concurrency);
}

std::optional<int64_t> GlobalBounds::concurrencyOverride() const {
    return max_concurrency ? max_concurrency : min_concurrency;
}

int64_t saturatingMultiply(int64_t a, int64_t b) {
    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
    if (a == 0 || b == 0) {
        return 0;
    }
    if (a > kMax / b) {
        return kMax;
    }
    return a * b;
}

}  // namespace search
}  // namespace rcs
