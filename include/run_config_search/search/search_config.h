#pragma once

// =============================================================================
// Run Config Search - Search Configuration
// =============================================================================
//
// SearchConfig describes the space being walked (dimensions, neighborhood
// radius, how many neighbors to measure before moving). GlobalBounds are the
// user's hard limits applied to every generated variant after the
// coordinate has been resolved.
//

#include "run_config_search/common.h"
#include "run_config_search/error.h"
#include "run_config_search/search/dimension.h"

#include <cstdint>
#include <optional>
#include <string_view>

namespace rcs {
namespace search {

// =============================================================================
// ConcurrencyMode
// =============================================================================

/// How the benchmark concurrency of a variant is chosen
enum class ConcurrencyMode : uint8_t {
    kFormula = 0,     // batch size x instance count x multiplier
    kCoordinate = 1,  // the unit's "concurrency" dimension, formula if absent
};

std::string_view concurrencyModeToString(ConcurrencyMode mode);
Result<ConcurrencyMode> concurrencyModeFromString(std::string_view name);

// =============================================================================
// GlobalBounds
// =============================================================================

struct GlobalBounds {
    std::optional<int64_t> min_model_batch_size;
    std::optional<int64_t> max_model_batch_size;
    std::optional<int64_t> min_instance_count;
    std::optional<int64_t> max_instance_count;
    std::optional<int64_t> min_concurrency;
    std::optional<int64_t> max_concurrency;
    int64_t concurrency_multiplier = kDefaultConcurrencyMultiplier;

    /// kInvalidBounds when a min exceeds its max or a value is not positive
    [[nodiscard]] Result<void> validate() const;

    // Apply max then min; a contradictory pair resolves to the min
    [[nodiscard]] int64_t clampBatchSize(int64_t value) const;
    [[nodiscard]] int64_t clampInstanceCount(int64_t value) const;
    [[nodiscard]] int64_t clampConcurrency(int64_t value) const;

    /// Concurrency used verbatim for composite models: max if set, else min
    [[nodiscard]] std::optional<int64_t> concurrencyOverride() const;
};

// =============================================================================
// SearchConfig
// =============================================================================

inline constexpr uint32_t kDefaultRadius = 3;
inline constexpr uint32_t kDefaultMinInitialized = 3;
inline constexpr uint32_t kDefaultMaxSteps = 32;

struct SearchConfig {
    DimensionSet dimensions;
    uint32_t radius = kDefaultRadius;
    uint32_t min_initialized = kDefaultMinInitialized;
    ConcurrencyMode concurrency_mode = ConcurrencyMode::kFormula;
};

/// Saturating a * b for non-negative operands
[[nodiscard]] int64_t saturatingMultiply(int64_t a, int64_t b);

}  // namespace search
}  // namespace rcs
