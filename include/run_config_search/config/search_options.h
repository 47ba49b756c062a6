#pragma once

// =============================================================================
// Run Config Search - Search Options
// =============================================================================
//
// Process-level configuration of one search run, read from JSON:
//
//   {
//     "radius": 3,
//     "min_initialized": 3,
//     "max_steps": 32,
//     "concurrency_mode": "formula",
//     "bounds": {"max_model_batch_size": 128, "concurrency_multiplier": 2},
//     "objectives": {"perf_throughput": 10, "perf_latency_p99": 5},
//     "constraints": {"default": {"perf_latency_p99": {"max": 100}}}
//   }
//
// Every key is optional. Unknown keys are ignored.
//

#include "run_config_search/error.h"
#include "run_config_search/record/run_measurement.h"
#include "run_config_search/search/search_config.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace rcs {
namespace config {

struct SearchOptions {
    search::GlobalBounds bounds;
    uint32_t radius = search::kDefaultRadius;
    uint32_t min_initialized = search::kDefaultMinInitialized;
    uint32_t max_steps = search::kDefaultMaxSteps;
    search::ConcurrencyMode concurrency_mode = search::ConcurrencyMode::kFormula;
    record::Objectives objectives = record::defaultObjectives();
    nlohmann::json constraints;  // null: unconstrained

    [[nodiscard]] static Result<SearchOptions> fromJson(const nlohmann::json& j);

    /// Read a JSON file; a leading '~' expands to $HOME
    [[nodiscard]] static Result<SearchOptions> loadFile(const std::string& path);

    [[nodiscard]] nlohmann::json toJson() const;
};

/// Parse just the bounds object
[[nodiscard]] Result<search::GlobalBounds> boundsFromJson(const nlohmann::json& j);

/// Expand a leading '~' to $HOME
[[nodiscard]] std::string expandUserPath(const std::string& path);

}  // namespace config
}  // namespace rcs
