#pragma once

// =============================================================================
// Run Config Search - Constraint Evaluator
// =============================================================================
//
// Decides whether a multi-model measurement satisfies per-model metric
// bounds, and scores how far an infeasible one is from satisfying them.
//
// Constraint source shape (JSON):
//   {
//     "model_a": {"perf_latency_p99": {"max": 100}},
//     "default": {"perf_throughput": {"min": 500}}
//   }
// Models without an explicit entry fall back to "default".
//

#include "run_config_search/error.h"
#include "run_config_search/record/run_measurement.h"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rcs {
namespace result {

/// Key under which the constraint source stores the fallback constraints
inline constexpr std::string_view kDefaultConstraintKey = "default";

struct Constraint {
    std::string metric_tag;
    std::optional<double> min;
    std::optional<double> max;
};

/// Constraints of one model, keyed by metric tag
using ConstraintSet = std::map<std::string, Constraint, std::less<>>;

/// One entry per model position; nullopt means unconstrained
using ModelConstraints = std::vector<std::optional<ConstraintSet>>;

class ConstraintEvaluator {
  public:
    /// Parse {tag: {min?, max?}}
    [[nodiscard]] static Result<ConstraintSet> parseConstraintSet(const nlohmann::json& j);

    /// Build per-position constraints for `model_names` from a constraint source
    [[nodiscard]] static Result<ModelConstraints> forModels(
        const nlohmann::json& source, const std::vector<std::string>& model_names);

    /// True if every constrained metric of every model lies within its bounds
    [[nodiscard]] static bool satisfies(const ModelConstraints& constraints,
                                        const record::RunMeasurement& measurement);

    /// Sum over violated bounds of the relative overage, in percent.
    /// Zero exactly when satisfies() is true.
    [[nodiscard]] static double infeasibilityScore(const ModelConstraints& constraints,
                                                   const record::RunMeasurement& measurement);
};

}  // namespace result
}  // namespace rcs
