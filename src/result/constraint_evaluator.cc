// =============================================================================
// Run Config Search - Constraint Evaluator Implementation
// =============================================================================

#include "run_config_search/result/constraint_evaluator.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace rcs {
namespace result {

namespace {

// Relative overage of `value` past `bound`; a zero bound measures the
// absolute overage instead
double relativeOverage(double overage, double bound) {
    double denominator = std::fabs(bound);
    return denominator > 0.0 ? overage / denominator : overage;
}

// Calls fn(constraint, record) for every measured metric that has a constraint
template <typename Fn>
void forEachConstrainedRecord(const ModelConstraints& constraints,
                              const record::RunMeasurement& measurement, Fn&& fn) {
    size_t count = std::min(constraints.size(), measurement.numModels());
    for (size_t i = 0; i < count; ++i) {
        if (!constraints[i]) {
            continue;
        }
        for (const auto& rec : measurement.model(i).records()) {
            auto it = constraints[i]->find(rec.tag());
            if (it != constraints[i]->end()) {
                fn(it->second, rec);
            }
        }
    }
}

}  // namespace

// =============================================================================
// Parsing
// =============================================================================

Result<ConstraintSet> ConstraintEvaluator::parseConstraintSet(const nlohmann::json& j) {
    if (!j.is_object()) {
        RCS_RETURN_ERROR(ErrorCode::kInvalidConfiguration, "constraints must be an object");
    }

    ConstraintSet set;
    for (const auto& item : j.items()) {
        const std::string& tag = item.key();
        const nlohmann::json& bounds = item.value();
        if (!record::findMetric(tag)) {
            spdlog::warn("Constraint on unknown metric '{}' will never match", tag);
        }
        if (!bounds.is_object()) {
            RCS_RETURN_ERROR(ErrorCode::kInvalidConfiguration,
                             fmt::format("constraint for '{}' must be an object", tag));
        }

        Constraint constraint;
        constraint.metric_tag = tag;
        for (const std::string key : {"min", "max"}) {
            if (!bounds.contains(key)) {
                continue;
            }
            if (!bounds[key].is_number()) {
                RCS_RETURN_ERROR(ErrorCode::kInvalidConfiguration,
                                 fmt::format("constraint {}.{} must be a number", tag, key));
            }
            if (key == "min") {
                constraint.min = bounds[key].get<double>();
            } else {
                constraint.max = bounds[key].get<double>();
            }
        }

        if (constraint.min && constraint.max && *constraint.min > *constraint.max) {
            RCS_RETURN_ERROR(ErrorCode::kInvalidConfiguration,
                             fmt::format("constraint for '{}' has min {} > max {}", tag,
                                         *constraint.min, *constraint.max));
        }
        set.emplace(tag, std::move(constraint));
    }
    return set;
}

Result<ModelConstraints> ConstraintEvaluator::forModels(const nlohmann::json& source,
                                                        const std::vector<std::string>& model_names) {
    ModelConstraints constraints(model_names.size());
    if (source.is_null()) {
        return constraints;
    }
    if (!source.is_object()) {
        RCS_RETURN_ERROR(ErrorCode::kInvalidConfiguration, "constraint source must be an object");
    }

    std::optional<ConstraintSet> fallback;
    const std::string default_key(kDefaultConstraintKey);
    if (source.contains(default_key)) {
        RCS_ASSIGN_OR_RETURN(fallback, parseConstraintSet(source[default_key]));
    }

    for (size_t i = 0; i < model_names.size(); ++i) {
        if (source.contains(model_names[i])) {
            auto parsed = parseConstraintSet(source[model_names[i]]);
            if (!parsed) {
                return parsed.error();
            }
            constraints[i] = std::move(*parsed);
        } else {
            constraints[i] = fallback;
        }
    }
    return constraints;
}

// =============================================================================
// Evaluation
// =============================================================================

bool ConstraintEvaluator::satisfies(const ModelConstraints& constraints,
                                    const record::RunMeasurement& measurement) {
    bool ok = true;
    forEachConstrainedRecord(constraints, measurement,
                             [&](const Constraint& c, const record::Record& rec) {
                                 if (c.min && rec.value() < *c.min) {
                                     ok = false;
                                 }
                                 if (c.max && rec.value() > *c.max) {
                                     ok = false;
                                 }
                             });
    return ok;
}

double ConstraintEvaluator::infeasibilityScore(const ModelConstraints& constraints,
                                               const record::RunMeasurement& measurement) {
    double score = 0.0;
    forEachConstrainedRecord(constraints, measurement,
                             [&](const Constraint& c, const record::Record& rec) {
                                 if (c.min && rec.value() < *c.min) {
                                     score += relativeOverage(*c.min - rec.value(), *c.min);
                                 }
                                 if (c.max && rec.value() > *c.max) {
                                     score += relativeOverage(rec.value() - *c.max, *c.max);
                                 }
                             });
    return score * 100.0;
}

}  // namespace result
}  // namespace rcs
