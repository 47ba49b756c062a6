// =============================================================================
// Run Config Search - Model Configurations Implementation
// =============================================================================

#include "run_config_search/config/model_config.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace rcs {
namespace config {

namespace {

// Flags rendered ahead of the pass-through flags, with their short form
struct LeadingFlag {
    std::string_view key;
    std::string_view short_form;  // Empty: rendered as --key=value
};

constexpr LeadingFlag kLeadingFlags[] = {
    {kModelNameFlag, "-m"},
    {kBatchSizeFlag, "-b"},
    {kConcurrencyRangeFlag, ""},
};

bool isLeadingFlag(const std::string& key) {
    for (const auto& flag : kLeadingFlags) {
        if (flag.key == key) {
            return true;
        }
    }
    return false;
}

std::string renderValue(const nlohmann::json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

}  // namespace

// =============================================================================
// ModelConfig
// =============================================================================

std::string ModelConfig::name() const {
    const auto* field = getField(kNameField);
    return field && field->is_string() ? field->get<std::string>() : std::string();
}

bool ModelConfig::hasField(std::string_view key) const {
    return fields_.is_object() && fields_.contains(std::string(key));
}

const nlohmann::json* ModelConfig::getField(std::string_view key) const {
    if (!fields_.is_object()) {
        return nullptr;
    }
    auto it = fields_.find(std::string(key));
    return it == fields_.end() ? nullptr : &*it;
}

void ModelConfig::setField(std::string_view key, nlohmann::json value) {
    fields_[std::string(key)] = std::move(value);
}

void ModelConfig::eraseField(std::string_view key) {
    if (fields_.is_object()) {
        fields_.erase(std::string(key));
    }
}

int64_t ModelConfig::maxBatchSize() const {
    const auto* field = getField(kMaxBatchSizeField);
    return field && field->is_number_integer() ? field->get<int64_t>() : 0;
}

int64_t ModelConfig::instanceCount() const {
    const auto* groups = getField(kInstanceGroupField);
    if (!groups || !groups->is_array() || groups->empty()) {
        return 1;
    }
    int64_t total = 0;
    for (const auto& group : *groups) {
        if (group.is_object() && group.contains("count") && group["count"].is_number_integer()) {
            total += group["count"].get<int64_t>();
        } else {
            total += 1;
        }
    }
    return total > 0 ? total : 1;
}

bool ModelConfig::isEnsemble() const {
    const auto* platform = getField(kPlatformField);
    if (platform && platform->is_string() && platform->get<std::string>() == "ensemble") {
        return true;
    }
    return hasField(kEnsembleSchedulingField);
}

std::vector<std::string> ModelConfig::ensembleSteps() const {
    std::vector<std::string> steps;
    const auto* scheduling = getField(kEnsembleSchedulingField);
    if (!scheduling || !scheduling->is_object() || !scheduling->contains("step")) {
        return steps;
    }
    for (const auto& step : (*scheduling)["step"]) {
        if (step.is_object() && step.contains("model_name") && step["model_name"].is_string()) {
            steps.push_back(step["model_name"].get<std::string>());
        }
    }
    return steps;
}

// =============================================================================
// ModelSpec
// =============================================================================

Result<void> ModelSpec::validateBaseline(const std::string& name, const nlohmann::json& baseline) {
    if (!baseline.is_object()) {
        RCS_RETURN_ERROR(ErrorCode::kInvalidConfiguration,
                         fmt::format("baseline of '{}' is not an object", name));
    }
    if (!baseline.contains(std::string(kInputField))) {
        RCS_RETURN_ERROR(ErrorCode::kInvalidConfiguration,
                         fmt::format("baseline of '{}' has no '{}' field", name, kInputField));
    }
    const std::string max_batch_key(kMaxBatchSizeField);
    if (!baseline.contains(max_batch_key)) {
        RCS_RETURN_ERROR(ErrorCode::kInvalidConfiguration,
                         fmt::format("baseline of '{}' has no '{}' field", name, kMaxBatchSizeField));
    }
    if (!baseline[max_batch_key].is_number_integer() || baseline[max_batch_key].get<int64_t>() < 0) {
        RCS_RETURN_ERROR(ErrorCode::kInvalidConfiguration,
                         fmt::format("'{}' of '{}' must be a non-negative integer",
                                     kMaxBatchSizeField, name));
    }
    return {};
}

Result<ModelSpec> ModelSpec::fromBaseline(const std::string& name, nlohmann::json baseline,
                                          nlohmann::json benchmark_flags, bool cpu_only) {
    RCS_TRY(validateBaseline(name, baseline));
    if (!benchmark_flags.is_null() && !benchmark_flags.is_object()) {
        RCS_RETURN_ERROR(ErrorCode::kInvalidConfiguration,
                         fmt::format("benchmark flags of '{}' must be an object", name));
    }

    ModelSpec spec;
    spec.name_ = name;
    spec.baseline_ = ModelConfig(std::move(baseline));
    if (spec.baseline_.isEnsemble()) {
        RCS_RETURN_ERROR(ErrorCode::kInvalidConfiguration,
                         fmt::format("'{}' is an ensemble; its stages need a baseline lookup", name));
    }
    if (spec.baseline_.name().empty()) {
        spec.baseline_.setName(name);
    }
    if (benchmark_flags.is_object()) {
        spec.benchmark_flags_ = std::move(benchmark_flags);
    }
    spec.cpu_only_ = cpu_only;
    return spec;
}

Result<ModelSpec> ModelSpec::create(const std::string& name, const BaselineLookup& lookup,
                                    nlohmann::json benchmark_flags, bool cpu_only) {
    if (!lookup) {
        RCS_RETURN_ERROR(ErrorCode::kInvalidInput, "baseline lookup is empty");
    }
    auto baseline = lookup(name);
    if (!baseline) {
        return Error(ErrorCode::kUnknownModel,
                     fmt::format("cannot load baseline of '{}': {}", name, baseline.error().message()));
    }

    ModelConfig probe(*baseline);
    if (!probe.isEnsemble()) {
        return fromBaseline(name, std::move(*baseline), std::move(benchmark_flags), cpu_only);
    }

    RCS_TRY(validateBaseline(name, *baseline));
    if (!benchmark_flags.is_null() && !benchmark_flags.is_object()) {
        RCS_RETURN_ERROR(ErrorCode::kInvalidConfiguration,
                         fmt::format("benchmark flags of '{}' must be an object", name));
    }

    ModelSpec spec;
    spec.name_ = name;
    spec.baseline_ = std::move(probe);
    if (spec.baseline_.name().empty()) {
        spec.baseline_.setName(name);
    }
    if (benchmark_flags.is_object()) {
        spec.benchmark_flags_ = std::move(benchmark_flags);
    }
    spec.cpu_only_ = cpu_only;

    auto steps = spec.baseline_.ensembleSteps();
    if (steps.empty()) {
        RCS_RETURN_ERROR(ErrorCode::kInvalidConfiguration,
                         fmt::format("ensemble '{}' has no steps", name));
    }
    for (const auto& step : steps) {
        auto stage_baseline = lookup(step);
        if (!stage_baseline) {
            return Error(ErrorCode::kUnknownModel,
                         fmt::format("cannot load stage '{}' of ensemble '{}': {}", step, name,
                                     stage_baseline.error().message()));
        }
        auto stage = fromBaseline(step, std::move(*stage_baseline), nlohmann::json::object(), cpu_only);
        if (!stage) {
            return stage.error();
        }
        spec.stages_.push_back(std::move(*stage));
    }

    spdlog::debug("Resolved ensemble '{}' with {} stages", name, spec.stages_.size());
    return spec;
}

// =============================================================================
// BenchmarkParams
// =============================================================================

void BenchmarkParams::set(std::string_view key, nlohmann::json value) {
    fields_[std::string(key)] = std::move(value);
}

const nlohmann::json* BenchmarkParams::get(std::string_view key) const {
    auto it = fields_.find(std::string(key));
    return it == fields_.end() ? nullptr : &*it;
}

void BenchmarkParams::update(const nlohmann::json& flags) {
    if (!flags.is_object()) {
        return;
    }
    for (const auto& item : flags.items()) {
        fields_[item.key()] = item.value();
    }
}

int64_t BenchmarkParams::concurrency() const {
    const auto* value = get(kConcurrencyRangeFlag);
    return value && value->is_number_integer() ? value->get<int64_t>() : 0;
}

std::string BenchmarkParams::representation() const {
    std::string out;
    auto append = [&out](const std::string& part) {
        if (!out.empty()) {
            out += ' ';
        }
        out += part;
    };

    for (const auto& flag : kLeadingFlags) {
        const auto* value = get(flag.key);
        if (!value) {
            continue;
        }
        if (flag.short_form.empty()) {
            append(fmt::format("--{}={}", flag.key, renderValue(*value)));
        } else {
            append(fmt::format("{} {}", flag.short_form, renderValue(*value)));
        }
    }
    for (const auto& item : fields_.items()) {
        if (isLeadingFlag(item.key())) {
            continue;
        }
        append(fmt::format("--{}={}", item.key(), renderValue(item.value())));
    }
    return out;
}

// =============================================================================
// ModelRunConfig / RunConfig
// =============================================================================

nlohmann::json ModelRunConfig::toJson() const {
    nlohmann::json j;
    j["model_name"] = model_name;
    j["model_config"] = model_config.toJson();
    j["perf_config"] = perf_config.toJson();
    if (isComposite()) {
        j["stage_configs"] = nlohmann::json::array();
        for (const auto& stage : stage_configs) {
            j["stage_configs"].push_back(stage.toJson());
        }
    }
    return j;
}

std::string RunConfig::representation() const {
    std::string out;
    for (const auto& model : models_) {
        if (!out.empty()) {
            out += ' ';
        }
        out += model.representation();
    }
    return out;
}

nlohmann::json RunConfig::toJson() const {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& model : models_) {
        j.push_back(model.toJson());
    }
    return j;
}

}  // namespace config
}  // namespace rcs
