// =============================================================================
// Run Config Search - Quick Config Generator Implementation
// =============================================================================

#include "run_config_search/search/quick_config_generator.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace rcs {
namespace search {

std::string_view generatorPhaseToString(GeneratorPhase phase) {
    switch (phase) {
    case GeneratorPhase::kDefault:
        return "default";
    case GeneratorPhase::kStepping:
        return "stepping";
    }
    return "unknown";
}

// =============================================================================
// Construction
// =============================================================================

QuickConfigGenerator::QuickConfigGenerator(SearchConfig config, GlobalBounds bounds,
                                           std::vector<config::ModelSpec> models,
                                           std::shared_ptr<config::VariantNameRegistry> registry)
    : config_(std::move(config)),
      bounds_(std::move(bounds)),
      models_(std::move(models)),
      registry_(std::move(registry)) {
    for (const auto& model : models_) {
        num_units_ += model.numSearchUnits();
    }
    cursor_ = config_.dimensions.startingCoordinate();
}

Result<QuickConfigGenerator> QuickConfigGenerator::create(
    SearchConfig config, GlobalBounds bounds, std::vector<config::ModelSpec> models,
    std::shared_ptr<config::VariantNameRegistry> registry) {
    if (!registry) {
        RCS_RETURN_ERROR(ErrorCode::kInvalidInput, "variant name registry is null");
    }
    if (models.empty()) {
        RCS_RETURN_ERROR(ErrorCode::kInvalidInput, "no models to search");
    }
    RCS_TRY(bounds.validate());

    size_t units = 0;
    for (const auto& model : models) {
        units += model.numSearchUnits();
    }
    if (config.dimensions.numEntities() != units) {
        RCS_RETURN_ERROR(ErrorCode::kDimensionMismatch,
                         fmt::format("dimension set describes {} search units, models provide {}",
                                     config.dimensions.numEntities(), units));
    }

    spdlog::debug("Created generator over {} models, {} units, {} slots", models.size(), units,
                  config.dimensions.numSlots());
    return QuickConfigGenerator(std::move(config), std::move(bounds), std::move(models),
                                std::move(registry));
}

// =============================================================================
// Cursor / phases
// =============================================================================

Result<void> QuickConfigGenerator::setCoordinateToMeasure(Coordinate coordinate) {
    if (coordinate.size() != config_.dimensions.numSlots()) {
        RCS_RETURN_ERROR(ErrorCode::kDimensionMismatch,
                         fmt::format("coordinate {} has {} slots, expected {}",
                                     coordinate.toString(), coordinate.size(),
                                     config_.dimensions.numSlots()));
    }
    cursor_ = std::move(coordinate);
    return {};
}

Result<config::RunConfig> QuickConfigGenerator::nextRunConfig() {
    if (phase_ == GeneratorPhase::kDefault) {
        auto run_config = defaultRunConfig();
        if (run_config) {
            phase_ = GeneratorPhase::kStepping;
            spdlog::info("Default configuration generated, stepping from {}", cursor_.toString());
        }
        return run_config;
    }
    return runConfigFor(cursor_);
}

// =============================================================================
// Value resolution
// =============================================================================

QuickConfigGenerator::UnitSettings QuickConfigGenerator::resolveUnit(
    const DimensionValues& values, const config::ModelConfig& baseline) const {
    UnitSettings settings;

    auto batch = values.find(std::string(kMaxBatchSizeDimension));
    settings.batch_size = batch != values.end() ? batch->second : std::max<int64_t>(baseline.maxBatchSize(), 1);
    settings.batch_size = bounds_.clampBatchSize(settings.batch_size);

    auto instances = values.find(std::string(kInstanceCountDimension));
    settings.instance_count = instances != values.end() ? instances->second : baseline.instanceCount();
    settings.instance_count = bounds_.clampInstanceCount(settings.instance_count);

    auto concurrency = values.find(std::string(kConcurrencyDimension));
    if (config_.concurrency_mode == ConcurrencyMode::kCoordinate && concurrency != values.end()) {
        settings.concurrency = concurrency->second;
    } else {
        settings.concurrency = saturatingMultiply(
            saturatingMultiply(settings.batch_size, settings.instance_count),
            bounds_.concurrency_multiplier);
    }
    settings.concurrency = bounds_.clampConcurrency(settings.concurrency);
    return settings;
}

int64_t QuickConfigGenerator::defaultConcurrency(const config::ModelConfig& baseline) const {
    int64_t batch = std::max<int64_t>(baseline.maxBatchSize(), 1);
    return saturatingMultiply(saturatingMultiply(batch, baseline.instanceCount()),
                              bounds_.concurrency_multiplier);
}

int64_t QuickConfigGenerator::compositeConcurrency(const std::vector<int64_t>& stage_values) const {
    if (auto forced = bounds_.concurrencyOverride()) {
        return *forced;
    }
    int64_t lowest = stage_values.empty() ? 1 : *std::min_element(stage_values.begin(), stage_values.end());
    return bounds_.clampConcurrency(lowest);
}

// =============================================================================
// Variant construction
// =============================================================================

Result<config::ModelConfig> QuickConfigGenerator::buildVariant(const config::ModelSpec& spec,
                                                               const UnitSettings& settings) {
    config::ModelConfig variant = spec.baseline();
    variant.setField(config::kMaxBatchSizeField, settings.batch_size);

    nlohmann::json group;
    group["count"] = settings.instance_count;
    group["kind"] = std::string(spec.cpuOnly() ? config::kKindCpu : config::kKindGpu);
    variant.setField(config::kInstanceGroupField, nlohmann::json::array({group}));

    if (!variant.hasSequenceBatching() && !variant.hasDynamicBatching() && settings.batch_size >= 1) {
        variant.setField(config::kDynamicBatchingField, nlohmann::json::object());
    }

    std::string name;
    RCS_ASSIGN_OR_RETURN(name, registry_->nameFor(spec.name(), variant.toJson(), false));
    variant.setName(name);
    spdlog::debug("Variant {}: max_batch_size={} instances={}", name, settings.batch_size,
                  settings.instance_count);
    return variant;
}

Result<config::ModelConfig> QuickConfigGenerator::buildDefaultVariant(const config::ModelSpec& spec) {
    config::ModelConfig variant = spec.baseline();
    if (variant.maxBatchSize() > 0 && !variant.hasSequenceBatching() && !variant.hasDynamicBatching()) {
        variant.setField(config::kDynamicBatchingField, nlohmann::json::object());
    }

    std::string name;
    RCS_ASSIGN_OR_RETURN(name, registry_->nameFor(spec.name(), variant.toJson(), true));
    variant.setName(name);
    return variant;
}

Result<config::ModelConfig> QuickConfigGenerator::buildComposite(
    const config::ModelSpec& spec, const std::vector<config::ModelConfig>& stages, bool is_default) {
    config::ModelConfig composite = spec.baseline();

    const auto* scheduling = composite.getField(config::kEnsembleSchedulingField);
    if (scheduling && scheduling->is_object() && scheduling->contains("step")) {
        nlohmann::json rewritten = *scheduling;
        size_t next_stage = 0;
        for (auto& step : rewritten["step"]) {
            if (next_stage < stages.size() && step.is_object() && step.contains("model_name")) {
                step["model_name"] = stages[next_stage++].name();
            }
        }
        composite.setField(config::kEnsembleSchedulingField, std::move(rewritten));
    }

    std::string name;
    RCS_ASSIGN_OR_RETURN(name, registry_->nameFor(spec.name(), composite.toJson(), is_default));
    composite.setName(name);
    return composite;
}

config::BenchmarkParams QuickConfigGenerator::buildBenchmarkParams(const config::ModelSpec& spec,
                                                                   const std::string& variant_name,
                                                                   int64_t concurrency) const {
    config::BenchmarkParams params;
    params.update(spec.benchmarkFlags());
    params.set(config::kModelNameFlag, variant_name);
    params.set(config::kBatchSizeFlag, 1);
    params.set(config::kConcurrencyRangeFlag, concurrency);
    return params;
}

// =============================================================================
// Run configurations
// =============================================================================

Result<config::RunConfig> QuickConfigGenerator::defaultRunConfig() {
    config::RunConfig run_config;

    for (const auto& spec : models_) {
        config::ModelRunConfig model_run;
        model_run.model_name = spec.name();

        if (spec.isComposite()) {
            std::vector<int64_t> stage_concurrency;
            for (const auto& stage : spec.stages()) {
                auto variant = buildDefaultVariant(stage);
                if (!variant) {
                    return variant.error();
                }
                stage_concurrency.push_back(defaultConcurrency(stage.baseline()));
                model_run.stage_configs.push_back(std::move(*variant));
            }
            auto composite = buildComposite(spec, model_run.stage_configs, true);
            if (!composite) {
                return composite.error();
            }
            model_run.model_config = std::move(*composite);
            model_run.perf_config = buildBenchmarkParams(spec, model_run.model_config.name(),
                                                         compositeConcurrency(stage_concurrency));
        } else {
            auto variant = buildDefaultVariant(spec);
            if (!variant) {
                return variant.error();
            }
            model_run.model_config = std::move(*variant);
            model_run.perf_config = buildBenchmarkParams(
                spec, model_run.model_config.name(),
                bounds_.clampConcurrency(defaultConcurrency(spec.baseline())));
        }

        spdlog::debug("Default run config for '{}': {}", spec.name(), model_run.representation());
        run_config.addModelRunConfig(std::move(model_run));
    }
    return run_config;
}

Result<config::RunConfig> QuickConfigGenerator::runConfigFor(const Coordinate& coordinate) {
    auto values = config_.dimensions.valuesFor(coordinate);
    if (!values) {
        return values.error();
    }

    config::RunConfig run_config;
    size_t unit = 0;
    for (const auto& spec : models_) {
        config::ModelRunConfig model_run;
        model_run.model_name = spec.name();

        if (spec.isComposite()) {
            std::vector<int64_t> stage_concurrency;
            for (const auto& stage : spec.stages()) {
                UnitSettings settings = resolveUnit((*values)[unit++], stage.baseline());
                auto variant = buildVariant(stage, settings);
                if (!variant) {
                    return variant.error();
                }
                stage_concurrency.push_back(settings.concurrency);
                model_run.stage_configs.push_back(std::move(*variant));
            }
            auto composite = buildComposite(spec, model_run.stage_configs, false);
            if (!composite) {
                return composite.error();
            }
            model_run.model_config = std::move(*composite);
            model_run.perf_config = buildBenchmarkParams(spec, model_run.model_config.name(),
                                                         compositeConcurrency(stage_concurrency));
        } else {
            UnitSettings settings = resolveUnit((*values)[unit++], spec.baseline());
            auto variant = buildVariant(spec, settings);
            if (!variant) {
                return variant.error();
            }
            model_run.model_config = std::move(*variant);
            model_run.perf_config =
                buildBenchmarkParams(spec, model_run.model_config.name(), settings.concurrency);
        }

        run_config.addModelRunConfig(std::move(model_run));
    }

    spdlog::debug("Run config at {}: {}", coordinate.toString(), run_config.representation());
    return run_config;
}

}  // namespace search
}  // namespace rcs
