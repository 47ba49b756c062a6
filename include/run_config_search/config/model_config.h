#pragma once

// =============================================================================
// Run Config Search - Model Configurations
// =============================================================================
//
// ModelConfig    - a model's serving configuration as a JSON field mapping
//                  (the baseline's shape; the search overwrites a few fields)
// ModelSpec      - one model taking part in a search: its baseline, its
//                  benchmark flags and, for ensembles, its ordered stages
// BenchmarkParams- flags handed to the benchmarking tool for one model
// ModelRunConfig - one model's generated variant (+ stage variants)
// RunConfig      - everything measured together in one step
//

#include "run_config_search/error.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace rcs {
namespace config {

// Baseline fields read or written by the search
inline constexpr std::string_view kNameField = "name";
inline constexpr std::string_view kInputField = "input";
inline constexpr std::string_view kMaxBatchSizeField = "max_batch_size";
inline constexpr std::string_view kInstanceGroupField = "instance_group";
inline constexpr std::string_view kDynamicBatchingField = "dynamic_batching";
inline constexpr std::string_view kSequenceBatchingField = "sequence_batching";
inline constexpr std::string_view kPlatformField = "platform";
inline constexpr std::string_view kEnsembleSchedulingField = "ensemble_scheduling";

inline constexpr std::string_view kKindGpu = "KIND_GPU";
inline constexpr std::string_view kKindCpu = "KIND_CPU";

// Benchmark flags set by the search
inline constexpr std::string_view kModelNameFlag = "model-name";
inline constexpr std::string_view kBatchSizeFlag = "batch-size";
inline constexpr std::string_view kConcurrencyRangeFlag = "concurrency-range";

// =============================================================================
// ModelConfig
// =============================================================================

class ModelConfig {
  public:
    ModelConfig() : fields_(nlohmann::json::object()) {}
    explicit ModelConfig(nlohmann::json fields) : fields_(std::move(fields)) {}

    [[nodiscard]] const nlohmann::json& toJson() const { return fields_; }

    [[nodiscard]] std::string name() const;
    void setName(const std::string& name) { fields_[std::string(kNameField)] = name; }

    [[nodiscard]] bool hasField(std::string_view key) const;
    /// Field value, or nullptr if absent
    [[nodiscard]] const nlohmann::json* getField(std::string_view key) const;
    void setField(std::string_view key, nlohmann::json value);
    void eraseField(std::string_view key);

    /// max_batch_size, 0 when absent (no batching support)
    [[nodiscard]] int64_t maxBatchSize() const;

    /// Total instance count over instance_group entries, 1 when absent
    [[nodiscard]] int64_t instanceCount() const;

    [[nodiscard]] bool hasSequenceBatching() const { return hasField(kSequenceBatchingField); }
    [[nodiscard]] bool hasDynamicBatching() const { return hasField(kDynamicBatchingField); }

    /// platform == "ensemble" or an ensemble_scheduling block
    [[nodiscard]] bool isEnsemble() const;

    /// ensemble_scheduling.step[].model_name, in order
    [[nodiscard]] std::vector<std::string> ensembleSteps() const;

    bool operator==(const ModelConfig& other) const { return fields_ == other.fields_; }

  private:
    nlohmann::json fields_;
};

// =============================================================================
// ModelSpec
// =============================================================================

/// Returns the baseline configuration of a model by name
using BaselineLookup = std::function<Result<nlohmann::json>(const std::string& model_name)>;

class ModelSpec {
  public:
    /// Fetch the baseline through `lookup`, validate it and, for ensembles,
    /// resolve every stage through the same lookup.
    [[nodiscard]] static Result<ModelSpec> create(
        const std::string& name, const BaselineLookup& lookup,
        nlohmann::json benchmark_flags = nlohmann::json::object(), bool cpu_only = false);

    /// Validate an already-fetched, non-ensemble baseline
    [[nodiscard]] static Result<ModelSpec> fromBaseline(
        const std::string& name, nlohmann::json baseline,
        nlohmann::json benchmark_flags = nlohmann::json::object(), bool cpu_only = false);

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const ModelConfig& baseline() const { return baseline_; }
    [[nodiscard]] const nlohmann::json& benchmarkFlags() const { return benchmark_flags_; }
    [[nodiscard]] bool cpuOnly() const { return cpu_only_; }

    [[nodiscard]] bool isComposite() const { return !stages_.empty(); }
    [[nodiscard]] const std::vector<ModelSpec>& stages() const { return stages_; }

    /// Search units this model contributes: 1, or one per stage
    [[nodiscard]] size_t numSearchUnits() const { return isComposite() ? stages_.size() : 1; }

  private:
    ModelSpec() = default;

    static Result<void> validateBaseline(const std::string& name, const nlohmann::json& baseline);

    std::string name_;
    ModelConfig baseline_;
    nlohmann::json benchmark_flags_ = nlohmann::json::object();
    bool cpu_only_ = false;
    std::vector<ModelSpec> stages_;
};

// =============================================================================
// BenchmarkParams
// =============================================================================

class BenchmarkParams {
  public:
    BenchmarkParams() : fields_(nlohmann::json::object()) {}

    void set(std::string_view key, nlohmann::json value);
    /// Flag value, or nullptr if absent
    [[nodiscard]] const nlohmann::json* get(std::string_view key) const;

    /// Copy every flag of `flags` over the current ones
    void update(const nlohmann::json& flags);

    [[nodiscard]] int64_t concurrency() const;
    [[nodiscard]] const nlohmann::json& toJson() const { return fields_; }

    /// Command-line style rendering:
    ///   -m <model-name> -b <batch-size> --concurrency-range=<n> --<flag>=<value> ...
    [[nodiscard]] std::string representation() const;

  private:
    nlohmann::json fields_;
};

// =============================================================================
// ModelRunConfig / RunConfig
// =============================================================================

struct ModelRunConfig {
    std::string model_name;  // Logical model (not variant) name
    ModelConfig model_config;
    BenchmarkParams perf_config;
    std::vector<ModelConfig> stage_configs;  // Composite models only

    [[nodiscard]] bool isComposite() const { return !stage_configs.empty(); }
    [[nodiscard]] std::string variantName() const { return model_config.name(); }
    [[nodiscard]] std::string representation() const { return perf_config.representation(); }
    [[nodiscard]] nlohmann::json toJson() const;
};

class RunConfig {
  public:
    void addModelRunConfig(ModelRunConfig config) { models_.push_back(std::move(config)); }

    [[nodiscard]] const std::vector<ModelRunConfig>& modelRunConfigs() const { return models_; }
    [[nodiscard]] size_t numModels() const { return models_.size(); }

    /// Space-joined representation of every model, identifies the run
    [[nodiscard]] std::string representation() const;

    [[nodiscard]] nlohmann::json toJson() const;

  private:
    std::vector<ModelRunConfig> models_;
};

}  // namespace config
}  // namespace rcs
