#pragma once

// =============================================================================
// Run Config Search - Quick Config Generator
// =============================================================================
//
// Turns coordinates of a discrete search space into concrete, named run
// configurations for one or more models served together.
//
// The generator has two phases:
//   kDefault  - the first nextRunConfig() yields each model's baseline with
//               only the mandatory defaults applied
//   kStepping - every later call resolves coordinateToMeasure() through the
//               DimensionSet, clamps against GlobalBounds and builds one
//               variant per model (per stage for ensembles)
//
// The generator is single-threaded; callers move the cursor with
// setCoordinateToMeasure() between calls. The VariantNameRegistry may be
// shared with other generators.
//

#include "run_config_search/config/model_config.h"
#include "run_config_search/config/variant_name_registry.h"
#include "run_config_search/error.h"
#include "run_config_search/search/coordinate.h"
#include "run_config_search/search/search_config.h"

#include <memory>
#include <string_view>
#include <vector>

namespace rcs {
namespace search {

enum class GeneratorPhase : uint8_t {
    kDefault = 0,
    kStepping = 1,
};

std::string_view generatorPhaseToString(GeneratorPhase phase);

class QuickConfigGenerator {
  public:
    /// Validates the bounds and that the DimensionSet has one entity per
    /// search unit (one per plain model, one per ensemble stage).
    [[nodiscard]] static Result<QuickConfigGenerator> create(
        SearchConfig config, GlobalBounds bounds, std::vector<config::ModelSpec> models,
        std::shared_ptr<config::VariantNameRegistry> registry);

    /// Default configuration on the first call, then the configuration at
    /// coordinateToMeasure() on every later call.
    [[nodiscard]] Result<config::RunConfig> nextRunConfig();

    /// Baseline-derived configuration; does not change the phase
    [[nodiscard]] Result<config::RunConfig> defaultRunConfig();

    /// Configuration at an arbitrary coordinate; does not move the cursor
    [[nodiscard]] Result<config::RunConfig> runConfigFor(const Coordinate& coordinate);

    [[nodiscard]] const Coordinate& coordinateToMeasure() const { return cursor_; }
    Result<void> setCoordinateToMeasure(Coordinate coordinate);

    [[nodiscard]] GeneratorPhase phase() const { return phase_; }
    [[nodiscard]] const SearchConfig& searchConfig() const { return config_; }
    [[nodiscard]] const GlobalBounds& bounds() const { return bounds_; }
    [[nodiscard]] const std::vector<config::ModelSpec>& models() const { return models_; }
    [[nodiscard]] size_t numSearchUnits() const { return num_units_; }

  private:
    // Resolved knobs of one search unit
    struct UnitSettings {
        int64_t batch_size = 1;
        int64_t instance_count = 1;
        int64_t concurrency = 1;
    };

    QuickConfigGenerator(SearchConfig config, GlobalBounds bounds,
                         std::vector<config::ModelSpec> models,
                         std::shared_ptr<config::VariantNameRegistry> registry);

    [[nodiscard]] UnitSettings resolveUnit(const DimensionValues& values,
                                           const config::ModelConfig& baseline) const;
    [[nodiscard]] int64_t defaultConcurrency(const config::ModelConfig& baseline) const;

    // Variant of a plain model (or stage) with the given settings
    [[nodiscard]] Result<config::ModelConfig> buildVariant(const config::ModelSpec& spec,
                                                           const UnitSettings& settings);
    [[nodiscard]] Result<config::ModelConfig> buildDefaultVariant(const config::ModelSpec& spec);

    // Composite config pointing its steps at the stage variants
    [[nodiscard]] Result<config::ModelConfig> buildComposite(
        const config::ModelSpec& spec, const std::vector<config::ModelConfig>& stages,
        bool is_default);

    [[nodiscard]] config::BenchmarkParams buildBenchmarkParams(const config::ModelSpec& spec,
                                                               const std::string& variant_name,
                                                               int64_t concurrency) const;

    [[nodiscard]] int64_t compositeConcurrency(const std::vector<int64_t>& stage_values) const;

    SearchConfig config_;
    GlobalBounds bounds_;
    std::vector<config::ModelSpec> models_;
    std::shared_ptr<config::VariantNameRegistry> registry_;
    size_t num_units_ = 0;
    Coordinate cursor_;
    GeneratorPhase phase_ = GeneratorPhase::kDefault;
};

}  // namespace search
}  // namespace rcs
