#pragma once

// =============================================================================
// Run Config Search - Quick Search
// =============================================================================
//
// Hill-climbing driver around a QuickConfigGenerator:
//   1. Measure the default configuration.
//   2. From the home coordinate, measure neighbors until min_initialized
//      coordinates of the neighborhood have results.
//   3. Move home to the best coordinate of the neighborhood.
//   4. Stop when home is already the best, or after max_steps moves.
//
// Measuring is delegated to a caller-supplied function; returning nullopt
// marks the run as failed (ranked below every successful run).
//

#include "run_config_search/config/model_config.h"
#include "run_config_search/error.h"
#include "run_config_search/record/run_measurement.h"
#include "run_config_search/result/constraint_evaluator.h"
#include "run_config_search/search/neighborhood.h"
#include "run_config_search/search/quick_config_generator.h"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace rcs {
namespace search {

using MeasureFn = std::function<std::optional<record::RunMeasurement>(const config::RunConfig&)>;

struct SearchSummary {
    std::optional<config::RunConfig> best_config;
    std::optional<record::RunMeasurement> best_measurement;
    std::optional<Coordinate> best_coordinate;  // Unset when the default won
    bool best_is_feasible = false;
    size_t num_measurements = 0;  // Distinct runs handed to the measure function
    size_t num_steps = 0;         // Home moves

    [[nodiscard]] std::string bestRepresentation() const {
        return best_config ? best_config->representation() : std::string();
    }
};

class QuickSearch {
  public:
    QuickSearch(QuickConfigGenerator& generator, result::ModelConstraints constraints,
                uint32_t max_steps = kDefaultMaxSteps);

    [[nodiscard]] Result<SearchSummary> run(const MeasureFn& measure);

    [[nodiscard]] const MeasuredCoordinates& measured() const { return measured_; }

  private:
    // Generate, measure (or reuse) and record the run at `coordinate`
    Result<void> measureCoordinate(const Coordinate& coordinate, const MeasureFn& measure);

    const std::optional<record::RunMeasurement>& measureOnce(const config::RunConfig& run_config,
                                                             const MeasureFn& measure);

    void consider(const config::RunConfig& run_config,
                  const std::optional<record::RunMeasurement>& measurement,
                  std::optional<Coordinate> coordinate);

    QuickConfigGenerator& generator_;
    result::ModelConstraints constraints_;
    uint32_t max_steps_;

    MeasuredCoordinates measured_;
    std::unordered_map<std::string, std::optional<record::RunMeasurement>> by_representation_;
    SearchSummary summary_;
    bool have_best_ = false;
};

}  // namespace search
}  // namespace rcs
