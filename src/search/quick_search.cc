// =============================================================================
// Run Config Search - Quick Search Implementation
// =============================================================================

#include "run_config_search/search/quick_search.h"

#include <spdlog/spdlog.h>

namespace rcs {
namespace search {

QuickSearch::QuickSearch(QuickConfigGenerator& generator, result::ModelConstraints constraints,
                         uint32_t max_steps)
    : generator_(generator), constraints_(std::move(constraints)), max_steps_(max_steps) {}

const std::optional<record::RunMeasurement>& QuickSearch::measureOnce(
    const config::RunConfig& run_config, const MeasureFn& measure) {
    std::string key = run_config.representation();
    auto it = by_representation_.find(key);
    if (it != by_representation_.end()) {
        spdlog::debug("Reusing measurement of {}", key);
        return it->second;
    }

    auto measurement = measure(run_config);
    ++summary_.num_measurements;
    if (!measurement) {
        spdlog::warn("Measurement failed for {}", key);
    }
    return by_representation_.emplace(std::move(key), std::move(measurement)).first->second;
}

void QuickSearch::consider(const config::RunConfig& run_config,
                           const std::optional<record::RunMeasurement>& measurement,
                           std::optional<Coordinate> coordinate) {
    if (!measurement) {
        return;
    }
    if (have_best_ && compareMeasurements(measurement, summary_.best_measurement, constraints_) <= 0) {
        return;
    }
    have_best_ = true;
    summary_.best_config = run_config;
    summary_.best_measurement = measurement;
    summary_.best_coordinate = std::move(coordinate);
    summary_.best_is_feasible = result::ConstraintEvaluator::satisfies(constraints_, *measurement);
}

Result<void> QuickSearch::measureCoordinate(const Coordinate& coordinate, const MeasureFn& measure) {
    auto moved = generator_.setCoordinateToMeasure(coordinate);
    if (!moved) {
        return moved;
    }
    auto run_config = generator_.nextRunConfig();
    if (!run_config) {
        return run_config.error();
    }

    const auto& measurement = measureOnce(*run_config, measure);
    measured_[coordinate] = measurement;
    consider(*run_config, measurement, coordinate);
    return {};
}

Result<SearchSummary> QuickSearch::run(const MeasureFn& measure) {
    if (!measure) {
        RCS_RETURN_ERROR(ErrorCode::kInvalidInput, "measure function is empty");
    }

    if (generator_.phase() == GeneratorPhase::kDefault) {
        auto run_config = generator_.nextRunConfig();
        if (!run_config) {
            return run_config.error();
        }
        const auto& measurement = measureOnce(*run_config, measure);
        consider(*run_config, measurement, std::nullopt);
    }

    const SearchConfig& config = generator_.searchConfig();
    Coordinate home = generator_.coordinateToMeasure();

    for (;;) {
        Neighborhood neighborhood(measured_, home, config.radius, config.min_initialized);

        while (!neighborhood.enoughCoordinatesInitialized()) {
            auto next = neighborhood.pickCoordinateToInitialize();
            if (!next) {
                break;
            }
            auto measured = measureCoordinate(*next, measure);
            if (!measured) {
                return measured.error();
            }
        }
        if (measured_.count(home) == 0) {
            auto measured = measureCoordinate(home, measure);
            if (!measured) {
                return measured.error();
            }
        }

        auto best = neighborhood.determineBestCoordinate(constraints_);
        if (!best || *best == home) {
            spdlog::info("Search converged at {} after {} steps", home.toString(), summary_.num_steps);
            break;
        }
        if (summary_.num_steps >= max_steps_) {
            spdlog::info("Search stopped after {} steps at {}", max_steps_, home.toString());
            break;
        }
        spdlog::info("Moving home {} -> {}", home.toString(), best->toString());
        home = *best;
        ++summary_.num_steps;
    }

    return summary_;
}

}  // namespace search
}  // namespace rcs
