#pragma once

// =============================================================================
// Run Config Search - Neighborhood
// =============================================================================
//
// The set of coordinates within a Chebyshev radius of a home coordinate
// (home included), viewed against the measurements taken so far.
//

#include "run_config_search/record/run_measurement.h"
#include "run_config_search/result/constraint_evaluator.h"
#include "run_config_search/search/coordinate.h"

#include <cstdint>
#include <optional>
#include <unordered_map>

namespace rcs {
namespace search {

/// Measurement per coordinate; nullopt marks a run that failed
using MeasuredCoordinates = std::unordered_map<Coordinate, std::optional<record::RunMeasurement>>;

/// Feasibility-aware ranking of two measurements. Positive if `a` is better.
/// A missing measurement loses to any present one; a feasible one beats an
/// infeasible one; two infeasible ones compare by infeasibility score first.
int compareMeasurements(const std::optional<record::RunMeasurement>& a,
                        const std::optional<record::RunMeasurement>& b,
                        const result::ModelConstraints& constraints);

class Neighborhood {
  public:
    Neighborhood(const MeasuredCoordinates& measured, Coordinate home, uint32_t radius,
                 uint32_t min_initialized)
        : measured_(&measured),
          home_(std::move(home)),
          radius_(radius),
          min_initialized_(min_initialized) {}

    [[nodiscard]] const Coordinate& home() const { return home_; }
    [[nodiscard]] uint32_t radius() const { return radius_; }

    [[nodiscard]] bool contains(const Coordinate& coordinate) const {
        return coordinate.size() == home_.size() && home_.distanceTo(coordinate) <= radius_;
    }

    /// Measured coordinates in the neighborhood, home included
    [[nodiscard]] size_t numInitialized() const;
    [[nodiscard]] bool enoughCoordinatesInitialized() const {
        return numInitialized() >= min_initialized_;
    }

    /// First unmeasured coordinate in neighbor order, home first
    [[nodiscard]] std::optional<Coordinate> pickCoordinateToInitialize() const;

    /// Best measured coordinate in the neighborhood. Home wins ties; other
    /// ties go to the lexicographically smallest coordinate.
    [[nodiscard]] std::optional<Coordinate> determineBestCoordinate(
        const result::ModelConstraints& constraints) const;

  private:
    const MeasuredCoordinates* measured_;
    Coordinate home_;
    uint32_t radius_;
    uint32_t min_initialized_;
};

}  // namespace search
}  // namespace rcs
