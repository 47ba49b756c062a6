// =============================================================================
// Run Config Search - Neighborhood Implementation
// =============================================================================

#include "run_config_search/search/neighborhood.h"

namespace rcs {
namespace search {

int compareMeasurements(const std::optional<record::RunMeasurement>& a,
                        const std::optional<record::RunMeasurement>& b,
                        const result::ModelConstraints& constraints) {
    if (!a || !b) {
        return (a ? 1 : 0) - (b ? 1 : 0);
    }

    bool a_feasible = result::ConstraintEvaluator::satisfies(constraints, *a);
    bool b_feasible = result::ConstraintEvaluator::satisfies(constraints, *b);
    if (a_feasible != b_feasible) {
        return a_feasible ? 1 : -1;
    }
    if (!a_feasible) {
        double a_score = result::ConstraintEvaluator::infeasibilityScore(constraints, *a);
        double b_score = result::ConstraintEvaluator::infeasibilityScore(constraints, *b);
        if (a_score != b_score) {
            return a_score < b_score ? 1 : -1;
        }
    }

    double gain = a->weightedPercentageGain(*b);
    if (gain > 0.0) {
        return 1;
    }
    return gain < 0.0 ? -1 : 0;
}

size_t Neighborhood::numInitialized() const {
    size_t count = 0;
    for (const auto& entry : *measured_) {
        if (contains(entry.first)) {
            ++count;
        }
    }
    return count;
}

std::optional<Coordinate> Neighborhood::pickCoordinateToInitialize() const {
    if (measured_->count(home_) == 0) {
        return home_;
    }
    for (const auto& neighbor : home_.neighborsWithinRadius(radius_)) {
        if (measured_->count(neighbor) == 0) {
            return neighbor;
        }
    }
    return std::nullopt;
}

std::optional<Coordinate> Neighborhood::determineBestCoordinate(
    const result::ModelConstraints& constraints) const {
    auto home_entry = measured_->find(home_);
    const std::pair<const Coordinate, std::optional<record::RunMeasurement>>* best =
        home_entry == measured_->end() ? nullptr : &*home_entry;

    for (const auto& entry : *measured_) {
        if (!contains(entry.first) || (best && &entry == best)) {
            continue;
        }
        if (!best) {
            best = &entry;
            continue;
        }
        int order = compareMeasurements(entry.second, best->second, constraints);
        bool home_is_best = best->first == home_;
        if (order > 0 || (order == 0 && !home_is_best && entry.first.values() < best->first.values())) {
            best = &entry;
        }
    }

    if (!best) {
        return std::nullopt;
    }
    return best->first;
}

}  // namespace search
}  // namespace rcs
