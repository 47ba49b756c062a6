// =============================================================================
// Run Config Search - Run Measurements Implementation
// =============================================================================

#include "run_config_search/record/run_measurement.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace rcs {
namespace record {

Objectives defaultObjectives() {
    return Objectives{{std::string(kPerfThroughput), 1.0}};
}

// =============================================================================
// ModelMeasurement
// =============================================================================

ModelMeasurement::ModelMeasurement(std::string variant_name, std::vector<Record> records)
    : variant_name_(std::move(variant_name)) {
    for (const auto& record : records) {
        set(record);
    }
}

void ModelMeasurement::set(const Record& record) {
    auto it = std::find_if(records_.begin(), records_.end(),
                           [&](const Record& r) { return r.tag() == record.tag(); });
    if (it != records_.end()) {
        *it = record;
    } else {
        records_.push_back(record);
    }
}

const Record* ModelMeasurement::find(std::string_view tag) const {
    auto it = std::find_if(records_.begin(), records_.end(),
                           [&](const Record& r) { return r.tag() == tag; });
    return it == records_.end() ? nullptr : &*it;
}

double ModelMeasurement::weightedPercentageGain(const ModelMeasurement& other,
                                                const Objectives& objectives) const {
    double total_weight = 0.0;
    for (const auto& [tag, weight] : objectives) {
        if (find(tag) && other.find(tag)) {
            total_weight += weight;
        }
    }
    if (total_weight <= 0.0) {
        return 0.0;
    }

    double gain = 0.0;
    for (const auto& [tag, weight] : objectives) {
        const Record* mine = find(tag);
        const Record* theirs = other.find(tag);
        if (!mine || !theirs) {
            continue;
        }
        gain += (weight / total_weight) * percentageGain(*theirs, *mine);
    }
    return gain;
}

// =============================================================================
// RunMeasurement
// =============================================================================

void RunMeasurement::addModel(ModelMeasurement measurement, Objectives objectives) {
    models_.push_back(std::move(measurement));
    objectives_.push_back(std::move(objectives));
}

double RunMeasurement::weightedPercentageGain(const RunMeasurement& other) const {
    size_t count = std::min(models_.size(), other.models_.size());
    if (count == 0) {
        return 0.0;
    }
    if (models_.size() != other.models_.size()) {
        spdlog::warn("Comparing run measurements with {} and {} models", models_.size(),
                     other.models_.size());
    }

    double gain = 0.0;
    for (size_t i = 0; i < count; ++i) {
        gain += models_[i].weightedPercentageGain(other.models_[i], objectives_[i]);
    }
    return gain / static_cast<double>(count);
}

std::optional<Record> RunMeasurement::aggregate(std::string_view tag) const {
    std::optional<Record> total;
    for (const auto& model : models_) {
        const Record* record = model.find(tag);
        if (!record) {
            continue;
        }
        total = total ? total->withValue(total->value() + record->value()) : *record;
    }
    return total;
}

}  // namespace record
}  // namespace rcs
