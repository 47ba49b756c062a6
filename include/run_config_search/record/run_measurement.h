#pragma once

// =============================================================================
// Run Config Search - Run Measurements
// =============================================================================
//
// ModelMeasurement holds the records measured for one model variant.
// RunMeasurement holds one ModelMeasurement per model of a multi-model run,
// in the same order as the RunConfig that produced it, together with each
// model's objectives (metric tag -> weight) used to rank runs.
//

#include "run_config_search/record/record.h"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rcs {
namespace record {

/// Metric tag -> relative weight
using Objectives = std::map<std::string, double, std::less<>>;

/// Throughput only
[[nodiscard]] Objectives defaultObjectives();

// =============================================================================
// ModelMeasurement
// =============================================================================

class ModelMeasurement {
  public:
    ModelMeasurement() = default;
    explicit ModelMeasurement(std::string variant_name) : variant_name_(std::move(variant_name)) {}
    ModelMeasurement(std::string variant_name, std::vector<Record> records);

    [[nodiscard]] const std::string& variantName() const { return variant_name_; }
    [[nodiscard]] const std::vector<Record>& records() const { return records_; }

    /// Insert or replace the record with the same tag
    void set(const Record& record);

    /// Record for `tag`, or nullptr
    [[nodiscard]] const Record* find(std::string_view tag) const;

    /// Weighted percentage gain of this measurement over `other`
    [[nodiscard]] double weightedPercentageGain(const ModelMeasurement& other,
                                                const Objectives& objectives) const;

  private:
    std::string variant_name_;
    std::vector<Record> records_;
};

// =============================================================================
// RunMeasurement
// =============================================================================

class RunMeasurement {
  public:
    RunMeasurement() = default;

    void addModel(ModelMeasurement measurement, Objectives objectives = defaultObjectives());

    [[nodiscard]] size_t numModels() const { return models_.size(); }
    [[nodiscard]] const std::vector<ModelMeasurement>& models() const { return models_; }
    [[nodiscard]] const ModelMeasurement& model(size_t index) const { return models_[index]; }
    [[nodiscard]] const Objectives& objectives(size_t index) const { return objectives_[index]; }

    /// Mean over models of each model's weighted gain over `other`.
    /// Positive means this run is better.
    [[nodiscard]] double weightedPercentageGain(const RunMeasurement& other) const;

    [[nodiscard]] bool isBetterThan(const RunMeasurement& other) const {
        return weightedPercentageGain(other) > 0.0;
    }

    /// Sum of one metric over all models, if any model reports it
    [[nodiscard]] std::optional<Record> aggregate(std::string_view tag) const;

  private:
    std::vector<ModelMeasurement> models_;
    std::vector<Objectives> objectives_;
};

}  // namespace record
}  // namespace rcs
