#pragma once

// =============================================================================
// Run Config Search - Search Dimensions
// =============================================================================
//
// A Dimension is one tunable axis (max batch size, instance count, ...).
// A DimensionSet groups dimensions per search unit and maps a flat
// Coordinate onto per-unit, per-dimension integer values.
//
// Value resolution:
// - Exponential: 2^max(slot, min)
// - Linear:      max(slot, min) + 1   (one-based, slot 0 = one instance)
//

#include "run_config_search/error.h"
#include "run_config_search/search/coordinate.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace rcs {
namespace search {

// =============================================================================
// Dimension
// =============================================================================

/// Growth law of a dimension
enum class DimensionLaw : uint8_t {
    kLinear = 0,
    kExponential = 1,
};

std::string_view dimensionLawToString(DimensionLaw law);

/// Well-known dimension names
inline constexpr std::string_view kMaxBatchSizeDimension = "max_batch_size";
inline constexpr std::string_view kInstanceCountDimension = "instance_count";
inline constexpr std::string_view kConcurrencyDimension = "concurrency";

class Dimension {
  public:
    Dimension(std::string name, DimensionLaw law, uint32_t min = 0)
        : name_(std::move(name)), law_(law), min_(min) {}

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] DimensionLaw law() const { return law_; }
    [[nodiscard]] uint32_t min() const { return min_; }

    /// Resolve a coordinate slot to the concrete value of this axis
    [[nodiscard]] int64_t valueAt(uint32_t slot) const;

    bool operator==(const Dimension& other) const = default;

  private:
    std::string name_;
    DimensionLaw law_;
    uint32_t min_;
};

/// Resolved values of one search unit, keyed by dimension name
using DimensionValues = std::map<std::string, int64_t>;

// =============================================================================
// DimensionSet
// =============================================================================

class DimensionSet {
  public:
    struct Slot {
        size_t entity_index = 0;
        Dimension dimension;
    };

    DimensionSet() = default;

    /// Append the dimensions of one search unit. Units must be added in
    /// order 0, 1, 2, ... and each exactly once.
    Result<void> addDimensions(size_t entity_index, std::vector<Dimension> dimensions);

    /// Resolve a coordinate to one value map per search unit
    [[nodiscard]] Result<std::vector<DimensionValues>> valuesFor(const Coordinate& coordinate) const;

    /// Coordinate with every slot at its dimension's minimum
    [[nodiscard]] Coordinate startingCoordinate() const;

    [[nodiscard]] size_t numSlots() const { return slots_.size(); }
    [[nodiscard]] size_t numEntities() const { return num_entities_; }
    [[nodiscard]] bool empty() const { return slots_.empty(); }

    [[nodiscard]] const Slot& slot(size_t index) const { return slots_[index]; }
    [[nodiscard]] const std::vector<Slot>& slots() const { return slots_; }

    /// Dimensions of one search unit, in slot order
    [[nodiscard]] std::vector<Dimension> dimensionsFor(size_t entity_index) const;

  private:
    std::vector<Slot> slots_;
    size_t num_entities_ = 0;
};

}  // namespace search
}  // namespace rcs
