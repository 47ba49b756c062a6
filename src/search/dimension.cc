// =============================================================================
// Run Config Search - Search Dimensions Implementation
// =============================================================================

#include "run_config_search/search/dimension.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace rcs {
namespace search {

std::string_view dimensionLawToString(DimensionLaw law) {
    switch (law) {
    case DimensionLaw::kLinear:
        return "linear";
    case DimensionLaw::kExponential:
        return "exponential";
    default:
        return "unknown";
    }
}

// =============================================================================
// Dimension
// =============================================================================

int64_t Dimension::valueAt(uint32_t slot) const {
    uint32_t effective = std::max(slot, min_);

    if (law_ == DimensionLaw::kExponential) {
        effective = std::min(effective, kMaxExponentialSlot);
        return int64_t{1} << effective;
    }

    // One-based: slot 0 resolves to 1
    return static_cast<int64_t>(effective) + 1;
}

// =============================================================================
// DimensionSet
// =============================================================================

Result<void> DimensionSet::addDimensions(size_t entity_index, std::vector<Dimension> dimensions) {
    if (entity_index != num_entities_) {
        RCS_RETURN_ERROR(ErrorCode::kDimensionMismatch,
                         fmt::format("dimensions for entity {} added out of order (expected {})",
                                     entity_index, num_entities_));
    }

    for (auto& dimension : dimensions) {
        slots_.push_back(Slot{entity_index, std::move(dimension)});
    }
    ++num_entities_;

    spdlog::debug("DimensionSet: entity {} now spans {} slots total", entity_index,
                  slots_.size());
    return {};
}

Result<std::vector<DimensionValues>> DimensionSet::valuesFor(const Coordinate& coordinate) const {
    if (coordinate.size() != slots_.size()) {
        RCS_RETURN_ERROR(ErrorCode::kDimensionMismatch,
                         fmt::format("coordinate {} has {} slots, dimension set has {}",
                                     coordinate.toString(), coordinate.size(), slots_.size()));
    }

    std::vector<DimensionValues> values(num_entities_);
    for (size_t i = 0; i < slots_.size(); ++i) {
        const auto& slot = slots_[i];
        values[slot.entity_index][slot.dimension.name()] = slot.dimension.valueAt(coordinate[i]);
    }
    return values;
}

Coordinate DimensionSet::startingCoordinate() const {
    std::vector<uint32_t> values;
    values.reserve(slots_.size());
    for (const auto& slot : slots_) {
        values.push_back(slot.dimension.min());
    }
    return Coordinate(std::move(values));
}

std::vector<Dimension> DimensionSet::dimensionsFor(size_t entity_index) const {
    std::vector<Dimension> result;
    for (const auto& slot : slots_) {
        if (slot.entity_index == entity_index) {
            result.push_back(slot.dimension);
        }
    }
    return result;
}

}  // namespace search
}  // namespace rcs
