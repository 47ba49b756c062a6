// =============================================================================
// Run Config Search - Coordinate Implementation
// =============================================================================

#include "run_config_search/search/coordinate.h"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cstdlib>
#include <limits>

namespace rcs {
namespace search {

// =============================================================================
// Coordinate
// =============================================================================

Result<Coordinate> Coordinate::create(const std::vector<int64_t>& values) {
    std::vector<uint32_t> slots;
    slots.reserve(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        if (values[i] < 0 || values[i] > std::numeric_limits<uint32_t>::max()) {
            RCS_RETURN_ERROR(ErrorCode::kInvalidCoordinate,
                             fmt::format("slot {} has out-of-range value {}", i, values[i]));
        }
        slots.push_back(static_cast<uint32_t>(values[i]));
    }
    return Coordinate(std::move(slots));
}

Result<Coordinate> Coordinate::clampToBound(size_t slot, uint32_t lower_bound) const {
    if (slot >= values_.size()) {
        RCS_RETURN_ERROR(ErrorCode::kDimensionMismatch,
                         fmt::format("slot {} out of range for coordinate of size {}", slot,
                                     values_.size()));
    }
    std::vector<uint32_t> clamped = values_;
    clamped[slot] = std::max(clamped[slot], lower_bound);
    return Coordinate(std::move(clamped));
}

NeighborRange Coordinate::neighborsWithinRadius(uint32_t radius) const {
    return NeighborRange(*this, radius);
}

uint32_t Coordinate::distanceTo(const Coordinate& other) const {
    RCS_ASSERT(size() == other.size());
    uint32_t distance = 0;
    for (size_t i = 0; i < values_.size(); ++i) {
        int64_t delta = static_cast<int64_t>(values_[i]) - static_cast<int64_t>(other.values_[i]);
        distance = std::max(distance, static_cast<uint32_t>(std::llabs(delta)));
    }
    return distance;
}

std::string Coordinate::toString() const {
    return fmt::format("[{}]", fmt::join(values_, ", "));
}

// =============================================================================
// NeighborRange::Iterator
// =============================================================================
//
// Odometer over per-slot offsets, slot 0 most significant. Each slot runs
// from max(-radius, -origin[slot]) to +radius, so no neighbor ever has a
// negative slot; the all-zero offset (the origin itself) is skipped.

NeighborRange::Iterator::Iterator(const Coordinate& origin, uint32_t radius)
    : origin_(origin), radius_(radius) {
    if (origin_.empty() || radius_ == 0) {
        done_ = true;
        return;
    }

    offsets_.resize(origin_.size());
    for (size_t i = 0; i < offsets_.size(); ++i) {
        offsets_[i] = std::max(-radius_, -static_cast<int64_t>(origin_[i]));
    }
    done_ = false;
    settle();
}

NeighborRange::Iterator& NeighborRange::Iterator::operator++() {
    if (done_) {
        return *this;
    }
    if (!step()) {
        done_ = true;
        return *this;
    }
    settle();
    return *this;
}

bool NeighborRange::Iterator::step() {
    for (size_t i = offsets_.size(); i-- > 0;) {
        if (offsets_[i] < radius_) {
            ++offsets_[i];
            return true;
        }
        offsets_[i] = std::max(-radius_, -static_cast<int64_t>(origin_[i]));
    }
    return false;
}

bool NeighborRange::Iterator::isValid() const {
    return std::any_of(offsets_.begin(), offsets_.end(), [](int64_t o) { return o != 0; });
}

void NeighborRange::Iterator::settle() {
    while (!isValid()) {
        if (!step()) {
            done_ = true;
            offsets_.clear();
            return;
        }
    }

    std::vector<uint32_t> values(offsets_.size());
    for (size_t i = 0; i < offsets_.size(); ++i) {
        values[i] = static_cast<uint32_t>(static_cast<int64_t>(origin_[i]) + offsets_[i]);
    }
    current_ = Coordinate(std::move(values));
}

}  // namespace search
}  // namespace rcs
