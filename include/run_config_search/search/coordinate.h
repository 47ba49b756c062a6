#pragma once

// =============================================================================
// Run Config Search - Coordinate
// =============================================================================
//
// An immutable point in the discrete search space: one non-negative integer
// per DimensionSet slot. Transitions always produce a new Coordinate.
//
// NeighborRange enumerates, lazily and in a fixed order, every coordinate
// within a Chebyshev radius of an origin. It stores only the origin and the
// radius; each iterator stores its own copy of the origin and one offset
// vector, so iterators stay valid after the range is gone.
//

#include "run_config_search/error.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <string>
#include <vector>

namespace rcs {
namespace search {

class NeighborRange;

// =============================================================================
// Coordinate
// =============================================================================

class Coordinate {
  public:
    Coordinate() = default;
    explicit Coordinate(std::vector<uint32_t> values) : values_(std::move(values)) {}
    Coordinate(std::initializer_list<uint32_t> values) : values_(values) {}

    /// Build from signed values; negative slots are rejected
    [[nodiscard]] static Result<Coordinate> create(const std::vector<int64_t>& values);

    [[nodiscard]] size_t size() const { return values_.size(); }
    [[nodiscard]] bool empty() const { return values_.empty(); }
    [[nodiscard]] uint32_t operator[](size_t slot) const { return values_[slot]; }
    [[nodiscard]] const std::vector<uint32_t>& values() const { return values_; }

    /// New coordinate with `slot` floored to `lower_bound`
    [[nodiscard]] Result<Coordinate> clampToBound(size_t slot, uint32_t lower_bound) const;

    /// All coordinates within Chebyshev distance `radius`, origin excluded
    [[nodiscard]] NeighborRange neighborsWithinRadius(uint32_t radius) const;

    /// Chebyshev (max absolute slot delta) distance; sizes must match
    [[nodiscard]] uint32_t distanceTo(const Coordinate& other) const;

    [[nodiscard]] std::string toString() const;

    bool operator==(const Coordinate& other) const = default;

  private:
    std::vector<uint32_t> values_;
};

// =============================================================================
// NeighborRange
// =============================================================================

class NeighborRange {
  public:
    class Iterator {
      public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Coordinate;
        using difference_type = std::ptrdiff_t;
        using pointer = const Coordinate*;
        using reference = const Coordinate&;

        Iterator() = default;

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }

        Iterator& operator++();
        Iterator operator++(int) {
            Iterator tmp = *this;
            ++(*this);
            return tmp;
        }

        bool operator==(const Iterator& other) const {
            return done_ == other.done_ && (done_ || offsets_ == other.offsets_);
        }

      private:
        friend class NeighborRange;
        Iterator(const Coordinate& origin, uint32_t radius);

        // Advance the odometer once; false when exhausted
        bool step();
        // Advance until a valid neighbor or the end is reached
        void settle();
        [[nodiscard]] bool isValid() const;

        Coordinate origin_;
        int64_t radius_ = 0;
        std::vector<int64_t> offsets_;
        Coordinate current_;
        bool done_ = true;
    };

    NeighborRange(Coordinate origin, uint32_t radius)
        : origin_(std::move(origin)), radius_(radius) {}

    [[nodiscard]] Iterator begin() const { return Iterator(origin_, radius_); }
    [[nodiscard]] Iterator end() const { return Iterator(); }

    [[nodiscard]] const Coordinate& origin() const { return origin_; }
    [[nodiscard]] uint32_t radius() const { return radius_; }

  private:
    Coordinate origin_;
    uint32_t radius_;
};

}  // namespace search
}  // namespace rcs

// Hash function for std::unordered_map
template <>
struct std::hash<rcs::search::Coordinate> {
    size_t operator()(const rcs::search::Coordinate& coordinate) const noexcept {
        size_t seed = coordinate.size();
        for (uint32_t v : coordinate.values()) {
            seed ^= std::hash<uint32_t>{}(v) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        }
        return seed;
    }
};
