// =============================================================================
// Run Config Search - Dimension Tests
// =============================================================================

#include "run_config_search/search/dimension.h"

#include <gtest/gtest.h>

namespace rcs {
namespace search {
namespace {

DimensionSet makeBatchInstanceSet(size_t num_entities) {
    DimensionSet set;
    for (size_t i = 0; i < num_entities; ++i) {
        auto added = set.addDimensions(i, {Dimension(std::string(kMaxBatchSizeDimension),
                                                     DimensionLaw::kExponential),
                                           Dimension(std::string(kInstanceCountDimension),
                                                     DimensionLaw::kLinear)});
        EXPECT_TRUE(added);
    }
    return set;
}

TEST(DimensionTest, ExponentialValues) {
    Dimension d("max_batch_size", DimensionLaw::kExponential);
    EXPECT_EQ(d.valueAt(0), 1);
    EXPECT_EQ(d.valueAt(1), 2);
    EXPECT_EQ(d.valueAt(5), 32);
    EXPECT_EQ(d.valueAt(10), 1024);
}

TEST(DimensionTest, LinearValuesAreOneBased) {
    Dimension d("instance_count", DimensionLaw::kLinear);
    EXPECT_EQ(d.valueAt(0), 1);
    EXPECT_EQ(d.valueAt(1), 2);
    EXPECT_EQ(d.valueAt(7), 8);
}

TEST(DimensionTest, MinimumFloorsTheSlot) {
    Dimension linear("instance_count", DimensionLaw::kLinear, 3);
    EXPECT_EQ(linear.valueAt(0), 4);
    EXPECT_EQ(linear.valueAt(3), 4);
    EXPECT_EQ(linear.valueAt(4), 5);

    Dimension exponential("max_batch_size", DimensionLaw::kExponential, 2);
    EXPECT_EQ(exponential.valueAt(0), 4);
    EXPECT_EQ(exponential.valueAt(6), 64);
}

TEST(DimensionTest, ExponentialSaturatesInsteadOfOverflowing) {
    Dimension d("max_batch_size", DimensionLaw::kExponential);
    EXPECT_EQ(d.valueAt(kMaxExponentialSlot), int64_t{1} << kMaxExponentialSlot);
    EXPECT_EQ(d.valueAt(kMaxExponentialSlot + 10), int64_t{1} << kMaxExponentialSlot);
    EXPECT_GT(d.valueAt(1000), 0);
}

TEST(DimensionTest, LawNames) {
    EXPECT_EQ(dimensionLawToString(DimensionLaw::kLinear), "linear");
    EXPECT_EQ(dimensionLawToString(DimensionLaw::kExponential), "exponential");
}

TEST(DimensionSetTest, ResolvesCoordinatePerEntity) {
    DimensionSet set = makeBatchInstanceSet(1);
    ASSERT_EQ(set.numSlots(), 2u);
    ASSERT_EQ(set.numEntities(), 1u);

    auto values = set.valuesFor(Coordinate{5, 7});
    ASSERT_TRUE(values);
    ASSERT_EQ(values->size(), 1u);
    EXPECT_EQ((*values)[0].at("max_batch_size"), 32);
    EXPECT_EQ((*values)[0].at("instance_count"), 8);
}

TEST(DimensionSetTest, MultipleEntities) {
    DimensionSet set = makeBatchInstanceSet(2);
    ASSERT_EQ(set.numSlots(), 4u);

    auto values = set.valuesFor(Coordinate{1, 2, 4, 5});
    ASSERT_TRUE(values);
    ASSERT_EQ(values->size(), 2u);
    EXPECT_EQ((*values)[0].at("max_batch_size"), 2);
    EXPECT_EQ((*values)[0].at("instance_count"), 3);
    EXPECT_EQ((*values)[1].at("max_batch_size"), 16);
    EXPECT_EQ((*values)[1].at("instance_count"), 6);

    EXPECT_EQ(set.slot(2).entity_index, 1u);
    EXPECT_EQ(set.slot(2).dimension.name(), "max_batch_size");
    EXPECT_EQ(set.dimensionsFor(1).size(), 2u);
}

TEST(DimensionSetTest, ArityMismatchIsDimensionError) {
    DimensionSet set = makeBatchInstanceSet(1);

    auto too_short = set.valuesFor(Coordinate{1});
    ASSERT_FALSE(too_short);
    EXPECT_EQ(too_short.error().code(), ErrorCode::kDimensionMismatch);

    auto too_long = set.valuesFor(Coordinate{1, 2, 3});
    ASSERT_FALSE(too_long);
    EXPECT_EQ(too_long.error().code(), ErrorCode::kDimensionMismatch);
}

TEST(DimensionSetTest, EntitiesMustBeAddedInOrder) {
    DimensionSet set;
    auto skipped = set.addDimensions(1, {Dimension("instance_count", DimensionLaw::kLinear)});
    ASSERT_FALSE(skipped);
    EXPECT_EQ(skipped.error().code(), ErrorCode::kDimensionMismatch);

    ASSERT_TRUE(set.addDimensions(0, {Dimension("instance_count", DimensionLaw::kLinear)}));
    auto repeated = set.addDimensions(0, {Dimension("max_batch_size", DimensionLaw::kExponential)});
    ASSERT_FALSE(repeated);
    EXPECT_EQ(set.numEntities(), 1u);
}

TEST(DimensionSetTest, StartingCoordinateUsesMinimums) {
    DimensionSet set;
    ASSERT_TRUE(set.addDimensions(0, {Dimension("max_batch_size", DimensionLaw::kExponential, 2),
                                      Dimension("instance_count", DimensionLaw::kLinear, 1)}));
    ASSERT_TRUE(set.addDimensions(1, {Dimension("max_batch_size", DimensionLaw::kExponential, 3)}));

    Coordinate start = set.startingCoordinate();
    EXPECT_EQ(start, (Coordinate{2, 1, 3}));
}

TEST(DimensionSetTest, EmptySet) {
    DimensionSet set;
    EXPECT_TRUE(set.empty());
    EXPECT_TRUE(set.startingCoordinate().empty());

    auto values = set.valuesFor(Coordinate{});
    ASSERT_TRUE(values);
    EXPECT_TRUE(values->empty());
}

}  // namespace
}  // namespace search
}  // namespace rcs
