// =============================================================================
// Run Config Search - Metric Record Tests
// =============================================================================

#include "run_config_search/record/record.h"

#include <gtest/gtest.h>

namespace rcs {
namespace record {
namespace {

Record make(std::string_view tag, double value) {
    auto r = Record::create(tag, value);
    EXPECT_TRUE(r) << "unknown tag " << tag;
    return *r;
}

TEST(MetricTableTest, KnownTagsResolve) {
    for (const auto& metric : allMetrics()) {
        const MetricDescriptor* found = findMetric(metric.tag);
        ASSERT_NE(found, nullptr);
        EXPECT_EQ(found->header, metric.header);
    }
    EXPECT_EQ(allMetrics().size(), 12u);
    EXPECT_EQ(findMetric("perf_unknown"), nullptr);
}

TEST(MetricTableTest, Polarities) {
    EXPECT_EQ(findMetric(kPerfThroughput)->polarity, Polarity::kHigherIsBetter);
    EXPECT_EQ(findMetric(kGpuUtilization)->polarity, Polarity::kHigherIsBetter);
    EXPECT_EQ(findMetric(kPerfLatencyP99)->polarity, Polarity::kLowerIsBetter);
    EXPECT_EQ(findMetric(kGpuUsedMemory)->polarity, Polarity::kLowerIsBetter);
    EXPECT_EQ(findMetric(kCpuUsedRam)->polarity, Polarity::kLowerIsBetter);
}

TEST(RecordTest, CreateRejectsUnknownTag) {
    auto r = Record::create("not_a_metric", 1.0);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code(), ErrorCode::kInvalidInput);
}

TEST(RecordTest, Accessors) {
    auto r = Record::create(kPerfThroughput, 250.0, 17.5);
    ASSERT_TRUE(r);
    EXPECT_EQ(r->tag(), kPerfThroughput);
    EXPECT_DOUBLE_EQ(r->value(), 250.0);
    EXPECT_DOUBLE_EQ(r->timestamp(), 17.5);
    EXPECT_EQ(r->header(), "Throughput (infer/sec)");

    Record updated = r->withValue(300.0);
    EXPECT_DOUBLE_EQ(updated.value(), 300.0);
    EXPECT_DOUBLE_EQ(updated.timestamp(), 17.5);
}

TEST(RecordTest, AggregatedHeader) {
    EXPECT_EQ(make(kGpuUsedMemory, 1.0).header(true), "Max GPU Memory Usage (MB)");
    EXPECT_EQ(make(kGpuUsedMemory, 1.0).header(false), "GPU Memory Usage (MB)");
    // Non-aggregated metrics never get the prefix
    EXPECT_EQ(make(kPerfLatencyP99, 1.0).header(true), "p99 Latency (ms)");
}

TEST(RecordTest, CompareHigherIsBetter) {
    Record high = make(kPerfThroughput, 200.0);
    Record low = make(kPerfThroughput, 100.0);
    EXPECT_GT(compare(high, low), 0);
    EXPECT_LT(compare(low, high), 0);
    EXPECT_EQ(compare(high, high), 0);
    EXPECT_TRUE(isBetter(high, low));
}

TEST(RecordTest, CompareLowerIsBetter) {
    Record fast = make(kPerfLatencyP99, 10.0);
    Record slow = make(kPerfLatencyP99, 50.0);
    EXPECT_GT(compare(fast, slow), 0);
    EXPECT_LT(compare(slow, fast), 0);
    EXPECT_TRUE(isBetter(fast, slow));
    EXPECT_FALSE(isBetter(slow, fast));
}

TEST(RecordTest, Equality) {
    EXPECT_TRUE(make(kPerfThroughput, 5.0) == make(kPerfThroughput, 5.0));
    EXPECT_FALSE(make(kPerfThroughput, 5.0) == make(kPerfThroughput, 6.0));
    EXPECT_FALSE(make(kPerfThroughput, 5.0) == make(kGpuUtilization, 5.0));
}

TEST(RecordTest, AddAndSubtract) {
    auto sum = add(make(kPerfThroughput, 100.0), make(kPerfThroughput, 50.0));
    ASSERT_TRUE(sum);
    EXPECT_DOUBLE_EQ(sum->value(), 150.0);

    auto throughput_diff = subtract(make(kPerfThroughput, 100.0), make(kPerfThroughput, 40.0));
    ASSERT_TRUE(throughput_diff);
    EXPECT_DOUBLE_EQ(throughput_diff->value(), 60.0);

    // Lower-is-better: positive difference still means the first is better
    auto latency_diff = subtract(make(kPerfLatencyP99, 10.0), make(kPerfLatencyP99, 30.0));
    ASSERT_TRUE(latency_diff);
    EXPECT_DOUBLE_EQ(latency_diff->value(), 20.0);

    auto mismatch = add(make(kPerfThroughput, 1.0), make(kPerfLatencyP99, 1.0));
    ASSERT_FALSE(mismatch);
    EXPECT_EQ(mismatch.error().code(), ErrorCode::kInvalidInput);
}

TEST(RecordTest, PercentageGain) {
    EXPECT_DOUBLE_EQ(percentageGain(make(kPerfThroughput, 100.0), make(kPerfThroughput, 150.0)), 50.0);
    EXPECT_DOUBLE_EQ(percentageGain(make(kPerfThroughput, 100.0), make(kPerfThroughput, 50.0)), -50.0);
    EXPECT_DOUBLE_EQ(percentageGain(make(kPerfLatencyP99, 100.0), make(kPerfLatencyP99, 80.0)), 20.0);
    EXPECT_DOUBLE_EQ(percentageGain(make(kPerfLatencyP99, 100.0), make(kPerfLatencyP99, 120.0)), -20.0);
}

TEST(RecordTest, PercentageGainZeroBaseline) {
    EXPECT_DOUBLE_EQ(percentageGain(make(kPerfThroughput, 0.0), make(kPerfThroughput, 10.0)), 0.0);
}

}  // namespace
}  // namespace record
}  // namespace rcs
