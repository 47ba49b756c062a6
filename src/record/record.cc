// =============================================================================
// Run Config Search - Metric Records Implementation
// =============================================================================

#include "run_config_search/record/record.h"

#include <fmt/format.h>

#include <algorithm>

namespace rcs {
namespace record {

// =============================================================================
// Metric Table
// =============================================================================

const std::vector<MetricDescriptor>& allMetrics() {
    static const std::vector<MetricDescriptor> kMetrics = {
        {kPerfThroughput, "Throughput (infer/sec)", Polarity::kHigherIsBetter, false},
        {kPerfLatencyAvg, "Avg Latency (ms)", Polarity::kLowerIsBetter, false},
        {kPerfLatencyP90, "p90 Latency (ms)", Polarity::kLowerIsBetter, false},
        {kPerfLatencyP95, "p95 Latency (ms)", Polarity::kLowerIsBetter, false},
        {kPerfLatencyP99, "p99 Latency (ms)", Polarity::kLowerIsBetter, false},
        {kPerfClientResponseWait, "Response Wait Time (ms)", Polarity::kLowerIsBetter, false},
        {kPerfServerQueue, "Server Queue Time (ms)", Polarity::kLowerIsBetter, false},
        {kPerfServerComputeInfer, "Server Compute Infer time (ms)", Polarity::kLowerIsBetter,
         false},
        {kGpuUsedMemory, "GPU Memory Usage (MB)", Polarity::kLowerIsBetter, true},
        {kGpuUtilization, "GPU Utilization (%)", Polarity::kHigherIsBetter, true},
        {kGpuPowerUsage, "GPU Power Usage (W)", Polarity::kLowerIsBetter, true},
        {kCpuUsedRam, "RAM Usage (MB)", Polarity::kLowerIsBetter, false},
    };
    return kMetrics;
}

const MetricDescriptor* findMetric(std::string_view tag) {
    const auto& metrics = allMetrics();
    auto it = std::find_if(metrics.begin(), metrics.end(),
                           [&](const MetricDescriptor& m) { return m.tag == tag; });
    return it == metrics.end() ? nullptr : &*it;
}

// =============================================================================
// Record
// =============================================================================

Result<Record> Record::create(std::string_view tag, double value, double timestamp) {
    const MetricDescriptor* descriptor = findMetric(tag);
    if (!descriptor) {
        RCS_RETURN_ERROR(ErrorCode::kInvalidInput, fmt::format("unknown metric tag '{}'", tag));
    }
    return Record(descriptor, value, timestamp);
}

std::string Record::header(bool aggregation_tag) const {
    if (aggregation_tag && descriptor_->aggregated) {
        return fmt::format("Max {}", descriptor_->header);
    }
    return std::string(descriptor_->header);
}

// =============================================================================
// Operations
// =============================================================================

int compare(const Record& a, const Record& b) {
    RCS_ASSERT(a.tag() == b.tag());
    if (a.value() == b.value()) {
        return 0;
    }
    bool a_greater = a.value() > b.value();
    if (a.polarity() == Polarity::kLowerIsBetter) {
        return a_greater ? -1 : 1;
    }
    return a_greater ? 1 : -1;
}

bool operator==(const Record& a, const Record& b) {
    return a.tag() == b.tag() && a.value() == b.value();
}

Result<Record> add(const Record& a, const Record& b) {
    if (a.tag() != b.tag()) {
        RCS_RETURN_ERROR(ErrorCode::kInvalidInput,
                         fmt::format("cannot add {} and {}", a.tag(), b.tag()));
    }
    return a.withValue(a.value() + b.value());
}

Result<Record> subtract(const Record& a, const Record& b) {
    if (a.tag() != b.tag()) {
        RCS_RETURN_ERROR(ErrorCode::kInvalidInput,
                         fmt::format("cannot subtract {} from {}", b.tag(), a.tag()));
    }
    if (a.polarity() == Polarity::kLowerIsBetter) {
        return a.withValue(b.value() - a.value());
    }
    return a.withValue(a.value() - b.value());
}

double percentageGain(const Record& baseline, const Record& candidate) {
    RCS_ASSERT(baseline.tag() == candidate.tag());
    if (baseline.value() == 0.0) {
        return 0.0;
    }

    double delta = candidate.value() - baseline.value();
    if (baseline.polarity() == Polarity::kLowerIsBetter) {
        delta = -delta;
    }
    return delta / baseline.value() * 100.0;
}

}  // namespace record
}  // namespace rcs
