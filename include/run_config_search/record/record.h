#pragma once

// =============================================================================
// Run Config Search - Metric Records
// =============================================================================
//
// A Record is one measured value of one metric. Every metric tag maps to a
// MetricDescriptor naming its display header and its polarity; comparison,
// combination and percentage gain are explicit functions that read the
// polarity, so "better" always means better for that metric:
//
//   throughput-like (higher is better):  150 better than 100
//   latency-like    (lower is better):    50 better than 100
//

#include "run_config_search/error.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace rcs {
namespace record {

// =============================================================================
// Metric Descriptors
// =============================================================================

enum class Polarity : uint8_t {
    kHigherIsBetter = 0,
    kLowerIsBetter = 1,
};

struct MetricDescriptor {
    std::string_view tag;
    std::string_view header;
    Polarity polarity = Polarity::kHigherIsBetter;
    bool aggregated = false;  // Reported as the max over GPUs
};

// Well-known metric tags
inline constexpr std::string_view kPerfThroughput = "perf_throughput";
inline constexpr std::string_view kPerfLatencyAvg = "perf_latency_avg";
inline constexpr std::string_view kPerfLatencyP90 = "perf_latency_p90";
inline constexpr std::string_view kPerfLatencyP95 = "perf_latency_p95";
inline constexpr std::string_view kPerfLatencyP99 = "perf_latency_p99";
inline constexpr std::string_view kPerfClientResponseWait = "perf_client_response_wait";
inline constexpr std::string_view kPerfServerQueue = "perf_server_queue";
inline constexpr std::string_view kPerfServerComputeInfer = "perf_server_compute_infer";
inline constexpr std::string_view kGpuUsedMemory = "gpu_used_memory";
inline constexpr std::string_view kGpuUtilization = "gpu_utilization";
inline constexpr std::string_view kGpuPowerUsage = "gpu_power_usage";
inline constexpr std::string_view kCpuUsedRam = "cpu_used_ram";

/// Look up a metric by tag; nullptr if unknown
[[nodiscard]] const MetricDescriptor* findMetric(std::string_view tag);

/// All known metrics, in table order
[[nodiscard]] const std::vector<MetricDescriptor>& allMetrics();

// =============================================================================
// Record
// =============================================================================

class Record {
  public:
    /// Create a record for a known metric tag
    [[nodiscard]] static Result<Record> create(std::string_view tag, double value,
                                               double timestamp = 0.0);

    [[nodiscard]] std::string_view tag() const { return descriptor_->tag; }
    [[nodiscard]] Polarity polarity() const { return descriptor_->polarity; }
    [[nodiscard]] const MetricDescriptor& descriptor() const { return *descriptor_; }
    [[nodiscard]] double value() const { return value_; }
    [[nodiscard]] double timestamp() const { return timestamp_; }

    /// Display header; aggregated GPU metrics get a "Max " prefix when asked
    [[nodiscard]] std::string header(bool aggregation_tag = false) const;

    /// Same metric, new value (timestamp kept)
    [[nodiscard]] Record withValue(double value) const {
        return Record(descriptor_, value, timestamp_);
    }

  private:
    Record(const MetricDescriptor* descriptor, double value, double timestamp)
        : descriptor_(descriptor), value_(value), timestamp_(timestamp) {}

    const MetricDescriptor* descriptor_;  // Non-owning, points into the static table
    double value_;
    double timestamp_;
};

// =============================================================================
// Polarity-Aware Operations
// =============================================================================

/// Positive if `a` is better than `b`, negative if worse, zero if equal.
/// Both records must carry the same tag.
[[nodiscard]] int compare(const Record& a, const Record& b);

[[nodiscard]] inline bool isBetter(const Record& a, const Record& b) { return compare(a, b) > 0; }

/// Equal tag and equal value
[[nodiscard]] bool operator==(const Record& a, const Record& b);

/// a + b, same tag required
[[nodiscard]] Result<Record> add(const Record& a, const Record& b);

/// Difference oriented so that a positive value means `a` is better than `b`:
/// a - b for higher-is-better metrics, b - a for lower-is-better metrics
[[nodiscard]] Result<Record> subtract(const Record& a, const Record& b);

/// Percentage gain of `candidate` over `baseline`; positive exactly when the
/// candidate is an improvement. Zero when the baseline value is zero.
[[nodiscard]] double percentageGain(const Record& baseline, const Record& candidate);

}  // namespace record
}  // namespace rcs
