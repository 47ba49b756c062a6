// =============================================================================
// Run Config Search - Search Options Tests
// =============================================================================

#include "run_config_search/config/search_options.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

#include <gtest/gtest.h>

namespace rcs {
namespace config {
namespace {

TEST(SearchOptionsTest, DefaultsFromEmptyObject) {
    auto options = SearchOptions::fromJson(nlohmann::json::object());
    ASSERT_TRUE(options);
    EXPECT_EQ(options->radius, 3u);
    EXPECT_EQ(options->min_initialized, 3u);
    EXPECT_EQ(options->max_steps, 32u);
    EXPECT_EQ(options->concurrency_mode, search::ConcurrencyMode::kFormula);
    EXPECT_EQ(options->bounds.concurrency_multiplier, 2);
    EXPECT_FALSE(options->bounds.max_model_batch_size.has_value());
    ASSERT_EQ(options->objectives.size(), 1u);
    EXPECT_DOUBLE_EQ(options->objectives.at("perf_throughput"), 1.0);
    EXPECT_TRUE(options->constraints.is_null());
}

TEST(SearchOptionsTest, ParsesEveryKey) {
    auto options = SearchOptions::fromJson(nlohmann::json::parse(R"({
        "radius": 2,
        "min_initialized": 5,
        "max_steps": 10,
        "concurrency_mode": "coordinate",
        "bounds": {"max_model_batch_size": 64, "min_instance_count": 2, "concurrency_multiplier": 4},
        "objectives": {"perf_latency_p99": 3, "perf_throughput": 1},
        "constraints": {"default": {"perf_latency_p99": {"max": 100}}},
        "unrelated_key": true
    })"));
    ASSERT_TRUE(options) << options.error().toString();
    EXPECT_EQ(options->radius, 2u);
    EXPECT_EQ(options->min_initialized, 5u);
    EXPECT_EQ(options->max_steps, 10u);
    EXPECT_EQ(options->concurrency_mode, search::ConcurrencyMode::kCoordinate);
    EXPECT_EQ(options->bounds.max_model_batch_size.value_or(0), 64);
    EXPECT_EQ(options->bounds.min_instance_count.value_or(0), 2);
    EXPECT_EQ(options->bounds.concurrency_multiplier, 4);
    EXPECT_DOUBLE_EQ(options->objectives.at("perf_latency_p99"), 3.0);
    EXPECT_TRUE(options->constraints.contains("default"));
}

TEST(SearchOptionsTest, WrongTypesAreConfigurationErrors) {
    for (const char* text : {
             R"({"radius": "three"})",
             R"({"radius": -1})",
             R"({"bounds": {"max_concurrency": 1.5}})",
             R"({"concurrency_mode": "random"})",
             R"({"objectives": {}})",
             R"({"objectives": {"perf_throughput": "high"}})",
             R"({"constraints": [1, 2]})",
             R"([1, 2, 3])",
         }) {
        auto options = SearchOptions::fromJson(nlohmann::json::parse(text));
        ASSERT_FALSE(options) << text;
        EXPECT_EQ(options.error().code(), ErrorCode::kInvalidConfiguration) << text;
    }
}

TEST(SearchOptionsTest, OversizedBoundIsConfigurationError) {
    // 2^64 - 1 does not fit a signed bound
    auto options = SearchOptions::fromJson(
        nlohmann::json::parse(R"({"bounds": {"max_concurrency": 18446744073709551615}})"));
    ASSERT_FALSE(options);
    EXPECT_EQ(options.error().code(), ErrorCode::kInvalidConfiguration);

    auto largest = boundsFromJson(nlohmann::json{{"max_concurrency", 9223372036854775807ULL}});
    ASSERT_TRUE(largest) << largest.error().toString();
    EXPECT_EQ(largest->max_concurrency.value_or(0), 9223372036854775807LL);
}

TEST(SearchOptionsTest, ContradictoryBoundsAreBoundsErrors) {
    auto options = SearchOptions::fromJson(
        nlohmann::json::parse(R"({"bounds": {"min_model_batch_size": 64, "max_model_batch_size": 16}})"));
    ASSERT_FALSE(options);
    EXPECT_EQ(options.error().code(), ErrorCode::kInvalidBounds);

    auto zero_multiplier = boundsFromJson(nlohmann::json{{"concurrency_multiplier", 0}});
    ASSERT_FALSE(zero_multiplier);
    EXPECT_EQ(zero_multiplier.error().code(), ErrorCode::kInvalidBounds);
}

TEST(SearchOptionsTest, JsonRoundTripKeepsBounds) {
    SearchOptions options;
    options.bounds.max_concurrency = 8;
    options.radius = 4;

    auto reparsed = SearchOptions::fromJson(options.toJson());
    ASSERT_TRUE(reparsed);
    EXPECT_EQ(reparsed->bounds.max_concurrency.value_or(0), 8);
    EXPECT_EQ(reparsed->radius, 4u);
}

TEST(SearchOptionsTest, LoadFile) {
    std::string path = ::testing::TempDir() + "rcs_search_options_test.json";
    {
        std::ofstream out(path);
        out << R"({"max_steps": 7, "bounds": {"max_instance_count": 3}})";
    }

    auto options = SearchOptions::loadFile(path);
    ASSERT_TRUE(options) << options.error().toString();
    EXPECT_EQ(options->max_steps, 7u);
    EXPECT_EQ(options->bounds.max_instance_count.value_or(0), 3);
    std::remove(path.c_str());
}

TEST(SearchOptionsTest, LoadFileErrors) {
    auto missing = SearchOptions::loadFile("/nonexistent/rcs/options.json");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code(), ErrorCode::kIoError);

    std::string path = ::testing::TempDir() + "rcs_search_options_bad.json";
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    auto bad = SearchOptions::loadFile(path);
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code(), ErrorCode::kParseError);
    std::remove(path.c_str());
}

TEST(SearchOptionsTest, ExpandUserPath) {
    const char* home = std::getenv("HOME");
    if (!home) {
        GTEST_SKIP() << "HOME not set";
    }
    EXPECT_EQ(expandUserPath("~/options.json"), std::string(home) + "/options.json");
    EXPECT_EQ(expandUserPath("/abs/options.json"), "/abs/options.json");
}

}  // namespace
}  // namespace config
}  // namespace rcs
