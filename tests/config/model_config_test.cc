// =============================================================================
// Run Config Search - Model Configuration Tests
// =============================================================================

#include "run_config_search/config/model_config.h"

#include <map>

#include <gtest/gtest.h>

namespace rcs {
namespace config {
namespace {

nlohmann::json plainBaseline(const std::string& name) {
    return nlohmann::json{
        {"name", name},
        {"max_batch_size", 8},
        {"input", nlohmann::json::array({{{"name", "INPUT0"}, {"data_type", "TYPE_FP32"}}})},
        {"backend", "onnxruntime"},
    };
}

BaselineLookup lookupFrom(std::map<std::string, nlohmann::json> baselines) {
    return [baselines = std::move(baselines)](const std::string& name) -> Result<nlohmann::json> {
        auto it = baselines.find(name);
        if (it == baselines.end()) {
            return Error(ErrorCode::kUnknownModel, "no such model");
        }
        return it->second;
    };
}

// =============================================================================
// ModelConfig
// =============================================================================

TEST(ModelConfigTest, FieldAccess) {
    ModelConfig config(plainBaseline("m"));
    EXPECT_EQ(config.name(), "m");
    EXPECT_EQ(config.maxBatchSize(), 8);
    EXPECT_EQ(config.instanceCount(), 1);
    EXPECT_FALSE(config.hasSequenceBatching());
    EXPECT_FALSE(config.isEnsemble());

    config.setField(kInstanceGroupField, nlohmann::json::array({{{"count", 2}}, {{"count", 3}}}));
    EXPECT_EQ(config.instanceCount(), 5);

    config.eraseField(kMaxBatchSizeField);
    EXPECT_EQ(config.maxBatchSize(), 0);
    EXPECT_EQ(config.getField(kMaxBatchSizeField), nullptr);
}

TEST(ModelConfigTest, EnsembleSteps) {
    ModelConfig ensemble(nlohmann::json::parse(R"({
        "name": "ens",
        "platform": "ensemble",
        "ensemble_scheduling": {"step": [{"model_name": "pre"}, {"model_name": "infer"}]}
    })"));
    EXPECT_TRUE(ensemble.isEnsemble());
    EXPECT_EQ(ensemble.ensembleSteps(), (std::vector<std::string>{"pre", "infer"}));
}

// =============================================================================
// ModelSpec
// =============================================================================

TEST(ModelSpecTest, CreatePlainModel) {
    auto spec = ModelSpec::create("m", lookupFrom({{"m", plainBaseline("m")}}),
                                  nlohmann::json{{"percentile", 96}}, true);
    ASSERT_TRUE(spec) << spec.error().toString();
    EXPECT_EQ(spec->name(), "m");
    EXPECT_FALSE(spec->isComposite());
    EXPECT_EQ(spec->numSearchUnits(), 1u);
    EXPECT_TRUE(spec->cpuOnly());
    EXPECT_EQ(spec->benchmarkFlags()["percentile"], 96);
}

TEST(ModelSpecTest, MissingFieldsAreConfigurationErrors) {
    nlohmann::json no_input = plainBaseline("m");
    no_input.erase("input");
    auto a = ModelSpec::fromBaseline("m", no_input);
    ASSERT_FALSE(a);
    EXPECT_EQ(a.error().code(), ErrorCode::kInvalidConfiguration);

    nlohmann::json no_batch = plainBaseline("m");
    no_batch.erase("max_batch_size");
    auto b = ModelSpec::fromBaseline("m", no_batch);
    ASSERT_FALSE(b);
    EXPECT_EQ(b.error().code(), ErrorCode::kInvalidConfiguration);
}

TEST(ModelSpecTest, UnknownModelFromLookup) {
    auto spec = ModelSpec::create("ghost", lookupFrom({}));
    ASSERT_FALSE(spec);
    EXPECT_EQ(spec.error().code(), ErrorCode::kUnknownModel);
}

TEST(ModelSpecTest, EnsembleResolvesStages) {
    nlohmann::json ensemble = plainBaseline("ens");
    ensemble["platform"] = "ensemble";
    ensemble["ensemble_scheduling"] = nlohmann::json::parse(
        R"({"step": [{"model_name": "pre"}, {"model_name": "infer"}]})");

    auto lookup = lookupFrom({{"ens", ensemble}, {"pre", plainBaseline("pre")}, {"infer", plainBaseline("infer")}});
    auto spec = ModelSpec::create("ens", lookup);
    ASSERT_TRUE(spec) << spec.error().toString();
    ASSERT_TRUE(spec->isComposite());
    ASSERT_EQ(spec->stages().size(), 2u);
    EXPECT_EQ(spec->stages()[0].name(), "pre");
    EXPECT_EQ(spec->stages()[1].name(), "infer");
    EXPECT_EQ(spec->numSearchUnits(), 2u);
}

TEST(ModelSpecTest, EnsembleWithMissingStage) {
    nlohmann::json ensemble = plainBaseline("ens");
    ensemble["platform"] = "ensemble";
    ensemble["ensemble_scheduling"] = nlohmann::json::parse(R"({"step": [{"model_name": "pre"}]})");

    auto spec = ModelSpec::create("ens", lookupFrom({{"ens", ensemble}}));
    ASSERT_FALSE(spec);
    EXPECT_EQ(spec.error().code(), ErrorCode::kUnknownModel);
}

TEST(ModelSpecTest, EnsembleNeedsLookup) {
    nlohmann::json ensemble = plainBaseline("ens");
    ensemble["platform"] = "ensemble";
    auto spec = ModelSpec::fromBaseline("ens", ensemble);
    ASSERT_FALSE(spec);
    EXPECT_EQ(spec.error().code(), ErrorCode::kInvalidConfiguration);
}

// =============================================================================
// BenchmarkParams / RunConfig
// =============================================================================

TEST(BenchmarkParamsTest, Representation) {
    BenchmarkParams params;
    params.update(nlohmann::json{{"percentile", 96}, {"model-version", 2}});
    params.set(kModelNameFlag, "m_config_0");
    params.set(kBatchSizeFlag, 1);
    params.set(kConcurrencyRangeFlag, 64);

    EXPECT_EQ(params.concurrency(), 64);
    EXPECT_EQ(params.representation(),
              "-m m_config_0 -b 1 --concurrency-range=64 --model-version=2 --percentile=96");
}

TEST(RunConfigTest, RepresentationJoinsModels) {
    RunConfig run;
    for (const char* name : {"a_config_0", "b_config_3"}) {
        ModelRunConfig model;
        model.model_name = name;
        model.perf_config.set(kModelNameFlag, name);
        run.addModelRunConfig(std::move(model));
    }
    EXPECT_EQ(run.numModels(), 2u);
    EXPECT_EQ(run.representation(), "-m a_config_0 -m b_config_3");
    EXPECT_EQ(run.toJson().size(), 2u);
}

}  // namespace
}  // namespace config
}  // namespace rcs
