// =============================================================================
// Run Config Search - Quick Search Example
// =============================================================================
//
// Searches serving configurations for two models served together. A small
// analytic model stands in for the benchmarking tool: throughput rises with
// batch size and instances until the device saturates, latency rises with
// the queue depth.
//
// Usage: quick_search_demo [options.json]
//

#include "run_config_search/run_config_search.h"

#include <algorithm>
#include <iostream>
#include <map>
#include <memory>

namespace {

std::map<std::string, nlohmann::json> demoBaselines() {
    std::map<std::string, nlohmann::json> baselines;
    baselines["resnet50"] = nlohmann::json::parse(R"({
        "name": "resnet50",
        "backend": "onnxruntime",
        "max_batch_size": 8,
        "input": [{"name": "input", "data_type": "TYPE_FP32", "dims": [3, 224, 224]}],
        "output": [{"name": "logits", "data_type": "TYPE_FP32", "dims": [1000]}]
    })");
    baselines["bert_tokenizer"] = nlohmann::json::parse(R"({
        "name": "bert_tokenizer",
        "backend": "python",
        "max_batch_size": 4,
        "input": [{"name": "text", "data_type": "TYPE_STRING", "dims": [1]}],
        "output": [{"name": "ids", "data_type": "TYPE_INT64", "dims": [128]}],
        "sequence_batching": {}
    })");
    return baselines;
}

// Saturating throughput and queueing latency per model
rcs::record::ModelMeasurement simulate(const rcs::config::ModelRunConfig& model, double capacity) {
    double batch = static_cast<double>(model.model_config.maxBatchSize());
    double instances = static_cast<double>(model.model_config.instanceCount());
    double concurrency = static_cast<double>(model.perf_config.concurrency());

    double offered = batch * instances * 40.0;
    double throughput = std::min(offered, capacity) - instances * 15.0;
    double latency = 2.0 + concurrency / std::max(throughput, 1.0) * 1000.0;

    rcs::record::ModelMeasurement measurement(model.variantName());
    measurement.set(*rcs::record::Record::create(rcs::record::kPerfThroughput, throughput));
    measurement.set(*rcs::record::Record::create(rcs::record::kPerfLatencyP99, latency));
    measurement.set(*rcs::record::Record::create(rcs::record::kGpuUsedMemory, 500.0 * instances + 20.0 * batch));
    return measurement;
}

}  // namespace

int main(int argc, char** argv) {
    auto init_result = rcs::initialize();
    if (!init_result) {
        std::cerr << "Failed to initialize: " << init_result.error().toString() << "\n";
        return 1;
    }

    rcs::config::SearchOptions options;
    if (argc > 1) {
        auto loaded = rcs::config::SearchOptions::loadFile(argv[1]);
        if (!loaded) {
            std::cerr << "Failed to load options: " << loaded.error().toString() << "\n";
            return 1;
        }
        options = std::move(*loaded);
    } else {
        options.bounds.max_model_batch_size = 128;
        options.bounds.max_instance_count = 5;
        options.constraints = nlohmann::json::parse(R"({"default": {"perf_latency_p99": {"max": 250}}})");
    }

    // Models under search
    auto baselines = demoBaselines();
    rcs::config::BaselineLookup lookup = [&baselines](const std::string& name) -> rcs::Result<nlohmann::json> {
        auto it = baselines.find(name);
        if (it == baselines.end()) {
            return rcs::Error(rcs::ErrorCode::kUnknownModel, name);
        }
        return it->second;
    };

    std::vector<rcs::config::ModelSpec> models;
    std::vector<std::string> names;
    for (const char* name : {"resnet50", "bert_tokenizer"}) {
        auto spec = rcs::config::ModelSpec::create(name, lookup, nlohmann::json{{"percentile", 99}});
        if (!spec) {
            std::cerr << "Skipping " << name << ": " << spec.error().toString() << "\n";
            continue;
        }
        names.emplace_back(name);
        models.push_back(std::move(*spec));
    }

    // One batch and one instance dimension per model
    rcs::search::SearchConfig search_config;
    search_config.radius = options.radius;
    search_config.min_initialized = options.min_initialized;
    search_config.concurrency_mode = options.concurrency_mode;
    for (size_t i = 0; i < models.size(); ++i) {
        auto added = search_config.dimensions.addDimensions(
            i, {rcs::search::Dimension("max_batch_size", rcs::search::DimensionLaw::kExponential),
                rcs::search::Dimension("instance_count", rcs::search::DimensionLaw::kLinear)});
        if (!added) {
            std::cerr << added.error().toString() << "\n";
            return 1;
        }
    }

    auto constraints = rcs::result::ConstraintEvaluator::forModels(options.constraints, names);
    if (!constraints) {
        std::cerr << "Bad constraints: " << constraints.error().toString() << "\n";
        return 1;
    }

    auto generator = rcs::search::QuickConfigGenerator::create(
        std::move(search_config), options.bounds, std::move(models),
        std::make_shared<rcs::config::VariantNameRegistry>());
    if (!generator) {
        std::cerr << "Failed to create generator: " << generator.error().toString() << "\n";
        return 1;
    }

    const std::vector<double> capacities = {3000.0, 800.0};
    rcs::search::QuickSearch search(*generator, std::move(*constraints), options.max_steps);
    auto summary = search.run([&](const rcs::config::RunConfig& run_config) {
        rcs::record::RunMeasurement measurement;
        const auto& runs = run_config.modelRunConfigs();
        for (size_t i = 0; i < runs.size(); ++i) {
            measurement.addModel(simulate(runs[i], capacities[i % capacities.size()]), options.objectives);
        }
        return std::optional<rcs::record::RunMeasurement>(std::move(measurement));
    });
    if (!summary) {
        std::cerr << "Search failed: " << summary.error().toString() << "\n";
        return 1;
    }

    std::cout << "Measured " << summary->num_measurements << " configurations in "
              << summary->num_steps << " steps\n";
    std::cout << "Best: " << summary->bestRepresentation()
              << (summary->best_is_feasible ? "" : " (violates constraints)") << "\n";
    if (summary->best_config) {
        std::cout << summary->best_config->toJson().dump(2) << "\n";
    }

    rcs::shutdown();
    return 0;
}
