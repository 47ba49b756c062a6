// =============================================================================
// Run Config Search - Search Options Implementation
// =============================================================================

#include "run_config_search/config/search_options.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <limits>

namespace rcs {
namespace config {

namespace {

Result<std::optional<int64_t>> readOptionalInt(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::optional<int64_t>();
    }
    if (!j[key].is_number_integer()) {
        RCS_RETURN_ERROR(ErrorCode::kInvalidConfiguration,
                         fmt::format("'{}' must be an integer", key));
    }
    if (j[key].is_number_unsigned() &&
        j[key].get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        RCS_RETURN_ERROR(ErrorCode::kInvalidConfiguration,
                         fmt::format("'{}' is out of range", key));
    }
    return std::optional<int64_t>(j[key].get<int64_t>());
}

Result<void> readUint(const nlohmann::json& j, const char* key, uint32_t& out) {
    if (!j.contains(key)) {
        return {};
    }
    if (!j[key].is_number_integer() || j[key].get<int64_t>() < 0 ||
        j[key].get<int64_t>() > std::numeric_limits<uint32_t>::max()) {
        RCS_RETURN_ERROR(ErrorCode::kInvalidConfiguration,
                         fmt::format("'{}' must be a non-negative integer", key));
    }
    out = j[key].get<uint32_t>();
    return {};
}

}  // namespace

std::string expandUserPath(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (!home) {
        return path;
    }
    return std::string(home) + path.substr(1);
}

Result<search::GlobalBounds> boundsFromJson(const nlohmann::json& j) {
    search::GlobalBounds bounds;
    if (j.is_null()) {
        return bounds;
    }
    if (!j.is_object()) {
        RCS_RETURN_ERROR(ErrorCode::kInvalidConfiguration, "'bounds' must be an object");
    }

    struct Field {
        const char* key;
        std::optional<int64_t> search::GlobalBounds::*member;
    };
    const Field fields[] = {
        {"min_model_batch_size", &search::GlobalBounds::min_model_batch_size},
        {"max_model_batch_size", &search::GlobalBounds::max_model_batch_size},
        {"min_instance_count", &search::GlobalBounds::min_instance_count},
        {"max_instance_count", &search::GlobalBounds::max_instance_count},
        {"min_concurrency", &search::GlobalBounds::min_concurrency},
        {"max_concurrency", &search::GlobalBounds::max_concurrency},
    };
    for (const auto& field : fields) {
        auto value = readOptionalInt(j, field.key);
        if (!value) {
            return value.error();
        }
        bounds.*field.member = *value;
    }

    auto multiplier = readOptionalInt(j, "concurrency_multiplier");
    if (!multiplier) {
        return multiplier.error();
    }
    if (*multiplier) {
        bounds.concurrency_multiplier = **multiplier;
    }

    RCS_TRY(bounds.validate());
    return bounds;
}

Result<SearchOptions> SearchOptions::fromJson(const nlohmann::json& j) {
    SearchOptions options;
    if (j.is_null()) {
        return options;
    }
    if (!j.is_object()) {
        RCS_RETURN_ERROR(ErrorCode::kInvalidConfiguration, "search options must be an object");
    }

    if (j.contains("bounds")) {
        auto bounds = boundsFromJson(j["bounds"]);
        if (!bounds) {
            return bounds.error();
        }
        options.bounds = *bounds;
    }

    RCS_TRY(readUint(j, "radius", options.radius));
    RCS_TRY(readUint(j, "min_initialized", options.min_initialized));
    RCS_TRY(readUint(j, "max_steps", options.max_steps));

    if (j.contains("concurrency_mode")) {
        if (!j["concurrency_mode"].is_string()) {
            RCS_RETURN_ERROR(ErrorCode::kInvalidConfiguration, "'concurrency_mode' must be a string");
        }
        auto mode = search::concurrencyModeFromString(j["concurrency_mode"].get<std::string>());
        if (!mode) {
            return mode.error();
        }
        options.concurrency_mode = *mode;
    }

    if (j.contains("objectives")) {
        const auto& objectives = j["objectives"];
        if (!objectives.is_object() || objectives.empty()) {
            RCS_RETURN_ERROR(ErrorCode::kInvalidConfiguration,
                             "'objectives' must be a non-empty object");
        }
        options.objectives.clear();
        for (const auto& item : objectives.items()) {
            if (!item.value().is_number() || item.value().get<double>() < 0.0) {
                RCS_RETURN_ERROR(ErrorCode::kInvalidConfiguration,
                                 fmt::format("objective '{}' must be a non-negative number",
                                             item.key()));
            }
            if (!record::findMetric(item.key())) {
                spdlog::warn("Objective on unknown metric '{}'", item.key());
            }
            options.objectives.emplace(item.key(), item.value().get<double>());
        }
    }

    if (j.contains("constraints")) {
        if (!j["constraints"].is_object() && !j["constraints"].is_null()) {
            RCS_RETURN_ERROR(ErrorCode::kInvalidConfiguration, "'constraints' must be an object");
        }
        options.constraints = j["constraints"];
    }

    if (options.radius == 0) {
        spdlog::warn("Search radius 0 leaves no neighbors to explore");
    }
    return options;
}

Result<SearchOptions> SearchOptions::loadFile(const std::string& path) {
    const std::string resolved = expandUserPath(path);
    std::ifstream in(resolved);
    if (!in) {
        RCS_RETURN_ERROR(ErrorCode::kIoError, fmt::format("cannot open '{}'", resolved));
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        RCS_RETURN_ERROR(ErrorCode::kParseError, fmt::format("{}: {}", resolved, e.what()));
    }
    spdlog::info("Loaded search options from {}", resolved);
    return fromJson(j);
}

nlohmann::json SearchOptions::toJson() const {
    nlohmann::json j;
    j["radius"] = radius;
    j["min_initialized"] = min_initialized;
    j["max_steps"] = max_steps;
    j["concurrency_mode"] = std::string(search::concurrencyModeToString(concurrency_mode));

    nlohmann::json b = nlohmann::json::object();
    auto put = [&b](const char* key, const std::optional<int64_t>& value) {
        if (value) {
            b[key] = *value;
        }
    };
    put("min_model_batch_size", bounds.min_model_batch_size);
    put("max_model_batch_size", bounds.max_model_batch_size);
    put("min_instance_count", bounds.min_instance_count);
    put("max_instance_count", bounds.max_instance_count);
    put("min_concurrency", bounds.min_concurrency);
    put("max_concurrency", bounds.max_concurrency);
    b["concurrency_multiplier"] = bounds.concurrency_multiplier;
    j["bounds"] = std::move(b);

    nlohmann::json o = nlohmann::json::object();
    for (const auto& [tag, weight] : objectives) {
        o[tag] = weight;
    }
    j["objectives"] = std::move(o);
    j["constraints"] = constraints;
    return j;
}

}  // namespace config
}  // namespace rcs
