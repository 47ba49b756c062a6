// =============================================================================
// Run Config Search - Variant Name Registry Implementation
// =============================================================================

#include "run_config_search/config/variant_name_registry.h"

#include "run_config_search/config/model_config.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <optional>

namespace rcs {
namespace config {

namespace {

// Parses N out of "<entity>_config_<N>"
std::optional<size_t> parseIndex(const std::string& entity, const std::string& name) {
    const std::string prefix = entity + "_config_";
    if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }
    size_t index = 0;
    const char* first = name.data() + prefix.size();
    const char* last = name.data() + name.size();
    auto [ptr, ec] = std::from_chars(first, last, index);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return index;
}

}  // namespace

std::string VariantNameRegistry::defaultName(const std::string& entity) {
    return fmt::format("{}_config_default", entity);
}

std::string VariantNameRegistry::indexedName(const std::string& entity, size_t index) {
    return fmt::format("{}_config_{}", entity, index);
}

nlohmann::json VariantNameRegistry::canonicalize(const nlohmann::json& payload) {
    nlohmann::json canonical = payload;
    if (canonical.is_object()) {
        canonical.erase(std::string(kNameField));
    }
    return canonical;
}

Result<void> VariantNameRegistry::bind(EntityVariants& variants, const std::string& name,
                                       const std::string& key) {
    auto by_name = variants.payload_by_name.find(name);
    if (by_name != variants.payload_by_name.end() && by_name->second != key) {
        RCS_RETURN_ERROR(ErrorCode::kNamingCollision,
                         fmt::format("name '{}' is already bound to a different payload", name));
    }
    auto by_payload = variants.name_by_payload.find(key);
    if (by_payload != variants.name_by_payload.end() && by_payload->second != name) {
        RCS_RETURN_ERROR(ErrorCode::kNamingCollision,
                         fmt::format("payload named '{}' is already bound to '{}'", name,
                                     by_payload->second));
    }
    variants.payload_by_name[name] = key;
    variants.name_by_payload[key] = name;
    return {};
}

Result<std::string> VariantNameRegistry::nameFor(const std::string& entity,
                                                 const nlohmann::json& payload, bool is_default) {
    // The default name is reserved and never bound to a payload
    if (is_default) {
        return defaultName(entity);
    }

    const std::string key = canonicalize(payload).dump();

    std::lock_guard<std::mutex> lock(mutex_);
    auto& variants = entities_[entity];

    auto existing = variants.name_by_payload.find(key);
    if (existing != variants.name_by_payload.end()) {
        return existing->second;
    }

    // Skip indices already taken by adopted names
    std::string name;
    do {
        name = indexedName(entity, variants.next_index++);
    } while (variants.payload_by_name.count(name) != 0);

    RCS_TRY(bind(variants, name, key));
    ++variants.num_indexed;
    spdlog::debug("Named new variant '{}'", name);
    return name;
}

Result<void> VariantNameRegistry::adoptName(const std::string& entity, const std::string& name,
                                            const nlohmann::json& payload) {
    const std::string key = canonicalize(payload).dump();

    std::lock_guard<std::mutex> lock(mutex_);
    auto& variants = entities_[entity];
    bool known = variants.payload_by_name.count(name) != 0;

    auto bound = bind(variants, name, key);
    if (!bound) {
        return bound;
    }
    if (known) {
        return {};
    }
    if (auto index = parseIndex(entity, name)) {
        ++variants.num_indexed;
        if (*index >= variants.next_index) {
            variants.next_index = *index + 1;
        }
    }
    return {};
}

size_t VariantNameRegistry::numVariants(const std::string& entity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entities_.find(entity);
    return it == entities_.end() ? 0 : it->second.num_indexed;
}

void VariantNameRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entities_.clear();
}

}  // namespace config
}  // namespace rcs
