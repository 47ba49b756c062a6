#pragma once

// =============================================================================
// Run Config Search - Variant Name Registry
// =============================================================================
//
// Assigns stable, deduplicated names to generated model config variants:
//   <entity>_config_default   for the baseline-derived default variant
//   <entity>_config_<N>       for stepping variants, N = 0, 1, 2, ...
//
// Two payloads that differ only in their "name" field are the same variant
// and receive the same name. The registry is shared by every generator in a
// process and is safe to call from several threads.
//

#include "run_config_search/common.h"
#include "run_config_search/error.h"

#include <nlohmann/json.hpp>

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

namespace rcs {
namespace config {

class VariantNameRegistry : NonCopyable {
  public:
    VariantNameRegistry() = default;

    /// Name for `payload` as a variant of `entity`. Returns the existing name
    /// when an equivalent payload was already named. With `is_default` the
    /// result is always <entity>_config_default, whatever the payload.
    [[nodiscard]] Result<std::string> nameFor(const std::string& entity, const nlohmann::json& payload,
                                              bool is_default = false);

    /// Record a name chosen elsewhere (e.g. a variant found on disk).
    /// Fails with kNamingCollision if either side is already bound differently.
    Result<void> adoptName(const std::string& entity, const std::string& name,
                           const nlohmann::json& payload);

    /// Number of distinct stepping variants named for `entity`
    [[nodiscard]] size_t numVariants(const std::string& entity) const;

    void clear();

    [[nodiscard]] static std::string defaultName(const std::string& entity);
    [[nodiscard]] static std::string indexedName(const std::string& entity, size_t index);

    /// Payload with its "name" field removed
    [[nodiscard]] static nlohmann::json canonicalize(const nlohmann::json& payload);

  private:
    struct EntityVariants {
        std::map<std::string, std::string> name_by_payload;  // canonical dump -> name
        std::map<std::string, std::string> payload_by_name;  // name -> canonical dump
        size_t next_index = 0;
        size_t num_indexed = 0;
    };

    Result<void> bind(EntityVariants& variants, const std::string& name, const std::string& key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, EntityVariants> entities_;
};

}  // namespace config
}  // namespace rcs
