#pragma once

// =============================================================================
// Run Config Search - Main Header
// =============================================================================
//
// Automatic search over model serving configurations: batch size, instance
// count and benchmark concurrency, for one or more models served together.
//
// Include this header for full API access.
//

#include "run_config_search/common.h"
#include "run_config_search/config/model_config.h"
#include "run_config_search/config/search_options.h"
#include "run_config_search/config/variant_name_registry.h"
#include "run_config_search/error.h"
#include "run_config_search/record/record.h"
#include "run_config_search/record/run_measurement.h"
#include "run_config_search/result/constraint_evaluator.h"
#include "run_config_search/search/coordinate.h"
#include "run_config_search/search/dimension.h"
#include "run_config_search/search/neighborhood.h"
#include "run_config_search/search/quick_config_generator.h"
#include "run_config_search/search/quick_search.h"
#include "run_config_search/search/search_config.h"

#include <string>
#include <string_view>

namespace rcs {

// =============================================================================
// Version Information
// =============================================================================

struct Version {
    static constexpr int major = RCS_VERSION_MAJOR;
    static constexpr int minor = RCS_VERSION_MINOR;
    static constexpr int patch = RCS_VERSION_PATCH;

    static std::string string() {
        return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    }
};

// =============================================================================
// Runtime Initialization
// =============================================================================

struct RuntimeConfig {
    // trace, debug, info, warn, error, critical, off.
    // RCS_LOG_LEVEL in the environment takes precedence.
    std::string log_level = "info";
};

// Initialize logging (call once at program start)
Result<void> initialize(const RuntimeConfig& config = {});

// Shutdown the runtime (call at program end)
void shutdown();

// Check if runtime is initialized
bool isInitialized();

}  // namespace rcs
