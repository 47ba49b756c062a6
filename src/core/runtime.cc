// =============================================================================
// Run Config Search - Runtime
// =============================================================================

#include "run_config_search/run_config_search.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdlib>

namespace rcs {

namespace {
std::atomic<bool> g_initialized{false};
}  // namespace

Result<void> initialize(const RuntimeConfig& config) {
    if (g_initialized.exchange(true)) {
        spdlog::warn("Run Config Search runtime already initialized");
        return {};
    }

    std::string level_name = config.log_level;
    if (const char* env = std::getenv("RCS_LOG_LEVEL")) {
        level_name = env;
    }
    auto level = spdlog::level::from_str(level_name);
    // from_str() maps unknown names to off
    if (level == spdlog::level::off && level_name != "off") {
        g_initialized.store(false);
        RCS_RETURN_ERROR(ErrorCode::kInvalidConfiguration,
                         fmt::format("unknown log level '{}'", level_name));
    }
    spdlog::set_level(level);

    spdlog::info("Run Config Search v{} initialized (log level {})", Version::string(), level_name);
    return {};
}

void shutdown() {
    if (!g_initialized.exchange(false)) {
        return;  // Not initialized
    }
    spdlog::info("Run Config Search shutting down");
    spdlog::default_logger()->flush();
}

bool isInitialized() {
    return g_initialized.load();
}

}  // namespace rcs
