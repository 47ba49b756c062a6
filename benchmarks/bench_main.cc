// =============================================================================
// Run Config Search - Benchmark Entry Point
// =============================================================================

#define ANKERL_NANOBENCH_IMPLEMENT
#include "run_config_search/run_config_search.h"

#include <nanobench.h>

namespace rcs {
void benchNeighborEnumeration();
void benchConfigGeneration();
}  // namespace rcs

int main() {
    rcs::RuntimeConfig config;
    config.log_level = "warn";
    if (!rcs::initialize(config)) {
        return 1;
    }

    rcs::benchNeighborEnumeration();
    rcs::benchConfigGeneration();

    rcs::shutdown();
    return 0;
}
