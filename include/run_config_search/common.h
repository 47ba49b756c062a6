#pragma once

// =============================================================================
// Run Config Search - Common Definitions
// =============================================================================

#include <cstddef>
#include <cstdint>

// Version information
#define RCS_VERSION_MAJOR 0
#define RCS_VERSION_MINOR 1
#define RCS_VERSION_PATCH 0

namespace rcs {

// =============================================================================
// Compiler Attributes
// =============================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define RCS_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define RCS_UNLIKELY(x) (x)
#endif

// =============================================================================
// Debug Macros
// =============================================================================

#ifdef NDEBUG
    #define RCS_ASSERT(cond) ((void)0)
#else
    #define RCS_ASSERT(cond)                                  \
        do {                                                  \
            if (RCS_UNLIKELY(!(cond))) {                      \
                rcs::assertFailed(#cond, __FILE__, __LINE__); \
            }                                                 \
        } while (0)
#endif

// Assert failure handler (implemented in error.cc)
[[noreturn]] void assertFailed(const char* cond, const char* file, int line);

// =============================================================================
// Search Space Limits
// =============================================================================

// Exponential dimensions resolve to 2^slot; slots beyond this would overflow
// the 64-bit signed values the search hands to the benchmarking tool.
constexpr uint32_t kMaxExponentialSlot = 62;

// Default factor in concurrency = batch size x instance count x multiplier
constexpr int64_t kDefaultConcurrencyMultiplier = 2;

// =============================================================================
// Utility Types
// =============================================================================

// Non-copyable base class
class NonCopyable {
  protected:
    NonCopyable() = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable&) = delete;
    NonCopyable& operator=(const NonCopyable&) = delete;
};

}  // namespace rcs
