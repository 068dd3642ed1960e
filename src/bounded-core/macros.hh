#pragma once

// Build modes come from the build system: BC_DEBUG, BC_RELWITHDEBINFO or BC_RELEASE.
// BC_ASSERT is compiled out only in BC_RELEASE, unless BC_ENABLE_ASSERT_IN_RELEASE is set.

#if defined(BC_RELEASE) && !defined(BC_ENABLE_ASSERT_IN_RELEASE)
#define BC_ASSERT_ENABLED 0
#else
#define BC_ASSERT_ENABLED 1
#endif

#if defined(_MSC_VER) && !defined(__clang__)
#define BC_COLD_FUNC
#else
#define BC_COLD_FUNC __attribute__((cold))
#endif
