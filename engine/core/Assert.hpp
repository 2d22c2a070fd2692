#pragma once

// =============================================================================
// Assertions
// =============================================================================
//
// Invariant checks for development builds. Callers always log and recover
// from the violated invariant themselves; the assert only stops a debugger
// on the spot when CRIMSON_ENABLE_ASSERTS is defined.

#if defined(CRIMSON_ENABLE_ASSERTS)
    #include <cassert>
    #define CRIMSON_ASSERT(condition) assert(condition)
    #define CRIMSON_ASSERT_MSG(condition, msg) assert((condition) && (msg))
#else
    #define CRIMSON_ASSERT(condition) ((void)0)
    #define CRIMSON_ASSERT_MSG(condition, msg) ((void)0)
#endif

#define CRIMSON_STATIC_ASSERT(condition, msg) static_assert(condition, msg)
