// kiln

#pragma once

#include <cassert>

// internal invariants; the optional message is shown by a failing assert
#if !defined(KN_ASSERT)
#define KN_ASSERT(x, ...) assert((x) __VA_OPT__(&&(__VA_ARGS__)))
#endif

#if defined(_MSC_VER)
#define KN_BREAK() __debugbreak()
#else
#define KN_BREAK() (void)0
#endif

// API misuse: break into the debugger and bail out of the calling function
#define KN_GUARD_OR(x, r) \
    if (!(x))             \
    {                     \
        KN_BREAK();       \
        return (r);       \
    }

#define KN_GUARD_VOID(x) \
    if (!(x))            \
    {                    \
        KN_BREAK();      \
        return;          \
    }
