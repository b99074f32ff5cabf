// kiln

#pragma once

// Static builds need no decoration. Shared builds define KN_SHARED for everyone, and
// KN_EXPORT or KN_EXTRA_EXPORT while compiling kiln or kiln_extra themselves.
#if !defined(KN_SHARED)
#define KN_API
#define KN_EXTRA_API
#elif defined(_WIN32)
#if defined(KN_EXPORT)
#define KN_API __declspec(dllexport)
#else
#define KN_API __declspec(dllimport)
#endif
#if defined(KN_EXTRA_EXPORT)
#define KN_EXTRA_API __declspec(dllexport)
#else
#define KN_EXTRA_API __declspec(dllimport)
#endif
#else
#define KN_API [[gnu::visibility("default")]]
#define KN_EXTRA_API [[gnu::visibility("default")]]
#endif
