#pragma once

#if defined(__linux__)
#define SPLICE_PLATFORM_LINUX 1
#if defined(__x86_64__) || defined(__aarch64__)
#define SPLICE_PLATFORM_64BIT 1
#else
#define SPLICE_PLATFORM_32BIT 1
#endif
#elif defined(__APPLE__)
#define SPLICE_PLATFORM_APPLE 1
#include <TargetConditionals.h>
#if TARGET_OS_MAC
#define SPLICE_PLATFORM_MACOS 1
#endif
#if defined(__x86_64__) || defined(__aarch64__)
#define SPLICE_PLATFORM_64BIT 1
#else
#define SPLICE_PLATFORM_32BIT 1
#endif
#else
#error "Splice only supports Linux and macOS targets."
#endif

// Visibility
#define SPLICE_API __attribute__((visibility("default")))

#define SPLICE_NODISCARD [[nodiscard]]

#define SPLICE_UNUSED(x)   (void)(x)
#define SPLICE_LIKELY(x)   __builtin_expect(!!(x), 1)
#define SPLICE_UNLIKELY(x) __builtin_expect(!!(x), 0)
