#pragma once
#include "config.h"
#include <cstdio>
#include <ctime>

namespace lifxctl {

// Milliseconds since the first log call in this process
inline unsigned long logMillis() {
    static struct timespec start = {0, 0};
    struct timespec now;
    clock_gettime(CLOCK_MONOTONIC, &now);
    if (start.tv_sec == 0 && start.tv_nsec == 0) {
        start = now;
    }
    return (unsigned long)((now.tv_sec - start.tv_sec) * 1000 +
                           (now.tv_nsec - start.tv_nsec) / 1000000);
}

} // namespace lifxctl

#if DEBUG_LEVEL >= DEBUG_LEVEL_ERROR
#define LOG_ERROR(tag, fmt, ...) fprintf(stderr, "[%lu] [" tag "] " fmt "\n", ::lifxctl::logMillis(), ##__VA_ARGS__)
#else
#define LOG_ERROR(tag, fmt, ...)
#endif

#if DEBUG_LEVEL >= DEBUG_LEVEL_INFO
#define LOG_INFO(tag, fmt, ...) fprintf(stderr, "[%lu] [" tag "] " fmt "\n", ::lifxctl::logMillis(), ##__VA_ARGS__)
#else
#define LOG_INFO(tag, fmt, ...)
#endif

#if DEBUG_LEVEL >= DEBUG_LEVEL_DEBUG
#define LOG_DEBUG(tag, fmt, ...) fprintf(stderr, "[%lu] [" tag "] " fmt "\n", ::lifxctl::logMillis(), ##__VA_ARGS__)
#else
#define LOG_DEBUG(tag, fmt, ...)
#endif

#if DEBUG_LEVEL >= DEBUG_LEVEL_TRACE
#define LOG_TRACE(tag, fmt, ...) fprintf(stderr, "[%lu] [" tag "] " fmt "\n", ::lifxctl::logMillis(), ##__VA_ARGS__)
#else
#define LOG_TRACE(tag, fmt, ...)
#endif
