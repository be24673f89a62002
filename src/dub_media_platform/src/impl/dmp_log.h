#pragma once

// Simple logging - check DMP_LOG_LEVEL env var at runtime
// 0 = silent (default), 1 = warnings, 2 = debug

#include <cstdio>
#include <cstdlib>

namespace dmp {
namespace impl {

inline int dmp_log_level() {
    static int level = -1;
    if (level < 0) {
        const char* env = std::getenv("DMP_LOG_LEVEL");
        level = env ? std::atoi(env) : 0;
    }
    return level;
}

} // namespace impl
} // namespace dmp

#define DMP_LOG_WARN(...) do { if (dmp::impl::dmp_log_level() >= 1) { fprintf(stderr, "[DMP WARN] "); fprintf(stderr, __VA_ARGS__); fprintf(stderr, "\n"); } } while(0)
#define DMP_LOG_DEBUG(...) do { if (dmp::impl::dmp_log_level() >= 2) { fprintf(stderr, "[DMP] "); fprintf(stderr, __VA_ARGS__); fprintf(stderr, "\n"); } } while(0)
