#pragma once

#ifdef DEN_ENABLE_DEBUG

#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <time.h>
#include <chrono>
#include <mutex>

#include "den_filesystem.h"

namespace den_debug_detail {
inline std::once_flag g_log_init_flag;
inline FILE* g_log_file = nullptr;
}  // namespace den_debug_detail

static inline int den_debug_enabled(void) {
    const char* value = getenv("DEN_DEBUG");
    return value != NULL && value[0] == '1' && value[1] == '\0';
}

static inline int den_debug_file_enabled(void) {
    const char* value = getenv("DEN_DEBUG_FILE");
    return value != NULL && value[0] == '1' && value[1] == '\0';
}

static inline void close_debug_log_file(void) {
    if (den_debug_detail::g_log_file != nullptr) {
        (void)fclose(den_debug_detail::g_log_file);
        den_debug_detail::g_log_file = nullptr;
    }
}

static inline FILE* den_get_debug_log_file(void) {
    std::call_once(den_debug_detail::g_log_init_flag, []() {
        if (!den_filesystem::initialize_den_directories()) {
            return;
        }

        long long timestamp = static_cast<long long>(time(nullptr));
        char filename[64];
        if (snprintf(filename, sizeof(filename), "den_debug_%lld.log", timestamp) < 0) {
            return;
        }

        auto log_path = den_filesystem::g_den_cache_path / filename;
        den_debug_detail::g_log_file = fopen(log_path.string().c_str(), "a");
        if (den_debug_detail::g_log_file == nullptr) {
            return;
        }

        (void)atexit(close_debug_log_file);
    });

    return den_debug_detail::g_log_file;
}

static inline void den_debug_msg(const char* fmt, ...) {
    if (!den_debug_enabled()) {
        return;
    }

    FILE* output_stream = nullptr;
    if (den_debug_file_enabled()) {
        output_stream = den_get_debug_log_file();
    }

    if (output_stream == nullptr) {
        output_stream = stderr;
    }

    va_list args;
    va_start(args, fmt);

    (void)fputs("[DEBUG] ", output_stream);
    (void)vfprintf(output_stream, fmt, args);
    va_end(args);
    (void)fputc('\n', output_stream);
    (void)fflush(output_stream);
}

class PerformanceTracker {
   public:
    explicit PerformanceTracker(const char* label) : label_(label), enabled_(den_debug_enabled()) {
        if (enabled_) {
            start_time_ = std::chrono::steady_clock::now();
        }
    }

    ~PerformanceTracker() {
        if (!enabled_) {
            return;
        }

        auto end_time = std::chrono::steady_clock::now();
        auto duration = end_time - start_time_;
        auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(duration).count();

        if (microseconds < 1000) {
            den_debug_msg("PerformanceTracker [%s]: %lld us", label_,
                          static_cast<long long>(microseconds));
        } else {
            double milliseconds = static_cast<double>(microseconds) / 1000.0;
            den_debug_msg("PerformanceTracker [%s]: %.3f ms", label_, milliseconds);
        }
    }

   private:
    const char* label_;
    bool enabled_{false};
    std::chrono::steady_clock::time_point start_time_;
};

#else

static inline int den_debug_enabled(void) {
    return 0;
}

static inline int den_debug_file_enabled(void) {
    return 0;
}

static inline void den_debug_msg(const char* fmt, ...) {
    (void)fmt;
}

class PerformanceTracker {
   public:
    PerformanceTracker(const char* label) {
        (void)label;
    }

    ~PerformanceTracker() {
    }
};

#endif
