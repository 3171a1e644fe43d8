#pragma once

// Tag-prefixed diagnostics on stderr.
// INKOCR_LOGD/INKOCR_LOGW compile out when NDEBUG is defined,
// INKOCR_LOGE is always enabled.

namespace InkLog {
    void Print(char level, const char* tag, const char* fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;
}

#ifdef NDEBUG
#define INKOCR_LOGD(TAG, ...) ((void)0)
#define INKOCR_LOGW(TAG, ...) ((void)0)
#else
#define INKOCR_LOGD(TAG, ...) InkLog::Print('D', TAG, __VA_ARGS__)
#define INKOCR_LOGW(TAG, ...) InkLog::Print('W', TAG, __VA_ARGS__)
#endif

#define INKOCR_LOGE(TAG, ...) InkLog::Print('E', TAG, __VA_ARGS__)
