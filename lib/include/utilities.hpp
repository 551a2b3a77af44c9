#ifndef UTILITIES_HPP
#define UTILITIES_HPP

#ifndef BALLSCAN_DEBUG_OUTPUT
#define BALLSCAN_DEBUG_OUTPUT 0
#endif

#if defined(__ANDROID__)
#define PLATFORM_ANDROID 1
#elif defined(__APPLE__)
#include <TargetConditionals.h>
#if TARGET_OS_IPHONE
#define PLATFORM_IOS 1
#else
#define PLATFORM_MACOS 1
#endif
#elif defined(_WIN32) || defined(_WIN64)
#define PLATFORM_WINDOWS 1
#else
#define PLATFORM_LINUX 1
#endif

#if BALLSCAN_DEBUG_OUTPUT
#ifdef PLATFORM_ANDROID
#include <android/log.h>
#define LOG_TAG "ballscan_native"
#define LOGI(...) __android_log_print(ANDROID_LOG_INFO, LOG_TAG, __VA_ARGS__)
#define LOGE(...) __android_log_print(ANDROID_LOG_ERROR, LOG_TAG, __VA_ARGS__)
#elif defined(PLATFORM_IOS)
#include <os/log.h>
#define LOGI(...) os_log(OS_LOG_DEFAULT, __VA_ARGS__)
#define LOGE(...) os_log_error(OS_LOG_DEFAULT, __VA_ARGS__)
#else
#include <cstdio>
#define LOGI(...)            \
    do {                     \
        printf("INFO: ");    \
        printf(__VA_ARGS__); \
        printf("\n");        \
    } while (0)
#define LOGE(...)                     \
    do {                              \
        fprintf(stderr, "ERROR: ");   \
        fprintf(stderr, __VA_ARGS__); \
        fprintf(stderr, "\n");        \
    } while (0)
#endif
#else
#define LOGI(...)
#define LOGE(...)
#endif

// Brightness used by the pixel heuristics: plain channel mean, not luminance.
inline double channelMean(int r, int g, int b) { return (r + g + b) / 3.0; }

#endif  // UTILITIES_HPP
