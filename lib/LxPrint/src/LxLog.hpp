#pragma once

/**
 * LxLog - compile-time levelled logging for the LxPrint protocol core
 *
 * Disabled levels compile to ((void)0), so TRACE traffic dumps cost nothing
 * in release firmware.
 *
 * Select the level with a numeric or symbolic build flag:
 *   -DLXPRINT_LOG_LEVEL=4            (0 NONE .. 5 TRACE)
 *   -DLXPRINT_LOG_LEVEL_DEBUG        (symbolic; the most verbose flag wins)
 *   -DLXPRINT_DISABLE_LOGGING
 *
 * Output goes through printf. On ESP32 Arduino stdout is the same UART
 * console that Serial writes to, on a host build it is the terminal.
 *
 * Usage:
 *   LXPRINT_LOG_INFO("job: %u blocks\n", count);
 *   LXPRINT_LOG_DEBUG_BYTES("TX ", frame, sizeof(frame));
 */

#include <cstdio>
#include <cstdint>
#include <cstddef>

#ifndef LXPRINT_LOG_LEVEL
  #define LXPRINT_LOG_LEVEL 3  // INFO

  #if defined(LXPRINT_DISABLE_LOGGING) || defined(LXPRINT_LOG_LEVEL_NONE)
    #undef LXPRINT_LOG_LEVEL
    #define LXPRINT_LOG_LEVEL 0
  #endif
  #ifdef LXPRINT_LOG_LEVEL_ERROR
    #undef LXPRINT_LOG_LEVEL
    #define LXPRINT_LOG_LEVEL 1
  #endif
  #ifdef LXPRINT_LOG_LEVEL_WARN
    #undef LXPRINT_LOG_LEVEL
    #define LXPRINT_LOG_LEVEL 2
  #endif
  #ifdef LXPRINT_LOG_LEVEL_INFO
    #undef LXPRINT_LOG_LEVEL
    #define LXPRINT_LOG_LEVEL 3
  #endif
  #ifdef LXPRINT_LOG_LEVEL_DEBUG
    #undef LXPRINT_LOG_LEVEL
    #define LXPRINT_LOG_LEVEL 4
  #endif
  #ifdef LXPRINT_LOG_LEVEL_TRACE
    #undef LXPRINT_LOG_LEVEL
    #define LXPRINT_LOG_LEVEL 5
  #endif
#endif

// Dump at most one data frame worth of bytes per line
#define LXPRINT_LOG_BYTES_MAX 20

#define LXPRINT_LOG_BYTES_IMPL(tag, prefix, data, size) do { \
    std::printf("LXPRINT:" tag " %s", prefix); \
    for (size_t _i = 0; _i < (size_t)(size) && _i < LXPRINT_LOG_BYTES_MAX; ++_i) { \
      std::printf("%02X ", ((const uint8_t*)(data))[_i]); \
    } \
    if ((size_t)(size) > LXPRINT_LOG_BYTES_MAX) std::printf("..."); \
    std::printf("\n"); \
  } while (0)

#if LXPRINT_LOG_LEVEL >= 1
  #define LXPRINT_LOG_ERROR(...) std::printf("LXPRINT:E " __VA_ARGS__)
#else
  #define LXPRINT_LOG_ERROR(...) ((void)0)
#endif

#if LXPRINT_LOG_LEVEL >= 2
  #define LXPRINT_LOG_WARN(...) std::printf("LXPRINT:W " __VA_ARGS__)
#else
  #define LXPRINT_LOG_WARN(...) ((void)0)
#endif

#if LXPRINT_LOG_LEVEL >= 3
  #define LXPRINT_LOG_INFO(...) std::printf("LXPRINT:I " __VA_ARGS__)
#else
  #define LXPRINT_LOG_INFO(...) ((void)0)
#endif

#if LXPRINT_LOG_LEVEL >= 4
  #define LXPRINT_LOG_DEBUG(...) std::printf("LXPRINT:D " __VA_ARGS__)
  #define LXPRINT_LOG_DEBUG_BYTES(prefix, data, size) LXPRINT_LOG_BYTES_IMPL("D", prefix, data, size)
#else
  #define LXPRINT_LOG_DEBUG(...) ((void)0)
  #define LXPRINT_LOG_DEBUG_BYTES(prefix, data, size) ((void)0)
#endif

#if LXPRINT_LOG_LEVEL >= 5
  #define LXPRINT_LOG_TRACE(...) std::printf("LXPRINT:T " __VA_ARGS__)
  #define LXPRINT_LOG_TRACE_BYTES(prefix, data, size) LXPRINT_LOG_BYTES_IMPL("T", prefix, data, size)
#else
  #define LXPRINT_LOG_TRACE(...) ((void)0)
  #define LXPRINT_LOG_TRACE_BYTES(prefix, data, size) ((void)0)
#endif
