/**
 * @file log.hpp
 * @brief Logging macros for the PanicRam boot-time reporting paths.
 * @copyright Copyright (c) 2025 MTA, Inc.
 *
 * printf-backed, `[panicram]`-tagged log lines for the boot-time paths:
 *
 * - LOGD: region placement found at boot (Region::verifyRegion)
 * - LOGW: a previous record whose lengths or text are damaged (Report)
 * - LOGE: a region too small to hold a record header (Region::verifyRegion)
 * - LOGC: the previous fault record itself (Report)
 *
 * `PANICRAM_LOG_LEVEL` (set from CMake) suppresses every level below it.
 *
 * Never used on the fault capture path: printf may allocate, block on a USB
 * endpoint or fault on its own.
 */

#pragma once

#include <cstdio>


// Define log levels
#define PANICRAM_LOG_DEBUG     0
#define PANICRAM_LOG_WARNING   1
#define PANICRAM_LOG_ERROR     2
#define PANICRAM_LOG_CRITICAL  3

// Set the current log level
#ifndef PANICRAM_LOG_LEVEL
#warning "PANICRAM_LOG_LEVEL is not defined, defaulting to PANICRAM_LOG_CRITICAL"
#define PANICRAM_LOG_LEVEL PANICRAM_LOG_CRITICAL
#endif

#define PANICRAM_LOG_TAG "[panicram] "

// Logging macros

#if PANICRAM_LOG_LEVEL <= PANICRAM_LOG_DEBUG
#define LOGD(fmt, ...) \
    printf(PANICRAM_LOG_TAG "[DEBUG] " fmt, ##__VA_ARGS__)
#else
#define LOGD(fmt, ...)
#endif

#if PANICRAM_LOG_LEVEL <= PANICRAM_LOG_WARNING
#define LOGW(fmt, ...) \
    printf(PANICRAM_LOG_TAG "[WARNING] " fmt, ##__VA_ARGS__)
#else
#define LOGW(fmt, ...)
#endif

#if PANICRAM_LOG_LEVEL <= PANICRAM_LOG_ERROR
#define LOGE(fmt, ...) \
    printf(PANICRAM_LOG_TAG "[ERROR] " fmt, ##__VA_ARGS__)
#else
#define LOGE(fmt, ...)
#endif

#if PANICRAM_LOG_LEVEL <= PANICRAM_LOG_CRITICAL
#define LOGC(fmt, ...) \
    printf(PANICRAM_LOG_TAG "[CRITICAL] " fmt, ##__VA_ARGS__)
#else
#define LOGC(fmt, ...)
#endif
