/**
 * @file config.hpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 *
 * Compile-time configuration for the PanicRam fault record library.
 *
 * Every value can be overridden from the build system with a compile
 * definition of the same name. The defaults are sized for an RP2350 with
 * the record buffer placed in the `.uninitialized_data` section.
 */

#pragma once

#ifndef PANICRAM_REGION_SIZE
#define PANICRAM_REGION_SIZE 1024               ///< Size of the persistent record buffer (bytes)
#endif

#ifndef PANICRAM_MAX_FILENAME_LEN
#define PANICRAM_MAX_FILENAME_LEN 255           ///< Longest filename stored in a record (bytes)
#endif

#ifndef PANICRAM_MAX_MESSAGE_LEN
#define PANICRAM_MAX_MESSAGE_LEN 65535          ///< Longest message stored in a record (bytes)
#endif

#ifndef PANICRAM_LED_BLINK_COUNT
#define PANICRAM_LED_BLINK_COUNT 10             ///< Status LED flashes before reset
#endif

#ifndef PANICRAM_LED_BLINK_DELAY_US
#define PANICRAM_LED_BLINK_DELAY_US 100000      ///< Half-period of a status LED flash (microseconds)
#endif

#ifndef PANICRAM_MAX_FAULT_DESC_LEN
#define PANICRAM_MAX_FAULT_DESC_LEN 128         ///< Scratch buffer used by the C fault wrappers
#endif

static_assert(PANICRAM_MAX_FILENAME_LEN <= 255, "filename length is stored in a uint8_t");
static_assert(PANICRAM_MAX_MESSAGE_LEN <= 65535, "message length is stored in a uint16_t");
