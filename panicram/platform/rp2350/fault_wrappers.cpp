/**
 * @file fault_wrappers.cpp
 * @brief C wrapper functions that route platform faults into PanicRam
 * @copyright Copyright (c) 2025 MTA, Inc.
 *
 * This file contains the C-style entry points that integrate the PanicRam
 * capture path with FreeRTOS hooks, Cortex-M fault handlers, newlib's
 * assert() and the Pico SDK panic() function.
 *
 * Each wrapper classifies the fault and calls PanicRam::reportFault(),
 * which records the fault in persistent RAM and resets the device.
 *
 * Descriptions are built with a BoundedWriter over a static buffer: no
 * snprintf, no heap, no stack-hungry library calls.
 */

#include <cstdint>

#include <FreeRTOS.h>
#include <task.h>

#include <pico/stdlib.h>

#include "panicram/bounded_writer.hpp"
#include "panicram/capture.hpp"
#include "panicram/config.hpp"

/**
 * @brief Static buffer for fault descriptions in wrapper functions
 *
 * Shared among all wrappers: they only run on the way to a reset, and a
 * second fault while building a description ends in the same reset.
 */
static char gWrapperDescription[PANICRAM_MAX_FAULT_DESC_LEN];

/**
 * @brief Concatenate a prefix and a detail string into gWrapperDescription
 *
 * @param prefix Fixed description prefix
 * @param detail Variable part (may be null)
 * @return Pointer to the NUL-terminated description
 */
static const char *describe(const char *prefix, const char *detail) {
    PanicRam::ByteView buffer(reinterpret_cast<uint8_t *>(gWrapperDescription), sizeof(gWrapperDescription) - 1);
    PanicRam::BoundedWriter writer(buffer);

    writer.append(prefix);
    writer.append(detail);

    gWrapperDescription[writer.offset()] = '\0';
    return gWrapperDescription;
}

// ========== C-style wrapper functions ==========

extern "C" {

    /**
     * @brief FreeRTOS assertion failure handler
     *
     * Called from configASSERT() (see FreeRTOSConfig.h).
     *
     * @param file Source file where assertion failed
     * @param line Line number where assertion failed
     * @param func Function name where assertion failed
     * @param expr The assertion expression that failed
     *
     * @note Never returns - records the fault and resets
     */
    void my_assert_func(const char *file, int line, const char *func, const char *expr) {
        PanicRam::reportFault(
            PanicRam::FaultType::FREERTOS_ASSERT,
            describe("FreeRTOS assertion failed: ", expr),
            file, static_cast<uint32_t>(line), func
        );
    }

    /**
     * @brief FreeRTOS heap allocation failure handler
     *
     * @note Never returns - records the fault and resets
     */
    void vApplicationMallocFailedHook(void) {
        PanicRam::reportFault(
            PanicRam::FaultType::MALLOC_FAILED,
            "FreeRTOS malloc failed - insufficient heap memory",
            __FILE__, __LINE__, __func__
        );
    }

    /**
     * @brief FreeRTOS stack overflow detection handler
     *
     * @param xTask Handle of the task that overflowed its stack
     * @param pcTaskName Name of the task for identification
     *
     * @note Never returns - records the fault and resets
     * @note Runs on a stack that has just overflowed; keep it minimal
     */
    void vApplicationStackOverflowHook(TaskHandle_t xTask, char *pcTaskName) {
        (void)xTask;

        PanicRam::reportFault(
            PanicRam::FaultType::STACK_OVERFLOW,
            describe("Stack overflow detected in task: ", pcTaskName),
            __FILE__, __LINE__, __func__
        );
    }

    /**
     * @brief ARM Cortex-M HardFault exception handler
     *
     * @note Never returns - records the fault and resets
     */
    void isr_hardfault(void) {
        PanicRam::reportFault(
            PanicRam::FaultType::HARDWARE_FAULT,
            "Hardware fault (HardFault) occurred",
            __FILE__, __LINE__, __func__
        );
    }

    void isr_memmanage(void) {
        PanicRam::reportFault(
            PanicRam::FaultType::HARDWARE_FAULT,
            "Memory management fault occurred",
            __FILE__, __LINE__, __func__
        );
    }

    void isr_busfault(void) {
        PanicRam::reportFault(
            PanicRam::FaultType::HARDWARE_FAULT,
            "Bus fault occurred",
            __FILE__, __LINE__, __func__
        );
    }

    void isr_usagefault(void) {
        PanicRam::reportFault(
            PanicRam::FaultType::HARDWARE_FAULT,
            "Usage fault occurred",
            __FILE__, __LINE__, __func__
        );
    }

    void isr_securefault(void) {
        PanicRam::reportFault(
            PanicRam::FaultType::HARDWARE_FAULT,
            "Secure fault occurred",
            __FILE__, __LINE__, __func__
        );
    }

    /**
     * @brief Standard C assert() function override
     *
     * Replaces newlib's __assert_func so that failed assert() calls are
     * recorded with the caller's location instead of aborting.
     *
     * @param file Source file where assertion failed
     * @param line Line number where assertion failed
     * @param func Function name where assertion failed
     * @param expr The assertion expression that failed
     *
     * @note Never returns - records the fault and resets
     */
    void __assert_func(const char *file, int line, const char *func, const char *expr) {
        PanicRam::reportFault(
            PanicRam::FaultType::C_ASSERT,
            describe("Standard assertion failed: ", expr),
            file, static_cast<uint32_t>(line), func
        );
    }

    /**
     * @brief Pico SDK panic() replacement
     *
     * Installed with PICO_PANIC_FUNCTION=panicram_pico_panic. The format
     * string is recorded as-is; formatting the arguments would need
     * vsnprintf on the fault path.
     *
     * @param fmt printf-style format passed to panic()
     *
     * @note Never returns - records the fault and resets
     */
    void __attribute__((noreturn)) panicram_pico_panic(const char *fmt, ...) {
        PanicRam::reportFault(
            PanicRam::FaultType::PANIC,
            describe("Pico SDK panic: ", fmt),
            nullptr, 0, nullptr
        );
    }

} // extern "C"
