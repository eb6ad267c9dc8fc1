/**
 * @file capture.hpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 *
 * Fault capture path and notification hook registry.
 *
 * capture() is the terminal action of a faulting context. It writes a
 * record into the persistent region, invokes the notification hook (if one
 * is registered) and resets the device through the platform. It never
 * returns.
 *
 * Fault capture sequence:
 * ======================
 *
 * 1. Resolve the persistent region
 * 2. Encode filename, line, column and (in full builds) the message
 * 3. Compute the checksum and write the header
 * 4. Invoke the notification hook, synchronously and inline
 * 5. Reset the device
 *
 * The notification hook runs with no isolation. If it never returns, the
 * reset never happens.
 *
 * Startup obligations:
 * ===================
 *
 * - Call detectAndConsume() (or Report::reportPreviousFault()) before any
 *   code that can fault is enabled, otherwise a new fault can overwrite the
 *   previous record before it is read
 * - Register the notification hook before any code that can fault is
 *   enabled
 */

#pragma once

#include <cstdint>

#include "panicram/fault_type.hpp"
#include "panicram/message.hpp"
#include "panicram/record.hpp"


namespace PanicRam {

    /**
     * @brief Callback invoked at fault time, immediately before reset
     *
     * Typically drives a human-visible signal such as a flashing LED. Runs
     * in fault context: it must not allocate, block or rely on the
     * scheduler.
     */
    using NotificationHook = void (*)();

    /**
     * @brief Register the fault-time notification hook
     *
     * Single slot, last registration wins. Passing nullptr clears the slot.
     *
     * @param hook Callback to invoke before reset
     *
     * @note The slot is atomic; registration may race with a fault on
     *       another core, in which case either the old or the new hook runs
     */
    void registerNotificationHook(NotificationHook hook);

    /**
     * @brief Return the currently registered notification hook
     *
     * @return The hook, or nullptr if none is registered
     */
    NotificationHook notificationHook();

    /**
     * @brief Record a fault and reset the device
     *
     * @param location Fault location, or null if unknown
     * @param message Producer of the message text
     *
     * @note Never returns
     * @note Safe to call from interrupt context
     */
    [[noreturn]] void capture(const SourceLocation *location, const MessageSource &message);

    /**
     * @brief Report a classified fault and reset the device
     *
     * Entry point used by the panic macros and the platform fault wrappers.
     *
     * @param type Fault type classification
     * @param description Human-readable description (may be null)
     * @param file Source file where the fault occurred (null if unknown)
     * @param line Line number in the source file
     * @param function Function name where the fault occurred (may be null)
     * @param column Column number in the source file (0 if unknown)
     *
     * @note Never returns
     */
    [[noreturn]] void reportFault(FaultType type,
                                  const char *description,
                                  const char *file,
                                  uint32_t line,
                                  const char *function,
                                  uint32_t column = 0);

} // namespace PanicRam

// ========== PANIC MACROS ==========

/**
 * @brief Column of the macro invocation, or 0 where the compiler cannot say
 *
 * Clang provides __builtin_COLUMN(); GCC (including arm-none-eabi-gcc) does
 * not, in which case the column is recorded as unknown.
 */
#if defined(__has_builtin)
#if __has_builtin(__builtin_COLUMN)
#define PANICRAM_HAS_COLUMN 1
#endif
#endif

#ifdef PANICRAM_HAS_COLUMN
#define PANICRAM_COLUMN() static_cast<uint32_t>(__builtin_COLUMN())
#else
#define PANICRAM_HAS_COLUMN 0
#define PANICRAM_COLUMN() 0u
#endif

/**
 * @brief Record an unconditional panic with the current source location
 *
 * @param reason Human-readable string describing the failure
 *
 * Example usage:
 * @code
 * PANICRAM_PANIC("Unexpected state in sensor state machine");
 * @endcode
 *
 * @note Never returns - triggers system reset
 */
#define PANICRAM_PANIC(reason) \
    PanicRam::reportFault( \
        PanicRam::FaultType::PANIC, \
        reason, \
        __FILE__, \
        __LINE__, \
        __func__, \
        PANICRAM_COLUMN() \
    )

/**
 * @brief Panic macro that triggers a fault if condition is false.
 *
 * @param expr Boolean expression to evaluate
 * @param reason Human-readable string describing the expected condition
 *
 * Example usage:
 * @code
 * PANICRAM_PANIC_IF_NOT(ptr != nullptr, "Pointer must not be null");
 * @endcode
 *
 * @note This macro never returns if the condition fails - triggers system reset
 */
#define PANICRAM_PANIC_IF_NOT(expr, reason) \
    do { \
        if (!(expr)) { \
            PanicRam::reportFault( \
                PanicRam::FaultType::INVALID_STATE, \
                reason, \
                __FILE__, \
                __LINE__, \
                __func__, \
                PANICRAM_COLUMN() \
            ); \
        } \
    } while(0)
