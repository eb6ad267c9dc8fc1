/**
 * @file fault_type.hpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 *
 * Classification of the faults routed into the PanicRam capture path.
 */

#pragma once

#include <cstdint>


namespace PanicRam {

    /**
     * @brief Enumeration of fault types that can be recorded
     */
    enum class FaultType : uint8_t {
        UNKNOWN = 0,
        PANIC,                    ///< Explicit PANICRAM_PANIC() call
        FREERTOS_ASSERT,          ///< FreeRTOS configASSERT failure
        STACK_OVERFLOW,           ///< FreeRTOS stack overflow detection
        MALLOC_FAILED,            ///< FreeRTOS malloc failure
        C_ASSERT,                 ///< Standard C assert() failure
        HARDWARE_FAULT,           ///< Hardware exception (HardFault, etc.)
        INVALID_STATE,            ///< Failed PANICRAM_PANIC_IF_NOT() check
    };

    /**
     * @brief Convert fault type enumeration to a printable string.
     * @param type Fault type.
     * @return Constant string name; "INVALID" for out-of-range values.
     */
    const char *faultTypeToString(FaultType type);

} // namespace PanicRam
