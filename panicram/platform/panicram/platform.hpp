/**
 * @file platform.hpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 *
 * Platform seam for the PanicRam library.
 *
 * The library never touches hardware or linker symbols directly. Instead,
 * the functions declared here are defined once per target:
 *
 * - RP2350 firmware: `platform/rp2350/platform_rp2350.cpp`
 * - Host unit tests: `tests/test_platform.cpp`
 *
 * Exactly one definition of each function must be linked into an image.
 */

#pragma once

#include <cstdint>


namespace PanicRam::Platform {

    /**
     * @brief Address bounds of the persistent record region
     *
     * `start` is inclusive and `end` is exclusive. The backing memory must
     * keep its bit pattern across the reset performed by systemReset(), but
     * is not expected to survive a power cycle.
     */
    struct RegionBounds {
        uint8_t *start;     ///< First byte of the region
        uint8_t *end;       ///< One past the last byte of the region
    };

    /**
     * @brief Return the bounds of the persistent record region
     *
     * Called on every access; implementations must not cache state that can
     * be corrupted by the fault being recorded.
     *
     * @return Region bounds supplied by the environment
     */
    RegionBounds regionBounds();

    /**
     * @brief Reset the device immediately
     *
     * @note Never returns
     * @note Must preserve the contents of the persistent record region
     */
    [[noreturn]] void systemReset();

    /**
     * @brief Ready-made notification hook that flashes the status LED
     *
     * Busy-waits between toggles so that it works from interrupt context and
     * before the scheduler is started. Only provided by the RP2350 platform.
     */
    void statusLedNotification();

} // namespace PanicRam::Platform
