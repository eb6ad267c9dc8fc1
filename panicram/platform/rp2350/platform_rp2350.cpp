/**
 * @file platform_rp2350.cpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 *
 * RP2350 implementation of the PanicRam platform seam.
 *
 * Region placement:
 * ================
 *
 * - Default: a PANICRAM_REGION_SIZE buffer in the Pico SDK's
 *   `.uninitialized_data` section. The SDK startup code neither zeroes nor
 *   copies this section, so its contents survive a watchdog reset.
 * - PANICRAM_USE_LINKER_REGION: the region is delimited by the
 *   `__panicram_start` and `__panicram_end` symbols, which a custom linker
 *   script must reserve outside of .bss and .data.
 *
 * The RP2350 SRAM keeps its contents across a watchdog reset but not across
 * a power cycle; on power-on the region holds random data, which fails the
 * checksum with high probability.
 */

#include <cstdint>

// Pico SDK includes
#include <pico/stdlib.h>
#include <pico/status_led.h>
#include <hardware/watchdog.h>

#include "panicram/config.hpp"
#include "panicram/platform.hpp"


#ifdef PANICRAM_USE_LINKER_REGION
extern "C" {
    extern uint8_t __panicram_start;
    extern uint8_t __panicram_end;
}
#endif


namespace PanicRam::Platform {

#ifndef PANICRAM_USE_LINKER_REGION
    /**
     * @brief Raw memory buffer for the persistent fault record
     *
     * Placed in .uninitialized_data so that the record survives the watchdog
     * reset triggered at the end of the capture path.
     */
    static uint8_t gPanicRamRegion[PANICRAM_REGION_SIZE] __attribute__((section(".uninitialized_data"))) __attribute__((aligned(4)));
#endif

    RegionBounds regionBounds() {
#ifdef PANICRAM_USE_LINKER_REGION
        return RegionBounds{&__panicram_start, &__panicram_end};
#else
        return RegionBounds{gPanicRamRegion, gPanicRamRegion + PANICRAM_REGION_SIZE};
#endif
    }

    /**
     * @brief Perform immediate system reset using the watchdog
     *
     * Watchdog reset is more reliable than software reset mechanisms and
     * leaves SRAM intact.
     */
    void systemReset() {
        watchdog_enable(1, 1);
        while (true) {
            tight_loop_contents();
        }
    }

    /**
     * @brief Flash the status LED before reset
     *
     * Uses busy-wait delays only; the scheduler and the timer alarm pool may
     * be unusable in fault context.
     *
     * @note On boards where the status LED sits behind the CYW43 wireless
     *       chip, driving it needs a working async context and may not work
     *       from a hard fault handler.
     */
    void statusLedNotification() {
        for (uint32_t i = 0; i < PANICRAM_LED_BLINK_COUNT; i++) {
            status_led_set_state(true);
            busy_wait_us_32(PANICRAM_LED_BLINK_DELAY_US);
            status_led_set_state(false);
            busy_wait_us_32(PANICRAM_LED_BLINK_DELAY_US);
        }
    }

} // namespace PanicRam::Platform
