/**
 * @file app.hpp
 * @brief PanicRam crash demo application
 * @copyright Copyright (c) 2025 MTA, Inc.
 *
 * Reports the fault recorded before the last reset, blinks the status LED
 * for a few seconds and then deliberately faults. Each boot picks the next
 * kind of fault, so a device left running cycles through every capture
 * route: panic macro, failed check, FreeRTOS assertion, Pico SDK panic()
 * and a hardware fault.
 */

#pragma once

#include <cstdint>


namespace PanicRam::Demo {

    enum class CrashKind : uint32_t {
        PANIC = 0,
        INVALID_STATE = 1,
        FREERTOS_ASSERT = 2,
        PICO_PANIC = 3,
        HARD_FAULT = 4,
        COUNT = 5
    };

    class App {
    public:
        /**
         * @brief Run the demo
         *
         * Initializes stdio and the status LED, reports the previous fault,
         * registers the LED notification hook, creates the crash task and
         * starts the FreeRTOS scheduler.
         *
         * @note Never returns
         */
        void run();

    protected:
        CrashKind _crashKind = CrashKind::PANIC;

        static void _crashTaskEntry(void *param);

        void _init();
        void _crashTask();
        void _triggerCrash(CrashKind kind);
        void _triggerHardFault();
    };

} // namespace PanicRam::Demo
