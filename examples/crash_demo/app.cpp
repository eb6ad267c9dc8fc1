/**
 * @file app.cpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 */

#include "app.hpp"

#include <stdio.h>

#include <FreeRTOS.h>
#include <task.h>

#include <pico/stdlib.h>
#include <pico/status_led.h>

#include "panicram/capture.hpp"
#include "panicram/log.hpp"
#include "panicram/platform.hpp"
#include "panicram/region.hpp"
#include "panicram/report.hpp"


using namespace PanicRam::Demo;

namespace {

    constexpr uint32_t BOOT_COUNTER_MAGIC = 0x50414E43;  // "PANC"
    constexpr uint32_t BLINKS_BEFORE_CRASH = 30;
    constexpr uint32_t CRASH_TASK_STACK_SIZE = 1024;

    /**
     * @brief Boot counter that survives watchdog resets
     *
     * Element 0 holds the magic value, element 1 the number of boots seen
     * since the magic was last written. Lives beside the fault region in
     * .uninitialized_data, so it is garbage after a power cycle.
     */
    uint32_t gBootCounter[2] __attribute__((section(".uninitialized_data")));

    uint32_t nextBootNumber() {
        if (gBootCounter[0] != BOOT_COUNTER_MAGIC) {
            gBootCounter[0] = BOOT_COUNTER_MAGIC;
            gBootCounter[1] = 0;
        }

        return gBootCounter[1]++;
    }

} // namespace

void App::run() {
    _init();

    BaseType_t created = xTaskCreate(
        _crashTaskEntry,
        "crash",
        CRASH_TASK_STACK_SIZE,
        this,
        tskIDLE_PRIORITY + 1,
        nullptr
    );

    PANICRAM_PANIC_IF_NOT(created == pdPASS, "Failed to create crash task");

    vTaskStartScheduler();

    PANICRAM_PANIC("FreeRTOS scheduler returned");
}

void App::_init() {
    stdio_init_all();
    status_led_init();

    // Give a USB serial host time to attach before the report is printed
    sleep_ms(2000);

    // Read the previous record before anything that can fault is enabled
    if (!PanicRam::Region::verifyRegion()) {
        PANICRAM_PANIC("Persistent fault region is unusable");
    }

    PanicRam::Report::reportPreviousFault();
    PanicRam::registerNotificationHook(PanicRam::Platform::statusLedNotification);

    uint32_t boot = nextBootNumber();
    _crashKind = static_cast<CrashKind>(boot % static_cast<uint32_t>(CrashKind::COUNT));

    LOGD("Boot %lu, next crash kind %lu\n",
         static_cast<unsigned long>(boot),
         static_cast<unsigned long>(_crashKind));
}

void App::_crashTaskEntry(void *param) {
    static_cast<App *>(param)->_crashTask();
}

void App::_crashTask() {
    for (uint32_t count = 0; count < BLINKS_BEFORE_CRASH; count++) {
        status_led_set_state(count % 2 == 0);
        vTaskDelay(pdMS_TO_TICKS(100));
    }

    status_led_set_state(false);
    _triggerCrash(_crashKind);

    // Every route above ends in a reset
    PANICRAM_PANIC("Crash trigger returned");
}

void App::_triggerCrash(CrashKind kind) {
    printf("Triggering crash kind %lu...\n", static_cast<unsigned long>(kind));
    sleep_ms(100);  // Give printf time to flush

    switch (kind) {
        case CrashKind::PANIC:
            PANICRAM_PANIC("Demo panic after blinking");
            break;
        case CrashKind::INVALID_STATE:
            PANICRAM_PANIC_IF_NOT(kind != CrashKind::INVALID_STATE, "Crash kind must not be INVALID_STATE");
            break;
        case CrashKind::FREERTOS_ASSERT:
            configASSERT(kind != CrashKind::FREERTOS_ASSERT);
            break;
        case CrashKind::PICO_PANIC:
            panic("Demo Pico SDK panic on boot %lu", static_cast<unsigned long>(gBootCounter[1]));
            break;
        case CrashKind::HARD_FAULT:
            _triggerHardFault();
            break;
        default:
            break;
    }
}

void App::_triggerHardFault() {
    // Execute code from an invalid address
    void (*badFunction)(void) = (void (*)(void))0xFFFFFFFF;
    badFunction();
}
