/**
 * @file notification_hook.cpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 *
 * Process-wide notification hook slot.
 */

#include <atomic>

#include "panicram/capture.hpp"


namespace PanicRam {

    /**
     * @brief Single-slot storage for the fault-time notification hook
     *
     * Atomic so that a registration racing with a fault on another core or
     * in an interrupt yields either the old or the new hook, never a torn
     * pointer.
     */
    static std::atomic<NotificationHook> gNotificationHook{nullptr};

    void registerNotificationHook(NotificationHook hook) {
        gNotificationHook.store(hook, std::memory_order_release);
    }

    NotificationHook notificationHook() {
        return gNotificationHook.load(std::memory_order_acquire);
    }

} // namespace PanicRam
