/**
 * @file capture.cpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 *
 * Fault capture path. Optimized for minimal stack usage and static-only
 * memory: the only stack objects are the header built by the codec and the
 * message source passed in by the caller.
 */

#include "panicram/capture.hpp"

#include "panicram/platform.hpp"
#include "panicram/region.hpp"


namespace PanicRam {

    void capture(const SourceLocation *location, const MessageSource &message) {
        encodeRecord(Region::region(), location, message, defaultDetailMode());

        NotificationHook hook = notificationHook();
        if (hook != nullptr) {
            hook();
        }

        Platform::systemReset();
    }

    void reportFault(FaultType type,
                     const char *description,
                     const char *file,
                     uint32_t line,
                     const char *function,
                     uint32_t column) {

        SourceLocation location = {file, line, column};
        FaultMessage message(type, description, function);

        capture(file != nullptr ? &location : nullptr, message);
    }

} // namespace PanicRam
