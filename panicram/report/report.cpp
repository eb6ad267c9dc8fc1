/**
 * @file report.cpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 */

#include "panicram/report.hpp"

#include "panicram/log.hpp"


namespace PanicRam::Report {

    void printRecord(const Record &record) {
        std::string_view filename = record.filename();
        std::string_view message = record.message();

        LOGC("\n");
        LOGC("=== PREVIOUS FAULT RECORD ===\n");

        if (!record.isWellFormed()) {
            LOGW("Record lengths or text are damaged, output below is clamped to the region\n");
        }

        if (filename.empty()) {
            LOGC("Location: unknown\n");
        } else {
            LOGC("Location: %.*s:%lu:%lu\n",
                 static_cast<int>(filename.size()), filename.data(),
                 static_cast<unsigned long>(record.line()),
                 static_cast<unsigned long>(record.column()));
        }

        if (message.empty()) {
            LOGC("Message: (message not recorded)\n");
        } else {
            LOGC("Message: %.*s\n", static_cast<int>(message.size()), message.data());
        }

        LOGC("==============================\n");
    }

    bool reportPreviousFault() {
        std::optional<Record> record = detectAndConsume();

        if (!record) {
            LOGD("No fault record from previous boot\n");
            return false;
        }

        printRecord(*record);
        return true;
    }

} // namespace PanicRam::Report
