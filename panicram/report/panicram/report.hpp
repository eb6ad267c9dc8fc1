/**
 * @file report.hpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 *
 * Boot-time reporting of the fault recorded before the last reset.
 *
 * Intended to be called once, early in main() after stdio is up and before
 * any code that can fault is enabled. Output goes through the PanicRam log
 * macros at the critical level.
 */

#pragma once

#include "panicram/record.hpp"


namespace PanicRam::Report {

    /**
     * @brief Detect, consume and print the previous fault record
     *
     * @return true if a record from the previous boot was found
     *
     * @note Consumes the record: a second call in the same boot returns false
     */
    bool reportPreviousFault();

    /**
     * @brief Print a single record to the console
     *
     * @param record Record to print
     */
    void printRecord(const Record &record);

} // namespace PanicRam::Report
