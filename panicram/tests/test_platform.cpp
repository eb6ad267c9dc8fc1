/**
 * @file test_platform.cpp
 * @brief Host implementation of the PanicRam platform seam for tests.
 * @copyright Copyright (c) 2025 MTA, Inc.
 *
 */

#include "test_platform.hpp"

#include "panicram/platform.hpp"


namespace PanicRam::Test {

    static uint8_t *gRegionStart = nullptr;
    static uint8_t *gRegionEnd = nullptr;
    static int gResetCount = 0;

    void setRegion(uint8_t *start, size_t size) {
        gRegionStart = start;
        gRegionEnd = start != nullptr ? start + size : nullptr;
    }

    void setBounds(uint8_t *start, uint8_t *end) {
        gRegionStart = start;
        gRegionEnd = end;
    }

    int resetCount() {
        return gResetCount;
    }

    void clearResetCount() {
        gResetCount = 0;
    }

} // namespace PanicRam::Test


namespace PanicRam::Platform {

    RegionBounds regionBounds() {
        return RegionBounds{Test::gRegionStart, Test::gRegionEnd};
    }

    void systemReset() {
        Test::gResetCount++;
        throw Test::ResetRequested();
    }

} // namespace PanicRam::Platform
