/**
 * @file host_platform.cpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 *
 * Platform seam for host tools. A host process has no persistent region:
 * tools work on images passed to them explicitly, never on the live region.
 */

#include "panicram/platform.hpp"

#include <cstdlib>


namespace PanicRam::Platform {

    RegionBounds regionBounds() {
        return RegionBounds{nullptr, nullptr};
    }

    void systemReset() {
        std::exit(EXIT_FAILURE);
    }

} // namespace PanicRam::Platform
