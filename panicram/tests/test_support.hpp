/**
 * @file test_support.hpp
 * @brief Minimal check/report helpers shared by the PanicRam test programs.
 * @copyright Copyright (c) 2025 MTA, Inc.
 *
 */

#pragma once

#include <iostream>
#include <string>


namespace PanicRam::Test {

    inline int gFailures = 0;

    inline void check(bool condition, const std::string &name) {
        if (condition) {
            std::cout << "✓ PASS " << name << std::endl;
        } else {
            std::cout << "✗ FAIL " << name << std::endl;
            gFailures++;
        }
    }

    inline void section(const std::string &title) {
        std::cout << "\n--- " << title << " ---" << std::endl;
    }

    inline int finish(const std::string &suite) {
        if (gFailures == 0) {
            std::cout << "\n=== " << suite << ": all checks passed ===" << std::endl;
            return 0;
        }

        std::cout << "\n=== " << suite << ": " << gFailures << " check(s) failed ===" << std::endl;
        return 1;
    }

} // namespace PanicRam::Test
