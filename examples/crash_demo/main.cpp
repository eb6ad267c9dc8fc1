/**
 * @file main.cpp
 * @brief Main application entry point file
 * @copyright Copyright (c) 2025 MTA, Inc.
 *
 */

#include "app.hpp"


/**
 * @brief Global application instance
 */
PanicRam::Demo::App app;

/**
 * @brief Main entry point for the application.
 *
 * @return int Exit code (not used)
 */
int main() {
    app.run();
    return 0;
}
