/**
 * @file main.cpp
 * @brief Entry point of the panicram_dump host tool.
 * @copyright Copyright (c) 2025 MTA, Inc.
 */

#include <iostream>

#include "panicram/dump.hpp"


int main(int argc, char **argv) {
    return PanicRam::Tools::runDump(argc, argv, std::cout, std::cerr);
}
