/**
 * @file dump.hpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 *
 * Host-side viewer for raw images of the persistent fault region.
 *
 * An image is the region read out of a device (for example with a debug
 * probe) and saved as a flat binary file. The viewer decodes it with the
 * validating decoder, since the image was produced by a device the host
 * has no reason to trust.
 *
 * Exit codes:
 * ==========
 *
 * - 0: a valid record was found and printed
 * - 1: the image holds no valid record
 * - 2: usage or I/O error
 */

#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>


namespace PanicRam::Tools {

    constexpr int EXIT_RECORD_FOUND = 0;
    constexpr int EXIT_NO_RECORD = 1;
    constexpr int EXIT_ERROR = 2;

    /**
     * @brief Read a region image from disk
     *
     * @param path Image file path
     * @param image Receives the file contents
     * @return true on success
     */
    bool readImage(const std::string &path, std::vector<uint8_t> &image);

    /**
     * @brief Write a region image back to disk
     *
     * @param path Image file path
     * @param image Bytes to write
     * @return true on success
     */
    bool writeImage(const std::string &path, const std::vector<uint8_t> &image);

    /**
     * @brief Run the viewer with command-line arguments
     *
     * Usage: panicram_dump <image-file> [--consume]
     *
     * @param argc Argument count, including the program name
     * @param argv Argument vector
     * @param out Stream receiving the decoded record
     * @param err Stream receiving usage and error messages
     * @return One of the EXIT_ codes above
     */
    int runDump(int argc, const char *const argv[], std::ostream &out, std::ostream &err);

} // namespace PanicRam::Tools
