/**
 * @file dump.cpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 */

#include "panicram/dump.hpp"

#include <cstring>
#include <fstream>
#include <iterator>

#include "panicram/record.hpp"


namespace PanicRam::Tools {

    static void printUsage(std::ostream &err) {
        err << "usage: panicram_dump <image-file> [--consume]" << std::endl;
    }

    bool readImage(const std::string &path, std::vector<uint8_t> &image) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return false;
        }

        image.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
        return !file.bad();
    }

    bool writeImage(const std::string &path, const std::vector<uint8_t> &image) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return false;
        }

        file.write(reinterpret_cast<const char *>(image.data()), static_cast<std::streamsize>(image.size()));
        return static_cast<bool>(file);
    }

    int runDump(int argc, const char *const argv[], std::ostream &out, std::ostream &err) {
        const char *path = nullptr;
        bool consume = false;

        for (int i = 1; i < argc; i++) {
            if (strcmp(argv[i], "--consume") == 0) {
                consume = true;
            } else if (argv[i][0] == '-' || path != nullptr) {
                printUsage(err);
                return EXIT_ERROR;
            } else {
                path = argv[i];
            }
        }

        if (path == nullptr) {
            printUsage(err);
            return EXIT_ERROR;
        }

        std::vector<uint8_t> image;
        if (!readImage(path, image)) {
            err << "panicram_dump: cannot read " << path << std::endl;
            return EXIT_ERROR;
        }

        std::optional<Record> record = detectAndConsumeValidated(ByteView(image.data(), image.size()));
        if (!record) {
            out << "No valid fault record in " << path << " (" << image.size() << " bytes)" << std::endl;
            return EXIT_NO_RECORD;
        }

        if (record->filename().empty()) {
            out << "File: unknown" << std::endl;
        } else {
            out << "File: " << record->filename() << std::endl;
            out << "Line: " << record->line() << std::endl;
            out << "Column: " << record->column() << std::endl;
        }

        if (record->message().empty()) {
            out << "Message: (message not recorded)" << std::endl;
        } else {
            out << "Message: " << record->message() << std::endl;
        }

        if (consume && !writeImage(path, image)) {
            err << "panicram_dump: cannot write " << path << std::endl;
            return EXIT_ERROR;
        }

        return EXIT_RECORD_FOUND;
    }

} // namespace PanicRam::Tools
