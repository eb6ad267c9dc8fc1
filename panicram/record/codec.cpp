/**
 * @file codec.cpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 *
 * Record encode (fault time) and decode (boot time).
 *
 * encodeRecord() runs while a fault is being handled, possibly from an
 * exception handler with a damaged stack. It uses a single header on the
 * stack, memcpy/memset, and the BoundedWriter; nothing else.
 */

#include "panicram/record.hpp"

#include <cstring>

#include "panicram/bounded_writer.hpp"


namespace PanicRam {

    /**
     * @brief Length of a NUL-terminated string, clamped to a maximum
     *
     * Never reads past `maxLen` bytes of the source.
     */
    static inline size_t boundedLength(const char *text, size_t maxLen) {
        size_t length = 0;
        while (length < maxLen && text[length] != '\0') {
            length++;
        }
        return length;
    }

    uint8_t xorChecksum(ByteView bytes) {
        uint8_t checksum = 0;
        for (size_t i = 0; i < bytes.size(); i++) {
            checksum ^= bytes[i];
        }
        return checksum;
    }

    void encodeRecord(ByteView region,
                      const SourceLocation *location,
                      const MessageSource &message,
                      DetailMode mode) {

        if (region.size() < HEADER_SIZE) {
            return; // Out of contract; never write past the region
        }

        RecordHeader header;
        memset(&header, 0, sizeof(header));

        ByteView payload = region.subview(HEADER_SIZE);

        if (location != nullptr && location->file != nullptr) {
            size_t filenameLength = boundedLength(location->file, PANICRAM_MAX_FILENAME_LEN);
            ByteView filename = payload.subview(0, filenameLength);

            if (!filename.empty()) {
                memcpy(filename.data(), location->file, filename.size());
            }

            header.filenameLength = static_cast<uint8_t>(filename.size());
            header.line = location->line;
            header.column = location->column;
        }

        if (mode == DetailMode::FULL) {
            ByteView messageArea = payload.subview(header.filenameLength, PANICRAM_MAX_MESSAGE_LEN);
            BoundedWriter writer(messageArea);

            message.writeTo(writer);

            header.messageLength = static_cast<uint16_t>(writer.written());
        }

        // Covers filename, message and any stale bytes left by a previous record
        header.checksum = xorChecksum(payload);

        memcpy(region.data(), &header, HEADER_SIZE);
    }

    std::optional<Record> detectAndConsume(ByteView region) {
        if (region.size() < HEADER_SIZE) {
            return std::nullopt;
        }

        RecordHeader header;
        memcpy(&header, region.data(), HEADER_SIZE);

        if (xorChecksum(region.subview(HEADER_SIZE)) != header.checksum) {
            return std::nullopt;
        }

        region.subview(0, HEADER_SIZE).fill(0);

        return Record(header, region);
    }

    std::optional<Record> detectAndConsume() {
        return detectAndConsume(Region::region());
    }

    std::optional<Record> detectAndConsumeValidated(ByteView region) {
        if (region.size() < HEADER_SIZE) {
            return std::nullopt;
        }

        RecordHeader header;
        memcpy(&header, region.data(), HEADER_SIZE);

        if (xorChecksum(region.subview(HEADER_SIZE)) != header.checksum) {
            return std::nullopt;
        }

        Record record(header, region);
        if (!record.isWellFormed()) {
            return std::nullopt;
        }

        region.subview(0, HEADER_SIZE).fill(0);

        return record;
    }

} // namespace PanicRam
