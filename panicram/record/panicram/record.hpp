/**
 * @file record.hpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 *
 * Persistent fault record layout and codec.
 *
 * Region layout (native byte order):
 *
 *   [RecordHeader (12 bytes)][filename bytes][message bytes][unused tail]
 *
 * The header checksum is the XOR of every byte from the end of the header to
 * the end of the region, unused tail included. A record is therefore only
 * reported as valid while the whole region is unchanged since it was
 * written. A record is consumed by zeroing its header, so it is detected at
 * most once.
 *
 * Lifecycle:
 * =========
 *
 * 1. A fault occurs and encodeRecord() writes the record in a single pass
 * 2. The device is reset; the region survives the warm reset
 * 3. Early in the next boot, detectAndConsume() returns the record once
 * 4. Any later call reports no record
 *
 * Known ambiguity: a region that is entirely zero (for example memory that
 * was zero-initialized by a bootloader) has a matching checksum and decodes
 * as a valid, empty record.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "panicram/config.hpp"
#include "panicram/message.hpp"
#include "panicram/region.hpp"


namespace PanicRam {

    /**
     * @brief Fixed-size header stored at the start of the region
     */
    struct __attribute__((packed)) RecordHeader {
        uint8_t filenameLength;         ///< Number of filename bytes after the header
        uint32_t line;                  ///< Source line of the fault (0 if unknown)
        uint32_t column;                ///< Source column of the fault (0 if unknown)
        uint16_t messageLength;         ///< Number of message bytes after the filename
        uint8_t checksum;               ///< XOR of [HEADER_SIZE, region end)
    };

    static_assert(sizeof(RecordHeader) == 12, "RecordHeader must be packed to 12 bytes");

    constexpr size_t HEADER_SIZE = sizeof(RecordHeader);

    /**
     * @brief Source location attached to a fault
     */
    struct SourceLocation {
        const char *file;               ///< NUL-terminated file name; null means unknown
        uint32_t line;
        uint32_t column;
    };

    /**
     * @brief How much detail is written into a record at fault time
     */
    enum class DetailMode : uint8_t {
        FULL,       ///< Location and formatted message
        MINIMAL,    ///< Location only; message formatting is skipped
    };

    /**
     * @brief Detail mode selected by the build (PANICRAM_MINIMAL)
     */
    constexpr DetailMode defaultDetailMode() {
#ifdef PANICRAM_MINIMAL
        return DetailMode::MINIMAL;
#else
        return DetailMode::FULL;
#endif
    }

    /**
     * @brief A fault record recovered from the region
     *
     * Header fields are copied by value when the record is decoded, so they
     * stay valid after the header in the region has been zeroed. The text
     * accessors read the filename and message bytes from the region, which
     * are left untouched by consumption.
     */
    class Record {
    public:
        Record(const RecordHeader &header, ByteView region);

        uint8_t filenameLength() const { return _header.filenameLength; }

        uint32_t line() const { return _header.line; }

        uint32_t column() const { return _header.column; }

        uint16_t messageLength() const { return _header.messageLength; }

        uint8_t checksum() const { return _header.checksum; }

        /**
         * @brief Filename of the fault location
         *
         * Encoding is not validated; only the codec's own encode path writes
         * these bytes. The range is clamped to the region.
         */
        std::string_view filename() const;

        /**
         * @brief Descriptive fault message
         *
         * Encoding is not validated. Empty in minimal builds. The range is
         * clamped to the region.
         */
        std::string_view message() const;

        /**
         * @brief Strict validation for consumers that cannot trust the source
         *
         * Checks that the stored lengths fit inside the region and that the
         * filename and message are well-formed UTF-8. A multi-byte sequence
         * cut short at the very end of a field is accepted, since the writer
         * and the filename clamp truncate on byte boundaries.
         *
         * @return true if the record is structurally sound
         */
        bool isWellFormed() const;

    private:
        RecordHeader _header;
        ByteView _region;
    };

    /**
     * @brief XOR of every byte in a view
     */
    uint8_t xorChecksum(ByteView bytes);

    /**
     * @brief Write a fault record into a region in a single forward pass
     *
     * Never fails: the filename is clamped to PANICRAM_MAX_FILENAME_LEN, the
     * message is truncated to the space left in the region and nothing is
     * written past the end of the region. A region smaller than the header
     * is left untouched.
     *
     * @param region Target region
     * @param location Fault location, or null if unknown
     * @param message Producer of the message text (unused in MINIMAL mode)
     * @param mode Amount of detail to record
     */
    void encodeRecord(ByteView region,
                      const SourceLocation *location,
                      const MessageSource &message,
                      DetailMode mode);

    /**
     * @brief Detect a record in a region and consume it
     *
     * If the stored checksum matches the region contents the header is
     * copied out, zeroed in place and the record returned. Otherwise
     * nothing is modified and no record is returned; this covers both "no
     * fault occurred" and "the region was overwritten".
     *
     * @param region Region to inspect
     * @return The record, or std::nullopt
     */
    std::optional<Record> detectAndConsume(ByteView region);

    /**
     * @brief Detect and consume a record in the persistent region
     *
     * Must be called at most once per boot, before any code that can fault
     * is enabled.
     */
    std::optional<Record> detectAndConsume();

    /**
     * @brief Detect a record, requiring both checksum and structural validity
     *
     * For consumers that cannot trust the producer (e.g. a host-side dump
     * viewer). The header is only consumed when both checks pass.
     *
     * @param region Region to inspect
     * @return The record, or std::nullopt
     */
    std::optional<Record> detectAndConsumeValidated(ByteView region);

} // namespace PanicRam
