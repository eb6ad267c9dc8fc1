/**
 * @file validated_decode_test.cpp
 * @brief Strict decoding for consumers that cannot trust the producer.
 * @copyright Copyright (c) 2025 MTA, Inc.
 *
 */

#include "panicram/record.hpp"
#include "test_support.hpp"

#include <cstring>
#include <vector>

using namespace PanicRam;
using PanicRam::Test::check;
using PanicRam::Test::section;

/**
 * @brief Write a header with arbitrary lengths and a matching checksum
 */
static void forgeHeader(std::vector<uint8_t> &buffer, uint8_t filenameLength, uint16_t messageLength) {
    ByteView region(buffer.data(), buffer.size());

    RecordHeader header;
    memset(&header, 0, sizeof(header));
    header.filenameLength = filenameLength;
    header.messageLength = messageLength;
    header.checksum = xorChecksum(region.subview(HEADER_SIZE));

    memcpy(buffer.data(), &header, HEADER_SIZE);
}

/**
 * @brief Place raw message bytes after an empty filename and seal the header
 */
static void forgeMessage(std::vector<uint8_t> &buffer, const std::vector<uint8_t> &message) {
    memcpy(buffer.data() + HEADER_SIZE, message.data(), message.size());
    forgeHeader(buffer, 0, static_cast<uint16_t>(message.size()));
}

static void test_valid_record() {
    section("Valid record");

    std::vector<uint8_t> buffer(64, 0);
    ByteView region(buffer.data(), buffer.size());
    SourceLocation location = {"ok.cpp", 8, 2};
    encodeRecord(region, &location, TextMessage("température élevée"), DetailMode::FULL);

    std::optional<Record> record = detectAndConsumeValidated(region);
    check(record.has_value(), "well-formed UTF-8 record passes validation");
    check(record.has_value() && record->isWellFormed(), "returned record reports well-formed");
    check(!detectAndConsumeValidated(region).has_value(), "validated decode also consumes the record");
}

static void test_checksum_still_required() {
    section("Checksum still required");

    std::vector<uint8_t> buffer(64, 0);
    ByteView region(buffer.data(), buffer.size());
    encodeRecord(region, nullptr, TextMessage("fine text"), DetailMode::FULL);
    buffer[HEADER_SIZE] ^= 0x20;

    check(!detectAndConsumeValidated(region).has_value(), "checksum mismatch is rejected");
}

static void test_lengths_beyond_region() {
    section("Lengths beyond region");

    std::vector<uint8_t> buffer(64, 0);
    memcpy(buffer.data() + HEADER_SIZE, "abc", 3);
    forgeHeader(buffer, 200, 0);

    std::vector<uint8_t> copy = buffer;

    std::optional<Record> trusted = detectAndConsume(ByteView(copy.data(), copy.size()));
    check(trusted.has_value(), "trusted decode accepts a matching checksum");
    if (trusted) {
        check(trusted->filename().size() == 64 - HEADER_SIZE, "trusted accessor is clamped to the region");
        check(!trusted->isWellFormed(), "record reports lengths that overrun the region");
    }

    check(!detectAndConsumeValidated(ByteView(buffer.data(), buffer.size())).has_value(),
          "validated decode rejects overrunning lengths");
    check(buffer[0] == 200, "rejected record is not consumed");
}

static void test_utf8_rules() {
    section("UTF-8 rules");

    struct Case {
        const char *name;
        std::vector<uint8_t> bytes;
        bool accepted;
    };

    const Case cases[] = {
        {"plain ASCII is accepted", {'o', 'k'}, true},
        {"two-byte sequence is accepted", {0xC3, 0xA9}, true},
        {"four-byte sequence is accepted", {0xF0, 0x9F, 0x98, 0x80}, true},
        {"sequence cut at the end of the field is accepted", {'a', 0xE2, 0x82}, true},
        {"invalid lead byte is rejected", {'a', 0xFF, 'b'}, false},
        {"stray continuation byte is rejected", {0x80, 'a'}, false},
        {"overlong encoding is rejected", {0xC0, 0xAF}, false},
        {"UTF-16 surrogate is rejected", {0xED, 0xA0, 0x80}, false},
        {"code point above U+10FFFF is rejected", {0xF4, 0x90, 0x80, 0x80}, false},
        {"interrupted sequence is rejected", {0xE2, 'a', 0x82}, false},
    };

    for (const Case &testCase : cases) {
        std::vector<uint8_t> buffer(32, 0);
        forgeMessage(buffer, testCase.bytes);

        bool accepted = detectAndConsumeValidated(ByteView(buffer.data(), buffer.size())).has_value();
        check(accepted == testCase.accepted, testCase.name);
    }
}

static void test_truncated_multibyte_message() {
    section("Truncated multi-byte message");

    // Room for "ab" plus the first byte of "é"
    std::vector<uint8_t> buffer(HEADER_SIZE + 3, 0);
    ByteView region(buffer.data(), buffer.size());
    encodeRecord(region, nullptr, TextMessage("abé"), DetailMode::FULL);

    std::optional<Record> record = detectAndConsumeValidated(region);
    check(record.has_value() && record->messageLength() == 3,
          "message truncated inside a code point still validates");
}

int main() {
    std::cout << "=== Validated Decode Test ===" << std::endl;

    test_valid_record();
    test_checksum_still_required();
    test_lengths_beyond_region();
    test_utf8_rules();
    test_truncated_multibyte_message();

    return PanicRam::Test::finish("Validated Decode Test");
}
