/**
 * @file bounded_writer_test.cpp
 * @brief Saturation and formatting behaviour of the BoundedWriter.
 * @copyright Copyright (c) 2025 MTA, Inc.
 *
 */

#include "panicram/bounded_writer.hpp"
#include "test_support.hpp"

#include <cstring>
#include <string>
#include <vector>

using PanicRam::BoundedWriter;
using PanicRam::ByteView;
using PanicRam::Test::check;
using PanicRam::Test::section;

static std::string contents(const std::vector<uint8_t> &buffer, size_t length) {
    return std::string(reinterpret_cast<const char *>(buffer.data()), length);
}

static void test_append_within_capacity() {
    section("Append within capacity");

    std::vector<uint8_t> buffer(16, 0xAA);
    BoundedWriter writer(ByteView(buffer.data(), buffer.size()));

    writer.append("hello", 5);
    writer.append(" world");

    check(writer.written() == 11, "written() counts every appended byte");
    check(writer.offset() == 11, "offset advances with each append");
    check(writer.remaining() == 5, "remaining() reports free capacity");
    check(contents(buffer, 11) == "hello world", "bytes land in order");
    check(buffer[11] == 0xAA, "byte after the written text is untouched");
}

static void test_append_saturates() {
    section("Append saturates at capacity");

    std::vector<uint8_t> buffer(12, 0x00);
    ByteView view(buffer.data(), 8);  // last 4 bytes act as a guard
    BoundedWriter writer(view);

    writer.append("0123456789ABCDEF");

    check(writer.written() == 8, "copies exactly the remaining capacity");
    check(contents(buffer, 8) == "01234567", "keeps the leading bytes");
    check(buffer[8] == 0 && buffer[9] == 0 && buffer[10] == 0 && buffer[11] == 0,
          "never writes past the target view");

    writer.append("more");
    writer.appendDecimal(42);
    writer.appendHex(0xDEADBEEF);
    check(writer.written() == 8, "appends on a full writer are silently dropped");
}

static void test_initial_offset() {
    section("Initial offset");

    std::vector<uint8_t> buffer(10, '.');
    BoundedWriter writer(ByteView(buffer.data(), buffer.size()), 6);

    writer.append("abcdef");

    check(writer.offset() == 10, "offset starts at the supplied position");
    check(writer.written() == 4, "written() excludes the initial offset");
    check(contents(buffer, 10) == "......abcd", "text is placed after the offset");

    BoundedWriter clamped(ByteView(buffer.data(), buffer.size()), 50);
    clamped.append("x");
    check(clamped.offset() == 10 && clamped.written() == 0, "out-of-range offset is clamped to capacity");
}

static void test_number_formatting() {
    section("Number formatting");

    std::vector<uint8_t> buffer(64, 0);
    BoundedWriter writer(ByteView(buffer.data(), buffer.size()));

    writer.appendDecimal(0);
    writer.append(",");
    writer.appendDecimal(1234567890);
    writer.append(",");
    writer.appendDecimal(4294967295u);
    writer.append(",");
    writer.appendHex(0x2000F00D);

    check(contents(buffer, writer.written()) == "0,1234567890,4294967295,0x2000F00D",
          "decimal and hex render without printf");

    std::vector<uint8_t> small(5, 0);
    BoundedWriter truncating(ByteView(small.data(), small.size()));
    truncating.appendDecimal(987654);
    check(contents(small, truncating.written()) == "98765", "numbers are truncated like any other text");
}

static void test_degenerate_inputs() {
    section("Degenerate inputs");

    std::vector<uint8_t> buffer(4, 0);
    BoundedWriter writer(ByteView(buffer.data(), buffer.size()));

    writer.append(nullptr);
    writer.append(nullptr, 10);
    writer.append("", 0);
    check(writer.written() == 0, "null and empty text append nothing");

    BoundedWriter empty{ByteView()};
    empty.append("anything");
    check(empty.capacity() == 0 && empty.written() == 0, "zero-capacity writer accepts and drops text");

    const char unterminated[4] = {'a', 'b', 'c', 'd'};
    BoundedWriter bounded(ByteView(buffer.data(), 2));
    bounded.append(unterminated);
    check(bounded.written() == 2, "string scan stops at capacity");
}

int main() {
    std::cout << "=== BoundedWriter Test ===" << std::endl;

    test_append_within_capacity();
    test_append_saturates();
    test_initial_offset();
    test_number_formatting();
    test_degenerate_inputs();

    return PanicRam::Test::finish("BoundedWriter Test");
}
