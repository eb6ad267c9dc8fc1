/**
 * @file bounded_writer.cpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 *
 * Runs in fault context: no heap, no printf, no library calls beyond memcpy.
 */

#include "panicram/bounded_writer.hpp"

#include <cstring>


namespace PanicRam {

    BoundedWriter::BoundedWriter(ByteView target, size_t offset) :
        _target(target),
        _startOffset(offset < target.size() ? offset : target.size()),
        _offset(_startOffset) {
    }

    void BoundedWriter::append(const char *text, size_t length) {
        if (text == nullptr) {
            return;
        }

        size_t bytesLeft = _target.size() - _offset;
        size_t toCopy = length < bytesLeft ? length : bytesLeft;

        if (toCopy > 0) {
            memcpy(_target.data() + _offset, text, toCopy);
            _offset += toCopy;
        }
    }

    void BoundedWriter::append(const char *text) {
        if (text == nullptr) {
            return;
        }

        // Stop scanning once the buffer is full; the source may be unterminated garbage
        size_t length = 0;
        size_t bytesLeft = remaining();
        while (length < bytesLeft && text[length] != '\0') {
            length++;
        }

        append(text, length);
    }

    void BoundedWriter::appendDecimal(uint32_t value) {
        char digits[10];
        size_t count = 0;

        do {
            digits[count++] = static_cast<char>('0' + (value % 10));
            value /= 10;
        } while (value != 0);

        // Digits were produced least significant first
        char ordered[10];
        for (size_t i = 0; i < count; i++) {
            ordered[i] = digits[count - 1 - i];
        }

        append(ordered, count);
    }

    void BoundedWriter::appendHex(uint32_t value) {
        static const char hexDigits[] = "0123456789ABCDEF";
        char text[10] = {'0', 'x'};

        for (size_t i = 0; i < 8; i++) {
            text[9 - i] = hexDigits[value & 0xF];
            value >>= 4;
        }

        append(text, sizeof(text));
    }

} // namespace PanicRam
