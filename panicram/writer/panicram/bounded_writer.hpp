/**
 * @file bounded_writer.hpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 *
 * Saturating text sink over a fixed byte buffer.
 *
 * The BoundedWriter is used to format diagnostic text directly into the
 * persistent region while a fault is being handled. It has no failure mode:
 * text that does not fit is silently dropped, so formatting can never raise
 * a second fault on top of the one being recorded. It uses no heap and no
 * printf-family functions.
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "panicram/region.hpp"


namespace PanicRam {

    /**
     * @brief Append-only, truncating writer over a ByteView
     *
     * Not thread-safe; a writer has a single owner for its whole lifetime.
     */
    class BoundedWriter {
    public:
        /**
         * @brief Create a writer over a target buffer
         *
         * @param target Buffer that receives the text; its size is the capacity
         * @param offset Initial write position; clamped to the capacity
         */
        explicit BoundedWriter(ByteView target, size_t offset = 0);

        /**
         * @brief Append raw text
         *
         * Copies min(length, remaining()) bytes and advances the write
         * position by the number of bytes copied.
         *
         * @param text Bytes to append (may be null if length is 0)
         * @param length Number of bytes requested
         */
        void append(const char *text, size_t length);

        /**
         * @brief Append a NUL-terminated string
         *
         * A null pointer appends nothing.
         */
        void append(const char *text);

        /**
         * @brief Append the decimal representation of a value
         */
        void appendDecimal(uint32_t value);

        /**
         * @brief Append a value as 0x-prefixed, 8-digit uppercase hex
         */
        void appendHex(uint32_t value);

        size_t capacity() const { return _target.size(); }

        size_t offset() const { return _offset; }

        size_t remaining() const { return _target.size() - _offset; }

        /**
         * @brief Number of bytes copied since construction
         */
        size_t written() const { return _offset - _startOffset; }

    private:
        ByteView _target;
        size_t _startOffset;
        size_t _offset;
    };

} // namespace PanicRam
