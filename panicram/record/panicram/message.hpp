/**
 * @file message.hpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 *
 * Producers of the descriptive text stored in a fault record.
 *
 * The record codec does not know what a fault looks like. It hands a
 * BoundedWriter positioned in the persistent region to a MessageSource and
 * records however many bytes the source managed to write. Implementations
 * run in fault context and must follow the same rules as the writer: no
 * heap, no printf, no operation that can fail.
 */

#pragma once

#include <cstddef>

#include "panicram/bounded_writer.hpp"
#include "panicram/fault_type.hpp"


namespace PanicRam {

    /**
     * @brief Abstract producer of record message text
     */
    class MessageSource {
    public:
        virtual ~MessageSource() = default;

        /**
         * @brief Format the message into the writer
         *
         * @param writer Saturating sink positioned at the message area
         */
        virtual void writeTo(BoundedWriter &writer) const = 0;
    };

    /**
     * @brief Message made of a single, preformatted run of text
     */
    class TextMessage : public MessageSource {
    public:
        /**
         * @param text NUL-terminated text; null produces an empty message
         */
        explicit TextMessage(const char *text);

        /**
         * @param text Text bytes (need not be NUL-terminated)
         * @param length Number of bytes in text
         */
        TextMessage(const char *text, size_t length);

        void writeTo(BoundedWriter &writer) const override;

    private:
        const char *_text;
        size_t _length;
        bool _terminated;
    };

    /**
     * @brief Message describing a classified fault
     *
     * Formats as `<TYPE>: <description>`, followed by ` in <function>()`
     * when the function name is known.
     */
    class FaultMessage : public MessageSource {
    public:
        FaultMessage(FaultType type, const char *description, const char *function);

        void writeTo(BoundedWriter &writer) const override;

    private:
        FaultType _type;
        const char *_description;
        const char *_function;
    };

} // namespace PanicRam
