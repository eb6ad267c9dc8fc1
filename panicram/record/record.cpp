/**
 * @file record.cpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 */

#include "panicram/record.hpp"


namespace PanicRam {

    /**
     * @brief Validate UTF-8, tolerating one truncated sequence at the end
     *
     * Rejects invalid lead bytes, stray continuation bytes, overlong forms,
     * surrogates and code points above U+10FFFF.
     */
    static bool isWellFormedUtf8(std::string_view text) {
        size_t i = 0;

        while (i < text.size()) {
            uint8_t lead = static_cast<uint8_t>(text[i]);

            if (lead < 0x80) {
                i++;
                continue;
            }

            size_t length;
            uint32_t codePoint;
            uint32_t minimum;

            if ((lead & 0xE0) == 0xC0) {
                length = 2;
                codePoint = lead & 0x1F;
                minimum = 0x80;
            } else if ((lead & 0xF0) == 0xE0) {
                length = 3;
                codePoint = lead & 0x0F;
                minimum = 0x800;
            } else if ((lead & 0xF8) == 0xF0) {
                length = 4;
                codePoint = lead & 0x07;
                minimum = 0x10000;
            } else {
                return false;
            }

            size_t j = 1;
            for (; j < length && i + j < text.size(); j++) {
                uint8_t continuation = static_cast<uint8_t>(text[i + j]);
                if ((continuation & 0xC0) != 0x80) {
                    return false;
                }
                codePoint = (codePoint << 6) | (continuation & 0x3F);
            }

            if (j < length) {
                return true; // Cut short by truncation at the end of the field
            }

            if (codePoint < minimum || codePoint > 0x10FFFF ||
                (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {
                return false;
            }

            i += length;
        }

        return true;
    }

    static std::string_view asText(ByteView bytes) {
        if (bytes.empty()) {
            return std::string_view();
        }
        return std::string_view(reinterpret_cast<const char *>(bytes.data()), bytes.size());
    }

    Record::Record(const RecordHeader &header, ByteView region) :
        _header(header),
        _region(region) {
    }

    std::string_view Record::filename() const {
        return asText(_region.subview(HEADER_SIZE, _header.filenameLength));
    }

    std::string_view Record::message() const {
        return asText(_region.subview(HEADER_SIZE + _header.filenameLength, _header.messageLength));
    }

    bool Record::isWellFormed() const {
        size_t occupied = HEADER_SIZE + static_cast<size_t>(_header.filenameLength) +
                          static_cast<size_t>(_header.messageLength);

        if (occupied > _region.size()) {
            return false;
        }

        return isWellFormedUtf8(filename()) && isWellFormedUtf8(message());
    }

} // namespace PanicRam
