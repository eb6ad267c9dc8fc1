/**
 * @file message.cpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 */

#include "panicram/message.hpp"


namespace PanicRam {

    const char *faultTypeToString(FaultType type) {
        switch (type) {
            case FaultType::UNKNOWN: return "UNKNOWN";
            case FaultType::PANIC: return "PANIC";
            case FaultType::FREERTOS_ASSERT: return "FREERTOS_ASSERT";
            case FaultType::STACK_OVERFLOW: return "STACK_OVERFLOW";
            case FaultType::MALLOC_FAILED: return "MALLOC_FAILED";
            case FaultType::C_ASSERT: return "C_ASSERT";
            case FaultType::HARDWARE_FAULT: return "HARDWARE_FAULT";
            case FaultType::INVALID_STATE: return "INVALID_STATE";
            default: return "INVALID";
        }
    }

    TextMessage::TextMessage(const char *text) :
        _text(text),
        _length(0),
        _terminated(true) {
    }

    TextMessage::TextMessage(const char *text, size_t length) :
        _text(text),
        _length(length),
        _terminated(false) {
    }

    void TextMessage::writeTo(BoundedWriter &writer) const {
        if (_terminated) {
            writer.append(_text);
        } else {
            writer.append(_text, _length);
        }
    }

    FaultMessage::FaultMessage(FaultType type, const char *description, const char *function) :
        _type(type),
        _description(description),
        _function(function) {
    }

    void FaultMessage::writeTo(BoundedWriter &writer) const {
        writer.append(faultTypeToString(_type));
        writer.append(": ");
        writer.append(_description != nullptr ? _description : "(no description)");

        if (_function != nullptr && _function[0] != '\0') {
            writer.append(" in ");
            writer.append(_function);
            writer.append("()");
        }
    }

} // namespace PanicRam
