// Source/bind_string_blob_time.cpp
#include <stdexcept>
#include <string>

#include "mysql_binding/bind.h"

namespace mysql_binding {

    namespace {
        // Fixed-width types ignore buffer_length on the wire, so a short byte buffer
        // tagged with one would be over-read by the client library.
        WireType requireByteSequenceWireType(WireType type) {
            if (!isByteSequenceWireType(type)) {
                throw std::invalid_argument(std::string("Bind: ") + wireTypeName(type) + " is not a byte sequence wire type");
            }
            return type;
        }

        WireType requireTemporalWireType(WireType type) {
            if (!isFixedTemporalWireType(type)) {
                throw std::invalid_argument(std::string("Bind: ") + wireTypeName(type) + " is not a temporal wire type");
            }
            return type;
        }
    }  // namespace

    // Length is the UTF-8 byte count, not the character count.
    Bind::Bind(std::string_view utf8_text) : Bind(MYSQL_TYPE_STRING, copyIntoBuffer(utf8_text.data(), utf8_text.size()), static_cast<unsigned long>(utf8_text.size())) {
    }

    Bind::Bind(const Bytes& bytes, WireType type) : Bind(requireByteSequenceWireType(type), copyIntoBuffer(bytes.data(), bytes.size()), static_cast<unsigned long>(bytes.size())) {
    }

    Bind::Bind(const std::chrono::system_clock::time_point& time_point, const TemporalCalendar& calendar) : Bind(toWireTemporal(time_point, calendar), MYSQL_TYPE_DATETIME) {
    }

    Bind::Bind(const MYSQL_TIME& record, WireType type) : Bind(requireTemporalWireType(type), copyIntoBuffer(&record, sizeof(MYSQL_TIME)), sizeof(MYSQL_TIME)) {
    }

}  // namespace mysql_binding
