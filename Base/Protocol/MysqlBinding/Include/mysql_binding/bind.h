// Include/mysql_binding/bind.h
#pragma once

#include <mysql/mysql.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#include "mysql_binding/field_descriptor.h"
#include "mysql_binding/mysql_wire_types.h"
#include "mysql_binding/temporal_converter.h"

namespace mysql_binding {

    // Owned, type-tagged MYSQL_BIND.
    //
    // Every buffer and indicator cell the descriptor points at is held by exactly one
    // owning handle of this object and released when the object is destroyed. The
    // MYSQL_BIND returned by native() is a non-owning view over those handles; it may be
    // copied into the contiguous array handed to mysql_stmt_bind_param/_result as long
    // as the Bind outlives the array.
    //
    // Allocation failure surfaces as std::bad_alloc from the constructor; handles already
    // acquired by that constructor are released before the exception leaves it.
    class Bind {
      public:
        using Byte = unsigned char;
        using Bytes = std::vector<Byte>;
        using Buffer = std::unique_ptr<Byte[]>;

        // NULL input binding. Owns nothing.
        Bind();

        // Output binding for a result column. Always owns buffer, length, is_null and error cells.
        explicit Bind(const FieldDescriptor& field);

        // Takes ownership of |buffer| (|buffer_length| bytes) and allocates a length cell
        // initialised to |buffer_length|. All value constructors below end up here.
        Bind(WireType type, Buffer buffer, unsigned long buffer_length, bool is_unsigned = false);

        // The byte and MYSQL_TIME constructors throw std::invalid_argument when |type| is not a
        // byte sequence (string, blob, JSON) or temporal wire type respectively.
        explicit Bind(int64_t value);
        explicit Bind(uint64_t value);
        explicit Bind(double value);
        explicit Bind(std::string_view utf8_text);
        explicit Bind(const Bytes& bytes, WireType type = MYSQL_TYPE_STRING);
        explicit Bind(const std::chrono::system_clock::time_point& time_point, const TemporalCalendar& calendar = TemporalCalendar::utc());
        explicit Bind(const MYSQL_TIME& record, WireType type = MYSQL_TYPE_DATETIME);

        ~Bind();

        Bind(const Bind&) = delete;
        Bind& operator=(const Bind&) = delete;
        Bind(Bind&&) = delete;
        Bind& operator=(Bind&&) = delete;

        WireType variant() const noexcept {
            return m_wire_type;
        }

        const MYSQL_BIND& native() const noexcept {
            return m_native;
        }

        const Byte* buffer() const noexcept {
            return m_buffer.get();
        }
        unsigned long bufferLength() const noexcept {
            return m_buffer_length;
        }

        const unsigned long* lengthCell() const noexcept {
            return m_length_cell.get();
        }
        const bool* isNullCell() const noexcept {
            return m_is_null_cell.get();
        }
        const bool* errorCell() const noexcept {
            return m_error_cell.get();
        }

        bool isUnsigned() const noexcept {
            return m_is_unsigned;
        }
        bool isOutput() const noexcept {
            return m_is_output;
        }
        bool isNull() const noexcept {
            return m_wire_type == MYSQL_TYPE_NULL;
        }

        // Byte size an output binding allocates for |field|.
        static unsigned long outputBufferLength(const FieldDescriptor& field) noexcept;

      private:
        static Buffer allocateBuffer(std::size_t length);
        static Buffer copyIntoBuffer(const void* source, std::size_t length);

        void refreshNativeView() noexcept;

        const WireType m_wire_type;
        Buffer m_buffer;
        unsigned long m_buffer_length;
        std::unique_ptr<unsigned long> m_length_cell;
        std::unique_ptr<bool> m_is_null_cell;
        std::unique_ptr<bool> m_error_cell;
        bool m_is_unsigned;
        bool m_is_output;

        MYSQL_BIND m_native;
    };

}  // namespace mysql_binding
