// Source/bind_core.cpp
#include <algorithm>
#include <cstring>  // For std::memset, std::memcpy
#include <utility>

#include "mysql_binding/bind.h"

namespace mysql_binding {

    Bind::Bind() : m_wire_type(MYSQL_TYPE_NULL), m_buffer_length(0), m_is_unsigned(false), m_is_output(false) {
        refreshNativeView();
    }

    Bind::Bind(const FieldDescriptor& field)
        : m_wire_type(field.wire_type),
          m_buffer(allocateBuffer(outputBufferLength(field))),
          m_buffer_length(outputBufferLength(field)),
          m_length_cell(std::make_unique<unsigned long>(0)),
          m_is_null_cell(std::make_unique<bool>(false)),
          m_error_cell(std::make_unique<bool>(false)),
          m_is_unsigned(field.isUnsigned()),
          m_is_output(true) {
        refreshNativeView();
    }

    Bind::Bind(WireType type, Buffer buffer, unsigned long buffer_length, bool is_unsigned)
        : m_wire_type(type),
          m_buffer(std::move(buffer)),
          m_buffer_length(buffer_length),
          m_length_cell(std::make_unique<unsigned long>(buffer_length)),
          m_is_unsigned(is_unsigned),
          m_is_output(false) {
        refreshNativeView();
    }

    Bind::~Bind() = default;

    unsigned long Bind::outputBufferLength(const FieldDescriptor& field) noexcept {
        // The C API always writes a full MYSQL_TIME for temporal columns.
        if (field.isTemporal()) {
            return sizeof(MYSQL_TIME);
        }
        // max_length is a display width; the client writes the native width.
        if (auto native_width = fixedNumericWidth(field.wire_type)) {
            return std::max<unsigned long>(field.max_length, static_cast<unsigned long>(*native_width));
        }
        return field.max_length;
    }

    Bind::Buffer Bind::allocateBuffer(std::size_t length) {
        // new Byte[0] still yields a unique non-null pointer
        return std::make_unique<Byte[]>(length);
    }

    Bind::Buffer Bind::copyIntoBuffer(const void* source, std::size_t length) {
        Buffer buffer = allocateBuffer(length);
        if (length > 0) {
            std::memcpy(buffer.get(), source, length);
        }
        return buffer;
    }

    void Bind::refreshNativeView() noexcept {
        std::memset(&m_native, 0, sizeof(MYSQL_BIND));
        m_native.buffer_type = m_wire_type;
        m_native.buffer = m_buffer.get();
        m_native.buffer_length = m_buffer_length;
        m_native.length = m_length_cell.get();
        m_native.is_null = m_is_null_cell.get();
        m_native.error = m_error_cell.get();
        m_native.is_unsigned = m_is_unsigned;
    }

}  // namespace mysql_binding
