// Include/mysql_binding/mysql_wire_types.h
#pragma once

#include <mysql/mysql.h>

#include <cstddef>
#include <optional>

namespace mysql_binding {

    // The wire type tag is the client library's own enum_field_types.
    using WireType = enum enum_field_types;

    // DATE, DATETIME, TIMESTAMP and TIME are transferred as a fixed MYSQL_TIME record.
    bool isFixedTemporalWireType(WireType type) noexcept;

    // String, blob and JSON types: the client reads exactly buffer_length bytes.
    bool isByteSequenceWireType(WireType type) noexcept;

    // Native C width of the fixed-size numeric wire types, std::nullopt for everything else.
    std::optional<std::size_t> fixedNumericWidth(WireType type) noexcept;

    const char* wireTypeName(WireType type) noexcept;

}  // namespace mysql_binding
