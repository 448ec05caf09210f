// Include/mysql_binding/structured_encoder.h
#pragma once

#include <expected>
#include <vector>

#include "mysql_binding/mysql_bind_error.h"
#include "mysql_binding/value.h"

namespace mysql_binding {

    // Serialises array and map values into the byte sequence stored in a string/blob column.
    class StructuredEncoder {
      public:
        virtual ~StructuredEncoder() = default;

        virtual std::expected<std::vector<unsigned char>, MySqlBindError> encode(const Value& value) const = 0;
    };

    // Compact JSON through QJsonDocument.
    //
    //   null -> null, bool -> true/false, Int64 -> integer, UInt64 -> integer (must fit in
    //   int64), Double -> number (must be finite), String -> string, Bytes -> base64 string,
    //   Timestamp -> ISO-8601 UTC string with milliseconds, Array -> array, Map -> object.
    //
    // Object keys come out in QJsonObject's sorted order; a repeated key keeps its last value.
    // The top-level value must be an Array or a Map.
    class JsonStructuredEncoder : public StructuredEncoder {
      public:
        std::expected<std::vector<unsigned char>, MySqlBindError> encode(const Value& value) const override;
    };

}  // namespace mysql_binding
