// Source/mysql_wire_types.cpp
#include "mysql_binding/mysql_wire_types.h"

#include <cstdint>

namespace mysql_binding {

    bool isFixedTemporalWireType(WireType type) noexcept {
        switch (type) {
            case MYSQL_TYPE_DATE:
            case MYSQL_TYPE_DATETIME:
            case MYSQL_TYPE_TIMESTAMP:
            case MYSQL_TYPE_TIME:
                return true;
            default:
                return false;
        }
    }

    bool isByteSequenceWireType(WireType type) noexcept {
        switch (type) {
            case MYSQL_TYPE_STRING:
            case MYSQL_TYPE_VAR_STRING:
            case MYSQL_TYPE_VARCHAR:
            case MYSQL_TYPE_TINY_BLOB:
            case MYSQL_TYPE_MEDIUM_BLOB:
            case MYSQL_TYPE_LONG_BLOB:
            case MYSQL_TYPE_BLOB:
            case MYSQL_TYPE_JSON:
                return true;
            default:
                return false;
        }
    }

    std::optional<std::size_t> fixedNumericWidth(WireType type) noexcept {
        switch (type) {
            case MYSQL_TYPE_TINY:
                return sizeof(int8_t);
            case MYSQL_TYPE_SHORT:
                return sizeof(int16_t);
            case MYSQL_TYPE_INT24:
            case MYSQL_TYPE_LONG:
                return sizeof(int32_t);
            case MYSQL_TYPE_LONGLONG:
                return sizeof(int64_t);
            case MYSQL_TYPE_FLOAT:
                return sizeof(float);
            case MYSQL_TYPE_DOUBLE:
                return sizeof(double);
            default:
                return std::nullopt;
        }
    }

    const char* wireTypeName(WireType type) noexcept {
        switch (type) {
            case MYSQL_TYPE_NULL:
                return "NULL";
            case MYSQL_TYPE_TINY:
                return "TINY";
            case MYSQL_TYPE_SHORT:
                return "SHORT";
            case MYSQL_TYPE_INT24:
                return "INT24";
            case MYSQL_TYPE_LONG:
                return "LONG";
            case MYSQL_TYPE_LONGLONG:
                return "LONGLONG";
            case MYSQL_TYPE_FLOAT:
                return "FLOAT";
            case MYSQL_TYPE_DOUBLE:
                return "DOUBLE";
            case MYSQL_TYPE_DECIMAL:
                return "DECIMAL";
            case MYSQL_TYPE_NEWDECIMAL:
                return "NEWDECIMAL";
            case MYSQL_TYPE_DATE:
                return "DATE";
            case MYSQL_TYPE_TIME:
                return "TIME";
            case MYSQL_TYPE_DATETIME:
                return "DATETIME";
            case MYSQL_TYPE_TIMESTAMP:
                return "TIMESTAMP";
            case MYSQL_TYPE_YEAR:
                return "YEAR";
            case MYSQL_TYPE_STRING:
                return "STRING";
            case MYSQL_TYPE_VAR_STRING:
                return "VAR_STRING";
            case MYSQL_TYPE_VARCHAR:
                return "VARCHAR";
            case MYSQL_TYPE_TINY_BLOB:
                return "TINY_BLOB";
            case MYSQL_TYPE_MEDIUM_BLOB:
                return "MEDIUM_BLOB";
            case MYSQL_TYPE_LONG_BLOB:
                return "LONG_BLOB";
            case MYSQL_TYPE_BLOB:
                return "BLOB";
            case MYSQL_TYPE_JSON:
                return "JSON";
            case MYSQL_TYPE_BIT:
                return "BIT";
            case MYSQL_TYPE_ENUM:
                return "ENUM";
            case MYSQL_TYPE_SET:
                return "SET";
            case MYSQL_TYPE_GEOMETRY:
                return "GEOMETRY";
            default:
                return "UNKNOWN";
        }
    }

}  // namespace mysql_binding
