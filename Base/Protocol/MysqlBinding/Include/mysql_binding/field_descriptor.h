// Include/mysql_binding/field_descriptor.h
#pragma once

#include <mysql/mysql.h>

#include <string>

#include "mysql_binding/mysql_wire_types.h"

namespace mysql_binding {

    // Column metadata needed to size an output binding.
    struct FieldDescriptor {
        std::string name;
        WireType wire_type = MYSQL_TYPE_NULL;
        unsigned long max_length = 0;  // longest encoded value reported by the result metadata
        unsigned int flags = 0;

        FieldDescriptor() = default;
        FieldDescriptor(std::string field_name, WireType type, unsigned long field_max_length, unsigned int field_flags = 0);

        static FieldDescriptor fromMysqlField(const MYSQL_FIELD& field);

        bool isUnsigned() const {
            return flags & UNSIGNED_FLAG;
        }
        bool isTemporal() const {
            return isFixedTemporalWireType(wire_type);
        }
    };

}  // namespace mysql_binding
