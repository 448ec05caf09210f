// Source/field_descriptor.cpp
#include "mysql_binding/field_descriptor.h"

#include <utility>

namespace mysql_binding {

    FieldDescriptor::FieldDescriptor(std::string field_name, WireType type, unsigned long field_max_length, unsigned int field_flags)
        : name(std::move(field_name)), wire_type(type), max_length(field_max_length), flags(field_flags) {
    }

    FieldDescriptor FieldDescriptor::fromMysqlField(const MYSQL_FIELD& field) {
        FieldDescriptor descriptor;
        descriptor.name = field.name ? std::string(field.name, field.name_length) : std::string();
        descriptor.wire_type = field.type;
        descriptor.max_length = field.max_length;
        descriptor.flags = field.flags;
        return descriptor;
    }

}  // namespace mysql_binding
