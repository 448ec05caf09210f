// Source/bind_numeric.cpp
#include "mysql_binding/bind.h"

namespace mysql_binding {

    // Numeric values are stored in host byte order, which is what the C API reads for
    // MYSQL_TYPE_LONGLONG and MYSQL_TYPE_DOUBLE.

    Bind::Bind(int64_t value) : Bind(MYSQL_TYPE_LONGLONG, copyIntoBuffer(&value, sizeof(int64_t)), sizeof(int64_t), false) {
    }

    Bind::Bind(uint64_t value) : Bind(MYSQL_TYPE_LONGLONG, copyIntoBuffer(&value, sizeof(uint64_t)), sizeof(uint64_t), true) {
    }

    Bind::Bind(double value) : Bind(MYSQL_TYPE_DOUBLE, copyIntoBuffer(&value, sizeof(double)), sizeof(double), false) {
    }

}  // namespace mysql_binding
