// Source/value.cpp
#include "mysql_binding/value.h"

#include <sstream>
#include <type_traits>
#include <utility>

#include "mysql_binding/temporal_converter.h"

namespace mysql_binding {

    Value::Value() : m_value_storage(std::monostate{}) {
    }
    Value::Value(std::nullptr_t) : m_value_storage(std::monostate{}) {
    }
    Value::Value(bool val) : m_value_storage(val) {
    }
    Value::Value(int32_t val) : m_value_storage(static_cast<int64_t>(val)) {
    }
    Value::Value(int64_t val) : m_value_storage(val) {
    }
    Value::Value(uint32_t val) : m_value_storage(static_cast<uint64_t>(val)) {
    }
    Value::Value(uint64_t val) : m_value_storage(val) {
    }
    Value::Value(double val) : m_value_storage(val) {
    }
    Value::Value(const char* val) : m_value_storage(val ? std::string(val) : std::string()) {
    }
    Value::Value(std::string val) : m_value_storage(std::move(val)) {
    }
    Value::Value(Bytes val) : m_value_storage(std::move(val)) {
    }
    Value::Value(Timestamp val) : m_value_storage(val) {
    }
    Value::Value(Array val) : m_value_storage(std::move(val)) {
    }
    Value::Value(Map val) : m_value_storage(std::move(val)) {
    }

    ValueType Value::type() const noexcept {
        return static_cast<ValueType>(m_value_storage.index());
    }

    const char* Value::typeName() const noexcept {
        return valueTypeName(type());
    }

    bool Value::isStructured() const noexcept {
        ValueType t = type();
        return t == ValueType::Array || t == ValueType::Map;
    }

    std::string Value::toDebugString() const {
        std::ostringstream oss;
        oss << typeName();
        std::visit(
            [&oss](const auto& arg) {
                using T = std::decay_t<decltype(arg)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    // nothing to add
                } else if constexpr (std::is_same_v<T, bool>) {
                    oss << "(" << (arg ? "true" : "false") << ")";
                } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, uint64_t> || std::is_same_v<T, double>) {
                    oss << "(" << arg << ")";
                } else if constexpr (std::is_same_v<T, std::string> || std::is_same_v<T, Bytes>) {
                    oss << "[" << arg.size() << " bytes]";
                } else if constexpr (std::is_same_v<T, Timestamp>) {
                    oss << "(" << formatWireTemporal(toWireTemporal(arg)) << "Z)";
                } else {
                    oss << "[" << arg.size() << " items]";
                }
            },
            m_value_storage);
        return oss.str();
    }

    const char* valueTypeName(ValueType type) noexcept {
        switch (type) {
            case ValueType::Null:
                return "Null";
            case ValueType::Int64:
                return "Int64";
            case ValueType::UInt64:
                return "UInt64";
            case ValueType::Double:
                return "Double";
            case ValueType::String:
                return "String";
            case ValueType::Bytes:
                return "Bytes";
            case ValueType::Bool:
                return "Bool";
            case ValueType::Timestamp:
                return "Timestamp";
            case ValueType::Array:
                return "Array";
            case ValueType::Map:
                return "Map";
        }
        return "Unknown";
    }

}  // namespace mysql_binding
