// Include/mysql_binding/value.h
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace mysql_binding {

    enum class ValueType {
        Null,
        Int64,
        UInt64,
        Double,
        String,  // UTF-8 text
        Bytes,
        Bool,
        Timestamp,
        Array,
        Map
    };

    struct MapEntry;

    // Dynamically typed value bound to a statement parameter.
    class Value {
      public:
        using Bytes = std::vector<unsigned char>;
        using Timestamp = std::chrono::system_clock::time_point;
        using Array = std::vector<Value>;
        using Map = std::vector<MapEntry>;  // insertion order is kept

        using StorageType = std::variant<  // index matches ValueType
            std::monostate,                // 0: Null
            int64_t,                       // 1
            uint64_t,                      // 2
            double,                        // 3
            std::string,                   // 4
            Bytes,                         // 5
            bool,                          // 6
            Timestamp,                     // 7
            Array,                         // 8
            Map                            // 9
            >;

        Value();
        Value(std::nullptr_t);
        Value(bool val);
        Value(int32_t val);
        Value(int64_t val);
        Value(uint32_t val);
        Value(uint64_t val);
        Value(double val);
        Value(const char* val);
        Value(std::string val);
        Value(Bytes val);
        Value(Timestamp val);
        Value(Array val);
        Value(Map val);

        ValueType type() const noexcept;
        const char* typeName() const noexcept;
        bool isNull() const noexcept {
            return std::holds_alternative<std::monostate>(m_value_storage);
        }
        bool isStructured() const noexcept;

        const StorageType& storage() const noexcept {
            return m_value_storage;
        }

        // Short human readable rendering for log lines. Text and byte payloads are
        // summarised by size, never dumped.
        std::string toDebugString() const;

      private:
        StorageType m_value_storage;
    };

    struct MapEntry {
        std::string key;
        Value value;
    };

    const char* valueTypeName(ValueType type) noexcept;

}  // namespace mysql_binding
