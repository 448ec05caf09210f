// Include/mysql_binding/value_to_bind.h
#pragma once

#include <expected>
#include <memory>
#include <vector>

#include "mysql_binding/bind.h"
#include "mysql_binding/bind_set.h"
#include "mysql_binding/binding_config.h"
#include "mysql_binding/mysql_bind_error.h"
#include "mysql_binding/value.h"

namespace mysql_binding {

    // Picks the Bind constructor for each Value variant:
    //
    //   Null      -> Bind()                       MYSQL_TYPE_NULL
    //   Int64     -> Bind(int64_t)                MYSQL_TYPE_LONGLONG
    //   UInt64    -> Bind(uint64_t)               MYSQL_TYPE_LONGLONG, unsigned
    //   Double    -> Bind(double)                 MYSQL_TYPE_DOUBLE
    //   String    -> Bind(std::string_view)       MYSQL_TYPE_STRING
    //   Bytes     -> Bind(const Bytes&)           MYSQL_TYPE_STRING
    //   Bool      -> Bind(int64_t{0 or 1})        MYSQL_TYPE_LONGLONG
    //   Timestamp -> Bind(time_point, calendar)   MYSQL_TYPE_DATETIME
    //   Array/Map -> encoder bytes -> Bind(const Bytes&)
    class ValueToBind {
      public:
        ValueToBind();
        explicit ValueToBind(BindingConfig config);

        // Only fails for Array/Map values when the encoder fails and the policy is Propagate.
        std::expected<std::unique_ptr<Bind>, MySqlBindError> bind(const Value& value) const;

        // Binds |values| in order; stops at the first failure and names its position.
        std::expected<BindSet, MySqlBindError> bindAll(const std::vector<Value>& values) const;

        const BindingConfig& config() const noexcept {
            return m_config;
        }

      private:
        std::expected<std::unique_ptr<Bind>, MySqlBindError> bindStructured(const Value& value) const;

        BindingConfig m_config;
        std::shared_ptr<const StructuredEncoder> m_encoder;
        std::shared_ptr<spdlog::logger> m_logger;
    };

}  // namespace mysql_binding
