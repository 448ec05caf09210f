// Include/mysql_binding/bind_set.h
#pragma once

#include <mysql/mysql.h>

#include <cstddef>
#include <expected>
#include <memory>
#include <vector>

#include "mysql_binding/bind.h"
#include "mysql_binding/field_descriptor.h"
#include "mysql_binding/mysql_bind_error.h"
#include "spdlog/spdlog.h"

namespace mysql_binding {

    // Ordered Bind instances for one statement, plus the contiguous MYSQL_BIND array the
    // C API takes. Each array element is a copy of the matching Bind's native view, so it
    // points straight at Bind-owned storage. The set owns the Binds; the array stays valid
    // until the set is destroyed or appended to.
    class BindSet {
      public:
        BindSet() = default;
        explicit BindSet(std::shared_ptr<spdlog::logger> logger);

        BindSet(const BindSet&) = delete;
        BindSet& operator=(const BindSet&) = delete;
        BindSet(BindSet&&) noexcept = default;
        BindSet& operator=(BindSet&&) noexcept = default;

        // One output binding per column.
        static BindSet forResultFields(const std::vector<FieldDescriptor>& fields, std::shared_ptr<spdlog::logger> logger = nullptr);
        // Same, reading the columns from mysql_stmt_result_metadata().
        static BindSet forResultMetadata(MYSQL_RES* metadata, std::shared_ptr<spdlog::logger> logger = nullptr);

        Bind& append(std::unique_ptr<Bind> bind);

        std::size_t size() const noexcept {
            return m_binds.size();
        }
        bool empty() const noexcept {
            return m_binds.empty();
        }
        const Bind& at(std::size_t index) const;
        const Bind& operator[](std::size_t index) const {
            return *m_binds[index];
        }

        // nullptr for an empty set
        MYSQL_BIND* nativeArray() noexcept {
            return m_native_binds.empty() ? nullptr : m_native_binds.data();
        }

        std::expected<void, MySqlBindError> attachAsParams(MYSQL_STMT* stmt_handle);
        std::expected<void, MySqlBindError> attachAsResults(MYSQL_STMT* stmt_handle);

      private:
        std::vector<std::unique_ptr<Bind>> m_binds;
        std::vector<MYSQL_BIND> m_native_binds;
        std::shared_ptr<spdlog::logger> m_logger;
    };

}  // namespace mysql_binding
