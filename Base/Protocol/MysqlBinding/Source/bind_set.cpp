// Source/bind_set.cpp
#include "mysql_binding/bind_set.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace mysql_binding {

    BindSet::BindSet(std::shared_ptr<spdlog::logger> logger) : m_logger(std::move(logger)) {
    }

    BindSet BindSet::forResultFields(const std::vector<FieldDescriptor>& fields, std::shared_ptr<spdlog::logger> logger) {
        BindSet set(std::move(logger));
        set.m_binds.reserve(fields.size());
        set.m_native_binds.reserve(fields.size());
        for (const auto& field : fields) {
            set.append(std::make_unique<Bind>(field));
        }
        if (set.m_logger) {
            set.m_logger->debug("Prepared {} output binding(s).", set.size());
        }
        return set;
    }

    BindSet BindSet::forResultMetadata(MYSQL_RES* metadata, std::shared_ptr<spdlog::logger> logger) {
        std::vector<FieldDescriptor> fields;
        if (metadata) {
            unsigned int num_fields = mysql_num_fields(metadata);
            MYSQL_FIELD* mysql_fields = mysql_fetch_fields(metadata);
            fields.reserve(num_fields);
            for (unsigned int i = 0; i < num_fields; ++i) {
                fields.push_back(FieldDescriptor::fromMysqlField(mysql_fields[i]));
            }
        }
        return forResultFields(fields, std::move(logger));
    }

    Bind& BindSet::append(std::unique_ptr<Bind> bind) {
        if (!bind) {
            throw std::invalid_argument("BindSet::append: null Bind");
        }
        // Both vectors grow by one or neither does.
        m_binds.push_back(std::move(bind));
        try {
            m_native_binds.push_back(m_binds.back()->native());
        } catch (...) {
            m_binds.pop_back();
            throw;
        }
        return *m_binds.back();
    }

    const Bind& BindSet::at(std::size_t index) const {
        if (index >= m_binds.size()) {
            throw std::out_of_range("BindSet::at: index " + std::to_string(index) + " out of range (size " + std::to_string(m_binds.size()) + ")");
        }
        return *m_binds[index];
    }

    std::expected<void, MySqlBindError> BindSet::attachAsParams(MYSQL_STMT* stmt_handle) {
        if (!stmt_handle) {
            return std::unexpected(makeStmtError(stmt_handle, InternalErrc::STMT_HANDLE_NULL, "attachAsParams"));
        }
        unsigned long expected_count = mysql_stmt_param_count(stmt_handle);
        if (expected_count != m_binds.size()) {
            MySqlBindError err(InternalErrc::STMT_BIND_COUNT_MISMATCH, "Parameter count mismatch. Expected " + std::to_string(expected_count) + ", got " + std::to_string(m_binds.size()) + ".");
            if (m_logger) m_logger->error("{}", err.toString());
            return std::unexpected(err);
        }
        if (mysql_stmt_bind_param(stmt_handle, nativeArray())) {
            MySqlBindError err = makeStmtError(stmt_handle, InternalErrc::STMT_BIND_PARAM_FAILED, "mysql_stmt_bind_param failed");
            if (m_logger) m_logger->error("{}", err.toString());
            return std::unexpected(err);
        }
        if (m_logger) {
            m_logger->debug("Attached {} parameter binding(s).", m_binds.size());
        }
        return {};
    }

    std::expected<void, MySqlBindError> BindSet::attachAsResults(MYSQL_STMT* stmt_handle) {
        if (!stmt_handle) {
            return std::unexpected(makeStmtError(stmt_handle, InternalErrc::STMT_HANDLE_NULL, "attachAsResults"));
        }
        unsigned int expected_count = mysql_stmt_field_count(stmt_handle);
        if (expected_count != m_binds.size()) {
            MySqlBindError err(InternalErrc::STMT_BIND_COUNT_MISMATCH, "Result column count mismatch. Expected " + std::to_string(expected_count) + ", got " + std::to_string(m_binds.size()) + ".");
            if (m_logger) m_logger->error("{}", err.toString());
            return std::unexpected(err);
        }
        if (mysql_stmt_bind_result(stmt_handle, nativeArray())) {
            MySqlBindError err = makeStmtError(stmt_handle, InternalErrc::STMT_BIND_RESULT_FAILED, "mysql_stmt_bind_result failed");
            if (m_logger) m_logger->error("{}", err.toString());
            return std::unexpected(err);
        }
        if (m_logger) {
            m_logger->debug("Attached {} result binding(s).", m_binds.size());
        }
        return {};
    }

}  // namespace mysql_binding
