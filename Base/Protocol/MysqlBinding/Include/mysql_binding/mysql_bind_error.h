// Include/mysql_binding/mysql_bind_error.h
#pragma once

#include <mysql/mysql.h>

#include <string>

namespace mysql_binding {

    // Internal error codes carried by MySqlBindError::error_code
    namespace InternalErrc {
        constexpr unsigned int SUCCESS = 0;

        // Structured value encoding (10000 - 10099)
        constexpr unsigned int STRUCTURED_ENCODING_FAILED = 10001;
        constexpr unsigned int STRUCTURED_ENCODING_NON_FINITE_NUMBER = 10002;
        constexpr unsigned int STRUCTURED_ENCODING_INTEGER_OUT_OF_RANGE = 10003;

        // Binding a value sequence (10200 - 10299)
        constexpr unsigned int BIND_VALUE_CONVERSION_FAILED = 10201;

        // Attaching binds to a statement handle (10300 - 10399)
        constexpr unsigned int STMT_HANDLE_NULL = 10301;
        constexpr unsigned int STMT_BIND_PARAM_FAILED = 10302;
        constexpr unsigned int STMT_BIND_RESULT_FAILED = 10303;
        constexpr unsigned int STMT_BIND_COUNT_MISMATCH = 10304;
    }  // namespace InternalErrc

    struct MySqlBindError {
        unsigned int error_code = InternalErrc::SUCCESS;
        unsigned int native_mysql_errno = 0;
        char sql_state[SQLSTATE_LENGTH + 1];
        std::string error_message;

        MySqlBindError() noexcept;

        // Internal error, SQLSTATE "PI000"
        MySqlBindError(unsigned int internal_code, std::string msg) noexcept;

        // Error reported by the client library; sql_state falls back to "HY000" when absent
        MySqlBindError(unsigned int internal_code, unsigned int mysql_errno, const char* mysql_sql_state, std::string msg) noexcept;

        bool isOk() const noexcept {
            return error_code == InternalErrc::SUCCESS;
        }

        std::string toString() const;
    };

    // Builds an error from the statement handle's last errno / SQLSTATE / message.
    MySqlBindError makeStmtError(MYSQL_STMT* stmt_handle, unsigned int internal_code, const std::string& context);

}  // namespace mysql_binding
