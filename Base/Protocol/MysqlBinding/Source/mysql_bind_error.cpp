// Source/mysql_bind_error.cpp
#include "mysql_binding/mysql_bind_error.h"

#include <cstring>  // For std::strncpy
#include <string>
#include <utility>

namespace mysql_binding {

    namespace {
        void setSqlState(char (&dest)[SQLSTATE_LENGTH + 1], const char* state) noexcept {
            std::strncpy(dest, state, SQLSTATE_LENGTH);
            dest[SQLSTATE_LENGTH] = '\0';
        }
    }  // namespace

    MySqlBindError::MySqlBindError() noexcept : error_message("Success") {
        setSqlState(sql_state, "00000");
    }

    MySqlBindError::MySqlBindError(unsigned int internal_code, std::string msg) noexcept : error_code(internal_code), error_message(std::move(msg)) {
        setSqlState(sql_state, "PI000");  // Protocol Internal
    }

    MySqlBindError::MySqlBindError(unsigned int internal_code, unsigned int mysql_errno, const char* mysql_sql_state, std::string msg) noexcept
        : error_code(internal_code), native_mysql_errno(mysql_errno), error_message(std::move(msg)) {
        if (mysql_sql_state && mysql_sql_state[0] != '\0') {
            setSqlState(sql_state, mysql_sql_state);
        } else {
            setSqlState(sql_state, "HY000");  // General error
        }
    }

    std::string MySqlBindError::toString() const {
        if (isOk()) {
            return "MySqlBindError: Success";
        }
        std::string full_msg = "MySqlBindError: [Code: " + std::to_string(error_code) + "] [SQLSTATE: " + std::string(sql_state) + "] " + error_message;
        if (native_mysql_errno != 0) {
            full_msg += " | MySQL Errno: " + std::to_string(native_mysql_errno);
        }
        return full_msg;
    }

    MySqlBindError makeStmtError(MYSQL_STMT* stmt_handle, unsigned int internal_code, const std::string& context) {
        if (!stmt_handle) {
            return MySqlBindError(InternalErrc::STMT_HANDLE_NULL, context + ": MYSQL_STMT handle is null.");
        }
        unsigned int err_no = mysql_stmt_errno(stmt_handle);
        const char* sql_state = mysql_stmt_sqlstate(stmt_handle);
        std::string err_msg = mysql_stmt_error(stmt_handle);
        if (err_msg.empty()) {
            err_msg = "no error message reported by the client library";
        }
        return MySqlBindError(internal_code, err_no, sql_state, context + ": " + err_msg);
    }

}  // namespace mysql_binding
