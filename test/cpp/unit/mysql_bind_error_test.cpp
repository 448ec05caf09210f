#include <gtest/gtest.h>

#include <string>

#include "mysql_binding/mysql_bind_error.h"
#include "mysql_binding/mysql_wire_types.h"

using namespace mysql_binding;

TEST(MySqlBindErrorTest, DefaultIsSuccess) {
    MySqlBindError err;
    EXPECT_TRUE(err.isOk());
    EXPECT_STREQ(err.sql_state, "00000");
    EXPECT_EQ(err.toString(), "MySqlBindError: Success");
}

TEST(MySqlBindErrorTest, InternalErrorUsesInternalSqlState) {
    MySqlBindError err(InternalErrc::STRUCTURED_ENCODING_FAILED, "boom");
    EXPECT_FALSE(err.isOk());
    EXPECT_STREQ(err.sql_state, "PI000");
    EXPECT_EQ(err.native_mysql_errno, 0u);
    EXPECT_EQ(err.toString(), "MySqlBindError: [Code: 10001] [SQLSTATE: PI000] boom");
}

TEST(MySqlBindErrorTest, NativeErrorKeepsServerState) {
    MySqlBindError err(InternalErrc::STMT_BIND_PARAM_FAILED, 2031, "HY000", "No data supplied");
    EXPECT_STREQ(err.sql_state, "HY000");
    EXPECT_NE(err.toString().find("MySQL Errno: 2031"), std::string::npos);

    MySqlBindError with_state(InternalErrc::STMT_BIND_RESULT_FAILED, 2036, "07001", "x");
    EXPECT_STREQ(with_state.sql_state, "07001");
}

TEST(MySqlBindErrorTest, MissingNativeStateFallsBackToGeneralError) {
    MySqlBindError null_state(InternalErrc::STMT_BIND_PARAM_FAILED, 1, nullptr, "x");
    EXPECT_STREQ(null_state.sql_state, "HY000");

    MySqlBindError empty_state(InternalErrc::STMT_BIND_PARAM_FAILED, 1, "", "x");
    EXPECT_STREQ(empty_state.sql_state, "HY000");
}

TEST(MySqlBindErrorTest, StmtErrorOnNullHandle) {
    MySqlBindError err = makeStmtError(nullptr, InternalErrc::STMT_BIND_PARAM_FAILED, "bind");
    EXPECT_EQ(err.error_code, InternalErrc::STMT_HANDLE_NULL);
    EXPECT_NE(err.error_message.find("bind"), std::string::npos);
}

TEST(MySqlWireTypesTest, TemporalAndNumericClassification) {
    EXPECT_TRUE(isFixedTemporalWireType(MYSQL_TYPE_DATE));
    EXPECT_TRUE(isFixedTemporalWireType(MYSQL_TYPE_TIME));
    EXPECT_FALSE(isFixedTemporalWireType(MYSQL_TYPE_YEAR));
    EXPECT_FALSE(isFixedTemporalWireType(MYSQL_TYPE_STRING));

    EXPECT_EQ(fixedNumericWidth(MYSQL_TYPE_SHORT).value_or(0), 2u);
    EXPECT_EQ(fixedNumericWidth(MYSQL_TYPE_INT24).value_or(0), 4u);
    EXPECT_EQ(fixedNumericWidth(MYSQL_TYPE_DOUBLE).value_or(0), 8u);
    EXPECT_FALSE(fixedNumericWidth(MYSQL_TYPE_NEWDECIMAL).has_value());

    EXPECT_STREQ(wireTypeName(MYSQL_TYPE_LONGLONG), "LONGLONG");
}
