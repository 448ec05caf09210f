#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <cstring>
#include <limits>
#include <memory>
#include <sstream>
#include <string>

#include "mysql_binding/value_to_bind.h"
#include "spdlog/sinks/ostream_sink.h"

using namespace mysql_binding;

namespace {

    class FailingEncoder : public StructuredEncoder {
      public:
        std::expected<std::vector<unsigned char>, MySqlBindError> encode(const Value&) const override {
            return std::unexpected(MySqlBindError(InternalErrc::STRUCTURED_ENCODING_FAILED, "encoder unavailable"));
        }
    };

    std::string bufferText(const Bind& bind) {
        return std::string(reinterpret_cast<const char*>(bind.buffer()), bind.bufferLength());
    }

    int64_t bufferInt64(const Bind& bind) {
        int64_t stored = 0;
        std::memcpy(&stored, bind.buffer(), sizeof(stored));
        return stored;
    }

    class ValueToBindTest : public ::testing::Test {
      protected:
        void SetUp() override {
            auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(log_output);
            logger = std::make_shared<spdlog::logger>("value_to_bind_test", sink);
            logger->set_pattern("%l %v");
        }

        BindingConfig configWith(std::shared_ptr<const StructuredEncoder> encoder, EncodingFailurePolicy policy) {
            BindingConfig config;
            config.structured_encoder = std::move(encoder);
            config.encoding_failure_policy = policy;
            config.logger = logger;
            return config;
        }

        std::ostringstream log_output;
        std::shared_ptr<spdlog::logger> logger;
    };

}  // namespace

TEST_F(ValueToBindTest, NullMapsToNullBinding) {
    ValueToBind binder(configWith(nullptr, EncodingFailurePolicy::FallbackToEmpty));
    auto bind = binder.bind(Value());
    ASSERT_TRUE(bind.has_value());
    EXPECT_EQ((*bind)->variant(), MYSQL_TYPE_NULL);
    EXPECT_EQ((*bind)->buffer(), nullptr);
}

TEST_F(ValueToBindTest, ScalarVariantsPickTheirWireType) {
    ValueToBind binder(configWith(nullptr, EncodingFailurePolicy::FallbackToEmpty));

    EXPECT_EQ((*binder.bind(Value(int64_t{7})))->variant(), MYSQL_TYPE_LONGLONG);
    EXPECT_EQ((*binder.bind(Value(uint64_t{7})))->variant(), MYSQL_TYPE_LONGLONG);
    EXPECT_EQ((*binder.bind(Value(1.5)))->variant(), MYSQL_TYPE_DOUBLE);
    EXPECT_EQ((*binder.bind(Value("text")))->variant(), MYSQL_TYPE_STRING);
    EXPECT_EQ((*binder.bind(Value(Value::Bytes{1, 2})))->variant(), MYSQL_TYPE_STRING);
    EXPECT_EQ((*binder.bind(Value(true)))->variant(), MYSQL_TYPE_LONGLONG);
    EXPECT_EQ((*binder.bind(Value(std::chrono::system_clock::now())))->variant(), MYSQL_TYPE_DATETIME);
}

TEST_F(ValueToBindTest, UnsignedValueKeepsUnsignedFlag) {
    ValueToBind binder(configWith(nullptr, EncodingFailurePolicy::FallbackToEmpty));
    auto bind = binder.bind(Value(std::numeric_limits<uint64_t>::max()));
    ASSERT_TRUE(bind.has_value());
    EXPECT_TRUE((*bind)->isUnsigned());

    auto signed_bind = binder.bind(Value(int64_t{-1}));
    ASSERT_TRUE(signed_bind.has_value());
    EXPECT_FALSE((*signed_bind)->isUnsigned());
}

TEST_F(ValueToBindTest, BooleanBindsAsOneOrZero) {
    ValueToBind binder(configWith(nullptr, EncodingFailurePolicy::FallbackToEmpty));

    auto yes = binder.bind(Value(true));
    ASSERT_TRUE(yes.has_value());
    EXPECT_EQ(bufferInt64(**yes), 1);
    EXPECT_EQ((*yes)->bufferLength(), 8UL);

    auto no = binder.bind(Value(false));
    ASSERT_TRUE(no.has_value());
    EXPECT_EQ(bufferInt64(**no), 0);
}

TEST_F(ValueToBindTest, TextLengthIsByteCount) {
    ValueToBind binder(configWith(nullptr, EncodingFailurePolicy::FallbackToEmpty));
    auto bind = binder.bind(Value(std::string("\xE6\x97\xA5\xE6\x9C\xAC")));  // two CJK characters
    ASSERT_TRUE(bind.has_value());
    EXPECT_EQ((*bind)->bufferLength(), 6UL);
    EXPECT_EQ(*(*bind)->lengthCell(), 6UL);
}

TEST_F(ValueToBindTest, TimestampUsesConfiguredCalendar) {
    using namespace std::chrono;
    BindingConfig config = configWith(nullptr, EncodingFailurePolicy::FallbackToEmpty);
    config.calendar = TemporalCalendar::fixedOffset(hours{2});
    ValueToBind binder(config);

    const auto instant = system_clock::time_point(sys_days{year{2021} / March / 15} + hours{8} + minutes{30} + seconds{45});
    auto bind = binder.bind(Value(instant));
    ASSERT_TRUE(bind.has_value());

    MYSQL_TIME record;
    std::memcpy(&record, (*bind)->buffer(), sizeof(MYSQL_TIME));
    EXPECT_EQ(record.hour, 10u);
    EXPECT_EQ(record.minute, 30u);
    EXPECT_EQ(record.second, 45u);
}

TEST_F(ValueToBindTest, ArrayEncodesThroughDefaultJsonEncoder) {
    ValueToBind binder(configWith(nullptr, EncodingFailurePolicy::FallbackToEmpty));
    auto bind = binder.bind(Value(Value::Array{1, "a", nullptr}));
    ASSERT_TRUE(bind.has_value());
    EXPECT_EQ((*bind)->variant(), MYSQL_TYPE_STRING);
    EXPECT_EQ(bufferText(**bind), "[1,\"a\",null]");
    EXPECT_EQ(*(*bind)->lengthCell(), 12UL);
}

TEST_F(ValueToBindTest, MapEncodesThroughDefaultJsonEncoder) {
    ValueToBind binder(configWith(nullptr, EncodingFailurePolicy::FallbackToEmpty));
    auto bind = binder.bind(Value(Value::Map{{"name", "x"}, {"id", 3}}));
    ASSERT_TRUE(bind.has_value());
    EXPECT_EQ(bufferText(**bind), "{\"id\":3,\"name\":\"x\"}");
}

TEST_F(ValueToBindTest, FailedEncodingFallsBackToEmptyBytesAndWarns) {
    ValueToBind binder(configWith(std::make_shared<FailingEncoder>(), EncodingFailurePolicy::FallbackToEmpty));
    auto bind = binder.bind(Value(Value::Array{1, "a", nullptr}));
    ASSERT_TRUE(bind.has_value());
    EXPECT_EQ((*bind)->variant(), MYSQL_TYPE_STRING);
    EXPECT_FALSE((*bind)->isNull());
    EXPECT_EQ((*bind)->bufferLength(), 0UL);
    EXPECT_EQ(*(*bind)->lengthCell(), 0UL);

    const std::string log_text = log_output.str();
    EXPECT_NE(log_text.find("warning"), std::string::npos) << log_text;
    EXPECT_NE(log_text.find("encoder unavailable"), std::string::npos) << log_text;
}

TEST_F(ValueToBindTest, FailedEncodingPropagatesWhenConfigured) {
    ValueToBind binder(configWith(std::make_shared<FailingEncoder>(), EncodingFailurePolicy::Propagate));
    auto bind = binder.bind(Value(Value::Array{1, "a", nullptr}));
    ASSERT_FALSE(bind.has_value());
    EXPECT_EQ(bind.error().error_code, InternalErrc::STRUCTURED_ENCODING_FAILED);
    EXPECT_STREQ(bind.error().sql_state, "PI000");
}

TEST_F(ValueToBindTest, NonFiniteNumberInArrayIsAnEncodingError) {
    ValueToBind binder(configWith(nullptr, EncodingFailurePolicy::Propagate));
    auto bind = binder.bind(Value(Value::Array{1.0, std::numeric_limits<double>::quiet_NaN()}));
    ASSERT_FALSE(bind.has_value());
    EXPECT_EQ(bind.error().error_code, InternalErrc::STRUCTURED_ENCODING_NON_FINITE_NUMBER);
}

TEST_F(ValueToBindTest, ScalarsIgnoreEncodingPolicy) {
    ValueToBind binder(configWith(std::make_shared<FailingEncoder>(), EncodingFailurePolicy::Propagate));
    auto bind = binder.bind(Value("plain"));
    ASSERT_TRUE(bind.has_value());
    EXPECT_EQ(bufferText(**bind), "plain");
}

TEST_F(ValueToBindTest, BindAllKeepsOrder) {
    ValueToBind binder(configWith(nullptr, EncodingFailurePolicy::FallbackToEmpty));
    auto set = binder.bindAll({Value(int64_t{1}), Value("two"), Value(), Value(3.0)});
    ASSERT_TRUE(set.has_value());
    ASSERT_EQ(set->size(), 4u);
    EXPECT_EQ(set->at(0).variant(), MYSQL_TYPE_LONGLONG);
    EXPECT_EQ(set->at(1).variant(), MYSQL_TYPE_STRING);
    EXPECT_EQ(set->at(2).variant(), MYSQL_TYPE_NULL);
    EXPECT_EQ(set->at(3).variant(), MYSQL_TYPE_DOUBLE);
}

TEST_F(ValueToBindTest, BindAllReportsFailingPosition) {
    ValueToBind binder(configWith(std::make_shared<FailingEncoder>(), EncodingFailurePolicy::Propagate));
    auto set = binder.bindAll({Value(int64_t{1}), Value(Value::Array{}), Value("never reached")});
    ASSERT_FALSE(set.has_value());
    EXPECT_EQ(set.error().error_code, InternalErrc::BIND_VALUE_CONVERSION_FAILED);
    EXPECT_NE(set.error().error_message.find("Value #1"), std::string::npos) << set.error().error_message;
    EXPECT_NE(set.error().error_message.find("encoder unavailable"), std::string::npos);
}

TEST_F(ValueToBindTest, DefaultConfigUsesUtcAndFallback) {
    ValueToBind binder;
    EXPECT_EQ(binder.config().calendar, TemporalCalendar::utc());
    EXPECT_EQ(binder.config().encoding_failure_policy, EncodingFailurePolicy::FallbackToEmpty);
}
