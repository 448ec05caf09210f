// Include/mysql_binding/binding_config.h
#pragma once

#include <memory>
#include <string>

#include "mysql_binding/structured_encoder.h"
#include "mysql_binding/temporal_converter.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

namespace mysql_binding {

    // What ValueToBind does when an Array or Map value cannot be encoded.
    enum class EncodingFailurePolicy {
        FallbackToEmpty,  // log a warning, bind an empty byte sequence
        Propagate         // return the encoder's error, build nothing
    };

    struct BindingConfig {
        // Calendar used to split timestamps into MYSQL_TIME components
        TemporalCalendar calendar = TemporalCalendar::utc();

        // Encoder for Array and Map values; JsonStructuredEncoder when not set
        std::shared_ptr<const StructuredEncoder> structured_encoder;

        EncodingFailurePolicy encoding_failure_policy = EncodingFailurePolicy::FallbackToEmpty;

        // Logging
        std::shared_ptr<spdlog::logger> logger;
        spdlog::level::level_enum log_level = spdlog::level::info;

        std::shared_ptr<spdlog::logger> get_or_create_logger(const std::string& logger_name = "MySqlBinding");
        std::shared_ptr<const StructuredEncoder> get_or_create_encoder() const;
    };

    const char* encodingFailurePolicyName(EncodingFailurePolicy policy) noexcept;

}  // namespace mysql_binding
