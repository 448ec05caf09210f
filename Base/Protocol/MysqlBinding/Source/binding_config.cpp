// Source/binding_config.cpp
#include "mysql_binding/binding_config.h"

#include <iostream>

namespace mysql_binding {

    std::shared_ptr<spdlog::logger> BindingConfig::get_or_create_logger(const std::string& logger_name) {
        if (logger) {
            logger->set_level(log_level);
            return logger;
        }
        auto default_logger = spdlog::get(logger_name);
        if (!default_logger) {
            try {
                default_logger = spdlog::stdout_color_mt(logger_name);
                default_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] [tid %t] %v");
                default_logger->set_level(log_level);
            } catch (const spdlog::spdlog_ex& ex) {
                std::cerr << "Logger (" << logger_name << ") initialization failed: " << ex.what() << std::endl;
                return nullptr;
            }
        } else {
            default_logger->set_level(log_level);
        }
        return default_logger;
    }

    std::shared_ptr<const StructuredEncoder> BindingConfig::get_or_create_encoder() const {
        if (structured_encoder) {
            return structured_encoder;
        }
        return std::make_shared<JsonStructuredEncoder>();
    }

    const char* encodingFailurePolicyName(EncodingFailurePolicy policy) noexcept {
        switch (policy) {
            case EncodingFailurePolicy::FallbackToEmpty:
                return "FallbackToEmpty";
            case EncodingFailurePolicy::Propagate:
                return "Propagate";
        }
        return "Unknown";
    }

}  // namespace mysql_binding
