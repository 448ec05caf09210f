// Source/value_to_bind.cpp
#include "mysql_binding/value_to_bind.h"

#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace mysql_binding {

    ValueToBind::ValueToBind() : ValueToBind(BindingConfig{}) {
    }

    ValueToBind::ValueToBind(BindingConfig config) : m_config(std::move(config)) {
        m_encoder = m_config.get_or_create_encoder();
        m_logger = m_config.get_or_create_logger();
        if (m_logger) {
            m_logger->debug("ValueToBind ready: utc_offset={}s, encoding_failure_policy={}", m_config.calendar.utc_offset.count(), encodingFailurePolicyName(m_config.encoding_failure_policy));
        }
    }

    std::expected<std::unique_ptr<Bind>, MySqlBindError> ValueToBind::bind(const Value& value) const {
        if (value.isStructured()) {
            return bindStructured(value);
        }

        std::unique_ptr<Bind> result = std::visit(
            [this](const auto& arg) -> std::unique_ptr<Bind> {
                using T = std::decay_t<decltype(arg)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    return std::make_unique<Bind>();
                } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, uint64_t> || std::is_same_v<T, double>) {
                    return std::make_unique<Bind>(arg);
                } else if constexpr (std::is_same_v<T, bool>) {
                    return std::make_unique<Bind>(static_cast<int64_t>(arg ? 1 : 0));
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return std::make_unique<Bind>(std::string_view(arg));
                } else if constexpr (std::is_same_v<T, Value::Bytes>) {
                    return std::make_unique<Bind>(arg);
                } else if constexpr (std::is_same_v<T, Value::Timestamp>) {
                    return std::make_unique<Bind>(arg, m_config.calendar);
                } else {
                    // Array and Map are routed to bindStructured() above
                    return nullptr;
                }
            },
            value.storage());

        if (m_logger && m_logger->should_log(spdlog::level::trace)) {
            m_logger->trace("Bound {} as {}", value.toDebugString(), wireTypeName(result->variant()));
        }
        return result;
    }

    std::expected<std::unique_ptr<Bind>, MySqlBindError> ValueToBind::bindStructured(const Value& value) const {
        auto encoded = m_encoder->encode(value);
        if (encoded) {
            if (m_logger && m_logger->should_log(spdlog::level::trace)) {
                m_logger->trace("Bound {} as {} ({} encoded bytes)", value.toDebugString(), wireTypeName(MYSQL_TYPE_STRING), encoded->size());
            }
            return std::make_unique<Bind>(*encoded);
        }

        if (m_config.encoding_failure_policy == EncodingFailurePolicy::Propagate) {
            if (m_logger) {
                m_logger->debug("Structured encoding of {} failed: {}", value.toDebugString(), encoded.error().toString());
            }
            return std::unexpected(encoded.error());
        }

        if (m_logger) {
            m_logger->warn("Structured encoding of {} failed, binding an empty byte sequence instead: {}", value.toDebugString(), encoded.error().toString());
        }
        return std::make_unique<Bind>(Bind::Bytes{});
    }

    std::expected<BindSet, MySqlBindError> ValueToBind::bindAll(const std::vector<Value>& values) const {
        BindSet set(m_logger);
        for (std::size_t i = 0; i < values.size(); ++i) {
            auto bound = bind(values[i]);
            if (!bound) {
                MySqlBindError err(InternalErrc::BIND_VALUE_CONVERSION_FAILED,
                                   "Value #" + std::to_string(i) + " (" + values[i].typeName() + ") could not be bound: [Code: " + std::to_string(bound.error().error_code) + "] " + bound.error().error_message);
                if (m_logger) {
                    m_logger->error("{}", err.toString());
                }
                return std::unexpected(std::move(err));
            }
            set.append(std::move(*bound));
        }
        if (m_logger) {
            m_logger->debug("Bound {} parameter value(s).", set.size());
        }
        return set;
    }

}  // namespace mysql_binding
