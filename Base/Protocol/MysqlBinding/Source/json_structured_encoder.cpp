// Source/json_structured_encoder.cpp
#include <QByteArray>
#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <QStringDecoder>
#include <QTimeZone>  // For Qt 6
#include <cmath>
#include <limits>
#include <string>
#include <type_traits>

#include "mysql_binding/structured_encoder.h"

namespace mysql_binding {

    namespace {

        std::expected<QJsonValue, MySqlBindError> toJsonValue(const Value& value);

        // QString::fromUtf8 substitutes U+FFFD for malformed input; reject it instead.
        std::expected<QString, MySqlBindError> decodeUtf8(const std::string& text, const char* what) {
            QStringDecoder decoder(QStringDecoder::Utf8);
            QString decoded = decoder.decode(QByteArrayView(text.data(), static_cast<qsizetype>(text.size())));
            if (decoder.hasError()) {
                return std::unexpected(MySqlBindError(InternalErrc::STRUCTURED_ENCODING_FAILED, std::string(what) + " is not valid UTF-8."));
            }
            return decoded;
        }

        std::expected<QJsonArray, MySqlBindError> toJsonArray(const Value::Array& items) {
            QJsonArray json_array;
            for (const Value& item : items) {
                auto element = toJsonValue(item);
                if (!element) {
                    return std::unexpected(element.error());
                }
                json_array.append(*element);
            }
            return json_array;
        }

        std::expected<QJsonObject, MySqlBindError> toJsonObject(const Value::Map& entries) {
            QJsonObject json_object;
            for (const MapEntry& entry : entries) {
                auto key = decodeUtf8(entry.key, "Map key");
                if (!key) {
                    return std::unexpected(key.error());
                }
                auto member = toJsonValue(entry.value);
                if (!member) {
                    return std::unexpected(member.error());
                }
                json_object.insert(*key, *member);
            }
            return json_object;
        }

        std::expected<QJsonValue, MySqlBindError> toJsonValue(const Value& value) {
            return std::visit(
                [](const auto& arg) -> std::expected<QJsonValue, MySqlBindError> {
                    using T = std::decay_t<decltype(arg)>;
                    if constexpr (std::is_same_v<T, std::monostate>) {
                        return QJsonValue(QJsonValue::Null);
                    } else if constexpr (std::is_same_v<T, bool>) {
                        return QJsonValue(arg);
                    } else if constexpr (std::is_same_v<T, int64_t>) {
                        return QJsonValue(static_cast<qint64>(arg));
                    } else if constexpr (std::is_same_v<T, uint64_t>) {
                        if (arg > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                            return std::unexpected(MySqlBindError(InternalErrc::STRUCTURED_ENCODING_INTEGER_OUT_OF_RANGE, "Unsigned value " + std::to_string(arg) + " does not fit a JSON integer."));
                        }
                        return QJsonValue(static_cast<qint64>(arg));
                    } else if constexpr (std::is_same_v<T, double>) {
                        if (!std::isfinite(arg)) {
                            return std::unexpected(MySqlBindError(InternalErrc::STRUCTURED_ENCODING_NON_FINITE_NUMBER, "NaN and infinity have no JSON representation."));
                        }
                        return QJsonValue(arg);
                    } else if constexpr (std::is_same_v<T, std::string>) {
                        auto text = decodeUtf8(arg, "Text value");
                        if (!text) {
                            return std::unexpected(text.error());
                        }
                        return QJsonValue(*text);
                    } else if constexpr (std::is_same_v<T, Value::Bytes>) {
                        QByteArray raw(reinterpret_cast<const char*>(arg.data()), static_cast<qsizetype>(arg.size()));
                        return QJsonValue(QString::fromLatin1(raw.toBase64()));
                    } else if constexpr (std::is_same_v<T, Value::Timestamp>) {
                        const auto ms = std::chrono::floor<std::chrono::milliseconds>(arg.time_since_epoch()).count();
                        QDateTime dt = QDateTime::fromMSecsSinceEpoch(static_cast<qint64>(ms), QTimeZone::utc());
                        return QJsonValue(dt.toString(Qt::ISODateWithMs));
                    } else if constexpr (std::is_same_v<T, Value::Array>) {
                        auto json_array = toJsonArray(arg);
                        if (!json_array) {
                            return std::unexpected(json_array.error());
                        }
                        return QJsonValue(*json_array);
                    } else {
                        auto json_object = toJsonObject(arg);
                        if (!json_object) {
                            return std::unexpected(json_object.error());
                        }
                        return QJsonValue(*json_object);
                    }
                },
                value.storage());
        }

    }  // namespace

    std::expected<std::vector<unsigned char>, MySqlBindError> JsonStructuredEncoder::encode(const Value& value) const {
        QJsonDocument doc;
        if (value.type() == ValueType::Array) {
            auto json_array = toJsonArray(std::get<Value::Array>(value.storage()));
            if (!json_array) {
                return std::unexpected(json_array.error());
            }
            doc.setArray(*json_array);
        } else if (value.type() == ValueType::Map) {
            auto json_object = toJsonObject(std::get<Value::Map>(value.storage()));
            if (!json_object) {
                return std::unexpected(json_object.error());
            }
            doc.setObject(*json_object);
        } else {
            return std::unexpected(MySqlBindError(InternalErrc::STRUCTURED_ENCODING_FAILED, std::string("JSON document root must be an Array or a Map, got ") + value.typeName() + "."));
        }

        const QByteArray json = doc.toJson(QJsonDocument::Compact);
        return std::vector<unsigned char>(json.constBegin(), json.constEnd());
    }

}  // namespace mysql_binding
