#pragma once

#include "core/field_value.hpp"
#include "core/result.hpp"
#include <QJsonObject>
#include <QJsonValue>
#include <string>
#include <string_view>

namespace larder::storage {

/**
 * JSON form of field values, shared by the SQLite columns and the HTTP body.
 *
 * Numbers without a fractional part decode as integers; a real that happens
 * to be integral therefore comes back as an integer, which same_value() and
 * the schema treat as equal.
 */
[[nodiscard]] QJsonValue to_json(const FieldValue& value);
[[nodiscard]] Result<FieldValue, Error> from_json(const QJsonValue& value);

[[nodiscard]] QJsonObject to_json_object(const Fields& fields);
[[nodiscard]] Result<Fields, Error> from_json_object(const QJsonObject& object);

/**
 * Compact JSON text of a field map. Keys are emitted in sorted order, so
 * equal maps give byte-identical text (the queue checksum relies on this).
 */
[[nodiscard]] std::string encode_fields(const Fields& fields);
[[nodiscard]] Result<Fields, Error> decode_fields(std::string_view json);

/**
 * A single value, wrapped in a one-element array.
 */
[[nodiscard]] std::string encode_value(const FieldValue& value);
[[nodiscard]] Result<FieldValue, Error> decode_value(std::string_view json);

} // namespace larder::storage
