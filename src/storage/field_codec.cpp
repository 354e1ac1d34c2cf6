#include "storage/field_codec.hpp"

#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <cmath>

namespace larder::storage {

namespace {

Error corrupted(const std::string& what) {
    return Error::of(ErrorKind::Corrupted, what);
}

Result<QJsonDocument, Error> parse_document(std::string_view json) {
    QJsonParseError parse_error{};
    const auto doc = QJsonDocument::fromJson(
        QByteArray(json.data(), static_cast<qsizetype>(json.size())), &parse_error);
    if (parse_error.error != QJsonParseError::NoError) {
        return Result<QJsonDocument, Error>::err(
            corrupted("Invalid JSON: " + parse_error.errorString().toStdString()));
    }
    return Result<QJsonDocument, Error>::ok(doc);
}

} // namespace

QJsonValue to_json(const FieldValue& value) {
    return std::visit([](const auto& v) -> QJsonValue {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return QJsonValue(QJsonValue::Null);
        } else if constexpr (std::is_same_v<T, bool>) {
            return QJsonValue(v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return QJsonValue(static_cast<qint64>(v));
        } else if constexpr (std::is_same_v<T, double>) {
            return QJsonValue(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return QJsonValue(QString::fromStdString(v));
        } else {
            QJsonArray array;
            for (const auto& item : v) {
                array.append(QString::fromStdString(item));
            }
            return array;
        }
    }, value);
}

Result<FieldValue, Error> from_json(const QJsonValue& value) {
    using R = Result<FieldValue, Error>;
    switch (value.type()) {
        case QJsonValue::Null:
        case QJsonValue::Undefined:
            return R::ok(std::monostate{});
        case QJsonValue::Bool:
            return R::ok(value.toBool());
        case QJsonValue::Double: {
            const double d = value.toDouble();
            constexpr double kMaxExact = 9007199254740992.0; // 2^53
            if (std::isfinite(d) && std::floor(d) == d && std::fabs(d) <= kMaxExact) {
                return R::ok(static_cast<int64_t>(d));
            }
            return R::ok(d);
        }
        case QJsonValue::String:
            return R::ok(value.toString().toStdString());
        case QJsonValue::Array: {
            StringList list;
            for (const auto& item : value.toArray()) {
                if (!item.isString()) {
                    return R::err(Error::of(ErrorKind::InvalidArgument,
                                            "List fields may only hold strings"));
                }
                list.push_back(item.toString().toStdString());
            }
            return R::ok(std::move(list));
        }
        case QJsonValue::Object:
            break;
    }
    return R::err(Error::of(ErrorKind::InvalidArgument, "Unsupported field value"));
}

QJsonObject to_json_object(const Fields& fields) {
    QJsonObject object;
    for (const auto& [name, value] : fields) {
        object.insert(QString::fromStdString(name), to_json(value));
    }
    return object;
}

Result<Fields, Error> from_json_object(const QJsonObject& object) {
    Fields fields;
    for (auto it = object.begin(); it != object.end(); ++it) {
        auto decoded = from_json(it.value());
        if (decoded.is_err()) {
            return Result<Fields, Error>::err(Error::of(decoded.unwrap_err().kind,
                "Field " + it.key().toStdString() + ": " + decoded.unwrap_err().message));
        }
        fields.emplace(it.key().toStdString(), std::move(decoded).unwrap());
    }
    return Result<Fields, Error>::ok(std::move(fields));
}

std::string encode_fields(const Fields& fields) {
    return QJsonDocument(to_json_object(fields)).toJson(QJsonDocument::Compact).toStdString();
}

Result<Fields, Error> decode_fields(std::string_view json) {
    auto doc = parse_document(json);
    if (doc.is_err()) {
        return forward_err<Fields>(doc);
    }
    if (!doc.unwrap().isObject()) {
        return Result<Fields, Error>::err(corrupted("Field map is not a JSON object"));
    }
    return from_json_object(doc.unwrap().object());
}

std::string encode_value(const FieldValue& value) {
    QJsonArray wrapper;
    wrapper.append(to_json(value));
    return QJsonDocument(wrapper).toJson(QJsonDocument::Compact).toStdString();
}

Result<FieldValue, Error> decode_value(std::string_view json) {
    auto doc = parse_document(json);
    if (doc.is_err()) {
        return forward_err<FieldValue>(doc);
    }
    const auto& parsed = doc.unwrap();
    if (!parsed.isArray() || parsed.array().size() != 1) {
        return Result<FieldValue, Error>::err(corrupted("Field value is not a one-element array"));
    }
    return from_json(parsed.array().at(0));
}

} // namespace larder::storage
