#include "network/http_remote_api.hpp"

#include "log/logging.hpp"
#include "storage/field_codec.hpp"
#include <QEventLoop>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>

namespace larder::network {

namespace {

QString collection_for(EntityType type) {
    return type == EntityType::Item ? QStringLiteral("items") : QStringLiteral("categories");
}

QByteArray verb_for(Operation op) {
    switch (op) {
        case Operation::Create: return QByteArrayLiteral("POST");
        case Operation::Update: return QByteArrayLiteral("PUT");
        case Operation::Delete: return QByteArrayLiteral("DELETE");
    }
    return QByteArrayLiteral("PUT");
}

Error rejection(int status, const QByteArray& body) {
    auto message = "HTTP " + std::to_string(status);
    if (!body.isEmpty()) {
        message += ": " + body.left(200).toStdString();
    }
    return Error::of(ErrorKind::ServerRejection, message, status);
}

Result<RemoteRecord, Error> parse_record(EntityType type, const QJsonObject& object) {
    using R = Result<RemoteRecord, Error>;
    const auto id = object.value(QStringLiteral("id")).toString();
    if (id.isEmpty() || !object.value(QStringLiteral("fields")).isObject()) {
        return R::err(Error::of(ErrorKind::ServerRejection, "Malformed record in response"));
    }
    auto fields = storage::from_json_object(object.value(QStringLiteral("fields")).toObject());
    if (fields.is_err()) {
        return R::err(Error::of(ErrorKind::ServerRejection, fields.unwrap_err().message));
    }
    return R::ok(RemoteRecord{
        .type = type,
        .id = id.toStdString(),
        .fields = std::move(fields).unwrap(),
        .version = object.value(QStringLiteral("version")).toInteger(),
        .updated_at = Timestamp(object.value(QStringLiteral("updated_at")).toInteger()),
    });
}

std::optional<QJsonObject> parse_object(const QByteArray& body) {
    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(body, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::nullopt;
    }
    return doc.object();
}

} // namespace

HttpRemoteApi::HttpRemoteApi(QUrl base_url, std::chrono::milliseconds timeout)
    : base_url_(std::move(base_url))
    , timeout_(timeout)
    , manager_(std::make_unique<QNetworkAccessManager>())
{
}

HttpRemoteApi::~HttpRemoteApi() = default;

QUrl HttpRemoteApi::url_for(EntityType type, const std::string& id) const {
    QUrl url = base_url_;
    auto path = url.path();
    if (!path.endsWith(QLatin1Char('/'))) {
        path += QLatin1Char('/');
    }
    path += collection_for(type);
    if (!id.empty()) {
        path += QLatin1Char('/') + QString::fromStdString(id);
    }
    url.setPath(path);
    return url;
}

Result<HttpRemoteApi::Reply, Error> HttpRemoteApi::perform(const QByteArray& verb,
                                                           const QUrl& url,
                                                           const QByteArray& body) {
    QNetworkRequest request(url);
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    request.setHeader(QNetworkRequest::UserAgentHeader, QStringLiteral("larder/1.0"));
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);

    QNetworkReply* reply = body.isEmpty()
        ? manager_->sendCustomRequest(request, verb)
        : manager_->sendCustomRequest(request, verb, body);

    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);
    timeout.start(static_cast<int>(timeout_.count()));
    loop.exec();

    if (!reply->isFinished()) {
        reply->abort();
        reply->deleteLater();
        qCInfo(larderRemoteLog) << verb << url.toString() << "timed out";
        return Result<Reply, Error>::err(Error::of(ErrorKind::NetworkError,
            "Request timed out after " + std::to_string(timeout_.count()) + " ms"));
    }
    timeout.stop();

    const auto status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    Reply out{.status = status.isValid() ? status.toInt() : 0, .body = reply->readAll()};
    const auto net_error = reply->error();
    const auto error_string = reply->errorString();
    reply->deleteLater();

    // Qt reports HTTP error statuses as reply errors too; only a missing
    // status means the request never reached the server.
    if (out.status == 0) {
        qCInfo(larderRemoteLog) << verb << url.toString() << "failed:" << error_string;
        return Result<Reply, Error>::err(Error::of(ErrorKind::NetworkError,
            error_string.toStdString(), static_cast<int>(net_error)));
    }
    qCDebug(larderRemoteLog) << verb << url.toString() << "->" << out.status;
    return Result<Reply, Error>::ok(std::move(out));
}

Result<int64_t, Error> HttpRemoteApi::send(const MutationRequest& request) {
    using R = Result<int64_t, Error>;
    QJsonObject body;
    body.insert(QStringLiteral("operation_id"), QString::fromStdString(request.operation_id.to_string()));
    body.insert(QStringLiteral("base_version"), static_cast<qint64>(request.base_version));
    body.insert(QStringLiteral("fields"), storage::to_json_object(request.payload));

    auto performed = perform(verb_for(request.operation),
                             url_for(request.entity_type, request.entity_id),
                             QJsonDocument(body).toJson(QJsonDocument::Compact));
    if (performed.is_err()) {
        return R::err(performed.unwrap_err());
    }
    const auto& reply = performed.unwrap();

    if (reply.status == 200 || reply.status == 201 || reply.status == 204) {
        // An empty body means the backend bumped the version by one.
        if (reply.body.trimmed().isEmpty()) {
            return R::ok(request.base_version + 1);
        }
        const auto object = parse_object(reply.body);
        if (!object) {
            return R::err(Error::of(ErrorKind::ServerRejection, "Response is not a JSON object",
                                    reply.status));
        }
        return R::ok(object->value(QStringLiteral("version")).toInteger(request.base_version + 1));
    }
    if (reply.status == 409) {
        return R::err(Error::of(ErrorKind::VersionConflict, "Base version is stale", 409));
    }
    if (reply.status == 404) {
        if (request.operation == Operation::Delete) {
            // Already gone; the delete is satisfied.
            return R::ok(request.base_version);
        }
        return R::err(Error::of(ErrorKind::VersionConflict, "Record no longer exists", 404));
    }
    // Every other status is retried until the ceiling; the queue entry is
    // dropped (and reported) only when it keeps failing.
    return R::err(rejection(reply.status, reply.body));
}

Result<std::optional<RemoteRecord>, Error> HttpRemoteApi::fetch(EntityType type, const std::string& id) {
    using R = Result<std::optional<RemoteRecord>, Error>;
    auto performed = perform(QByteArrayLiteral("GET"), url_for(type, id), {});
    if (performed.is_err()) {
        return R::err(performed.unwrap_err());
    }
    const auto& reply = performed.unwrap();
    if (reply.status == 404 || reply.status == 410) {
        return R::ok(std::nullopt);
    }
    if (reply.status != 200) {
        return R::err(rejection(reply.status, reply.body));
    }
    const auto object = parse_object(reply.body);
    if (!object) {
        return R::err(Error::of(ErrorKind::ServerRejection, "Response is not a JSON object"));
    }
    auto record = parse_record(type, *object);
    if (record.is_err()) {
        return R::err(record.unwrap_err());
    }
    return R::ok(std::move(record).unwrap());
}

Result<std::vector<RemoteRecord>, Error> HttpRemoteApi::list(EntityType type) {
    using R = Result<std::vector<RemoteRecord>, Error>;
    auto performed = perform(QByteArrayLiteral("GET"), url_for(type, {}), {});
    if (performed.is_err()) {
        return R::err(performed.unwrap_err());
    }
    const auto& reply = performed.unwrap();
    if (reply.status != 200) {
        return R::err(rejection(reply.status, reply.body));
    }
    const auto object = parse_object(reply.body);
    if (!object) {
        return R::err(Error::of(ErrorKind::ServerRejection, "Response is not a JSON object"));
    }

    std::vector<RemoteRecord> records;
    for (const auto& value : object->value(QStringLiteral("records")).toArray()) {
        auto record = parse_record(type, value.toObject());
        if (record.is_err()) {
            return R::err(record.unwrap_err());
        }
        records.push_back(std::move(record).unwrap());
    }
    return R::ok(std::move(records));
}

} // namespace larder::network
