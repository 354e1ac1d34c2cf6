#include <catch2/catch_test_macros.hpp>
#include <QHostAddress>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkProxy>
#include <QTcpServer>
#include <QTcpSocket>
#include <deque>
#include <memory>
#include <vector>

#include "core/inventory.hpp"
#include "network/http_remote_api.hpp"

using namespace larder;
using namespace larder::network;
using namespace std::chrono_literals;

namespace {

/**
 * CannedServer - Loopback HTTP server answering each request with the next
 * queued status and body. Serviced by the client's own event loop.
 */
class CannedServer {
public:
    struct Canned {
        int status{200};
        QByteArray body;
    };

    struct Received {
        QByteArray method;
        QByteArray path;
        QByteArray body;
    };

    std::deque<Canned> replies;
    std::vector<Received> received;
    bool silent = false;

    CannedServer() {
        QNetworkProxy::setApplicationProxy(QNetworkProxy::NoProxy);
        REQUIRE(server_.listen(QHostAddress::LocalHost, 0));
        QObject::connect(&server_, &QTcpServer::newConnection, &server_, [this] {
            while (auto* socket = server_.nextPendingConnection()) {
                accept(socket);
            }
        });
    }

    [[nodiscard]] QUrl url() const {
        return QUrl(QStringLiteral("http://127.0.0.1:%1/api").arg(server_.serverPort()));
    }

    void reply(int status, QByteArray body = {}) {
        replies.push_back(Canned{status, std::move(body)});
    }

private:
    void accept(QTcpSocket* socket) {
        auto buffer = std::make_shared<QByteArray>();
        QObject::connect(socket, &QTcpSocket::readyRead, socket, [this, socket, buffer] {
            buffer->append(socket->readAll());
            const auto header_end = buffer->indexOf("\r\n\r\n");
            if (header_end < 0) return;

            const auto lines = buffer->left(header_end).split('\n');
            qsizetype content_length = 0;
            for (const auto& line : lines) {
                const auto trimmed = line.trimmed();
                if (trimmed.toLower().startsWith("content-length:")) {
                    content_length = trimmed.mid(15).trimmed().toLongLong();
                }
            }
            if (buffer->size() < header_end + 4 + content_length) return;

            const auto request_line = lines.front().trimmed().split(' ');
            received.push_back(Received{
                .method = request_line.value(0),
                .path = request_line.value(1),
                .body = buffer->mid(header_end + 4, content_length),
            });
            buffer->clear();
            if (silent) return;

            Canned canned{500, {}};
            if (!replies.empty()) {
                canned = replies.front();
                replies.pop_front();
            }
            QByteArray out = "HTTP/1.1 " + QByteArray::number(canned.status) + " Canned\r\n";
            out += "Content-Type: application/json\r\n";
            out += "Content-Length: " + QByteArray::number(canned.body.size()) + "\r\n";
            out += "Connection: close\r\n\r\n";
            out += canned.body;
            socket->write(out);
            socket->disconnectFromHost();
        });
    }

    QTcpServer server_;
};

MutationRequest mutation(Operation op, int64_t base_version, Fields payload = {}) {
    return MutationRequest{
        .operation_id = Uuid::generate(),
        .entity_type = EntityType::Item,
        .entity_id = "i1",
        .operation = op,
        .payload = std::move(payload),
        .base_version = base_version,
    };
}

} // namespace

TEST_CASE("HTTP backend: accepted mutations return the new version", "[integration][http]") {
    CannedServer server;
    HttpRemoteApi api(server.url(), 2000ms);

    SECTION("Create") {
        server.reply(201, R"({"version":1})");
        const auto request = mutation(Operation::Create, 0,
                                      Fields{{field::Name, std::string("Widget")}, {field::Quantity, int64_t{3}}});
        auto sent = api.send(request);
        REQUIRE(sent.is_ok());
        REQUIRE(sent.unwrap() == 1);

        REQUIRE(server.received.size() == 1);
        REQUIRE(server.received.front().method == "POST");
        REQUIRE(server.received.front().path == "/api/items/i1");
        const auto body = QJsonDocument::fromJson(server.received.front().body).object();
        REQUIRE(body.value(QStringLiteral("operation_id")).toString().toStdString() ==
                request.operation_id.to_string());
        REQUIRE(body.value(QStringLiteral("base_version")).toInteger() == 0);
        REQUIRE(body.value(QStringLiteral("fields")).toObject().value(QStringLiteral("quantity")).toInteger() == 3);
    }

    SECTION("Update") {
        server.reply(200, R"({"version":4})");
        auto sent = api.send(mutation(Operation::Update, 3, Fields{{field::Quantity, int64_t{5}}}));
        REQUIRE(sent.unwrap() == 4);
        REQUIRE(server.received.front().method == "PUT");
    }

    SECTION("An empty reply bumps the base version") {
        server.reply(204);
        REQUIRE(api.send(mutation(Operation::Update, 7, Fields{{field::Quantity, int64_t{1}}})).unwrap() == 8);
    }
}

TEST_CASE("HTTP backend: status mapping", "[integration][http]") {
    CannedServer server;
    HttpRemoteApi api(server.url(), 2000ms);

    SECTION("409 is a version conflict") {
        server.reply(409, R"({"error":"stale"})");
        auto sent = api.send(mutation(Operation::Update, 1, Fields{{field::Quantity, int64_t{5}}}));
        REQUIRE(sent.is_err());
        REQUIRE(sent.unwrap_err().kind == ErrorKind::VersionConflict);
        REQUIRE(sent.unwrap_err().code == 409);
        REQUIRE_FALSE(sent.unwrap_err().retryable());
    }

    SECTION("404 satisfies a delete") {
        server.reply(404);
        auto sent = api.send(mutation(Operation::Delete, 6));
        REQUIRE(sent.is_ok());
        REQUIRE(sent.unwrap() == 6);
        REQUIRE(server.received.front().method == "DELETE");
    }

    SECTION("404 on an update goes to conflict detection") {
        server.reply(404);
        auto sent = api.send(mutation(Operation::Update, 2, Fields{{field::Quantity, int64_t{5}}}));
        REQUIRE(sent.is_err());
        REQUIRE(sent.unwrap_err().kind == ErrorKind::VersionConflict);
    }

    SECTION("Other statuses are retryable rejections") {
        for (int status : {503, 429, 422}) {
            server.reply(status, "busy");
            auto sent = api.send(mutation(Operation::Update, 2, Fields{{field::Quantity, int64_t{5}}}));
            REQUIRE(sent.is_err());
            REQUIRE(sent.unwrap_err().kind == ErrorKind::ServerRejection);
            REQUIRE(sent.unwrap_err().code == status);
            REQUIRE(sent.unwrap_err().retryable());
        }
    }

    SECTION("A malformed success body is rejected") {
        server.reply(200, "{oops");
        auto sent = api.send(mutation(Operation::Update, 2, Fields{{field::Quantity, int64_t{5}}}));
        REQUIRE(sent.is_err());
        REQUIRE(sent.unwrap_err().kind == ErrorKind::ServerRejection);

        server.reply(200, "not json");
        auto fetched = api.fetch(EntityType::Item, "i1");
        REQUIRE(fetched.is_err());
        REQUIRE(fetched.unwrap_err().kind == ErrorKind::ServerRejection);
    }
}

TEST_CASE("HTTP backend: reading records", "[integration][http]") {
    CannedServer server;
    HttpRemoteApi api(server.url(), 2000ms);

    server.reply(200, R"({"id":"i1","version":3,"updated_at":1700000000000,)"
                      R"("fields":{"name":"Widget","quantity":8}})");
    auto fetched = api.fetch(EntityType::Item, "i1");
    REQUIRE(fetched.is_ok());
    REQUIRE(fetched.unwrap().has_value());
    const auto& record = *fetched.unwrap();
    REQUIRE(record.version == 3);
    REQUIRE(record.updated_at == Timestamp{1'700'000'000'000});
    REQUIRE(record.fields.at(field::Quantity) == FieldValue{int64_t{8}});

    server.reply(404);
    auto missing = api.fetch(EntityType::Item, "gone");
    REQUIRE(missing.is_ok());
    REQUIRE_FALSE(missing.unwrap().has_value());

    server.reply(200, R"({"records":[{"id":"c1","version":1,"fields":{"name":"Tools"}},)"
                      R"({"id":"c2","version":2,"fields":{"name":"Paint"}}]})");
    auto listed = api.list(EntityType::Category);
    REQUIRE(listed.is_ok());
    REQUIRE(listed.unwrap().size() == 2);
    REQUIRE(listed.unwrap().at(1).id == "c2");
    REQUIRE(server.received.back().path == "/api/categories");
}

TEST_CASE("HTTP backend: transport failures are network errors", "[integration][http]") {
    SECTION("A server that never answers times out") {
        CannedServer server;
        server.silent = true;
        HttpRemoteApi api(server.url(), 200ms);
        auto sent = api.send(mutation(Operation::Update, 1, Fields{{field::Quantity, int64_t{5}}}));
        REQUIRE(sent.is_err());
        REQUIRE(sent.unwrap_err().kind == ErrorKind::NetworkError);
        REQUIRE(sent.unwrap_err().retryable());
    }

    SECTION("Nothing listening") {
        QUrl url;
        {
            CannedServer closed;
            url = closed.url();
        }
        HttpRemoteApi api(url, 2000ms);
        auto fetched = api.fetch(EntityType::Item, "i1");
        REQUIRE(fetched.is_err());
        REQUIRE(fetched.unwrap_err().kind == ErrorKind::NetworkError);
    }
}
