#pragma once

#include "network/remote_api.hpp"
#include <QByteArray>
#include <QNetworkAccessManager>
#include <QUrl>
#include <chrono>
#include <memory>

namespace larder::network {

/**
 * HttpRemoteApi - RemoteApi over a JSON REST backend.
 *
 *   GET    {base}/{items|categories}           -> {"records": [record...]}
 *   GET    {base}/{items|categories}/{id}      -> record | 404
 *   POST   {base}/{items|categories}/{id}      create
 *   PUT    {base}/{items|categories}/{id}      update
 *   DELETE {base}/{items|categories}/{id}      delete
 *
 * Mutation bodies are {"operation_id", "base_version", "fields"}; replies
 * carry {"version"}. A record is {"id", "version", "updated_at", "fields"}.
 *
 * Calls block in a local event loop bounded by the request timeout, so they
 * must be made from a thread with a Qt event dispatcher.
 */
class HttpRemoteApi : public RemoteApi {
public:
    HttpRemoteApi(QUrl base_url, std::chrono::milliseconds timeout);
    ~HttpRemoteApi() override;

    [[nodiscard]] Result<int64_t, Error> send(const MutationRequest& request) override;
    [[nodiscard]] Result<std::optional<RemoteRecord>, Error> fetch(EntityType type,
                                                                  const std::string& id) override;
    [[nodiscard]] Result<std::vector<RemoteRecord>, Error> list(EntityType type) override;

private:
    struct Reply {
        int status{0};
        QByteArray body;
    };

    [[nodiscard]] QUrl url_for(EntityType type, const std::string& id) const;
    [[nodiscard]] Result<Reply, Error> perform(const QByteArray& verb, const QUrl& url,
                                               const QByteArray& body);

    QUrl base_url_;
    std::chrono::milliseconds timeout_;
    std::unique_ptr<QNetworkAccessManager> manager_;
};

} // namespace larder::network
