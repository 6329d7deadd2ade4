#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QUrl>

#include "planner/sync/RemoteService.hpp"

namespace planner {
namespace core {
class SettingsSource;
}

namespace sync {

// RemoteService over the versioned REST API:
//   GET  <endpoint>/api/v<major.minor>/sync/full-state/<type>s
//   POST <endpoint>/api/v<major.minor>/<type>s/sync-queue  {"operations": [...]}
// Requests block on a local event loop and are aborted after the configured timeout.
class HttpRemoteService : public RemoteService
{
public:
    explicit HttpRemoteService(const core::SettingsSource &settings);
    ~HttpRemoteService() override;

    core::Result<std::vector<data::Entity>> listEntities(data::EntityType type) override;
    core::Result<RemoteAck> applyOperation(const RemoteOperation &operation) override;

    QUrl endpointUrl(const QString &path) const;

    static QJsonObject operationToJson(const RemoteOperation &operation);
    static core::Error classify(QNetworkReply::NetworkError error, int statusCode, const QString &message);
    static core::Result<std::vector<data::Entity>> parseEntities(data::EntityType type, const QByteArray &body);
    // The sync-queue answer is the whole collection. Updates are matched by id;
    // creates by the identifying fields of their payload, newest id first.
    static core::Result<RemoteAck> selectAck(const RemoteOperation &operation,
                                             const std::vector<data::Entity> &entities);

private:
    struct HttpResponse
    {
        int statusCode = 0;
        QByteArray body;
    };

    core::Result<HttpResponse> send(const QByteArray &verb, const QUrl &url, const QByteArray &body);

    const core::SettingsSource &m_settings;
    QNetworkAccessManager m_manager;
};

} // namespace sync
} // namespace planner
