#include "planner/sync/HttpRemoteService.hpp"

#include <QDateTime>
#include <QEventLoop>
#include <QJsonArray>
#include <QJsonDocument>
#include <QNetworkRequest>
#include <QStringList>
#include <QTimer>

#include "planner/core/Logging.hpp"
#include "planner/core/Settings.hpp"
#include "planner/data/EntityCodec.hpp"

namespace planner {
namespace sync {

namespace {
QString collectionName(data::EntityType type)
{
    return data::entityTypeToString(type) + QLatin1Char('s');
}

QStringList identityFields(data::EntityType type)
{
    switch (type) {
    case data::EntityType::Task:
        return {QStringLiteral("title"), QStringLiteral("task_type"), QStringLiteral("reminder_time")};
    case data::EntityType::User:
        return {QStringLiteral("name"), QStringLiteral("email")};
    case data::EntityType::Group:
    default:
        return {QStringLiteral("name"), QStringLiteral("created_by")};
    }
}

bool matchesPayload(data::EntityType type, const data::Entity &entity, const QJsonObject &payload)
{
    const QJsonObject json = data::EntityCodec::toJson(entity);
    bool compared = false;
    for (const QString &field : identityFields(type)) {
        if (!payload.contains(field)) {
            continue;
        }
        if (json.value(field) != payload.value(field)) {
            return false;
        }
        compared = true;
    }
    return compared;
}
} // namespace

HttpRemoteService::HttpRemoteService(const core::SettingsSource &settings)
    : m_settings(settings)
{
}

HttpRemoteService::~HttpRemoteService() = default;

core::Result<std::vector<data::Entity>> HttpRemoteService::listEntities(data::EntityType type)
{
    const QUrl url = endpointUrl(QStringLiteral("/sync/full-state/%1").arg(collectionName(type)));
    const auto response = send(QByteArrayLiteral("GET"), url, QByteArray());
    if (!response) {
        return core::Result<std::vector<data::Entity>>::fail(response.error());
    }
    return parseEntities(type, response.value().body);
}

core::Result<RemoteAck> HttpRemoteService::applyOperation(const RemoteOperation &operation)
{
    QJsonArray operations;
    operations.append(operationToJson(operation));
    QJsonObject root;
    root.insert(QStringLiteral("operations"), operations);

    const QUrl url = endpointUrl(QStringLiteral("/%1/sync-queue").arg(collectionName(operation.entityType)));
    const auto response = send(QByteArrayLiteral("POST"), url, QJsonDocument(root).toJson(QJsonDocument::Compact));
    if (!response) {
        return core::Result<RemoteAck>::fail(response.error());
    }

    const auto entities = parseEntities(operation.entityType, response.value().body);
    if (!entities) {
        return core::Result<RemoteAck>::fail(
            core::Error::remoteRejected(response.value().statusCode, entities.error().message));
    }

    const auto ack = selectAck(operation, entities.value());
    if (!ack) {
        return core::Result<RemoteAck>::fail(
            core::Error::remoteRejected(response.value().statusCode, ack.error().message));
    }
    return ack;
}

core::Result<RemoteAck> HttpRemoteService::selectAck(const RemoteOperation &operation,
                                                     const std::vector<data::Entity> &entities)
{
    RemoteAck ack;
    if (operation.entityId) {
        for (const data::Entity &entity : entities) {
            if (data::entityId(entity) == *operation.entityId) {
                ack.entity = entity;
                break;
            }
        }
        return core::Result<RemoteAck>::ok(ack);
    }
    if (operation.operation != data::QueueOperation::Create) {
        return core::Result<RemoteAck>::ok(ack);
    }

    for (const data::Entity &entity : entities) {
        if (!matchesPayload(operation.entityType, entity, operation.payload)) {
            continue;
        }
        if (!ack.entity || data::entityId(entity) > data::entityId(*ack.entity)) {
            ack.entity = entity;
        }
    }
    if (!ack.entity) {
        qCWarning(lcRemote) << "Create of" << data::entityTypeToString(operation.entityType)
                            << "acknowledged without a matching entity among" << entities.size();
        return core::Result<RemoteAck>::fail(core::Error::remoteRejected(
            0, QStringLiteral("create acknowledged without the new %1")
                   .arg(data::entityTypeToString(operation.entityType))));
    }
    return core::Result<RemoteAck>::ok(ack);
}

QUrl HttpRemoteService::endpointUrl(const QString &path) const
{
    const core::SyncSettings settings = m_settings.current();
    return QUrl(QStringLiteral("%1/api/v%2%3").arg(settings.endpoint, settings.apiVersion, path));
}

QJsonObject HttpRemoteService::operationToJson(const RemoteOperation &operation)
{
    QJsonObject object;
    object.insert(QStringLiteral("operation"), data::queueOperationToString(operation.operation));
    object.insert(QStringLiteral("timestamp"),
                  QDateTime::fromMSecsSinceEpoch(operation.timestamp, Qt::UTC).toString(Qt::ISODateWithMs));
    if (operation.entityId) {
        object.insert(QStringLiteral("%1_id").arg(data::entityTypeToString(operation.entityType)),
                      *operation.entityId);
    }
    if (!operation.payload.isEmpty()) {
        object.insert(QStringLiteral("payload"), operation.payload);
    }
    return object;
}

core::Error HttpRemoteService::classify(QNetworkReply::NetworkError error, int statusCode, const QString &message)
{
    if (statusCode == 0) {
        return core::Error::transientNetwork(message);
    }
    if (statusCode == 408 || statusCode == 429 || statusCode >= 500) {
        core::Error transient = core::Error::transientNetwork(message);
        transient.statusCode = statusCode;
        return transient;
    }
    if (statusCode >= 400) {
        return core::Error::remoteRejected(statusCode, message);
    }
    if (error != QNetworkReply::NoError) {
        return core::Error::transientNetwork(message);
    }
    return core::Error::remoteRejected(statusCode, message);
}

core::Result<std::vector<data::Entity>> HttpRemoteService::parseEntities(data::EntityType type,
                                                                        const QByteArray &body)
{
    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return core::Result<std::vector<data::Entity>>::fail(
            core::Error::validation(QStringLiteral("malformed response: %1").arg(parseError.errorString())));
    }

    QJsonArray array;
    if (document.isArray()) {
        array = document.array();
    } else if (document.isObject()) {
        array = document.object().value(QStringLiteral("entities")).toArray();
    }

    std::vector<data::Entity> entities;
    entities.reserve(static_cast<size_t>(array.size()));
    for (const QJsonValue &value : qAsConst(array)) {
        auto parsed = data::EntityCodec::fromJson(type, value.toObject());
        if (!parsed) {
            return core::Result<std::vector<data::Entity>>::fail(parsed.error());
        }
        entities.push_back(std::move(parsed.value()));
    }
    return core::Result<std::vector<data::Entity>>::ok(std::move(entities));
}

core::Result<HttpRemoteService::HttpResponse> HttpRemoteService::send(const QByteArray &verb, const QUrl &url,
                                                                      const QByteArray &body)
{
    QNetworkRequest request(url);
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json; charset=utf-8"));
    request.setRawHeader(QByteArrayLiteral("Accept"), QByteArrayLiteral("application/json"));

    QNetworkReply *reply = m_manager.sendCustomRequest(request, verb, body);
    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    bool timedOut = false;
    QObject::connect(&timer, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        reply->abort();
    });
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    timer.start(m_settings.current().timeoutMs);
    if (!reply->isFinished()) {
        loop.exec();
    }
    timer.stop();

    const int statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    const QNetworkReply::NetworkError error = reply->error();
    HttpResponse response{statusCode, reply->readAll()};
    const QString errorText = reply->errorString();
    reply->deleteLater();

    if (timedOut) {
        qCWarning(lcRemote) << verb << url.toString() << "timed out";
        return core::Result<HttpResponse>::fail(
            core::Error::transientNetwork(QStringLiteral("%1 timed out").arg(url.toString())));
    }
    if (error != QNetworkReply::NoError || statusCode >= 400 || statusCode == 0) {
        const QString message = QStringLiteral("%1 %2: %3")
                                    .arg(QString::fromLatin1(verb), url.toString(),
                                         statusCode > 0 ? QString::fromUtf8(response.body.left(512)) : errorText);
        qCWarning(lcRemote).noquote() << message << "status" << statusCode;
        return core::Result<HttpResponse>::fail(classify(error, statusCode, message));
    }
    qCDebug(lcRemote) << verb << url.toString() << "->" << statusCode << response.body.size() << "bytes";
    return core::Result<HttpResponse>::ok(response);
}

} // namespace sync
} // namespace planner
