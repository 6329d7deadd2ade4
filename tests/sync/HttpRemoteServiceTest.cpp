#include <QtTest/QtTest>

#include <QJsonArray>

#include "TestSupport.hpp"
#include "planner/core/Settings.hpp"
#include "planner/data/EntityCodec.hpp"
#include "planner/sync/HttpRemoteService.hpp"

using planner::core::Error;
using planner::core::StaticSettingsSource;
using planner::core::SyncSettings;
using planner::data::EntityCodec;
using planner::data::EntityType;
using planner::data::QueueOperation;
using planner::data::Task;
using planner::sync::HttpRemoteService;
using planner::sync::RemoteOperation;
using planner::testing::at;
using planner::testing::makeTask;

namespace {
const QByteArray kTaskJson = QByteArrayLiteral(
    R"({"id": 1001, "title": "Water plants", "task_type": "recurring", "recurrence_type": "daily",)"
    R"( "recurrence_interval": 2, "reminder_time": "2024-03-10T08:00:00", "enabled": true,)"
    R"( "completed": false, "assigned_user_ids": [4, 2], "updated_at": 1710057600000, "colour": "green"})");

std::vector<planner::data::Entity> collection(const QByteArray &body)
{
    return HttpRemoteService::parseEntities(EntityType::Task, body).value();
}

RemoteOperation createWaterPlants()
{
    RemoteOperation operation;
    operation.operation = QueueOperation::Create;
    operation.entityType = EntityType::Task;
    operation.localId = -1;
    operation.payload = EntityCodec::toPayload(makeTask(-1, QStringLiteral("Water plants"), at(2024, 3, 10, 8, 0)),
                                               false);
    return operation;
}
}

class HttpRemoteServiceTest : public QObject
{
    Q_OBJECT

private slots:
    void endpointUrlIsVersioned();
    void endpointUrlFollowsSettingsChanges();
    void operationJsonCarriesIdAndPayload();
    void createOperationOmitsId();
    void classifyConnectivityFailures();
    void classifyServerErrorsAsTransient();
    void classifyClientErrorsAsRejected();
    void parseEntitiesFromObject();
    void parseEntitiesFromBareArray();
    void parseMalformedJsonFails();
    void parseInvalidEntityFails();
    void createAckSkipsExistingEntities();
    void createAckPrefersNewestMatch();
    void createAckWithoutMatchIsRejected();
    void updateAckMatchesById();
};

void HttpRemoteServiceTest::endpointUrlIsVersioned()
{
    SyncSettings settings;
    settings.endpoint = QStringLiteral("https://planner.example.org/");
    settings.apiVersion = QStringLiteral("v0.3");
    settings.normalize();
    StaticSettingsSource source(settings);
    HttpRemoteService remote(source);

    QCOMPARE(remote.endpointUrl(QStringLiteral("/sync/full-state/tasks")),
             QUrl(QStringLiteral("https://planner.example.org/api/v0.3/sync/full-state/tasks")));
}

void HttpRemoteServiceTest::endpointUrlFollowsSettingsChanges()
{
    SyncSettings settings;
    settings.endpoint = QStringLiteral("http://localhost:8080");
    StaticSettingsSource source(settings);
    HttpRemoteService remote(source);

    settings.apiVersion = QStringLiteral("1.0");
    source.setSettings(settings);
    QCOMPARE(remote.endpointUrl(QStringLiteral("/tasks/sync-queue")),
             QUrl(QStringLiteral("http://localhost:8080/api/v1.0/tasks/sync-queue")));
}

void HttpRemoteServiceTest::operationJsonCarriesIdAndPayload()
{
    RemoteOperation operation;
    operation.operation = QueueOperation::Complete;
    operation.entityType = EntityType::Task;
    operation.entityId = 1001;
    operation.timestamp = QDateTime(QDate(2024, 3, 10), QTime(9, 30), Qt::UTC).toMSecsSinceEpoch();

    const QJsonObject json = HttpRemoteService::operationToJson(operation);
    QCOMPARE(json.value(QStringLiteral("operation")).toString(), QStringLiteral("complete"));
    QCOMPARE(json.value(QStringLiteral("task_id")).toInt(), 1001);
    QCOMPARE(json.value(QStringLiteral("timestamp")).toString(), QStringLiteral("2024-03-10T09:30:00.000Z"));
    QVERIFY(!json.contains(QStringLiteral("payload")));
}

void HttpRemoteServiceTest::createOperationOmitsId()
{
    RemoteOperation operation;
    operation.operation = QueueOperation::Create;
    operation.entityType = EntityType::Group;
    operation.localId = -1;
    operation.payload = QJsonObject{{QStringLiteral("name"), QStringLiteral("Flat")}};

    const QJsonObject json = HttpRemoteService::operationToJson(operation);
    QCOMPARE(json.value(QStringLiteral("operation")).toString(), QStringLiteral("create"));
    QVERIFY(!json.contains(QStringLiteral("group_id")));
    QCOMPARE(json.value(QStringLiteral("payload")).toObject().value(QStringLiteral("name")).toString(),
             QStringLiteral("Flat"));
}

void HttpRemoteServiceTest::classifyConnectivityFailures()
{
    const Error refused = HttpRemoteService::classify(QNetworkReply::ConnectionRefusedError, 0,
                                                      QStringLiteral("refused"));
    QCOMPARE(refused.kind, Error::Kind::TransientNetwork);
    QCOMPARE(refused.statusCode, 0);
    QVERIFY(refused.isRetryable());
}

void HttpRemoteServiceTest::classifyServerErrorsAsTransient()
{
    for (const int status : {408, 429, 500, 503}) {
        const Error error = HttpRemoteService::classify(QNetworkReply::InternalServerError, status, QString());
        QCOMPARE(error.kind, Error::Kind::TransientNetwork);
        QCOMPARE(error.statusCode, status);
    }
}

void HttpRemoteServiceTest::classifyClientErrorsAsRejected()
{
    for (const int status : {400, 404, 409, 422}) {
        const Error error = HttpRemoteService::classify(QNetworkReply::ContentConflictError, status,
                                                        QStringLiteral("nope"));
        QCOMPARE(error.kind, Error::Kind::RemoteRejected);
        QCOMPARE(error.statusCode, status);
        QVERIFY(!error.isRetryable());
    }
}

void HttpRemoteServiceTest::parseEntitiesFromObject()
{
    const QByteArray body = QByteArrayLiteral(R"({"entities": [)") + kTaskJson + QByteArrayLiteral("]}");
    const auto parsed = HttpRemoteService::parseEntities(EntityType::Task, body);
    QVERIFY(parsed.isOk());
    QCOMPARE(parsed.value().size(), size_t(1));

    const Task task = std::get<Task>(parsed.value().front());
    QCOMPARE(task.id, 1001);
    QCOMPARE(task.title, QStringLiteral("Water plants"));
    QCOMPARE(task.recurrenceInterval, std::optional<int>(2));
    QCOMPARE(task.assignedUserIds, (QSet<int>{2, 4}));
    QCOMPARE(task.updatedAt, qint64(1710057600000));
}

void HttpRemoteServiceTest::parseEntitiesFromBareArray()
{
    const QByteArray body = QByteArrayLiteral("[") + kTaskJson + QByteArrayLiteral("]");
    const auto parsed = HttpRemoteService::parseEntities(EntityType::Task, body);
    QVERIFY(parsed.isOk());
    QCOMPARE(parsed.value().size(), size_t(1));

    const auto empty = HttpRemoteService::parseEntities(EntityType::User, QByteArrayLiteral("[]"));
    QVERIFY(empty.isOk());
    QVERIFY(empty.value().empty());
}

void HttpRemoteServiceTest::parseMalformedJsonFails()
{
    const auto parsed = HttpRemoteService::parseEntities(EntityType::Task, QByteArrayLiteral("{\"entities\": ["));
    QVERIFY(!parsed.isOk());
    QCOMPARE(parsed.error().kind, Error::Kind::Validation);
}

void HttpRemoteServiceTest::parseInvalidEntityFails()
{
    const auto parsed = HttpRemoteService::parseEntities(
        EntityType::Task, QByteArrayLiteral(R"([{"id": 3, "title": "x", "task_type": "sometimes"}])"));
    QVERIFY(!parsed.isOk());
    QCOMPARE(parsed.error().kind, Error::Kind::Validation);
}

void HttpRemoteServiceTest::createAckSkipsExistingEntities()
{
    const auto entities = collection(QByteArrayLiteral(
        R"([{"id": 1, "title": "Call mum", "task_type": "one_time", "reminder_time": "2024-03-09T18:00:00",)"
        R"(  "updated_at": 1},)"
        R"( {"id": 2, "title": "Water plants", "task_type": "one_time", "reminder_time": "2024-03-10T08:00:00",)"
        R"(  "updated_at": 2}])"));

    const auto ack = HttpRemoteService::selectAck(createWaterPlants(), entities);
    QVERIFY(ack.isOk());
    QVERIFY(ack.value().entity.has_value());
    QCOMPARE(planner::data::entityId(*ack.value().entity), 2);
}

void HttpRemoteServiceTest::createAckPrefersNewestMatch()
{
    const auto entities = collection(QByteArrayLiteral(
        R"([{"id": 9, "title": "Water plants", "task_type": "one_time", "reminder_time": "2024-03-10T08:00:00",)"
        R"(  "updated_at": 2},)"
        R"( {"id": 5, "title": "Water plants", "task_type": "one_time", "reminder_time": "2024-03-10T08:00:00",)"
        R"(  "updated_at": 1},)"
        R"( {"id": 12, "title": "Water plants", "task_type": "one_time", "reminder_time": "2024-03-11T08:00:00",)"
        R"(  "updated_at": 3}])"));

    const auto ack = HttpRemoteService::selectAck(createWaterPlants(), entities);
    QVERIFY(ack.isOk());
    QCOMPARE(planner::data::entityId(*ack.value().entity), 9);
}

void HttpRemoteServiceTest::createAckWithoutMatchIsRejected()
{
    const auto entities = collection(QByteArrayLiteral(
        R"([{"id": 1, "title": "Call mum", "task_type": "one_time", "reminder_time": "2024-03-09T18:00:00",)"
        R"(  "updated_at": 1}])"));

    const auto ack = HttpRemoteService::selectAck(createWaterPlants(), entities);
    QVERIFY(!ack.isOk());
    QCOMPARE(ack.error().kind, Error::Kind::RemoteRejected);

    const auto empty = HttpRemoteService::selectAck(createWaterPlants(), {});
    QVERIFY(!empty.isOk());
}

void HttpRemoteServiceTest::updateAckMatchesById()
{
    const auto entities = collection(QByteArrayLiteral("[") + kTaskJson + QByteArrayLiteral("]"));

    RemoteOperation operation;
    operation.operation = QueueOperation::Update;
    operation.entityType = EntityType::Task;
    operation.entityId = 1001;
    operation.payload = QJsonObject{{QStringLiteral("title"), QStringLiteral("Water plants")}};
    const auto ack = HttpRemoteService::selectAck(operation, entities);
    QVERIFY(ack.isOk());
    QCOMPARE(planner::data::entityId(*ack.value().entity), 1001);

    operation.entityId = 77;
    const auto missing = HttpRemoteService::selectAck(operation, entities);
    QVERIFY(missing.isOk());
    QVERIFY(!missing.value().entity.has_value());
}

QTEST_GUILESS_MAIN(HttpRemoteServiceTest)
#include "HttpRemoteServiceTest.moc"
