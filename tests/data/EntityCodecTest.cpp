#include <QtTest/QtTest>

#include <QJsonArray>
#include <QJsonDocument>

#include "TestSupport.hpp"
#include "planner/data/EntityCodec.hpp"

using planner::data::Entity;
using planner::data::EntityCodec;
using planner::data::EntityType;
using planner::data::Group;
using planner::data::RecurrenceType;
using planner::data::Task;
using planner::data::TaskType;
using planner::data::User;
using planner::testing::at;

namespace {
QJsonObject parse(const char *json)
{
    return QJsonDocument::fromJson(QByteArray(json)).object();
}
} // namespace

class EntityCodecTest : public QObject
{
    Q_OBJECT

private slots:
    void taskSurvivesJson();
    void payloadOmitsIdForCreates();
    void unknownFieldsAreIgnored();
    void taskWithoutReminderIsRejected();
    void unknownEnumIsRejected();
    void userStatusFromActiveFlag();
    void groupAcceptsMemberIdsAlias();
    void reminderDropsZone();
    void timestampsAcceptSeveralForms();
};

void EntityCodecTest::taskSurvivesJson()
{
    Task task = planner::testing::makeDaily(12, QStringLiteral("Gym"), at(2024, 3, 10, 18, 30), 2);
    task.description = QStringLiteral("legs");
    task.groupId = 3;
    task.assignedUserIds = {8, 2};
    task.completed = true;
    task.updatedAt = 1710000000000;
    task.createdAt = 1700000000000;

    const auto decoded = EntityCodec::fromJson(EntityType::Task, EntityCodec::toJson(task));
    QVERIFY(decoded.isOk());
    const Task &back = std::get<Task>(decoded.value());
    QCOMPARE(back.id, 12);
    QCOMPARE(back.title, task.title);
    QCOMPARE(back.description, task.description);
    QCOMPARE(back.taskType, TaskType::Recurring);
    QVERIFY(back.recurrenceType == RecurrenceType::Daily);
    QCOMPARE(back.recurrenceInterval, std::optional<int>(2));
    QCOMPARE(back.reminderTime, task.reminderTime);
    QCOMPARE(back.assignedUserIds, task.assignedUserIds);
    QVERIFY(back.completed);
    QCOMPARE(back.updatedAt, task.updatedAt);
    QCOMPARE(back.createdAt, task.createdAt);
}

void EntityCodecTest::payloadOmitsIdForCreates()
{
    const Task task = planner::testing::makeTask(-3, QStringLiteral("Local"), at(2024, 3, 10, 8, 0));
    const QJsonObject payload = EntityCodec::toPayload(task, false);
    QVERIFY(!payload.contains(QStringLiteral("id")));
    QCOMPARE(payload.value(QStringLiteral("reminder_time")).toString(), QStringLiteral("2024-03-10T08:00:00"));
    QCOMPARE(payload.value(QStringLiteral("assigned_user_ids")).toArray().size(), 0);
    QVERIFY(EntityCodec::toPayload(task, true).contains(QStringLiteral("id")));
}

void EntityCodecTest::unknownFieldsAreIgnored()
{
    const auto decoded = EntityCodec::fromJson(EntityType::Task, parse(R"({
        "id": 5, "title": "Plants", "task_type": "one_time", "reminder_time": "2024-03-10T08:00:00",
        "updated_at": 100, "colour": "green", "metadata": {"source": "web"}, "active": false
    })"));
    QVERIFY(decoded.isOk());
    const Task &task = std::get<Task>(decoded.value());
    QCOMPARE(task.title, QStringLiteral("Plants"));
    QVERIFY(!task.enabled);
    QVERIFY(task.assignedUserIds.isEmpty());
}

void EntityCodecTest::taskWithoutReminderIsRejected()
{
    const auto decoded = EntityCodec::fromJson(EntityType::Task,
                                               parse(R"({"id": 5, "title": "x", "task_type": "one_time"})"));
    QVERIFY(!decoded.isOk());
    QCOMPARE(decoded.error().kind, planner::core::Error::Kind::Validation);
}

void EntityCodecTest::unknownEnumIsRejected()
{
    const auto decoded = EntityCodec::fromJson(EntityType::Task, parse(R"({
        "id": 5, "title": "x", "task_type": "recurring", "recurrence_type": "fortnightly",
        "reminder_time": "2024-03-10T08:00:00"
    })"));
    QVERIFY(!decoded.isOk());
    QVERIFY(decoded.error().message.contains(QStringLiteral("fortnightly")));
}

void EntityCodecTest::userStatusFromActiveFlag()
{
    const auto decoded = EntityCodec::fromJson(
        EntityType::User, parse(R"({"id": 9, "name": "Ben", "is_active": false, "updated_at": "2024-03-10T08:00:00"})"));
    QVERIFY(decoded.isOk());
    const User &user = std::get<User>(decoded.value());
    QCOMPARE(user.status, QStringLiteral("inactive"));
    QCOMPARE(user.role, QStringLiteral("regular"));
    QCOMPARE(user.updatedAt, at(2024, 3, 10, 8, 0).toMSecsSinceEpoch());
}

void EntityCodecTest::groupAcceptsMemberIdsAlias()
{
    const auto decoded = EntityCodec::fromJson(EntityType::Group,
                                               parse(R"({"id": 2, "name": "Flat", "member_ids": [4, 1, 4]})"));
    QVERIFY(decoded.isOk());
    QCOMPARE(std::get<Group>(decoded.value()).memberIds, (QSet<int>{1, 4}));

    const auto malformed = EntityCodec::fromJson(EntityType::Group, parse(R"({"id": 2, "user_ids": "1,2"})"));
    QVERIFY(!malformed.isOk());
}

void EntityCodecTest::reminderDropsZone()
{
    QCOMPARE(EntityCodec::parseReminder(QStringLiteral("2024-03-10T08:00:00+02:00")), at(2024, 3, 10, 8, 0));
    QCOMPARE(EntityCodec::parseReminder(QStringLiteral("2024-03-10T08:00:00Z")), at(2024, 3, 10, 8, 0));
    QVERIFY(!EntityCodec::parseReminder(QStringLiteral("tomorrow")).isValid());
}

void EntityCodecTest::timestampsAcceptSeveralForms()
{
    QCOMPARE(EntityCodec::parseTimestamp(QJsonValue(1234.0)), std::optional<qint64>(1234));
    QCOMPARE(EntityCodec::parseTimestamp(QJsonValue(QStringLiteral("1234"))), std::optional<qint64>(1234));
    QCOMPARE(EntityCodec::parseTimestamp(QJsonValue(QStringLiteral("1970-01-01T00:00:01Z"))),
             std::optional<qint64>(1000));
    QVERIFY(!EntityCodec::parseTimestamp(QJsonValue(true)).has_value());
}

QTEST_GUILESS_MAIN(EntityCodecTest)
#include "EntityCodecTest.moc"
