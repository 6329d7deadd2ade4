#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QString>
#include <QTextStream>
#include <QTimer>

#include <memory>

#include "version.h"

#include "planner/core/AppContext.hpp"
#include "planner/core/Clock.hpp"
#include "planner/core/Settings.hpp"
#include "planner/data/CacheStore.hpp"
#include "planner/data/DataProvider.hpp"
#include "planner/data/EntityCodec.hpp"
#include "planner/data/MutationQueue.hpp"
#include "planner/data/OfflineRepository.hpp"
#include "planner/sync/RetentionPolicy.hpp"
#include "planner/sync/SyncDriver.hpp"
#include "planner/sync/SyncService.hpp"

namespace {

using planner::core::AppContext;
using planner::core::Error;

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

int fail(const Error &error)
{
    err() << "error (" << planner::core::errorKindName(error.kind) << "): " << error.message << Qt::endl;
    return 1;
}

int usage(const QCommandLineParser &parser, const QString &message)
{
    err() << message << Qt::endl << parser.helpText();
    return 2;
}

void printTask(const planner::data::Task &task)
{
    out() << task.id << '\t' << (task.completed ? "[x] " : "[ ] ") << task.title << '\t'
          << planner::data::EntityCodec::formatReminder(task.reminderTime) << '\t'
          << planner::data::taskTypeToString(task.taskType);
    if (task.recurrenceType) {
        out() << '/' << planner::data::recurrenceTypeToString(*task.recurrenceType);
    }
    if (!task.enabled) {
        out() << "\tinactive";
    }
    out() << Qt::endl;
}

std::optional<int> parseId(const QStringList &arguments)
{
    if (arguments.size() < 2) {
        return std::nullopt;
    }
    bool ok = false;
    const int id = arguments.at(1).toInt(&ok);
    return ok ? std::optional<int>(id) : std::nullopt;
}

int listTasks(AppContext &context, const QCommandLineParser &parser)
{
    planner::data::EntityFilter filter;
    filter.todayOnly = parser.isSet(QStringLiteral("today"));
    if (parser.isSet(QStringLiteral("user"))) {
        filter.userId = parser.value(QStringLiteral("user")).toInt();
    }
    for (const auto &entity : context.repository().getCachedEntities(filter)) {
        printTask(std::get<planner::data::Task>(entity));
    }
    return 0;
}

int addTask(AppContext &context, const QCommandLineParser &parser)
{
    planner::data::Task task;
    task.title = parser.value(QStringLiteral("title"));
    task.description = parser.value(QStringLiteral("description"));

    const QString type = parser.value(QStringLiteral("type"));
    const auto taskType = planner::data::taskTypeFromString(type);
    if (!taskType) {
        return fail(Error::validation(QStringLiteral("unknown task type '%1'").arg(type)));
    }
    task.taskType = *taskType;

    if (parser.isSet(QStringLiteral("recurrence"))) {
        const QString recurrence = parser.value(QStringLiteral("recurrence"));
        task.recurrenceType = planner::data::recurrenceTypeFromString(recurrence);
        if (!task.recurrenceType) {
            return fail(Error::validation(QStringLiteral("unknown recurrence '%1'").arg(recurrence)));
        }
    } else if (task.taskType == planner::data::TaskType::Interval) {
        task.recurrenceType = planner::data::RecurrenceType::Interval;
    } else if (task.taskType == planner::data::TaskType::Recurring) {
        task.recurrenceType = planner::data::RecurrenceType::Daily;
    }
    if (parser.isSet(QStringLiteral("interval"))) {
        task.recurrenceInterval = parser.value(QStringLiteral("interval")).toInt();
    } else if (task.isRepeating()) {
        task.recurrenceInterval = 1;
    }
    if (parser.isSet(QStringLiteral("interval-days"))) {
        task.intervalDays = parser.value(QStringLiteral("interval-days")).toInt();
    }

    if (parser.isSet(QStringLiteral("at"))) {
        task.reminderTime = planner::data::EntityCodec::parseReminder(parser.value(QStringLiteral("at")));
    } else {
        task.reminderTime = planner::core::toLogical(QDateTime::currentDateTime()).addSecs(3600);
    }

    const auto created = context.repository().createTask(task);
    if (!created) {
        return fail(created.error());
    }
    printTask(created.value());
    return 0;
}

int editTask(AppContext &context, const QString &command, const QStringList &arguments,
             const QCommandLineParser &parser)
{
    const auto id = parseId(arguments);
    if (!id) {
        return usage(parser, QStringLiteral("%1 needs a task id").arg(command));
    }
    auto &repository = context.repository();
    planner::core::Result<planner::data::Task> result = command == QLatin1String("complete")
        ? repository.completeTask(*id)
        : command == QLatin1String("uncomplete") ? repository.uncompleteTask(*id) : repository.deleteTask(*id);
    if (!result) {
        return fail(result.error());
    }
    printTask(result.value());
    return 0;
}

int syncOnce(AppContext &context)
{
    const auto result = context.syncService().triggerSyncNow();
    if (!result) {
        return fail(result.error());
    }
    const planner::sync::SyncSummary &summary = result.value();
    out() << "pushed " << summary.pushed << ", failed " << summary.pushFailed << ", pulled " << summary.pulled
          << ", deactivated " << summary.deactivated << ", parked " << summary.parked << Qt::endl;
    if (summary.error) {
        return fail(*summary.error);
    }
    return 0;
}

int printStatus(AppContext &context)
{
    const planner::sync::SyncStatus status = context.syncService().status();
    const auto queue = context.dataProvider().mutationQueue();
    const auto cache = context.dataProvider().cacheStore();
    const planner::data::QueueCounts counts = queue->countByStatus();

    out() << "database: " << context.databasePath() << Qt::endl;
    out() << "state: " << planner::sync::syncStateToString(status.state) << Qt::endl;
    out() << "last successful sync: "
          << (status.lastSuccessfulSync > 0
                  ? QDateTime::fromMSecsSinceEpoch(status.lastSuccessfulSync).toString(Qt::ISODate)
                  : QStringLiteral("never"))
          << Qt::endl;
    out() << "queue: " << counts.pending << " pending, " << counts.failed - counts.parked << " retrying, "
          << counts.parked << " parked, " << counts.synced << " synced (" << queue->pendingSizeBytes() << " bytes)"
          << Qt::endl;
    out() << "cache: " << cache->count(planner::data::EntityType::Task) << " tasks, "
          << cache->count(planner::data::EntityType::User) << " users, "
          << cache->count(planner::data::EntityType::Group) << " groups (~" << cache->sizeEstimateBytes()
          << " bytes)" << Qt::endl;
    for (const auto &item : queue->parkedItems()) {
        out() << "parked #" << item.id << ' ' << planner::data::queueOperationToString(item.operation) << ' '
              << planner::data::entityTypeToString(item.entityType) << ' ' << item.effectiveId() << " after "
              << item.retryCount << " attempts" << Qt::endl;
    }
    return 0;
}

int runRetention(AppContext &context)
{
    auto &retention = context.retentionPolicy();
    const planner::core::SyncSettings settings = context.settings().current();
    retention.setCeilingBytes(settings.retentionCeilingBytes);
    retention.setInactiveRetentionDays(settings.inactiveRetentionDays);
    const planner::sync::RetentionReport report = retention.run();
    out() << "size " << report.sizeBefore << " -> " << report.sizeAfter << " bytes, expired " << report.expired
          << ", evicted " << report.evicted;
    if (report.overBudget) {
        out() << ", still " << report.overageBytes << " bytes over budget";
    }
    out() << Qt::endl;
    return 0;
}

int retryParked(AppContext &context)
{
    const auto reset = context.dataProvider().mutationQueue()->resetParked();
    if (!reset) {
        return fail(reset.error());
    }
    out() << reset.value() << " parked items scheduled for retry" << Qt::endl;
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Planner"));
    QCoreApplication::setApplicationName(QStringLiteral("planner-sync"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kPlannerVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Offline-first task cache and sync engine"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOptions({
        {QStringLiteral("db"), QStringLiteral("SQLite database file."), QStringLiteral("path")},
        {QStringLiteral("loopback"), QStringLiteral("Sync against an in-process remote.")},
        {QStringLiteral("today"), QStringLiteral("list: only tasks visible today.")},
        {QStringLiteral("user"), QStringLiteral("list: unassigned tasks and tasks of this user."), QStringLiteral("id")},
        {QStringLiteral("title"), QStringLiteral("add: task title."), QStringLiteral("text")},
        {QStringLiteral("description"), QStringLiteral("add: task description."), QStringLiteral("text")},
        {QStringLiteral("type"), QStringLiteral("add: one_time, recurring or interval."), QStringLiteral("type"),
         QStringLiteral("one_time")},
        {QStringLiteral("recurrence"), QStringLiteral("add: daily, weekdays, weekends, weekly, monthly, yearly, "
                                                      "custom or interval."),
         QStringLiteral("kind")},
        {QStringLiteral("interval"), QStringLiteral("add: recurrence interval."), QStringLiteral("n")},
        {QStringLiteral("interval-days"), QStringLiteral("add: days between interval repeats."), QStringLiteral("n")},
        {QStringLiteral("at"), QStringLiteral("add: reminder time, yyyy-MM-ddTHH:mm:ss."), QStringLiteral("time")},
    });
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("list, add, complete, uncomplete, delete, sync, status, retention, "
                                                "retry-parked or run."));
    parser.process(app);

    const QStringList arguments = parser.positionalArguments();
    if (arguments.isEmpty()) {
        return usage(parser, QStringLiteral("missing command"));
    }
    const QString command = arguments.first();

    planner::core::AppOptions options;
    options.databasePath = parser.value(QStringLiteral("db"));
    options.loopback = parser.isSet(QStringLiteral("loopback"));

    AppContext context(options, std::make_unique<planner::core::QSettingsSource>());
    const auto opened = context.open();
    if (!opened) {
        return fail(opened.error());
    }

    if (command == QLatin1String("list")) {
        return listTasks(context, parser);
    }
    if (command == QLatin1String("add")) {
        return addTask(context, parser);
    }
    if (command == QLatin1String("complete") || command == QLatin1String("uncomplete")
        || command == QLatin1String("delete")) {
        return editTask(context, command, arguments, parser);
    }
    if (command == QLatin1String("sync")) {
        return syncOnce(context);
    }
    if (command == QLatin1String("status")) {
        return printStatus(context);
    }
    if (command == QLatin1String("retention")) {
        return runRetention(context);
    }
    if (command == QLatin1String("retry-parked")) {
        return retryParked(context);
    }
    if (command == QLatin1String("run")) {
        QObject::connect(&context.syncService(), &planner::sync::SyncService::syncStatusChanged, &app,
                         [](const planner::sync::SyncStatus &status) {
                             out() << "sync " << planner::sync::syncStateToString(status.state) << ", "
                                   << status.pendingItems << " pending" << Qt::endl;
                         });
        context.syncDriver().start();
        QTimer::singleShot(0, &context.syncDriver(), &planner::sync::SyncDriver::syncNow);
        return app.exec();
    }
    return usage(parser, QStringLiteral("unknown command '%1'").arg(command));
}
