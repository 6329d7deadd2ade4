#include "planner/core/Settings.hpp"

#include <QSettings>
#include <QtGlobal>

#include <utility>

namespace planner {
namespace core {

namespace {
constexpr auto kDayStartHour = "sync/dayStartHour";
constexpr auto kRetentionCeiling = "cache/retentionCeilingBytes";
constexpr auto kInactiveRetention = "cache/inactiveRetentionDays";
constexpr auto kQueueCeiling = "queue/ceilingBytes";
constexpr auto kEndpoint = "network/endpoint";
constexpr auto kApiVersion = "network/apiVersion";
constexpr auto kTimeoutMs = "network/timeoutMs";
constexpr auto kBatchSize = "sync/batchSize";
constexpr auto kSyncInterval = "sync/intervalSeconds";
constexpr auto kMaxRejectedRetries = "queue/maxRejectedRetries";
constexpr auto kBackoffBase = "queue/backoffBaseSeconds";
constexpr auto kBackoffMax = "queue/backoffMaxSeconds";
constexpr auto kSyncedRetention = "queue/syncedRetentionHours";
constexpr auto kDatabasePath = "storage/databasePath";

QString key(const char *name)
{
    return QString::fromLatin1(name);
}
} // namespace

SyncSettings SyncSettings::load(const QSettings &settings)
{
    SyncSettings result;
    result.dayStartHour = settings.value(key(kDayStartHour), result.dayStartHour).toInt();
    result.retentionCeilingBytes = settings.value(key(kRetentionCeiling), result.retentionCeilingBytes).toULongLong();
    result.inactiveRetentionDays =
        settings.value(key(kInactiveRetention), result.inactiveRetentionDays).toInt();
    result.queueCeilingBytes = settings.value(key(kQueueCeiling), result.queueCeilingBytes).toULongLong();
    result.endpoint = settings.value(key(kEndpoint), result.endpoint).toString();
    result.apiVersion = settings.value(key(kApiVersion), result.apiVersion).toString();
    result.timeoutMs = settings.value(key(kTimeoutMs), result.timeoutMs).toInt();
    result.batchSize = settings.value(key(kBatchSize), result.batchSize).toInt();
    result.syncIntervalSeconds = settings.value(key(kSyncInterval), result.syncIntervalSeconds).toInt();
    result.maxRejectedRetries = settings.value(key(kMaxRejectedRetries), result.maxRejectedRetries).toInt();
    result.backoffBaseSeconds = settings.value(key(kBackoffBase), result.backoffBaseSeconds).toInt();
    result.backoffMaxSeconds = settings.value(key(kBackoffMax), result.backoffMaxSeconds).toInt();
    result.syncedRetentionHours = settings.value(key(kSyncedRetention), result.syncedRetentionHours).toInt();
    result.databasePath = settings.value(key(kDatabasePath)).toString();
    result.normalize();
    return result;
}

void SyncSettings::save(QSettings &settings) const
{
    settings.setValue(key(kDayStartHour), dayStartHour);
    settings.setValue(key(kRetentionCeiling), retentionCeilingBytes);
    settings.setValue(key(kInactiveRetention), inactiveRetentionDays);
    settings.setValue(key(kQueueCeiling), queueCeilingBytes);
    settings.setValue(key(kEndpoint), endpoint);
    settings.setValue(key(kApiVersion), apiVersion);
    settings.setValue(key(kTimeoutMs), timeoutMs);
    settings.setValue(key(kBatchSize), batchSize);
    settings.setValue(key(kSyncInterval), syncIntervalSeconds);
    settings.setValue(key(kMaxRejectedRetries), maxRejectedRetries);
    settings.setValue(key(kBackoffBase), backoffBaseSeconds);
    settings.setValue(key(kBackoffMax), backoffMaxSeconds);
    settings.setValue(key(kSyncedRetention), syncedRetentionHours);
    if (!databasePath.isEmpty()) {
        settings.setValue(key(kDatabasePath), databasePath);
    }
}

void SyncSettings::normalize()
{
    dayStartHour = qBound(0, dayStartHour, 23);
    inactiveRetentionDays = qBound(0, inactiveRetentionDays, 3650);
    timeoutMs = qBound(1000, timeoutMs, 300000);
    batchSize = qBound(1, batchSize, 10000);
    syncIntervalSeconds = qBound(10, syncIntervalSeconds, 24 * 3600);
    maxRejectedRetries = qBound(1, maxRejectedRetries, 100);
    backoffBaseSeconds = qBound(1, backoffBaseSeconds, 3600);
    backoffMaxSeconds = qMax(backoffBaseSeconds, qMin(backoffMaxSeconds, 24 * 3600));
    syncedRetentionHours = qBound(0, syncedRetentionHours, 24 * 30);
    if (apiVersion.startsWith(QLatin1Char('v'))) {
        apiVersion = apiVersion.mid(1);
    }
    while (endpoint.endsWith(QLatin1Char('/'))) {
        endpoint.chop(1);
    }
}

SyncSettings QSettingsSource::current() const
{
    QSettings settings;
    return SyncSettings::load(settings);
}

StaticSettingsSource::StaticSettingsSource(SyncSettings settings)
    : m_settings(std::move(settings))
{
    m_settings.normalize();
}

SyncSettings StaticSettingsSource::current() const
{
    return m_settings;
}

void StaticSettingsSource::setSettings(const SyncSettings &settings)
{
    m_settings = settings;
    m_settings.normalize();
}

} // namespace core
} // namespace planner
