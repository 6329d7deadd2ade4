#pragma once

#include <QString>
#include <QtGlobal>

class QSettings;

namespace planner {
namespace core {

struct SyncSettings
{
    int dayStartHour = 4;
    quint64 retentionCeilingBytes = 25ull * 1024 * 1024;
    // 0 keeps inactive tasks until the ceiling forces them out.
    int inactiveRetentionDays = 7;
    quint64 queueCeilingBytes = 5ull * 1024 * 1024;
    QString endpoint = QStringLiteral("http://127.0.0.1:8000");
    QString apiVersion = QStringLiteral("0.3");
    int timeoutMs = 30000;
    int batchSize = 100;
    int syncIntervalSeconds = 300;
    int maxRejectedRetries = 5;
    int backoffBaseSeconds = 30;
    int backoffMaxSeconds = 3600;
    int syncedRetentionHours = 24;
    QString databasePath;

    static SyncSettings load(const QSettings &settings);
    void save(QSettings &settings) const;
    void normalize();
};

// Read-only configuration, consulted at the start of every cycle.
class SettingsSource
{
public:
    virtual ~SettingsSource() = default;
    virtual SyncSettings current() const = 0;
};

class QSettingsSource : public SettingsSource
{
public:
    SyncSettings current() const override;
};

class StaticSettingsSource : public SettingsSource
{
public:
    explicit StaticSettingsSource(SyncSettings settings = {});

    SyncSettings current() const override;
    void setSettings(const SyncSettings &settings);

private:
    SyncSettings m_settings;
};

} // namespace core
} // namespace planner
