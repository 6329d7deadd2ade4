#pragma once

#include <QMetaType>
#include <QMutex>
#include <QObject>
#include <QString>

#include <atomic>
#include <memory>
#include <optional>

#include "planner/core/DayBoundaryEngine.hpp"
#include "planner/core/Result.hpp"
#include "planner/data/Entity.hpp"
#include "planner/data/QueueItem.hpp"
#include "planner/sync/RemoteService.hpp"
#include "planner/sync/RetentionPolicy.hpp"

namespace planner {
namespace core {
class Clock;
class SettingsSource;
}

namespace data {
class CacheStore;
class MetadataStore;
class MutationQueue;
}

namespace sync {

enum class SyncState
{
    Idle,
    Syncing,
    Error,
};

QString syncStateToString(SyncState state);

struct SyncStatus
{
    SyncState state = SyncState::Idle;
    std::optional<core::Error::Kind> lastErrorKind;
    QString lastErrorMessage;
    qint64 lastSuccessfulSync = 0;
    int pendingItems = 0;
    // Items that stopped retrying after repeated rejections.
    int parkedItems = 0;
};

struct SyncSummary
{
    bool alreadyRunning = false;
    bool cancelled = false;
    int pushed = 0;
    int pushFailed = 0;
    int pulled = 0;
    int unchangedTypes = 0;
    int deactivated = 0;
    int parked = 0;
    std::optional<core::DayRollover> rollover;
    std::optional<RetentionReport> retention;
    std::optional<core::Error> error;
};

// Reconciles the local cache with the remote store: drains the mutation queue
// (push), then downloads and merges the remote state (pull). Storage failures
// fail the call; remote failures are reported through the summary and the
// observable status.
class SyncService : public QObject
{
    Q_OBJECT

public:
    SyncService(std::shared_ptr<data::CacheStore> cache, std::shared_ptr<data::MetadataStore> metadata,
                std::shared_ptr<data::MutationQueue> queue, std::shared_ptr<RemoteService> remote,
                std::shared_ptr<core::DayBoundaryEngine> dayBoundary, std::shared_ptr<RetentionPolicy> retention,
                std::shared_ptr<core::Clock> clock, const core::SettingsSource &settings, QObject *parent = nullptr);
    ~SyncService() override;

    core::Result<SyncSummary> triggerSyncNow();
    // Stops the running cycle between two items.
    void requestCancel();

    SyncStatus status() const;

signals:
    void syncStatusChanged(const planner::sync::SyncStatus &status);

private:
    // Both return false when the remote cannot be reached.
    core::Result<bool> push(int batchSize, SyncSummary &summary);
    core::Result<bool> pull(SyncSummary &summary);
    core::Result<bool> mergeType(data::EntityType type, const std::vector<data::Entity> &remote,
                                 SyncSummary &summary);

    core::Result<RemoteOperation> buildOperation(const data::QueueItem &item) const;
    core::Result<bool> applyAck(const data::QueueItem &item, const RemoteAck &ack);
    core::Result<bool> applyConfirmedDelete(data::EntityType type, int id);
    std::optional<data::Entity> deactivated(const data::Entity &entity) const;

    void recordFailure(const core::Error &error, SyncSummary &summary);
    void publish(SyncState state);

    std::shared_ptr<data::CacheStore> m_cache;
    std::shared_ptr<data::MetadataStore> m_metadata;
    std::shared_ptr<data::MutationQueue> m_queue;
    std::shared_ptr<RemoteService> m_remote;
    std::shared_ptr<core::DayBoundaryEngine> m_dayBoundary;
    std::shared_ptr<RetentionPolicy> m_retention;
    std::shared_ptr<core::Clock> m_clock;
    const core::SettingsSource &m_settings;

    std::atomic_bool m_running{false};
    std::atomic_bool m_cancelRequested{false};
    mutable QMutex m_statusMutex;
    SyncStatus m_status;
};

} // namespace sync
} // namespace planner

Q_DECLARE_METATYPE(planner::sync::SyncStatus)
