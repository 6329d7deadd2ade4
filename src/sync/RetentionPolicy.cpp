#include "planner/sync/RetentionPolicy.hpp"

#include <QSet>

#include "planner/core/Clock.hpp"
#include "planner/core/Logging.hpp"
#include "planner/data/CacheStore.hpp"
#include "planner/data/MutationQueue.hpp"

namespace planner {
namespace sync {

namespace {
constexpr int kCandidateBatch = 64;
constexpr qint64 kDayMillis = 24 * 60 * 60 * 1000;
}

RetentionPolicy::RetentionPolicy(std::shared_ptr<data::CacheStore> cache, std::shared_ptr<data::MutationQueue> queue,
                                 std::shared_ptr<core::Clock> clock, quint64 ceilingBytes, int inactiveRetentionDays)
    : m_cache(std::move(cache))
    , m_queue(std::move(queue))
    , m_clock(std::move(clock))
    , m_ceilingBytes(ceilingBytes)
    , m_inactiveRetentionDays(inactiveRetentionDays)
{
}

void RetentionPolicy::setCeilingBytes(quint64 ceilingBytes)
{
    m_ceilingBytes = ceilingBytes;
}

void RetentionPolicy::setInactiveRetentionDays(int days)
{
    m_inactiveRetentionDays = days;
}

RetentionReport RetentionPolicy::run()
{
    RetentionReport report;
    report.sizeBefore = m_cache->sizeEstimateBytes();
    report.expired = purgeExpired();
    quint64 size = report.expired > 0 ? m_cache->sizeEstimateBytes() : report.sizeBefore;

    if (size > m_ceilingBytes) {
        QSet<data::EntityKey> skipped;
        bool exhausted = false;
        while (size > m_ceilingBytes && !exhausted) {
            const auto candidates = m_cache->evictionCandidates(kCandidateBatch + skipped.size());
            exhausted = true;
            for (const data::EntityKey &key : candidates) {
                if (skipped.contains(key)) {
                    continue;
                }
                if (m_queue->hasOutstanding(key.type, key.id)) {
                    skipped.insert(key);
                    continue;
                }
                const auto removed = m_cache->remove(key.type, key.id);
                if (!removed) {
                    qCWarning(lcRetention) << "eviction failed for" << data::entityTypeToString(key.type) << key.id
                                           << removed.error().message;
                    skipped.insert(key);
                    continue;
                }
                exhausted = false;
                ++report.evicted;
                size = m_cache->sizeEstimateBytes();
                if (size <= m_ceilingBytes) {
                    break;
                }
            }
        }
    }

    report.sizeAfter = size;
    report.overBudget = size > m_ceilingBytes;
    report.overageBytes = report.overBudget ? size - m_ceilingBytes : 0;
    if (report.overBudget) {
        qCWarning(lcRetention) << "cache still over budget by" << report.overageBytes << "bytes after evicting"
                               << report.evicted << "entities";
    } else if (report.evicted > 0 || report.expired > 0) {
        qCInfo(lcRetention) << "purged" << report.expired << "expired and evicted" << report.evicted << "entities,"
                            << report.sizeBefore << "->" << report.sizeAfter << "bytes";
    }
    return report;
}

int RetentionPolicy::purgeExpired()
{
    if (m_inactiveRetentionDays <= 0) {
        return 0;
    }
    const qint64 cutoff = m_clock->nowMillis() - qint64(m_inactiveRetentionDays) * kDayMillis;
    int purged = 0;
    for (const data::EntityKey &key : m_cache->expiredInactive(cutoff)) {
        if (m_queue->hasOutstanding(key.type, key.id)) {
            continue;
        }
        const auto removed = m_cache->remove(key.type, key.id);
        if (!removed) {
            qCWarning(lcRetention) << "purge failed for" << data::entityTypeToString(key.type) << key.id
                                   << removed.error().message;
            continue;
        }
        ++purged;
    }
    if (purged > 0) {
        qCDebug(lcRetention) << "purged" << purged << "tasks inactive for more than" << m_inactiveRetentionDays
                             << "days";
    }
    return purged;
}

} // namespace sync
} // namespace planner
