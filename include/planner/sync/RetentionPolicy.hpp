#pragma once

#include <QtGlobal>

#include <memory>

namespace planner {
namespace core {
class Clock;
}

namespace data {
class CacheStore;
class MutationQueue;
}

namespace sync {

struct RetentionReport
{
    quint64 sizeBefore = 0;
    quint64 sizeAfter = 0;
    int expired = 0;
    int evicted = 0;
    bool overBudget = false;
    quint64 overageBytes = 0;
};

// Purges inactive tasks not updated for the configured number of days, then
// keeps the cache under its byte ceiling by evicting inactive entities, least
// recently accessed first. Enabled entities and entities with queued mutations
// are never removed. An age of 0 days turns the purge off.
class RetentionPolicy
{
public:
    RetentionPolicy(std::shared_ptr<data::CacheStore> cache, std::shared_ptr<data::MutationQueue> queue,
                    std::shared_ptr<core::Clock> clock, quint64 ceilingBytes, int inactiveRetentionDays = 0);

    void setCeilingBytes(quint64 ceilingBytes);
    quint64 ceilingBytes() const { return m_ceilingBytes; }
    void setInactiveRetentionDays(int days);
    int inactiveRetentionDays() const { return m_inactiveRetentionDays; }

    RetentionReport run();

private:
    int purgeExpired();

    std::shared_ptr<data::CacheStore> m_cache;
    std::shared_ptr<data::MutationQueue> m_queue;
    std::shared_ptr<core::Clock> m_clock;
    quint64 m_ceilingBytes;
    int m_inactiveRetentionDays;
};

} // namespace sync
} // namespace planner
