#pragma once

#include <memory>
#include <QString>

#include "planner/core/Result.hpp"

namespace planner {
namespace core {
class Clock;
class DayBoundaryEngine;
class SettingsSource;
struct SyncSettings;
}

namespace data {

class CacheStore;
class LocalDatabase;
class MetadataStore;
class MutationQueue;
class OfflineRepository;

// Owns the local database and the stores built on it.
class DataProvider
{
public:
    DataProvider(QString databasePath, std::shared_ptr<core::Clock> clock, const core::SettingsSource &settings);
    ~DataProvider();

    core::Result<bool> open();

    // PLANNER_DB_PATH, then storage/databasePath, then the application data folder.
    static QString resolveDatabasePath(const core::SyncSettings &settings);

    const std::shared_ptr<LocalDatabase> &database() const { return m_database; }
    const std::shared_ptr<CacheStore> &cacheStore() const { return m_cacheStore; }
    const std::shared_ptr<MetadataStore> &metadataStore() const { return m_metadataStore; }
    const std::shared_ptr<MutationQueue> &mutationQueue() const { return m_mutationQueue; }
    const std::shared_ptr<core::DayBoundaryEngine> &dayBoundaryEngine() const { return m_dayBoundary; }
    OfflineRepository &repository();

private:
    std::shared_ptr<LocalDatabase> m_database;
    std::shared_ptr<CacheStore> m_cacheStore;
    std::shared_ptr<MetadataStore> m_metadataStore;
    std::shared_ptr<MutationQueue> m_mutationQueue;
    std::shared_ptr<core::DayBoundaryEngine> m_dayBoundary;
    std::unique_ptr<OfflineRepository> m_repository;
};

} // namespace data
} // namespace planner
