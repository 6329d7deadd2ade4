#include "planner/data/DataProvider.hpp"

#include "planner/core/DayBoundaryEngine.hpp"
#include "planner/core/Settings.hpp"
#include "planner/data/CacheStore.hpp"
#include "planner/data/LocalDatabase.hpp"
#include "planner/data/MetadataStore.hpp"
#include "planner/data/MutationQueue.hpp"
#include "planner/data/OfflineRepository.hpp"

#include <QDir>
#include <QStandardPaths>

namespace planner {
namespace data {

namespace {
constexpr auto kDatabasePathVariable = "PLANNER_DB_PATH";
constexpr auto kDatabaseFileName = "planner.sqlite";
}

DataProvider::DataProvider(QString databasePath, std::shared_ptr<core::Clock> clock,
                           const core::SettingsSource &settings)
    : m_database(std::make_shared<LocalDatabase>(std::move(databasePath)))
    , m_cacheStore(std::make_shared<CacheStore>(m_database, clock))
    , m_metadataStore(std::make_shared<MetadataStore>(m_database, clock))
    , m_mutationQueue(std::make_shared<MutationQueue>(m_database, clock,
                                                      QueuePolicy::fromSettings(settings.current())))
    , m_dayBoundary(std::make_shared<core::DayBoundaryEngine>(m_cacheStore, m_metadataStore))
    , m_repository(std::make_unique<OfflineRepository>(m_database, m_cacheStore, m_mutationQueue, m_dayBoundary,
                                                       clock, settings))
{
}

DataProvider::~DataProvider() = default;

core::Result<bool> DataProvider::open()
{
    return m_database->open();
}

QString DataProvider::resolveDatabasePath(const core::SyncSettings &settings)
{
    const QString fromEnvironment = qEnvironmentVariable(kDatabasePathVariable);
    if (!fromEnvironment.isEmpty()) {
        return fromEnvironment;
    }
    if (!settings.databasePath.isEmpty()) {
        return settings.databasePath;
    }

    QString storageFolder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (storageFolder.isEmpty()) {
        storageFolder = QDir::homePath() + QStringLiteral("/.local/share/planner-sync");
    }
    return QDir(storageFolder).filePath(QString::fromLatin1(kDatabaseFileName));
}

OfflineRepository &DataProvider::repository()
{
    return *m_repository;
}

} // namespace data
} // namespace planner
