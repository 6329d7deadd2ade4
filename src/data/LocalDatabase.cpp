#include "planner/data/LocalDatabase.hpp"

#include <QDir>
#include <QFileInfo>
#include <QMutexLocker>
#include <QSqlError>
#include <QSqlQuery>
#include <QThread>
#include <QUuid>

#include "planner/core/Logging.hpp"

namespace planner {
namespace data {

namespace {
constexpr int kSchemaVersion = 2;

const char *const SCHEMA[] = {
    R"SQL(
        CREATE TABLE IF NOT EXISTS task_cache (
            id INTEGER PRIMARY KEY,
            title TEXT NOT NULL,
            description TEXT,
            task_type TEXT NOT NULL,
            recurrence_type TEXT,
            recurrence_interval INTEGER,
            interval_days INTEGER,
            reminder_time TEXT NOT NULL,
            group_id INTEGER,
            enabled INTEGER NOT NULL DEFAULT 1,
            completed INTEGER NOT NULL DEFAULT 0,
            assigned_user_ids TEXT NOT NULL DEFAULT '[]',
            updated_at INTEGER NOT NULL,
            last_accessed INTEGER NOT NULL,
            last_shown_at INTEGER,
            created_at INTEGER NOT NULL
        )
    )SQL",
    "CREATE INDEX IF NOT EXISTS idx_task_cache_reminder ON task_cache(reminder_time)",
    "CREATE INDEX IF NOT EXISTS idx_task_cache_eviction ON task_cache(enabled, last_accessed)",
    R"SQL(
        CREATE TABLE IF NOT EXISTS user_cache (
            id INTEGER PRIMARY KEY,
            name TEXT NOT NULL,
            email TEXT,
            role TEXT NOT NULL DEFAULT '',
            status TEXT NOT NULL DEFAULT '',
            updated_at INTEGER NOT NULL,
            last_accessed INTEGER NOT NULL,
            created_at INTEGER NOT NULL
        )
    )SQL",
    R"SQL(
        CREATE TABLE IF NOT EXISTS group_cache (
            id INTEGER PRIMARY KEY,
            name TEXT NOT NULL,
            description TEXT,
            created_by INTEGER NOT NULL DEFAULT 0,
            user_ids TEXT NOT NULL DEFAULT '[]',
            updated_at INTEGER NOT NULL,
            last_accessed INTEGER NOT NULL,
            created_at INTEGER NOT NULL
        )
    )SQL",
    R"SQL(
        CREATE TABLE IF NOT EXISTS sync_queue (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            operation TEXT NOT NULL,
            entity_type TEXT NOT NULL,
            entity_id INTEGER,
            local_id INTEGER,
            payload TEXT,
            timestamp INTEGER NOT NULL,
            retry_count INTEGER NOT NULL DEFAULT 0,
            last_retry INTEGER,
            status TEXT NOT NULL DEFAULT 'pending',
            last_error TEXT,
            synced_at INTEGER,
            size_bytes INTEGER NOT NULL DEFAULT 0,
            leased_at INTEGER
        )
    )SQL",
    "CREATE INDEX IF NOT EXISTS idx_sync_queue_status ON sync_queue(status, timestamp)",
    "CREATE INDEX IF NOT EXISTS idx_sync_queue_entity ON sync_queue(entity_type, entity_id, local_id)",
    R"SQL(
        CREATE TABLE IF NOT EXISTS metadata (
            key TEXT PRIMARY KEY,
            value TEXT NOT NULL,
            updated_at INTEGER NOT NULL
        )
    )SQL",
};
} // namespace

LocalDatabase::LocalDatabase(QString filePath)
    : m_filePath(std::move(filePath))
    , m_connectionPrefix(QStringLiteral("planner_%1").arg(QUuid::createUuid().toString(QUuid::Id128)))
{
}

LocalDatabase::~LocalDatabase()
{
    QMutexLocker locker(&m_connectionsMutex);
    for (const QString &name : qAsConst(m_connectionNames)) {
        {
            QSqlDatabase db = QSqlDatabase::database(name, false);
            if (db.isOpen()) {
                db.close();
            }
        }
        QSqlDatabase::removeDatabase(name);
    }
    m_connectionNames.clear();
}

core::Result<bool> LocalDatabase::open()
{
    if (m_open) {
        return core::Result<bool>::ok(true);
    }

    const QFileInfo info(m_filePath);
    QDir dir = info.absoluteDir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        return core::Result<bool>::fail(
            core::Error::storage(QStringLiteral("cannot create directory %1").arg(dir.absolutePath())));
    }

    qCDebug(lcDatabase) << "Opening database at" << m_filePath;
    QSqlDatabase db = connection();
    if (!db.isOpen()) {
        return core::Result<bool>::fail(core::Error::storage(
            QStringLiteral("failed to open database %1: %2").arg(m_filePath, db.lastError().text())));
    }

    auto schema = createSchema();
    if (!schema) {
        return schema;
    }
    m_open = true;
    return core::Result<bool>::ok(true);
}

bool LocalDatabase::isOpen() const
{
    return m_open;
}

const QString &LocalDatabase::filePath() const
{
    return m_filePath;
}

QSqlDatabase LocalDatabase::connection() const
{
    const QString name = connectionNameForCurrentThread();
    if (QSqlDatabase::contains(name)) {
        return QSqlDatabase::database(name);
    }

    QSqlDatabase db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), name);
    db.setDatabaseName(m_filePath);
    db.setConnectOptions(QStringLiteral("QSQLITE_BUSY_TIMEOUT=5000"));
    if (!db.open()) {
        qCWarning(lcDatabase) << "Failed to open connection" << name << ":" << db.lastError().text();
    } else {
        QSqlQuery pragma(db);
        if (!pragma.exec(QStringLiteral("PRAGMA journal_mode=WAL"))) {
            qCDebug(lcDatabase) << "WAL unavailable:" << pragma.lastError().text();
        }
    }

    QMutexLocker locker(&m_connectionsMutex);
    m_connectionNames << name;
    return db;
}

bool LocalDatabase::acquireRead() const
{
    if (m_writer.load() == QThread::currentThreadId()) {
        return false;
    }
    m_lock.lockForRead();
    return true;
}

void LocalDatabase::releaseRead() const
{
    m_lock.unlock();
}

void LocalDatabase::acquireWrite()
{
    Qt::HANDLE self = QThread::currentThreadId();
    if (m_writer.load() == self) {
        ++m_writeDepth;
        return;
    }
    m_lock.lockForWrite();
    m_writer.store(self);
    m_writeDepth = 1;
}

void LocalDatabase::releaseWrite()
{
    if (--m_writeDepth > 0) {
        return;
    }
    m_writer.store(nullptr);
    m_lock.unlock();
}

bool LocalDatabase::beginTransaction()
{
    if (m_transactionDepth == 0) {
        m_rollbackOnly = false;
        QSqlDatabase db = connection();
        if (!db.transaction()) {
            qCWarning(lcDatabase) << "BEGIN failed:" << db.lastError().text();
            return false;
        }
    }
    ++m_transactionDepth;
    return true;
}

bool LocalDatabase::commitTransaction()
{
    if (m_transactionDepth <= 0) {
        return false;
    }
    if (--m_transactionDepth > 0) {
        return !m_rollbackOnly;
    }

    QSqlDatabase db = connection();
    if (m_rollbackOnly) {
        db.rollback();
        qCWarning(lcDatabase) << "Transaction rolled back by an inner scope";
        return false;
    }
    if (!db.commit()) {
        qCWarning(lcDatabase) << "COMMIT failed:" << db.lastError().text();
        db.rollback();
        return false;
    }
    return true;
}

void LocalDatabase::rollbackTransaction()
{
    if (m_transactionDepth <= 0) {
        return;
    }
    m_rollbackOnly = true;
    if (--m_transactionDepth == 0) {
        QSqlDatabase db = connection();
        if (!db.rollback()) {
            qCWarning(lcDatabase) << "ROLLBACK failed:" << db.lastError().text();
        }
    }
}

int LocalDatabase::transactionDepth() const
{
    return m_transactionDepth;
}

core::Error LocalDatabase::queryError(const QSqlQuery &query, const QString &context)
{
    const QString message = QStringLiteral("%1: %2").arg(context, query.lastError().text());
    qCWarning(lcDatabase).noquote() << message;
    return core::Error::storage(message);
}

core::Result<bool> LocalDatabase::createSchema()
{
    WriteGuard guard(*this);
    QSqlDatabase db = connection();
    QSqlQuery query(db);
    if (!query.exec(QStringLiteral("PRAGMA user_version")) || !query.next()) {
        return core::Result<bool>::fail(queryError(query, QStringLiteral("read schema version")));
    }
    const int storedVersion = query.value(0).toInt();
    query.finish();

    for (const char *statement : SCHEMA) {
        if (!query.exec(QString::fromLatin1(statement))) {
            return core::Result<bool>::fail(queryError(query, QStringLiteral("schema")));
        }
    }
    if (storedVersion == 1) {
        qCInfo(lcDatabase) << "Migrating schema from version 1";
        if (!query.exec(QStringLiteral("ALTER TABLE sync_queue ADD COLUMN leased_at INTEGER"))) {
            return core::Result<bool>::fail(queryError(query, QStringLiteral("migrate sync_queue")));
        }
    }
    if (!query.exec(QStringLiteral("PRAGMA user_version = %1").arg(kSchemaVersion))) {
        return core::Result<bool>::fail(queryError(query, QStringLiteral("schema version")));
    }
    qCDebug(lcDatabase) << "Schema ready, version" << kSchemaVersion;
    return core::Result<bool>::ok(true);
}

QString LocalDatabase::connectionNameForCurrentThread() const
{
    return m_connectionPrefix + QString::asprintf("_%p", QThread::currentThreadId());
}

ReadGuard::ReadGuard(const LocalDatabase &database)
    : m_database(database)
    , m_locked(database.acquireRead())
{
}

ReadGuard::~ReadGuard()
{
    if (m_locked) {
        m_database.releaseRead();
    }
}

WriteGuard::WriteGuard(LocalDatabase &database)
    : m_database(database)
{
    m_database.acquireWrite();
}

WriteGuard::~WriteGuard()
{
    m_database.releaseWrite();
}

TransactionGuard::TransactionGuard(LocalDatabase &database)
    : m_database(database)
    , m_writeGuard(database)
{
    m_active = m_database.beginTransaction();
}

TransactionGuard::~TransactionGuard()
{
    if (m_active) {
        m_database.rollbackTransaction();
    }
}

bool TransactionGuard::isActive() const
{
    return m_active;
}

bool TransactionGuard::commit()
{
    if (!m_active) {
        return false;
    }
    m_active = false;
    return m_database.commitTransaction();
}

} // namespace data
} // namespace planner
