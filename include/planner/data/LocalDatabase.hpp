#pragma once

#include <QMutex>
#include <QReadWriteLock>
#include <QSqlDatabase>
#include <QString>
#include <QStringList>

#include <atomic>

#include "planner/core/Result.hpp"

class QSqlQuery;

namespace planner {
namespace data {

// SQLite file shared by the cache, queue and metadata stores. Each thread gets
// its own QSQLITE connection. Readers share a QReadWriteLock, a single writer
// holds it exclusively (re-entrant for the writing thread, which also reads
// without further locking), and nested transactions collapse into the
// outermost one.
class LocalDatabase
{
public:
    explicit LocalDatabase(QString filePath);
    ~LocalDatabase();

    LocalDatabase(const LocalDatabase &) = delete;
    LocalDatabase &operator=(const LocalDatabase &) = delete;

    core::Result<bool> open();
    bool isOpen() const;
    const QString &filePath() const;

    QSqlDatabase connection() const;

    // Returns false when the calling thread already writes and no lock was taken.
    bool acquireRead() const;
    void releaseRead() const;
    void acquireWrite();
    void releaseWrite();

    // Callers hold the write lock. Depth counted; only the outer level talks to SQLite.
    bool beginTransaction();
    bool commitTransaction();
    void rollbackTransaction();
    int transactionDepth() const;

    static core::Error queryError(const QSqlQuery &query, const QString &context);

private:
    core::Result<bool> createSchema();
    QString connectionNameForCurrentThread() const;

    QString m_filePath;
    QString m_connectionPrefix;
    bool m_open = false;
    mutable QReadWriteLock m_lock;
    std::atomic<Qt::HANDLE> m_writer{nullptr};
    int m_writeDepth = 0;
    mutable QMutex m_connectionsMutex;
    mutable QStringList m_connectionNames;
    int m_transactionDepth = 0;
    bool m_rollbackOnly = false;
};

class ReadGuard
{
public:
    explicit ReadGuard(const LocalDatabase &database);
    ~ReadGuard();

    ReadGuard(const ReadGuard &) = delete;
    ReadGuard &operator=(const ReadGuard &) = delete;

private:
    const LocalDatabase &m_database;
    bool m_locked = false;
};

class WriteGuard
{
public:
    explicit WriteGuard(LocalDatabase &database);
    ~WriteGuard();

    WriteGuard(const WriteGuard &) = delete;
    WriteGuard &operator=(const WriteGuard &) = delete;

private:
    LocalDatabase &m_database;
};

// Write lock plus transaction for one scope. Rolls back unless commit() succeeded.
class TransactionGuard
{
public:
    explicit TransactionGuard(LocalDatabase &database);
    ~TransactionGuard();

    TransactionGuard(const TransactionGuard &) = delete;
    TransactionGuard &operator=(const TransactionGuard &) = delete;

    bool isActive() const;
    bool commit();

private:
    LocalDatabase &m_database;
    WriteGuard m_writeGuard;
    bool m_active = false;
};

} // namespace data
} // namespace planner
