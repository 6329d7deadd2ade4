#pragma once

#include <QByteArray>
#include <QSet>
#include <QString>

#include <vector>

#include "planner/data/Entity.hpp"

namespace planner {
namespace sync {

// SHA-256 fingerprints (lowercase hex) of entities and entity sets. Absent
// values encode as empty strings and id sets as sorted "a,b,c".
class HashCalculator
{
public:
    static QString taskHash(const data::Task &task);
    static QString userHash(const data::User &user);
    static QString groupHash(const data::Group &group);
    static QString entityHash(const data::Entity &entity);

    // Per-entity hashes concatenated in ascending id order, then hashed.
    static QString setHash(const std::vector<data::Entity> &entities);

    static QString encodeTask(const data::Task &task);

private:
    static QString sha256(const QString &text);
    static QString joinIds(const QSet<int> &ids);
};

} // namespace sync
} // namespace planner
