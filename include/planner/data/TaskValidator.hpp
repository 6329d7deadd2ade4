#pragma once

#include <QString>
#include <QStringList>

#include "planner/core/Result.hpp"
#include "planner/data/Entity.hpp"

namespace planner {
namespace data {

class TaskValidator
{
public:
    static constexpr int kMaxTitleLength = 200;
    static constexpr int kMaxDescriptionLength = 1000;

    // Every violated rule, in field order. Empty when the entity is valid.
    static QStringList violations(const Entity &entity);
    static core::Result<bool> validate(const Entity &entity);

private:
    static void checkTask(const Task &task, QStringList &errors);
};

} // namespace data
} // namespace planner
