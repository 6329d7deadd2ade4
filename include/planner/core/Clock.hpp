#pragma once

#include <QDateTime>
#include <QtGlobal>

namespace planner {
namespace core {

// Source of wall-clock time. Logical times (reminders, day boundaries) are
// zone-free: the local wall-clock reading is carried in a Qt::UTC QDateTime.
class Clock
{
public:
    virtual ~Clock() = default;

    virtual qint64 nowMillis() const = 0;
    virtual QDateTime now() const = 0;
};

class SystemClock : public Clock
{
public:
    qint64 nowMillis() const override;
    QDateTime now() const override;
};

// Fixed, manually advanced clock.
class ManualClock : public Clock
{
public:
    explicit ManualClock(QDateTime now);

    qint64 nowMillis() const override;
    QDateTime now() const override;

    void setNow(const QDateTime &now);
    void advanceSecs(qint64 seconds);

private:
    QDateTime m_now;
};

QDateTime toLogical(const QDateTime &wallClock);
QDateTime logicalFromMillis(qint64 millis);

} // namespace core
} // namespace planner
