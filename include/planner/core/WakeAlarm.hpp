#pragma once

#include <QDateTime>
#include <QObject>
#include <QTimer>

#include <memory>

namespace planner {
namespace core {

class Clock;

// Wakes the process at a logical wall-clock time.
class WakeAlarm : public QObject
{
    Q_OBJECT

public:
    using QObject::QObject;
    ~WakeAlarm() override = default;

    virtual void arm(const QDateTime &at) = 0;
    virtual void cancel() = 0;
    virtual bool isArmed() const = 0;

signals:
    void fired();
};

// QTimer based alarm for a running process. Long waits are split into chunks
// and re-checked against the clock.
class TimerWakeAlarm : public WakeAlarm
{
    Q_OBJECT

public:
    explicit TimerWakeAlarm(std::shared_ptr<Clock> clock, QObject *parent = nullptr);

    void arm(const QDateTime &at) override;
    void cancel() override;
    bool isArmed() const override;

    QDateTime target() const;

private slots:
    void onTimeout();

private:
    void schedule();

    std::shared_ptr<Clock> m_clock;
    QTimer m_timer;
    QDateTime m_target;
};

} // namespace core
} // namespace planner
