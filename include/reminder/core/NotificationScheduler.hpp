#pragma once

#include <QDateTime>
#include <QObject>
#include <QTimer>
#include <QUuid>
#include <vector>

#include "reminder/core/RecurrenceEngine.hpp"
#include "reminder/data/Settings.hpp"
#include "reminder/data/Task.hpp"

namespace reminder {
namespace core {

class Clock;
class Notifier;
class TaskBoard;

class NotificationScheduler : public QObject
{
    Q_OBJECT

public:
    NotificationScheduler(TaskBoard &board, Notifier &notifier, const Clock &clock, const data::Settings &settings,
                          QObject *parent = nullptr);

    void start();
    void stop();
    bool isActive() const;
    int currentIntervalMs() const { return m_intervalMs; }

    // Delay until the next scan: nearest pending advance or due instant minus
    // the guard, or the end of a pending-delete grace window, clamped to
    // [minIntervalMs, maxIntervalMs].
    static int computeIntervalMs(const std::vector<data::TaskItem> &tasks, const QDateTime &now,
                                 const data::Settings &settings);

public slots:
    void tick();
    // Re-arms the timer for the current task list, outside of a tick.
    void reschedule();

signals:
    void advanceNotified(const QUuid &id);
    void taskDue(const QUuid &id);
    void awaitingAcknowledgement(const QUuid &id);
    void taskExpired(const QUuid &id);
    void tickFinished(int nextIntervalMs);

private:
    struct PendingEvent
    {
        enum Kind
        {
            Advance,
            Due,
            AwaitingAck,
            Expired,
        };
        Kind kind;
        QUuid id;
    };

    static bool isActiveTask(const data::TaskItem &task);
    bool checkTask(data::TaskItem &task, const QDateTime &now);

    TaskBoard &m_board;
    Notifier &m_notifier;
    const Clock &m_clock;
    const data::Settings &m_settings;
    RecurrenceEngine m_engine;
    std::vector<PendingEvent> m_pendingEvents;
    QTimer m_timer;
    int m_intervalMs = 0;
    bool m_running = false;
    bool m_inTick = false;
};

} // namespace core
} // namespace reminder
