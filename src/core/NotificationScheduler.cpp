#include "reminder/core/NotificationScheduler.hpp"

#include <QtGlobal>

#include "reminder/core/Clock.hpp"
#include "reminder/core/Logging.hpp"
#include "reminder/core/Notifier.hpp"
#include "reminder/core/TaskBoard.hpp"

namespace reminder {
namespace core {

NotificationScheduler::NotificationScheduler(TaskBoard &board, Notifier &notifier, const Clock &clock,
                                             const data::Settings &settings, QObject *parent)
    : QObject(parent)
    , m_board(board)
    , m_notifier(notifier)
    , m_clock(clock)
    , m_settings(settings)
{
    m_timer.setSingleShot(true);
    connect(&m_timer, &QTimer::timeout, this, &NotificationScheduler::tick);
    connect(&m_board, &TaskBoard::tasksChanged, this, &NotificationScheduler::reschedule);
}

void NotificationScheduler::start()
{
    if (m_running) {
        return;
    }
    m_running = true;
    qCInfo(lcReminderScheduler) << "Scheduler started";
    tick();
}

void NotificationScheduler::stop()
{
    m_running = false;
    m_timer.stop();
    qCInfo(lcReminderScheduler) << "Scheduler stopped";
}

bool NotificationScheduler::isActive() const
{
    return m_running;
}

void NotificationScheduler::tick()
{
    if (m_inTick) {
        return;
    }
    m_inTick = true;

    const QDateTime now = m_clock.now();
    bool changed = false;
    for (auto &task : m_board.mutableTasks()) {
        if (!isActiveTask(task)) {
            continue;
        }
        changed = checkTask(task, now) || changed;
    }
    m_board.commitTick(changed);
    m_board.purge(false);

    // Listeners may mutate the board, so they only hear about it once the
    // scan is over.
    const std::vector<PendingEvent> events = std::move(m_pendingEvents);
    m_pendingEvents.clear();
    for (const auto &event : events) {
        switch (event.kind) {
        case PendingEvent::Advance:
            emit advanceNotified(event.id);
            break;
        case PendingEvent::Due:
            emit taskDue(event.id);
            break;
        case PendingEvent::AwaitingAck:
            emit awaitingAcknowledgement(event.id);
            break;
        case PendingEvent::Expired:
            emit taskExpired(event.id);
            break;
        }
    }

    m_intervalMs = computeIntervalMs(m_board.tasks(), m_clock.now(), m_settings);
    m_inTick = false;
    if (m_running) {
        m_timer.start(m_intervalMs);
    }
    emit tickFinished(m_intervalMs);
}

void NotificationScheduler::reschedule()
{
    if (!m_running || m_inTick) {
        return;
    }
    m_intervalMs = computeIntervalMs(m_board.tasks(), m_clock.now(), m_settings);
    m_timer.start(m_intervalMs);
}

int NotificationScheduler::computeIntervalMs(const std::vector<data::TaskItem> &tasks, const QDateTime &now,
                                             const data::Settings &settings)
{
    const int minMs = qMax(1, settings.minIntervalMs);
    const int maxMs = qMax(minMs, settings.maxIntervalMs);
    const int advance = settings.advanceNotifySeconds;

    QDateTime next;
    auto consider = [&next, &now](const QDateTime &candidate) {
        if (candidate > now && (!next.isValid() || candidate < next)) {
            next = candidate;
        }
    };
    QDateTime purgeAt;

    for (const auto &task : tasks) {
        if (task.pendingDelete) {
            if (task.deleteMarkTime.isValid()) {
                const QDateTime deadline = task.deleteMarkTime.addSecs(qMax(0, settings.pendingDeleteGraceSeconds));
                if (!purgeAt.isValid() || deadline < purgeAt) {
                    purgeAt = deadline;
                }
            }
            continue;
        }
        if (!isActiveTask(task)) {
            continue;
        }
        if (advance > 0 && !task.advanceNotified) {
            consider(task.finish.addSecs(-advance));
        }
        if (!task.notified && (settings.alsoNotifyAtDue || !task.advanceNotified)) {
            consider(task.finish);
        }
    }

    if (!next.isValid() && !purgeAt.isValid()) {
        return maxMs;
    }
    qint64 deltaMs = maxMs;
    if (next.isValid()) {
        // Notifications wake a guard early, a purge exactly at its deadline.
        deltaMs = qMax<qint64>(0, now.msecsTo(next.addSecs(-settings.guardSeconds)));
    }
    if (purgeAt.isValid()) {
        deltaMs = qMin(deltaMs, qMax<qint64>(0, now.msecsTo(purgeAt)));
    }
    return static_cast<int>(qBound<qint64>(minMs, deltaMs, maxMs));
}

bool NotificationScheduler::isActiveTask(const data::TaskItem &task)
{
    return !task.pendingDelete && !task.done && !task.awaitingAck && task.finish.isValid();
}

bool NotificationScheduler::checkTask(data::TaskItem &task, const QDateTime &now)
{
    bool changed = false;

    const int advance = m_settings.advanceNotifySeconds;
    if (advance > 0 && !task.advanceNotified && task.finish > now && task.finish.addSecs(-advance) <= now) {
        m_notifier.notify(tr("[Advance] %1").arg(task.account),
                          tr("%1 finishes soon, at %2").arg(task.name, task.finishText()));
        task.advanceNotified = true;
        changed = true;
        qCDebug(lcReminderScheduler) << "Advance notification for" << task.id;
        m_pendingEvents.push_back({ PendingEvent::Advance, task.id });
    }

    if (task.finish > now || task.notified) {
        return changed;
    }

    if (!m_settings.alsoNotifyAtDue && task.advanceNotified) {
        qCDebug(lcReminderScheduler) << "Due notification for" << task.id << "suppressed";
    } else {
        m_notifier.notify(tr("[Due] %1").arg(task.account), tr("%1 finished at %2").arg(task.name, task.finishText()));
        qCDebug(lcReminderScheduler) << "Due notification for" << task.id;
    }
    task.notified = true;
    m_pendingEvents.push_back({ PendingEvent::Due, task.id });

    if (task.isRepeating()) {
        const AdvanceOutcome outcome = m_engine.advance(task);
        qCDebug(lcReminderScheduler) << "Task" << task.id << "advanced:" << toString(outcome);
        if (outcome == AdvanceOutcome::AwaitingAck) {
            m_pendingEvents.push_back({ PendingEvent::AwaitingAck, task.id });
        } else if (outcome == AdvanceOutcome::Expired) {
            m_pendingEvents.push_back({ PendingEvent::Expired, task.id });
        }
    }
    return true;
}

} // namespace core
} // namespace reminder
