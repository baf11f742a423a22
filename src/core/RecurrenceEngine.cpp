#include "reminder/core/RecurrenceEngine.hpp"

#include "reminder/core/Logging.hpp"

namespace reminder {
namespace core {

const char *toString(AdvanceOutcome outcome)
{
    switch (outcome) {
    case AdvanceOutcome::Inactive:
        return "inactive";
    case AdvanceOutcome::Rescheduled:
        return "rescheduled";
    case AdvanceOutcome::AwaitingAck:
        return "awaiting-ack";
    case AdvanceOutcome::Expired:
        return "expired";
    case AdvanceOutcome::Blocked:
        return "blocked";
    }
    return "unknown";
}

RecurrenceState RecurrenceEngine::state(const data::TaskItem &task, const QDateTime &now) const
{
    if (!task.isRepeating()) {
        return RecurrenceState::Inactive;
    }
    if (task.expired) {
        return RecurrenceState::Expired;
    }
    if (task.awaitingAck) {
        return RecurrenceState::AwaitingAck;
    }
    if (task.finish <= now) {
        return RecurrenceState::Due;
    }
    return RecurrenceState::Scheduled;
}

AdvanceOutcome RecurrenceEngine::advance(data::TaskItem &task) const
{
    if (!task.isRepeating()) {
        return AdvanceOutcome::Inactive;
    }
    if (task.awaitingAck || task.expired) {
        return AdvanceOutcome::Blocked;
    }

    const auto &rule = task.recurrence;
    ++task.cursor.occurrences;
    if (data::isNotifyOccurrence(rule.skip(), task.cursor.occurrences)) {
        ++task.cursor.notifications;
    }

    if (rule.pauseUntilAck()) {
        // A task with no occurrence left before its end expires instead of pausing.
        if (rule.hasEnd() && nextOccurrence(rule, task.finish) >= rule.endAt()) {
            task.expired = true;
            qCDebug(lcReminderRecurrence) << "Task" << task.id << "expired at occurrence" << task.cursor.occurrences;
            return AdvanceOutcome::Expired;
        }
        task.awaitingAck = true;
        qCDebug(lcReminderRecurrence) << "Task" << task.id << "paused at occurrence" << task.cursor.occurrences;
        return AdvanceOutcome::AwaitingAck;
    }
    return scheduleFrom(task, task.finish);
}

AdvanceOutcome RecurrenceEngine::acknowledge(data::TaskItem &task, const QDateTime &now) const
{
    if (!task.isRepeating()) {
        return AdvanceOutcome::Inactive;
    }
    if (!task.awaitingAck) {
        return AdvanceOutcome::Blocked;
    }
    task.awaitingAck = false;
    return scheduleFrom(task, now);
}

QDateTime RecurrenceEngine::nextOccurrence(const data::RecurrenceRule &rule, const QDateTime &from)
{
    const QDateTime raw = rule.stepFrom(from);
    const QDateTime shifted = raw.addSecs(rule.offsetAfterSeconds());
    if (shifted <= from) {
        return raw;
    }
    return shifted;
}

AdvanceOutcome RecurrenceEngine::scheduleFrom(data::TaskItem &task, const QDateTime &base) const
{
    const auto &rule = task.recurrence;
    QDateTime next = nextOccurrence(rule, base);
    for (;;) {
        if (rule.hasEnd() && next >= rule.endAt()) {
            task.expired = true;
            qCDebug(lcReminderRecurrence) << "Task" << task.id << "expired, next occurrence" << next
                                          << "reaches end" << rule.endAt();
            return AdvanceOutcome::Expired;
        }
        if (data::isNotifyOccurrence(rule.skip(), task.cursor.occurrences + 1)) {
            break;
        }
        ++task.cursor.occurrences;
        qCDebug(lcReminderRecurrence) << "Task" << task.id << "skips occurrence" << task.cursor.occurrences << "at"
                                      << next;
        next = nextOccurrence(rule, next);
    }

    task.finish = next;
    task.notified = false;
    task.advanceNotified = false;
    qCDebug(lcReminderRecurrence) << "Task" << task.id << "rescheduled to" << next;
    return AdvanceOutcome::Rescheduled;
}

} // namespace core
} // namespace reminder
