#pragma once

#include <QDateTime>

#include "reminder/data/Task.hpp"

namespace reminder {
namespace core {

enum class RecurrenceState
{
    Inactive,
    Scheduled,
    Due,
    AwaitingAck,
    Expired,
};

enum class AdvanceOutcome
{
    Inactive,    // rule does not repeat, nothing changed
    Rescheduled, // finish moved to the next notify occurrence
    AwaitingAck, // paused until the user acknowledges
    Expired,     // next occurrence would reach the end instant
    Blocked,     // task is paused or expired already, nothing changed
};

const char *toString(AdvanceOutcome outcome);

// Moves repeating tasks from one occurrence to the next. Stateless, every
// piece of progress lives in the task's SkipCursor and flags.
class RecurrenceEngine
{
public:
    RecurrenceState state(const data::TaskItem &task, const QDateTime &now) const;

    // Called once the occurrence at task.finish has fired. Counts it, then
    // either pauses the task or schedules the next notify occurrence.
    // Occurrences that fall into the silent part of a skip cycle are counted
    // and stepped over immediately.
    AdvanceOutcome advance(data::TaskItem &task) const;

    // Leaves the paused state and schedules the next occurrence from now.
    AdvanceOutcome acknowledge(data::TaskItem &task, const QDateTime &now) const;

    // One period plus the rule's offset. Never returns an instant at or
    // before the starting point; an offset that would do so is ignored.
    static QDateTime nextOccurrence(const data::RecurrenceRule &rule, const QDateTime &from);

private:
    AdvanceOutcome scheduleFrom(data::TaskItem &task, const QDateTime &base) const;
};

} // namespace core
} // namespace reminder
