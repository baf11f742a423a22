#include "reminder/data/Task.hpp"

namespace reminder {
namespace data {

bool operator==(const SkipCursor &lhs, const SkipCursor &rhs)
{
    return lhs.occurrences == rhs.occurrences && lhs.notifications == rhs.notifications;
}

bool isNotifyOccurrence(const std::optional<SkipRule> &skip, int occurrence)
{
    if (!skip || occurrence <= 0) {
        return true;
    }
    const int position = (occurrence - 1) % skip->cycleLength() + 1;
    return position <= skip->remindEvery;
}

int expectedNotifications(const std::optional<SkipRule> &skip, int occurrences)
{
    if (occurrences <= 0) {
        return 0;
    }
    if (!skip) {
        return occurrences;
    }
    const int cycle = skip->cycleLength();
    return (occurrences / cycle) * skip->remindEvery + qMin(occurrences % cycle, skip->remindEvery);
}

QString TaskItem::startText() const
{
    if (!start.isValid()) {
        return {};
    }
    return start.toString(QString::fromLatin1(TimeFormat));
}

void TaskItem::recalculateFinish(const QDateTime &now)
{
    const QDateTime base = start.isValid() ? start : now;
    finish = base.addDays(days).addSecs(static_cast<qint64>(hours) * 3600 + static_cast<qint64>(minutes) * 60);
}

void TaskItem::resetRecurrenceProgress()
{
    cursor.reset();
    awaitingAck = false;
    expired = false;
    notified = false;
    advanceNotified = false;
}

} // namespace data
} // namespace reminder
