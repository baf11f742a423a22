#pragma once

#include <QDateTime>
#include <QString>
#include <QUuid>
#include <optional>

#include "reminder/data/Recurrence.hpp"

namespace reminder {
namespace data {

// Occurrences counts every time the rule fired, skipped ones included.
// Notifications counts only the occurrences that reached the user.
struct SkipCursor
{
    int occurrences = 0;
    int notifications = 0;

    void reset()
    {
        occurrences = 0;
        notifications = 0;
    }
};

bool operator==(const SkipCursor &lhs, const SkipCursor &rhs);

// Occurrence numbers start at 1. Without a skip rule every occurrence notifies.
bool isNotifyOccurrence(const std::optional<SkipRule> &skip, int occurrence);
int expectedNotifications(const std::optional<SkipRule> &skip, int occurrences);

struct TaskItem
{
    static constexpr const char *DefaultAccount = "Default";
    static constexpr const char *TimeFormat = "yyyy-MM-dd HH:mm";

    QUuid id = QUuid::createUuid();
    QString account = QString::fromLatin1(DefaultAccount);
    QString name = QStringLiteral("-");
    QDateTime start; // invalid means "from now"
    int days = 0;
    int hours = 0;
    int minutes = 0;
    QDateTime finish;

    bool notified = false;
    bool advanceNotified = false;
    bool awaitingAck = false;
    bool expired = false;
    bool done = false;
    QDateTime completedTime;
    bool pendingDelete = false;
    QDateTime deleteMarkTime;

    RecurrenceRule recurrence;
    SkipCursor cursor;

    bool isRepeating() const { return recurrence.isRepeating(); }
    QString finishText() const { return finish.toString(QString::fromLatin1(TimeFormat)); }
    QString startText() const;

    void recalculateFinish(const QDateTime &now);
    void resetRecurrenceProgress();
};

} // namespace data
} // namespace reminder
