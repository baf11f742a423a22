#pragma once

#include <QDateTime>
#include <QString>

namespace reminder {
namespace data {

struct DayTimeSpan
{
    int days = 0;
    int hours = 0;
    int minutes = 0;
    int seconds = 0;

    bool isZero() const { return days == 0 && hours == 0 && minutes == 0 && seconds == 0; }
};

struct CalendarSpan
{
    int years = 0;
    int months = 0;
    DayTimeSpan time;

    bool isZero() const { return years == 0 && months == 0 && time.isZero(); }
};

bool operator==(const DayTimeSpan &lhs, const DayTimeSpan &rhs);
bool operator!=(const DayTimeSpan &lhs, const DayTimeSpan &rhs);
bool operator==(const CalendarSpan &lhs, const CalendarSpan &rhs);
bool operator!=(const CalendarSpan &lhs, const CalendarSpan &rhs);

// Negative fields are clamped to zero, then seconds, minutes and hours are
// carried upwards. Days absorb everything above hours.
DayTimeSpan normalized(DayTimeSpan span);

// Same as above plus months >= 12 carried into years. Days never carry into
// months because month length is not fixed.
CalendarSpan normalized(CalendarSpan span);

QString formatDuration(int days, int hours, int minutes, bool showSeconds = false, int seconds = 0);
QString formatRemaining(const QDateTime &finish, const QDateTime &now);

} // namespace data
} // namespace reminder
