#include "reminder/data/Duration.hpp"

#include <QObject>
#include <QtGlobal>

namespace reminder {
namespace data {

bool operator==(const DayTimeSpan &lhs, const DayTimeSpan &rhs)
{
    return lhs.days == rhs.days && lhs.hours == rhs.hours && lhs.minutes == rhs.minutes
        && lhs.seconds == rhs.seconds;
}

bool operator!=(const DayTimeSpan &lhs, const DayTimeSpan &rhs)
{
    return !(lhs == rhs);
}

bool operator==(const CalendarSpan &lhs, const CalendarSpan &rhs)
{
    return lhs.years == rhs.years && lhs.months == rhs.months && lhs.time == rhs.time;
}

bool operator!=(const CalendarSpan &lhs, const CalendarSpan &rhs)
{
    return !(lhs == rhs);
}

DayTimeSpan normalized(DayTimeSpan span)
{
    span.seconds = qMax(0, span.seconds);
    span.minutes = qMax(0, span.minutes);
    span.hours = qMax(0, span.hours);
    span.days = qMax(0, span.days);

    if (span.seconds >= 60) {
        span.minutes += span.seconds / 60;
        span.seconds %= 60;
    }
    if (span.minutes >= 60) {
        span.hours += span.minutes / 60;
        span.minutes %= 60;
    }
    if (span.hours >= 24) {
        span.days += span.hours / 24;
        span.hours %= 24;
    }
    return span;
}

CalendarSpan normalized(CalendarSpan span)
{
    span.years = qMax(0, span.years);
    span.months = qMax(0, span.months);
    span.time = normalized(span.time);

    if (span.months >= 12) {
        span.years += span.months / 12;
        span.months %= 12;
    }
    return span;
}

QString formatDuration(int days, int hours, int minutes, bool showSeconds, int seconds)
{
    if (days > 0) {
        return QObject::tr("%1d %2h %3m").arg(days).arg(hours).arg(minutes);
    }
    if (hours > 0) {
        if (showSeconds) {
            return QObject::tr("%1h %2m %3s").arg(hours).arg(minutes).arg(seconds);
        }
        return QObject::tr("%1h %2m").arg(hours).arg(minutes);
    }
    if (showSeconds) {
        return QObject::tr("%1m %2s").arg(minutes).arg(seconds);
    }
    return QObject::tr("%1m").arg(minutes);
}

QString formatRemaining(const QDateTime &finish, const QDateTime &now)
{
    const qint64 total = now.secsTo(finish);
    if (total <= 0) {
        return QObject::tr("Due");
    }
    const DayTimeSpan span = normalized(DayTimeSpan{ 0, 0, 0, static_cast<int>(qMin<qint64>(total, 0x7fffffff)) });
    return formatDuration(span.days, span.hours, span.minutes, true, span.seconds);
}

} // namespace data
} // namespace reminder
