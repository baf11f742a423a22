#include "reminder/data/Recurrence.hpp"

#include <QtGlobal>

namespace reminder {
namespace data {

bool CustomPeriod::isEmpty() const
{
    return years <= 0 && months <= 0 && days <= 0 && hours <= 0 && minutes <= 0 && seconds <= 0;
}

CustomPeriod CustomPeriod::normalized() const
{
    const CalendarSpan span = data::normalized(CalendarSpan{ years, months, { days, hours, minutes, seconds } });
    return CustomPeriod{ span.years, span.months, span.time.days, span.time.hours, span.time.minutes,
                         span.time.seconds };
}

bool operator==(const CustomPeriod &lhs, const CustomPeriod &rhs)
{
    return lhs.years == rhs.years && lhs.months == rhs.months && lhs.days == rhs.days
        && lhs.hours == rhs.hours && lhs.minutes == rhs.minutes && lhs.seconds == rhs.seconds;
}

std::optional<SkipRule> SkipRule::create(int remindEvery, int skipCount)
{
    if (remindEvery <= 0 || skipCount <= 0) {
        return std::nullopt;
    }
    return SkipRule{ qMin(remindEvery, MaxSide), qMin(skipCount, MaxSide) };
}

bool operator==(const SkipRule &lhs, const SkipRule &rhs)
{
    return lhs.remindEvery == rhs.remindEvery && lhs.skipCount == rhs.skipCount;
}

RecurrenceRule::RecurrenceRule(Period period)
    : m_period(std::move(period))
{
}

RecurrenceRule RecurrenceRule::none()
{
    return RecurrenceRule();
}

RecurrenceRule RecurrenceRule::preset(RepeatMode mode)
{
    switch (mode) {
    case RepeatMode::Daily:
    case RepeatMode::Weekly:
    case RepeatMode::Monthly:
    case RepeatMode::Yearly:
        return RecurrenceRule(Period(mode));
    case RepeatMode::None:
    case RepeatMode::Custom:
        break;
    }
    return none();
}

RecurrenceRule RecurrenceRule::custom(const CustomPeriod &period)
{
    const CustomPeriod clean = period.normalized();
    if (clean.isEmpty()) {
        return none();
    }
    return RecurrenceRule(Period(clean));
}

RepeatMode RecurrenceRule::mode() const
{
    if (const auto *preset = std::get_if<RepeatMode>(&m_period)) {
        return *preset;
    }
    if (std::holds_alternative<CustomPeriod>(m_period)) {
        return RepeatMode::Custom;
    }
    return RepeatMode::None;
}

std::optional<CustomPeriod> RecurrenceRule::customPeriod() const
{
    if (const auto *period = std::get_if<CustomPeriod>(&m_period)) {
        return *period;
    }
    return std::nullopt;
}

bool RecurrenceRule::isRepeating() const
{
    return !std::holds_alternative<std::monostate>(m_period);
}

void RecurrenceRule::setEndAt(const QDateTime &endAt)
{
    m_endAt = endAt;
}

void RecurrenceRule::setSkip(int remindEvery, int skipCount)
{
    m_skip = SkipRule::create(remindEvery, skipCount);
}

void RecurrenceRule::clearSkip()
{
    m_skip.reset();
}

void RecurrenceRule::setPauseUntilAck(bool pause)
{
    m_pauseUntilAck = pause;
}

void RecurrenceRule::setOffsetAfterSeconds(int seconds)
{
    m_offsetAfterSeconds = seconds;
}

QDateTime RecurrenceRule::stepFrom(const QDateTime &instant) const
{
    switch (mode()) {
    case RepeatMode::Daily:
        return instant.addDays(1);
    case RepeatMode::Weekly:
        return instant.addDays(7);
    case RepeatMode::Monthly:
        return instant.addMonths(1);
    case RepeatMode::Yearly:
        return instant.addYears(1);
    case RepeatMode::Custom: {
        const CustomPeriod &period = std::get<CustomPeriod>(m_period);
        const qint64 seconds = static_cast<qint64>(period.hours) * 3600
            + static_cast<qint64>(period.minutes) * 60 + period.seconds;
        return instant.addYears(period.years).addMonths(period.months).addDays(period.days).addSecs(seconds);
    }
    case RepeatMode::None:
        break;
    }
    return instant;
}

bool RecurrenceRule::operator==(const RecurrenceRule &other) const
{
    return m_period == other.m_period && m_endAt == other.m_endAt && m_skip == other.m_skip
        && m_pauseUntilAck == other.m_pauseUntilAck && m_offsetAfterSeconds == other.m_offsetAfterSeconds;
}

} // namespace data
} // namespace reminder
