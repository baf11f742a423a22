#pragma once

#include <QDateTime>
#include <optional>
#include <variant>

#include "reminder/data/Duration.hpp"

namespace reminder {
namespace data {

enum class RepeatMode
{
    None,
    Daily,
    Weekly,
    Monthly,
    Yearly,
    Custom,
};

struct CustomPeriod
{
    int years = 0;
    int months = 0;
    int days = 0;
    int hours = 0;
    int minutes = 0;
    int seconds = 0;

    bool isEmpty() const;
    CustomPeriod normalized() const;
};

bool operator==(const CustomPeriod &lhs, const CustomPeriod &rhs);

// "Notify remindEvery times, then stay silent for skipCount occurrences."
struct SkipRule
{
    // Upper bound for either side, keeps cycleLength() in range.
    static constexpr int MaxSide = 1000000;

    int remindEvery = 0;
    int skipCount = 0;

    int cycleLength() const { return remindEvery + skipCount; }

    // Only a rule with both sides positive is meaningful. Larger sides are
    // capped at MaxSide.
    static std::optional<SkipRule> create(int remindEvery, int skipCount);
};

bool operator==(const SkipRule &lhs, const SkipRule &rhs);

class RecurrenceRule
{
public:
    RecurrenceRule() = default;

    static RecurrenceRule none();
    // None and Custom are not presets and yield none().
    static RecurrenceRule preset(RepeatMode mode);
    // An empty period yields none().
    static RecurrenceRule custom(const CustomPeriod &period);

    RepeatMode mode() const;
    std::optional<CustomPeriod> customPeriod() const;
    bool isRepeating() const;

    const QDateTime &endAt() const { return m_endAt; }
    void setEndAt(const QDateTime &endAt);
    bool hasEnd() const { return m_endAt.isValid(); }

    const std::optional<SkipRule> &skip() const { return m_skip; }
    void setSkip(int remindEvery, int skipCount);
    void clearSkip();
    bool hasSkip() const { return m_skip.has_value(); }

    bool pauseUntilAck() const { return m_pauseUntilAck; }
    void setPauseUntilAck(bool pause);

    int offsetAfterSeconds() const { return m_offsetAfterSeconds; }
    void setOffsetAfterSeconds(int seconds);

    // Adds one period to the instant. Returns the instant unchanged for a
    // non-repeating rule.
    QDateTime stepFrom(const QDateTime &instant) const;

    bool operator==(const RecurrenceRule &other) const;
    bool operator!=(const RecurrenceRule &other) const { return !(*this == other); }

private:
    using Period = std::variant<std::monostate, RepeatMode, CustomPeriod>;

    explicit RecurrenceRule(Period period);

    Period m_period;
    QDateTime m_endAt;
    std::optional<SkipRule> m_skip;
    bool m_pauseUntilAck = false;
    int m_offsetAfterSeconds = 0;
};

} // namespace data
} // namespace reminder
