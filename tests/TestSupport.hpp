#pragma once

#include <QDateTime>
#include <QList>
#include <QPair>
#include <QString>

#include "reminder/core/Clock.hpp"
#include "reminder/core/Notifier.hpp"

namespace reminder {
namespace test {

class ManualClock : public core::Clock
{
public:
    explicit ManualClock(QDateTime now)
        : m_now(std::move(now))
    {
    }

    QDateTime now() const override { return m_now; }
    void set(const QDateTime &now) { m_now = now; }
    void advance(qint64 seconds) { m_now = m_now.addSecs(seconds); }

private:
    QDateTime m_now;
};

class RecordingNotifier : public core::Notifier
{
public:
    void notify(const QString &title, const QString &body) override { messages.append({ title, body }); }

    QList<QPair<QString, QString>> messages;
};

inline QDateTime at(int year, int month, int day, int hour, int minute, int second = 0)
{
    return QDateTime(QDate(year, month, day), QTime(hour, minute, second));
}

} // namespace test
} // namespace reminder
