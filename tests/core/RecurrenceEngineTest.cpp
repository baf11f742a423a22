#include <QtTest/QtTest>

#include "TestSupport.hpp"
#include "reminder/core/RecurrenceEngine.hpp"

using namespace reminder;
using reminder::test::at;

namespace {
data::TaskItem dailyTask(const QDateTime &finish)
{
    data::TaskItem task;
    task.name = "Gold mine";
    task.finish = finish;
    task.recurrence = data::RecurrenceRule::preset(data::RepeatMode::Daily);
    return task;
}
} // namespace

class RecurrenceEngineTest : public QObject
{
    Q_OBJECT

private slots:
    void nonRepeatingTaskNeverMoves();
    void dailyTaskAdvancesOneDay();
    void skipCycleStepsOverSilentOccurrences();
    void negativeOffsetMovesNextOccurrenceEarlier();
    void offsetNeverMovesBackwards();
    void endInstantExpiresTask();
    void pauseWaitsForAcknowledgement();
    void pausedTaskPastEndExpiresInstead();
    void acknowledgementRespectsSkipAndEnd();
    void reportsState();
    void notificationsMatchClosedForm_data();
    void notificationsMatchClosedForm();
};

void RecurrenceEngineTest::nonRepeatingTaskNeverMoves()
{
    core::RecurrenceEngine engine;
    data::TaskItem task;
    task.finish = at(2025, 1, 1, 10, 0);
    task.notified = true;

    QCOMPARE(engine.advance(task), core::AdvanceOutcome::Inactive);
    QCOMPARE(task.finish, at(2025, 1, 1, 10, 0));
    QCOMPARE(task.cursor.occurrences, 0);
    QVERIFY(task.notified);
}

void RecurrenceEngineTest::dailyTaskAdvancesOneDay()
{
    core::RecurrenceEngine engine;
    data::TaskItem task = dailyTask(at(2025, 1, 1, 10, 0));
    task.notified = true;
    task.advanceNotified = true;

    QCOMPARE(engine.advance(task), core::AdvanceOutcome::Rescheduled);
    QCOMPARE(task.finish, at(2025, 1, 2, 10, 0));
    QCOMPARE(task.cursor.occurrences, 1);
    QCOMPARE(task.cursor.notifications, 1);
    QVERIFY(!task.notified);
    QVERIFY(!task.advanceNotified);
}

void RecurrenceEngineTest::skipCycleStepsOverSilentOccurrences()
{
    core::RecurrenceEngine engine;
    data::TaskItem task = dailyTask(at(2025, 1, 1, 10, 0));
    task.recurrence.setSkip(2, 1);

    // Occurrence 1 fired, occurrence 2 is next.
    QCOMPARE(engine.advance(task), core::AdvanceOutcome::Rescheduled);
    QCOMPARE(task.finish, at(2025, 1, 2, 10, 0));
    QCOMPARE(task.cursor.occurrences, 1);
    QCOMPARE(task.cursor.notifications, 1);

    // Occurrence 2 fired, occurrence 3 is silent so the task lands on 4.
    QCOMPARE(engine.advance(task), core::AdvanceOutcome::Rescheduled);
    QCOMPARE(task.finish, at(2025, 1, 4, 10, 0));
    QCOMPARE(task.cursor.occurrences, 3);
    QCOMPARE(task.cursor.notifications, 2);

    QCOMPARE(engine.advance(task), core::AdvanceOutcome::Rescheduled);
    QCOMPARE(task.finish, at(2025, 1, 5, 10, 0));
    QCOMPARE(task.cursor.occurrences, 4);
    QCOMPARE(task.cursor.notifications, 3);
}

void RecurrenceEngineTest::negativeOffsetMovesNextOccurrenceEarlier()
{
    core::RecurrenceEngine engine;
    data::TaskItem task = dailyTask(at(2025, 1, 1, 10, 0));
    task.recurrence.setOffsetAfterSeconds(-60);

    QCOMPARE(engine.advance(task), core::AdvanceOutcome::Rescheduled);
    QCOMPARE(task.finish, at(2025, 1, 2, 9, 59));

    task.recurrence.setOffsetAfterSeconds(120);
    QCOMPARE(engine.advance(task), core::AdvanceOutcome::Rescheduled);
    QCOMPARE(task.finish, at(2025, 1, 3, 10, 1));
}

void RecurrenceEngineTest::offsetNeverMovesBackwards()
{
    data::RecurrenceRule rule = data::RecurrenceRule::preset(data::RepeatMode::Daily);
    rule.setOffsetAfterSeconds(-2 * 24 * 3600);
    const QDateTime from = at(2025, 1, 1, 10, 0);
    QCOMPARE(core::RecurrenceEngine::nextOccurrence(rule, from), at(2025, 1, 2, 10, 0));
}

void RecurrenceEngineTest::endInstantExpiresTask()
{
    core::RecurrenceEngine engine;
    data::TaskItem task = dailyTask(at(2025, 1, 1, 10, 0));
    task.recurrence.setEndAt(at(2025, 1, 2, 0, 0));
    task.notified = true;

    QCOMPARE(engine.advance(task), core::AdvanceOutcome::Expired);
    QCOMPARE(task.finish, at(2025, 1, 1, 10, 0));
    QVERIFY(task.expired);
    QVERIFY(task.notified);
    QCOMPARE(engine.state(task, at(2025, 1, 3, 0, 0)), core::RecurrenceState::Expired);

    QCOMPARE(engine.advance(task), core::AdvanceOutcome::Blocked);
    QCOMPARE(task.finish, at(2025, 1, 1, 10, 0));
    QCOMPARE(task.cursor.occurrences, 1);
}

void RecurrenceEngineTest::pauseWaitsForAcknowledgement()
{
    core::RecurrenceEngine engine;
    data::TaskItem task = dailyTask(at(2025, 1, 1, 10, 0));
    task.recurrence.setPauseUntilAck(true);
    task.notified = true;

    QCOMPARE(engine.advance(task), core::AdvanceOutcome::AwaitingAck);
    QVERIFY(task.awaitingAck);
    QCOMPARE(task.finish, at(2025, 1, 1, 10, 0));
    QCOMPARE(task.cursor.occurrences, 1);
    QCOMPARE(task.cursor.notifications, 1);

    QCOMPARE(engine.advance(task), core::AdvanceOutcome::Blocked);
    QCOMPARE(task.cursor.occurrences, 1);

    QCOMPARE(engine.acknowledge(task, at(2025, 1, 1, 18, 30)), core::AdvanceOutcome::Rescheduled);
    QVERIFY(!task.awaitingAck);
    QVERIFY(!task.notified);
    QCOMPARE(task.finish, at(2025, 1, 2, 18, 30));
    QCOMPARE(task.cursor.occurrences, 1);

    QCOMPARE(engine.acknowledge(task, at(2025, 1, 1, 19, 0)), core::AdvanceOutcome::Blocked);
}

void RecurrenceEngineTest::pausedTaskPastEndExpiresInstead()
{
    core::RecurrenceEngine engine;
    data::TaskItem task = dailyTask(at(2025, 1, 1, 10, 0));
    task.recurrence.setPauseUntilAck(true);
    task.recurrence.setEndAt(at(2025, 1, 2, 0, 0));
    task.notified = true;

    QCOMPARE(engine.advance(task), core::AdvanceOutcome::Expired);
    QVERIFY(task.expired);
    QVERIFY(!task.awaitingAck);
    QCOMPARE(task.finish, at(2025, 1, 1, 10, 0));
    QCOMPARE(task.cursor.occurrences, 1);
    QCOMPARE(task.cursor.notifications, 1);
    QCOMPARE(engine.state(task, at(2025, 1, 3, 0, 0)), core::RecurrenceState::Expired);
    QCOMPARE(engine.acknowledge(task, at(2025, 1, 3, 0, 0)), core::AdvanceOutcome::Blocked);
}

void RecurrenceEngineTest::acknowledgementRespectsSkipAndEnd()
{
    core::RecurrenceEngine engine;
    data::TaskItem task = dailyTask(at(2025, 1, 1, 10, 0));
    task.recurrence.setPauseUntilAck(true);
    task.recurrence.setSkip(1, 1);
    task.recurrence.setEndAt(at(2025, 1, 10, 0, 0));

    QCOMPARE(engine.advance(task), core::AdvanceOutcome::AwaitingAck);
    // Occurrence 2 is silent, so the acknowledged task waits for occurrence 3.
    QCOMPARE(engine.acknowledge(task, at(2025, 1, 1, 12, 0)), core::AdvanceOutcome::Rescheduled);
    QCOMPARE(task.finish, at(2025, 1, 3, 12, 0));
    QCOMPARE(task.cursor.occurrences, 2);

    QCOMPARE(engine.advance(task), core::AdvanceOutcome::AwaitingAck);
    QCOMPARE(engine.acknowledge(task, at(2025, 1, 8, 12, 0)), core::AdvanceOutcome::Expired);
    QVERIFY(task.expired);
    QCOMPARE(task.finish, at(2025, 1, 3, 12, 0));
}

void RecurrenceEngineTest::reportsState()
{
    core::RecurrenceEngine engine;
    data::TaskItem plain;
    plain.finish = at(2025, 1, 1, 10, 0);
    QCOMPARE(engine.state(plain, at(2025, 1, 1, 11, 0)), core::RecurrenceState::Inactive);

    data::TaskItem task = dailyTask(at(2025, 1, 1, 10, 0));
    QCOMPARE(engine.state(task, at(2025, 1, 1, 9, 0)), core::RecurrenceState::Scheduled);
    QCOMPARE(engine.state(task, at(2025, 1, 1, 10, 0)), core::RecurrenceState::Due);
    task.awaitingAck = true;
    QCOMPARE(engine.state(task, at(2025, 1, 1, 10, 0)), core::RecurrenceState::AwaitingAck);
}

void RecurrenceEngineTest::notificationsMatchClosedForm_data()
{
    QTest::addColumn<int>("remindEvery");
    QTest::addColumn<int>("skipCount");
    QTest::addColumn<int>("advances");

    QTest::newRow("no skip") << 0 << 0 << 7;
    QTest::newRow("2/1") << 2 << 1 << 6;
    QTest::newRow("1/4") << 1 << 4 << 5;
    QTest::newRow("3/2") << 3 << 2 << 9;
}

void RecurrenceEngineTest::notificationsMatchClosedForm()
{
    QFETCH(int, remindEvery);
    QFETCH(int, skipCount);
    QFETCH(int, advances);

    core::RecurrenceEngine engine;
    data::TaskItem task = dailyTask(at(2025, 1, 1, 10, 0));
    task.recurrence.setSkip(remindEvery, skipCount);

    for (int i = 0; i < advances; ++i) {
        QCOMPARE(engine.advance(task), core::AdvanceOutcome::Rescheduled);
        QVERIFY(task.cursor.occurrences >= task.cursor.notifications);
        // Every stored finish belongs to an occurrence that will notify.
        QVERIFY(data::isNotifyOccurrence(task.recurrence.skip(), task.cursor.occurrences + 1));
    }
    QCOMPARE(task.cursor.notifications, data::expectedNotifications(task.recurrence.skip(), task.cursor.occurrences));
    QCOMPARE(task.finish, at(2025, 1, 1, 10, 0).addDays(task.cursor.occurrences));
}

QTEST_GUILESS_MAIN(RecurrenceEngineTest)
#include "RecurrenceEngineTest.moc"
