#include <QtTest/QtTest>

#include "TestSupport.hpp"
#include "reminder/core/FinishOrderIndex.hpp"

using namespace reminder;
using reminder::test::at;

namespace {
data::TaskItem taskAt(const QString &name, const QDateTime &finish)
{
    data::TaskItem task;
    task.name = name;
    task.finish = finish;
    return task;
}

QStringList names(const std::vector<data::TaskItem> &tasks)
{
    QStringList result;
    for (const auto &task : tasks) {
        result << task.name;
    }
    return result;
}
} // namespace

class FinishOrderIndexTest : public QObject
{
    Q_OBJECT

private slots:
    void sortIsStable();
    void insertGoesAfterEqualFinish();
    void insertAtEnds();
};

void FinishOrderIndexTest::sortIsStable()
{
    std::vector<data::TaskItem> tasks{
        taskAt("c", at(2025, 1, 3, 0, 0)),
        taskAt("a1", at(2025, 1, 1, 0, 0)),
        taskAt("b", at(2025, 1, 2, 0, 0)),
        taskAt("a2", at(2025, 1, 1, 0, 0)),
    };
    core::FinishOrderIndex::sort(tasks);
    QCOMPARE(names(tasks), (QStringList{ "a1", "a2", "b", "c" }));
}

void FinishOrderIndexTest::insertGoesAfterEqualFinish()
{
    std::vector<data::TaskItem> tasks{
        taskAt("a", at(2025, 1, 1, 0, 0)),
        taskAt("b1", at(2025, 1, 2, 0, 0)),
        taskAt("c", at(2025, 1, 3, 0, 0)),
    };
    const auto index = core::FinishOrderIndex::insert(tasks, taskAt("b2", at(2025, 1, 2, 0, 0)));
    QCOMPARE(index, static_cast<std::size_t>(2));
    QCOMPARE(names(tasks), (QStringList{ "a", "b1", "b2", "c" }));
}

void FinishOrderIndexTest::insertAtEnds()
{
    std::vector<data::TaskItem> tasks;
    QCOMPARE(core::FinishOrderIndex::insert(tasks, taskAt("m", at(2025, 1, 2, 0, 0))), static_cast<std::size_t>(0));
    QCOMPARE(core::FinishOrderIndex::insert(tasks, taskAt("first", at(2025, 1, 1, 0, 0))), static_cast<std::size_t>(0));
    QCOMPARE(core::FinishOrderIndex::insert(tasks, taskAt("last", at(2025, 1, 9, 0, 0))), static_cast<std::size_t>(2));
    QCOMPARE(names(tasks), (QStringList{ "first", "m", "last" }));
}

QTEST_GUILESS_MAIN(FinishOrderIndexTest)
#include "FinishOrderIndexTest.moc"
