#include <QtTest/QtTest>

#include <QBrush>
#include <QSignalSpy>

#include "TestSupport.hpp"
#include "reminder/core/DeletionPolicy.hpp"
#include "reminder/core/TaskBoard.hpp"
#include "reminder/data/InMemoryTaskRepository.hpp"
#include "reminder/ui/TaskListModel.hpp"
#include "reminder/ui/TaskListViewModel.hpp"

using namespace reminder;
using reminder::test::at;

namespace {
data::TaskItem sampleTask()
{
    data::TaskItem task;
    task.id = QUuid::createUuid();
    task.account = "Main";
    task.name = "Town hall";
    task.start = at(2025, 1, 1, 9, 0);
    task.days = 1;
    task.hours = 2;
    task.minutes = 30;
    task.finish = at(2025, 1, 2, 11, 30);
    return task;
}
} // namespace

class TaskListModelTest : public QObject
{
    Q_OBJECT

private slots:
    void displaysColumns();
    void remainingReflectsState();
    void rolesHighlightState();
    void referenceTimeRefreshesRemainingColumn();
    void viewModelFollowsBoard();
};

void TaskListModelTest::displaysColumns()
{
    ui::TaskListModel model;
    model.setTasks({ sampleTask() });
    model.setReferenceTime(at(2025, 1, 1, 10, 0));

    QCOMPARE(model.rowCount(), 1);
    QCOMPARE(model.columnCount(), static_cast<int>(ui::TaskListModel::ColumnCount));
    QCOMPARE(model.headerData(ui::TaskListModel::RemainingColumn, Qt::Horizontal, Qt::DisplayRole).toString(),
             QStringLiteral("Remaining"));

    const auto text = [&model](int column) { return model.index(0, column).data().toString(); };
    QCOMPARE(text(ui::TaskListModel::AccountColumn), QStringLiteral("Main"));
    QCOMPARE(text(ui::TaskListModel::TaskColumn), QStringLiteral("Town hall"));
    QCOMPARE(text(ui::TaskListModel::StartColumn), QStringLiteral("2025-01-01 09:00"));
    QCOMPARE(text(ui::TaskListModel::DurationColumn), QStringLiteral("1d 2h 30m"));
    QCOMPARE(text(ui::TaskListModel::FinishColumn), QStringLiteral("2025-01-02 11:30"));
    QCOMPARE(text(ui::TaskListModel::RemainingColumn), QStringLiteral("1d 1h 30m"));

    QVERIFY(model.taskAt(model.index(0, 0)) != nullptr);
    QCOMPARE(model.taskAt(model.index(0, 0))->name, QStringLiteral("Town hall"));
    QVERIFY(model.taskAt(QModelIndex()) == nullptr);
}

void TaskListModelTest::remainingReflectsState()
{
    data::TaskItem done = sampleTask();
    done.done = true;
    data::TaskItem waiting = sampleTask();
    waiting.awaitingAck = true;
    data::TaskItem overdue = sampleTask();

    ui::TaskListModel model;
    model.setTasks({ done, waiting, overdue });
    model.setReferenceTime(at(2025, 1, 3, 0, 0));

    const int column = ui::TaskListModel::RemainingColumn;
    QCOMPARE(model.index(0, column).data().toString(), QStringLiteral("Done"));
    QCOMPARE(model.index(1, column).data().toString(), QStringLiteral("Waiting for confirmation"));
    QCOMPARE(model.index(2, column).data().toString(), QStringLiteral("Due"));
}

void TaskListModelTest::rolesHighlightState()
{
    data::TaskItem waiting = sampleTask();
    waiting.awaitingAck = true;
    waiting.recurrence = data::RecurrenceRule::preset(data::RepeatMode::Daily);
    waiting.cursor = { 3, 2 };
    data::TaskItem removed = sampleTask();
    removed.pendingDelete = true;

    ui::TaskListModel model;
    model.setTasks({ waiting, removed });

    QVERIFY(model.index(0, 0).data(Qt::BackgroundRole).isValid());
    QVERIFY(!model.index(1, 0).data(Qt::BackgroundRole).isValid());
    QVERIFY(!model.index(0, 0).data(Qt::ForegroundRole).isValid());
    QCOMPARE(model.index(1, 0).data(Qt::ForegroundRole).value<QBrush>().color(), QColor(Qt::gray));

    const QString tooltip = model.index(0, 0).data(Qt::ToolTipRole).toString();
    QVERIFY(tooltip.contains(QStringLiteral("3")));
    QVERIFY(tooltip.contains(QStringLiteral("2")));
    QVERIFY(!model.index(1, 0).data(Qt::ToolTipRole).isValid());
}

void TaskListModelTest::referenceTimeRefreshesRemainingColumn()
{
    ui::TaskListModel model;
    model.setTasks({ sampleTask(), sampleTask() });

    QSignalSpy changedSpy(&model, &QAbstractItemModel::dataChanged);
    model.setReferenceTime(at(2025, 1, 2, 11, 29, 50));
    QCOMPARE(changedSpy.count(), 1);
    const auto args = changedSpy.takeFirst();
    QCOMPARE(args.at(0).value<QModelIndex>().column(), static_cast<int>(ui::TaskListModel::RemainingColumn));
    QCOMPARE(args.at(1).value<QModelIndex>().row(), 1);
    QCOMPARE(model.index(0, ui::TaskListModel::RemainingColumn).data().toString(), QStringLiteral("0m 10s"));
}

void TaskListModelTest::viewModelFollowsBoard()
{
    data::InMemoryTaskRepository repository;
    core::SimpleDeletionPolicy policy;
    test::ManualClock clock(at(2025, 1, 1, 9, 0));
    core::TaskBoard board(repository, policy, clock);
    ui::TaskListViewModel viewModel(board, clock);

    QSignalSpy refreshedSpy(&viewModel, &ui::TaskListViewModel::tasksChanged);
    data::TaskItem task;
    task.name = "Mortar";
    task.hours = 1;
    board.addTask(task);

    QCOMPARE(refreshedSpy.count(), 1);
    QCOMPARE(viewModel.model()->rowCount(), 1);
    QCOMPARE(viewModel.model()->index(0, ui::TaskListModel::RemainingColumn).data().toString(),
             QStringLiteral("1h 0m 0s"));

    clock.advance(30 * 60);
    viewModel.refreshRemaining();
    QCOMPARE(viewModel.model()->index(0, ui::TaskListModel::RemainingColumn).data().toString(),
             QStringLiteral("30m 0s"));
}

QTEST_GUILESS_MAIN(TaskListModelTest)
#include "TaskListModelTest.moc"
