#include "reminder/ui/TaskListViewModel.hpp"

#include <QVector>

#include "reminder/core/Clock.hpp"
#include "reminder/core/TaskBoard.hpp"
#include "reminder/ui/TaskListModel.hpp"

namespace reminder {
namespace ui {

TaskListViewModel::TaskListViewModel(core::TaskBoard &board, const core::Clock &clock, QObject *parent)
    : QObject(parent)
    , m_board(board)
    , m_clock(clock)
    , m_model(std::make_unique<TaskListModel>(this))
{
    connect(&m_board, &core::TaskBoard::tasksChanged, this, &TaskListViewModel::refresh);
    m_clockTimer.setInterval(1000);
    connect(&m_clockTimer, &QTimer::timeout, this, &TaskListViewModel::refreshRemaining);
}

TaskListModel *TaskListViewModel::model() const
{
    return m_model.get();
}

void TaskListViewModel::startClock()
{
    m_clockTimer.start();
}

void TaskListViewModel::refresh()
{
    const auto &tasks = m_board.tasks();
    QVector<data::TaskItem> items;
    items.reserve(static_cast<int>(tasks.size()));
    for (const auto &task : tasks) {
        items.append(task);
    }
    m_model->setReferenceTime(m_clock.now());
    m_model->setTasks(std::move(items));
    emit tasksChanged();
}

void TaskListViewModel::refreshRemaining()
{
    m_model->setReferenceTime(m_clock.now());
}

} // namespace ui
} // namespace reminder
