#pragma once

#include <QObject>
#include <QTimer>
#include <memory>

#include "reminder/data/Task.hpp"

namespace reminder {
namespace core {
class Clock;
class TaskBoard;
}

namespace ui {

class TaskListModel;

class TaskListViewModel : public QObject
{
    Q_OBJECT
public:
    TaskListViewModel(core::TaskBoard &board, const core::Clock &clock, QObject *parent = nullptr);

    TaskListModel *model() const;
    // Ticks the remaining-time column once per second.
    void startClock();

public slots:
    void refresh();
    void refreshRemaining();

signals:
    void tasksChanged();

private:
    core::TaskBoard &m_board;
    const core::Clock &m_clock;
    std::unique_ptr<TaskListModel> m_model;
    QTimer m_clockTimer;
};

} // namespace ui
} // namespace reminder
