#include "reminder/ui/TaskListModel.hpp"

#include <QBrush>
#include <QColor>

#include "reminder/data/Duration.hpp"

namespace reminder {
namespace ui {

TaskListModel::TaskListModel(QObject *parent)
    : QAbstractTableModel(parent)
    , m_now(QDateTime::currentDateTime())
{
}

int TaskListModel::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) {
        return 0;
    }
    return m_tasks.size();
}

int TaskListModel::columnCount(const QModelIndex &parent) const
{
    if (parent.isValid()) {
        return 0;
    }
    return ColumnCount;
}

QVariant TaskListModel::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() < 0 || index.row() >= m_tasks.size()) {
        return {};
    }

    const auto &task = m_tasks.at(index.row());
    switch (role) {
    case Qt::DisplayRole:
        switch (index.column()) {
        case AccountColumn:
            return task.account;
        case TaskColumn:
            return task.name;
        case StartColumn:
            return task.startText();
        case DurationColumn:
            return durationText(task);
        case FinishColumn:
            return task.finishText();
        case RemainingColumn:
            if (task.done) {
                return tr("Done");
            }
            if (task.awaitingAck) {
                return tr("Waiting for confirmation");
            }
            return data::formatRemaining(task.finish, m_now);
        default:
            return {};
        }
    case Qt::ToolTipRole:
        if (task.isRepeating()) {
            return tr("Occurred %1 times, notified %2 times")
                .arg(task.cursor.occurrences)
                .arg(task.cursor.notifications);
        }
        return {};
    case Qt::BackgroundRole:
        if (task.awaitingAck) {
            return QBrush(QColor(255, 236, 179));
        }
        return {};
    case Qt::ForegroundRole:
        if (task.done || task.pendingDelete) {
            return QBrush(QColor(Qt::gray));
        }
        return {};
    default:
        return {};
    }
}

QVariant TaskListModel::headerData(int section, Qt::Orientation orientation, int role) const
{
    if (orientation != Qt::Horizontal || role != Qt::DisplayRole) {
        return QAbstractTableModel::headerData(section, orientation, role);
    }
    switch (section) {
    case AccountColumn:
        return tr("Account");
    case TaskColumn:
        return tr("Task");
    case StartColumn:
        return tr("Start");
    case DurationColumn:
        return tr("Duration");
    case FinishColumn:
        return tr("Finish");
    case RemainingColumn:
        return tr("Remaining");
    default:
        return {};
    }
}

void TaskListModel::setTasks(QVector<data::TaskItem> tasks)
{
    beginResetModel();
    m_tasks = std::move(tasks);
    endResetModel();
}

const data::TaskItem *TaskListModel::taskAt(const QModelIndex &index) const
{
    if (!index.isValid() || index.row() < 0 || index.row() >= m_tasks.size()) {
        return nullptr;
    }
    return &m_tasks.at(index.row());
}

void TaskListModel::setReferenceTime(const QDateTime &now)
{
    m_now = now;
    if (m_tasks.isEmpty()) {
        return;
    }
    const QModelIndex first = index(0, RemainingColumn);
    const QModelIndex last = index(m_tasks.size() - 1, RemainingColumn);
    emit dataChanged(first, last, { Qt::DisplayRole });
}

QString TaskListModel::durationText(const data::TaskItem &task) const
{
    const data::DayTimeSpan span = data::normalized(data::DayTimeSpan{ task.days, task.hours, task.minutes, 0 });
    return data::formatDuration(span.days, span.hours, span.minutes);
}

} // namespace ui
} // namespace reminder
