#pragma once

#include <QAbstractTableModel>
#include <QDateTime>
#include <QVector>

#include "reminder/data/Task.hpp"

namespace reminder {
namespace ui {

class TaskListModel : public QAbstractTableModel
{
    Q_OBJECT

public:
    enum Column
    {
        AccountColumn,
        TaskColumn,
        StartColumn,
        DurationColumn,
        FinishColumn,
        RemainingColumn,
        ColumnCount,
    };

    explicit TaskListModel(QObject *parent = nullptr);

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    int columnCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role) const override;
    QVariant headerData(int section, Qt::Orientation orientation, int role) const override;

    void setTasks(QVector<data::TaskItem> tasks);
    const data::TaskItem *taskAt(const QModelIndex &index) const;
    // Refreshes the remaining-time column only.
    void setReferenceTime(const QDateTime &now);

private:
    QString durationText(const data::TaskItem &task) const;

    QVector<data::TaskItem> m_tasks;
    QDateTime m_now;
};

} // namespace ui
} // namespace reminder
