#pragma once

#include <QObject>
#include <QUuid>
#include <cstddef>
#include <optional>
#include <vector>

#include "reminder/core/RecurrenceEngine.hpp"
#include "reminder/data/Settings.hpp"
#include "reminder/data/Task.hpp"

namespace reminder {
namespace data {
class TaskRepository;
}

namespace core {

class Clock;
class DeletionPolicy;

// Owns the task collection. Every mutation happens here, on the GUI thread,
// and is followed by tasksChanged().
class TaskBoard : public QObject
{
    Q_OBJECT

public:
    TaskBoard(data::TaskRepository &repository, const DeletionPolicy &deletionPolicy, const Clock &clock,
              QObject *parent = nullptr);

    void load();
    bool save();

    const std::vector<data::TaskItem> &tasks() const { return m_tasks; }
    std::optional<data::TaskItem> findById(const QUuid &id) const;

    data::SortMode sortMode() const { return m_sortMode; }
    void setSortMode(data::SortMode mode);

    data::TaskItem addTask(data::TaskItem task);
    bool updateTask(const data::TaskItem &task);
    // Resumes a task awaiting acknowledgement, otherwise toggles done.
    bool acknowledge(const QUuid &id);
    bool markPendingDelete(const QUuid &id);
    bool restore(const QUuid &id);
    std::size_t purge(bool force);
    std::size_t removeAllDone();
    // Only meaningful in custom sort mode.
    bool moveTask(std::size_t from, std::size_t to);

    // Scheduler access for in-place flag updates during a tick.
    std::vector<data::TaskItem> &mutableTasks() { return m_tasks; }
    void commitTick(bool changed);

signals:
    void tasksChanged();
    void awaitingAcknowledgementChanged(const QUuid &id, bool awaiting);

private:
    std::vector<data::TaskItem>::iterator findIt(const QUuid &id);
    void placeTask(data::TaskItem task);
    void persistAndNotify();

    data::TaskRepository &m_repository;
    const DeletionPolicy &m_deletionPolicy;
    const Clock &m_clock;
    RecurrenceEngine m_engine;
    std::vector<data::TaskItem> m_tasks;
    data::SortMode m_sortMode = data::SortMode::ByFinish;
};

} // namespace core
} // namespace reminder
