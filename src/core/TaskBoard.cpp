#include "reminder/core/TaskBoard.hpp"

#include <algorithm>

#include "reminder/core/Clock.hpp"
#include "reminder/core/DeletionPolicy.hpp"
#include "reminder/core/FinishOrderIndex.hpp"
#include "reminder/core/Logging.hpp"
#include "reminder/data/TaskRepository.hpp"

namespace reminder {
namespace core {

namespace {
bool scheduleInputsChanged(const data::TaskItem &before, const data::TaskItem &after)
{
    return before.start != after.start || before.days != after.days || before.hours != after.hours
        || before.minutes != after.minutes || before.recurrence != after.recurrence;
}
} // namespace

TaskBoard::TaskBoard(data::TaskRepository &repository, const DeletionPolicy &deletionPolicy, const Clock &clock,
                     QObject *parent)
    : QObject(parent)
    , m_repository(repository)
    , m_deletionPolicy(deletionPolicy)
    , m_clock(clock)
{
}

void TaskBoard::load()
{
    m_tasks = m_repository.loadTasks();
    if (m_sortMode == data::SortMode::ByFinish) {
        FinishOrderIndex::sort(m_tasks);
    }
    qCInfo(lcReminderBoard) << "Loaded" << m_tasks.size() << "tasks";
    emit tasksChanged();
}

bool TaskBoard::save()
{
    if (!m_repository.saveTasks(m_tasks)) {
        qCWarning(lcReminderBoard) << "Saving" << m_tasks.size() << "tasks failed";
        return false;
    }
    return true;
}

std::optional<data::TaskItem> TaskBoard::findById(const QUuid &id) const
{
    const auto it = std::find_if(m_tasks.cbegin(), m_tasks.cend(),
                                 [&id](const data::TaskItem &task) { return task.id == id; });
    if (it == m_tasks.cend()) {
        return std::nullopt;
    }
    return *it;
}

void TaskBoard::setSortMode(data::SortMode mode)
{
    if (m_sortMode == mode) {
        return;
    }
    m_sortMode = mode;
    if (m_sortMode == data::SortMode::ByFinish) {
        FinishOrderIndex::sort(m_tasks);
    }
    emit tasksChanged();
}

data::TaskItem TaskBoard::addTask(data::TaskItem task)
{
    if (task.id.isNull()) {
        task.id = QUuid::createUuid();
    }
    task.recalculateFinish(m_clock.now());
    task.resetRecurrenceProgress();
    const data::TaskItem stored = task;
    placeTask(std::move(task));
    qCDebug(lcReminderBoard) << "Added task" << stored.id << stored.name << "finishing" << stored.finish;
    persistAndNotify();
    return stored;
}

bool TaskBoard::updateTask(const data::TaskItem &task)
{
    auto it = findIt(task.id);
    if (it == m_tasks.end()) {
        return false;
    }

    // Only user-editable fields are taken over; flags stay owned by the board.
    data::TaskItem updated = *it;
    updated.account = task.account;
    updated.name = task.name;
    if (scheduleInputsChanged(*it, task)) {
        updated.start = task.start;
        updated.days = task.days;
        updated.hours = task.hours;
        updated.minutes = task.minutes;
        updated.recurrence = task.recurrence;
        updated.recalculateFinish(m_clock.now());
        updated.resetRecurrenceProgress();
    }
    const bool leftAwaiting = it->awaitingAck && !updated.awaitingAck;

    if (m_sortMode == data::SortMode::ByFinish) {
        m_tasks.erase(it);
        placeTask(std::move(updated));
    } else {
        *it = std::move(updated);
    }
    if (leftAwaiting) {
        emit awaitingAcknowledgementChanged(task.id, false);
    }
    persistAndNotify();
    return true;
}

bool TaskBoard::acknowledge(const QUuid &id)
{
    auto it = findIt(id);
    if (it == m_tasks.end()) {
        return false;
    }

    const QDateTime now = m_clock.now();
    if (it->awaitingAck) {
        const AdvanceOutcome outcome = m_engine.acknowledge(*it, now);
        qCInfo(lcReminderBoard) << "Task" << id << "acknowledged:" << toString(outcome);
        if (m_sortMode == data::SortMode::ByFinish) {
            FinishOrderIndex::sort(m_tasks);
        }
        emit awaitingAcknowledgementChanged(id, false);
    } else {
        it->done = !it->done;
        it->completedTime = it->done ? now : QDateTime();
    }
    persistAndNotify();
    return true;
}

bool TaskBoard::markPendingDelete(const QUuid &id)
{
    auto it = findIt(id);
    if (it == m_tasks.end() || it->pendingDelete) {
        return false;
    }
    it->pendingDelete = true;
    it->deleteMarkTime = m_clock.now();
    persistAndNotify();
    return true;
}

bool TaskBoard::restore(const QUuid &id)
{
    auto it = findIt(id);
    if (it == m_tasks.end() || !it->pendingDelete) {
        return false;
    }
    it->pendingDelete = false;
    it->deleteMarkTime = QDateTime();
    persistAndNotify();
    return true;
}

std::size_t TaskBoard::purge(bool force)
{
    const QDateTime now = m_clock.now();
    const auto firstRemoved = std::remove_if(m_tasks.begin(), m_tasks.end(), [&](const data::TaskItem &task) {
        return m_deletionPolicy.shouldPurge(task, now, force);
    });
    const auto removed = static_cast<std::size_t>(std::distance(firstRemoved, m_tasks.end()));
    if (removed == 0) {
        return 0;
    }
    m_tasks.erase(firstRemoved, m_tasks.end());
    if (m_sortMode == data::SortMode::ByFinish) {
        FinishOrderIndex::sort(m_tasks);
    }
    qCDebug(lcReminderBoard) << "Purged" << removed << "tasks";
    persistAndNotify();
    return removed;
}

std::size_t TaskBoard::removeAllDone()
{
    const auto firstRemoved = std::remove_if(m_tasks.begin(), m_tasks.end(),
                                             [](const data::TaskItem &task) { return task.done; });
    const auto removed = static_cast<std::size_t>(std::distance(firstRemoved, m_tasks.end()));
    if (removed == 0) {
        return 0;
    }
    m_tasks.erase(firstRemoved, m_tasks.end());
    persistAndNotify();
    return removed;
}

bool TaskBoard::moveTask(std::size_t from, std::size_t to)
{
    if (m_sortMode != data::SortMode::Custom || from >= m_tasks.size() || to >= m_tasks.size()) {
        return false;
    }
    if (from == to) {
        return true;
    }
    if (from < to) {
        std::rotate(m_tasks.begin() + static_cast<long>(from), m_tasks.begin() + static_cast<long>(from) + 1,
                    m_tasks.begin() + static_cast<long>(to) + 1);
    } else {
        std::rotate(m_tasks.begin() + static_cast<long>(to), m_tasks.begin() + static_cast<long>(from),
                    m_tasks.begin() + static_cast<long>(from) + 1);
    }
    persistAndNotify();
    return true;
}

void TaskBoard::commitTick(bool changed)
{
    if (!changed) {
        return;
    }
    if (m_sortMode == data::SortMode::ByFinish) {
        FinishOrderIndex::sort(m_tasks);
    }
    persistAndNotify();
}

std::vector<data::TaskItem>::iterator TaskBoard::findIt(const QUuid &id)
{
    return std::find_if(m_tasks.begin(), m_tasks.end(), [&id](const data::TaskItem &task) { return task.id == id; });
}

void TaskBoard::placeTask(data::TaskItem task)
{
    if (m_sortMode == data::SortMode::ByFinish) {
        FinishOrderIndex::insert(m_tasks, std::move(task));
    } else {
        m_tasks.push_back(std::move(task));
    }
}

void TaskBoard::persistAndNotify()
{
    save();
    emit tasksChanged();
}

} // namespace core
} // namespace reminder
