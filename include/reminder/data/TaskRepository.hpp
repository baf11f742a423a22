#pragma once

#include <vector>

#include "reminder/data/Task.hpp"

namespace reminder {
namespace data {

class TaskRepository
{
public:
    virtual ~TaskRepository() = default;

    // Returns an empty list when nothing is stored or the store is unreadable.
    virtual std::vector<TaskItem> loadTasks() const = 0;
    // Replaces everything stored.
    virtual bool saveTasks(const std::vector<TaskItem> &tasks) = 0;
};

} // namespace data
} // namespace reminder
