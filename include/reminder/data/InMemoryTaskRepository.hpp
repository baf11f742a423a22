#pragma once

#include "reminder/data/TaskRepository.hpp"

namespace reminder {
namespace data {

class InMemoryTaskRepository : public TaskRepository
{
public:
    InMemoryTaskRepository();
    ~InMemoryTaskRepository() override;

    std::vector<TaskItem> loadTasks() const override;
    bool saveTasks(const std::vector<TaskItem> &tasks) override;

    int saveCount() const { return m_saveCount; }

private:
    std::vector<TaskItem> m_items;
    int m_saveCount = 0;
};

} // namespace data
} // namespace reminder
