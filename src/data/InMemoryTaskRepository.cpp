#include "reminder/data/InMemoryTaskRepository.hpp"

namespace reminder {
namespace data {

InMemoryTaskRepository::InMemoryTaskRepository() = default;
InMemoryTaskRepository::~InMemoryTaskRepository() = default;

std::vector<TaskItem> InMemoryTaskRepository::loadTasks() const
{
    return m_items;
}

bool InMemoryTaskRepository::saveTasks(const std::vector<TaskItem> &tasks)
{
    m_items = tasks;
    ++m_saveCount;
    return true;
}

} // namespace data
} // namespace reminder
