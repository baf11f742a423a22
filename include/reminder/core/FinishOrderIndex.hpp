#pragma once

#include <cstddef>
#include <vector>

#include "reminder/data/Task.hpp"

namespace reminder {
namespace core {

// Default ordering of the task list: earliest finish first, ties keep
// insertion order.
class FinishOrderIndex
{
public:
    static void sort(std::vector<data::TaskItem> &tasks);
    // Expects tasks to be sorted already. Returns the insertion index.
    static std::size_t insert(std::vector<data::TaskItem> &tasks, data::TaskItem item);
};

} // namespace core
} // namespace reminder
