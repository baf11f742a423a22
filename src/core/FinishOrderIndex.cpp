#include "reminder/core/FinishOrderIndex.hpp"

#include <algorithm>

namespace reminder {
namespace core {

void FinishOrderIndex::sort(std::vector<data::TaskItem> &tasks)
{
    std::stable_sort(tasks.begin(), tasks.end(), [](const data::TaskItem &lhs, const data::TaskItem &rhs) {
        return lhs.finish < rhs.finish;
    });
}

std::size_t FinishOrderIndex::insert(std::vector<data::TaskItem> &tasks, data::TaskItem item)
{
    std::size_t index = 0;
    while (index < tasks.size() && tasks[index].finish <= item.finish) {
        ++index;
    }
    tasks.insert(tasks.begin() + static_cast<long>(index), std::move(item));
    return index;
}

} // namespace core
} // namespace reminder
