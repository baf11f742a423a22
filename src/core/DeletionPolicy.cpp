#include "reminder/core/DeletionPolicy.hpp"

#include <QtGlobal>

namespace reminder {
namespace core {

SimpleDeletionPolicy::SimpleDeletionPolicy(int pendingDeleteGraceSeconds,
                                           std::optional<int> completedRetentionSeconds)
    : m_pendingDeleteGraceSeconds(qMax(0, pendingDeleteGraceSeconds))
{
    setCompletedRetentionSeconds(completedRetentionSeconds);
}

bool SimpleDeletionPolicy::shouldPurge(const data::TaskItem &task, const QDateTime &now, bool force) const
{
    if (task.pendingDelete) {
        if (force || !task.deleteMarkTime.isValid()) {
            return true;
        }
        return task.deleteMarkTime.secsTo(now) >= m_pendingDeleteGraceSeconds;
    }
    if (task.done && task.completedTime.isValid() && m_completedRetentionSeconds) {
        return task.completedTime.secsTo(now) >= *m_completedRetentionSeconds;
    }
    return false;
}

void SimpleDeletionPolicy::setPendingDeleteGraceSeconds(int seconds)
{
    m_pendingDeleteGraceSeconds = qMax(0, seconds);
}

void SimpleDeletionPolicy::setCompletedRetentionSeconds(std::optional<int> seconds)
{
    if (seconds) {
        m_completedRetentionSeconds = qMax(0, *seconds);
    } else {
        m_completedRetentionSeconds.reset();
    }
}

} // namespace core
} // namespace reminder
