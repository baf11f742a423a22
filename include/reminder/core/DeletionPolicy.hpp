#pragma once

#include <QDateTime>
#include <optional>

#include "reminder/data/Task.hpp"

namespace reminder {
namespace core {

class DeletionPolicy
{
public:
    virtual ~DeletionPolicy() = default;
    virtual bool shouldPurge(const data::TaskItem &task, const QDateTime &now, bool force) const = 0;
};

// Pending-delete tasks go after the grace window (or at once when forced),
// completed tasks after the retention window. std::nullopt retention keeps
// completed tasks.
class SimpleDeletionPolicy : public DeletionPolicy
{
public:
    explicit SimpleDeletionPolicy(int pendingDeleteGraceSeconds = 3,
                                  std::optional<int> completedRetentionSeconds = 60);

    bool shouldPurge(const data::TaskItem &task, const QDateTime &now, bool force) const override;

    int pendingDeleteGraceSeconds() const { return m_pendingDeleteGraceSeconds; }
    std::optional<int> completedRetentionSeconds() const { return m_completedRetentionSeconds; }

    void setPendingDeleteGraceSeconds(int seconds);
    void setCompletedRetentionSeconds(std::optional<int> seconds);

private:
    int m_pendingDeleteGraceSeconds = 3;
    std::optional<int> m_completedRetentionSeconds;
};

} // namespace core
} // namespace reminder
