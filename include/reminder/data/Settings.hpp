#pragma once

#include <QString>
#include <QStringList>
#include <optional>

namespace reminder {
namespace data {

enum class SortMode
{
    ByFinish,
    Custom,
};

struct Settings
{
    // Lead time of the advance notification, 0 disables it.
    int advanceNotifySeconds = 300;
    bool alsoNotifyAtDue = true;
    // std::nullopt keeps completed tasks forever.
    std::optional<int> completedRetentionSeconds = 60;
    int pendingDeleteGraceSeconds = 3;

    int minIntervalMs = 1000;
    int maxIntervalMs = 5000;
    int guardSeconds = 3;

    QStringList accounts;
    QStringList taskPresets = { QStringLiteral("Upgrade"), QStringLiteral("Maintenance") };
    SortMode sortMode = SortMode::ByFinish;
};

} // namespace data
} // namespace reminder
