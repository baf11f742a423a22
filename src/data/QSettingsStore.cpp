#include "reminder/data/QSettingsStore.hpp"

#include <QSettings>
#include <QtGlobal>
#include <memory>

#include "reminder/core/Logging.hpp"

namespace reminder {
namespace data {

namespace {
const QString AdvanceSecondsKey = QStringLiteral("notify/advanceSeconds");
const QString AlsoNotifyAtDueKey = QStringLiteral("notify/alsoAtDue");
const QString RetentionEnabledKey = QStringLiteral("cleanup/completedRetentionEnabled");
const QString RetentionSecondsKey = QStringLiteral("cleanup/completedRetentionSeconds");
const QString GraceSecondsKey = QStringLiteral("cleanup/pendingDeleteGraceSeconds");
const QString MinIntervalKey = QStringLiteral("scheduler/minIntervalMs");
const QString MaxIntervalKey = QStringLiteral("scheduler/maxIntervalMs");
const QString GuardSecondsKey = QStringLiteral("scheduler/guardSeconds");
const QString AccountsKey = QStringLiteral("lists/accounts");
const QString TaskPresetsKey = QStringLiteral("lists/taskPresets");
const QString SortModeKey = QStringLiteral("ui/sortMode");

constexpr int MaxAdvanceSeconds = 7 * 24 * 3600;
constexpr int MaxIntervalCeilingMs = 60 * 1000;

std::unique_ptr<QSettings> openSettings(const QString &iniPath)
{
    if (iniPath.isEmpty()) {
        return std::make_unique<QSettings>();
    }
    return std::make_unique<QSettings>(iniPath, QSettings::IniFormat);
}
} // namespace

QSettingsStore::QSettingsStore() = default;

QSettingsStore::QSettingsStore(QString iniPath)
    : m_iniPath(std::move(iniPath))
{
}

Settings QSettingsStore::load() const
{
    Settings result;
    const auto settings = openSettings(m_iniPath);
    read(*settings, result);
    return result;
}

bool QSettingsStore::save(const Settings &settings)
{
    const auto store = openSettings(m_iniPath);
    write(*store, settings);
    store->sync();
    if (store->status() != QSettings::NoError) {
        qCWarning(lcReminderData) << "Failed to write settings to" << store->fileName();
        return false;
    }
    return true;
}

void QSettingsStore::read(const QSettings &settings, Settings &out) const
{
    const Settings defaults;
    out.advanceNotifySeconds = qBound(0, settings.value(AdvanceSecondsKey, defaults.advanceNotifySeconds).toInt(),
                                      MaxAdvanceSeconds);
    out.alsoNotifyAtDue = settings.value(AlsoNotifyAtDueKey, defaults.alsoNotifyAtDue).toBool();

    const bool retentionEnabled = settings.value(RetentionEnabledKey, true).toBool();
    if (retentionEnabled) {
        const int seconds = settings.value(RetentionSecondsKey, *defaults.completedRetentionSeconds).toInt();
        out.completedRetentionSeconds = qMax(0, seconds);
    } else {
        out.completedRetentionSeconds = std::nullopt;
    }
    out.pendingDeleteGraceSeconds
        = qMax(0, settings.value(GraceSecondsKey, defaults.pendingDeleteGraceSeconds).toInt());

    out.minIntervalMs = qBound(100, settings.value(MinIntervalKey, defaults.minIntervalMs).toInt(),
                               MaxIntervalCeilingMs);
    out.maxIntervalMs = qBound(out.minIntervalMs, settings.value(MaxIntervalKey, defaults.maxIntervalMs).toInt(),
                               MaxIntervalCeilingMs);
    out.guardSeconds = qBound(0, settings.value(GuardSecondsKey, defaults.guardSeconds).toInt(), 60);

    out.accounts = settings.value(AccountsKey).toStringList();
    out.taskPresets = settings.value(TaskPresetsKey, defaults.taskPresets).toStringList();
    out.sortMode = settings.value(SortModeKey).toString() == QLatin1String("custom") ? SortMode::Custom
                                                                                      : SortMode::ByFinish;
}

void QSettingsStore::write(QSettings &settings, const Settings &in) const
{
    settings.setValue(AdvanceSecondsKey, in.advanceNotifySeconds);
    settings.setValue(AlsoNotifyAtDueKey, in.alsoNotifyAtDue);
    settings.setValue(RetentionEnabledKey, in.completedRetentionSeconds.has_value());
    if (in.completedRetentionSeconds) {
        settings.setValue(RetentionSecondsKey, *in.completedRetentionSeconds);
    }
    settings.setValue(GraceSecondsKey, in.pendingDeleteGraceSeconds);
    settings.setValue(MinIntervalKey, in.minIntervalMs);
    settings.setValue(MaxIntervalKey, in.maxIntervalMs);
    settings.setValue(GuardSecondsKey, in.guardSeconds);
    settings.setValue(AccountsKey, in.accounts);
    settings.setValue(TaskPresetsKey, in.taskPresets);
    settings.setValue(SortModeKey,
                      in.sortMode == SortMode::Custom ? QStringLiteral("custom") : QStringLiteral("finish"));
}

} // namespace data
} // namespace reminder
