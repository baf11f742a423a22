#include "reminder/core/AppContext.hpp"

#include "reminder/core/Clock.hpp"
#include "reminder/core/DeletionPolicy.hpp"
#include "reminder/core/Logging.hpp"
#include "reminder/core/NotificationScheduler.hpp"
#include "reminder/core/TaskBoard.hpp"
#include "reminder/data/DataProvider.hpp"
#include "reminder/data/SettingsStore.hpp"

namespace reminder {
namespace core {

AppContext::AppContext(Notifier &notifier, QString storageFolder)
    : m_dataProvider(std::make_unique<data::DataProvider>(std::move(storageFolder)))
    , m_settings(m_dataProvider->settingsStore().load())
    , m_clock(std::make_unique<SystemClock>())
    , m_deletionPolicy(std::make_unique<SimpleDeletionPolicy>(m_settings.pendingDeleteGraceSeconds,
                                                              m_settings.completedRetentionSeconds))
    , m_taskBoard(std::make_unique<TaskBoard>(m_dataProvider->taskRepository(), *m_deletionPolicy, *m_clock))
    , m_scheduler(std::make_unique<NotificationScheduler>(*m_taskBoard, notifier, *m_clock, m_settings))
{
    m_taskBoard->setSortMode(m_settings.sortMode);
    m_taskBoard->load();
}

AppContext::~AppContext()
{
    m_scheduler->stop();
}

TaskBoard &AppContext::taskBoard()
{
    return *m_taskBoard;
}

NotificationScheduler &AppContext::scheduler()
{
    return *m_scheduler;
}

const Clock &AppContext::clock() const
{
    return *m_clock;
}

void AppContext::updateSettings(const data::Settings &settings)
{
    m_settings = settings;
    applySettings();
    if (!m_dataProvider->settingsStore().save(m_settings)) {
        qCWarning(lcReminderBoard) << "Settings were applied but could not be stored";
    }
}

void AppContext::applySettings()
{
    m_deletionPolicy->setPendingDeleteGraceSeconds(m_settings.pendingDeleteGraceSeconds);
    m_deletionPolicy->setCompletedRetentionSeconds(m_settings.completedRetentionSeconds);
    m_taskBoard->setSortMode(m_settings.sortMode);
}

} // namespace core
} // namespace reminder
