#pragma once

#include <QString>
#include <memory>

#include "reminder/data/Settings.hpp"

namespace reminder {
namespace data {
class DataProvider;
}

namespace core {

class Clock;
class Notifier;
class NotificationScheduler;
class SimpleDeletionPolicy;
class TaskBoard;

class AppContext
{
public:
    explicit AppContext(Notifier &notifier, QString storageFolder = QString());
    ~AppContext();

    TaskBoard &taskBoard();
    NotificationScheduler &scheduler();
    const Clock &clock() const;
    const data::Settings &settings() const { return m_settings; }
    void updateSettings(const data::Settings &settings);

private:
    void applySettings();

    std::unique_ptr<data::DataProvider> m_dataProvider;
    data::Settings m_settings;
    std::unique_ptr<Clock> m_clock;
    std::unique_ptr<SimpleDeletionPolicy> m_deletionPolicy;
    std::unique_ptr<TaskBoard> m_taskBoard;
    std::unique_ptr<NotificationScheduler> m_scheduler;
};

} // namespace core
} // namespace reminder
