#include "reminder/data/DataProvider.hpp"

#include "reminder/core/Logging.hpp"
#include "reminder/data/JsonTaskRepository.hpp"
#include "reminder/data/QSettingsStore.hpp"

#include <QDir>
#include <QStandardPaths>

namespace reminder {
namespace data {

DataProvider::DataProvider(QString storageFolder)
    : m_storageFolder(storageFolder.isEmpty() ? defaultStorageFolder() : std::move(storageFolder))
{
    QDir dir(m_storageFolder);
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        qCWarning(lcReminderData) << "Cannot create storage folder" << m_storageFolder;
    }

    m_taskRepository = std::make_unique<JsonTaskRepository>(dir.filePath(QStringLiteral("tasks.json")));
    m_settingsStore = std::make_unique<QSettingsStore>(dir.filePath(QStringLiteral("settings.ini")));
    qCInfo(lcReminderData) << "Using storage folder" << m_storageFolder;
}

DataProvider::~DataProvider() = default;

TaskRepository &DataProvider::taskRepository()
{
    return *m_taskRepository;
}

SettingsStore &DataProvider::settingsStore()
{
    return *m_settingsStore;
}

QString DataProvider::defaultStorageFolder()
{
    QString folder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (folder.isEmpty()) {
        folder = QDir::homePath() + QStringLiteral("/.local/share/upgrade-reminder");
    }
    return folder;
}

} // namespace data
} // namespace reminder
