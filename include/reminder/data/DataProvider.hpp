#pragma once

#include <memory>
#include <QString>

namespace reminder {
namespace data {

class TaskRepository;
class SettingsStore;

class DataProvider
{
public:
    // An empty folder resolves to the per-user application data location.
    explicit DataProvider(QString storageFolder = QString());
    ~DataProvider();

    TaskRepository &taskRepository();
    SettingsStore &settingsStore();
    const QString &storageFolder() const { return m_storageFolder; }

private:
    static QString defaultStorageFolder();

    QString m_storageFolder;
    std::unique_ptr<TaskRepository> m_taskRepository;
    std::unique_ptr<SettingsStore> m_settingsStore;
};

} // namespace data
} // namespace reminder
