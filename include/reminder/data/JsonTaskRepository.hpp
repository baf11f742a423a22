#pragma once

#include <QJsonObject>
#include <QJsonValue>
#include <QString>

#include "reminder/data/TaskRepository.hpp"

namespace reminder {
namespace data {

// Stores the whole task list as one JSON array (tasks.json).
class JsonTaskRepository : public TaskRepository
{
public:
    explicit JsonTaskRepository(QString filePath);
    ~JsonTaskRepository() override = default;

    std::vector<TaskItem> loadTasks() const override;
    bool saveTasks(const std::vector<TaskItem> &tasks) override;

    const QString &filePath() const { return m_filePath; }

    static QJsonObject taskToJson(const TaskItem &task);
    static TaskItem taskFromJson(const QJsonObject &object);

private:
    static QJsonObject recurrenceToJson(const RecurrenceRule &rule);
    static RecurrenceRule recurrenceFromJson(const QJsonObject &object);
    static QString formatDateTime(const QDateTime &dt);
    static QDateTime parseDateTime(const QJsonValue &value);
    static QString modeToString(RepeatMode mode);
    static RepeatMode modeFromString(const QString &value);

    QString m_filePath;
};

} // namespace data
} // namespace reminder
