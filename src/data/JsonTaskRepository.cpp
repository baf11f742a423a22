#include "reminder/data/JsonTaskRepository.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>

#include "reminder/core/Logging.hpp"

namespace reminder {
namespace data {

namespace {
QString prepareUid(const QUuid &id)
{
    return id.toString(QUuid::WithoutBraces);
}

QUuid parseUid(const QString &value)
{
    const QString withBraces = QStringLiteral("{%1}").arg(value);
    QUuid id(withBraces);
    if (id.isNull()) {
        return QUuid::createUuid();
    }
    return id;
}
} // namespace

JsonTaskRepository::JsonTaskRepository(QString filePath)
    : m_filePath(std::move(filePath))
{
}

std::vector<TaskItem> JsonTaskRepository::loadTasks() const
{
    std::vector<TaskItem> result;

    QFile file(m_filePath);
    if (!file.exists()) {
        return result;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcReminderData) << "Cannot open" << m_filePath << ":" << file.errorString();
        return result;
    }

    QJsonParseError error;
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &error);
    if (error.error != QJsonParseError::NoError) {
        qCWarning(lcReminderData) << "Malformed task file" << m_filePath << ":" << error.errorString();
        return result;
    }
    if (!document.isArray()) {
        qCWarning(lcReminderData) << "Task file" << m_filePath << "does not hold a list";
        return result;
    }

    const QJsonArray array = document.array();
    result.reserve(static_cast<size_t>(array.size()));
    for (const QJsonValue &value : array) {
        if (!value.isObject()) {
            continue;
        }
        result.push_back(taskFromJson(value.toObject()));
    }
    qCDebug(lcReminderData) << "Loaded" << result.size() << "tasks from" << m_filePath;
    return result;
}

bool JsonTaskRepository::saveTasks(const std::vector<TaskItem> &tasks)
{
    if (m_filePath.isEmpty()) {
        return false;
    }

    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }

    QJsonArray array;
    for (const TaskItem &task : tasks) {
        array.append(taskToJson(task));
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qCWarning(lcReminderData) << "Cannot write" << m_filePath << ":" << file.errorString();
        return false;
    }
    file.write(QJsonDocument(array).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qCWarning(lcReminderData) << "Failed to commit" << m_filePath << ":" << file.errorString();
        return false;
    }
    return true;
}

QJsonObject JsonTaskRepository::taskToJson(const TaskItem &task)
{
    QJsonObject object;
    object.insert(QStringLiteral("id"), prepareUid(task.id));
    object.insert(QStringLiteral("account"), task.account);
    object.insert(QStringLiteral("taskName"), task.name);
    if (task.start.isValid()) {
        object.insert(QStringLiteral("start"), formatDateTime(task.start));
    }
    object.insert(QStringLiteral("days"), task.days);
    object.insert(QStringLiteral("hours"), task.hours);
    object.insert(QStringLiteral("minutes"), task.minutes);
    object.insert(QStringLiteral("finish"), formatDateTime(task.finish));
    object.insert(QStringLiteral("notified"), task.notified);
    object.insert(QStringLiteral("advanceNotified"), task.advanceNotified);
    object.insert(QStringLiteral("done"), task.done);
    if (task.completedTime.isValid()) {
        object.insert(QStringLiteral("completedTime"), formatDateTime(task.completedTime));
    }
    object.insert(QStringLiteral("pendingDelete"), task.pendingDelete);
    if (task.deleteMarkTime.isValid()) {
        object.insert(QStringLiteral("deleteMarkTime"), formatDateTime(task.deleteMarkTime));
    }
    if (task.isRepeating()) {
        object.insert(QStringLiteral("repeat"), recurrenceToJson(task.recurrence));
        object.insert(QStringLiteral("repeatCursor"), task.cursor.occurrences);
        object.insert(QStringLiteral("repeatNotifyCount"), task.cursor.notifications);
        object.insert(QStringLiteral("awaitingAck"), task.awaitingAck);
        object.insert(QStringLiteral("repeatExpired"), task.expired);
    }
    return object;
}

TaskItem JsonTaskRepository::taskFromJson(const QJsonObject &object)
{
    TaskItem task;
    task.id = parseUid(object.value(QStringLiteral("id")).toString());
    const QString account = object.value(QStringLiteral("account")).toString();
    if (!account.trimmed().isEmpty()) {
        task.account = account;
    }
    const QString name = object.value(QStringLiteral("taskName")).toString();
    if (!name.trimmed().isEmpty()) {
        task.name = name;
    }
    task.start = parseDateTime(object.value(QStringLiteral("start")));
    task.days = qMax(0, object.value(QStringLiteral("days")).toInt());
    task.hours = qMax(0, object.value(QStringLiteral("hours")).toInt());
    task.minutes = qMax(0, object.value(QStringLiteral("minutes")).toInt());
    task.finish = parseDateTime(object.value(QStringLiteral("finish")));
    if (!task.finish.isValid() && task.start.isValid()) {
        task.recalculateFinish(task.start);
    }
    task.notified = object.value(QStringLiteral("notified")).toBool();
    task.advanceNotified = object.value(QStringLiteral("advanceNotified")).toBool();
    task.done = object.value(QStringLiteral("done")).toBool();
    task.completedTime = parseDateTime(object.value(QStringLiteral("completedTime")));
    task.pendingDelete = object.value(QStringLiteral("pendingDelete")).toBool();
    task.deleteMarkTime = parseDateTime(object.value(QStringLiteral("deleteMarkTime")));

    const QJsonValue repeat = object.value(QStringLiteral("repeat"));
    if (repeat.isObject()) {
        task.recurrence = recurrenceFromJson(repeat.toObject());
    }
    if (task.isRepeating()) {
        const int occurrences = qMax(0, object.value(QStringLiteral("repeatCursor")).toInt());
        const int notifications = object.value(QStringLiteral("repeatNotifyCount")).toInt();
        task.cursor.occurrences = occurrences;
        task.cursor.notifications = qBound(0, notifications, occurrences);
        task.awaitingAck = object.value(QStringLiteral("awaitingAck")).toBool();
        task.expired = object.value(QStringLiteral("repeatExpired")).toBool();
    }
    return task;
}

QJsonObject JsonTaskRepository::recurrenceToJson(const RecurrenceRule &rule)
{
    QJsonObject object;
    object.insert(QStringLiteral("mode"), modeToString(rule.mode()));
    if (const auto period = rule.customPeriod()) {
        QJsonObject custom;
        custom.insert(QStringLiteral("years"), period->years);
        custom.insert(QStringLiteral("months"), period->months);
        custom.insert(QStringLiteral("days"), period->days);
        custom.insert(QStringLiteral("hours"), period->hours);
        custom.insert(QStringLiteral("minutes"), period->minutes);
        custom.insert(QStringLiteral("seconds"), period->seconds);
        object.insert(QStringLiteral("custom"), custom);
    }
    if (rule.hasEnd()) {
        object.insert(QStringLiteral("endAt"), formatDateTime(rule.endAt()));
    }
    if (const auto &skip = rule.skip()) {
        QJsonObject skipObject;
        skipObject.insert(QStringLiteral("remindTimes"), skip->remindEvery);
        skipObject.insert(QStringLiteral("skipTimes"), skip->skipCount);
        object.insert(QStringLiteral("skip"), skipObject);
    }
    object.insert(QStringLiteral("pauseUntilDone"), rule.pauseUntilAck());
    object.insert(QStringLiteral("offsetAfterSeconds"), rule.offsetAfterSeconds());
    return object;
}

RecurrenceRule JsonTaskRepository::recurrenceFromJson(const QJsonObject &object)
{
    const RepeatMode mode = modeFromString(object.value(QStringLiteral("mode")).toString());
    RecurrenceRule rule;
    if (mode == RepeatMode::Custom) {
        const QJsonObject custom = object.value(QStringLiteral("custom")).toObject();
        CustomPeriod period;
        period.years = custom.value(QStringLiteral("years")).toInt();
        period.months = custom.value(QStringLiteral("months")).toInt();
        period.days = custom.value(QStringLiteral("days")).toInt();
        period.hours = custom.value(QStringLiteral("hours")).toInt();
        period.minutes = custom.value(QStringLiteral("minutes")).toInt();
        period.seconds = custom.value(QStringLiteral("seconds")).toInt();
        rule = RecurrenceRule::custom(period);
    } else {
        rule = RecurrenceRule::preset(mode);
    }
    if (!rule.isRepeating()) {
        return rule;
    }

    rule.setEndAt(parseDateTime(object.value(QStringLiteral("endAt"))));
    const QJsonObject skip = object.value(QStringLiteral("skip")).toObject();
    rule.setSkip(skip.value(QStringLiteral("remindTimes")).toInt(), skip.value(QStringLiteral("skipTimes")).toInt());
    rule.setPauseUntilAck(object.value(QStringLiteral("pauseUntilDone")).toBool());
    rule.setOffsetAfterSeconds(object.value(QStringLiteral("offsetAfterSeconds")).toInt());
    return rule;
}

QString JsonTaskRepository::formatDateTime(const QDateTime &dt)
{
    if (!dt.isValid()) {
        return {};
    }
    return dt.toString(Qt::ISODate);
}

QDateTime JsonTaskRepository::parseDateTime(const QJsonValue &value)
{
    if (!value.isString()) {
        return {};
    }
    return QDateTime::fromString(value.toString(), Qt::ISODate);
}

QString JsonTaskRepository::modeToString(RepeatMode mode)
{
    switch (mode) {
    case RepeatMode::Daily:
        return QStringLiteral("daily");
    case RepeatMode::Weekly:
        return QStringLiteral("weekly");
    case RepeatMode::Monthly:
        return QStringLiteral("monthly");
    case RepeatMode::Yearly:
        return QStringLiteral("yearly");
    case RepeatMode::Custom:
        return QStringLiteral("custom");
    case RepeatMode::None:
        break;
    }
    return QStringLiteral("none");
}

RepeatMode JsonTaskRepository::modeFromString(const QString &value)
{
    const QString lower = value.toLower();
    if (lower == QLatin1String("daily")) {
        return RepeatMode::Daily;
    }
    if (lower == QLatin1String("weekly")) {
        return RepeatMode::Weekly;
    }
    if (lower == QLatin1String("monthly")) {
        return RepeatMode::Monthly;
    }
    if (lower == QLatin1String("yearly")) {
        return RepeatMode::Yearly;
    }
    if (lower == QLatin1String("custom")) {
        return RepeatMode::Custom;
    }
    return RepeatMode::None;
}

} // namespace data
} // namespace reminder
