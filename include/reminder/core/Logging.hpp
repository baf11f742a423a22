#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcReminderData)
Q_DECLARE_LOGGING_CATEGORY(lcReminderBoard)
Q_DECLARE_LOGGING_CATEGORY(lcReminderRecurrence)
Q_DECLARE_LOGGING_CATEGORY(lcReminderScheduler)
