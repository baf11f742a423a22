#include "reminder/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcReminderData, "reminder.data", QtInfoMsg)
Q_LOGGING_CATEGORY(lcReminderBoard, "reminder.board", QtInfoMsg)
Q_LOGGING_CATEGORY(lcReminderRecurrence, "reminder.recurrence", QtInfoMsg)
Q_LOGGING_CATEGORY(lcReminderScheduler, "reminder.scheduler", QtInfoMsg)
