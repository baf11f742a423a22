#include "reminder/ui/TrayNotifier.hpp"

#include <QSystemTrayIcon>

#include "reminder/core/Logging.hpp"

namespace reminder {
namespace ui {

TrayNotifier::TrayNotifier(QSystemTrayIcon &trayIcon, int timeoutMs)
    : m_trayIcon(trayIcon)
    , m_timeoutMs(timeoutMs)
{
}

void TrayNotifier::notify(const QString &title, const QString &body)
{
    if (!QSystemTrayIcon::supportsMessages() || !m_trayIcon.isVisible()) {
        qCInfo(lcReminderScheduler).noquote() << title << "-" << body;
        return;
    }
    m_trayIcon.showMessage(title, body, QSystemTrayIcon::Information, m_timeoutMs);
}

} // namespace ui
} // namespace reminder
