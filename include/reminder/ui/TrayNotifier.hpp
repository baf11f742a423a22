#pragma once

#include "reminder/core/Notifier.hpp"

class QSystemTrayIcon;

namespace reminder {
namespace ui {

class TrayNotifier : public core::Notifier
{
public:
    explicit TrayNotifier(QSystemTrayIcon &trayIcon, int timeoutMs = 3000);

    void notify(const QString &title, const QString &body) override;

private:
    QSystemTrayIcon &m_trayIcon;
    int m_timeoutMs;
};

} // namespace ui
} // namespace reminder
