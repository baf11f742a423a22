#include <QAbstractItemView>
#include <QAction>
#include <QApplication>
#include <QCoreApplication>
#include <QHeaderView>
#include <QIcon>
#include <QMenu>
#include <QStyle>
#include <QSystemTrayIcon>
#include <QTableView>

#include "version.h"

#include "reminder/core/AppContext.hpp"
#include "reminder/core/NotificationScheduler.hpp"
#include "reminder/core/TaskBoard.hpp"
#include "reminder/ui/TaskListModel.hpp"
#include "reminder/ui/TaskListViewModel.hpp"
#include "reminder/ui/TrayNotifier.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("UpgradeReminder"));
    QCoreApplication::setApplicationName(QStringLiteral("Upgrade Reminder"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kUpgradeReminderVersion));

    QApplication app(argc, argv);
    app.setQuitOnLastWindowClosed(false);
    const QIcon appIcon = app.style()->standardIcon(QStyle::SP_MessageBoxInformation);
    app.setWindowIcon(appIcon);

    QSystemTrayIcon trayIcon(appIcon);
    reminder::ui::TrayNotifier notifier(trayIcon);
    reminder::core::AppContext context(notifier);

    reminder::ui::TaskListViewModel viewModel(context.taskBoard(), context.clock());
    QTableView view;
    view.setModel(viewModel.model());
    view.setSelectionBehavior(QAbstractItemView::SelectRows);
    view.horizontalHeader()->setStretchLastSection(true);
    view.setWindowTitle(QObject::tr("Upgrade Reminder %1").arg(QString::fromLatin1(kUpgradeReminderVersion)));
    view.resize(760, 420);

    QObject::connect(&view, &QTableView::doubleClicked, &view, [&](const QModelIndex &index) {
        if (const auto *task = viewModel.model()->taskAt(index)) {
            context.taskBoard().acknowledge(task->id);
        }
    });
    QObject::connect(&context.scheduler(), &reminder::core::NotificationScheduler::awaitingAcknowledgement, &view,
                     [&view](const QUuid &) {
                         view.show();
                         view.raise();
                     });

    QMenu trayMenu;
    QAction *showAction = trayMenu.addAction(QObject::tr("Show"));
    QAction *quitAction = trayMenu.addAction(QObject::tr("Quit"));
    QObject::connect(showAction, &QAction::triggered, &view, [&view]() {
        view.show();
        view.raise();
    });
    QObject::connect(quitAction, &QAction::triggered, &app, [&context]() {
        context.taskBoard().purge(true);
        QCoreApplication::quit();
    });
    trayIcon.setContextMenu(&trayMenu);
    trayIcon.show();

    viewModel.refresh();
    viewModel.startClock();
    context.scheduler().start();
    view.show();

    return app.exec();
}
