#include "mainwindow.h"
#include "logging.h"
#include "settings.h"

#include <QApplication>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(lcMain, "chansplit.main")

int main(int argc, char *argv[])
{
    QApplication a(argc, argv);
    QApplication::setApplicationName("ChannelSplitter");

    setupLogging(defaultLogPath());

    Settings settings = defaultSettings();
    const QString settingsPath = defaultSettingsPath();
    QString error;
    if (loadSettings(settingsPath, settings, error) != 0) {
        qCCritical(lcMain) << error;
    }

    MainWindow w(settings, settingsPath);
    w.show();

    qCDebug(lcMain) << "Starting the Qt event loop.";
    return a.exec();
}
