#ifndef CHANNELSPLITTER_MAINWINDOW_H
#define CHANNELSPLITTER_MAINWINDOW_H

#include <QMainWindow>
#include <QPointer>
#include <QThread>

#include <memory>

#include "notification.h"
#include "settings.h"
#include "transcoder.h"

QT_BEGIN_NAMESPACE
namespace Ui {
class MainWindow;
}
QT_END_NAMESPACE

class QTimer;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    MainWindow(const Settings &settings, const QString &settingsPath, QWidget *parent = nullptr);
    ~MainWindow();

protected:
    void closeEvent(QCloseEvent *event) override;

private slots:
    void on_inBrowseButton_clicked();
    void on_outBrowseButton_clicked();
    void on_splitButton_clicked();
    void on_openOutputButton_clicked();

    void processQueue();

private:
    void handle(const Notification &notification);

    Ui::MainWindow *ui;
    Settings settings;
    QString settingsPath;
    std::unique_ptr<Transcoder> transcoder;
    NotificationQueue queue;
    QTimer *queueTimer = nullptr;
    QPointer<QThread> worker;
};

#endif // CHANNELSPLITTER_MAINWINDOW_H
