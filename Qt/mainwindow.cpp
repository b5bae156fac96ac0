#include "mainwindow.h"
#include "./ui_mainwindow.h"
#include "batchsplitter.h"
#include "transcoderfactory.h"
#include <QCloseEvent>
#include <QCoreApplication>
#include <QDesktopServices>
#include <QFileDialog>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QMessageBox>
#include <QThread>
#include <QTimer>
#include <QUrl>

#include <exception>

Q_LOGGING_CATEGORY(lcWindow, "chansplit.window")

MainWindow::MainWindow(const Settings &settings, const QString &settingsPath, QWidget *parent)
    : QMainWindow(parent)
    , ui(new Ui::MainWindow)
    , settings(settings)
    , settingsPath(settingsPath)
{
    ui->setupUi(this);

    Backend backend;
    if (!parseBackend(settings.backend, backend)) {
        qCWarning(lcWindow) << "Unknown backend" << settings.backend << "in config, using process";
        backend = Backend::BACKEND_PROCESS;
    }
    transcoder = createTranscoder(backend, QCoreApplication::applicationDirPath(),
                                  FfmpegTools{settings.ffmpegPath, settings.ffprobePath});

    QString error;
    if (!transcoder->isAvailable(error)) {
        qCCritical(lcWindow) << error;
    }

    queueTimer = new QTimer(this);
    queueTimer->setInterval(100);
    connect(queueTimer, &QTimer::timeout, this, &MainWindow::processQueue);
    queueTimer->start();
}

MainWindow::~MainWindow()
{
    if (worker) {
        qCInfo(lcWindow) << "Waiting for the running batch to finish";
        worker->wait();
    }
    delete ui;
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    QString error;
    if (saveSettings(settingsPath, settings, error) != 0) {
        qCCritical(lcWindow) << error;
    }
    event->accept();
}

void MainWindow::on_inBrowseButton_clicked()
{
    QString directory = QFileDialog::getExistingDirectory(this, "Select Input Directory", settings.lastInputDir);

    if (!directory.isEmpty()) {
        ui->inDirPath->setText(directory);
        qCDebug(lcWindow) << "Selected input directory:" << directory;
        settings.lastInputDir = directory;
        settings.lastOutputDir = directory;
    }
}

void MainWindow::on_outBrowseButton_clicked()
{
    QString directory = QFileDialog::getExistingDirectory(this, "Select Output Directory", settings.lastOutputDir);

    if (!directory.isEmpty()) {
        ui->outDirPath->setText(directory);
        qCDebug(lcWindow) << "Selected output directory:" << directory;
        settings.lastOutputDir = directory;
        settings.lastInputDir = directory;
    }
}

void MainWindow::on_splitButton_clicked()
{
    const QString inputDir = ui->inDirPath->text().trimmed();
    const QString outputDir = ui->outDirPath->text().trimmed();
    qCDebug(lcWindow) << "Input Directory:" << inputDir;
    qCDebug(lcWindow) << "Output Directory:" << outputDir;

    if (inputDir.isEmpty() || outputDir.isEmpty()) {
        qCCritical(lcWindow) << "Input or output directory not selected.";
        QMessageBox::critical(this, "Error", "Please select both input and output directories.");
        return;
    }

    ui->splitButton->setEnabled(false);
    ui->progressBar->setValue(0);

    NotificationQueue *messages = &queue;
    Transcoder *active = transcoder.get();

    worker = QThread::create([messages, active, inputDir, outputDir]() {
        try {
            BatchSplitter splitter(*active, [messages](const Notification &n) { messages->push(n); });
            splitter.run(inputDir, outputDir);
        } catch (const std::exception &e) {
            qCCritical(lcWindow) << "An unexpected error occurred in the worker:" << e.what();
            messages->push(Notification::error("Error", QString("An unexpected error occurred:\n%1").arg(QString::fromLocal8Bit(e.what()))));
        }
        messages->push(Notification::finished());
    });
    connect(worker, &QThread::finished, worker, &QObject::deleteLater);
    worker->start();
}

void MainWindow::on_openOutputButton_clicked()
{
    const QString outputDir = ui->outDirPath->text().trimmed();

    if (!QFileInfo(outputDir).isDir() || !QDesktopServices::openUrl(QUrl::fromLocalFile(outputDir))) {
        qCCritical(lcWindow) << "Failed to open output directory" << outputDir;
        QMessageBox::critical(this, "Error", QString("Failed to open output directory:\n%1").arg(outputDir));
        return;
    }
    qCDebug(lcWindow) << "Opened output directory:" << outputDir;
}

void MainWindow::processQueue()
{
    // Message boxes spin their own event loop; keep this from re-entering.
    queueTimer->stop();
    for (const Notification &notification : queue.drain()) {
        handle(notification);
    }
    queueTimer->start();
}

void MainWindow::handle(const Notification &notification)
{
    switch (notification.kind) {
    case Notification::Kind::Progress:
        ui->progressBar->setValue(notification.percent);
        break;
    case Notification::Kind::Info:
        QMessageBox::information(this, notification.title, notification.message);
        ui->openOutputButton->setEnabled(true);
        break;
    case Notification::Kind::Error:
        QMessageBox::critical(this, notification.title, notification.message);
        break;
    case Notification::Kind::Finished:
        ui->splitButton->setEnabled(true);
        break;
    }
}
