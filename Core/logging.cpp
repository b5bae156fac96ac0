//
// Created by Trixie on 05/03/2026.
//

#include "logging.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QLoggingCategory>
#include <QMutex>
#include <QMutexLocker>
#include <QTextStream>

#include <cstdio>

Q_LOGGING_CATEGORY(lcApp, "chansplit.app")

namespace {

QMutex logMutex;
QFile* logFile = nullptr;

const char* levelName(QtMsgType type) {
    switch (type) {
    case QtDebugMsg:
        return "DEBUG";
    case QtInfoMsg:
        return "INFO";
    case QtWarningMsg:
        return "WARNING";
    case QtCriticalMsg:
        return "ERROR";
    case QtFatalMsg:
        return "CRITICAL";
    }
    return "INFO";
}

void writeMessage(QtMsgType type, const QMessageLogContext&, const QString& msg) {
    const QString line = QString("%1 - %2 - %3\n")
                             .arg(QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss,zzz"),
                                  QString::fromLatin1(levelName(type)),
                                  msg);
    const QByteArray bytes = line.toLocal8Bit();

    QMutexLocker locker(&logMutex);
    std::fwrite(bytes.constData(), 1, bytes.size(), stdout);
    std::fflush(stdout);

    if (logFile) {
        logFile->write(bytes);
        logFile->flush();
    }
}

}

QString defaultLogPath() {
    return QDir(QCoreApplication::applicationDirPath()).filePath("app.log");
}

void setupLogging(const QString& logFilePath) {
    QLoggingCategory::setFilterRules("chansplit.*.debug=true");

    QString openError;
    {
        QMutexLocker locker(&logMutex);
        delete logFile;
        logFile = nullptr;

        auto* file = new QFile(logFilePath);
        if (file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            logFile = file;
        } else {
            openError = file->errorString();
            delete file;
        }
    }

    qInstallMessageHandler(writeMessage);

    if (!openError.isEmpty()) {
        qCCritical(lcApp) << "Failed to set up logging to file" << logFilePath << ":" << openError;
    }
}
