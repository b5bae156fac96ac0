//
// Created by Trixie on 05/03/2026.
//

#include "settings.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QSaveFile>

Q_LOGGING_CATEGORY(lcSettings, "chansplit.settings")

Settings defaultSettings() {
    Settings settings;
    settings.lastInputDir = QDir::homePath();
    settings.lastOutputDir = QDir::homePath();
    return settings;
}

QString defaultSettingsPath() {
    return QDir(QCoreApplication::applicationDirPath()).filePath("config.json");
}

int loadSettings(const QString& path, Settings& settings, QString& error) {
    QFile file(path);
    if (!file.exists()) {
        qCDebug(lcSettings) << "No config at" << path << ", using defaults";
        return 0;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        error = QString("Error loading config: %1").arg(file.errorString());
        return 1;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (!doc.isObject()) {
        error = QString("Error loading config: %1").arg(parseError.errorString());
        return 1;
    }

    const QJsonObject config = doc.object();
    settings.lastInputDir = config.value("last_input_dir").toString(settings.lastInputDir);
    settings.lastOutputDir = config.value("last_output_dir").toString(settings.lastOutputDir);
    settings.backend = config.value("backend").toString(settings.backend);
    settings.ffmpegPath = config.value("ffmpeg_path").toString(settings.ffmpegPath);
    settings.ffprobePath = config.value("ffprobe_path").toString(settings.ffprobePath);

    qCDebug(lcSettings).noquote() << "Loaded config:" << doc.toJson(QJsonDocument::Compact);
    return 0;
}

int saveSettings(const QString& path, const Settings& settings, QString& error) {
    QJsonObject config;
    config.insert("last_input_dir", settings.lastInputDir);
    config.insert("last_output_dir", settings.lastOutputDir);
    config.insert("backend", settings.backend);
    if (!settings.ffmpegPath.isEmpty()) {
        config.insert("ffmpeg_path", settings.ffmpegPath);
    }
    if (!settings.ffprobePath.isEmpty()) {
        config.insert("ffprobe_path", settings.ffprobePath);
    }

    const QByteArray json = QJsonDocument(config).toJson(QJsonDocument::Compact);

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        error = QString("Error saving config: %1").arg(file.errorString());
        return 1;
    }
    file.write(json);
    if (!file.commit()) {
        error = QString("Error saving config: %1").arg(file.errorString());
        return 1;
    }

    qCDebug(lcSettings).noquote() << "Saved config:" << json;
    return 0;
}
