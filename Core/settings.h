//
// Created by Trixie on 05/03/2026.
//

#ifndef CHANNELSPLITTER_SETTINGS_H
#define CHANNELSPLITTER_SETTINGS_H

#include <QString>

// Persisted as config.json beside the executable.
struct Settings {
    QString lastInputDir;
    QString lastOutputDir;
    QString backend = "process";
    QString ffmpegPath;
    QString ffprobePath;
};

Settings defaultSettings();
QString defaultSettingsPath();

// A missing file is not an error; settings keep their current values.
int loadSettings(const QString& path, Settings& settings, QString& error);
int saveSettings(const QString& path, const Settings& settings, QString& error);

#endif //CHANNELSPLITTER_SETTINGS_H
