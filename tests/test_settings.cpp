#include <gtest/gtest.h>

#include "settings.h"

#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

namespace {

void writeFile(const QString &path, const QByteArray &contents) {
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write(contents);
}

}

TEST(Settings, DefaultsToHomeDirectory) {
    const Settings settings = defaultSettings();
    EXPECT_EQ(settings.lastInputDir, QDir::homePath());
    EXPECT_EQ(settings.lastOutputDir, QDir::homePath());
    EXPECT_EQ(settings.backend, "process");
}

TEST(Settings, MissingFileKeepsDefaults) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    Settings settings = defaultSettings();
    QString error;
    EXPECT_EQ(loadSettings(dir.filePath("config.json"), settings, error), 0);
    EXPECT_TRUE(error.isEmpty());
    EXPECT_EQ(settings.lastInputDir, QDir::homePath());
}

TEST(Settings, SavesAndLoadsLastDirectories) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("config.json");

    Settings saved = defaultSettings();
    saved.lastInputDir = "/projects/sfx/raw";
    saved.lastOutputDir = "/projects/sfx/split";
    saved.backend = "libav";
    QString error;
    ASSERT_EQ(saveSettings(path, saved, error), 0) << error.toStdString();

    Settings loaded = defaultSettings();
    ASSERT_EQ(loadSettings(path, loaded, error), 0) << error.toStdString();
    EXPECT_EQ(loaded.lastInputDir, "/projects/sfx/raw");
    EXPECT_EQ(loaded.lastOutputDir, "/projects/sfx/split");
    EXPECT_EQ(loaded.backend, "libav");
    EXPECT_TRUE(loaded.ffmpegPath.isEmpty());
}

TEST(Settings, WritesExpectedKeys) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("config.json");

    Settings settings = defaultSettings();
    settings.lastInputDir = "/in";
    settings.lastOutputDir = "/out";
    QString error;
    ASSERT_EQ(saveSettings(path, settings, error), 0);

    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::ReadOnly));
    const QJsonObject config = QJsonDocument::fromJson(file.readAll()).object();
    EXPECT_EQ(config.value("last_input_dir").toString(), "/in");
    EXPECT_EQ(config.value("last_output_dir").toString(), "/out");
    EXPECT_FALSE(config.contains("ffmpeg_path"));
}

TEST(Settings, PartialFileOnlyOverridesPresentKeys) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("config.json");
    writeFile(path, R"({"last_output_dir": "/exports", "ffprobe_path": "/opt/ff/ffprobe"})");

    Settings settings = defaultSettings();
    QString error;
    ASSERT_EQ(loadSettings(path, settings, error), 0);
    EXPECT_EQ(settings.lastInputDir, QDir::homePath());
    EXPECT_EQ(settings.lastOutputDir, "/exports");
    EXPECT_EQ(settings.ffprobePath, "/opt/ff/ffprobe");
    EXPECT_EQ(settings.backend, "process");
}

TEST(Settings, CorruptFileIsAnErrorAndChangesNothing) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("config.json");
    writeFile(path, "{ last_input_dir: ");

    Settings settings = defaultSettings();
    QString error;
    EXPECT_NE(loadSettings(path, settings, error), 0);
    EXPECT_TRUE(error.startsWith("Error loading config"));
    EXPECT_EQ(settings.lastInputDir, QDir::homePath());
}

TEST(Settings, UnwritableLocationIsAnError) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    QString error;
    EXPECT_NE(saveSettings(dir.filePath("missing/dir/config.json"), defaultSettings(), error), 0);
    EXPECT_TRUE(error.startsWith("Error saving config"));
}
