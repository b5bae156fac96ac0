//
// Created by Trixie on 03/03/2026.
//

#include "ffmpegtools.h"

#include <QDir>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QStandardPaths>

Q_LOGGING_CATEGORY(lcTools, "chansplit.tools")

namespace {

QString executableName(const QString& tool) {
#ifdef Q_OS_WIN
    return tool + ".exe";
#else
    return tool;
#endif
}

bool isExecutableFile(const QString& path) {
    QFileInfo info(path);
    return info.isFile() && info.isExecutable();
}

QString locateTool(const QString& tool, const QString& appDir, const QString& override,
                   const QStringList& extraLocations, bool searchPath) {
    if (!override.isEmpty()) {
        if (isExecutableFile(override)) {
            qCDebug(lcTools) << "Using configured" << tool << "at" << override;
            return override;
        }
        qCWarning(lcTools) << "Configured" << tool << "path is not executable:" << override;
    }

    const QString exe = executableName(tool);

    if (!appDir.isEmpty()) {
        const QString bundled = QDir(appDir).filePath("ffmpeg/" + exe);
        if (isExecutableFile(bundled)) {
            qCDebug(lcTools) << "Found" << tool << "in app directory:" << bundled;
            return bundled;
        }
    }

    if (searchPath) {
        const QString onPath = QStandardPaths::findExecutable(exe);
        if (!onPath.isEmpty()) {
            qCDebug(lcTools) << "Found" << tool << "on PATH:" << onPath;
            return onPath;
        }
    }

    for (const QString& dir : extraLocations) {
        const QString candidate = QDir(dir).filePath(exe);
        if (isExecutableFile(candidate)) {
            qCDebug(lcTools) << "Found" << tool << "in possible location:" << candidate;
            return candidate;
        }
    }

    return {};
}

}

QStringList defaultToolLocations() {
    return {
        "/usr/local/bin",
        "/opt/homebrew/bin",
        "/usr/bin",
        "/usr/local/ffmpeg/bin",
    };
}

FfmpegTools locateFfmpegTools(const QString& appDir, const FfmpegTools& overrides,
                              const QStringList& extraLocations, bool searchPath) {
    FfmpegTools tools;
    tools.ffmpeg = locateTool("ffmpeg", appDir, overrides.ffmpeg, extraLocations, searchPath);
    tools.ffprobe = locateTool("ffprobe", appDir, overrides.ffprobe, extraLocations, searchPath);

    if (tools.ffmpeg.isEmpty()) {
        qCCritical(lcTools) << "FFmpeg not found.";
    } else {
        qCInfo(lcTools) << "Using FFmpeg at:" << tools.ffmpeg;
    }

    if (tools.ffprobe.isEmpty()) {
        qCCritical(lcTools) << "FFprobe not found.";
    } else {
        qCInfo(lcTools) << "Using FFprobe at:" << tools.ffprobe;
    }

    return tools;
}
