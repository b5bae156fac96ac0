//
// Created by Trixie on 03/03/2026.
//

#ifndef CHANNELSPLITTER_FFMPEGTOOLS_H
#define CHANNELSPLITTER_FFMPEGTOOLS_H

#include <QString>
#include <QStringList>

struct FfmpegTools {
    QString ffmpeg;
    QString ffprobe;

    bool isComplete() const { return !ffmpeg.isEmpty() && !ffprobe.isEmpty(); }
};

QStringList defaultToolLocations();

// Search order per binary: override, <appDir>/ffmpeg, PATH, then extraLocations.
FfmpegTools locateFfmpegTools(const QString& appDir,
                              const FfmpegTools& overrides = {},
                              const QStringList& extraLocations = defaultToolLocations(),
                              bool searchPath = true);

#endif //CHANNELSPLITTER_FFMPEGTOOLS_H
