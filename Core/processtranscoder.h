//
// Created by Trixie on 04/03/2026.
//

#ifndef CHANNELSPLITTER_PROCESSTRANSCODER_H
#define CHANNELSPLITTER_PROCESSTRANSCODER_H

#include "ffmpegtools.h"
#include "transcoder.h"

#include <QByteArray>
#include <QStringList>

// Runs the ffprobe and ffmpeg executables for every probe and export.
class ProcessTranscoder : public Transcoder {
public:
    explicit ProcessTranscoder(FfmpegTools tools);

    QString name() const override { return "ffmpeg"; }
    bool isAvailable(QString& error) const override;

    int probe(const QString& path, AudioInfo& info, QString& error) override;
    int exportChannel(const ChannelJob& job, QString& error) override;

    void setProbeTimeout(int msecs) { probeTimeoutMs = msecs; }
    void setExportTimeout(int msecs) { exportTimeoutMs = msecs; }

    static QStringList probeArguments(const QString& path);
    static QStringList exportArguments(const ChannelJob& job);
    static int parseProbeOutput(const QByteArray& json, AudioInfo& info, QString& error);

private:
    int run(const QString& program, const QStringList& args, int timeoutMs,
            QByteArray& output, QString& error) const;

    FfmpegTools tools;
    int probeTimeoutMs = 30000;
    int exportTimeoutMs = -1;
};

#endif //CHANNELSPLITTER_PROCESSTRANSCODER_H
