//
// Created by Trixie on 03/03/2026.
//

#ifndef CHANNELSPLITTER_TRANSCODER_H
#define CHANNELSPLITTER_TRANSCODER_H

#include <QMap>
#include <QString>

struct AudioInfo {
    QString path;
    QString codecName;
    int sampleRate = 0;
    int channels = 0;
    int bitsPerSample = 0;  // 0 when the prober could not tell
    QMap<QString, QString> tags;
};

struct ChannelJob {
    QString inputPath;
    QString outputPath;
    int channel = 1;  // 1-based
    int channelCount = 0;  // 0 skips the layout check
    int sampleRate = 0;
    QString codec;
};

// Probes and encodes audio on behalf of the batch splitter.
// Both calls return 0 on success, otherwise non-zero with error filled in.
class Transcoder {
public:
    virtual ~Transcoder() = default;

    virtual QString name() const = 0;
    virtual bool isAvailable(QString& error) const = 0;

    virtual int probe(const QString& path, AudioInfo& info, QString& error) = 0;
    virtual int exportChannel(const ChannelJob& job, QString& error) = 0;
};

#endif //CHANNELSPLITTER_TRANSCODER_H
