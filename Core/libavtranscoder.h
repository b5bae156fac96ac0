//
// Created by Trixie on 12/02/2026.
//

#ifndef CHANNELSPLITTER_LIBAVTRANSCODER_H
#define CHANNELSPLITTER_LIBAVTRANSCODER_H

#include "transcoder.h"

// Probes and splits in-process with libavformat/libavcodec/libswresample.
class LibavTranscoder : public Transcoder {
public:
    QString name() const override { return "libav"; }
    bool isAvailable(QString&) const override { return true; }

    int probe(const QString& path, AudioInfo& info, QString& error) override;
    int exportChannel(const ChannelJob& job, QString& error) override;
};

#endif //CHANNELSPLITTER_LIBAVTRANSCODER_H
