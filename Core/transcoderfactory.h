//
// Created by Trixie on 05/03/2026.
//

#ifndef CHANNELSPLITTER_TRANSCODERFACTORY_H
#define CHANNELSPLITTER_TRANSCODERFACTORY_H

#include "ffmpegtools.h"
#include "transcoder.h"

#include <memory>

enum class Backend {
    BACKEND_PROCESS,
    BACKEND_LIBAV
};

bool parseBackend(const QString& name, Backend& backend);

// The process backend looks for ffmpeg/ffprobe on creation.
std::unique_ptr<Transcoder> createTranscoder(Backend backend, const QString& appDir,
                                             const FfmpegTools& overrides = {});

#endif //CHANNELSPLITTER_TRANSCODERFACTORY_H
