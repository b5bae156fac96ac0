//
// Created by Trixie on 05/03/2026.
//

#include "transcoderfactory.h"
#include "libavtranscoder.h"
#include "processtranscoder.h"

bool parseBackend(const QString& name, Backend& backend) {
    if (name.isEmpty() || name == "process") {
        backend = Backend::BACKEND_PROCESS;
    } else if (name == "libav") {
        backend = Backend::BACKEND_LIBAV;
    } else {
        return false;
    }
    return true;
}

std::unique_ptr<Transcoder> createTranscoder(Backend backend, const QString& appDir,
                                             const FfmpegTools& overrides) {
    if (backend == Backend::BACKEND_LIBAV) {
        return std::make_unique<LibavTranscoder>();
    }
    return std::make_unique<ProcessTranscoder>(locateFfmpegTools(appDir, overrides));
}
