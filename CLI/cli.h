//
// Created by Trixie on 19/10/2026.
//

#ifndef CHANNELSPLITTER_CLI_H
#define CHANNELSPLITTER_CLI_H

#include <QString>

#include "ffmpegtools.h"
#include "transcoderfactory.h"

struct CliOptions {
    QString inputDir;
    QString outputDir;
    Backend backend = Backend::BACKEND_PROCESS;
    FfmpegTools overrides;
};

// Both return the process exit status: 0 on success, 1 otherwise.
int parseArguments(int argc, char** argv, CliOptions& options);
int runBatch(const CliOptions& options);

#endif //CHANNELSPLITTER_CLI_H
