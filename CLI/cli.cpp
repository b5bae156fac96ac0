//
// Created by Trixie on 19/10/2026.
//

#include <iostream>
#include <string>
#include <QCoreApplication>
#include "batchsplitter.h"
#include "cli.h"

namespace {

void usage() {
    std::cerr << "Usage: chansplit-cli <input_dir> <output_dir> [--backend process|libav]"
                 " [--ffmpeg <path>] [--ffprobe <path>]\n";
}

}

int parseArguments(int argc, char** argv, CliOptions& options) {
    if (argc < 3) {
        usage();
        return 1;
    }

    options.inputDir = QString::fromLocal8Bit(argv[1]);
    options.outputDir = QString::fromLocal8Bit(argv[2]);

    for (int i = 3; i < argc; i++) {
        std::string option = argv[i];

        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << option << "\n";
            usage();
            return 1;
        }
        const QString value = QString::fromLocal8Bit(argv[++i]);

        if (option == "--backend") {
            if (!parseBackend(value, options.backend)) {
                std::cerr << "Unknown backend parameter: " << value.toStdString() << "\n";
                return 1;
            }
        } else if (option == "--ffmpeg") {
            options.overrides.ffmpeg = value;
        } else if (option == "--ffprobe") {
            options.overrides.ffprobe = value;
        } else {
            std::cerr << "Unknown parameter: " << option << "\n";
            usage();
            return 1;
        }
    }

    return 0;
}

int runBatch(const CliOptions& options) {
    auto transcoder = createTranscoder(options.backend, QCoreApplication::applicationDirPath(),
                                       options.overrides);

    BatchSplitter splitter(*transcoder, [](const Notification& n) {
        switch (n.kind) {
        case Notification::Kind::Progress:
            std::cout << "Progress: " << n.percent << "%\n";
            break;
        case Notification::Kind::Info:
            std::cout << n.message.toStdString() << "\n";
            break;
        case Notification::Kind::Error:
            std::cerr << n.title.toStdString() << ": " << n.message.toStdString() << "\n";
            break;
        case Notification::Kind::Finished:
            break;
        }
    });

    const BatchReport report = splitter.run(options.inputDir, options.outputDir);
    return report.succeeded() ? 0 : 1;
}
