#include <QCoreApplication>
#include "cli.h"
#include "logging.h"

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);

    CliOptions options;
    if (parseArguments(argc, argv, options) != 0) {
        return 1;
    }

    setupLogging(defaultLogPath());

    return runBatch(options);
}
