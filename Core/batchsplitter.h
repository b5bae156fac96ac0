//
// Created by Trixie on 05/03/2026.
//

#ifndef CHANNELSPLITTER_BATCHSPLITTER_H
#define CHANNELSPLITTER_BATCHSPLITTER_H

#include "notification.h"
#include "transcoder.h"

#include <QString>
#include <QStringList>

#include <functional>

struct BatchReport {
    int filesFound = 0;
    int filesSplit = 0;
    int filesFailed = 0;
    QStringList outputs;
    bool aborted = false;

    bool succeeded() const { return !aborted && filesFailed == 0; }
};

// Splits every .wav file of a directory into one mono file per channel.
// Runs synchronously; the caller decides which thread that is.
class BatchSplitter {
public:
    using Sink = std::function<void(const Notification&)>;

    BatchSplitter(Transcoder& transcoder, Sink sink);

    BatchReport run(const QString& inputDir, const QString& outputDir);

    static QStringList findWavFiles(const QString& dir);
    static QString channelOutputName(const QString& inputFile, int channel);

private:
    bool splitFile(const QString& inputFile, const QString& outputDir, BatchReport& report);
    void abort(BatchReport& report, const QString& message);
    void fail(const QString& message);

    Transcoder& transcoder;
    Sink sink;
};

#endif //CHANNELSPLITTER_BATCHSPLITTER_H
