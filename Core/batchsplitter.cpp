//
// Created by Trixie on 05/03/2026.
//

#include "batchsplitter.h"
#include "pcmformat.h"

#include <QDir>
#include <QFileInfo>
#include <QLoggingCategory>

#include <utility>

Q_LOGGING_CATEGORY(lcBatch, "chansplit.batch")

BatchSplitter::BatchSplitter(Transcoder& transcoder, Sink sink)
    : transcoder(transcoder), sink(std::move(sink)) {
}

QStringList BatchSplitter::findWavFiles(const QString& dir) {
    QDir input(dir);
    input.setNameFilters({"*.wav"});
    input.setFilter(QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot);
    input.setSorting(QDir::Name);

    QStringList files;
    for (const QFileInfo& entry : input.entryInfoList()) {
        files.append(entry.absoluteFilePath());
    }
    return files;
}

QString BatchSplitter::channelOutputName(const QString& inputFile, int channel) {
    return QString("%1_chan%2.wav").arg(QFileInfo(inputFile).completeBaseName(), QString::number(channel));
}

void BatchSplitter::fail(const QString& message) {
    qCCritical(lcBatch).noquote() << message;
    sink(Notification::error("Error", message));
}

void BatchSplitter::abort(BatchReport& report, const QString& message) {
    report.aborted = true;
    fail(message);
}

BatchReport BatchSplitter::run(const QString& inputDir, const QString& outputDir) {
    BatchReport report;
    qCDebug(lcBatch) << "Splitting" << inputDir << "into" << outputDir << "with" << transcoder.name();

    QString error;
    if (!transcoder.isAvailable(error)) {
        abort(report, error);
        return report;
    }

    if (!QFileInfo(inputDir).isDir()) {
        abort(report, QString("Input directory '%1' does not exist.").arg(inputDir));
        return report;
    }

    const QStringList wavFiles = findWavFiles(inputDir);
    if (wavFiles.isEmpty()) {
        abort(report, QString("No .wav files found in directory '%1'.").arg(inputDir));
        return report;
    }

    if (!QDir().mkpath(outputDir)) {
        abort(report, QString("Could not create output directory '%1'.").arg(outputDir));
        return report;
    }
    qCDebug(lcBatch) << "Output directory" << outputDir << "is ready.";

    report.filesFound = wavFiles.size();
    qCInfo(lcBatch) << "Found" << report.filesFound << ".wav file(s) to process.";
    sink(Notification::progress(0));

    for (int i = 0; i < wavFiles.size(); ++i) {
        if (splitFile(wavFiles.at(i), outputDir, report)) {
            report.filesSplit++;
        } else {
            report.filesFailed++;
        }
        sink(Notification::progress((i + 1) * 100 / wavFiles.size()));
    }

    sink(Notification::progress(100));
    qCInfo(lcBatch) << "Split" << report.filesSplit << "of" << report.filesFound << "file(s),"
                    << report.outputs.size() << "output(s) written.";

    sink(Notification::info(
        "Success",
        QString("Audio files have been successfully split.\nOutput Directory: %1").arg(outputDir)));
    return report;
}

bool BatchSplitter::splitFile(const QString& inputFile, const QString& outputDir, BatchReport& report) {
    const QString fileName = QFileInfo(inputFile).fileName();
    qCInfo(lcBatch) << "Processing file:" << inputFile;

    AudioInfo info;
    QString error;
    if (transcoder.probe(inputFile, info, error) != 0) {
        fail(QString("Error loading audio file '%1': %2").arg(inputFile, error));
        return false;
    }

    if (info.bitsPerSample <= 0) {
        fail(QString("Could not determine bit depth of '%1'").arg(fileName));
        return false;
    }

    const auto format = pcmFormatForBits(info.bitsPerSample);
    if (!format) {
        fail(QString("Unsupported bit depth: %1 bits in '%2'").arg(QString::number(info.bitsPerSample), fileName));
        return false;
    }

    qCInfo(lcBatch) << "Original sample rate:" << info.sampleRate << "Hz";
    qCInfo(lcBatch) << "Original bit depth:" << info.bitsPerSample << "bits";
    qCInfo(lcBatch) << "Number of channels in" << fileName << ":" << info.channels;

    const QDir output(outputDir);
    bool allWritten = true;

    for (int channel = 1; channel <= info.channels; ++channel) {
        ChannelJob job;
        job.inputPath = inputFile;
        job.outputPath = output.filePath(channelOutputName(inputFile, channel));
        job.channel = channel;
        job.channelCount = info.channels;
        job.sampleRate = info.sampleRate;
        job.codec = QString::fromStdString(format->codec);

        qCDebug(lcBatch) << "Using codec" << job.codec << "for channel" << channel
                         << "at" << job.sampleRate << "Hz";

        if (transcoder.exportChannel(job, error) != 0) {
            fail(QString("Error exporting file '%1': %2").arg(job.outputPath, error));
            allWritten = false;
            continue;
        }

        qCInfo(lcBatch) << "Exported:" << job.outputPath;
        report.outputs.append(job.outputPath);
    }

    return allWritten;
}
