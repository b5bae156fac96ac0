//
// Created by Trixie on 04/03/2026.
//

#include "processtranscoder.h"

#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QProcess>

#include <utility>

Q_LOGGING_CATEGORY(lcProcess, "chansplit.process")

namespace {

// ffprobe prints some numbers as strings ("44100") and some as numbers.
int jsonInt(const QJsonValue& value) {
    if (value.isDouble()) {
        return value.toInt();
    }
    bool ok = false;
    const int parsed = value.toString().toInt(&ok);
    return ok ? parsed : 0;
}

}

ProcessTranscoder::ProcessTranscoder(FfmpegTools tools)
    : tools(std::move(tools)) {
}

bool ProcessTranscoder::isAvailable(QString& error) const {
    if (!tools.isComplete()) {
        error = "FFmpeg and/or FFprobe not found.";
        return false;
    }
    return true;
}

QStringList ProcessTranscoder::probeArguments(const QString& path) {
    return {
        "-v", "error",
        "-select_streams", "a:0",
        "-show_entries",
        "stream=codec_name,sample_rate,channels,bits_per_sample,bits_per_raw_sample:format_tags",
        "-of", "json",
        path,
    };
}

QStringList ProcessTranscoder::exportArguments(const ChannelJob& job) {
    return {
        "-y",
        "-v", "error",
        "-i", job.inputPath,
        "-map", "0:a:0",
        "-map_metadata", "0",
        "-af", QString("pan=mono|c0=c%1").arg(job.channel - 1),
        "-ar", QString::number(job.sampleRate),
        "-ac", "1",
        "-c:a", job.codec,
        job.outputPath,
    };
}

int ProcessTranscoder::parseProbeOutput(const QByteArray& json, AudioInfo& info, QString& error) {
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (doc.isNull() || !doc.isObject()) {
        error = "Unreadable ffprobe output: " + parseError.errorString();
        return 1;
    }

    const QJsonObject root = doc.object();
    const QJsonArray streams = root.value("streams").toArray();
    if (streams.isEmpty()) {
        error = "No audio stream found!";
        return 1;
    }

    const QJsonObject stream = streams.first().toObject();
    info.codecName = stream.value("codec_name").toString();
    info.sampleRate = jsonInt(stream.value("sample_rate"));
    info.channels = jsonInt(stream.value("channels"));

    info.bitsPerSample = jsonInt(stream.value("bits_per_sample"));
    if (info.bitsPerSample == 0) {
        info.bitsPerSample = jsonInt(stream.value("bits_per_raw_sample"));
    }

    const QJsonObject tags = root.value("format").toObject().value("tags").toObject();
    info.tags.clear();
    for (auto it = tags.constBegin(); it != tags.constEnd(); ++it) {
        info.tags.insert(it.key(), it.value().toString());
    }

    if (info.channels <= 0 || info.sampleRate <= 0) {
        error = "ffprobe reported no channels or sample rate";
        return 1;
    }
    return 0;
}

int ProcessTranscoder::probe(const QString& path, AudioInfo& info, QString& error) {
    QByteArray output;
    const QStringList args = probeArguments(path);
    qCDebug(lcProcess) << "Running ffprobe command:" << tools.ffprobe << args.join(' ');

    if (run(tools.ffprobe, args, probeTimeoutMs, output, error) != 0) {
        return 1;
    }

    info.path = path;
    if (parseProbeOutput(output, info, error) != 0) {
        return 1;
    }

    qCDebug(lcProcess) << "Probed" << path << "codec" << info.codecName
                       << "rate" << info.sampleRate << "channels" << info.channels
                       << "bits" << info.bitsPerSample << "tags" << info.tags;
    return 0;
}

int ProcessTranscoder::exportChannel(const ChannelJob& job, QString& error) {
    QByteArray output;
    const QStringList args = exportArguments(job);
    qCDebug(lcProcess) << "Running ffmpeg command:" << tools.ffmpeg << args.join(' ');

    if (run(tools.ffmpeg, args, exportTimeoutMs, output, error) != 0) {
        if (QFile::exists(job.outputPath) && !QFile::remove(job.outputPath)) {
            qCWarning(lcProcess) << "Could not remove incomplete output" << job.outputPath;
        }
        return 1;
    }

    if (!QFileInfo::exists(job.outputPath)) {
        error = "ffmpeg exited cleanly but wrote no file";
        return 1;
    }
    return 0;
}

int ProcessTranscoder::run(const QString& program, const QStringList& args, int timeoutMs,
                           QByteArray& output, QString& error) const {
    QProcess process;
    process.start(program, args);

    if (!process.waitForStarted()) {
        error = QString("Failed to start %1: %2").arg(program, process.errorString());
        return 1;
    }

    if (!process.waitForFinished(timeoutMs)) {
        process.kill();
        process.waitForFinished();
        error = QString("%1 timed out").arg(QFileInfo(program).fileName());
        return 1;
    }

    output = process.readAllStandardOutput();
    const QString stderrText = QString::fromLocal8Bit(process.readAllStandardError()).trimmed();

    if (process.exitStatus() != QProcess::NormalExit) {
        error = QString("%1 crashed").arg(QFileInfo(program).fileName());
        return 1;
    }

    if (process.exitCode() != 0) {
        error = QString("%1 exited with code %2")
                    .arg(QFileInfo(program).fileName())
                    .arg(process.exitCode());
        if (!stderrText.isEmpty()) {
            error += ": " + stderrText;
        }
        return 1;
    }

    return 0;
}
