#include <gtest/gtest.h>

#include "processtranscoder.h"

#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

namespace {

ChannelJob stereoJob() {
    ChannelJob job;
    job.inputPath = "/audio/in.wav";
    job.outputPath = "/audio/out/in_chan2.wav";
    job.channel = 2;
    job.channelCount = 2;
    job.sampleRate = 48000;
    job.codec = "pcm_s24le";
    return job;
}

#ifndef Q_OS_WIN
QString writeScript(const QTemporaryDir &dir, const QString &name, const QByteArray &body) {
    const QString path = dir.filePath(name);
    QFile script(path);
    if (!script.open(QIODevice::WriteOnly)) {
        return {};
    }
    script.write("#!/bin/sh\n" + body);
    script.close();
    script.setPermissions(QFile::ReadOwner | QFile::WriteOwner | QFile::ExeOwner);
    return path;
}
#endif

}

TEST(ProcessTranscoderArgs, ProbeSelectsFirstAudioStreamAsJson) {
    const QStringList args = ProcessTranscoder::probeArguments("/audio/in.wav");

    EXPECT_TRUE(args.contains("a:0"));
    EXPECT_TRUE(args.contains("json"));
    EXPECT_EQ(args.last(), "/audio/in.wav");
    const int entries = args.indexOf("-show_entries");
    ASSERT_GE(entries, 0);
    EXPECT_TRUE(args.at(entries + 1).contains("bits_per_sample"));
}

TEST(ProcessTranscoderArgs, ExportPansSelectedChannelToMono) {
    const QStringList args = ProcessTranscoder::exportArguments(stereoJob());

    const int filter = args.indexOf("-af");
    ASSERT_GE(filter, 0);
    EXPECT_EQ(args.at(filter + 1), "pan=mono|c0=c1");

    const int rate = args.indexOf("-ar");
    ASSERT_GE(rate, 0);
    EXPECT_EQ(args.at(rate + 1), "48000");

    const int codec = args.indexOf("-c:a");
    ASSERT_GE(codec, 0);
    EXPECT_EQ(args.at(codec + 1), "pcm_s24le");

    EXPECT_EQ(args.at(args.indexOf("-i") + 1), "/audio/in.wav");
    EXPECT_EQ(args.first(), "-y");
    EXPECT_EQ(args.last(), "/audio/out/in_chan2.wav");
}

TEST(ProcessTranscoderParse, ReadsStreamAndTags) {
    const QByteArray json = R"({
        "programs": [],
        "streams": [{
            "codec_name": "pcm_s24le",
            "sample_rate": "96000",
            "channels": 6,
            "bits_per_sample": 24
        }],
        "format": {"tags": {"title": "Door slam", "artist": "ZQ"}}
    })";

    AudioInfo info;
    QString error;
    ASSERT_EQ(ProcessTranscoder::parseProbeOutput(json, info, error), 0) << error.toStdString();

    EXPECT_EQ(info.codecName, "pcm_s24le");
    EXPECT_EQ(info.sampleRate, 96000);
    EXPECT_EQ(info.channels, 6);
    EXPECT_EQ(info.bitsPerSample, 24);
    EXPECT_EQ(info.tags.value("title"), "Door slam");
    EXPECT_EQ(info.tags.size(), 2);
}

TEST(ProcessTranscoderParse, FallsBackToRawBitsPerSample) {
    const QByteArray json = R"({"streams": [{"codec_name": "flac", "sample_rate": "44100",
        "channels": 2, "bits_per_sample": 0, "bits_per_raw_sample": "16"}]})";

    AudioInfo info;
    QString error;
    ASSERT_EQ(ProcessTranscoder::parseProbeOutput(json, info, error), 0);
    EXPECT_EQ(info.bitsPerSample, 16);
    EXPECT_TRUE(info.tags.isEmpty());
}

TEST(ProcessTranscoderParse, LeavesUnknownDepthAtZero) {
    const QByteArray json = R"({"streams": [{"codec_name": "mp3", "sample_rate": "44100",
        "channels": 2, "bits_per_sample": 0}]})";

    AudioInfo info;
    QString error;
    ASSERT_EQ(ProcessTranscoder::parseProbeOutput(json, info, error), 0);
    EXPECT_EQ(info.bitsPerSample, 0);
}

TEST(ProcessTranscoderParse, RejectsMissingStreamsAndGarbage) {
    AudioInfo info;
    QString error;

    EXPECT_NE(ProcessTranscoder::parseProbeOutput(R"({"streams": []})", info, error), 0);
    EXPECT_EQ(error, "No audio stream found!");

    error.clear();
    EXPECT_NE(ProcessTranscoder::parseProbeOutput("not json", info, error), 0);
    EXPECT_FALSE(error.isEmpty());
}

TEST(ProcessTranscoder, UnavailableWithoutBothTools) {
    ProcessTranscoder transcoder(FfmpegTools{"/usr/bin/ffmpeg", QString()});
    QString error;
    EXPECT_FALSE(transcoder.isAvailable(error));
    EXPECT_EQ(error, "FFmpeg and/or FFprobe not found.");
}

TEST(ProcessTranscoder, ReportsToolThatCannotStart) {
    ProcessTranscoder transcoder(FfmpegTools{"/nonexistent/ffmpeg", "/nonexistent/ffprobe"});
    AudioInfo info;
    QString error;
    EXPECT_NE(transcoder.probe("/audio/in.wav", info, error), 0);
    EXPECT_TRUE(error.startsWith("Failed to start")) << error.toStdString();
}

#ifndef Q_OS_WIN

TEST(ProcessTranscoder, ProbesThroughFfprobe) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString ffprobe = writeScript(dir, "ffprobe",
        "echo '{\"streams\":[{\"codec_name\":\"pcm_s16le\",\"sample_rate\":\"44100\","
        "\"channels\":2,\"bits_per_sample\":16}]}'\n");
    const QString ffmpeg = writeScript(dir, "ffmpeg", "exit 0\n");

    ProcessTranscoder transcoder(FfmpegTools{ffmpeg, ffprobe});
    AudioInfo info;
    QString error;
    ASSERT_EQ(transcoder.probe("/audio/in.wav", info, error), 0) << error.toStdString();
    EXPECT_EQ(info.path, "/audio/in.wav");
    EXPECT_EQ(info.channels, 2);
    EXPECT_EQ(info.bitsPerSample, 16);
}

TEST(ProcessTranscoder, ExportWritesLastArgument) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString ffmpeg = writeScript(dir, "ffmpeg", "for last; do :; done\nprintf RIFF > \"$last\"\n");
    const QString ffprobe = writeScript(dir, "ffprobe", "exit 0\n");

    ChannelJob job = stereoJob();
    job.outputPath = dir.filePath("in_chan2.wav");

    ProcessTranscoder transcoder(FfmpegTools{ffmpeg, ffprobe});
    QString error;
    EXPECT_EQ(transcoder.exportChannel(job, error), 0) << error.toStdString();
    EXPECT_TRUE(QFileInfo::exists(job.outputPath));
}

TEST(ProcessTranscoder, ExportFailureCarriesStderr) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString ffmpeg = writeScript(dir, "ffmpeg", "echo 'Invalid data found' >&2\nexit 1\n");
    const QString ffprobe = writeScript(dir, "ffprobe", "exit 0\n");

    ChannelJob job = stereoJob();
    job.outputPath = dir.filePath("in_chan2.wav");

    ProcessTranscoder transcoder(FfmpegTools{ffmpeg, ffprobe});
    QString error;
    EXPECT_NE(transcoder.exportChannel(job, error), 0);
    EXPECT_TRUE(error.contains("exited with code 1")) << error.toStdString();
    EXPECT_TRUE(error.contains("Invalid data found")) << error.toStdString();
}

TEST(ProcessTranscoder, FailedExportLeavesNoOutput) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString ffmpeg = writeScript(dir, "ffmpeg",
        "for last; do :; done\nprintf RIFF > \"$last\"\nexit 1\n");
    const QString ffprobe = writeScript(dir, "ffprobe", "exit 0\n");

    ChannelJob job = stereoJob();
    job.outputPath = dir.filePath("in_chan2.wav");

    ProcessTranscoder transcoder(FfmpegTools{ffmpeg, ffprobe});
    QString error;
    EXPECT_NE(transcoder.exportChannel(job, error), 0);
    EXPECT_FALSE(QFileInfo::exists(job.outputPath));
}

TEST(ProcessTranscoder, ProbeTimeoutKillsTool) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString ffprobe = writeScript(dir, "ffprobe", "exec sleep 10\n");
    const QString ffmpeg = writeScript(dir, "ffmpeg", "exit 0\n");

    ProcessTranscoder transcoder(FfmpegTools{ffmpeg, ffprobe});
    transcoder.setProbeTimeout(200);
    AudioInfo info;
    QString error;
    EXPECT_NE(transcoder.probe("/audio/in.wav", info, error), 0);
    EXPECT_EQ(error, "ffprobe timed out");
}

#endif
