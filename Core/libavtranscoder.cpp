//
// Created by Trixie on 12/02/2026.
//
#include <cstring>
#include <string>
extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavcodec/avcodec.h>
#include <libswresample/swresample.h>
#include <libavutil/opt.h>
#include <libavutil/samplefmt.h>
}
#include "libavtranscoder.h"

#include <QFile>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(lcLibav, "chansplit.libav")

namespace {

std::string ffmpeg_err(int err) {
    char buf[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(err, buf, sizeof(buf));
    return std::string(buf);
}

QString avError(const char* what, int err) {
    return QString("%1: %2").arg(QString::fromLatin1(what), QString::fromStdString(ffmpeg_err(err)));
}

struct ExportContext {
    AVFormatContext* in = nullptr;
    AVCodecContext* decoder = nullptr;
    AVCodecContext* encoder = nullptr;
    SwrContext* swr = nullptr;
    AVFormatContext* out = nullptr;
    AVStream* outStream = nullptr;
    AVFrame* inFrame = nullptr;
    AVFrame* planar = nullptr;
    AVFrame* mono = nullptr;
    AVPacket* inPacket = nullptr;
    AVPacket* outPacket = nullptr;
    AVChannelLayout inLayout{};
    AVSampleFormat planarFmt = AV_SAMPLE_FMT_NONE;
    int streamIndex = -1;
    int plane = 0;
    int planarCapacity = 0;
    int64_t samplesWritten = 0;
    QString partialOutput;  // removed unless the trailer was written

    ~ExportContext() {
        av_packet_free(&inPacket);
        av_packet_free(&outPacket);
        av_frame_free(&inFrame);
        av_frame_free(&planar);
        av_frame_free(&mono);
        if (out) {
            if (out->pb && !(out->oformat->flags & AVFMT_NOFILE)) {
                avio_closep(&out->pb);
            }
            avformat_free_context(out);
        }
        if (!partialOutput.isEmpty() && !QFile::remove(partialOutput)) {
            qCWarning(lcLibav) << "Could not remove incomplete output" << partialOutput;
        }
        swr_free(&swr);
        avcodec_free_context(&encoder);
        avcodec_free_context(&decoder);
        avformat_close_input(&in);
        av_channel_layout_uninit(&inLayout);
    }
};

int openInput(const QString& path, AVFormatContext*& fmt, int& audioStreamIndex, QString& error) {
    const QByteArray inputPath = path.toUtf8();

    int ret = avformat_open_input(&fmt, inputPath.constData(), nullptr, nullptr);
    if (ret < 0) {
        error = avError("Failed to open input", ret);
        return 1;
    }

    ret = avformat_find_stream_info(fmt, nullptr);
    if (ret < 0) {
        error = avError("Failed to find stream info", ret);
        return 1;
    }

    audioStreamIndex = -1;
    for (unsigned i = 0; i < fmt->nb_streams; i++) {
        if (fmt->streams[i]->codecpar->codec_type == AVMEDIA_TYPE_AUDIO) {
            audioStreamIndex = static_cast<int>(i);
            break;
        }
    }

    if (audioStreamIndex < 0) {
        error = "No audio stream found!";
        return 1;
    }
    return 0;
}

int writePackets(ExportContext& ctx, QString& error) {
    int ret;
    while ((ret = avcodec_receive_packet(ctx.encoder, ctx.outPacket)) == 0) {
        av_packet_rescale_ts(ctx.outPacket, ctx.encoder->time_base, ctx.outStream->time_base);
        ctx.outPacket->stream_index = ctx.outStream->index;

        ret = av_interleaved_write_frame(ctx.out, ctx.outPacket);
        if (ret < 0) {
            error = avError("Failed to write packet", ret);
            return 1;
        }
    }

    if (ret != AVERROR(EAGAIN) && ret != AVERROR_EOF) {
        error = avError("Encoder failed", ret);
        return 1;
    }
    return 0;
}

// Hands the selected plane of the last conversion to the mono encoder.
int encodePlane(ExportContext& ctx, int samples, QString& error) {
    if (samples <= 0) {
        return 0;
    }

    av_frame_unref(ctx.mono);
    ctx.mono->format = ctx.encoder->sample_fmt;
    ctx.mono->sample_rate = ctx.encoder->sample_rate;
    ctx.mono->nb_samples = samples;
    av_channel_layout_copy(&ctx.mono->ch_layout, &ctx.encoder->ch_layout);

    int ret = av_frame_get_buffer(ctx.mono, 0);
    if (ret < 0) {
        error = avError("Failed to allocate output frame", ret);
        return 1;
    }

    // A mono packed frame has the same memory layout as one plane.
    const int bytes = samples * av_get_bytes_per_sample(ctx.planarFmt);
    std::memcpy(ctx.mono->data[0], ctx.planar->extended_data[ctx.plane], bytes);

    ctx.mono->pts = ctx.samplesWritten;
    ctx.samplesWritten += samples;

    ret = avcodec_send_frame(ctx.encoder, ctx.mono);
    if (ret < 0) {
        error = avError("Failed to send frame to encoder", ret);
        return 1;
    }
    return writePackets(ctx, error);
}

// frame == nullptr flushes the resampler.
int convertFrame(ExportContext& ctx, const AVFrame* frame, QString& error) {
    const int inSamples = frame ? frame->nb_samples : 0;
    const int capacity = swr_get_out_samples(ctx.swr, inSamples);
    if (capacity < 0) {
        error = avError("swr_get_out_samples failed", capacity);
        return 1;
    }
    if (capacity == 0) {
        return 0;
    }

    if (capacity > ctx.planarCapacity) {
        av_frame_unref(ctx.planar);
        ctx.planar->format = ctx.planarFmt;
        ctx.planar->nb_samples = capacity;
        av_channel_layout_copy(&ctx.planar->ch_layout, &ctx.inLayout);

        int ret = av_frame_get_buffer(ctx.planar, 0);
        if (ret < 0) {
            error = avError("Failed to allocate conversion buffer", ret);
            return 1;
        }
        ctx.planarCapacity = capacity;
    }

    const int outSamples = swr_convert(
        ctx.swr,
        ctx.planar->extended_data,
        capacity,
        frame ? const_cast<const uint8_t**>(frame->extended_data) : nullptr,
        inSamples
    );

    if (outSamples < 0) {
        error = avError("swr_convert failed", outSamples);
        return 1;
    }

    return encodePlane(ctx, outSamples, error);
}

int decodeFrames(ExportContext& ctx, QString& error) {
    int ret;
    while ((ret = avcodec_receive_frame(ctx.decoder, ctx.inFrame)) == 0) {
        const int result = convertFrame(ctx, ctx.inFrame, error);
        av_frame_unref(ctx.inFrame);
        if (result != 0) {
            return 1;
        }
    }

    if (ret != AVERROR(EAGAIN) && ret != AVERROR_EOF) {
        error = avError("Decoder failed", ret);
        return 1;
    }
    return 0;
}

int openDecoder(ExportContext& ctx, QString& error) {
    AVStream* audioStream = ctx.in->streams[ctx.streamIndex];
    AVCodecParameters* codecpar = audioStream->codecpar;

    const AVCodec* decoder = avcodec_find_decoder(codecpar->codec_id);
    if (!decoder) {
        error = QString("Unsupported codec: %1").arg(QString::fromLatin1(avcodec_get_name(codecpar->codec_id)));
        return 1;
    }

    ctx.decoder = avcodec_alloc_context3(decoder);
    if (!ctx.decoder) {
        error = "Failed to allocate decoder context";
        return 1;
    }

    int ret = avcodec_parameters_to_context(ctx.decoder, codecpar);
    if (ret < 0) {
        error = avError("Failed to copy codec parameters", ret);
        return 1;
    }

    ret = avcodec_open2(ctx.decoder, decoder, nullptr);
    if (ret < 0) {
        error = avError("Failed to open decoder context", ret);
        return 1;
    }

    // WAV files without a channel mask come back unordered.
    if (ctx.decoder->ch_layout.nb_channels == 0) {
        av_channel_layout_default(&ctx.inLayout, codecpar->ch_layout.nb_channels);
    } else if (ctx.decoder->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC) {
        av_channel_layout_default(&ctx.inLayout, ctx.decoder->ch_layout.nb_channels);
    } else {
        av_channel_layout_copy(&ctx.inLayout, &ctx.decoder->ch_layout);
    }
    return 0;
}

int openEncoder(ExportContext& ctx, const ChannelJob& job, QString& error) {
    const QByteArray codecName = job.codec.toUtf8();
    const AVCodec* encoder = avcodec_find_encoder_by_name(codecName.constData());
    if (!encoder) {
        error = "Unknown codec: " + job.codec;
        return 1;
    }

    ctx.encoder = avcodec_alloc_context3(encoder);
    if (!ctx.encoder) {
        error = "Failed to allocate encoder context";
        return 1;
    }

    const AVChannelLayout OUT_CH_LAYOUT = AV_CHANNEL_LAYOUT_MONO;

    ctx.encoder->sample_rate = job.sampleRate;
    av_channel_layout_copy(&ctx.encoder->ch_layout, &OUT_CH_LAYOUT);
    ctx.encoder->sample_fmt = encoder->sample_fmts[0];
    ctx.encoder->time_base = AVRational{1, job.sampleRate};

    int ret = avcodec_open2(ctx.encoder, encoder, nullptr);
    if (ret < 0) {
        error = avError("Failed to open encoder", ret);
        return 1;
    }

    ctx.planarFmt = av_get_planar_sample_fmt(ctx.encoder->sample_fmt);
    return 0;
}

int openResampler(ExportContext& ctx, const ChannelJob& job, QString& error) {
    ctx.swr = swr_alloc();
    if (!ctx.swr) {
        error = "Failed to allocate resampler";
        return 1;
    }

    av_opt_set_chlayout(ctx.swr, "in_chlayout", &ctx.inLayout, 0);
    av_opt_set_int(ctx.swr, "in_sample_rate", ctx.decoder->sample_rate, 0);
    av_opt_set_sample_fmt(ctx.swr, "in_sample_fmt", ctx.decoder->sample_fmt, 0);

    av_opt_set_chlayout(ctx.swr, "out_chlayout", &ctx.inLayout, 0);
    av_opt_set_int(ctx.swr, "out_sample_rate", job.sampleRate, 0);
    av_opt_set_sample_fmt(ctx.swr, "out_sample_fmt", ctx.planarFmt, 0);

    int ret = swr_init(ctx.swr);
    if (ret < 0) {
        error = avError("Failed to initialise resampler", ret);
        return 1;
    }
    return 0;
}

int openOutput(ExportContext& ctx, const ChannelJob& job, QString& error) {
    const QByteArray outputPath = job.outputPath.toUtf8();

    int ret = avformat_alloc_output_context2(&ctx.out, nullptr, "wav", outputPath.constData());
    if (ret < 0 || !ctx.out) {
        error = avError("Failed to create output context", ret);
        return 1;
    }

    ctx.outStream = avformat_new_stream(ctx.out, nullptr);
    if (!ctx.outStream) {
        error = "Failed to create output stream";
        return 1;
    }

    ret = avcodec_parameters_from_context(ctx.outStream->codecpar, ctx.encoder);
    if (ret < 0) {
        error = avError("Failed to copy encoder parameters", ret);
        return 1;
    }
    ctx.outStream->time_base = AVRational{1, job.sampleRate};

    av_dict_copy(&ctx.out->metadata, ctx.in->metadata, 0);

    ret = avio_open(&ctx.out->pb, outputPath.constData(), AVIO_FLAG_WRITE);
    if (ret < 0) {
        error = avError("Failed to open output file", ret);
        return 1;
    }
    ctx.partialOutput = job.outputPath;

    ret = avformat_write_header(ctx.out, nullptr);
    if (ret < 0) {
        error = avError("Failed to write header", ret);
        return 1;
    }
    return 0;
}

}

int LibavTranscoder::probe(const QString& path, AudioInfo& info, QString& error) {
    AVFormatContext* fmt = nullptr;
    int audioStreamIndex = -1;

    if (openInput(path, fmt, audioStreamIndex, error) != 0) {
        avformat_close_input(&fmt);
        return 1;
    }

    const AVCodecParameters* codecpar = fmt->streams[audioStreamIndex]->codecpar;

    info.path = path;
    info.codecName = avcodec_get_name(codecpar->codec_id);
    info.sampleRate = codecpar->sample_rate;
    info.channels = codecpar->ch_layout.nb_channels;
    info.bitsPerSample = av_get_bits_per_sample(codecpar->codec_id);
    if (info.bitsPerSample == 0) {
        info.bitsPerSample = codecpar->bits_per_raw_sample;
    }

    info.tags.clear();
    const AVDictionaryEntry* tag = nullptr;
    while ((tag = av_dict_get(fmt->metadata, "", tag, AV_DICT_IGNORE_SUFFIX))) {
        info.tags.insert(QString::fromUtf8(tag->key), QString::fromUtf8(tag->value));
    }

    avformat_close_input(&fmt);

    qCDebug(lcLibav) << "Probed" << path << "codec" << info.codecName
                     << "rate" << info.sampleRate << "channels" << info.channels
                     << "bits" << info.bitsPerSample;

    if (info.channels <= 0 || info.sampleRate <= 0) {
        error = "Stream reports no channels or sample rate";
        return 1;
    }
    return 0;
}

int LibavTranscoder::exportChannel(const ChannelJob& job, QString& error) {
    ExportContext ctx;

    if (openInput(job.inputPath, ctx.in, ctx.streamIndex, error) != 0) {
        return 1;
    }
    if (openDecoder(ctx, error) != 0) {
        return 1;
    }

    if (job.channelCount > 0 && job.channelCount != ctx.inLayout.nb_channels) {
        error = QString("Expected %1 channels, input has %2")
                    .arg(job.channelCount)
                    .arg(ctx.inLayout.nb_channels);
        return 1;
    }

    if (job.channel < 1 || job.channel > ctx.inLayout.nb_channels) {
        error = QString("Channel %1 out of range, input has %2")
                    .arg(job.channel)
                    .arg(ctx.inLayout.nb_channels);
        return 1;
    }
    ctx.plane = job.channel - 1;

    if (job.sampleRate <= 0) {
        error = "Invalid output sample rate";
        return 1;
    }

    if (openEncoder(ctx, job, error) != 0 || openResampler(ctx, job, error) != 0
        || openOutput(ctx, job, error) != 0) {
        return 1;
    }

    ctx.inFrame = av_frame_alloc();
    ctx.planar = av_frame_alloc();
    ctx.mono = av_frame_alloc();
    ctx.inPacket = av_packet_alloc();
    ctx.outPacket = av_packet_alloc();
    if (!ctx.inFrame || !ctx.planar || !ctx.mono || !ctx.inPacket || !ctx.outPacket) {
        error = "Out of memory";
        return 1;
    }

    int ret;
    while ((ret = av_read_frame(ctx.in, ctx.inPacket)) >= 0) {
        if (ctx.inPacket->stream_index != ctx.streamIndex) {
            av_packet_unref(ctx.inPacket);
            continue;
        }

        ret = avcodec_send_packet(ctx.decoder, ctx.inPacket);
        av_packet_unref(ctx.inPacket);
        if (ret < 0) {
            error = avError("Failed to send packet to decoder", ret);
            return 1;
        }

        if (decodeFrames(ctx, error) != 0) {
            return 1;
        }
    }

    if (ret != AVERROR_EOF) {
        error = avError("Failed to read input", ret);
        return 1;
    }

    ret = avcodec_send_packet(ctx.decoder, nullptr);
    if (ret < 0 && ret != AVERROR_EOF) {
        error = avError("Failed to flush decoder", ret);
        return 1;
    }
    if (decodeFrames(ctx, error) != 0 || convertFrame(ctx, nullptr, error) != 0) {
        return 1;
    }

    ret = avcodec_send_frame(ctx.encoder, nullptr);
    if (ret < 0 && ret != AVERROR_EOF) {
        error = avError("Failed to flush encoder", ret);
        return 1;
    }
    if (writePackets(ctx, error) != 0) {
        return 1;
    }

    ret = av_write_trailer(ctx.out);
    if (ret < 0) {
        error = avError("Failed to write trailer", ret);
        return 1;
    }
    ctx.partialOutput.clear();

    qCDebug(lcLibav) << "Wrote" << ctx.samplesWritten << "samples of channel" << job.channel
                     << "to" << job.outputPath;
    return 0;
}
