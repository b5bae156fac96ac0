//
// Created by Trixie on 03/03/2026.
//

#include "pcmformat.h"

#include <QLoggingCategory>

#include <array>

Q_LOGGING_CATEGORY(lcFormat, "chansplit.format")

namespace {

// 8-bit WAV samples are unsigned, the wav muxer only accepts pcm_u8 for them.
const std::array<PcmFormat, 4> kFormats = {{
    {8, "u8", "pcm_u8"},
    {16, "s16", "pcm_s16le"},
    {24, "s24", "pcm_s24le"},
    {32, "s32", "pcm_s32le"},
}};

}

std::optional<PcmFormat> pcmFormatForBits(int bitsPerSample) {
    for (const auto& format : kFormats) {
        if (format.bitsPerSample == bitsPerSample) {
            qCDebug(lcFormat) << "Mapped bits_per_sample" << bitsPerSample
                              << "to sample_fmt" << format.sampleFormat.c_str()
                              << "codec" << format.codec.c_str();
            return format;
        }
    }

    qCWarning(lcFormat) << "Unsupported bits per sample:" << bitsPerSample;
    return std::nullopt;
}
