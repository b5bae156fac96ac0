//
// Created by Trixie on 03/03/2026.
//

#ifndef CHANNELSPLITTER_PCMFORMAT_H
#define CHANNELSPLITTER_PCMFORMAT_H

#include <optional>
#include <string>

// Output encoding chosen from the bit depth of the input file.
struct PcmFormat {
    int bitsPerSample;
    std::string sampleFormat;  // ffmpeg -sample_fmt name
    std::string codec;         // ffmpeg -c:a name
};

std::optional<PcmFormat> pcmFormatForBits(int bitsPerSample);

#endif //CHANNELSPLITTER_PCMFORMAT_H
