#ifndef CHANNELSPLITTER_WAVFIXTURE_H
#define CHANNELSPLITTER_WAVFIXTURE_H

#include <QString>

#include <cstdint>
#include <functional>
#include <vector>

struct WavData {
    int formatTag = 0;
    int channels = 0;
    int sampleRate = 0;
    int bitsPerSample = 0;
    std::vector<int32_t> samples;  // interleaved, sign-extended
};

// sample(frame, channel) returns the integer value to store at that position.
bool writePcmWav(const QString &path, int channels, int sampleRate, int bitsPerSample, int frames,
                 const std::function<int32_t(int, int)> &sample);

bool readPcmWav(const QString &path, WavData &wav);

#endif //CHANNELSPLITTER_WAVFIXTURE_H
