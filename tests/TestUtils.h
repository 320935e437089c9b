#pragma once

#include <cmath>
#include <cstdint>
#include <numbers>
#include <vector>

#include <QByteArray>
#include <QFile>
#include <QString>

#include "WavFile.h"

namespace test {

// 16 kHz mono 16-bit sine wave
inline std::vector<int16_t> sine(double seconds, double freq = 440.0, int sampleRate = 16000)
{
    const auto count = static_cast<size_t>(seconds * sampleRate);
    std::vector<int16_t> samples(count);
    for (size_t i = 0; i < count; ++i) {
        const auto v = std::sin(2.0 * std::numbers::pi * freq * static_cast<double>(i) / sampleRate);
        samples[i] = static_cast<int16_t>(v * 8000.0);
    }
    return samples;
}

inline bool writeWav(const QString& path, const std::vector<int16_t>& samples,
                     const wav::Format& format = {})
{
    QFile file{path};
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }

    const auto bytes = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    file.write(wav::makeHeader(format, bytes));
    file.write(reinterpret_cast<const char *>(samples.data()), bytes);
    return true;
}

inline bool writeFile(const QString& path, const QByteArray& content)
{
    QFile file{path};
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    return file.write(content) == content.size();
}

inline QByteArray readFile(const QString& path)
{
    QFile file{path};
    if (!file.open(QIODevice::ReadOnly)) {
        return {};
    }
    return file.readAll();
}

} // ns
