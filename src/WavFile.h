#pragma once

#include <cstdint>
#include <optional>

#include <QByteArray>
#include <QIODevice>

class QAudioFormat;

// RIFF/WAVE helpers for the files we record, and for reading simple PCM files directly.
namespace wav {

constexpr qint64 header_size = 44;

enum class Encoding : uint16_t {
    Pcm = 1,
    Float = 3
};

struct Format {
    uint32_t sample_rate{16000};
    uint16_t channels{1};
    uint16_t bits_per_sample{16};
    Encoding encoding{Encoding::Pcm};

    uint16_t blockAlign() const noexcept {
        return static_cast<uint16_t>(channels * bits_per_sample / 8);
    }

    uint32_t byteRate() const noexcept {
        return sample_rate * blockAlign();
    }

    // True if whisper can use the samples without resampling or conversion
    bool isWhisperNative() const noexcept {
        return sample_rate == 16000 && channels == 1
               && bits_per_sample == 16 && encoding == Encoding::Pcm;
    }
};

struct Info {
    Format format;
    qint64 data_offset{};
    uint32_t data_size{};
};

Format fromAudioFormat(const QAudioFormat& format);

// Canonical 44 byte header for `dataSize` bytes of sample data
QByteArray makeHeader(const Format& format, uint32_t dataSize);

/*! Parse the RIFF chunks of a wav file.
 *
 *  Skips unknown chunks (LIST etc.) until it finds "fmt " and "data".
 *  Returns nullopt if the device does not contain a wav file we understand.
 *  The device position is undefined afterwards.
 */
std::optional<Info> probe(QIODevice& device);

} // ns
