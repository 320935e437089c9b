#include <catch2/catch_test_macros.hpp>

#include <QBuffer>
#include <QFile>
#include <QTemporaryDir>
#include <QtEndian>

#include "AudioFileWriter.h"
#include "AudioRingBuffer.h"
#include "WavFile.h"
#include "TestUtils.h"

namespace {

uint32_t le32(const QByteArray& data, qsizetype offset) {
    return qFromLittleEndian<uint32_t>(data.constData() + offset);
}

} // anon ns

TEST_CASE("Wav header", "[wav]") {
    const wav::Format format;
    const auto header = wav::makeHeader(format, 32000);

    REQUIRE(header.size() == wav::header_size);
    CHECK(header.startsWith("RIFF"));
    CHECK(header.mid(8, 8) == "WAVEfmt ");
    CHECK(le32(header, 4) == 36 + 32000);
    CHECK(le32(header, 24) == 16000);
    CHECK(le32(header, 28) == 32000);
    CHECK(header.mid(36, 4) == "data");
    CHECK(le32(header, 40) == 32000);
}

TEST_CASE("Probe a wav file", "[wav]") {
    const auto samples = test::sine(0.25);
    const auto bytes = static_cast<uint32_t>(samples.size() * sizeof(int16_t));

    QByteArray data = wav::makeHeader({}, bytes);
    data.append(reinterpret_cast<const char *>(samples.data()), bytes);

    SECTION("Canonical header") {
        QBuffer buffer{&data};
        REQUIRE(buffer.open(QIODevice::ReadOnly));
        const auto info = wav::probe(buffer);
        REQUIRE(info.has_value());
        CHECK(info->format.isWhisperNative());
        CHECK(info->data_offset == wav::header_size);
        CHECK(info->data_size == bytes);
    }

    SECTION("Skips a LIST chunk") {
        QByteArray list{"LIST"};
        const auto le = qToLittleEndian<uint32_t>(5);
        list.append(reinterpret_cast<const char *>(&le), 4);
        list.append("INFOx", 5);
        list.append('\0'); // pad to even size
        data.insert(36, list);

        QBuffer buffer{&data};
        REQUIRE(buffer.open(QIODevice::ReadOnly));
        const auto info = wav::probe(buffer);
        REQUIRE(info.has_value());
        CHECK(info->data_offset == wav::header_size + list.size());
        CHECK(info->data_size == bytes);
    }

    SECTION("Unfinished recording") {
        data.replace(40, 4, QByteArray(4, '\0'));
        QBuffer buffer{&data};
        REQUIRE(buffer.open(QIODevice::ReadOnly));
        const auto info = wav::probe(buffer);
        REQUIRE(info.has_value());
        CHECK(info->data_size == bytes);
    }

    SECTION("Not a wav file") {
        QByteArray junk{"ID3 this is an mp3 file, more or less"};
        QBuffer buffer{&junk};
        REQUIRE(buffer.open(QIODevice::ReadOnly));
        CHECK_FALSE(wav::probe(buffer).has_value());
    }
}

TEST_CASE("Stereo 44.1 kHz is not whisper native", "[wav]") {
    wav::Format format;
    format.sample_rate = 44100;
    format.channels = 2;
    CHECK_FALSE(format.isWhisperNative());
    CHECK(format.blockAlign() == 4);
    CHECK(format.byteRate() == 44100 * 4);
}

TEST_CASE("File writer finalizes the header", "[wav]") {
    QTemporaryDir dir;
    const auto path = dir.filePath("rec.wav");

    AudioRingBuffer ring;
    AudioFileWriter writer{&ring, {}, path};

    const auto samples = test::sine(1.0);
    const auto bytes = static_cast<qsizetype>(samples.size() * sizeof(int16_t));
    const QByteArray pcm{reinterpret_cast<const char *>(samples.data()), bytes};

    // Feed it in small chunks, like the audio device does
    for (qsizetype offset = 0; offset < pcm.size(); offset += 3200) {
        ring.push(pcm.mid(offset, 3200));
    }

    CHECK(writer.stop() == bytes);

    QFile file{path};
    REQUIRE(file.open(QIODevice::ReadOnly));
    const auto info = wav::probe(file);
    REQUIRE(info.has_value());
    CHECK(info->data_size == static_cast<uint32_t>(bytes));
    CHECK(file.size() == wav::header_size + bytes);
}

TEST_CASE("File writer reports a full disk", "[wav]") {
    const QString path{"/dev/full"};
    if (!QFile::exists(path)) {
        SKIP("/dev/full is not available");
    }

    AudioRingBuffer ring;
    AudioFileWriter writer{&ring, {}, path};

    const auto samples = test::sine(1.0);
    const QByteArray pcm{reinterpret_cast<const char *>(samples.data()),
                         static_cast<qsizetype>(samples.size() * sizeof(int16_t))};
    ring.push(pcm);

    writer.stop();
    CHECK(writer.failed());
}
