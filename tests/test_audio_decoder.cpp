#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>

#include <QStandardPaths>
#include <QTemporaryDir>

#include "AudioDecoder.h"
#include "AudioSource.h"
#include "ScribeError.h"
#include "TestUtils.h"

using qvs::ErrorKind;
using qvs::ScribeError;

namespace {

ErrorKind decodeError(const AudioDecoder& decoder, const QString& path)
{
    try {
        decoder.decode(AudioSource::fromFile(path));
    } catch (const ScribeError& ex) {
        return ex.kind();
    }
    FAIL("No error thrown for " << path.toStdString());
    return ErrorKind::WriteError;
}

bool haveFfmpeg()
{
    return !QStandardPaths::findExecutable("ffmpeg").isEmpty();
}

} // anon ns

TEST_CASE("ffmpeg is asked for 16 kHz mono s16le on stdout", "[decoder]") {
    const auto args = AudioDecoder::ffmpegArguments("/tmp/in put.mp3");
    const QStringList expected{
        "-nostdin", "-hide_banner", "-loglevel", "error",
        "-i", "/tmp/in put.mp3",
        "-vn", "-ac", "1", "-ar", "16000",
        "-f", "s16le", "-acodec", "pcm_s16le", "pipe:1"};
    CHECK(args == expected);
}

TEST_CASE("Samples are scaled to -1..1", "[decoder]") {
    const std::vector<int16_t> pcm{0, 16384, -32768, 32767};
    const auto out = AudioDecoder::toFloat(pcm);
    REQUIRE(out.size() == 4);
    CHECK(out[0] == 0.0f);
    CHECK(out[1] == 0.5f);
    CHECK(out[2] == -1.0f);
    CHECK(out[3] < 1.0f);
}

TEST_CASE("Our own recordings are read directly", "[decoder]") {
    QTemporaryDir dir;
    const auto path = dir.filePath("rec.wav");
    const auto samples = test::sine(1.0);
    REQUIRE(test::writeWav(path, samples));

    // A bogus ffmpeg path proves ffmpeg is not involved
    const AudioDecoder decoder{"/nonexistent/ffmpeg"};
    const auto out = decoder.decode(AudioSource::fromRecording(path));
    REQUIRE(out.size() == samples.size());
    CHECK(out[100] == Catch::Approx(samples[100] / 32768.0f));
}

TEST_CASE("Too little audio is rejected", "[decoder]") {
    QTemporaryDir dir;
    const AudioDecoder decoder{"/nonexistent/ffmpeg"};

    SECTION("Too short") {
        const auto path = dir.filePath("short.wav");
        REQUIRE(test::writeWav(path, test::sine(0.05)));
        CHECK(decodeError(decoder, path) == ErrorKind::TranscriptionFailure);
    }

    SECTION("No samples") {
        const auto path = dir.filePath("empty.wav");
        REQUIRE(test::writeWav(path, {}));
        CHECK(decodeError(decoder, path) == ErrorKind::TranscriptionFailure);
    }
}

TEST_CASE("Missing ffmpeg is reported", "[decoder]") {
    QTemporaryDir dir;
    const auto path = dir.filePath("cd.wav");
    wav::Format format;
    format.sample_rate = 44100;
    format.channels = 2;
    REQUIRE(test::writeWav(path, test::sine(1.0, 440.0, 44100 * 2), format));

    const AudioDecoder decoder{"/nonexistent/ffmpeg"};
    CHECK(decodeError(decoder, path) == ErrorKind::TranscriptionFailure);
}

TEST_CASE("Other formats are converted by ffmpeg", "[decoder][ffmpeg]") {
    if (!haveFfmpeg()) {
        SKIP("ffmpeg is not installed");
    }

    QTemporaryDir dir;
    const AudioDecoder decoder{"ffmpeg"};

    SECTION("Stereo 44.1 kHz wav") {
        const auto path = dir.filePath("cd.wav");
        wav::Format format;
        format.sample_rate = 44100;
        format.channels = 2;
        REQUIRE(test::writeWav(path, test::sine(1.0, 440.0, 44100 * 2), format));

        const auto out = decoder.decode(AudioSource::fromFile(path));
        CHECK(std::abs(static_cast<long>(out.size()) - 16000L) < 400);
    }

    SECTION("Garbage with an audio extension") {
        const auto path = dir.filePath("noise.mp3");
        REQUIRE(test::writeFile(path, QByteArray(4096, 'z')));
        const auto kind = decodeError(decoder, path);
        CHECK((kind == ErrorKind::UnsupportedFormat || kind == ErrorKind::TranscriptionFailure));
    }
}
