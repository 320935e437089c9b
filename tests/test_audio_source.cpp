#include <catch2/catch_test_macros.hpp>

#include <QDir>
#include <QTemporaryDir>

#include "AudioSource.h"
#include "ScribeError.h"
#include "TestUtils.h"

using qvs::ErrorKind;
using qvs::ScribeError;

namespace {

ErrorKind errorFrom(const QString& path)
{
    try {
        AudioSource::fromFile(path);
    } catch (const ScribeError& ex) {
        return ex.kind();
    }
    FAIL("No error thrown for " << path.toStdString());
    return ErrorKind::WriteError;
}

} // anon ns

TEST_CASE("AudioSource accepts the supported formats", "[audio_source]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    for (const auto& ext : {"mp3", "wav", "flac", "ogg", "WAV", "Mp3"}) {
        const auto path = dir.filePath(QStringLiteral("sample.") + QString::fromLatin1(ext));
        REQUIRE(test::writeFile(path, "not really audio"));

        const auto source = AudioSource::fromFile(path);
        CHECK(source.origin() == AudioSource::Origin::File);
        CHECK_FALSE(source.isRecording());
        CHECK(source.baseName() == "sample");
        CHECK(QDir{source.directory()} == QDir{dir.path()});
    }
}

TEST_CASE("AudioSource rejects other extensions", "[audio_source]") {
    QTemporaryDir dir;

    for (const auto& name : {"notes.txt", "movie.mkv", "noext"}) {
        const auto path = dir.filePath(QString::fromLatin1(name));
        REQUIRE(test::writeFile(path, "data"));
        CHECK(errorFrom(path) == ErrorKind::UnsupportedFormat);
    }
}

TEST_CASE("AudioSource reports missing files first", "[audio_source]") {
    QTemporaryDir dir;

    CHECK(errorFrom(dir.filePath("missing.wav")) == ErrorKind::FileNotFound);
    CHECK(errorFrom(dir.filePath("missing.txt")) == ErrorKind::FileNotFound);
    CHECK(errorFrom({}) == ErrorKind::FileNotFound);

    // A directory is not an audio file, even with a good extension
    REQUIRE(QDir{dir.path()}.mkdir("folder.wav"));
    CHECK(errorFrom(dir.filePath("folder.wav")) == ErrorKind::FileNotFound);
}

TEST_CASE("AudioSource knows its recordings", "[audio_source]") {
    QTemporaryDir dir;
    const auto path = dir.filePath("recording_20250101_120000.wav");
    REQUIRE(test::writeWav(path, test::sine(0.2)));

    const auto rec = AudioSource::fromRecording(path);
    CHECK(rec.isRecording());
    CHECK(rec.baseName() == "recording_20250101_120000");

    const auto file = AudioSource::fromFile(path);
    CHECK_FALSE(file == rec);
    CHECK(file.path() == rec.path());
}

TEST_CASE("AudioSource name filter", "[audio_source]") {
    const auto filter = AudioSource::nameFilter();
    CHECK(filter == "Audio files (*.mp3 *.wav *.flac *.ogg)");
}
