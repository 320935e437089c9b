#include <catch2/catch_test_macros.hpp>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include "OutputManager.h"
#include "ScribeError.h"
#include "Session.h"
#include "TestUtils.h"

using qvs::ErrorKind;
using qvs::ScribeError;

TEST_CASE("Save writes the transcript as UTF-8", "[output]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath("out.txt");

    const QString text = QStringLiteral("Hello world.\nBlåbærsyltetøy og ünïcødé.");
    OutputManager::save(text, path);
    CHECK(QString::fromUtf8(test::readFile(path)) == text);

    SECTION("Overwrites an existing file") {
        OutputManager::save("short", path);
        CHECK(test::readFile(path) == "short");
    }

    SECTION("An empty transcript gives an empty file") {
        OutputManager::save({}, path);
        CHECK(QFileInfo{path}.size() == 0);
    }
}

TEST_CASE("Save reports write errors", "[output]") {
    QTemporaryDir dir;

    SECTION("Missing directory") {
        const auto path = dir.filePath("no/such/dir/out.txt");
        try {
            OutputManager::save("text", path);
            FAIL("Expected an exception");
        } catch (const ScribeError& ex) {
            CHECK(ex.kind() == ErrorKind::WriteError);
        }
        CHECK_FALSE(QFile::exists(path));
    }

    SECTION("No path") {
        try {
            OutputManager::save("text", {});
            FAIL("Expected an exception");
        } catch (const ScribeError& ex) {
            CHECK(ex.kind() == ErrorKind::WriteError);
        }
    }

    SECTION("Path is a directory") {
        REQUIRE(QDir{dir.path()}.mkdir("taken.txt"));
        CHECK_THROWS_AS(OutputManager::save("text", dir.filePath("taken.txt")), ScribeError);
    }
}

TEST_CASE("Cleanup deletes the sidecar files", "[output]") {
    QTemporaryDir dir;
    QStringList files;
    for (const auto& ext : {"txt", "srt", "vtt", "tsv", "json"}) {
        const auto path = dir.filePath(QStringLiteral("audio.") + QString::fromLatin1(ext));
        REQUIRE(test::writeFile(path, "x"));
        files << path;
    }

    SECTION("Deletes and is idempotent") {
        CHECK(OutputManager::cleanup(files, false) == 5);
        for (const auto& f : files) {
            CHECK_FALSE(QFile::exists(f));
        }
        CHECK(OutputManager::cleanup(files, false) == 0);
    }

    SECTION("Skips missing files") {
        REQUIRE(QFile::remove(files.front()));
        CHECK(OutputManager::cleanup(files, false) == 4);
    }

    SECTION("Keep files") {
        CHECK(OutputManager::cleanup(files, true) == 0);
        for (const auto& f : files) {
            CHECK(QFile::exists(f));
        }
    }
}

TEST_CASE("Clear does not touch saved files", "[output]") {
    QTemporaryDir dir;
    const auto wav = dir.filePath("rec.wav");
    REQUIRE(test::writeWav(wav, test::sine(0.5)));

    Session session;
    REQUIRE(session.setSource(AudioSource::fromRecording(wav)));
    REQUIRE(session.beginTranscription().has_value());
    REQUIRE(session.completeTranscription("Some text"));

    const auto saved = dir.filePath("saved.txt");
    OutputManager::save(session.transcript(), saved);

    REQUIRE(OutputManager::clear(session));
    CHECK(session.transcript().isEmpty());
    CHECK(session.state() == Session::State::Idle);
    CHECK(test::readFile(saved) == "Some text");
    CHECK(QFile::exists(wav));
}

TEST_CASE("Only recordings are discarded", "[output]") {
    QTemporaryDir dir;
    const auto path = dir.filePath("audio.wav");
    REQUIRE(test::writeWav(path, test::sine(0.5)));

    SECTION("User file") {
        CHECK_FALSE(OutputManager::discardSource(AudioSource::fromFile(path), false));
        CHECK(QFile::exists(path));
    }

    SECTION("Recording, keep files") {
        CHECK_FALSE(OutputManager::discardSource(AudioSource::fromRecording(path), true));
        CHECK(QFile::exists(path));
    }

    SECTION("Recording") {
        const auto rec = AudioSource::fromRecording(path);
        CHECK(OutputManager::discardSource(rec, false));
        CHECK_FALSE(QFile::exists(path));
        CHECK_FALSE(OutputManager::discardSource(rec, false));
    }
}

TEST_CASE("Suggested file names", "[output]") {
    QTemporaryDir dir;
    const auto path = dir.filePath("meeting.notes.mp3");
    REQUIRE(test::writeFile(path, "x"));

    const QDateTime when{QDate{2025, 3, 7}, QTime{9, 5, 1}};

    CHECK(OutputManager::suggestedFileName(AudioSource::fromFile(path), when)
          == "meeting.notes_transcribed.txt");
    CHECK(OutputManager::suggestedFileName(std::nullopt, when)
          == "transcription_20250307_090501.txt");
}
