#include <catch2/catch_test_macros.hpp>

#include <QDir>
#include <QEventLoop>
#include <QFile>
#include <QFileInfo>
#include <QMediaDevices>
#include <QSettings>
#include <QTemporaryDir>
#include <QTimer>

#include "AudioRecorder.h"
#include "ScribeError.h"
#include "WavFile.h"

using qvs::ErrorKind;
using qvs::ScribeError;

TEST_CASE("Recording file names", "[recorder]") {
    const QDateTime when{QDate{2024, 12, 31}, QTime{23, 59, 58}};
    CHECK(AudioRecorder::makeFileName(when) == "recording_20241231_235958.wav");
}

TEST_CASE("Recordings directory follows the settings", "[recorder]") {
    QSettings{}.setValue("recording/directory", "/var/tmp/qvs-recordings");
    CHECK(AudioRecorder::recordingsDirectory() == "/var/tmp/qvs-recordings");

    QSettings{}.remove("recording/directory");
    CHECK(AudioRecorder::recordingsDirectory().endsWith("/recordings"));
}

TEST_CASE("Stop without a recording", "[recorder]") {
    AudioRecorder recorder;
    CHECK_FALSE(recorder.isRunning());

    try {
        recorder.stop();
        FAIL("Expected an exception");
    } catch (const ScribeError& ex) {
        CHECK(ex.kind() == ErrorKind::NoActiveRecording);
    }
}

TEST_CASE("No input device", "[recorder]") {
    QTemporaryDir dir;
    AudioRecorder recorder;

    try {
        recorder.start(QAudioDevice{}, dir.path());
        FAIL("Expected an exception");
    } catch (const ScribeError& ex) {
        CHECK(ex.kind() == ErrorKind::DeviceUnavailable);
    }
    CHECK_FALSE(recorder.isRunning());
    CHECK(QDir{dir.path()}.isEmpty());
}

TEST_CASE("Record from the default microphone", "[recorder][device]") {
    const auto device = QMediaDevices::defaultAudioInput();
    if (device.isNull()) {
        SKIP("No audio input device");
    }

    QTemporaryDir dir;
    AudioRecorder recorder;

    QString path;
    try {
        path = recorder.start(device, dir.path());
    } catch (const ScribeError& ex) {
        SKIP("The audio input could not be opened: " << ex.what());
    }

    CHECK(recorder.isRunning());
    CHECK(QFileInfo{path}.fileName().startsWith("recording_"));

    QEventLoop loop;
    QTimer::singleShot(500, &loop, &QEventLoop::quit);
    loop.exec();

    CHECK(recorder.stop() == path);
    CHECK_FALSE(recorder.isRunning());

    QFile file{path};
    REQUIRE(file.open(QIODevice::ReadOnly));
    const auto info = wav::probe(file);
    REQUIRE(info.has_value());
    CHECK(file.size() == info->data_offset + info->data_size);

    SECTION("Stop twice") {
        CHECK_THROWS_AS(recorder.stop(), ScribeError);
    }
}
