#include <filesystem>
#include <optional>
#include <string>

#include <catch2/catch_test_macros.hpp>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QScopeGuard>
#include <QSettings>
#include <QTemporaryDir>

#include <qcorotask.h>

#include "ModelMgr.h"
#include "OutputManager.h"
#include "ScribeError.h"
#include "Session.h"
#include "Transcriber.h"
#include "TestUtils.h"

using qvs::ErrorKind;
using qvs::ScribeError;

TEST_CASE("Device selection", "[transcriber]") {
    ModelMgr mgr;
    const auto& engine = mgr.whisperEngine();

    CHECK_FALSE(Transcriber::resolveUseGpu(engine, ComputeDevice::Cpu));
    CHECK(Transcriber::resolveUseGpu(engine, ComputeDevice::Auto) == engine.hasGpu());

    if (engine.hasGpu()) {
        CHECK(Transcriber::resolveUseGpu(engine, ComputeDevice::Gpu));
        SKIP("A GPU backend is available");
    }

    QTemporaryDir dir;
    const auto path = dir.filePath("rec.wav");
    REQUIRE(test::writeWav(path, test::sine(1.0)));

    Session session;
    REQUIRE(session.setDevice(ComputeDevice::Gpu));
    REQUIRE(session.setSource(AudioSource::fromRecording(path)));
    const auto options = session.beginTranscription();
    REQUIRE(options);

    try {
        Transcriber::resolveUseGpu(engine, options->device);
        FAIL("Expected an exception");
    } catch (const ScribeError& ex) {
        CHECK(ex.kind() == ErrorKind::ModelLoadError);
        REQUIRE(session.failTranscription());
    }

    CHECK(session.state() == Session::State::Idle);
    CHECK(session.transcript().isEmpty());
}

TEST_CASE("A vanished source fails before loading a model", "[transcriber]") {
    ModelMgr mgr;
    Transcriber transcriber;

    QTemporaryDir dir;
    const auto path = dir.filePath("gone.wav");
    REQUIRE(test::writeWav(path, test::sine(1.0)));
    const auto source = AudioSource::fromRecording(path);
    REQUIRE(QFile::remove(path));

    try {
        QCoro::waitFor(transcriber.transcribe(source, {}));
        FAIL("Expected an exception");
    } catch (const ScribeError& ex) {
        CHECK(ex.kind() == ErrorKind::FileNotFound);
    }

    CHECK_FALSE(transcriber.busy());
    CHECK(transcriber.loadedModel().isEmpty());
}

TEST_CASE("A missing model file is reported", "[transcriber]") {
    QTemporaryDir models;
    QSettings{}.setValue("models/path", models.path());
    const auto restore = qScopeGuard([] { QSettings{}.remove("models/path"); });

    ModelMgr mgr;
    Transcriber transcriber;

    QTemporaryDir dir;
    const auto path = dir.filePath("rec.wav");
    REQUIRE(test::writeWav(path, test::sine(1.0)));

    TranscriptionOptions options;
    options.model = "tiny.en";
    options.device = ComputeDevice::Cpu;

    try {
        QCoro::waitFor(transcriber.transcribe(AudioSource::fromRecording(path), options));
        FAIL("Expected an exception");
    } catch (const ScribeError& ex) {
        CHECK(ex.kind() == ErrorKind::ModelLoadError);
    }

    // Nothing is written next to the source
    CHECK(QDir{dir.path()}.entryList(QDir::Files) == QStringList{"rec.wav"});
}

TEST_CASE("The whisper engine reports load errors", "[transcriber]") {
    ModelMgr mgr;
    auto& engine = mgr.whisperEngine();

    QTemporaryDir dir;
    const std::filesystem::path missing = dir.filePath("ggml-tiny.bin").toStdString();

    CHECK_FALSE(engine.loadWhisper("tiny", missing, {}));
    CHECK(engine.lastError().find("not found") != std::string::npos);

    if (!engine.hasGpu()) {
        qvs::WhisperEngineLoadParams params;
        params.use_gpu = true;
        CHECK_FALSE(engine.loadWhisper("tiny", missing, params));
        CHECK(engine.lastError().find("GPU requested") != std::string::npos);
    }
}

TEST_CASE("ModelMgr can go away while the engine starts", "[transcriber]") {
    std::optional<QCoro::Task<bool>> ready;
    {
        ModelMgr mgr;
        ready.emplace(mgr.prepareEngine());
    }

    // The worker was done with the manager before it was destroyed
    CHECK(QCoro::waitFor(std::move(*ready)));
}

// Needs a real model and a real recording:
//   QVS_TEST_MODEL=/path/to/ggml-tiny.bin QVS_TEST_SAMPLE=/path/to/speech.wav
TEST_CASE("Transcribe speech with tiny on the CPU", "[transcriber][model]") {
    const auto model_file = qEnvironmentVariable("QVS_TEST_MODEL");
    const auto sample_file = qEnvironmentVariable("QVS_TEST_SAMPLE");
    if (model_file.isEmpty() || sample_file.isEmpty()) {
        SKIP("Set QVS_TEST_MODEL and QVS_TEST_SAMPLE to run");
    }

    QTemporaryDir models;
    QSettings{}.setValue("models/path", models.path());
    const auto restore = qScopeGuard([] { QSettings{}.remove("models/path"); });

    ModelMgr mgr;
    const auto *info = ModelMgr::findModelByName("tiny");
    REQUIRE(info);
    const auto model_path = QString::fromStdString(mgr.findModelPath(*info).string());
    REQUIRE(QFile::link(QFileInfo{model_file}.absoluteFilePath(), model_path));
    REQUIRE(mgr.isDownloaded(*info));

    // Work on a copy, so the sidecar files don't end up next to the original
    QTemporaryDir dir;
    const auto audio = dir.filePath(QFileInfo{sample_file}.fileName());
    REQUIRE(QFile::copy(sample_file, audio));

    Session session;
    REQUIRE(session.setModel("tiny"));
    REQUIRE(session.setLanguage("en"));
    REQUIRE(session.setDevice(ComputeDevice::Cpu));
    REQUIRE(session.setSource(AudioSource::fromFile(audio)));

    const auto options = session.beginTranscription();
    REQUIRE(options);

    Transcriber transcriber;
    QStringList progress;
    QObject::connect(&transcriber, &Transcriber::progress, &transcriber, [&](const QString& message) {
        progress << message;
    });

    const auto result = QCoro::waitFor(transcriber.transcribe(session.source().value(), *options));
    REQUIRE(session.completeTranscription(result.text));

    CHECK_FALSE(result.text.isEmpty());
    CHECK_FALSE(result.segments.empty());
    CHECK(result.language == "en");
    CHECK(result.artifacts.size() == 5);
    CHECK(transcriber.loadedModel() == "tiny (CPU)");
    CHECK(progress.contains("Transcribing..."));

    CHECK(OutputManager::cleanup(result.artifacts, options->keep_files) == 5);
    CHECK(QFile::exists(audio));

    const auto out = dir.filePath("out.txt");
    OutputManager::save(session.transcript(), out);
    CHECK(QString::fromUtf8(test::readFile(out)) == result.text);

    SECTION("The model is re-used") {
        progress.clear();
        const auto again = QCoro::waitFor(transcriber.transcribe(AudioSource::fromFile(audio), *options));
        CHECK(again.text == result.text);
        CHECK_FALSE(progress.contains("Loading model tiny..."));
        OutputManager::cleanup(again.artifacts, false);
    }

    SECTION("Unload") {
        QCoro::waitFor(transcriber.unload());
        CHECK(transcriber.loadedModel().isEmpty());
    }
}
