#include <array>
#include <cassert>
#include <format>

#include <QFileInfo>
#include <QSettings>

#include "AppEngine.h"
#include "AudioSource.h"
#include "OutputManager.h"
#include "ScribeError.h"

#include "logging.h"

using namespace std;

namespace {

// Same order as the "devices" property
constexpr auto device_table = to_array<pair<ComputeDevice, string_view>>({
    {ComputeDevice::Auto, "auto"},
    {ComputeDevice::Gpu,  "gpu"},
    {ComputeDevice::Cpu,  "cpu"},
});

ComputeDevice deviceFromSetting(const QString& name) {
    const auto key = name.trimmed().toLower().toStdString();
    for (const auto& [device, setting] : device_table) {
        if (setting == key) {
            return device;
        }
    }
    return ComputeDevice::Auto;
}

} // anon ns

ostream& operator << (ostream& os, AppEngine::State state) {
    constexpr auto states = to_array<string_view>({
        "Idle",
        "Recording",
        "Ready",
        "Transcribing",
        "Transcribed"
    });

    return os << states.at(static_cast<size_t>(state));
}

AppEngine::AppEngine()
{
    QSettings settings{};

    models_.setModels(ModelMgr::availableModels());
    session_.setDevice(deviceFromSetting(settings.value("transcribe/device", "auto").toString()));
    session_.setKeepFiles(settings.value("transcribe/keep_files", false).toBool());
    syncOptions();

    connect(&models_, &AvailableModelsModel::selectedChanged, this, [this] {
        syncOptions();
        emit modelSummaryChanged();
    });

    connect(&languages_, &LanguagesModel::selectedChanged, this, &AppEngine::syncOptions);

    connect(&model_mgr_, &ModelMgr::downloadProgressRatio,
            this, [this](const QString& name, double ratio) {
        download_progress_ = ratio;
        emit downloadProgressChanged();
        setStateText(tr("Downloading model %1: %2%").arg(name).arg(static_cast<int>(ratio * 100)));
    });

    connect(&transcriber_, &Transcriber::progress, this, [this](const QString& message) {
        if (isTranscribing()) {
            setStateText(message);
        }
    });

    connect(&recorder_, &AudioRecorder::recordingLevelChanged, this, [this](qreal level) {
        if (level != recording_level_) {
            recording_level_ = level;
            emit recordingLevelChanged();
        }
    });

    connect(&recorder_, &AudioRecorder::deviceError, this, [this](const QString& message) {
        LOG_WARN_N << "Audio device error while recording: " << message;
        if (canStop()) {
            stopRecording();
        }
        failed(tr("Recording Error"), message);
    });

    connect(&audio_controller_, &AudioController::inputDevicesChanged,
            this, &AppEngine::updateMicrophones);

    connect(&audio_controller_, &AudioController::currentInputDeviceChanged,
            this, &AppEngine::currentMicChanged);

    recording_timer_.setInterval(1000);
    connect(&recording_timer_, &QTimer::timeout, this, &AppEngine::onRecordingTick);

    updateMicrophones();
    setStateText();
}

AppEngine::~AppEngine()
{
    if (recorder_.isRunning()) {
        LOG_INFO_N << "Stopping the recording before we exit";
        try {
            const auto path = recorder_.stop();
            session_.endRecording(AudioSource::fromRecording(path));
        } catch (const qvs::ScribeError& ex) {
            LOG_WARN_N << "Failed to finalize the recording: " << ex;
            session_.endRecording({});
        }
    }

    discardReplacedSource();
    if (const auto& source = session_.source()) {
        OutputManager::discardSource(*source, session_.options().keep_files);
    }
}

AppEngine::State AppEngine::state() const noexcept
{
    return static_cast<State>(session_.state());
}

void AppEngine::toggleRecording()
{
    if (canStop()) {
        stopRecording();
    } else {
        startRecording();
    }
}

void AppEngine::startRecording()
{
    LOG_INFO << "Starting recording";
    if (!session_.canRecord()) {
        LOG_WARN_N << "Cannot start recording in state " << session_.state();
        return;
    }

    try {
        recorder_.start(audio_controller_.currentInputDevice(), AudioRecorder::recordingsDirectory());
    } catch (const qvs::ScribeError& ex) {
        failed(ex);
        return;
    }

    session_.beginRecording();
    discardReplacedSource();

    recording_seconds_ = 0;
    recording_time_ = "00:00";
    emit recordingTimeChanged();
    recording_timer_.start();

    refresh();
}

void AppEngine::stopRecording()
{
    LOG_INFO << "Stopping recording";
    if (!canStop()) {
        LOG_WARN_N << "Cannot stop recording in state " << session_.state();
        return;
    }

    recording_timer_.stop();
    recording_level_ = {};
    emit recordingLevelChanged();

    try {
        const auto path = recorder_.stop();
        session_.endRecording(AudioSource::fromRecording(path));
        refresh();
        setStateText(tr("Recording saved: %1").arg(QFileInfo{path}.fileName()));
    } catch (const qvs::ScribeError& ex) {
        session_.endRecording({});
        failed(ex);
    }
}

void AppEngine::openAudioFile(const QUrl &url)
{
    if (!session_.canOpenFile()) {
        LOG_WARN_N << "Cannot open a file in state " << session_.state();
        return;
    }

    const auto path = url.isLocalFile() ? url.toLocalFile() : url.toString();
    LOG_INFO_N << "Opening audio file " << path;

    try {
        session_.setSource(AudioSource::fromFile(path));
    } catch (const qvs::ScribeError& ex) {
        failed(ex);
        return;
    }

    discardReplacedSource();
    refresh();

    // Opening a file means "transcribe this"
    transcribe();
}

void AppEngine::transcribe()
{
    if (!session_.canTranscribe()) {
        LOG_WARN_N << "Cannot transcribe in state " << session_.state();
        return;
    }

    runTranscription();
}

QCoro::Task<void> AppEngine::runTranscription()
{
    syncOptions();
    const auto options = session_.beginTranscription();
    if (!options) {
        co_return;
    }

    assert(session_.source());
    const auto source = *session_.source();

    emit transcriptChanged();
    refresh();
    setStateText(tr("Transcribing (%1 / %2)...").arg(options->model, devices().at(deviceIndex())));

    try {
        const auto *info = ModelMgr::findModelByName(options->model);
        if (!info) {
            throw qvs::ScribeError{qvs::ErrorKind::ModelLoadError,
                                   tr("Unknown model: %1").arg(options->model)};
        }

        if (!co_await model_mgr_.prepareEngine()) {
            throw qvs::ScribeError{qvs::ErrorKind::ModelLoadError,
                                   tr("Failed to initialize the whisper engine.")};
        }

        // No point in downloading gigabytes for a device we can't use
        Transcriber::resolveUseGpu(model_mgr_.whisperEngine(), options->device);

        if (!model_mgr_.isDownloaded(*info)) {
            setStateText(tr("Downloading model %1...").arg(options->model));
            const bool downloaded = co_await model_mgr_.makeAvailable(*info);
            if (!downloaded) {
                throw qvs::ScribeError{qvs::ErrorKind::ModelLoadError,
                                       tr("Failed to download the model %1.").arg(options->model)};
            }
        }

        auto result = co_await transcriber_.transcribe(source, *options);

        OutputManager::cleanup(result.artifacts, options->keep_files);

        LOG_INFO_N << "Transcribed " << source.path() << ": " << result.text.size()
                   << " characters, language " << result.language;

        session_.completeTranscription(std::move(result.text));
        emit transcriptChanged();
        refresh();
        setStateText(tr("Transcription complete"));
    } catch (const qvs::ScribeError& ex) {
        session_.failTranscription();
        emit transcriptChanged();
        failed(ex);
    }

    download_progress_ = 0;
    emit downloadProgressChanged();
}

bool AppEngine::saveTranscriptToFile(const QUrl &url)
{
    const auto& text = session_.transcript();
    if (text.trimmed().isEmpty()) {
        failed(tr("Warning"), tr("No text to save."));
        return false;
    }

    const auto path = url.isLocalFile() ? url.toLocalFile() : url.toString();
    try {
        OutputManager::save(text, path);
    } catch (const qvs::ScribeError& ex) {
        failed(ex);
        return false;
    }

    emit transcriptSaved(path);
    return true;
}

void AppEngine::clearTranscript()
{
    if (!OutputManager::clear(session_)) {
        LOG_WARN_N << "Cannot clear in state " << session_.state();
        return;
    }

    emit transcriptChanged();
    refresh();
}

void AppEngine::setTranscript(const QString &text)
{
    if (text == session_.transcript()) {
        return;
    }

    if (session_.setTranscript(text)) {
        emit transcriptChanged();
        emit stateFlagsChanged();
    }
}

QStringList AppEngine::devices() const
{
    return {tr("Auto"), tr("GPU (CUDA)"), tr("CPU")};
}

int AppEngine::deviceIndex() const noexcept
{
    const auto device = session_.options().device;
    for (size_t i = 0; i < device_table.size(); ++i) {
        if (device_table[i].first == device) {
            return static_cast<int>(i);
        }
    }
    return 0;
}

void AppEngine::setDeviceIndex(int index)
{
    if (index < 0 || static_cast<size_t>(index) >= device_table.size()) {
        LOG_WARN_N << "Invalid device index " << index;
        return;
    }

    const auto& [device, setting] = device_table[static_cast<size_t>(index)];
    if (device == session_.options().device) {
        return;
    }

    if (!session_.setDevice(device)) {
        LOG_WARN_N << "Cannot change the device in state " << session_.state();
        return;
    }

    QSettings{}.setValue("transcribe/device", QString::fromUtf8(setting));
    emit deviceIndexChanged();
}

void AppEngine::setKeepFiles(bool keep)
{
    if (keep == keepFiles()) {
        return;
    }

    if (!session_.setKeepFiles(keep)) {
        LOG_WARN_N << "Cannot change keep-files in state " << session_.state();
        return;
    }

    QSettings{}.setValue("transcribe/keep_files", keep);
    emit keepFilesChanged();
}

QString AppEngine::modelSummary() const
{
    if (const auto *model = models_.selectedModel()) {
        return model->summary();
    }
    return tr("Model information not available.");
}

int AppEngine::currentMic() const
{
    return audio_controller_.getCurrentDeviceIndex();
}

void AppEngine::setCurrentMic(int index)
{
    audio_controller_.setInputDevice(index);
}

QString AppEngine::suggestedSaveName() const
{
    return OutputManager::suggestedFileName(session_.source());
}

QStringList AppEngine::audioNameFilters()
{
    return {AudioSource::nameFilter(), tr("All files (*)")};
}

void AppEngine::initLogging()
{
    QSettings settings{};

    if (!settings.contains("logging/applevel")) {
        settings.setValue("logging/applevel", 4); // INFO
    }

#ifdef Q_OS_LINUX
    if (const auto level = settings.value("logging/applevel", 4).toInt()) {
        logfault::LogManager::Instance().AddHandler(
            make_unique<logfault::StreamHandler>(clog, static_cast<logfault::LogLevel>(level)));
        LOG_INFO << "Logging to console";
    }
#endif

    auto level = settings.value("logging/level", 0).toInt();
    if (level > 0) {
        if (auto path = settings.value("logging/path", "").toString().toStdString(); !path.empty()) {
            const bool prune = settings.value("logging/prune", "").toString() == "true";
            logfault::LogManager::Instance().AddHandler(
                make_unique<logfault::StreamHandler>(path, static_cast<logfault::LogLevel>(level), prune));

            LOG_INFO << "Logging to: " << path;
        }
    }
}

void AppEngine::syncOptions()
{
    if (!session_.canChangeOptions()) {
        return;
    }

    session_.setModel(models_.selectedModelName());
    session_.setLanguage(languages_.selectedCode());
}

void AppEngine::discardReplacedSource()
{
    if (const auto replaced = session_.takeDiscarded()) {
        if (const auto& current = session_.source(); current && current->path() == replaced->path()) {
            LOG_DEBUG_N << "Keeping " << replaced->path() << ". It is still the current source.";
            return;
        }
        OutputManager::discardSource(*replaced, session_.options().keep_files);
    }
}

void AppEngine::failed(const qvs::ScribeError &error)
{
    LOG_ERROR_N << "Operation failed: " << error;
    emit errorOccurred(error.title(), QString::fromUtf8(error.what()));
    refresh();
    setStateText(error.title());
}

void AppEngine::failed(const QString &title, const QString &why)
{
    LOG_WARN_N << title << ": " << why;
    emit errorOccurred(title, why);
    refresh();
}

void AppEngine::setStateText(QString text) {

    static const auto names = to_array<QString>({
        tr("Ready to record"),
        tr("Recording..."),
        tr("Ready to transcribe"),
        tr("Transcribing..."),
        tr("Transcription complete")
    });

    if (text.isEmpty()) {
        text = names.at(static_cast<size_t>(session_.state()));
    }

    if (text != state_text_) {
        LOG_DEBUG_N << "State text changed to: " << text;
        state_text_ = text;
        emit stateTextChanged();
    }
}

void AppEngine::refresh()
{
    if (session_.state() != last_state_) {
        LOG_DEBUG_N << "State changed from " << static_cast<State>(last_state_)
                    << " to " << state();
        last_state_ = session_.state();
        emit stateChanged();
        setStateText();
    }

    emit stateFlagsChanged();
}

void AppEngine::updateMicrophones()
{
    microphones_.clear();
    for (const auto& dev : audio_controller_.inputDevices()) {
        microphones_.append(dev.description());
    }
    emit microphonesChanged();
    emit currentMicChanged();
}

void AppEngine::onRecordingTick()
{
    ++recording_seconds_;
    recording_time_ = QStringLiteral("%1:%2")
        .arg(recording_seconds_ / 60, 2, 10, QLatin1Char('0'))
        .arg(recording_seconds_ % 60, 2, 10, QLatin1Char('0'));
    emit recordingTimeChanged();
}

QString AppEngine::aboutText() const
{
     return tr(R"(**QVoiceScribe** records your voice, or opens an audio file, and turns the speech into text.

This is QVoiceScribe version: %1, using Qt version: %2.

## How to use it

1. Pick a model, a language (or *Auto*) and a device.
2. Press **Start Recording**, talk, and press **Stop Recording**. Then press **Transcribe**.
   Or use **Open Audio File** to transcribe an mp3, wav, flac or ogg file right away.
3. Edit the text if you like, and **Save** it as a text file.

Models are downloaded the first time they are used. Larger models are slower,
but more accurate. Models ending in *.en* only understand English.

## Technical Information

- Speech recognition by **whisper.cpp**, running locally on your machine
- Audio files are decoded with **ffmpeg**, which must be installed
- Built with **Qt 6 (C++ / QML)**

## Credits

Developed by **The Last Viking LTD**
)").arg(APP_VERSION).arg(qVersion());
}
