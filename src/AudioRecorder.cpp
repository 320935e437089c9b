#include <array>
#include <format>
#include <memory>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSettings>
#include <QStandardPaths>

#include "AudioRecorder.h"
#include "ScribeError.h"
#include "WavFile.h"

#include "logging.h"

using namespace std;
using qvs::ErrorKind;
using qvs::ScribeError;

namespace logfault {
std::pair<bool /* json */, std::string /* content or json */> toLog(const AudioRecorder& r, bool json) {
    const auto path = QFileInfo{r.path()}.fileName().toStdString();
    if (json) {
        return make_pair(true, format(R"("recorder":{{"file":"{}"}})", path));
    }

    return make_pair(false, format("AudioRecorder{{file={}}}", path));
}
} // logfault ns

ostream& operator << (ostream& os, AudioRecorder::State state)
{
    constexpr auto names = to_array<string_view>({
        "STOPPED",
        "STARTED"
    });

    return os << names.at(static_cast<size_t>(state));
}

AudioRecorder::AudioRecorder(QObject *parent)
    : QObject(parent)
{}

AudioRecorder::~AudioRecorder()
{
    if (isRunning()) {
        LOG_INFO_EX(*this) << "Recorder destroyed while recording. Finalizing the file.";
        teardown();
    }
}

QString AudioRecorder::start(const QAudioDevice &device, const QString &directory)
{
    if (isRunning()) {
        LOG_DEBUG_EX(*this) << "Audio recorder already running";
        return path_;
    }

    if (device.isNull()) {
        throw ScribeError{ErrorKind::DeviceUnavailable,
                          tr("No audio input device is available. Please connect a microphone.")};
    }

    LOG_DEBUG_N << "Starting audio recorder on " << device.description();

    if (!QDir{}.mkpath(directory)) {
        throw ScribeError{ErrorKind::WriteError,
                          tr("Cannot create the recordings directory %1").arg(directory)};
    }

    const QDir dir{directory};
    const auto now = QDateTime::currentDateTime();
    auto path = dir.filePath(makeFileName(now));
    for(int i = 1; QFileInfo::exists(path); ++i) {
        path = dir.filePath(QStringLiteral("%1_%2.wav")
                                .arg(QFileInfo{makeFileName(now)}.completeBaseName())
                                .arg(i));
    }

    format_ = createWhisperFormat(device);
    ring_buffer_ = make_unique<AudioRingBuffer>();
    capture_device_ = make_unique<AudioCaptureDevice>(ring_buffer_.get(), format_, AUDIO_BUFFER_SIZE);
    connect(capture_device_.get(), &AudioCaptureDevice::recordingLevelUpdated,
            this, &AudioRecorder::recordingLevelChanged);

    // Throws if the file can't be created
    file_writer_ = make_unique<AudioFileWriter>(ring_buffer_.get(), wav::fromAudioFormat(format_), path);
    path_ = path;

    audio_source_ = make_unique<QAudioSource>(device, format_);
    connect(audio_source_.get(), &QAudioSource::stateChanged,
            this, &AudioRecorder::onSourceStateChanged);

    capture_device_->open(QIODevice::WriteOnly);
    audio_source_->start(capture_device_.get());  // push mode

    if (const auto err = audio_source_->error(); err != QAudio::NoError) {
        LOG_WARN_EX(*this) << "Failed to start the audio source. Error: " << static_cast<int>(err);
        teardown();
        QFile::remove(path);
        path_.clear();
        throw ScribeError{ErrorKind::DeviceUnavailable,
                          tr("Failed to open the audio input device \"%1\". "
                             "Check microphone permissions or if it's in use by another application.")
                              .arg(device.description())};
    }

    setState(State::STARTED);
    LOG_INFO_EX(*this) << "Recording to " << path_;
    emit started();
    return path_;
}

QString AudioRecorder::stop()
{
    if (!isRunning()) {
        throw ScribeError{ErrorKind::NoActiveRecording, tr("No recording is in progress.")};
    }

    const bool ok = teardown();
    setState(State::STOPPED);
    emit recordingLevelChanged(0);

    if (!ok) {
        LOG_ERROR_EX(*this) << "The recording could not be written. Removing " << path_;
        QFile::remove(path_);
        throw ScribeError{ErrorKind::WriteError,
                          tr("Failed to write the recording %1. The disk may be full.")
                              .arg(QFileInfo{path_}.fileName())};
    }

    LOG_INFO_EX(*this) << "Recording stopped: " << path_;
    emit stopped(path_);
    return path_;
}

bool AudioRecorder::teardown()
{
    bool ok = true;
    if (audio_source_) {
        audio_source_->disconnect(this);
        audio_source_->stop();
    }
    if (capture_device_) {
        capture_device_->close();
    }
    if (file_writer_) {
        const auto bytes = file_writer_->stop();
        LOG_DEBUG_EX(*this) << "Wrote " << bytes << " bytes of audio";
        ok = !file_writer_->failed();
    }

    audio_source_.reset();
    file_writer_.reset();
    capture_device_.reset();
    ring_buffer_.reset();
    return ok;
}

QAudioFormat AudioRecorder::createWhisperFormat(const QAudioDevice &device)
{
    QAudioFormat format;
    format.setSampleRate(16000);
    format.setChannelCount(1);
    format.setSampleFormat(QAudioFormat::Int16);

    if (!device.isNull() && !device.isFormatSupported(format)) {
        format = device.preferredFormat();
        LOG_WARN_N << "16 kHz mono Int16 is not supported by " << device.description()
                   << ". Using " << format.sampleRate() << " Hz, "
                   << format.channelCount() << " channels";
    }
    return format;
}

QString AudioRecorder::makeFileName(const QDateTime &when)
{
    return QStringLiteral("recording_%1.wav").arg(when.toString("yyyyMMdd_HHmmss"));
}

QString AudioRecorder::recordingsDirectory()
{
    auto dir = QSettings{}.value("recording/directory").toString().trimmed();
    if (dir.isEmpty()) {
        dir = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation) + "/recordings";
    }
    return dir;
}

void AudioRecorder::setState(State state)
{
    if (state_ != state) {
        LOG_DEBUG_EX(*this) << "AudioRecorder state changed from " << state_ << " to " << state;
        state_ = state;
    }
}

void AudioRecorder::onSourceStateChanged(QAudio::State state)
{
    if (!audio_source_ || !isRunning()) {
        return;
    }

    if (state == QAudio::StoppedState && audio_source_->error() != QAudio::NoError) {
        LOG_WARN_EX(*this) << "Audio input stopped with error " << static_cast<int>(audio_source_->error());
        emit deviceError(tr("The audio input device stopped unexpectedly."));
    }
}
