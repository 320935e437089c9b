#pragma once

#include <memory>

#include <QObject>
#include <QAudioDevice>
#include <QAudioSource>
#include <QAudioFormat>
#include <QDateTime>

#include "AudioCaptureDevice.h"
#include "AudioFileWriter.h"
#include "AudioRingBuffer.h"

constexpr int AUDIO_BUFFER_SIZE = 1024 * 16;

/*! Records from a microphone into a wav file.
 *
 *  The Qt audio source pushes into AudioCaptureDevice (Qt's audio thread),
 *  which hands chunks over to AudioFileWriter through a ring buffer.
 */
class AudioRecorder : public QObject
{
    Q_OBJECT

public:
    enum class State {
        STOPPED,
        STARTED
    };

    explicit AudioRecorder(QObject *parent = nullptr);
    ~AudioRecorder() override;

    /*! Start recording into a new file in `directory`.
     *
     *  \return The path to the file
     *  \throws ScribeError DeviceUnavailable if the device can't be opened,
     *          WriteError if the file can't be created.
     */
    QString start(const QAudioDevice &device, const QString& directory);

    /*! Stop recording and finalize the file.
     *
     *  \return The path to the finished file.
     *  \throws ScribeError NoActiveRecording if we are not recording, WriteError
     *          if the audio could not be written. The incomplete file is removed.
     */
    QString stop();

    State state() const noexcept { return state_;}
    bool isRunning() const noexcept { return state_ == State::STARTED;}
    QAudioFormat format() const { return format_; }
    const QString& path() const noexcept { return path_; }

    static QAudioFormat createWhisperFormat(const QAudioDevice &device);
    static QString makeFileName(const QDateTime& when);

    // From the "recording/directory" setting, or a default location
    static QString recordingsDirectory();

signals:
    void started();
    void stopped(const QString& path);
    void recordingLevelChanged(qreal level);
    void deviceError(const QString& message);

private:
    void setState(State state);
    void onSourceStateChanged(QAudio::State state);
    // Returns false if the file writer failed
    bool teardown();

    QAudioFormat  format_;
    std::unique_ptr<QAudioSource> audio_source_;
    std::unique_ptr<AudioRingBuffer> ring_buffer_;
    std::unique_ptr<AudioCaptureDevice> capture_device_;
    std::unique_ptr<AudioFileWriter> file_writer_;
    QString path_;
    State state_{State::STOPPED};
};

std::ostream& operator << (std::ostream& os, AudioRecorder::State state);
