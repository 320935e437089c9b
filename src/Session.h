#pragma once

#include <optional>
#include <ostream>
#include <utility>

#include <QString>

#include "AudioSource.h"

enum class ComputeDevice {
    Auto,
    Cpu,
    Gpu
};

/*! Snapshot of the user's choices, taken when a transcription starts.
 *
 *  The running transcription works on its own copy, so changes in the
 *  UI does not affect it.
 */
struct TranscriptionOptions {
    QString model{"turbo"};
    QString language{"auto"};   // whisper language code, or "auto"
    ComputeDevice device{ComputeDevice::Auto};
    bool keep_files{false};

    bool autoLanguage() const noexcept {
        return language.isEmpty() || language.compare("auto", Qt::CaseInsensitive) == 0;
    }
};

/*! The state of the current recording/transcription workflow.
 *
 *  Owned by AppEngine and only touched from the UI thread. All the
 *  transition methods return false, and leave the session unchanged,
 *  if the transition is not legal in the current state.
 */
class Session
{
public:
    enum class State {
        Idle,
        Recording,
        Ready,          // have a source, not yet transcribed
        Transcribing,
        Transcribed
    };

    State state() const noexcept { return state_; }
    const std::optional<AudioSource>& source() const noexcept { return source_; }
    const QString& transcript() const noexcept { return transcript_; }
    const TranscriptionOptions& options() const noexcept { return options_; }

    bool canRecord() const noexcept;
    bool canOpenFile() const noexcept { return canRecord(); }
    bool canTranscribe() const noexcept;
    bool canClear() const noexcept { return canRecord(); }
    bool canChangeOptions() const noexcept { return canRecord(); }
    bool isBusy() const noexcept {
        return state_ == State::Recording || state_ == State::Transcribing;
    }

    // Any current source is moved to the discarded slot.
    bool beginRecording();

    // recording is empty if nothing usable was captured
    bool endRecording(std::optional<AudioSource> recording);

    // Replace the current source with a user selected file
    bool setSource(AudioSource source);

    // Returns the options to use for the run, or nullopt if we can't transcribe now.
    std::optional<TranscriptionOptions> beginTranscription();
    bool completeTranscription(QString text);
    bool failTranscription();

    // Reset the displayed text. Does not touch any files.
    bool clear();

    // The user edited the text
    bool setTranscript(QString text);

    bool setModel(const QString& model);
    bool setLanguage(const QString& language);
    bool setDevice(ComputeDevice device);
    bool setKeepFiles(bool keep);

    /*! Returns the source that was replaced by the last transition, if any.
     *
     *  The caller decides what to do with it (deleting a recording that
     *  the user did not want to keep).
     */
    std::optional<AudioSource> takeDiscarded();

private:
    void discardSource();
    void setState(State state);

    State state_{State::Idle};
    std::optional<AudioSource> source_;
    std::optional<AudioSource> discarded_;
    TranscriptionOptions options_;
    QString transcript_;
};

std::ostream& operator << (std::ostream& os, Session::State state);
std::ostream& operator << (std::ostream& os, ComputeDevice device);
