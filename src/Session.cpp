#include <array>

#include "Session.h"

#include "logging.h"

using namespace std;

ostream& operator << (ostream& os, Session::State state)
{
    constexpr auto states = to_array<string_view>({
        "Idle",
        "Recording",
        "Ready",
        "Transcribing",
        "Transcribed"
    });

    return os << states.at(static_cast<size_t>(state));
}

ostream& operator << (ostream& os, ComputeDevice device)
{
    constexpr auto names = to_array<string_view>({
        "auto",
        "cpu",
        "gpu"
    });

    return os << names.at(static_cast<size_t>(device));
}

bool Session::canRecord() const noexcept
{
    return state_ == State::Idle
           || state_ == State::Ready
           || state_ == State::Transcribed;
}

bool Session::canTranscribe() const noexcept
{
    return canRecord() && source_.has_value();
}

bool Session::beginRecording()
{
    if (!canRecord()) {
        LOG_DEBUG_N << "Cannot start recording in state " << state_;
        return false;
    }

    discardSource();
    setState(State::Recording);
    return true;
}

bool Session::endRecording(std::optional<AudioSource> recording)
{
    if (state_ != State::Recording) {
        LOG_DEBUG_N << "Cannot end recording in state " << state_;
        return false;
    }

    source_ = std::move(recording);
    setState(source_ ? State::Ready : State::Idle);
    return true;
}

bool Session::setSource(AudioSource source)
{
    if (!canOpenFile()) {
        LOG_DEBUG_N << "Cannot change the audio source in state " << state_;
        return false;
    }

    // The same file, possibly our own recording opened from disk. Keep the current source.
    if (source_ && source_->path() == source.path()) {
        setState(State::Ready);
        return true;
    }

    discardSource();
    source_ = std::move(source);
    setState(State::Ready);
    return true;
}

std::optional<TranscriptionOptions> Session::beginTranscription()
{
    if (!canTranscribe()) {
        LOG_DEBUG_N << "Cannot transcribe in state " << state_
                    << (source_ ? "" : " without an audio source");
        return {};
    }

    transcript_.clear();
    setState(State::Transcribing);
    return options_;
}

bool Session::completeTranscription(QString text)
{
    if (state_ != State::Transcribing) {
        LOG_DEBUG_N << "No transcription in progress. State is " << state_;
        return false;
    }

    transcript_ = std::move(text);
    setState(State::Transcribed);
    return true;
}

bool Session::failTranscription()
{
    if (state_ != State::Transcribing) {
        LOG_DEBUG_N << "No transcription in progress. State is " << state_;
        return false;
    }

    // The source is kept so the user can try again, maybe with another model
    transcript_.clear();
    setState(State::Idle);
    return true;
}

bool Session::clear()
{
    if (!canClear()) {
        return false;
    }

    transcript_.clear();
    if (state_ == State::Transcribed) {
        setState(State::Idle);
    }
    return true;
}

bool Session::setTranscript(QString text)
{
    if (state_ == State::Transcribing) {
        return false;
    }

    transcript_ = std::move(text);
    return true;
}

bool Session::setModel(const QString &model)
{
    if (!canChangeOptions() || model.isEmpty()) {
        return false;
    }
    options_.model = model;
    return true;
}

bool Session::setLanguage(const QString &language)
{
    if (!canChangeOptions()) {
        return false;
    }
    options_.language = language.isEmpty() ? QStringLiteral("auto") : language;
    return true;
}

bool Session::setDevice(ComputeDevice device)
{
    if (!canChangeOptions()) {
        return false;
    }
    options_.device = device;
    return true;
}

bool Session::setKeepFiles(bool keep)
{
    if (!canChangeOptions()) {
        return false;
    }
    options_.keep_files = keep;
    return true;
}

std::optional<AudioSource> Session::takeDiscarded()
{
    return std::exchange(discarded_, std::nullopt);
}

void Session::discardSource()
{
    if (source_) {
        discarded_ = std::exchange(source_, std::nullopt);
    }
}

void Session::setState(State state)
{
    if (state_ != state) {
        LOG_DEBUG_N << "Session state changed from " << state_ << " to " << state;
        state_ = state;
    }
}
