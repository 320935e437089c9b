#include <array>
#include <cassert>
#include <filesystem>
#include <format>
#include <string_view>

#include <QFileInfo>
#include <QThread>

#include <qcoro/core/qcorofuture.h>

#include "Transcriber.h"
#include "AudioDecoder.h"
#include "ModelMgr.h"
#include "ScopedTimer.h"
#include "ScribeError.h"
#include "logging.h"

using namespace std;

namespace logfault {
std::pair<bool /* json */, std::string /* content or json */> toLog(const Transcriber& t, bool json) {
    const auto model = t.loadedModel().toStdString();
    if (json) {
        return make_pair(true, format(R"("transcriber":{{"model":"{}"}})", model));
    }

    return make_pair(false, format("Transcriber{{model={}}}", model.empty() ? "none" : model));
}
} // logfault ns

ostream& operator << (ostream& os, Transcriber::CmdType cmd)
{
    constexpr auto cmds = to_array<string_view>({
        "TRANSCRIBE",
        "UNLOAD",
        "EXIT"
    });

    return os << cmds.at(static_cast<size_t>(cmd));
}

Transcriber::Transcriber(QObject *parent)
    : QObject(parent)
{
    worker_.emplace([this] { run(); });
}

Transcriber::~Transcriber()
{
    // Makes a running whisper_full() bail out at the next decoder step
    stopping_ = true;
    enqueueCommand(make_unique<Operation>(CmdType::EXIT));

    if (worker_ && worker_->joinable()) {
        LOG_DEBUG_N << "Waiting for the transcriber worker thread to join...";
        worker_->join();
        LOG_DEBUG_N << "Transcriber worker thread joined.";
    }
}

QCoro::Task<Transcriber::Result> Transcriber::transcribe(AudioSource source, TranscriptionOptions options)
{
    // Shared with the worker. Written there before the future finishes.
    struct Job {
        Result result;
        exception_ptr error;
    };
    auto job = make_shared<Job>();

    auto op = make_unique<Operation>(CmdType::TRANSCRIBE, [this, job, source, options]() -> bool {
        try {
            job->result = process(source, options);
            return true;
        } catch (const qvs::ScribeError& ex) {
            LOG_WARN_N << "Transcription failed: " << ex;
            job->error = current_exception();
        } catch (const exception& ex) {
            LOG_WARN_N << "Transcription failed with unexpected error: " << ex.what();
            job->error = make_exception_ptr(
                qvs::ScribeError{qvs::ErrorKind::TranscriptionFailure, string{ex.what()}});
        }
        return false;
    });

    auto future = op->future();
    LOG_DEBUG_EX(*this) << "Enqueuing transcription of " << source.path()
                        << " with model " << options.model
                        << ", language " << options.language
                        << ", device " << options.device;

    busy_ = true;
    enqueueCommand(std::move(op));
    const bool ok = co_await future;
    busy_ = false;

    if (job->error) {
        rethrow_exception(job->error);
    }

    if (!ok) {
        throw qvs::ScribeError{qvs::ErrorKind::TranscriptionFailure,
                               tr("The transcription was cancelled.")};
    }

    co_return std::move(job->result);
}

QCoro::Task<void> Transcriber::unload()
{
    auto op = make_unique<Operation>(CmdType::UNLOAD);
    auto future = op->future();
    enqueueCommand(std::move(op));
    co_await future;
    co_return;
}

QString Transcriber::loadedModel() const
{
    lock_guard lock{loaded_mutex_};
    if (!loaded_) {
        return {};
    }

    return QStringLiteral("%1 (%2)").arg(loaded_->model, loaded_->use_gpu ? "GPU" : "CPU");
}

void Transcriber::enqueueCommand(std::unique_ptr<Operation> &&op)
{
    assert(op);
    LOG_TRACE_N << "Enqueue command: " << op->op();
    if (!cmd_queue_.push(std::move(op))) {
        // The worker is gone. The Operation's destructor fails the future.
        LOG_WARN_N << "The transcriber is shutting down. Command dropped.";
    }
}

void Transcriber::run() noexcept
{
    LOG_DEBUG_N << "Transcriber worker started.";

    while(true) {
        cmd_queue_t::type_t op;
        if (!cmd_queue_.pop(op) || !op) {
            LOG_ERROR_N << "No command received, exiting...";
            break;
        }

        LOG_TRACE_N << "Processing command: " << op->op() << " queued for "
                    << chrono::duration_cast<chrono::milliseconds>(op->queuedFor()).count() << " ms";

        const auto op_type = op->op();
        switch(op_type) {
        case CmdType::TRANSCRIBE:
            if (stopping_) {
                op->setResult(false);
                break;
            }
            // Execute will set the result
            op->execute();
            break;
        case CmdType::UNLOAD:
            releaseModel();
            op->setResult(true);
            break;
        case CmdType::EXIT:
            LOG_DEBUG_N << "Exit command received, stopping transcriber...";
            cmd_queue_.stop();
            releaseModel();
            op->setResult(true);
            LOG_DEBUG_N << "Transcriber worker done.";
            return;
        }
    }
}

bool Transcriber::resolveUseGpu(const qvs::WhisperEngine &engine, ComputeDevice device)
{
    switch(device) {
    case ComputeDevice::Gpu:
        if (!engine.hasGpu()) {
            throw qvs::ScribeError{qvs::ErrorKind::ModelLoadError,
                                   tr("GPU was requested, but no GPU backend is available.")};
        }
        return true;
    case ComputeDevice::Auto:
        return engine.hasGpu();
    case ComputeDevice::Cpu:
        break;
    }
    return false;
}

qvs::WhisperSessionCtx &Transcriber::prepareModel(const TranscriptionOptions &options)
{
    auto& engine = ModelMgr::instance().whisperEngine();

    const auto *info = ModelMgr::findModelByName(options.model);
    if (!info) {
        throw qvs::ScribeError{qvs::ErrorKind::ModelLoadError,
                               tr("Unknown model: %1").arg(options.model)};
    }

    const bool use_gpu = resolveUseGpu(engine, options.device);

    {
        lock_guard lock{loaded_mutex_};
        if (loaded_ && loaded_->model == options.model && loaded_->use_gpu == use_gpu) {
            LOG_DEBUG_N << "Re-using the loaded model " << options.model;
            return *loaded_->session;
        }
    }

    releaseModel();

    const auto path = ModelMgr::instance().findModelPath(*info);
    if (error_code ec; !filesystem::is_regular_file(path, ec)) {
        throw qvs::ScribeError{qvs::ErrorKind::ModelLoadError,
                               tr("The model file for %1 is missing: %2")
                                   .arg(options.model, QString::fromStdString(path.string()))};
    }

    emit progress(tr("Loading model %1...").arg(options.model));

    ScopedTimer timer;
    qvs::WhisperEngineLoadParams params;
    params.use_gpu = use_gpu;

    auto ctx = engine.loadWhisper(string{info->id}, path, params);
    if (!ctx) {
        throw qvs::ScribeError{qvs::ErrorKind::ModelLoadError,
                               tr("Failed to load the model %1: %2")
                                   .arg(options.model, QString::fromStdString(engine.lastError()))};
    }

    auto session = ctx->createWhisperSession();
    if (!session) {
        throw qvs::ScribeError{qvs::ErrorKind::ModelLoadError,
                               tr("Failed to create a whisper session for %1: %2")
                                   .arg(options.model, QString::fromStdString(engine.lastError()))};
    }

    LOG_INFO_N << "Loaded model " << options.model << " in " << timer.elapsed()
               << " seconds. " << ctx->info();

    lock_guard lock{loaded_mutex_};
    loaded_.emplace(Loaded{options.model, use_gpu, std::move(ctx), std::move(session)});
    return *loaded_->session;
}

void Transcriber::releaseModel()
{
    lock_guard lock{loaded_mutex_};
    if (loaded_) {
        LOG_DEBUG_N << "Unloading model " << loaded_->model;
        // The session holds whisper state that refers to the context. Free it first.
        loaded_->session.reset();
        loaded_->ctx.reset();
        loaded_.reset();
    }
}

Transcriber::Result Transcriber::process(const AudioSource &source, const TranscriptionOptions &options)
{
    // Fail fast on a missing file, before we spend time loading a model
    if (!QFileInfo::exists(source.path())) {
        throw qvs::ScribeError{qvs::ErrorKind::FileNotFound,
                               tr("The audio file does not exist: %1").arg(source.path())};
    }

    auto& session = prepareModel(options);

    emit progress(tr("Decoding audio..."));
    ScopedTimer timer;
    const auto abort = [this] { return stopping_.load(); };
    const auto samples = AudioDecoder{}.decode(source, abort);
    LOG_DEBUG_N << "Decoded " << samples.size() << " samples from " << source.path()
                << " in " << timer.elapsed() << " seconds";

    emit progress(tr("Transcribing..."));
    timer.restart();

    qvs::WhisperSessionCtx::WhisperFullParams params;
    if (!options.autoLanguage()) {
        params.language = options.language.toStdString();
    }
    params.abort = abort;
    params.progress = [this](int percent) {
        emit progressPercent(percent);
    };

    qvs::WhisperSessionCtx::Transcript transcript;
    if (!session.whisperFull(samples, params, transcript)) {
        if (stopping_) {
            throw qvs::ScribeError{qvs::ErrorKind::TranscriptionFailure,
                                   tr("The transcription was cancelled.")};
        }
        throw qvs::ScribeError{qvs::ErrorKind::TranscriptionFailure,
                               tr("Whisper failed to transcribe %1: %2")
                                   .arg(source.path(),
                                        QString::fromStdString(ModelMgr::instance().whisperEngine().lastError()))};
    }

    const double audio_seconds = static_cast<double>(samples.size()) / AudioDecoder::sample_rate;
    LOG_INFO_N << "Transcribed " << audio_seconds << " seconds of audio in "
               << timer.elapsed() << " seconds with " << options.model;

    Result result;
    result.language = QString::fromStdString(transcript.language);
    if (options.autoLanguage()) {
        emit progress(tr("Detected language: %1").arg(result.language));
    }

    result.segments.reserve(transcript.segments.size());
    for (const auto& seg : transcript.segments) {
        result.segments.push_back({seg.t0_ms, seg.t1_ms, QString::fromStdString(seg.text)});
    }
    result.text = QString::fromStdString(transcript.full_text).trimmed();

    emit progress(tr("Writing output files..."));
    try {
        result.artifacts = transcript::writeAll(source.directory(), source.baseName(),
                                                result.segments, result.language);
    } catch (const qvs::ScribeError& ex) {
        // The text is in memory. Losing the sidecars only matters if the user asked for them.
        if (options.keep_files) {
            throw;
        }
        LOG_WARN_N << "Ignoring failure to write sidecar files: " << ex.what();
    }

    return result;
}

void Transcriber::Operation::execute() noexcept
{
    try {
        if (fn_) {
            const bool res = fn_();
            setResult(res);
            return;
        }

        setResult(true);
    } catch (const exception& ex) {
        setResult(false);
        LOG_WARN_N << "Exception during operation execution: " << ex.what();
    }
}
