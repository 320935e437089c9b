#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include <QObject>
#include <QFuture>
#include <QPromise>
#include <QString>
#include <QStringList>

#include <qcorotask.h>

#include "qvs/WhisperEngine.h"
#include "AudioSource.h"
#include "Queue.h"
#include "Session.h"
#include "TranscriptFormats.h"

/*! Runs whisper over an audio source.
 *
 *  The Transcriber owns a worker thread that does all the blocking work:
 *  loading the model, decoding the audio and running the inference. The UI
 *  thread enqueues an operation and co_awaits its future.
 *
 *  The last model is kept loaded and re-used when the next run asks for
 *  the same model on the same device.
 */
class Transcriber : public QObject
{
    Q_OBJECT

public:
    struct Result {
        QString text;
        QString language;
        segments_t segments;
        QStringList artifacts;  // sidecar files written next to the source
    };

    enum class CmdType {
        TRANSCRIBE,
        UNLOAD,
        EXIT
    };

    class Operation {
    public:
        using fn_t = std::function<bool()>;

        Operation(CmdType type, fn_t && fn = {})
            : type_{type}, fn_{std::move(fn)} {}

        ~Operation() {
            setResult(false); // If not set to true, default to false.
        }

        Operation(const Operation&) = delete;
        Operation& operator=(const Operation&) = delete;
        Operation(Operation&&) = delete;
        Operation& operator=(Operation&&) = delete;

        CmdType op() const noexcept { return type_; }

        void execute() noexcept;

        void setResult(bool ok) {
            std::call_once(promise_set_, [this, ok]() {
                promise_.start();
                promise_.addResult(ok);
                promise_.finish();
            });
        }

        QFuture<bool> future() {
            return promise_.future();
        }

        auto queuedFor() const noexcept {
            return std::chrono::steady_clock::now() - timestamp_;
        }

    private:
        QPromise<bool> promise_;
        std::once_flag promise_set_;
        CmdType type_;
        fn_t fn_;
        std::chrono::steady_clock::time_point timestamp_{std::chrono::steady_clock::now()};
    };

    using cmd_queue_t = Queue<std::unique_ptr<Operation>>;

    explicit Transcriber(QObject *parent = nullptr);
    ~Transcriber() override;

    Transcriber(const Transcriber&) = delete;
    Transcriber& operator=(const Transcriber&) = delete;

    /*! Transcribe the source with the options.
     *
     *  The model file must already be on disk (see ModelMgr::makeAvailable()).
     *
     *  \throws ScribeError ModelLoadError if the model can't be loaded on
     *          the requested device, UnsupportedFormat or TranscriptionFailure
     *          if the audio can't be decoded or whisper fails.
     */
    QCoro::Task<Result> transcribe(AudioSource source, TranscriptionOptions options);

    // Release the cached model. Returns when the worker has done it.
    QCoro::Task<void> unload();

    bool busy() const noexcept { return busy_; }

    /*! Decide if a model should be placed on the GPU.
     *
     *  \throws ScribeError ModelLoadError if the GPU is requested and there is none.
     */
    static bool resolveUseGpu(const qvs::WhisperEngine& engine, ComputeDevice device);

    // Model name and device of the cached model, like "base.en (GPU)". Empty if none.
    QString loadedModel() const;

signals:
    // Human readable progress for the status line
    void progress(const QString& message);

    // Whisper's own progress, 0 - 100
    void progressPercent(int percent);

private:
    // Worker side
    void run() noexcept;
    Result process(const AudioSource& source, const TranscriptionOptions& options);
    qvs::WhisperSessionCtx& prepareModel(const TranscriptionOptions& options);
    void releaseModel();

    void enqueueCommand(std::unique_ptr<Operation> && op);

    struct Loaded {
        QString model;
        bool use_gpu{};
        std::shared_ptr<qvs::WhisperCtx> ctx;
        std::shared_ptr<qvs::WhisperSessionCtx> session;
    };

    std::optional<Loaded> loaded_;
    mutable std::mutex loaded_mutex_;
    std::atomic_bool stopping_{false};
    std::atomic_bool busy_{false};
    cmd_queue_t cmd_queue_;
    std::optional<std::jthread> worker_;
};

std::ostream& operator << (std::ostream& os, Transcriber::CmdType cmd);
