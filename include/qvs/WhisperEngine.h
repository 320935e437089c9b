#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <span>
#include <vector>

#include "EngineBase.h"

#if defined(_WIN32)
#if defined(QVS_WHISPER_WRAP_BUILD)
#define QVS_WHISPER_WRAP_API __declspec(dllexport)
#else
#define QVS_WHISPER_WRAP_API __declspec(dllimport)
#endif
#else
#define QVS_WHISPER_WRAP_API __attribute__((visibility("default")))
#endif

namespace qvs {

class WhisperEngine;

struct WhisperEngineLoadParams {
    bool use_gpu{};
};

/*! Session context for Whisper model sessions.
 *
 *  A session owns the whisper decoder state. Create one per audio stream.
 */
class QVS_WHISPER_WRAP_API WhisperSessionCtx {
public:
    struct WhisperFullParams {
        std::string language; // empty for auto

        // Polled by whisper between decoder steps. Return true to abort the run.
        std::function<bool()> abort;

        // Called from the decoding thread with the progress in percent.
        std::function<void(int)> progress;
    };

    struct Segment {
        int64_t t0_ms = 0;
        int64_t t1_ms = 0;
        std::string text;
    };

    struct Transcript {
        std::vector<Segment> segments;
        std::string full_text;
        std::string language;               // detected or forced
    };

    WhisperSessionCtx();
    virtual ~WhisperSessionCtx();

    /*! Processes the full audio data using the Whisper model.
     *
     * @param data Audio data as 16 kHz mono float samples in [-1, 1].
     * @param params Parameters for the Whisper processing.
     * @param out Output transcript structure to hold the results.
     * @return True if processing was successful, false otherwise.
     */
    virtual bool whisperFull(std::span<const float> data,
                             const WhisperFullParams& params,
                             Transcript& out) = 0;

};

/*! Context for a loaded Whisper model.
 *
 */
class QVS_WHISPER_WRAP_API WhisperCtx : public ModelCtx {
public:
    WhisperCtx();
    virtual ~WhisperCtx();
};

/*! Whisper engine interface
 *
 */
class QVS_WHISPER_WRAP_API WhisperEngine : public EngineBase {
public:
    QVS_WHISPER_WRAP_API WhisperEngine();
    QVS_WHISPER_WRAP_API virtual ~WhisperEngine();

    struct WhisperCreateParams{};

    /*! Creates a new Whisper engine instance.
     *
     * @param params Parameters for creating the engine.
     * @return Shared pointer to the new Whisper engine instance.
     */
    static QVS_WHISPER_WRAP_API std::shared_ptr<WhisperEngine> create(const WhisperCreateParams& params);

    /*! True if ggml has at least one GPU backend device registered. */
    virtual bool hasGpu() const = 0;

    /*! Human readable names of the ggml backend devices, for logging. */
    virtual std::vector<std::string> devices() const = 0;

    virtual std::shared_ptr<WhisperCtx> loadWhisper(const std::string& modelId,
                                                    const std::filesystem::path& modelPath,
                                                    const WhisperEngineLoadParams& params) = 0;
};

} // ns
