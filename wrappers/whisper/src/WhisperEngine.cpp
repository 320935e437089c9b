#include <cassert>
#include <format>
#include <memory>
#include <mutex>
#include <thread>

#include "qvs/WhisperEngine.h"
#include "qvs/log_wrapper.h"

#include <ggml-backend.h>
#include <whisper.h>

using namespace std;

namespace qvs {

namespace {

class WhisperImpl;
class WhisperCtxImpl;

void whisperLogger(ggml_log_level level, const char *msg, void *) {
    if (!msg) {
        return;
    }

    string_view message(msg);
    if (!message.empty() && message.back() == '\n') {
        message.remove_suffix(1);
    }

    if (message.empty()) {
        return;
    }

    switch(level) {
    case GGML_LOG_LEVEL_ERROR:
        LOG_ERROR << "[whisper] " << message;
        break;
    case GGML_LOG_LEVEL_WARN:
        LOG_WARN << "[whisper] " << message;
        break;
    case GGML_LOG_LEVEL_INFO:
        LOG_DEBUG << "[whisper] " << message;
        break;
    case GGML_LOG_LEVEL_DEBUG:
    case GGML_LOG_LEVEL_CONT:
        LOG_TRACE << "[whisper] " << message;
        break;
    default:
        break;
    }
}

int defaultThreads() {
    const auto thds = std::thread::hardware_concurrency();
    if (thds > 32) {
        return static_cast<int>(thds - 4);
    }
    if (thds > 4) {
        return static_cast<int>(thds - 1);
    }
    return 4;
}

class WhisperSessionCtxImpl final : public WhisperSessionCtx {
public:
    WhisperSessionCtxImpl(shared_ptr<WhisperCtxImpl> modelCtx, whisper_state *state);
    ~WhisperSessionCtxImpl() override;

    bool whisperFull(std::span<const float> data, const WhisperFullParams &params, Transcript& out) override;

private:
    shared_ptr<WhisperCtxImpl> model_ctx_;
    whisper_state *state_{nullptr};
};


class WhisperCtxImpl final : public WhisperCtx, public enable_shared_from_this<WhisperCtxImpl> {
public:
    WhisperCtxImpl(WhisperImpl& engine, string_view modelId, whisper_context *ctx, bool onGpu)
        : engine_{engine}, model_id_{modelId}, ctx_{ctx}, on_gpu_{onGpu}
    {
        assert(ctx_ != nullptr);
    }

    ~WhisperCtxImpl() override;

    string info() const noexcept override;

    const WhisperImpl& wengine() const noexcept {
        return engine_;
    }

    const string &modelId() const noexcept override {
        return model_id_;
    }

    std::shared_ptr<WhisperSessionCtx> createWhisperSession() override {
        LOG_DEBUG << "Creating new Whisper session for model " << model_id_;

        if (auto state = whisper_init_state(ctx_)) {
            return make_shared<WhisperSessionCtxImpl>(shared_from_this(), state);
        }

        LOG_ERROR << "Failed to create whisper state for model " << model_id_;
        return {};
    }

    whisper_context *ctx() noexcept {
        return ctx_;
    }

private:
    WhisperImpl& engine_;
    const std::string model_id_;
    whisper_context *ctx_{nullptr};
    const bool on_gpu_{false};
};

class WhisperImpl final : public WhisperEngine {
public:
    WhisperImpl(const WhisperCreateParams& /*params*/)
    {
        LOG_DEBUG << "Creating Whisper engine";
        whisper_log_set(whisperLogger, nullptr);
    }

    ~WhisperImpl() override {
        LOG_DEBUG << "Destroying Whisper engine";
    }

    string version() const override {
        string_view v;
        if (const auto p = whisper_version()) {
            v = p;
        }

        return format("whisper.cpp {}", v);
    }

    bool init() override {
        // Dynamic backends (CUDA, Vulkan, Metal...) must be registered before
        // we can ask ggml what devices it has.
        static once_flag once;
        call_once(once, [] {
            ggml_backend_load_all();
        });

        for(const auto& dev : devices()) {
            LOG_INFO << "ggml device: " << dev;
        }

        LOG_INFO << version() << " initialized. GPU available: " << (hasGpu() ? "yes" : "no");
        return clearError();
    }

    string lastError() const override {
        lock_guard lock{mutex_};
        return error_;
    }

    void setLogger(logfwd::callback_t cb, logfwd::Level level) override {
        logfwd::setCallback(std::move(cb), "whisper");
        logfwd::setLevel(level);
    }

    bool hasGpu() const override {
        const auto count = ggml_backend_dev_count();
        for (size_t i = 0; i < count; ++i) {
            if (auto *dev = ggml_backend_dev_get(i)) {
                if (ggml_backend_dev_type(dev) == GGML_BACKEND_DEVICE_TYPE_GPU) {
                    return true;
                }
            }
        }
        return false;
    }

    vector<string> devices() const override {
        vector<string> names;
        const auto count = ggml_backend_dev_count();
        names.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            if (auto *dev = ggml_backend_dev_get(i)) {
                const auto *name = ggml_backend_dev_name(dev);
                const auto *desc = ggml_backend_dev_description(dev);
                names.emplace_back(format("{} ({})", name ? name : "?", desc ? desc : ""));
            }
        }
        return names;
    }

    std::shared_ptr<WhisperCtx> loadWhisper(const std::string &modelId,
                                            const std::filesystem::path &modelPath,
                                            const WhisperEngineLoadParams &params) override {

        LOG_DEBUG << "Loading Whisper model " << modelId << " from " << modelPath
                  << " use_gpu=" << params.use_gpu;

        if (params.use_gpu && !hasGpu()) {
            return failed("GPU requested, but ggml has no GPU backend");
        }

        error_code ec;
        if (!filesystem::is_regular_file(modelPath, ec)) {
            return failed(format("Model file not found: {}", modelPath.string()));
        }

        whisper_context_params cparams = whisper_context_default_params();
        cparams.use_gpu = params.use_gpu;
        cparams.dtw_token_timestamps = false;
        cparams.dtw_aheads_preset = WHISPER_AHEADS_NONE;

        if (auto *ctx = whisper_init_from_file_with_params_no_state(modelPath.string().c_str(), cparams)) {
            auto modelCtx = make_shared<WhisperCtxImpl>(*this, modelId, ctx, params.use_gpu);
            clearError();

            // When the shared pointer goes out of scope, the model is unloaded
            return modelCtx;
        }

        return failed(format("Failed to load Whisper model from {}. The file may be corrupt or incompatible.",
                             modelPath.string()));
    }

private:
    shared_ptr<WhisperCtx> failed(string msg) {
        LOG_ERROR << msg;
        setError(std::move(msg));
        return {};
    }

    void setError(string msg) {
        lock_guard lock{mutex_};
        error_ = std::move(msg);
    }

    bool clearError() {
        lock_guard lock{mutex_};
        error_.clear();
        return true;
    }

    mutable mutex mutex_;
    string error_;
};

WhisperCtxImpl::~WhisperCtxImpl() {
    if (ctx_) {
        LOG_DEBUG << "Unloading Whisper model " << model_id_;
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

string WhisperCtxImpl::info() const noexcept
{
    return format("{}, model={}, device={}", wengine().version(), modelId(), on_gpu_ ? "gpu" : "cpu");
}

WhisperSessionCtxImpl::WhisperSessionCtxImpl(shared_ptr<WhisperCtxImpl> modelCtx, whisper_state *state)
    : model_ctx_{std::move(modelCtx)}, state_{state}
{
    assert(model_ctx_ != nullptr);
    assert(state_ != nullptr);
}

WhisperSessionCtxImpl::~WhisperSessionCtxImpl()
{
    if (state_) {
        whisper_free_state(state_);
        state_ = nullptr;
    }
}

bool WhisperSessionCtxImpl::whisperFull(std::span<const float> data, const WhisperFullParams &params, Transcript& out) {
    auto p = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);

    p.print_progress = false;
    p.print_realtime = false;
    p.print_timestamps = false;
    p.n_threads = defaultThreads();

    // whisper.cpp defaults to "en". "auto" makes it run language detection
    // on the first 30 seconds.
    p.language = params.language.empty() ? "auto" : params.language.c_str();

    if (params.abort) {
        p.abort_callback = [](void *userData) -> bool {
            const auto& fn = *static_cast<const std::function<bool()> *>(userData);
            return fn();
        };
        p.abort_callback_user_data = const_cast<std::function<bool()> *>(&params.abort);
    }

    if (params.progress) {
        p.progress_callback = [](whisper_context *, whisper_state *, int progress, void *userData) {
            const auto& fn = *static_cast<const std::function<void(int)> *>(userData);
            fn(progress);
        };
        p.progress_callback_user_data = const_cast<std::function<void(int)> *>(&params.progress);
    }

    LOG_DEBUG << "Running whisper: language=" << p.language
              << ", n_threads=" << p.n_threads
              << ", samples=" << data.size();

    out.segments.clear();
    out.full_text.clear();
    out.language.clear();

    const auto rc = whisper_full_with_state(model_ctx_->ctx(), state_, p, data.data(), static_cast<int>(data.size()));
    if (rc != 0) {
        LOG_ERROR << "whisper_full_with_state failed with rc=" << rc;
        return false;
    }

    const int n = whisper_full_n_segments_from_state(state_);
    out.segments.reserve(std::max(0, n));

    for (int i = 0; i < n; ++i) {
        Segment seg{};
        // whisper uses 10ms units
        seg.t0_ms = whisper_full_get_segment_t0_from_state(state_, i) * 10;
        seg.t1_ms = whisper_full_get_segment_t1_from_state(state_, i) * 10;

        if (const char* txt = whisper_full_get_segment_text_from_state(state_, i)) {
            seg.text.assign(txt);
            out.full_text += seg.text;
        }
        out.segments.push_back(std::move(seg));
    }

    if (!params.language.empty()) {
        out.language = params.language;
    } else if (const auto id = whisper_full_lang_id_from_state(state_); id >= 0) {
        if (const auto *lang = whisper_lang_str(id)) {
            out.language = lang;
        }
    }

    LOG_DEBUG << "Whisper produced " << n << " segments, language=" << out.language;
    return true;
}

} // anon ns

std::shared_ptr<WhisperEngine> WhisperEngine::create(const WhisperCreateParams &params)
{
    return make_shared<WhisperImpl>(params);
}

WhisperCtx::WhisperCtx() = default;
WhisperCtx::~WhisperCtx() = default;

WhisperSessionCtx::WhisperSessionCtx() = default;
WhisperSessionCtx::~WhisperSessionCtx() = default;

WhisperEngine::WhisperEngine() = default;
WhisperEngine::~WhisperEngine() = default;

} // ns
