#pragma once

#include <string>
#include <memory>

#include "log_wrapper.h"

/*! Only pure interfaces here. The implementation lives in a separate library.
 */

namespace qvs {

class WhisperSessionCtx;

/*! Context for a loaded model.
 *
 * Specific engines will define their own context structures.
 */
class ModelCtx {
public:
    ModelCtx() = default;
    virtual ~ModelCtx() = default;

    virtual std::string info() const noexcept = 0;

    virtual const std::string& modelId() const noexcept = 0;

    /*! Creates a new Whisper session context for processing.
     *
     * @return Shared pointer to the newly created session context, or nullptr on failure.
     */
    virtual std::shared_ptr<WhisperSessionCtx> createWhisperSession() {
        return {};
    };
};


/* Abstract interface for the engine base.
 *
 * The actual implementation (whisper) derives from this. It is built as a
 * separate shared library to keep whisper.cpp and ggml isolated from the
 * Qt application.
 */

class EngineBase {
public:
    EngineBase() = default;
    virtual ~EngineBase() = default;

    /*! Returns the version string of the underlying engine/library.
     *
     * Example: "whisper.cpp 1.7.4"
     */
    virtual std::string version() const = 0;

    /*! One time initialization of the engine.
     *
     * Must be called before any other methods.
     */
    virtual bool init() = 0;

    /*! Returns the last error message, if any.
     *
     * If the last operation was successful, returns an empty string.
     */
    virtual std::string lastError() const = 0;

    /*! Route the library's log messages to the application.
     *
     * @param cb Callback that receives each log message.
     * @param level Only messages at this level or more severe are forwarded.
     */
    virtual void setLogger(logfwd::callback_t cb, logfwd::Level level) = 0;
};

} // ns
