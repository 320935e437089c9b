#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <format>
#include <functional>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string_view>

/*! Minimal logger for the engine wrapper libraries.
 *
 * The wrappers are built as separate shared libraries and must not depend on
 * logfault directly. They log through the macros below, and the application
 * installs a callback (see EngineBase::setLogger()) that forwards each message
 * into logfault. Until a callback is installed, messages go to std::clog.
 */

namespace qvs::logfwd {

// Same order as logfault::LogLevel
enum class Level { NONE, ERROR, WARN, NOTICE, INFO, DEBUG, TRACE };

struct SourceLoc {
    const char* file{};
    int line{};
    const char* func{};
};

using callback_t = std::function<void(Level lvl, SourceLoc loc, std::string_view msg, std::string_view tag)>;

inline std::string_view to_name(Level l) {
    constexpr static auto names = std::to_array<std::string_view>({
        ""/* None*/, "ERROR", "WARN", "NOTICE", "INFO", "DEBUG", "TRACE"
    });

    return names.at(static_cast<size_t>(l));
}

} // ns

template <>
struct std::formatter<qvs::logfwd::Level> : std::formatter<std::string_view> {
    auto format(qvs::logfwd::Level l, std::format_context& ctx) const {
        return std::formatter<std::string_view>::format(to_name(l), ctx);
    }
};

namespace qvs::logfwd {

struct Instance {
    std::mutex mutex;
    callback_t cb;
    std::string tag;
    std::atomic<Level> level{Level::INFO};
};

inline Instance& instance() {
    static Instance s;
    return s;
}

inline void setCallback(callback_t cb, std::string_view tag) {
    auto& i = instance();
    std::lock_guard lock{i.mutex};
    i.tag = tag;
    i.cb = std::move(cb);
}

inline void setLevel(Level lvl) noexcept {
    instance().level = lvl;
}

inline Level level() noexcept {
    return instance().level.load(std::memory_order_relaxed);
}

class Log {
public:
    Log(Level lvl, SourceLoc loc) : lvl_(lvl), loc_(loc) {}
    ~Log() { flush(); }

    std::ostream& Line() { return ss_; }

private:
    void flush() noexcept {
        const auto msg = ss_.str();
        if (msg.empty()) return;

        auto& i = instance();
        callback_t cb;
        std::string tag;
        {
            std::lock_guard lock{i.mutex};
            cb = i.cb;
            tag = i.tag;
        }

        if (cb) {
            cb(lvl_, loc_, msg, tag);
            return;
        }

        const auto now = std::chrono::system_clock::now();
        std::clog << std::format("{:%FT%T} [{}] {} {}", now, lvl_, tag, msg) << std::endl;
    }

    Level lvl_;
    SourceLoc loc_;
    std::ostringstream ss_;
};

#ifdef _LOGFAULT_H
// Only visible to code that has included logfault (the application).
static inline void forwardToLogfault(Level lvl,
                                     SourceLoc loc,
                                     std::string_view msg,
                                     std::string_view tag) {

    const auto lf_level = static_cast<logfault::LogLevel>(lvl);
    if (::logfault::LogManager::Instance().IsRelevant(lf_level)) {
        ::logfault::Log(lf_level, loc.file, loc.line, loc.func).Line() << '[' << tag << "] " << msg;
    }
}
#endif

} // namespace qvs::logfwd

#if defined(QVS_LOGFWD_ENABLE_LOGGING) && QVS_LOGFWD_ENABLE_LOGGING

#if defined(__GNUC__) || defined(__clang__)
#define QVS_LOGFWD_FUNC __PRETTY_FUNCTION__
#else
#define QVS_LOGFWD_FUNC __func__
#endif

#define QVS_LOGFWD_RELEVANT(lvl) \
    (lvl <= qvs::logfwd::level())

#define LOG_ERROR  QVS_LOGFWD_RELEVANT(qvs::logfwd::Level::ERROR) && qvs::logfwd::Log(qvs::logfwd::Level::ERROR,{}).Line()
#define LOG_WARN   QVS_LOGFWD_RELEVANT(qvs::logfwd::Level::WARN) && qvs::logfwd::Log(qvs::logfwd::Level::WARN,{}).Line()
#define LOG_INFO   QVS_LOGFWD_RELEVANT(qvs::logfwd::Level::INFO) && qvs::logfwd::Log(qvs::logfwd::Level::INFO,{}).Line()
#define LOG_DEBUG  QVS_LOGFWD_RELEVANT(qvs::logfwd::Level::DEBUG) && qvs::logfwd::Log(qvs::logfwd::Level::DEBUG,{}).Line()
#define LOG_TRACE  QVS_LOGFWD_RELEVANT(qvs::logfwd::Level::TRACE) && qvs::logfwd::Log(qvs::logfwd::Level::TRACE,{}).Line()

#define LOG_ERROR_N  QVS_LOGFWD_RELEVANT(qvs::logfwd::Level::ERROR) && qvs::logfwd::Log(qvs::logfwd::Level::ERROR, {__FILE__, __LINE__, QVS_LOGFWD_FUNC}).Line()
#define LOG_WARN_N   QVS_LOGFWD_RELEVANT(qvs::logfwd::Level::WARN) && qvs::logfwd::Log(qvs::logfwd::Level::WARN,   {__FILE__, __LINE__, QVS_LOGFWD_FUNC}).Line()
#define LOG_DEBUG_N  QVS_LOGFWD_RELEVANT(qvs::logfwd::Level::DEBUG) && qvs::logfwd::Log(qvs::logfwd::Level::DEBUG, {__FILE__, __LINE__, QVS_LOGFWD_FUNC}).Line()

#endif // QVS_LOGFWD_ENABLE_LOGGING
