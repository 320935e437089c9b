#include <array>
#include <chrono>
#include <filesystem>
#include <format>

#include <QFile>
#include <QNetworkRequest>
#include <QNetworkReply>
#include <QScopeGuard>
#include <QSettings>
#include <QStandardPaths>
#include <QtConcurrent/QtConcurrentRun>

#include <qcoro/core/qcorofuture.h>
#include <qcoro/network/qcoronetwork.h>
#include <qcoronetworkreply.h>

#include "logging.h"

#include "qvs/log_wrapper.h"
#include "ModelMgr.h"
#include "ScopedTimer.h"
#include "ScribeError.h"

using namespace std;

namespace {

// A download that gets no data for this long is given up
constexpr auto download_stall_timeout = chrono::seconds{60};

constexpr string_view whisper_url = "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/";

using mi_t = ModelInfo;
constexpr auto all_whisper_models = std::to_array<mi_t>({
    {"tiny",      "tiny",           "ggml-tiny.bin",           75,   "39 M",   "~1 GB",  "~10x", true,  whisper_url},
    {"tiny.en",   "tiny.en",        "ggml-tiny.en.bin",        75,   "39 M",   "~1 GB",  "~10x", false, whisper_url},
    {"base",      "base",           "ggml-base.bin",           142,  "74 M",   "~1 GB",  "~7x",  true,  whisper_url},
    {"base.en",   "base.en",        "ggml-base.en.bin",        142,  "74 M",   "~1 GB",  "~7x",  false, whisper_url},
    {"small",     "small",          "ggml-small.bin",          466,  "244 M",  "~2 GB",  "~4x",  true,  whisper_url},
    {"small.en",  "small.en",       "ggml-small.en.bin",       466,  "244 M",  "~2 GB",  "~4x",  false, whisper_url},
    {"medium",    "medium",         "ggml-medium.bin",         1533, "769 M",  "~5 GB",  "~2x",  true,  whisper_url},
    {"medium.en", "medium.en",      "ggml-medium.en.bin",      1533, "769 M",  "~5 GB",  "~2x",  false, whisper_url},
    {"large",     "large-v3",       "ggml-large-v3.bin",       2951, "1550 M", "~10 GB", "1x",   true,  whisper_url},
    {"large-v2",  "large-v2",       "ggml-large-v2.bin",       2951, "1550 M", "~10 GB", "1x",   true,  whisper_url},
    {"large-v3",  "large-v3",       "ggml-large-v3.bin",       2951, "1550 M", "~10 GB", "1x",   true,  whisper_url},
    {"turbo",     "large-v3-turbo", "ggml-large-v3-turbo.bin", 1624, "809 M",  "~6 GB",  "~8x (optimized large-v3)", true, whisper_url},
});

} // anon ns

ModelMgr *ModelMgr::self_{};

ModelMgr::ModelMgr(QObject *parent)
    : QObject(parent)
{
    Q_ASSERT(!self_);
    self_ = this;
}

ModelMgr::~ModelMgr()
{
    // The pool thread uses this instance
    if (!engine_future_.isFinished()) {
        LOG_DEBUG_N << "Waiting for the whisper engine to finish initializing...";
        engine_future_.waitForFinished();
    }

    if (self_ == this) {
        self_ = nullptr;
    }
}

model_list_t ModelMgr::availableModels() noexcept
{
    return all_whisper_models;
}

const ModelInfo *ModelMgr::findModelByName(const QString &name) noexcept
{
    const auto key = name.trimmed().toStdString();
    for (const auto &m : all_whisper_models) {
        if (m.name == key || m.id == key) {
            return &m;
        }
    }

    LOG_WARN_N << "No whisper model found matching name='" << key << "'";
    return nullptr;
}

qvs::WhisperEngine &ModelMgr::whisperEngine() {

    lock_guard lock{engine_mutex_};
    if (!whisper_engine_) {
        auto engine = qvs::WhisperEngine::create({});
        if (!engine) {
            LOG_ERROR_N << "Failed to create Whisper engine instance.";
            throw qvs::ScribeError{qvs::ErrorKind::ModelLoadError, string{"Failed to create the Whisper engine."}};
        }

        engine->setLogger(qvs::logfwd::forwardToLogfault,
                          static_cast<qvs::logfwd::Level>(
                              ::logfault::LogManager::Instance().GetLoglevel()));

        if (!engine->init()) {
            LOG_ERROR_N << "Failed to initialize the Whisper engine: " << engine->lastError();
            throw qvs::ScribeError{qvs::ErrorKind::ModelLoadError,
                                   format("Failed to initialize the Whisper engine: {}", engine->lastError())};
        }

        LOG_INFO_N << "Using " << engine->version();
        whisper_engine_ = std::move(engine);
    }

    return *whisper_engine_;
}

QCoro::Task<bool> ModelMgr::prepareEngine()
{
    auto future = QtConcurrent::run([this]() -> bool {
        try {
            const ScopedTimer timer;
            whisperEngine();
            LOG_DEBUG_N << "Whisper engine ready in " << timer.elapsed() << " seconds";
            return true;
        } catch (const qvs::ScribeError& ex) {
            LOG_ERROR_N << "Failed to prepare the whisper engine: " << ex;
            return false;
        }
    });

    engine_future_ = future;
    co_return co_await future;
}

QString ModelMgr::modelsDirectory()
{
    auto base = QSettings{}.value("models/path", "").toString().trimmed();
    if (base.isEmpty()) {
        base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation) + "/models";
    }
    return base;
}

std::filesystem::path ModelMgr::findModelPath(const ModelInfo &modelInfo) const
{
    filesystem::path model_dir = modelsDirectory().toStdString();
    model_dir /= "whisper_models";

    if (error_code ec; !filesystem::is_directory(model_dir, ec)) {
        LOG_INFO_N << "Creating model directory: " << model_dir;
        filesystem::create_directories(model_dir, ec);
        if (ec) {
            LOG_WARN_N << "Failed to create " << model_dir << ": " << ec.message();
        }
    }

    return model_dir / modelInfo.filename;
}

bool ModelMgr::isDownloaded(const ModelInfo &modelInfo) const
{
    error_code ec;
    return filesystem::is_regular_file(findModelPath(modelInfo), ec);
}

QCoro::Task<bool> ModelMgr::makeAvailable(const ModelInfo &modelInfo)
{
    const auto model_path = findModelPath(modelInfo);

    LOG_DEBUG_N << "Making model available: id='" << modelInfo.id << "'"
                << ", path='" << model_path << "'";

    if (error_code ec; filesystem::is_regular_file(model_path, ec)) {
        co_return true;
    }

    co_return co_await downloadModel(modelInfo, QString::fromStdString(model_path.string()));
}

QCoro::Task<bool> ModelMgr::downloadModel(const ModelInfo &modelInfo, const QString& fullPath)
{
    QString surl{QString::fromUtf8(modelInfo.download_url)};
    if (modelInfo.download_url.ends_with('/')) {
        surl += QString::fromUtf8(modelInfo.filename);
    }

    const QUrl url{surl};

    LOG_INFO_N << "Starting download of model: id='" << modelInfo.id << "'"
               << ", url='" << url.toString() << "'"
               << ", path='" << fullPath << "'";

    const bool success = co_await downloadFile(QString::fromUtf8(modelInfo.name), url, fullPath);
    if (!success) {
        LOG_ERROR_N << "Failed to download model file: " << url.toString();
        co_return false;
    }

    LOG_INFO_N << "Model file downloaded successfully: " << fullPath;
    emit modelDownloaded(QString::fromUtf8(modelInfo.id));
    co_return true;
}

QCoro::Task<bool> ModelMgr::downloadFile(const QString& name,
                                         const QUrl &url,
                                         const QString &fullPath)
{
    if (!nam_) {
        nam_ = new QNetworkAccessManager(this);
    }

    const QString tmpPath = fullPath + ".part";

    QNetworkRequest request{url};
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);
    QNetworkReply *reply = nam_->get(request);

    // Delete the reply, and any partial file, when we leave
    const auto guard = qScopeGuard([reply, tmpPath] {
        reply->deleteLater();
        if (QFile::exists(tmpPath)) {
            LOG_DEBUG_N << "Removing temporary file: " << tmpPath;
            QFile::remove(tmpPath);
        }
    });

    QFile out(tmpPath);
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR_N << "Failed to create " << tmpPath << ": " << out.errorString();
        reply->abort();
        co_return false;
    }

    bool write_error = false;

    connect(reply, &QNetworkReply::downloadProgress,
            this, [this, name](qint64 bytesReceived, qint64 bytesTotal) {
        if (bytesTotal > 0) {
            const double ratio = static_cast<double>(bytesReceived) / static_cast<double>(bytesTotal);
            emit downloadProgressRatio(name, ratio);
        }
    });

    auto drainToFile = [&](QNetworkReply *r) {
        while (r->bytesAvailable() > 0) {
            const QByteArray chunk = r->read(64 * 1024);
            if (chunk.isEmpty()) {
                break;
            }

            if (out.write(chunk) != chunk.size()) {
                write_error = true;
                r->abort();
                break;
            }
        }
    };

    auto coreply = qCoro(reply);
    while (true) {
        drainToFile(reply);
        if (write_error) {
            LOG_ERROR_N << "Disk write error while downloading " << url.toString()
                        << ": " << out.errorString();
            co_return false;
        }

        if (reply->isFinished()) {
            if (reply->bytesAvailable() == 0) {
                break;
            }
            continue;
        }

        if (reply->error() != QNetworkReply::NoError) {
            LOG_ERROR_N << "Download error detected: " << reply->errorString();
            co_return false;
        }

        if (!co_await coreply.waitForReadyRead(download_stall_timeout) && !reply->isFinished()) {
            LOG_ERROR_N << "Download of " << url.toString() << " stalled. Giving up.";
            reply->abort();
            co_return false;
        }
    }

    out.close();

    if (reply->error() != QNetworkReply::NoError) {
        LOG_ERROR_N << "Network error while downloading " << url.toString()
                    << ": " << reply->errorString();
        co_return false;
    }

    // Local mirrors (file://) have no status code
    const int http_status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (url.scheme().startsWith("http") && (http_status < 200 || http_status >= 300)) {
        LOG_ERROR_N << "Download of " << url.toString() << " failed with HTTP status " << http_status;
        co_return false;
    }

    QFile::remove(fullPath);
    if (!QFile::rename(tmpPath, fullPath)) {
        LOG_ERROR_N << "Failed to rename " << tmpPath << " to " << fullPath;
        co_return false;
    }

    emit downloadProgressRatio(name, 1.0);
    co_return true;
}
