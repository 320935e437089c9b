#pragma once

#include <filesystem>
#include <memory>
#include <mutex>

#include <QFuture>
#include <QObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>

#include <qcorotask.h>

#include "qvs/WhisperEngine.h"
#include "ModelInfo.h"

/*! Model Manager

 Knows the whisper models we support, where their files are stored,
 and downloads them when they are missing. It also owns the whisper
 engine instance.

 Signals:
 - downloadProgressRatio(name, ratio): Emitted during model download.
 - modelDownloaded(id): Emitted when a model file is in place.
*/
class ModelMgr : public QObject
{
    Q_OBJECT

public:
    explicit ModelMgr(QObject *parent = nullptr);
    ~ModelMgr() override;

    static ModelMgr& instance() {
        Q_ASSERT(self_);
        return *self_;
    }

    static model_list_t availableModels() noexcept;

    // Accepts the display name ("base.en") or the id
    static const ModelInfo *findModelByName(const QString& name) noexcept;

    /*! The whisper engine. Created and initialized on first use.
     *
     *  Thread safe. Called from the transcription worker.
     *  \throws ScribeError ModelLoadError if the engine can't be created.
     */
    qvs::WhisperEngine& whisperEngine();

    // Creates the engine in a worker thread. Loading the ggml backends may take a while.
    QCoro::Task<bool> prepareEngine();

    // Full path to the model file in the "models/path" directory
    std::filesystem::path findModelPath(const ModelInfo &modelInfo) const;
    bool isDownloaded(const ModelInfo& modelInfo) const;

    /*! Make sure the model file is on disk, downloading it if required.
     *
     *  \return true if the file is available.
     */
    QCoro::Task<bool> makeAvailable(const ModelInfo& modelInfo);

    static QString modelsDirectory();

signals:
    void downloadProgressRatio(const QString& name, double ratio); // 0..1
    void modelDownloaded(const QString& id);

private:
    QCoro::Task<bool> downloadModel(const ModelInfo &modelInfo, const QString& fullPath);
    QCoro::Task<bool> downloadFile(const QString& name, const QUrl& url, const QString& fullPath);

    QNetworkAccessManager *nam_{};
    std::mutex engine_mutex_;
    std::shared_ptr<qvs::WhisperEngine> whisper_engine_;
    QFuture<bool> engine_future_;
    static ModelMgr *self_;
};
