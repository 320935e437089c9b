#pragma once

#include <QObject>
#include <QTimer>
#include <QUrl>

#include <qcorotask.h>

#include "AudioController.h"
#include "AudioRecorder.h"
#include "AvailableModelsModel.h"
#include "LanguagesModel.h"
#include "ModelMgr.h"
#include "Session.h"
#include "Transcriber.h"

namespace qvs {
class ScribeError;
}

/*! The glue between the QML UI and the rest of the application.
 *
 *  Owns the Session and reflects its state as properties. All methods
 *  are called on the UI thread.
 */
class AppEngine : public QObject
{
    Q_OBJECT

    Q_PROPERTY(State state READ state NOTIFY stateChanged)
    Q_PROPERTY(const QString& stateText READ stateText NOTIFY stateTextChanged)
    Q_PROPERTY(const QString& recordingTime MEMBER recording_time_ NOTIFY recordingTimeChanged)
    Q_PROPERTY(const qreal& recordingLevel MEMBER recording_level_ NOTIFY recordingLevelChanged)
    Q_PROPERTY(QString transcript READ transcript WRITE setTranscript NOTIFY transcriptChanged)
    Q_PROPERTY(bool canRecord READ canRecord NOTIFY stateFlagsChanged)
    Q_PROPERTY(bool canStop READ canStop NOTIFY stateFlagsChanged)
    Q_PROPERTY(bool canOpenFile READ canOpenFile NOTIFY stateFlagsChanged)
    Q_PROPERTY(bool canTranscribe READ canTranscribe NOTIFY stateFlagsChanged)
    Q_PROPERTY(bool canSave READ canSave NOTIFY stateFlagsChanged)
    Q_PROPERTY(bool canClear READ canClear NOTIFY stateFlagsChanged)
    Q_PROPERTY(bool isBusy READ isBusy NOTIFY stateFlagsChanged)
    Q_PROPERTY(bool isTranscribing READ isTranscribing NOTIFY stateFlagsChanged)
    Q_PROPERTY(bool settingsEnabled READ settingsEnabled NOTIFY stateFlagsChanged)
    Q_PROPERTY(AvailableModelsModel *models READ models CONSTANT)
    Q_PROPERTY(LanguagesModel *languages READ languages CONSTANT)
    Q_PROPERTY(QStringList devices READ devices CONSTANT)
    Q_PROPERTY(int deviceIndex READ deviceIndex WRITE setDeviceIndex NOTIFY deviceIndexChanged)
    Q_PROPERTY(bool keepFiles READ keepFiles WRITE setKeepFiles NOTIFY keepFilesChanged)
    Q_PROPERTY(QString modelSummary READ modelSummary NOTIFY modelSummaryChanged)
    Q_PROPERTY(const QStringList& microphones READ microphones NOTIFY microphonesChanged)
    Q_PROPERTY(int currentMic READ currentMic WRITE setCurrentMic NOTIFY currentMicChanged)
    Q_PROPERTY(QString suggestedSaveName READ suggestedSaveName NOTIFY stateFlagsChanged)
    Q_PROPERTY(QStringList audioNameFilters READ audioNameFilters CONSTANT)
    Q_PROPERTY(double downloadProgress MEMBER download_progress_ NOTIFY downloadProgressChanged)

public:
    enum State {
        Idle,
        Recording,
        Ready,
        Transcribing,
        Transcribed
    };
    Q_ENUM(State)

    Q_INVOKABLE void toggleRecording();
    Q_INVOKABLE void startRecording();
    Q_INVOKABLE void stopRecording();
    Q_INVOKABLE void openAudioFile(const QUrl &url);
    Q_INVOKABLE void transcribe();
    Q_INVOKABLE bool saveTranscriptToFile(const QUrl &url);
    Q_INVOKABLE void clearTranscript();
    Q_INVOKABLE QString aboutText() const;

    AppEngine();
    ~AppEngine() override;

    State state() const noexcept;
    const QString& stateText() const noexcept { return state_text_; }
    const QString& transcript() const noexcept { return session_.transcript(); }
    void setTranscript(const QString& text);

    bool canRecord() const noexcept { return session_.canRecord(); }
    bool canStop() const noexcept { return session_.state() == Session::State::Recording; }
    bool canOpenFile() const noexcept { return session_.canOpenFile(); }
    bool canTranscribe() const noexcept { return session_.canTranscribe(); }
    bool canSave() const noexcept { return !session_.isBusy() && !session_.transcript().trimmed().isEmpty(); }
    bool canClear() const noexcept { return session_.canClear(); }
    bool isBusy() const noexcept { return session_.isBusy(); }
    bool isTranscribing() const noexcept { return session_.state() == Session::State::Transcribing; }
    bool settingsEnabled() const noexcept { return session_.canChangeOptions(); }

    AvailableModelsModel *models() { return &models_; }
    LanguagesModel *languages() { return &languages_; }
    QStringList devices() const;
    int deviceIndex() const noexcept;
    void setDeviceIndex(int index);
    bool keepFiles() const noexcept { return session_.options().keep_files; }
    void setKeepFiles(bool keep);
    QString modelSummary() const;

    AudioController &audioController() { return audio_controller_; }
    const QStringList& microphones() const noexcept { return microphones_; }
    int currentMic() const;
    void setCurrentMic(int index);

    QString suggestedSaveName() const;
    static QStringList audioNameFilters();

    const Session& session() const noexcept { return session_; }

    static void initLogging();

signals:
    void stateChanged();
    void stateTextChanged();
    void stateFlagsChanged();
    void recordingTimeChanged();
    void recordingLevelChanged();
    void transcriptChanged();
    void deviceIndexChanged();
    void keepFilesChanged();
    void modelSummaryChanged();
    void microphonesChanged();
    void currentMicChanged();
    void downloadProgressChanged();
    void errorOccurred(const QString& title, const QString &message);
    void transcriptSaved(const QString& path);

private:
    QCoro::Task<void> runTranscription();
    void syncOptions();
    void discardReplacedSource();
    void failed(const qvs::ScribeError& error);
    void failed(const QString& title, const QString& why);
    void setStateText(QString text = {});
    void refresh();
    void updateMicrophones();
    void onRecordingTick();

    // Must be constructed before the models that use it
    ModelMgr model_mgr_;
    Session session_;
    AudioController audio_controller_;
    AudioRecorder recorder_;
    Transcriber transcriber_;
    AvailableModelsModel models_{"transcribe/model"};
    LanguagesModel languages_{"transcribe/language"};
    QTimer recording_timer_;
    int recording_seconds_{};
    QString recording_time_{"00:00"};
    qreal recording_level_{};
    QString state_text_;
    Session::State last_state_{Session::State::Idle};
    QStringList microphones_;
    double download_progress_{};
};

std::ostream& operator << (std::ostream& os, AppEngine::State state);
