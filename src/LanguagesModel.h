#pragma once

#include <optional>
#include <span>
#include <vector>

#include <QObject>
#include <QAbstractListModel>
#include <QtQml/qqml.h>

/*! The languages whisper can transcribe, with "Auto" first.
 *
 *  The selection is persisted in QSettings under the given key.
 */
class LanguagesModel : public QAbstractListModel
{
    Q_OBJECT
    QML_ELEMENT
    QML_UNCREATABLE("Owned by AppEngine")

    Q_PROPERTY(int selected READ selected WRITE setSelected NOTIFY selectedChanged)
    Q_PROPERTY(QString selectedCode READ selectedCode WRITE setSelectedCode  NOTIFY selectedChanged)

public:
    enum class Roles {
        Name = Qt::UserRole + 1,
        Code
    };

    struct Entry {
        QString name;       // e.g. "English"
        QString code;       // whisper code, e.g. "en" or "auto"
    };

    explicit LanguagesModel(const QString& settingsKey, QObject *parent = nullptr);

    // Model API
    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    QHash<int, QByteArray> roleNames() const override;

    // Selection
    int selected() const noexcept { return indexOfCode(selected_code_); }
    void setSelected(int index);
    void setSelectedCode(const QString& code);

    QString selectedCode() const { return selected_code_; }
    QString selectedName() const;

    Q_INVOKABLE int indexOfCode(const QString& code) const noexcept;

    static std::span<const Entry> whisperLanguages();

signals:
    void selectedChanged();

private:
    void loadSelection();
    void saveSelection() const;
    std::optional<Entry> findEntryByCode(const QString& code) const noexcept;

    std::vector<Entry> entries_;
    QString selected_code_;
    QString settings_key_;
};
