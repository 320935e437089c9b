#pragma once

#include <vector>

#include <QObject>
#include <QAbstractListModel>
#include <QtQml/qqml.h>

#include "ModelInfo.h"

/*! The whisper models the user can pick from.
 *
 *  Selection is by model name ("base.en"), as several names may share
 *  the same file. The name is persisted under the properties tag.
 */
class AvailableModelsModel : public QAbstractListModel
{
    Q_OBJECT
    QML_ELEMENT
    QML_UNCREATABLE("Owned by AppEngine")

    Q_PROPERTY(int selected READ selected WRITE setSelected NOTIFY selectedChanged)
    Q_PROPERTY(QString selectedName READ selectedModelName NOTIFY selectedChanged)
public:
    enum class Roles {
        Name = Qt::UserRole + 1,
        Id,
        SizeMB,
        Downloaded,
        Summary
    };

    struct ModelEntry {
        const ModelInfo *info{};
        bool downloaded{false};
    };

    static constexpr auto default_model = "turbo";

    AvailableModelsModel(QString propertiesTag, QObject *parent = nullptr);

    void setModels(model_list_t models);

    Q_INVOKABLE void setSelected(int index);
    int selected() const;
    const ModelInfo* selectedModel() const;
    const QString& selectedModelName() const noexcept {
        return selected_model_name_;
    }

    bool empty() const noexcept {
        return models_.empty();
    }

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    QHash<int, QByteArray> roleNames() const override;

signals:
    void selectedChanged();

private:
    void onModelDownloaded(const QString& id);

    std::vector<ModelEntry> models_;
    QString selected_model_name_;
    QString properties_tag_;
};
