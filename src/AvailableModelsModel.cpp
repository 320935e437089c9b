#include <QSettings>

#include "AvailableModelsModel.h"
#include "ModelMgr.h"

#include "logging.h"
using namespace std;


AvailableModelsModel::AvailableModelsModel(QString propertiesTag, QObject *parent)
    : QAbstractListModel(parent), properties_tag_(std::move(propertiesTag))
{
    selected_model_name_ = QSettings{}.value(properties_tag_, default_model).toString().trimmed();

    connect(&ModelMgr::instance(), &ModelMgr::modelDownloaded,
            this, &AvailableModelsModel::onModelDownloaded);
}

void AvailableModelsModel::setModels(model_list_t models)
{
    beginResetModel();
    models_.clear();
    models_.reserve(models.size());
    for(const auto& m : models) {
        models_.push_back({&m, ModelMgr::instance().isDownloaded(m)});
    }
    endResetModel();

    if (selected() < 0) {
        LOG_DEBUG_N << "Model '" << selected_model_name_ << "' is not in the list. Using "
                    << default_model;
        selected_model_name_ = default_model;
        emit selectedChanged();
    }
}

void AvailableModelsModel::onModelDownloaded(const QString &id)
{
    LOG_TRACE_N << "AvailableModelsModel received modelDownloaded signal for id=" << id;

    // Several names may share the file, so update them all
    int row = 0;
    for (auto& entry : models_) {
        if (QString::fromUtf8(entry.info->id) == id && !entry.downloaded) {
            entry.downloaded = true;
            const QModelIndex idx = index(row, 0);
            emit dataChanged(idx, idx, {static_cast<int>(Roles::Downloaded)});
        }
        ++row;
    }
}

int AvailableModelsModel::selected() const
{
    for (size_t i = 0; i < models_.size(); ++i) {
        if (QString::fromUtf8(models_[i].info->name) == selected_model_name_) {
            return static_cast<int>(i);
        }
    }

    return -1; // Not found
}

void AvailableModelsModel::setSelected(int index)
{
    const auto current = selected();
    LOG_TRACE_N << "Setting selected model index from " << current << " to " << index;
    if (current == index) {
        return;
    }

    if (index < 0 || static_cast<size_t>(index) >= models_.size()) {
        LOG_WARN_N << "Ignoring invalid model index " << index;
        return;
    }

    selected_model_name_ = QString::fromUtf8(models_[static_cast<size_t>(index)].info->name);
    QSettings{}.setValue(properties_tag_, selected_model_name_);
    emit selectedChanged();
}

const ModelInfo *AvailableModelsModel::selectedModel() const
{
    const int index = selected();
    if (index >= 0 && static_cast<size_t>(index) < models_.size()) {
        return models_[static_cast<size_t>(index)].info;
    }
    return nullptr;
}

int AvailableModelsModel::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) {
        return 0;
    }
    return static_cast<int>(models_.size());
}

QVariant AvailableModelsModel::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() < 0 || static_cast<size_t>(index.row()) >= models_.size()) {
        return {};
    }

    const ModelEntry& entry = models_[static_cast<size_t>(index.row())];

    switch (static_cast<Roles>(role)) {
    case Roles::Name:
        return QString::fromUtf8(entry.info->name);
    case Roles::Id:
        return QString::fromUtf8(entry.info->id);
    case Roles::SizeMB:
        return static_cast<qulonglong>(entry.info->size_mb);
    case Roles::Downloaded:
        return entry.downloaded;
    case Roles::Summary:
        return entry.info->summary();
    }

    if (role == Qt::DisplayRole) {
        return QString::fromUtf8(entry.info->name);
    }

    return {};
}

QHash<int, QByteArray> AvailableModelsModel::roleNames() const
{
    QHash<int, QByteArray> roles;
    roles[static_cast<int>(Roles::Name)] = "name";
    roles[static_cast<int>(Roles::Id)] = "id";
    roles[static_cast<int>(Roles::SizeMB)] = "sizeMB";
    roles[static_cast<int>(Roles::Downloaded)] = "downloaded";
    roles[static_cast<int>(Roles::Summary)] = "summary";
    return roles;
}
