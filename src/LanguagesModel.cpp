#include <array>

#include <QSettings>

#include "LanguagesModel.h"
#include "logging.h"

using namespace std;

namespace {

// In order of how common they are in whisper's training data
const auto defaultLanguages = to_array<LanguagesModel::Entry>({
    { "Auto", "auto" },
    { "English", "en" },
    { "Russian", "ru" },
    { "Chinese", "zh" },
    { "German", "de" },
    { "Spanish", "es" },
    { "Korean", "ko" },
    { "French", "fr" },
    { "Japanese", "ja" },
    { "Portuguese", "pt" },
    { "Turkish", "tr" },
    { "Polish", "pl" },
    { "Catalan", "ca" },
    { "Dutch", "nl" },
    { "Arabic", "ar" },
    { "Swedish", "sv" },
    { "Italian", "it" },
    { "Indonesian", "id" },
    { "Hindi", "hi" },
    { "Finnish", "fi" },
    { "Vietnamese", "vi" },
    { "Hebrew", "he" },
    { "Ukrainian", "uk" },
    { "Greek", "el" },
    { "Thai", "th" },
    { "Czech", "cs" },
    { "Romanian", "ro" },
    { "Danish", "da" },
    { "Hungarian", "hu" },
    { "Norwegian", "no" },
    { "Urdu", "ur" },
    { "Croatian", "hr" },
    { "Bulgarian", "bg" },
    { "Serbian", "sr" },
    { "Gujarati", "gu" },
    { "Telugu", "te" },
    { "Kannada", "kn" },
    { "Malayalam", "ml" },
    { "Marathi", "mr" },
    { "Nepali", "ne" },
    { "Mongolian", "mn" },
    { "Bosnian", "bs" },
    { "Kazakh", "kk" },
    { "Albanian", "sq" },
    { "Swahili", "sw" },
    { "Slovenian", "sl" },
    { "Armenian", "hy" },
    { "Estonian", "et" },
    { "Welsh", "cy" },
    { "Latvian", "lv" },
    { "Lithuanian", "lt" },
    { "Macedonian", "mk" },
    { "Georgian", "ka" },
    { "Azerbaijani", "az" },
    { "Afrikaans", "af" },
    { "Luxembourgish", "lb" },
    { "Yiddish", "yi" },
    { "Icelandic", "is" },
    { "Haitian Creole", "ht" },
    { "Malagasy", "mg" },
    { "Persian", "fa" },
    { "Sanskrit", "sa" },
    { "Lao", "lo" },
    { "Tibetan", "bo" },
    { "Burmese", "my" },
    { "Tagalog", "tl" },
    { "Khmer", "km" },
    { "Maori", "mi" },
    { "Sindhi", "sd" },
    { "Amharic", "am" }
});

} // anon ns

LanguagesModel::LanguagesModel(const QString& settingsKey, QObject *parent)
    : QAbstractListModel(parent)
    , entries_(defaultLanguages.begin(), defaultLanguages.end())
    , settings_key_{settingsKey}
{
    loadSelection();
}

span<const LanguagesModel::Entry> LanguagesModel::whisperLanguages()
{
    return defaultLanguages;
}

int LanguagesModel::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) return 0;
    return static_cast<int>(entries_.size());
}

QVariant LanguagesModel::data(const QModelIndex &index, int role) const
{
    const int row = index.row();
    if (!index.isValid() || row < 0 || row >= static_cast<int>(entries_.size()))
        return {};

    const auto& e = entries_[static_cast<size_t>(row)];

    switch (static_cast<Roles>(role)) {
    case Roles::Name:       return e.name;
    case Roles::Code:       return e.code;
    }

    if (role == Qt::DisplayRole) {
        return e.name;
    }

    return {};
}

QHash<int, QByteArray> LanguagesModel::roleNames() const
{
    return {
        { static_cast<int>(Roles::Name),       "name" },
        { static_cast<int>(Roles::Code),       "code" }
    };
}

void LanguagesModel::setSelected(int index)
{
    if (index < 0 || index >= static_cast<int>(entries_.size())) {
        LOG_WARN_N << "Ignoring invalid language index " << index;
        return;
    }

    const auto& entry = entries_[static_cast<size_t>(index)];

    if (selected_code_ != entry.code) {
        selected_code_ = entry.code;

        // Persist
        saveSelection();
        emit selectedChanged();
    }
}

void LanguagesModel::setSelectedCode(const QString &code)
{
    const int idx = indexOfCode(code);
    if (idx >= 0) {
        setSelected(idx);
    }
}

QString LanguagesModel::selectedName() const
{
    const auto entry = findEntryByCode(selected_code_);
    if (entry) {
        return entry->name;
    }
    return {};
}

int LanguagesModel::indexOfCode(const QString& code) const noexcept
{
    if (code.isEmpty()) return -1;

    for (int i = 0; i < static_cast<int>(entries_.size()); ++i) {
        if (entries_[static_cast<size_t>(i)].code.compare(code, Qt::CaseInsensitive) == 0)
            return i;
    }
    return -1;
}

void LanguagesModel::loadSelection()
{
    QSettings s;
    const QString code = s.value(settings_key_, "auto").toString().trimmed();
    if (const int idx = indexOfCode(code); idx >= 0) {
        selected_code_ = entries_[static_cast<size_t>(idx)].code;
    } else {
        LOG_WARN_N << "Unknown language '" << code << "' in settings. Using auto.";
        selected_code_ = "auto";
    }
}

void LanguagesModel::saveSelection() const
{
    if (settings_key_.isEmpty()) return;

    QSettings s;
    s.setValue(settings_key_, selectedCode());
}

std::optional<LanguagesModel::Entry> LanguagesModel::findEntryByCode(const QString &code) const noexcept
{
    if (code.isEmpty()) return std::nullopt;

    for (const auto& e : entries_) {
        if (e.code.compare(code, Qt::CaseInsensitive) == 0)
            return e;
    }
    return {};
}
