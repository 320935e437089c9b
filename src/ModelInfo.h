#pragma once

#include <cstddef>
#include <span>
#include <string_view>

#include <QString>

/*! Static description of a whisper model variant.
 *
 *  The catalog itself lives in ModelMgr.
 */
struct ModelInfo {
    std::string_view name;          // as shown to the user, "base.en"
    std::string_view id;            // as used in the ggml file name
    std::string_view filename;
    size_t size_mb{};               // approximate, in megabytes
    std::string_view params;        // "74 M"
    std::string_view vram;          // "~1 GB"
    std::string_view speed;         // relative to large
    bool multilingual{true};
    std::string_view download_url;  // If it ends with '/', the file name is appended for download

    bool englishOnly() const noexcept { return !multilingual; }

    // "Params: 74 M | VRAM: ~1 GB | Speed: ~7x (English-only)"
    QString summary() const;
};

using model_list_t = std::span<const ModelInfo>; // NB: Non owning
