#include "ModelInfo.h"

QString ModelInfo::summary() const
{
    auto text = QStringLiteral("Params: %1 | VRAM: %2 | Speed: %3")
                    .arg(QString::fromUtf8(params),
                         QString::fromUtf8(vram),
                         QString::fromUtf8(speed));

    if (englishOnly()) {
        text += QStringLiteral(" (English-only)");
    }

    return text;
}
