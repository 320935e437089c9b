#include <algorithm>
#include <cstring>

#include <QAudioFormat>
#include <QtEndian>

#include "WavFile.h"

namespace wav {

namespace {

void put16(QByteArray& out, uint16_t v) {
    const auto le = qToLittleEndian(v);
    out.append(reinterpret_cast<const char*>(&le), sizeof(le));
}

void put32(QByteArray& out, uint32_t v) {
    const auto le = qToLittleEndian(v);
    out.append(reinterpret_cast<const char*>(&le), sizeof(le));
}

uint16_t get16(const char *p) {
    return qFromLittleEndian<uint16_t>(p);
}

uint32_t get32(const char *p) {
    return qFromLittleEndian<uint32_t>(p);
}

} // anon ns

Format fromAudioFormat(const QAudioFormat &format)
{
    Format f;
    f.sample_rate = static_cast<uint32_t>(format.sampleRate());
    f.channels = static_cast<uint16_t>(format.channelCount());

    switch(format.sampleFormat()) {
    case QAudioFormat::UInt8:
        f.bits_per_sample = 8;
        break;
    case QAudioFormat::Int32:
        f.bits_per_sample = 32;
        break;
    case QAudioFormat::Float:
        f.bits_per_sample = 32;
        f.encoding = Encoding::Float;
        break;
    default:
        f.bits_per_sample = 16;
        break;
    }

    return f;
}

QByteArray makeHeader(const Format &format, uint32_t dataSize)
{
    QByteArray out;
    out.reserve(header_size);

    out.append("RIFF", 4);
    put32(out, 36 + dataSize);
    out.append("WAVE", 4);
    out.append("fmt ", 4);
    put32(out, 16);                 // fmt chunk size
    put16(out, static_cast<uint16_t>(format.encoding));
    put16(out, format.channels);
    put32(out, format.sample_rate);
    put32(out, format.byteRate());
    put16(out, format.blockAlign());
    put16(out, format.bits_per_sample);
    out.append("data", 4);
    put32(out, dataSize);

    Q_ASSERT(out.size() == header_size);
    return out;
}

std::optional<Info> probe(QIODevice &device)
{
    if (!device.seek(0)) {
        return {};
    }

    const auto riff = device.read(12);
    if (riff.size() != 12 || !riff.startsWith("RIFF") || std::memcmp(riff.constData() + 8, "WAVE", 4) != 0) {
        return {};
    }

    Info info;
    bool have_fmt = false;

    while(!device.atEnd()) {
        const auto hdr = device.read(8);
        if (hdr.size() != 8) {
            break;
        }

        const auto chunk_size = get32(hdr.constData() + 4);

        if (hdr.startsWith("fmt ")) {
            if (chunk_size < 16) {
                return {};
            }
            const auto fmt = device.read(chunk_size);
            if (fmt.size() != static_cast<qsizetype>(chunk_size)) {
                return {};
            }

            auto encoding = get16(fmt.constData());
            if (encoding == 0xFFFE && chunk_size >= 40) {
                // WAVE_FORMAT_EXTENSIBLE. The real format is the first two bytes of the sub-format GUID.
                encoding = get16(fmt.constData() + 24);
            }
            if (encoding != static_cast<uint16_t>(Encoding::Pcm)
                && encoding != static_cast<uint16_t>(Encoding::Float)) {
                return {};
            }

            info.format.encoding = static_cast<Encoding>(encoding);
            info.format.channels = get16(fmt.constData() + 2);
            info.format.sample_rate = get32(fmt.constData() + 4);
            info.format.bits_per_sample = get16(fmt.constData() + 14);
            have_fmt = true;
        } else if (hdr.startsWith("data")) {
            if (!have_fmt) {
                return {};
            }
            info.data_offset = device.pos();
            info.data_size = chunk_size;

            // An unfinished recording has a zero size. Use what is actually there.
            const auto available = device.size() - info.data_offset;
            if (info.data_size == 0 || info.data_size > available) {
                info.data_size = static_cast<uint32_t>(std::max<qint64>(0, available));
            }
            return info;
        } else {
            // Chunks are padded to an even size
            if (!device.seek(device.pos() + chunk_size + (chunk_size & 1))) {
                break;
            }
        }
    }

    return {};
}

} // ns
