// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "edid.h"
#include "logging.h"

namespace DisplaySwitch {

namespace {

constexpr int BaseBlockSize = 128;
constexpr int DescriptorOffsets[] = {54, 72, 90, 108};
constexpr int DescriptorTextLength = 13;
constexpr uchar MonitorNameTag = 0xFC;

quint8 byteAt(const QByteArray& raw, int index)
{
    return static_cast<quint8>(raw.at(index));
}

bool hasFixedHeader(const QByteArray& raw)
{
    static const uchar header[8] = {0x00, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x00};
    for (int i = 0; i < 8; ++i) {
        if (byteAt(raw, i) != header[i]) {
            return false;
        }
    }
    return true;
}

QString decodeMonitorName(const QByteArray& raw)
{
    for (int offset : DescriptorOffsets) {
        // Display descriptors start with a zero pixel clock
        if (byteAt(raw, offset) != 0 || byteAt(raw, offset + 1) != 0 || byteAt(raw, offset + 2) != 0) {
            continue;
        }
        if (byteAt(raw, offset + 3) != MonitorNameTag) {
            continue;
        }
        QByteArray text = raw.mid(offset + 5, DescriptorTextLength);
        const int newline = text.indexOf('\n');
        if (newline >= 0) {
            text.truncate(newline);
        }
        return QString::fromLatin1(text).trimmed();
    }
    return QString();
}

} // anonymous namespace

EdidInfo EdidInfo::decode(const QByteArray& raw)
{
    EdidInfo info;
    if (raw.size() < BaseBlockSize) {
        qCDebug(lcInventory) << "EDID data too small (" << raw.size() << "bytes)";
        return info;
    }
    if (!hasFixedHeader(raw)) {
        qCDebug(lcInventory) << "EDID header mismatch";
        return info;
    }

    // Bytes 8-9: big-endian, three 5-bit letters ('A' == 1)
    const quint16 manufacturer = static_cast<quint16>((byteAt(raw, 8) << 8) | byteAt(raw, 9));
    const char letters[3] = {
        static_cast<char>(((manufacturer >> 10) & 0x1F) + 'A' - 1),
        static_cast<char>(((manufacturer >> 5) & 0x1F) + 'A' - 1),
        static_cast<char>((manufacturer & 0x1F) + 'A' - 1),
    };
    info.manufacturerId = QString::fromLatin1(letters, 3);

    // Bytes 10-11 and 12-15 are little-endian
    const quint16 product = static_cast<quint16>(byteAt(raw, 10) | (byteAt(raw, 11) << 8));
    info.productCode = QStringLiteral("%1").arg(product, 4, 16, QLatin1Char('0')).toUpper();

    const quint32 serial = static_cast<quint32>(byteAt(raw, 12)) | (static_cast<quint32>(byteAt(raw, 13)) << 8)
        | (static_cast<quint32>(byteAt(raw, 14)) << 16) | (static_cast<quint32>(byteAt(raw, 15)) << 24);
    info.serialNumber = QStringLiteral("%1").arg(serial, 8, 16, QLatin1Char('0')).toUpper();

    info.monitorName = decodeMonitorName(raw);
    return info;
}

EdidInfo EdidInfo::fromHex(const QString& hex)
{
    QString compact = hex;
    compact.remove(QLatin1Char(' '));
    compact.remove(QLatin1Char('\t'));
    compact.remove(QLatin1Char('\n'));
    return decode(QByteArray::fromHex(compact.toLatin1()));
}

} // namespace DisplaySwitch
