#include "gpt_parser.h"
#include "crc_utils.h"
#include "core/logger.h"

#include <QRegularExpression>
#include <QStringList>
#include <QtEndian>
#include <cstring>

static const QString TAG = QStringLiteral("GPT");

namespace qedl {

QString gptErrorString(GptError error)
{
    switch (error) {
    case GptError::None:         return QStringLiteral("ok");
    case GptError::TooSmall:     return QStringLiteral("truncated table");
    case GptError::BadSignature: return QStringLiteral("bad signature");
    case GptError::BadHeaderCrc: return QStringLiteral("header CRC mismatch");
    case GptError::BadArrayCrc:  return QStringLiteral("partition array CRC mismatch");
    case GptError::BadLayout:    return QStringLiteral("invalid layout");
    }
    return QStringLiteral("unknown");
}

// ─── Field codec ─────────────────────────────────────────────────────

GptHeader GptParser::decodeHeader(const uint8_t* d)
{
    GptHeader h;
    h.signature           = qFromLittleEndian<quint64>(d);
    h.revision            = qFromLittleEndian<quint32>(d + 8);
    h.headerSize          = qFromLittleEndian<quint32>(d + 12);
    h.headerCrc32         = qFromLittleEndian<quint32>(d + 16);
    h.currentLba          = qFromLittleEndian<quint64>(d + 24);
    h.backupLba           = qFromLittleEndian<quint64>(d + 32);
    h.firstUsableLba      = qFromLittleEndian<quint64>(d + 40);
    h.lastUsableLba       = qFromLittleEndian<quint64>(d + 48);
    h.diskGuid            = readGuid(d + 56);
    h.partitionEntryLba   = qFromLittleEndian<quint64>(d + 72);
    h.numPartitionEntries = qFromLittleEndian<quint32>(d + 80);
    h.partitionEntrySize  = qFromLittleEndian<quint32>(d + 84);
    h.partitionArrayCrc32 = qFromLittleEndian<quint32>(d + 88);
    return h;
}

void GptParser::encodeHeader(const GptHeader& h, uint8_t* d)
{
    qToLittleEndian<quint64>(h.signature, d);
    qToLittleEndian<quint32>(h.revision, d + 8);
    qToLittleEndian<quint32>(h.headerSize, d + 12);
    qToLittleEndian<quint32>(h.headerCrc32, d + 16);
    qToLittleEndian<quint32>(0, d + 20);
    qToLittleEndian<quint64>(h.currentLba, d + 24);
    qToLittleEndian<quint64>(h.backupLba, d + 32);
    qToLittleEndian<quint64>(h.firstUsableLba, d + 40);
    qToLittleEndian<quint64>(h.lastUsableLba, d + 48);
    writeGuid(h.diskGuid, d + 56);
    qToLittleEndian<quint64>(h.partitionEntryLba, d + 72);
    qToLittleEndian<quint32>(h.numPartitionEntries, d + 80);
    qToLittleEndian<quint32>(h.partitionEntrySize, d + 84);
    qToLittleEndian<quint32>(h.partitionArrayCrc32, d + 88);
}

GptPartitionEntry GptParser::decodeEntry(const uint8_t* d, uint32_t index)
{
    GptPartitionEntry e;
    e.index = index;
    e.typeGuid = readGuid(d);
    e.uniqueGuid = readGuid(d + 16);
    e.firstLba = qFromLittleEndian<quint64>(d + 32);
    e.lastLba = qFromLittleEndian<quint64>(d + 40);
    e.attributes = qFromLittleEndian<quint64>(d + 48);

    // UTF-16LE, 36 code units, NUL padded
    QString name;
    for (int i = 0; i < 36; i++) {
        uint16_t ch = qFromLittleEndian<quint16>(d + 56 + i * 2);
        if (ch == 0) break;
        name.append(QChar(ch));
    }
    e.name = name;
    return e;
}

void GptParser::encodeEntry(const GptPartitionEntry& e, uint8_t* d)
{
    writeGuid(e.typeGuid, d);
    writeGuid(e.uniqueGuid, d + 16);
    qToLittleEndian<quint64>(e.firstLba, d + 32);
    qToLittleEndian<quint64>(e.lastLba, d + 40);
    qToLittleEndian<quint64>(e.attributes, d + 48);
    const int len = qMin(e.name.size(), 36);
    for (int i = 0; i < len; i++)
        qToLittleEndian<quint16>(e.name.at(i).unicode(), d + 56 + i * 2);
}

QUuid GptParser::readGuid(const uint8_t* data)
{
    // GPT GUID uses mixed-endian encoding
    return QUuid(qFromLittleEndian<quint32>(data),
                 qFromLittleEndian<quint16>(data + 4),
                 qFromLittleEndian<quint16>(data + 6),
                 data[8], data[9], data[10], data[11],
                 data[12], data[13], data[14], data[15]);
}

void GptParser::writeGuid(const QUuid& guid, uint8_t* data)
{
    qToLittleEndian<quint32>(guid.data1, data);
    qToLittleEndian<quint16>(guid.data2, data + 4);
    qToLittleEndian<quint16>(guid.data3, data + 6);
    std::memcpy(data + 8, guid.data4, 8);
}

// ─── Parse ───────────────────────────────────────────────────────────

GptError GptParser::parseHeader(const QByteArray& data, uint32_t sectorSize,
                                GptHeader* header, QString* message)
{
    auto fail = [message](GptError e, const QString& msg) {
        if (message) *message = msg;
        return e;
    };

    if (sectorSize < 512 || static_cast<uint64_t>(data.size()) < uint64_t(sectorSize) + MIN_HEADER_SIZE)
        return fail(GptError::TooSmall, QString("Need %1 bytes for the GPT header, got %2")
                                            .arg(uint64_t(sectorSize) + MIN_HEADER_SIZE).arg(data.size()));

    const uint8_t* hdr = reinterpret_cast<const uint8_t*>(data.constData()) + sectorSize;
    *header = decodeHeader(hdr);

    if (header->signature != GPT_SIGNATURE)
        return fail(GptError::BadSignature, QString("No EFI PART signature at LBA1 (sector size %1)")
                                                .arg(sectorSize));

    // A corrupt header_size still has to be caught by the checksum, so
    // fall back to the fixed header length when it is out of range
    uint32_t crcLength = header->headerSize;
    if (crcLength < MIN_HEADER_SIZE || crcLength > sectorSize)
        crcLength = MIN_HEADER_SIZE;

    QByteArray copy(reinterpret_cast<const char*>(hdr), static_cast<int>(crcLength));
    std::memset(copy.data() + 16, 0, 4);
    uint32_t computed = Crc32::compute(copy);
    if (computed != header->headerCrc32)
        return fail(GptError::BadHeaderCrc, QString("GPT header CRC mismatch: stored=%1 computed=%2")
                                                .arg(header->headerCrc32, 8, 16, QChar('0'))
                                                .arg(computed, 8, 16, QChar('0')));
    return GptError::None;
}

uint64_t GptParser::requiredBytes(const GptHeader& header, uint32_t sectorSize)
{
    // Both factors are 32-bit, so the array size itself cannot wrap
    const uint64_t arrayBytes = uint64_t(header.numPartitionEntries) * header.partitionEntrySize;
    if (sectorSize == 0 || header.partitionEntryLba > (UNREACHABLE_BYTES - arrayBytes) / sectorSize)
        return UNREACHABLE_BYTES;
    return header.partitionEntryLba * sectorSize + arrayBytes;
}

GptParseResult GptParser::parse(const QByteArray& data, uint32_t sectorSize)
{
    GptParseResult result;
    result.sectorSize = sectorSize;

    QString msg;
    GptError headerError = parseHeader(data, sectorSize, &result.header, &msg);
    if (headerError == GptError::TooSmall || headerError == GptError::BadSignature) {
        result.error = headerError;
        result.errorMessage = msg;
        return result;
    }
    if (headerError != GptError::None) {
        result.error = headerError;
        result.errorMessage = msg;
    }

    const GptHeader& h = result.header;
    if (h.partitionEntrySize < MIN_ENTRY_SIZE || h.partitionEntrySize % 8 != 0
        || h.numPartitionEntries == 0 || h.numPartitionEntries > 16384
        || h.partitionEntryLba < 2 || requiredBytes(h, sectorSize) == UNREACHABLE_BYTES) {
        if (result.error == GptError::None) {
            result.error = GptError::BadLayout;
            result.errorMessage = QString("Unusable entry array: lba=%1 count=%2 size=%3")
                                      .arg(h.partitionEntryLba).arg(h.numPartitionEntries)
                                      .arg(h.partitionEntrySize);
        }
        return result;
    }

    const uint64_t needed = requiredBytes(h, sectorSize);
    if (needed > static_cast<uint64_t>(data.size())) {
        if (result.error == GptError::None) {
            result.error = GptError::TooSmall;
            result.errorMessage = QString("Entry array ends at byte %1, only %2 bytes read")
                                      .arg(needed).arg(data.size());
        }
        return result;
    }

    const uint8_t* d = reinterpret_cast<const uint8_t*>(data.constData());
    const uint64_t arrayOffset = h.partitionEntryLba * sectorSize;
    const uint64_t arrayBytes = uint64_t(h.numPartitionEntries) * h.partitionEntrySize;

    uint32_t computed = Crc32::compute(d + arrayOffset, static_cast<size_t>(arrayBytes));
    if (computed != h.partitionArrayCrc32 && result.error == GptError::None) {
        result.error = GptError::BadArrayCrc;
        result.errorMessage = QString("Partition array CRC mismatch: stored=%1 computed=%2")
                                  .arg(h.partitionArrayCrc32, 8, 16, QChar('0'))
                                  .arg(computed, 8, 16, QChar('0'));
    }

    for (uint32_t i = 0; i < h.numPartitionEntries; i++) {
        GptPartitionEntry e = decodeEntry(d + arrayOffset + uint64_t(i) * h.partitionEntrySize, i);
        if (e.typeGuid.isNull())
            continue; // unused slot
        result.entries.append(e);
    }

    if (result.success())
        LOG_DEBUG_CAT(TAG, QString("Parsed %1 partitions (sector size %2)")
                               .arg(result.entries.size()).arg(sectorSize));
    else
        LOG_DEBUG_CAT(TAG, result.errorMessage);
    return result;
}

const GptPartitionEntry* GptParser::resolve(const QList<GptPartitionEntry>& entries,
                                            const QString& name)
{
    for (const auto& e : entries) {
        if (e.name == name)
            return &e;
    }
    return nullptr;
}

// ─── Human-readable view ─────────────────────────────────────────────

static QString hex32(uint32_t v) { return QString("0x%1").arg(v, 8, 16, QChar('0')); }
static QString hex64(uint64_t v) { return QString("0x%1").arg(v, 16, 16, QChar('0')); }

QString GptParser::render(const GptParseResult& gpt)
{
    const GptHeader& h = gpt.header;
    QStringList lines;
    lines << QStringLiteral("GPT header:");
    lines << QString("  signature             : %1").arg(hex64(h.signature));
    lines << QString("  revision              : %1").arg(hex32(h.revision));
    lines << QString("  header_size           : %1").arg(h.headerSize);
    lines << QString("  header_crc32          : %1").arg(hex32(h.headerCrc32));
    lines << QString("  current_lba           : %1").arg(h.currentLba);
    lines << QString("  backup_lba            : %1").arg(h.backupLba);
    lines << QString("  first_usable_lba      : %1").arg(h.firstUsableLba);
    lines << QString("  last_usable_lba       : %1").arg(h.lastUsableLba);
    lines << QString("  disk_guid             : %1").arg(h.diskGuid.toString());
    lines << QString("  partition_entry_lba   : %1").arg(h.partitionEntryLba);
    lines << QString("  num_partition_entries : %1").arg(h.numPartitionEntries);
    lines << QString("  partition_entry_size  : %1").arg(h.partitionEntrySize);
    lines << QString("  partition_array_crc32 : %1").arg(hex32(h.partitionArrayCrc32));
    lines << QString("Partitions (sector size %1):").arg(gpt.sectorSize);

    for (const auto& e : gpt.entries) {
        const uint64_t bytes = e.sizeBytes(gpt.sectorSize);
        // name is spliced in separately so a '%' in it is never expanded
        lines << QString("  %1] \"").arg(e.index, 3) + e.name
                     + QString("\" first_lba=%1 last_lba=%2 size=%3 (%4 KiB) "
                               "attributes=%5 type=%6 unique=%7")
                           .arg(e.firstLba)
                           .arg(e.lastLba)
                           .arg(bytes)
                           .arg(bytes / 1024)
                           .arg(hex64(e.attributes))
                           .arg(e.typeGuid.toString())
                           .arg(e.uniqueGuid.toString());
    }
    return lines.join('\n') + '\n';
}

GptParseResult GptParser::parseRendered(const QString& text)
{
    GptParseResult result;
    GptHeader& h = result.header;

    static const QRegularExpression fieldRe(QStringLiteral("^\\s+(\\w+)\\s*: (.+)$"));
    static const QRegularExpression sectorRe(QStringLiteral("^Partitions \\(sector size (\\d+)\\):$"));
    static const QRegularExpression entryRe(QStringLiteral(
        "^\\s*(\\d+)\\] \"(.*)\" first_lba=(\\d+) last_lba=(\\d+) size=\\d+ \\(\\d+ KiB\\) "
        "attributes=(0x[0-9a-fA-F]+) type=(\\S+) unique=(\\S+)$"));

    bool ok = true;
    auto num = [&ok](const QString& s) -> quint64 {
        bool good = false;
        quint64 v = s.trimmed().toULongLong(&good, 0);
        ok = ok && good;
        return v;
    };

    const QStringList lines = text.split('\n');
    for (const QString& line : lines) {
        QRegularExpressionMatch m = entryRe.match(line);
        if (m.hasMatch()) {
            GptPartitionEntry e;
            e.index = static_cast<uint32_t>(num(m.captured(1)));
            e.name = m.captured(2);
            e.firstLba = num(m.captured(3));
            e.lastLba = num(m.captured(4));
            e.attributes = num(m.captured(5));
            e.typeGuid = QUuid(m.captured(6));
            e.uniqueGuid = QUuid(m.captured(7));
            result.entries.append(e);
            continue;
        }
        m = sectorRe.match(line);
        if (m.hasMatch()) {
            result.sectorSize = static_cast<uint32_t>(num(m.captured(1)));
            continue;
        }
        m = fieldRe.match(line);
        if (!m.hasMatch())
            continue;

        const QString key = m.captured(1);
        const QString value = m.captured(2);
        if (key == "signature")                  h.signature = num(value);
        else if (key == "revision")              h.revision = static_cast<uint32_t>(num(value));
        else if (key == "header_size")           h.headerSize = static_cast<uint32_t>(num(value));
        else if (key == "header_crc32")          h.headerCrc32 = static_cast<uint32_t>(num(value));
        else if (key == "current_lba")           h.currentLba = num(value);
        else if (key == "backup_lba")            h.backupLba = num(value);
        else if (key == "first_usable_lba")      h.firstUsableLba = num(value);
        else if (key == "last_usable_lba")       h.lastUsableLba = num(value);
        else if (key == "disk_guid")             h.diskGuid = QUuid(value.trimmed());
        else if (key == "partition_entry_lba")   h.partitionEntryLba = num(value);
        else if (key == "num_partition_entries") h.numPartitionEntries = static_cast<uint32_t>(num(value));
        else if (key == "partition_entry_size")  h.partitionEntrySize = static_cast<uint32_t>(num(value));
        else if (key == "partition_array_crc32") h.partitionArrayCrc32 = static_cast<uint32_t>(num(value));
    }

    if (!ok || h.signature != GPT_SIGNATURE) {
        result.error = GptError::BadLayout;
        result.errorMessage = QStringLiteral("Not a rendered GPT table");
    }
    return result;
}

// ─── Serialize ───────────────────────────────────────────────────────

QByteArray GptParser::serialize(GptHeader header, const QList<GptPartitionEntry>& entries,
                                uint32_t sectorSize)
{
    header.signature = GPT_SIGNATURE;
    if (header.headerSize < MIN_HEADER_SIZE || header.headerSize > sectorSize)
        header.headerSize = MIN_HEADER_SIZE;
    if (header.partitionEntrySize < MIN_ENTRY_SIZE)
        header.partitionEntrySize = MIN_ENTRY_SIZE;
    if (header.numPartitionEntries == 0)
        header.numPartitionEntries = 128;
    if (header.partitionEntryLba < 2)
        header.partitionEntryLba = 2;

    const uint64_t arrayBytes = uint64_t(header.numPartitionEntries) * header.partitionEntrySize;
    const uint64_t arraySectors = (arrayBytes + sectorSize - 1) / sectorSize;
    if (header.firstUsableLba == 0)
        header.firstUsableLba = header.partitionEntryLba + arraySectors;

    QByteArray image(static_cast<int>((header.partitionEntryLba + arraySectors) * sectorSize), '\0');
    uint8_t* d = reinterpret_cast<uint8_t*>(image.data());

    // Protective MBR: one 0xEE partition covering the disk
    d[446 + 4] = 0xEE;
    qToLittleEndian<quint32>(1, d + 446 + 8);
    qToLittleEndian<quint32>(0xFFFFFFFF, d + 446 + 12);
    d[510] = 0x55;
    d[511] = 0xAA;

    for (const auto& e : entries) {
        if (e.index >= header.numPartitionEntries)
            continue;
        encodeEntry(e, d + header.partitionEntryLba * sectorSize
                         + uint64_t(e.index) * header.partitionEntrySize);
    }

    header.partitionArrayCrc32 = Crc32::compute(d + header.partitionEntryLba * sectorSize,
                                                static_cast<size_t>(arrayBytes));
    header.headerCrc32 = 0;
    encodeHeader(header, d + sectorSize);
    header.headerCrc32 = Crc32::compute(d + sectorSize, header.headerSize);
    qToLittleEndian<quint32>(header.headerCrc32, d + sectorSize + 16);
    return image;
}

} // namespace qedl
