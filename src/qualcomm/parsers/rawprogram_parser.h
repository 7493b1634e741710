#pragma once

#include <QList>
#include <QString>
#include <cstdint>

#include "qualcomm/protocol/firehose_client.h"

namespace qedl {

// ─── One instruction from a rawprogram/patch descriptor ──────────────
enum class FlashActionType {
    Program,
    Patch,
    Read,
    GetSha256Digest,
};

QString flashActionTypeName(FlashActionType type);

struct FlashAction {
    FlashActionType type = FlashActionType::Program;
    int line = 0;                    // position in the descriptor, for messages

    QString filename;
    QString label;
    uint32_t sectorSize = 0;         // 0 when the element does not say
    uint64_t numSectors = 0;
    uint32_t physicalPartition = 0;
    int slot = -1;                   // -1 = session storage slot
    QString startSector;             // may be a device-evaluated expression
    uint64_t fileSectorOffset = 0;

    // <patch> only
    uint64_t byteOffset = 0;
    uint32_t sizeInBytes = 0;
    QString value;
    QString what;

    SectorRange range() const;
    FirehosePatch toPatch() const;
};

// ─── Rawprogram parse result ─────────────────────────────────────────
struct RawprogramParseResult {
    QList<FlashAction> actions;      // in file order
    bool success = false;
    QString errorMessage;
};

// ─── Parser for rawprogram*.xml and patch*.xml ───────────────────────
// Element names are matched case-insensitively. Anything other than
// program, patch, read or getsha256digest fails the whole descriptor.
class RawprogramParser {
public:
    static RawprogramParseResult parseFile(const QString& filePath);
    static RawprogramParseResult parseXml(const QByteArray& xmlData);

    // Labels whose LUN becomes the boot drive once flashed
    static bool isBootableLabel(const QString& label);
};

} // namespace qedl
