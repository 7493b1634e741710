#pragma once

#include <QString>
#include <QList>
#include <QUuid>
#include <cstdint>

namespace qedl {

// One populated slot of the partition entry array
struct GptPartitionEntry {
    uint32_t index = 0;          // position in the on-disk array
    QUuid typeGuid;
    QUuid uniqueGuid;
    uint64_t firstLba = 0;
    uint64_t lastLba = 0;        // inclusive
    uint64_t attributes = 0;
    QString name;

    uint64_t numSectors() const { return lastLba >= firstLba ? lastLba - firstLba + 1 : 0; }
    uint64_t sizeBytes(uint32_t sectorSize) const { return numSectors() * sectorSize; }

    bool operator==(const GptPartitionEntry& o) const {
        return index == o.index && typeGuid == o.typeGuid && uniqueGuid == o.uniqueGuid
            && firstLba == o.firstLba && lastLba == o.lastLba
            && attributes == o.attributes && name == o.name;
    }
    bool operator!=(const GptPartitionEntry& o) const { return !(*this == o); }
};

struct GptHeader {
    uint64_t signature = 0;
    uint32_t revision = 0x00010000;
    uint32_t headerSize = 92;
    uint32_t headerCrc32 = 0;
    uint64_t currentLba = 1;
    uint64_t backupLba = 0;
    uint64_t firstUsableLba = 0;
    uint64_t lastUsableLba = 0;
    QUuid diskGuid;
    uint64_t partitionEntryLba = 2;
    uint32_t numPartitionEntries = 128;
    uint32_t partitionEntrySize = 128;
    uint32_t partitionArrayCrc32 = 0;

    bool operator==(const GptHeader& o) const {
        return signature == o.signature && revision == o.revision
            && headerSize == o.headerSize && headerCrc32 == o.headerCrc32
            && currentLba == o.currentLba && backupLba == o.backupLba
            && firstUsableLba == o.firstUsableLba && lastUsableLba == o.lastUsableLba
            && diskGuid == o.diskGuid && partitionEntryLba == o.partitionEntryLba
            && numPartitionEntries == o.numPartitionEntries
            && partitionEntrySize == o.partitionEntrySize
            && partitionArrayCrc32 == o.partitionArrayCrc32;
    }
};

enum class GptError {
    None = 0,
    TooSmall,       // buffer does not reach the header or the entry array
    BadSignature,
    BadHeaderCrc,
    BadArrayCrc,
    BadLayout,      // entry size/count or array location make no sense
};

QString gptErrorString(GptError error);

struct GptParseResult {
    GptHeader header;
    QList<GptPartitionEntry> entries;
    uint32_t sectorSize = 512;
    GptError error = GptError::None;
    QString errorMessage;

    bool success() const { return error == GptError::None; }
    // Header and entries were decoded, only a checksum disagreed
    bool decoded() const {
        return error == GptError::None || error == GptError::BadArrayCrc
            || (error == GptError::BadHeaderCrc && !entries.isEmpty());
    }
};

} // namespace qedl
