#pragma once

#include "partition_info.h"
#include <QByteArray>

namespace qedl {

class GptParser {
public:
    // `data` starts at LBA0 and must reach the end of the entry array.
    // Checks run in order signature, header CRC, layout, array CRC; the
    // first failure is reported but decoding continues as far as the
    // layout allows so a damaged table can still be displayed.
    static GptParseResult parse(const QByteArray& data, uint32_t sectorSize);

    // Decodes and checks only the header at LBA1 (data covers LBA0..LBA1)
    static GptError parseHeader(const QByteArray& data, uint32_t sectorSize,
                                GptHeader* header, QString* message = nullptr);

    // Bytes from LBA0 needed to hold the whole entry array, or
    // UNREACHABLE_BYTES when partition_entry_lba puts it past 2^64
    static uint64_t requiredBytes(const GptHeader& header, uint32_t sectorSize);

    // First entry whose decoded name matches exactly, or nullptr
    static const GptPartitionEntry* resolve(const QList<GptPartitionEntry>& entries,
                                            const QString& name);

    static QString render(const GptParseResult& gpt);
    static GptParseResult parseRendered(const QString& text);

    // Builds LBA0..end of entry array with both checksums filled in
    static QByteArray serialize(GptHeader header, const QList<GptPartitionEntry>& entries,
                                uint32_t sectorSize);

    static constexpr uint64_t GPT_SIGNATURE = 0x5452415020494645ULL; // "EFI PART"
    static constexpr uint32_t MIN_HEADER_SIZE = 92;
    static constexpr uint32_t MIN_ENTRY_SIZE = 128;
    static constexpr uint64_t UNREACHABLE_BYTES = UINT64_MAX;

private:
    static GptHeader decodeHeader(const uint8_t* data);
    static void encodeHeader(const GptHeader& h, uint8_t* data);
    static GptPartitionEntry decodeEntry(const uint8_t* data, uint32_t index);
    static void encodeEntry(const GptPartitionEntry& e, uint8_t* data);
    static QUuid readGuid(const uint8_t* data);
    static void writeGuid(const QUuid& guid, uint8_t* data);
};

} // namespace qedl
