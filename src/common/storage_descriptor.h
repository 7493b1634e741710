#pragma once

#include <QString>
#include <cstdint>

namespace qedl {

// ─── Storage media understood by Firehose loaders ────────────────────
enum class StorageType {
    eMMC,
    UFS,
    NVMe,
    NAND,
};

// Fixed at session start. Sector size feeds every command the session
// issues, so it is never changed once Firehose has been configured.
struct StorageDescriptor {
    StorageType type = StorageType::UFS;
    uint32_t sectorSize = 4096;
    uint32_t physicalPartition = 0;   // LUN
    uint32_t slot = 0;                // physical device index (secondary UFS etc.)
};

inline QString storageTypeString(StorageType type)
{
    switch (type) {
    case StorageType::eMMC: return QStringLiteral("emmc");
    case StorageType::UFS:  return QStringLiteral("ufs");
    case StorageType::NVMe: return QStringLiteral("nvme");
    case StorageType::NAND: return QStringLiteral("nand");
    }
    return QStringLiteral("ufs");
}

inline bool parseStorageType(const QString& text, StorageType* out)
{
    const QString t = text.trimmed().toLower();
    if (t == "emmc")      *out = StorageType::eMMC;
    else if (t == "ufs")  *out = StorageType::UFS;
    else if (t == "nvme") *out = StorageType::NVMe;
    else if (t == "nand") *out = StorageType::NAND;
    else return false;
    return true;
}

inline uint32_t defaultSectorSize(StorageType type)
{
    switch (type) {
    case StorageType::eMMC: return 512;
    case StorageType::UFS:  return 4096;
    case StorageType::NVMe: return 512;
    case StorageType::NAND: return 4096;
    }
    return 512;
}

} // namespace qedl
