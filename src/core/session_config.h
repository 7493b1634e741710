#pragma once

#include "common/storage_descriptor.h"
#include "transport/i_transport.h"

#include <QString>
#include <cstdint>

namespace qedl {

// What the device does once the session is over
enum class ResetMode {
    Edl,     // back to Emergency Download Mode
    Off,
    System,  // regular boot
};

QString resetModeString(ResetMode mode);
bool parseResetMode(const QString& text, ResetMode* out);

// ─── Global session options ──────────────────────────────────────────
struct SessionOptions {
    // Transport
    TransportType backend = TransportType::USB;
    QString devicePath;          // serial port path (serial backend)
    QString serialNumber;        // USB device selection
    qint32 baudRate = 115200;

    QString loaderPath;

    // Storage
    StorageType storageType = StorageType::UFS;
    uint32_t sectorSize = 0;     // 0 = storage type default or device report
    uint32_t physicalPartition = 0;
    uint32_t storageSlot = 0;

    ResetMode resetMode = ResetMode::Edl;
    uint32_t maxPayloadSize = 1048576;

    // Validation and workarounds
    bool hashPackets = false;
    bool readBackVerify = false;
    bool skipHelloWait = false;
    bool skipStorageInit = false;
    bool bypassStorage = false;
    bool readDeviceInfo = true;

    // Diagnostics
    bool verboseSahara = false;
    bool verboseFirehose = false;
    bool printFirehoseLog = false;
    QString logFile;
};

class SessionConfig {
public:
    // Loads an INI file ([transport], [storage], [session], [log] groups)
    // over the given options. Keys not present keep their current value.
    static bool loadFile(const QString& path, SessionOptions& options, QString* error);

    // Storage sector size to use when nothing else decides it
    static uint32_t effectiveSectorSize(const SessionOptions& options);
};

} // namespace qedl
