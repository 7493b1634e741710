#pragma once

#include "core/edl_error.h"

#include <QByteArray>
#include <QList>
#include <QObject>
#include <QString>
#include <QStringList>
#include <cstdint>

namespace qedl {

class ITransport;

// ─── Sahara command IDs ──────────────────────────────────────────────
enum class SaharaCommand : uint32_t {
    Hello              = 0x01,
    HelloResponse      = 0x02,
    ReadData           = 0x03,  // 32-bit read (old devices)
    EndImageTransfer   = 0x04,
    Done               = 0x05,
    DoneResponse       = 0x06,
    Reset              = 0x07,
    ResetResponse      = 0x08,
    MemoryDebug        = 0x09,
    MemoryRead         = 0x0A,
    CommandReady       = 0x0B,  // Device → Host: Command mode accepted
    SwitchMode         = 0x0C,  // Host → Device
    Execute            = 0x0D,  // Host → Device
    ExecuteData        = 0x0E,  // Device → Host: command data length
    ExecuteResponse    = 0x0F,  // Host → Device: send the data
    MemoryDebug64      = 0x10,
    MemoryRead64       = 0x11,
    ReadData64         = 0x12,  // 64-bit read (new devices)
};

// ─── Sahara mode codes ───────────────────────────────────────────────
enum class SaharaMode : uint32_t {
    ImageTransferPending  = 0x0,
    ImageTransferComplete = 0x1,
    MemoryDebug           = 0x2,
    Command               = 0x3,
};

enum class SaharaExecCommand : uint32_t {
    SerialNumRead   = 0x01,
    OemPkHashRead   = 0x03,
};

// ─── Engine states ───────────────────────────────────────────────────
enum class SaharaState {
    AwaitHello,
    Negotiating,
    SendingImage,
    AwaitDoneAck,
    Complete,
    Errored,
};

QString saharaStateName(SaharaState state);

struct SaharaDeviceInfo {
    uint32_t saharaVersion = 0;
    uint32_t saharaMinVersion = 0;
    uint32_t serial = 0;
    QString serialHex;
    QByteArray pkHash;
    QString pkHashHex;
    bool chipInfoRead = false;
};

// One entry of the memory table a crashed device publishes
struct SaharaMemoryRegion {
    uint64_t savePref = 0;
    uint64_t base = 0;
    uint64_t length = 0;
    QString description;
    QString filename;
};

// Receives memory regions pulled in memory debug mode
class IDumpSink {
public:
    virtual ~IDumpSink() = default;
    virtual bool beginRegion(const SaharaMemoryRegion& region) = 0;
    virtual bool writeChunk(const QByteArray& data) = 0;
    virtual bool endRegion() = 0;
};

// ─── Sahara packet structures (on-wire, little-endian) ───────────────
#pragma pack(push, 1)

struct SaharaPacketHeader {
    uint32_t command = 0;
    uint32_t length  = 0;   // includes this header
};

struct SaharaHelloPacket {
    SaharaPacketHeader header;   // command = 0x01
    uint32_t version     = 0;
    uint32_t versionMin  = 0;
    uint32_t maxCmdLen   = 0;
    uint32_t mode        = 0;
    uint32_t reserved[6] = {};
};

struct SaharaHelloResponsePacket {
    SaharaPacketHeader header;   // command = 0x02
    uint32_t version     = 0;
    uint32_t versionMin  = 0;
    uint32_t status      = 0;
    uint32_t mode        = 0;
    uint32_t reserved[6] = {};
};

struct SaharaReadDataPacket {
    SaharaPacketHeader header;   // command = 0x03
    uint32_t imageId = 0;
    uint32_t offset  = 0;
    uint32_t length  = 0;
};

struct SaharaReadData64Packet {
    SaharaPacketHeader header;   // command = 0x12
    uint64_t imageId = 0;
    uint64_t offset  = 0;
    uint64_t length  = 0;
};

struct SaharaEndImageTransferPacket {
    SaharaPacketHeader header;   // command = 0x04
    uint32_t imageId = 0;
    uint32_t status  = 0;
};

struct SaharaDoneResponsePacket {
    SaharaPacketHeader header;   // command = 0x06
    uint32_t imageTxStatus = 0;  // 0 = more images pending, 1 = complete
};

struct SaharaMemoryDebugPacket {
    SaharaPacketHeader header;   // command = 0x09
    uint32_t tableAddress = 0;
    uint32_t tableLength  = 0;
};

struct SaharaMemoryDebug64Packet {
    SaharaPacketHeader header;   // command = 0x10
    uint64_t tableAddress = 0;
    uint64_t tableLength  = 0;
};

struct SaharaMemoryReadPacket {
    SaharaPacketHeader header;   // command = 0x0A
    uint32_t address = 0;
    uint32_t length  = 0;
};

struct SaharaMemoryRead64Packet {
    SaharaPacketHeader header;   // command = 0x11
    uint64_t address = 0;
    uint64_t length  = 0;
};

struct SaharaMemoryTableEntry {
    uint32_t savePref = 0;
    uint32_t base     = 0;
    uint32_t length   = 0;
    char description[20] = {};
    char filename[20]    = {};
};

struct SaharaMemoryTableEntry64 {
    uint64_t savePref = 0;
    uint64_t base     = 0;
    uint64_t length   = 0;
    char description[20] = {};
    char filename[20]    = {};
};

struct SaharaExecutePacket {
    SaharaPacketHeader header;   // command = 0x0D
    uint32_t clientCommand = 0;
};

struct SaharaExecuteDataPacket {
    SaharaPacketHeader header;   // command = 0x0E
    uint32_t clientCommand = 0;
    uint32_t dataLength    = 0;
};

struct SaharaExecuteResponsePacket {
    SaharaPacketHeader header;   // command = 0x0F
    uint32_t clientCommand = 0;
};

struct SaharaSwitchModePacket {
    SaharaPacketHeader header;   // command = 0x0C
    uint32_t mode = 0;
};

#pragma pack(pop)

// ─── Sahara client ───────────────────────────────────────────────────
// Drives the bootrom side of EDL. Every malformed or unexpected packet
// moves the engine to Errored; nothing is retried.
class SaharaClient : public QObject {
    Q_OBJECT

public:
    explicit SaharaClient(ITransport* transport, QObject* parent = nullptr);

    // Some other program already consumed the Hello: answer blindly
    void setSkipHello(bool skip) { m_skipHello = skip; }
    // Query serial number and PK hash in Command mode before loading
    void setReadDeviceInfo(bool read) { m_readDeviceInfo = read; }

    // AwaitHello → ... → Complete. The loader is running on success.
    bool uploadLoader(const QByteArray& image);

    // Memory debug mode: fetch the region table, then pull every region
    // matching `regionFilter` (description or filename, empty = all)
    bool memoryDump(const QStringList& regionFilter, IDumpSink* sink);

    bool sendReset();

    SaharaState state() const { return m_state; }
    SaharaDeviceInfo deviceInfo() const { return m_deviceInfo; }
    QList<SaharaMemoryRegion> memoryTable() const { return m_memoryTable; }
    EdlError lastError() const { return m_lastError; }

    // Exact on-wire size of a packet the device may send (0 if unknown)
    static uint32_t expectedLength(uint32_t command);

    static constexpr uint32_t SAHARA_VERSION = 2;
    static constexpr uint32_t SAHARA_VERSION_MIN = 1;
    static constexpr uint64_t MEMORY_READ_CHUNK = 0x10000;

signals:
    void uploadProgress(qint64 served, qint64 total);
    void dumpProgress(const QString& region, qint64 done, qint64 total);
    void stateChanged(qedl::SaharaState state);

private:
    bool readPacket(QByteArray& packet, int timeoutMs);
    bool sendPacket(const void* data, uint32_t size);
    bool sendHelloResponse(SaharaMode mode);
    bool sendSwitchMode(SaharaMode mode);

    bool awaitHello(SaharaHelloPacket* hello);
    bool negotiate(QByteArray& pending);
    bool readDeviceInfo();
    bool executeCommand(SaharaExecCommand cmd, QByteArray& data);
    bool serveImage(const QByteArray& image, QByteArray pending);
    bool serveRead(const QByteArray& image, uint64_t offset, uint64_t length);

    bool memoryRead(uint64_t address, uint64_t length, QByteArray& out);
    bool parseMemoryTable(const QByteArray& raw, bool is64);

    void setState(SaharaState state);
    bool fail(EdlErrorKind kind, const QString& message);

    ITransport* m_transport = nullptr;
    SaharaState m_state = SaharaState::AwaitHello;
    SaharaDeviceInfo m_deviceInfo;
    QList<SaharaMemoryRegion> m_memoryTable;
    EdlError m_lastError;
    bool m_skipHello = false;
    bool m_readDeviceInfo = true;
    bool m_use64BitMemory = false;

    static constexpr uint32_t MAX_PACKET_SIZE = 0x1000;
    static constexpr int HELLO_TIMEOUT_MS = 10000;
    static constexpr int READ_TIMEOUT_MS = 5000;
    static constexpr int CMD_TIMEOUT_MS = 2000;
};

} // namespace qedl
