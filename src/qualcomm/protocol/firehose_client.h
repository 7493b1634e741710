#pragma once

#include <QByteArray>
#include <QList>
#include <QMap>
#include <QObject>
#include <QPair>
#include <QString>
#include <QStringList>
#include <cstdint>

#include "common/storage_descriptor.h"
#include "core/edl_error.h"
#include "core/session_config.h"

namespace qedl {

class ITransport;

// ─── Firehose XML command ────────────────────────────────────────────
// One element inside <data>. Attributes are emitted in insertion order.
struct FirehoseCommand {
    QString tag;
    QList<QPair<QString, QString>> attributes;

    FirehoseCommand() = default;
    explicit FirehoseCommand(const QString& t) : tag(t) {}

    FirehoseCommand& set(const QString& name, const QString& value);
    FirehoseCommand& set(const QString& name, qulonglong value);
    QString value(const QString& name) const;
    QByteArray toXml() const;
};

// ─── Firehose XML response ───────────────────────────────────────────
struct FirehoseResponse {
    bool success = false;
    QString rawValue;                   // "ACK" / "NAK"
    bool rawMode = false;               // payload phase follows
    QMap<QString, QString> attributes;  // every attribute of <response>
    QStringList logLines;               // <log value="..."/> before the response

    // Device-supplied reason for a NAK: the last log line, if any
    QString reason() const;
};

// Negotiated during <configure>
struct FirehoseConfig {
    uint32_t maxPayloadSize = 0;          // host → target ceiling actually in use
    uint32_t maxPayloadSupported = 0;
    uint32_t maxXmlSize = 0;
    uint32_t reportedSectorSize = 0;      // 0 when the device does not say
    QString version;
    uint32_t minVersionSupported = 0;
};

struct FirehoseConfigureRequest {
    uint32_t maxPayloadSize = 1048576;
    bool skipStorageInit = false;
    bool bypassStorage = false;  // SkipWrite: accept, never touch storage
    bool hashPackets = false;    // AlwaysValidate
    bool verbose = false;
};

// Sector-addressed region of one physical partition
struct SectorRange {
    uint32_t physicalPartition = 0;
    QString startSector;        // decimal, or an expression the device evaluates
    uint64_t numSectors = 0;
    int slot = -1;              // -1 = storage descriptor slot
    QString label;              // program only: reported as filename

    static SectorRange at(uint32_t lun, uint64_t start, uint64_t count);
    // True when startSector is a plain number
    bool numericStart(uint64_t* value = nullptr) const;
};

// One <patch> element. start_sector and value may be device expressions.
struct FirehosePatch {
    uint32_t sectorSize = 0;
    uint64_t byteOffset = 0;
    QString filename = QStringLiteral("DISK");
    uint32_t physicalPartition = 0;
    uint32_t sizeInBytes = 0;
    QString startSector;
    QString value;
    int slot = -1;
    QString what;
};

struct PatchOutcome {
    int index = 0;
    EdlError error;
};

// ─── Engine state ────────────────────────────────────────────────────
enum class FirehoseState {
    Idle,
    CommandSent,
    RawTransfer,
    Acked,
    Nakked,
};

QString firehoseStateName(FirehoseState state);

// ─── Firehose client ─────────────────────────────────────────────────
// Strictly one command in flight: issue() is refused unless Idle, and
// every command ends in exactly one terminal ACK or NAK.
class FirehoseClient : public QObject {
    Q_OBJECT

public:
    explicit FirehoseClient(ITransport* transport, QObject* parent = nullptr);

    void setStorage(const StorageDescriptor& storage) { m_storage = storage; }
    const StorageDescriptor& storage() const { return m_storage; }

    // Device log lines at Info instead of Debug
    void setPrintDeviceLog(bool print) { m_printDeviceLog = print; }

    // ── Negotiation ──────────────────────────────────────────────────
    bool drainWelcomeLogs(int quietMs = 500);
    bool configure(const FirehoseConfigureRequest& request);
    const FirehoseConfig& config() const { return m_config; }
    uint32_t maxPayloadSize() const { return m_config.maxPayloadSize; }

    // ── Command/response exchange ────────────────────────────────────
    bool issue(const FirehoseCommand& cmd);
    bool awaitResponse(FirehoseResponse& response, int timeoutMs = XML_TIMEOUT_MS);
    // issue + awaitResponse; NAK is reported as a FirehoseNak error
    bool execute(const FirehoseCommand& cmd, FirehoseResponse* response = nullptr,
                 int timeoutMs = XML_TIMEOUT_MS);

    // ── Payload phase (program/read) ─────────────────────────────────
    bool beginProgram(const SectorRange& range);
    bool beginRead(const SectorRange& range);
    bool sendPayload(const QByteArray& data);
    // Out-of-band digest ahead of a payload chunk (hash-packets mode)
    bool sendDigest(const QByteArray& digest);
    bool receivePayload(int size, QByteArray& out);
    // Awaits the closing response; the declared size must be fully moved
    bool finishTransfer(FirehoseResponse* response = nullptr);

    // ── Operations ───────────────────────────────────────────────────
    bool nop();
    bool erase(const SectorRange& range);
    bool peek(uint64_t address, uint64_t size, QByteArray& out);
    bool patch(const FirehosePatch& patch);
    // Each patch is tried independently; failures are listed by position.
    // Stops early only when the channel itself is broken.
    bool applyPatches(const QList<FirehosePatch>& patches, QList<PatchOutcome>* failures);
    bool setBootableStorageDrive(uint32_t index);
    bool power(ResetMode mode, int delaySeconds = 0);
    bool getSha256Digest(const SectorRange& range, QByteArray* digest);

    // Drops any half-finished exchange so a final reset can be attempted
    void abandon();

    FirehoseState state() const { return m_state; }
    EdlError lastError() const { return m_lastError; }

    static constexpr uint32_t FH_PROTO_VERSION_SUPPORTED = 1;
    static constexpr int XML_TIMEOUT_MS = 10000;
    static constexpr int DATA_TIMEOUT_MS = 60000;

signals:
    void deviceLog(const QString& line);
    void stateChanged(qedl::FirehoseState state);

private:
    FirehoseCommand rangeCommand(const QString& tag, const SectorRange& range) const;
    bool beginRaw(const FirehoseCommand& cmd, uint64_t totalBytes);
    bool sendConfigure(const FirehoseConfigureRequest& request, uint32_t payloadSize,
                       FirehoseResponse& response);
    bool takeDocument(QByteArray& document);
    bool parseDocument(const QByteArray& document, FirehoseResponse& response, bool* terminal);
    void surfaceLog(const QString& line);

    void setState(FirehoseState state);
    bool fail(EdlErrorKind kind, const QString& message);

    ITransport* m_transport = nullptr;
    StorageDescriptor m_storage;
    FirehoseConfig m_config;
    FirehoseState m_state = FirehoseState::Idle;
    EdlError m_lastError;
    QByteArray m_rx;              // received bytes not consumed yet
    QString m_pendingTag;
    uint64_t m_rawRemaining = 0;
    bool m_rawIsRead = false;
    bool m_printDeviceLog = false;

    static constexpr int READ_CHUNK = 16384;
};

} // namespace qedl
