#pragma once

#include <QObject>
#include <QByteArray>
#include <QList>
#include <QString>
#include <QStringList>
#include <atomic>
#include <memory>

#include "common/partition_info.h"
#include "core/edl_error.h"
#include "core/session_config.h"
#include "qualcomm/parsers/rawprogram_parser.h"
#include "qualcomm/protocol/firehose_client.h"
#include "qualcomm/protocol/sahara_protocol.h"
#include "qualcomm/protocol/transfer_coordinator.h"

namespace qedl {

class ITransport;

// ─── One EDL session against one device ──────────────────────────────
// Owns the transport for its whole lifetime. Binds Sahara, Firehose, the
// transfer coordinator and the GPT codec into the user-level operations.
class EdlSession : public QObject {
    Q_OBJECT

public:
    enum class Phase {
        Closed,
        Sahara,
        Firehose,
        Finished,
    };

    EdlSession(const SessionOptions& options, std::unique_ptr<ITransport> transport,
               QObject* parent = nullptr);
    ~EdlSession();

    void setCancelFlag(const std::atomic_bool* flag);

    // ── Lifecycle ────────────────────────────────────────────────────
    // Opens the transport, loads the programmer, configures Firehose
    bool start(const QByteArray& loader);
    // For a programmer that is already running: welcome logs + configure
    bool attachFirehose();
    // Resets the device (configured mode on success, EDL otherwise) and
    // releases the transport. Safe to call more than once.
    bool finish(bool success);

    // ── Operations ───────────────────────────────────────────────────
    bool dump(const QString& outDir);
    bool dumpPartition(const QString& name, const QString& outDir);
    bool write(const QString& name, const QString& imagePath);
    bool overwriteStorage(const QString& imagePath);
    bool erase(const QString& name);
    bool nop();
    bool peek(uint64_t address, uint64_t size, QByteArray* out);
    bool printGpt(QString* rendered);
    bool setBootablePart(uint32_t index);
    bool flasher(const QStringList& programFiles, const QStringList& patchFiles,
                 const QString& outDir);
    bool reset(ResetMode mode);

    // Sahara memory-debug path; needs no programmer
    bool ramdump(const QStringList& regions, const QString& outDir);

    // GPT of the session's physical partition. With `strict` any damage
    // fails; otherwise a table that still decodes only warns.
    bool readGpt(GptParseResult& gpt, bool strict);

    Phase phase() const { return m_phase; }
    const StorageDescriptor& storage() const { return m_storage; }
    SaharaDeviceInfo deviceInfo() const { return m_sahara->deviceInfo(); }
    EdlError lastError() const { return m_lastError; }

    SaharaClient* saharaClient() { return m_sahara.get(); }
    FirehoseClient* firehoseClient() { return m_firehose.get(); }
    TransferCoordinator* transferCoordinator() { return m_transfer.get(); }

signals:
    void progress(qint64 done, qint64 total);
    void phaseChanged(int phase);

private:
    bool openTransport();
    bool resolve(const GptParseResult& gpt, const QString& name, GptPartitionEntry* entry);
    SectorRange entryRange(const GptPartitionEntry& entry) const;
    bool readRangeToFile(const SectorRange& range, const QString& path);
    bool writeFileToRange(const QString& imagePath, qint64 fileOffset, SectorRange range,
                          bool fitToImage);

    bool runProgram(const FlashAction& action, const QString& imageDir, int* bootableLun);
    bool runPatches(const QList<FlashAction>& actions);
    bool runRead(const FlashAction& action, const QString& outDir);
    bool runDigest(const FlashAction& action, const QString& imageDir);

    bool requireFirehose();
    bool cancelled() const;
    void setPhase(Phase phase);
    bool fail(EdlErrorKind kind, const QString& message);
    bool failWith(const EdlError& error);

    SessionOptions m_options;
    StorageDescriptor m_storage;
    std::unique_ptr<ITransport> m_transport;
    std::unique_ptr<SaharaClient> m_sahara;
    std::unique_ptr<FirehoseClient> m_firehose;
    std::unique_ptr<TransferCoordinator> m_transfer;
    const std::atomic_bool* m_cancel = nullptr;

    Phase m_phase = Phase::Closed;
    bool m_resetSent = false;
    EdlError m_lastError;
};

} // namespace qedl
