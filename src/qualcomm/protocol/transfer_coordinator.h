#pragma once

#include <QByteArray>
#include <QList>
#include <QObject>
#include <atomic>
#include <functional>

#include "core/edl_error.h"
#include "firehose_client.h"

namespace qedl {

// ─── Transfer plan ───────────────────────────────────────────────────
struct TransferChunk {
    qint64 offset = 0;
    qint64 length = 0;
};

// Ascending, gapless, non-overlapping chunks covering [0, total).
// Every chunk is at most maxChunk bytes; only the last may be shorter.
class TransferPlan {
public:
    static TransferPlan build(qint64 totalLength, qint64 maxChunk);

    const QList<TransferChunk>& chunks() const { return m_chunks; }
    qint64 totalLength() const { return m_total; }
    int size() const { return m_chunks.size(); }
    bool isEmpty() const { return m_chunks.isEmpty(); }

private:
    QList<TransferChunk> m_chunks;
    qint64 m_total = 0;
};

// Fills `out` with up to `length` bytes of image data starting at `offset`.
// A short result is zero-padded to the chunk length.
using ChunkSource = std::function<bool(qint64 offset, qint64 length, QByteArray& out)>;
// Receives chunks in ascending order
using ChunkSink = std::function<bool(const QByteArray& data)>;

// ─── Transfer coordinator ────────────────────────────────────────────
// Moves sector ranges through the Firehose payload phase in chunks no
// larger than the negotiated payload size.
class TransferCoordinator : public QObject {
    Q_OBJECT

public:
    explicit TransferCoordinator(FirehoseClient* firehose, QObject* parent = nullptr);

    void setHashPackets(bool enabled) { m_hashPackets = enabled; }
    void setReadBackVerify(bool enabled) { m_readBackVerify = enabled; }
    // Checked between chunks only, never inside one
    void setCancelFlag(const std::atomic_bool* flag) { m_cancel = flag; }

    // Largest whole-sector chunk that fits the negotiated payload size
    qint64 chunkSize() const;

    bool write(const SectorRange& range, const ChunkSource& source);
    // `keepBytes` >= 0 truncates what reaches the sink (the tail of the
    // last sector is still read from the device)
    bool read(const SectorRange& range, const ChunkSink& sink, qint64 keepBytes = -1);

    EdlError lastError() const { return m_lastError; }

signals:
    void progress(qint64 done, qint64 total);

private:
    bool writeWhole(const SectorRange& range, const TransferPlan& plan, const ChunkSource& source);
    bool writeChunked(const SectorRange& range, uint64_t startSector, const TransferPlan& plan,
                      const ChunkSource& source);
    bool programSpan(const SectorRange& range, const TransferPlan& plan, qint64 baseOffset,
                     const ChunkSource& source, bool reportProgress);
    bool programWithRetry(const SectorRange& range, const TransferPlan& plan, qint64 baseOffset,
                          const ChunkSource& source, bool reportProgress);
    bool verifyRange(const SectorRange& range, qint64 baseOffset, const ChunkSource& source);
    bool fetchChunk(const ChunkSource& source, qint64 offset, qint64 length, QByteArray& out);

    bool cancelled() const;
    void reportProgress(qint64 done);
    bool fail(EdlErrorKind kind, const QString& message);
    bool failFromFirehose();

    FirehoseClient* m_firehose = nullptr;
    bool m_hashPackets = false;
    bool m_readBackVerify = false;
    const std::atomic_bool* m_cancel = nullptr;
    EdlError m_lastError;

    qint64 m_progressTotal = 0;
    qint64 m_progressDone = 0;
};

} // namespace qedl
