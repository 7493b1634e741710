#include "transfer_coordinator.h"
#include "common/sha256.h"
#include "core/logger.h"

static const QString TAG = QStringLiteral("Transfer");

namespace qedl {

TransferPlan TransferPlan::build(qint64 totalLength, qint64 maxChunk)
{
    TransferPlan plan;
    plan.m_total = qMax<qint64>(totalLength, 0);
    const qint64 step = qMax<qint64>(maxChunk, 1);

    for (qint64 offset = 0; offset < plan.m_total; offset += step) {
        TransferChunk chunk;
        chunk.offset = offset;
        chunk.length = qMin(step, plan.m_total - offset);
        plan.m_chunks.append(chunk);
    }
    return plan;
}

// ─── Coordinator ─────────────────────────────────────────────────────

TransferCoordinator::TransferCoordinator(FirehoseClient* firehose, QObject* parent)
    : QObject(parent)
    , m_firehose(firehose)
{
    Q_ASSERT(firehose);
}

qint64 TransferCoordinator::chunkSize() const
{
    const qint64 sectorSize = m_firehose->storage().sectorSize;
    const qint64 chunk = (m_firehose->maxPayloadSize() / sectorSize) * sectorSize;
    return chunk > 0 ? chunk : sectorSize;
}

bool TransferCoordinator::cancelled() const
{
    return m_cancel && m_cancel->load();
}

void TransferCoordinator::reportProgress(qint64 done)
{
    done = qMin(done, m_progressTotal);
    if (done <= m_progressDone)
        return;
    m_progressDone = done;
    emit progress(m_progressDone, m_progressTotal);
}

bool TransferCoordinator::fail(EdlErrorKind kind, const QString& message)
{
    m_lastError = EdlError(kind, message);
    LOG_ERROR_CAT(TAG, message);
    return false;
}

bool TransferCoordinator::failFromFirehose()
{
    m_lastError = m_firehose->lastError();
    return false;
}

bool TransferCoordinator::fetchChunk(const ChunkSource& source, qint64 offset, qint64 length,
                                     QByteArray& out)
{
    out.clear();
    if (!source(offset, length, out))
        return fail(EdlErrorKind::Io, QString("Failed to read image data at offset %1").arg(offset));
    if (out.size() > length)
        out.truncate(static_cast<int>(length));
    else if (out.size() < length)
        out.append(QByteArray(static_cast<int>(length - out.size()), '\0'));
    return true;
}

// ─── Write ───────────────────────────────────────────────────────────

bool TransferCoordinator::write(const SectorRange& range, const ChunkSource& source)
{
    m_lastError = EdlError();
    const qint64 total = static_cast<qint64>(range.numSectors) * m_firehose->storage().sectorSize;
    const TransferPlan plan = TransferPlan::build(total, chunkSize());

    m_progressTotal = total;
    m_progressDone = 0;
    if (plan.isEmpty())
        return true;

    LOG_INFO_CAT(TAG, QString("Writing %1 bytes at sector %2 on LUN %3 in %4 chunk(s)")
                          .arg(total).arg(range.startSector).arg(range.physicalPartition).arg(plan.size()));

    // Per-chunk commands let a bad chunk be retried or verified on its own;
    // that needs a start sector the host can do arithmetic on
    uint64_t startSector = 0;
    if ((m_hashPackets || m_readBackVerify) && range.numericStart(&startSector))
        return writeChunked(range, startSector, plan, source);

    return writeWhole(range, plan, source);
}

bool TransferCoordinator::writeWhole(const SectorRange& range, const TransferPlan& plan,
                                     const ChunkSource& source)
{
    if (!programWithRetry(range, plan, 0, source, true))
        return false;
    if (m_readBackVerify)
        return verifyRange(range, 0, source);
    return true;
}

bool TransferCoordinator::writeChunked(const SectorRange& range, uint64_t startSector,
                                       const TransferPlan& plan, const ChunkSource& source)
{
    const qint64 sectorSize = m_firehose->storage().sectorSize;

    for (const TransferChunk& chunk : plan.chunks()) {
        SectorRange sub = range;
        sub.startSector = QString::number(startSector + static_cast<uint64_t>(chunk.offset / sectorSize));
        sub.numSectors = static_cast<uint64_t>(chunk.length / sectorSize);

        const TransferPlan single = TransferPlan::build(chunk.length, chunk.length);
        if (!programWithRetry(sub, single, chunk.offset, source, false))
            return false;
        if (m_readBackVerify && !verifyRange(sub, chunk.offset, source))
            return false;
        reportProgress(chunk.offset + chunk.length);
    }
    return true;
}

bool TransferCoordinator::programSpan(const SectorRange& range, const TransferPlan& plan,
                                      qint64 baseOffset, const ChunkSource& source, bool withProgress)
{
    if (cancelled())
        return fail(EdlErrorKind::Interrupted,
                    QString("Interrupted before writing offset %1").arg(baseOffset));
    if (!m_firehose->beginProgram(range))
        return failFromFirehose();

    for (const TransferChunk& chunk : plan.chunks()) {
        const qint64 offset = baseOffset + chunk.offset;
        if (cancelled())
            return fail(EdlErrorKind::Interrupted,
                        QString("Interrupted before writing offset %1").arg(offset));

        QByteArray data;
        if (!fetchChunk(source, offset, chunk.length, data))
            return false;
        if (m_hashPackets && !m_firehose->sendDigest(Sha256::hash(data)))
            return failFromFirehose();
        if (!m_firehose->sendPayload(data))
            return failFromFirehose();
        if (withProgress)
            reportProgress(offset + chunk.length);
    }

    if (!m_firehose->finishTransfer())
        return failFromFirehose();
    return true;
}

bool TransferCoordinator::programWithRetry(const SectorRange& range, const TransferPlan& plan,
                                           qint64 baseOffset, const ChunkSource& source,
                                           bool withProgress)
{
    if (programSpan(range, plan, baseOffset, source, withProgress))
        return true;

    const bool digestRejected = m_hashPackets
        && m_lastError.kind == EdlErrorKind::FirehoseNak
        && m_lastError.message.contains("hash", Qt::CaseInsensitive);
    if (!digestRejected)
        return false;

    LOG_WARNING_CAT(TAG, QString("Device rejected the digest at offset %1, retrying once").arg(baseOffset));
    if (programSpan(range, plan, baseOffset, source, withProgress))
        return true;

    if (m_lastError.kind == EdlErrorKind::FirehoseNak)
        return fail(EdlErrorKind::Verification,
                    QString("Packet hash mismatch at offset %1 persisted after retry: %2")
                        .arg(baseOffset).arg(m_lastError.message));
    return false;
}

bool TransferCoordinator::verifyRange(const SectorRange& range, qint64 baseOffset,
                                      const ChunkSource& source)
{
    const qint64 total = static_cast<qint64>(range.numSectors) * m_firehose->storage().sectorSize;
    const TransferPlan plan = TransferPlan::build(total, chunkSize());

    if (!m_firehose->beginRead(range))
        return failFromFirehose();

    for (const TransferChunk& chunk : plan.chunks()) {
        const qint64 offset = baseOffset + chunk.offset;
        if (cancelled())
            return fail(EdlErrorKind::Interrupted,
                        QString("Interrupted while verifying offset %1").arg(offset));

        QByteArray actual;
        if (!m_firehose->receivePayload(static_cast<int>(chunk.length), actual))
            return failFromFirehose();
        QByteArray expected;
        if (!fetchChunk(source, offset, chunk.length, expected))
            return false;

        if (actual != expected) {
            int i = 0;
            while (i < actual.size() && actual.at(i) == expected.at(i))
                i++;
            return fail(EdlErrorKind::Verification,
                        QString("Read-back mismatch in chunk at offset %1 (first differing byte at %2)")
                            .arg(offset).arg(offset + i));
        }
    }

    if (!m_firehose->finishTransfer())
        return failFromFirehose();
    return true;
}

// ─── Read ────────────────────────────────────────────────────────────

bool TransferCoordinator::read(const SectorRange& range, const ChunkSink& sink, qint64 keepBytes)
{
    m_lastError = EdlError();
    const qint64 total = static_cast<qint64>(range.numSectors) * m_firehose->storage().sectorSize;
    const qint64 keep = keepBytes < 0 ? total : qMin(keepBytes, total);
    const TransferPlan plan = TransferPlan::build(total, chunkSize());

    m_progressTotal = total;
    m_progressDone = 0;
    if (plan.isEmpty())
        return true;

    LOG_INFO_CAT(TAG, QString("Reading %1 bytes at sector %2 on LUN %3 in %4 chunk(s)")
                          .arg(total).arg(range.startSector).arg(range.physicalPartition).arg(plan.size()));

    if (cancelled())
        return fail(EdlErrorKind::Interrupted, "Interrupted before reading");
    if (!m_firehose->beginRead(range))
        return failFromFirehose();

    for (const TransferChunk& chunk : plan.chunks()) {
        if (cancelled())
            return fail(EdlErrorKind::Interrupted,
                        QString("Interrupted before reading offset %1").arg(chunk.offset));

        QByteArray data;
        if (!m_firehose->receivePayload(static_cast<int>(chunk.length), data))
            return failFromFirehose();

        if (chunk.offset < keep) {
            if (chunk.offset + chunk.length > keep)
                data.truncate(static_cast<int>(keep - chunk.offset));
            if (!sink(data))
                return fail(EdlErrorKind::Io,
                            QString("Failed to store data read at offset %1").arg(chunk.offset));
        }
        reportProgress(chunk.offset + chunk.length);
    }

    if (!m_firehose->finishTransfer())
        return failFromFirehose();
    return true;
}

} // namespace qedl
