#include "edl_session.h"
#include "file_dump_sink.h"
#include "common/gpt_parser.h"
#include "common/sha256.h"
#include "transport/i_transport.h"
#include "core/logger.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>

static const QString TAG = QStringLiteral("Session");

namespace qedl {

// Largest primary GPT we are willing to pull: 16384 entries of 512 bytes
static constexpr uint64_t MAX_GPT_BYTES = 8ull * 1024 * 1024 + 2 * 4096;
static constexpr qint64 DIGEST_CHUNK_BYTES = 1024 * 1024;

EdlSession::EdlSession(const SessionOptions& options, std::unique_ptr<ITransport> transport,
                       QObject* parent)
    : QObject(parent)
    , m_options(options)
    , m_transport(std::move(transport))
{
    Q_ASSERT(m_transport);

    m_storage.type = options.storageType;
    m_storage.sectorSize = SessionConfig::effectiveSectorSize(options);
    m_storage.physicalPartition = options.physicalPartition;
    m_storage.slot = options.storageSlot;

    m_sahara = std::make_unique<SaharaClient>(m_transport.get());
    m_sahara->setSkipHello(options.skipHelloWait);
    m_sahara->setReadDeviceInfo(options.readDeviceInfo);

    m_firehose = std::make_unique<FirehoseClient>(m_transport.get());
    m_firehose->setStorage(m_storage);
    m_firehose->setPrintDeviceLog(options.printFirehoseLog);

    m_transfer = std::make_unique<TransferCoordinator>(m_firehose.get());
    m_transfer->setHashPackets(options.hashPackets);
    m_transfer->setReadBackVerify(options.readBackVerify);
    connect(m_transfer.get(), &TransferCoordinator::progress, this, &EdlSession::progress);
}

EdlSession::~EdlSession()
{
    // Leaving without finish(): an error path, so send the device back to EDL
    if (m_phase != Phase::Finished && m_phase != Phase::Closed)
        finish(false);
    if (m_transport->isOpen())
        m_transport->close();
}

void EdlSession::setCancelFlag(const std::atomic_bool* flag)
{
    m_cancel = flag;
    m_transfer->setCancelFlag(flag);
}

bool EdlSession::cancelled() const
{
    return m_cancel && m_cancel->load();
}

void EdlSession::setPhase(Phase phase)
{
    if (m_phase == phase)
        return;
    m_phase = phase;
    emit phaseChanged(static_cast<int>(phase));
}

bool EdlSession::fail(EdlErrorKind kind, const QString& message)
{
    m_lastError = EdlError(kind, message);
    LOG_ERROR_CAT(TAG, message);
    return false;
}

bool EdlSession::failWith(const EdlError& error)
{
    m_lastError = error;
    return false;
}

// ─── Lifecycle ───────────────────────────────────────────────────────

bool EdlSession::openTransport()
{
    if (m_transport->isOpen())
        return true;
    if (!m_transport->open())
        return fail(EdlErrorKind::Transport,
                    QString("Cannot open %1").arg(m_transport->description()));
    LOG_INFO_CAT(TAG, QString("Connected via %1").arg(m_transport->description()));
    return true;
}

bool EdlSession::start(const QByteArray& loader)
{
    if (!openTransport())
        return false;

    setPhase(Phase::Sahara);
    if (!m_sahara->uploadLoader(loader))
        return failWith(m_sahara->lastError());

    const SaharaDeviceInfo info = m_sahara->deviceInfo();
    if (info.chipInfoRead) {
        LOG_INFO_CAT(TAG, QString("Chip serial number: 0x%1").arg(info.serialHex));
        LOG_INFO_CAT(TAG, QString("OEM public key hash: %1").arg(info.pkHashHex));
    }

    return attachFirehose();
}

bool EdlSession::attachFirehose()
{
    if (!openTransport())
        return false;

    // From here on an error path leaves the device in EDL
    setPhase(Phase::Firehose);

    if (!m_firehose->drainWelcomeLogs())
        return failWith(m_firehose->lastError());

    FirehoseConfigureRequest request;
    request.maxPayloadSize = m_options.maxPayloadSize;
    request.skipStorageInit = m_options.skipStorageInit;
    request.bypassStorage = m_options.bypassStorage;
    request.hashPackets = m_options.hashPackets;
    request.verbose = m_options.verboseFirehose;
    if (!m_firehose->configure(request))
        return failWith(m_firehose->lastError());

    // The storage descriptor is settled here, before any operation runs
    const uint32_t reported = m_firehose->config().reportedSectorSize;
    if (reported != 0 && reported != m_storage.sectorSize) {
        if (m_options.sectorSize != 0)
            return fail(EdlErrorKind::UserConfig,
                        QString("Sector size %1 conflicts with the %2 bytes reported by the device")
                            .arg(m_options.sectorSize).arg(reported));
        LOG_INFO_CAT(TAG, QString("Using device-reported sector size %1").arg(reported));
        m_storage.sectorSize = reported;
        m_firehose->setStorage(m_storage);
    }

    LOG_INFO_CAT(TAG, QString("Storage %1, sector size %2, LUN %3")
                          .arg(storageTypeString(m_storage.type))
                          .arg(m_storage.sectorSize)
                          .arg(m_storage.physicalPartition));
    return true;
}

bool EdlSession::finish(bool success)
{
    if (m_phase == Phase::Finished)
        return true;

    bool ok = true;
    if (m_phase == Phase::Firehose && !m_resetSent) {
        const ResetMode mode = success ? m_options.resetMode : ResetMode::Edl;
        if (!success)
            m_firehose->abandon();
        if (m_firehose->power(mode)) {
            m_resetSent = true;
            if (success)
                LOG_INFO_CAT(TAG, QString("All done, resetting to %1").arg(resetModeString(mode)));
        } else {
            LOG_WARNING_CAT(TAG, QString("Final reset to %1 failed: %2")
                                     .arg(resetModeString(mode), m_firehose->lastError().message));
            if (success)
                ok = failWith(m_firehose->lastError());
        }
    }

    if (m_transport->isOpen())
        m_transport->close();
    setPhase(Phase::Finished);
    return ok;
}

bool EdlSession::requireFirehose()
{
    if (m_phase != Phase::Firehose)
        return fail(EdlErrorKind::UserConfig, "Firehose is not running");
    return true;
}

// ─── GPT ─────────────────────────────────────────────────────────────

bool EdlSession::readGpt(GptParseResult& gpt, bool strict)
{
    if (!requireFirehose())
        return false;

    const uint32_t ss = m_storage.sectorSize;
    QByteArray raw;
    auto collect = [&raw](const QByteArray& data) {
        raw.append(data);
        return true;
    };

    // LBA0 (protective MBR) and LBA1 first, to learn how big the table is
    SectorRange head = SectorRange::at(m_storage.physicalPartition, 0, 2);
    if (!m_transfer->read(head, collect))
        return failWith(m_transfer->lastError());

    GptHeader header;
    QString message;
    const GptError headerError = GptParser::parseHeader(raw, ss, &header, &message);
    if (headerError == GptError::TooSmall || headerError == GptError::BadSignature
        || (headerError != GptError::None && strict)) {
        gpt = GptParseResult();
        gpt.header = header;
        gpt.sectorSize = ss;
        gpt.error = headerError;
        gpt.errorMessage = message;
        return fail(EdlErrorKind::Gpt, QString("LUN %1: %2").arg(m_storage.physicalPartition).arg(message));
    }

    const uint64_t needed = GptParser::requiredBytes(header, ss);
    if (needed == GptParser::UNREACHABLE_BYTES)
        return fail(EdlErrorKind::Gpt, QString("LUN %1: partition entry array at LBA %2 is out of range")
                                           .arg(m_storage.physicalPartition).arg(header.partitionEntryLba));
    if (needed > MAX_GPT_BYTES)
        return fail(EdlErrorKind::Gpt, QString("LUN %1: implausible GPT size of %2 bytes")
                                           .arg(m_storage.physicalPartition).arg(needed));

    const uint64_t sectors = (needed + ss - 1) / ss;
    if (sectors > 2) {
        raw.clear();
        if (!m_transfer->read(SectorRange::at(m_storage.physicalPartition, 0, sectors), collect))
            return failWith(m_transfer->lastError());
    }

    gpt = GptParser::parse(raw, ss);
    if (gpt.success())
        return true;

    const QString problem = QString("LUN %1: %2 (%3)")
                                .arg(m_storage.physicalPartition)
                                .arg(gptErrorString(gpt.error), gpt.errorMessage);
    if (strict || !gpt.decoded())
        return fail(EdlErrorKind::Gpt, problem);
    LOG_WARNING_CAT(TAG, problem);
    return true;
}

bool EdlSession::resolve(const GptParseResult& gpt, const QString& name, GptPartitionEntry* entry)
{
    const GptPartitionEntry* found = GptParser::resolve(gpt.entries, name);
    if (!found)
        return fail(EdlErrorKind::PartitionNotFound,
                    QString("No partition named '%1' on LUN %2").arg(name).arg(m_storage.physicalPartition));
    *entry = *found;
    return true;
}

SectorRange EdlSession::entryRange(const GptPartitionEntry& entry) const
{
    SectorRange range = SectorRange::at(m_storage.physicalPartition, entry.firstLba, entry.numSectors());
    range.label = entry.name;
    return range;
}

// ─── File plumbing ───────────────────────────────────────────────────

bool EdlSession::readRangeToFile(const SectorRange& range, const QString& path)
{
    if (!QFileInfo(path).dir().mkpath("."))
        return fail(EdlErrorKind::Io, QString("Cannot create directory for %1").arg(path));

    QFile out(path);
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate))
        return fail(EdlErrorKind::Io, QString("Cannot create %1: %2").arg(path, out.errorString()));

    auto sink = [&out](const QByteArray& data) { return out.write(data) == data.size(); };
    if (!m_transfer->read(range, sink))
        return failWith(m_transfer->lastError());
    if (!out.flush())
        return fail(EdlErrorKind::Io, QString("Cannot flush %1").arg(path));
    LOG_INFO_CAT(TAG, QString("Saved %1").arg(path));
    return true;
}

// With `fitToImage` the range is shrunk to the sectors the image covers
bool EdlSession::writeFileToRange(const QString& imagePath, qint64 fileOffset, SectorRange range,
                                  bool fitToImage)
{
    QFile image(imagePath);
    if (!image.open(QIODevice::ReadOnly))
        return fail(EdlErrorKind::Io, QString("Cannot open %1: %2").arg(imagePath, image.errorString()));

    const qint64 available = qMax<qint64>(image.size() - fileOffset, 0);
    if (fitToImage) {
        if (available == 0)
            return fail(EdlErrorKind::UserConfig, QString("%1 is empty").arg(imagePath));
        const uint64_t imageSectors = (static_cast<uint64_t>(available) + m_storage.sectorSize - 1)
                                      / m_storage.sectorSize;
        if (imageSectors > range.numSectors)
            return fail(EdlErrorKind::UserConfig,
                        QString("Partition %1 is too small for %2 (%3 > %4 sectors)")
                            .arg(range.label, imagePath).arg(imageSectors).arg(range.numSectors));
        range.numSectors = imageSectors;
    }

    auto source = [&image, fileOffset](qint64 offset, qint64 length, QByteArray& out) {
        if (!image.seek(fileOffset + offset))
            return false;
        // Past the end of the image the coordinator zero-fills the chunk
        out = image.read(length);
        return true;
    };

    LOG_INFO_CAT(TAG, QString("Writing %1 to sector %2 (%3 sectors)")
                          .arg(imagePath, range.startSector).arg(range.numSectors));
    if (!m_transfer->write(range, source))
        return failWith(m_transfer->lastError());
    return true;
}

// ─── Operations ──────────────────────────────────────────────────────

bool EdlSession::dump(const QString& outDir)
{
    GptParseResult gpt;
    if (!readGpt(gpt, false))
        return false;

    for (const GptPartitionEntry& entry : gpt.entries) {
        if (entry.name.isEmpty() || entry.numSectors() == 0)
            continue;
        if (cancelled())
            return fail(EdlErrorKind::Interrupted, "Interrupted between partitions");
        if (!readRangeToFile(entryRange(entry), QDir(outDir).filePath(safeFileName(entry.name))))
            return false;
    }
    return true;
}

bool EdlSession::dumpPartition(const QString& name, const QString& outDir)
{
    GptParseResult gpt;
    GptPartitionEntry entry;
    if (!readGpt(gpt, false) || !resolve(gpt, name, &entry))
        return false;
    return readRangeToFile(entryRange(entry), QDir(outDir).filePath(safeFileName(entry.name)));
}

bool EdlSession::write(const QString& name, const QString& imagePath)
{
    GptParseResult gpt;
    GptPartitionEntry entry;
    if (!readGpt(gpt, true) || !resolve(gpt, name, &entry))
        return false;
    return writeFileToRange(imagePath, 0, entryRange(entry), true);
}

bool EdlSession::overwriteStorage(const QString& imagePath)
{
    if (!requireFirehose())
        return false;
    SectorRange range = SectorRange::at(m_storage.physicalPartition, 0, UINT64_MAX);
    return writeFileToRange(imagePath, 0, range, true);
}

bool EdlSession::erase(const QString& name)
{
    GptParseResult gpt;
    GptPartitionEntry entry;
    if (!readGpt(gpt, true) || !resolve(gpt, name, &entry))
        return false;
    if (!m_firehose->erase(entryRange(entry)))
        return failWith(m_firehose->lastError());
    LOG_INFO_CAT(TAG, QString("Erased %1").arg(name));
    return true;
}

bool EdlSession::nop()
{
    if (!requireFirehose())
        return false;
    if (!m_firehose->nop())
        return failWith(m_firehose->lastError());
    return true;
}

bool EdlSession::peek(uint64_t address, uint64_t size, QByteArray* out)
{
    if (!requireFirehose())
        return false;
    QByteArray data;
    if (!m_firehose->peek(address, size, data))
        return failWith(m_firehose->lastError());
    if (out)
        *out = data;
    return true;
}

bool EdlSession::printGpt(QString* rendered)
{
    GptParseResult gpt;
    if (!readGpt(gpt, false))
        return false;
    const QString text = QString("GPT on physical partition %1 of %2:\n")
                             .arg(m_storage.physicalPartition)
                             .arg(storageTypeString(m_storage.type))
                       + GptParser::render(gpt);
    if (rendered)
        *rendered = text;
    return true;
}

bool EdlSession::setBootablePart(uint32_t index)
{
    if (!requireFirehose())
        return false;
    if (!m_firehose->setBootableStorageDrive(index))
        return failWith(m_firehose->lastError());
    return true;
}

bool EdlSession::reset(ResetMode mode)
{
    if (!requireFirehose())
        return false;
    if (!m_firehose->power(mode))
        return failWith(m_firehose->lastError());
    m_resetSent = true;
    return true;
}

// ─── Flasher ─────────────────────────────────────────────────────────

bool EdlSession::runProgram(const FlashAction& action, const QString& imageDir, int* bootableLun)
{
    if (action.sectorSize != m_storage.sectorSize)
        return fail(EdlErrorKind::UserConfig,
                    QString("Descriptor asks for %1-byte sectors, the session uses %2")
                        .arg(action.sectorSize).arg(m_storage.sectorSize));

    if (action.numSectors == 0) {
        LOG_INFO_CAT(TAG, QString("Skipping 0-length entry for %1").arg(action.label));
        return true;
    }
    if (RawprogramParser::isBootableLabel(action.label))
        *bootableLun = static_cast<int>(action.physicalPartition);

    if (action.filename.isEmpty()) {
        LOG_DEBUG_CAT(TAG, QString("Skipping entry without image for %1").arg(action.label));
        return true;
    }
    const QString imagePath = QDir(imageDir).filePath(action.filename);
    if (!QFileInfo::exists(imagePath)) {
        LOG_WARNING_CAT(TAG, QString("Skipping missing image %1").arg(imagePath));
        return true;
    }

    const qint64 fileOffset = static_cast<qint64>(action.fileSectorOffset) * m_storage.sectorSize;
    return writeFileToRange(imagePath, fileOffset, action.range(), false);
}

bool EdlSession::runPatches(const QList<FlashAction>& actions)
{
    QList<FirehosePatch> patches;
    QList<int> lines;
    for (const FlashAction& action : actions) {
        if (action.filename != QLatin1String("DISK")) {
            LOG_DEBUG_CAT(TAG, QString("Skipping patch of host file %1").arg(action.filename));
            continue;
        }
        patches.append(action.toPatch());
        lines.append(action.line);
    }
    if (patches.isEmpty())
        return true;

    QList<PatchOutcome> failures;
    if (m_firehose->applyPatches(patches, &failures))
        return true;

    for (const PatchOutcome& f : failures)
        LOG_ERROR_CAT(TAG, QString("Patch at line %1 failed: %2").arg(lines.at(f.index)).arg(f.error.message));
    return failWith(m_firehose->lastError());
}

bool EdlSession::runRead(const FlashAction& action, const QString& outDir)
{
    return readRangeToFile(action.range(), QDir(outDir).filePath(action.filename));
}

bool EdlSession::runDigest(const FlashAction& action, const QString& imageDir)
{
    QByteArray digest;
    if (!m_firehose->getSha256Digest(action.range(), &digest))
        return failWith(m_firehose->lastError());
    if (action.filename.isEmpty())
        return true;

    // Hash the image the way it was programmed: from file_sector_offset,
    // zero-filled up to the end of the range
    const QString imagePath = QDir(imageDir).filePath(action.filename);
    QFile image(imagePath);
    if (!image.open(QIODevice::ReadOnly))
        return fail(EdlErrorKind::Io, QString("Cannot open %1: %2").arg(imagePath, image.errorString()));
    const qint64 fileOffset = static_cast<qint64>(action.fileSectorOffset) * m_storage.sectorSize;
    if (fileOffset < image.size() && !image.seek(fileOffset))
        return fail(EdlErrorKind::Io, QString("Cannot seek %1: %2").arg(imagePath, image.errorString()));

    Sha256 expected;
    qint64 remaining = static_cast<qint64>(action.numSectors) * m_storage.sectorSize;
    while (remaining > 0) {
        const qint64 length = qMin<qint64>(remaining, DIGEST_CHUNK_BYTES);
        QByteArray chunk = fileOffset < image.size() ? image.read(length) : QByteArray();
        if (chunk.size() < length)
            chunk.append(QByteArray(static_cast<int>(length - chunk.size()), '\0'));
        if (!expected.update(chunk))
            return fail(EdlErrorKind::Io, "SHA-256 update failed");
        remaining -= length;
    }
    const QByteArray host = expected.finish();
    if (host.isEmpty())
        return fail(EdlErrorKind::Io, "SHA-256 finalisation failed");

    if (host != digest)
        return fail(EdlErrorKind::Verification,
                    QString("SHA-256 of sector %1 (%2 sectors) is %3, %4 has %5")
                        .arg(action.startSector).arg(action.numSectors)
                        .arg(QString::fromLatin1(digest.toHex()), action.filename,
                             QString::fromLatin1(host.toHex())));
    LOG_INFO_CAT(TAG, QString("SHA-256 of sector %1 matches %2").arg(action.startSector, action.filename));
    return true;
}

bool EdlSession::flasher(const QStringList& programFiles, const QStringList& patchFiles,
                         const QString& outDir)
{
    if (!requireFirehose())
        return false;

    // Every descriptor is parsed before the first byte is written
    const QStringList files = programFiles + patchFiles;
    QList<RawprogramParseResult> parsed;
    for (const QString& file : files) {
        if (!QFileInfo(file).isFile())
            return fail(EdlErrorKind::UserConfig, QString("%1 doesn't exist").arg(file));
        RawprogramParseResult result = RawprogramParser::parseFile(file);
        if (!result.success)
            return fail(EdlErrorKind::UserConfig, result.errorMessage);
        parsed.append(result);
    }

    int bootableLun = -1;
    for (int f = 0; f < files.size(); f++) {
        const QString imageDir = QFileInfo(files.at(f)).absolutePath();
        const QList<FlashAction>& actions = parsed.at(f).actions;

        for (int i = 0; i < actions.size(); i++) {
            if (cancelled())
                return fail(EdlErrorKind::Interrupted, "Interrupted between flasher steps");

            const FlashAction& action = actions.at(i);
            bool ok = true;
            switch (action.type) {
            case FlashActionType::Program:
                ok = runProgram(action, imageDir, &bootableLun);
                break;
            case FlashActionType::Patch: {
                // Consecutive patches go out as one independently-applied list
                QList<FlashAction> run;
                while (i < actions.size() && actions.at(i).type == FlashActionType::Patch)
                    run.append(actions.at(i++));
                i--;
                ok = runPatches(run);
                break;
            }
            case FlashActionType::Read:
                ok = runRead(action, outDir);
                break;
            case FlashActionType::GetSha256Digest:
                ok = runDigest(action, imageDir);
                break;
            }

            if (!ok) {
                m_lastError.message = QString("%1:%2 <%3>: %4")
                                          .arg(QFileInfo(files.at(f)).fileName())
                                          .arg(action.line)
                                          .arg(flashActionTypeName(action.type), m_lastError.message);
                LOG_ERROR_CAT(TAG, QString("Flasher stopped, later steps were not run"));
                return false;
            }
        }
    }

    if (bootableLun >= 0) {
        LOG_INFO_CAT(TAG, QString("Setting physical partition %1 as bootable").arg(bootableLun));
        if (!m_firehose->setBootableStorageDrive(static_cast<uint32_t>(bootableLun)))
            return failWith(m_firehose->lastError());
    }
    return true;
}

// ─── Ramdump ─────────────────────────────────────────────────────────

bool EdlSession::ramdump(const QStringList& regions, const QString& outDir)
{
    if (!openTransport())
        return false;

    setPhase(Phase::Sahara);
    FileDumpSink sink(outDir);
    if (!m_sahara->memoryDump(regions, &sink)) {
        EdlError error = m_sahara->lastError();
        if (!sink.errorString().isEmpty())
            error.message += QString(": %1").arg(sink.errorString());
        return failWith(error);
    }

    LOG_INFO_CAT(TAG, QString("Dumped %1 region(s) to %2").arg(sink.writtenFiles().size()).arg(outDir));
    if (!m_sahara->sendReset())
        return failWith(m_sahara->lastError());
    return true;
}

} // namespace qedl
