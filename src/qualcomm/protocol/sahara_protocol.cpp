#include "sahara_protocol.h"
#include "transport/i_transport.h"
#include "core/logger.h"

#include <cstring>

static const QString TAG = QStringLiteral("Sahara");

namespace qedl {

QString saharaStateName(SaharaState state)
{
    switch (state) {
    case SaharaState::AwaitHello:   return QStringLiteral("AwaitHello");
    case SaharaState::Negotiating:  return QStringLiteral("Negotiating");
    case SaharaState::SendingImage: return QStringLiteral("SendingImage");
    case SaharaState::AwaitDoneAck: return QStringLiteral("AwaitDoneAck");
    case SaharaState::Complete:     return QStringLiteral("Complete");
    case SaharaState::Errored:      return QStringLiteral("Errored");
    }
    return QStringLiteral("?");
}

SaharaClient::SaharaClient(ITransport* transport, QObject* parent)
    : QObject(parent)
    , m_transport(transport)
{
    Q_ASSERT(transport);
}

uint32_t SaharaClient::expectedLength(uint32_t command)
{
    switch (static_cast<SaharaCommand>(command)) {
    case SaharaCommand::Hello:            return sizeof(SaharaHelloPacket);
    case SaharaCommand::ReadData:         return sizeof(SaharaReadDataPacket);
    case SaharaCommand::EndImageTransfer: return sizeof(SaharaEndImageTransferPacket);
    case SaharaCommand::DoneResponse:     return sizeof(SaharaDoneResponsePacket);
    case SaharaCommand::ResetResponse:    return sizeof(SaharaPacketHeader);
    case SaharaCommand::MemoryDebug:      return sizeof(SaharaMemoryDebugPacket);
    case SaharaCommand::CommandReady:     return sizeof(SaharaPacketHeader);
    case SaharaCommand::ExecuteData:      return sizeof(SaharaExecuteDataPacket);
    case SaharaCommand::MemoryDebug64:    return sizeof(SaharaMemoryDebug64Packet);
    case SaharaCommand::ReadData64:       return sizeof(SaharaReadData64Packet);
    default:                              return 0;
    }
}

void SaharaClient::setState(SaharaState state)
{
    if (m_state == state)
        return;
    LOG_DEBUG_CAT(TAG, QString("%1 -> %2").arg(saharaStateName(m_state), saharaStateName(state)));
    m_state = state;
    emit stateChanged(state);
}

bool SaharaClient::fail(EdlErrorKind kind, const QString& message)
{
    m_lastError = EdlError(kind, message);
    LOG_ERROR_CAT(TAG, message);
    setState(SaharaState::Errored);
    return false;
}

// ─── Low-level I/O helpers ───────────────────────────────────────────

bool SaharaClient::readPacket(QByteArray& packet, int timeoutMs)
{
    QByteArray header = m_transport->readExact(sizeof(SaharaPacketHeader), timeoutMs);
    if (header.size() < static_cast<int>(sizeof(SaharaPacketHeader)))
        return fail(EdlErrorKind::Transport,
                    QString("Timed out waiting for a packet in state %1").arg(saharaStateName(m_state)));

    SaharaPacketHeader hdr;
    std::memcpy(&hdr, header.constData(), sizeof(hdr));

    if (hdr.length < sizeof(SaharaPacketHeader) || hdr.length > MAX_PACKET_SIZE)
        return fail(EdlErrorKind::SaharaProtocol,
                    QString("Packet 0x%1 has invalid length %2")
                        .arg(hdr.command, 2, 16, QChar('0')).arg(hdr.length));

    const uint32_t expected = expectedLength(hdr.command);
    if (expected == 0)
        return fail(EdlErrorKind::SaharaProtocol,
                    QString("Unknown command 0x%1 from device").arg(hdr.command, 2, 16, QChar('0')));
    if (hdr.length != expected)
        return fail(EdlErrorKind::SaharaProtocol,
                    QString("Packet 0x%1 declares %2 bytes, expected %3")
                        .arg(hdr.command, 2, 16, QChar('0')).arg(hdr.length).arg(expected));

    packet = header;
    const int remaining = static_cast<int>(hdr.length - sizeof(SaharaPacketHeader));
    if (remaining > 0) {
        QByteArray body = m_transport->readExact(remaining, timeoutMs);
        if (body.size() < remaining)
            return fail(EdlErrorKind::Transport,
                        QString("Short packet body: expected %1 bytes, got %2")
                            .arg(remaining).arg(body.size()));
        packet += body;
    }

    LOG_WIRE_IN(TAG, packet, false);
    return true;
}

bool SaharaClient::sendPacket(const void* data, uint32_t size)
{
    QByteArray pkt(reinterpret_cast<const char*>(data), static_cast<int>(size));
    LOG_WIRE_OUT(TAG, pkt, false);
    if (m_transport->write(pkt) != static_cast<qint64>(size))
        return fail(EdlErrorKind::Transport, QString("Failed to send %1-byte packet").arg(size));
    return true;
}

bool SaharaClient::sendHelloResponse(SaharaMode mode)
{
    SaharaHelloResponsePacket resp{};
    resp.header.command = static_cast<uint32_t>(SaharaCommand::HelloResponse);
    resp.header.length  = sizeof(SaharaHelloResponsePacket);
    // Speak the device's version, capped at the newest one we implement
    const uint32_t version = m_deviceInfo.saharaVersion == 0
                                 ? SAHARA_VERSION
                                 : qMin(m_deviceInfo.saharaVersion, SAHARA_VERSION);
    resp.version        = version;
    resp.versionMin     = qMin(SAHARA_VERSION_MIN, version);
    resp.status         = 0;
    resp.mode           = static_cast<uint32_t>(mode);

    LOG_DEBUG_CAT(TAG, QString("Sending HelloResponse, mode=%1").arg(static_cast<uint32_t>(mode)));
    return sendPacket(&resp, sizeof(resp));
}

bool SaharaClient::sendSwitchMode(SaharaMode mode)
{
    SaharaSwitchModePacket pkt{};
    pkt.header.command = static_cast<uint32_t>(SaharaCommand::SwitchMode);
    pkt.header.length  = sizeof(SaharaSwitchModePacket);
    pkt.mode           = static_cast<uint32_t>(mode);
    return sendPacket(&pkt, sizeof(pkt));
}

// ─── Handshake ───────────────────────────────────────────────────────

bool SaharaClient::awaitHello(SaharaHelloPacket* hello)
{
    setState(SaharaState::AwaitHello);
    QByteArray pkt;
    if (!readPacket(pkt, HELLO_TIMEOUT_MS))
        return false;

    SaharaPacketHeader hdr;
    std::memcpy(&hdr, pkt.constData(), sizeof(hdr));
    if (hdr.command != static_cast<uint32_t>(SaharaCommand::Hello))
        return fail(EdlErrorKind::SaharaProtocol,
                    QString("Expected Hello, got 0x%1").arg(hdr.command, 2, 16, QChar('0')));

    std::memcpy(hello, pkt.constData(), sizeof(SaharaHelloPacket));
    m_deviceInfo.saharaVersion = hello->version;
    m_deviceInfo.saharaMinVersion = hello->versionMin;
    LOG_INFO_CAT(TAG, QString("Device Sahara v%1 (min %2), mode=%3")
                          .arg(hello->version).arg(hello->versionMin).arg(hello->mode));
    return true;
}

// Sends the HelloResponse that starts image transfer. When device info is
// wanted, Command mode is requested first; a device that declines answers
// straight away with a read request, which is handed back in `pending`.
bool SaharaClient::negotiate(QByteArray& pending)
{
    setState(SaharaState::Negotiating);

    if (!m_readDeviceInfo)
        return sendHelloResponse(SaharaMode::ImageTransferPending);

    if (!sendHelloResponse(SaharaMode::Command))
        return false;

    QByteArray pkt;
    if (!readPacket(pkt, CMD_TIMEOUT_MS))
        return false;

    SaharaPacketHeader hdr;
    std::memcpy(&hdr, pkt.constData(), sizeof(hdr));
    switch (static_cast<SaharaCommand>(hdr.command)) {
    case SaharaCommand::CommandReady:
        break;
    case SaharaCommand::ReadData:
    case SaharaCommand::ReadData64:
        LOG_INFO_CAT(TAG, "Device declined Command mode");
        pending = pkt;
        return true;
    default:
        return fail(EdlErrorKind::SaharaProtocol,
                    QString("Unexpected 0x%1 after Command mode request")
                        .arg(hdr.command, 2, 16, QChar('0')));
    }

    if (!readDeviceInfo())
        return false;
    if (!sendSwitchMode(SaharaMode::ImageTransferPending))
        return false;

    // The device restarts the handshake in the new mode
    SaharaHelloPacket hello{};
    if (!awaitHello(&hello))
        return false;
    setState(SaharaState::Negotiating);
    return sendHelloResponse(SaharaMode::ImageTransferPending);
}

bool SaharaClient::readDeviceInfo()
{
    QByteArray serial;
    if (!executeCommand(SaharaExecCommand::SerialNumRead, serial))
        return false;
    if (serial.size() >= 4) {
        std::memcpy(&m_deviceInfo.serial, serial.constData(), 4);
        m_deviceInfo.serialHex = QString("0x%1").arg(m_deviceInfo.serial, 8, 16, QChar('0'));
        LOG_INFO_CAT(TAG, QString("Chip serial number: %1").arg(m_deviceInfo.serialHex));
    }

    QByteArray pkHash;
    if (!executeCommand(SaharaExecCommand::OemPkHashRead, pkHash))
        return false;
    if (!pkHash.isEmpty()) {
        // The hash is repeated; the first copy is the key hash
        const int hashLen = pkHash.size() >= 96 ? 48 : qMin(pkHash.size(), 32);
        m_deviceInfo.pkHash = pkHash.left(hashLen);
        m_deviceInfo.pkHashHex = QString(m_deviceInfo.pkHash.toHex());
        LOG_INFO_CAT(TAG, QString("OEM PK hash: %1").arg(m_deviceInfo.pkHashHex));
    }

    m_deviceInfo.chipInfoRead = true;
    return true;
}

bool SaharaClient::executeCommand(SaharaExecCommand cmd, QByteArray& data)
{
    SaharaExecutePacket execPkt{};
    execPkt.header.command = static_cast<uint32_t>(SaharaCommand::Execute);
    execPkt.header.length  = sizeof(SaharaExecutePacket);
    execPkt.clientCommand  = static_cast<uint32_t>(cmd);
    if (!sendPacket(&execPkt, sizeof(execPkt)))
        return false;

    QByteArray pkt;
    if (!readPacket(pkt, CMD_TIMEOUT_MS))
        return false;

    SaharaPacketHeader hdr;
    std::memcpy(&hdr, pkt.constData(), sizeof(hdr));
    if (hdr.command != static_cast<uint32_t>(SaharaCommand::ExecuteData))
        return fail(EdlErrorKind::SaharaProtocol,
                    QString("Expected ExecuteData, got 0x%1").arg(hdr.command, 2, 16, QChar('0')));
    SaharaExecuteDataPacket resp;
    std::memcpy(&resp, pkt.constData(), sizeof(resp));
    if (resp.clientCommand != static_cast<uint32_t>(cmd))
        return fail(EdlErrorKind::SaharaProtocol,
                    QString("ExecuteData answers command 0x%1, sent 0x%2")
                        .arg(resp.clientCommand, 2, 16, QChar('0'))
                        .arg(static_cast<uint32_t>(cmd), 2, 16, QChar('0')));

    SaharaExecuteResponsePacket ack{};
    ack.header.command = static_cast<uint32_t>(SaharaCommand::ExecuteResponse);
    ack.header.length  = sizeof(SaharaExecuteResponsePacket);
    ack.clientCommand  = static_cast<uint32_t>(cmd);
    if (!sendPacket(&ack, sizeof(ack)))
        return false;

    if (resp.dataLength == 0) {
        data.clear();
        return true;
    }
    if (resp.dataLength > MAX_PACKET_SIZE)
        return fail(EdlErrorKind::SaharaProtocol,
                    QString("Execute data length %1 too large").arg(resp.dataLength));

    data = m_transport->readExact(static_cast<int>(resp.dataLength), CMD_TIMEOUT_MS);
    if (data.size() != static_cast<int>(resp.dataLength))
        return fail(EdlErrorKind::Transport,
                    QString("Execute 0x%1: expected %2 bytes, got %3")
                        .arg(static_cast<uint32_t>(cmd), 2, 16, QChar('0'))
                        .arg(resp.dataLength).arg(data.size()));
    return true;
}

// ─── Image transfer ──────────────────────────────────────────────────

bool SaharaClient::uploadLoader(const QByteArray& image)
{
    m_lastError = EdlError();
    m_state = SaharaState::AwaitHello;

    if (image.isEmpty())
        return fail(EdlErrorKind::UserConfig, "Loader image is empty");

    if (m_skipHello) {
        LOG_INFO_CAT(TAG, "Not waiting for Hello");
    } else {
        SaharaHelloPacket hello{};
        if (!awaitHello(&hello))
            return false;
        if (hello.mode == static_cast<uint32_t>(SaharaMode::MemoryDebug))
            return fail(EdlErrorKind::SaharaProtocol,
                        "Device is in memory debug mode (crashed), use ramdump");
    }

    QByteArray pending;
    if (!negotiate(pending))
        return false;

    LOG_INFO_CAT(TAG, QString("Uploading loader (%1 bytes)").arg(image.size()));
    if (!serveImage(image, pending))
        return false;

    LOG_INFO_CAT(TAG, "Loader accepted");
    return true;
}

bool SaharaClient::serveImage(const QByteArray& image, QByteArray pending)
{
    setState(SaharaState::SendingImage);

    for (;;) {
        QByteArray pkt;
        if (!pending.isEmpty()) {
            pkt = pending;
            pending.clear();
        } else if (!readPacket(pkt, READ_TIMEOUT_MS)) {
            return false;
        }

        SaharaPacketHeader hdr;
        std::memcpy(&hdr, pkt.constData(), sizeof(hdr));

        switch (static_cast<SaharaCommand>(hdr.command)) {
        case SaharaCommand::ReadData: {
            SaharaReadDataPacket req;
            std::memcpy(&req, pkt.constData(), sizeof(req));
            if (m_state == SaharaState::AwaitDoneAck)
                setState(SaharaState::SendingImage);
            if (!serveRead(image, req.offset, req.length))
                return false;
            break;
        }
        case SaharaCommand::ReadData64: {
            SaharaReadData64Packet req;
            std::memcpy(&req, pkt.constData(), sizeof(req));
            if (m_state == SaharaState::AwaitDoneAck)
                setState(SaharaState::SendingImage);
            if (!serveRead(image, req.offset, req.length))
                return false;
            break;
        }
        case SaharaCommand::EndImageTransfer: {
            if (m_state != SaharaState::SendingImage)
                return fail(EdlErrorKind::SaharaProtocol, "EndImageTransfer while awaiting DoneResponse");
            SaharaEndImageTransferPacket end;
            std::memcpy(&end, pkt.constData(), sizeof(end));
            if (end.status != 0)
                return fail(EdlErrorKind::SaharaProtocol,
                            QString("Device rejected image %1, status 0x%2")
                                .arg(end.imageId).arg(end.status, 2, 16, QChar('0')));

            setState(SaharaState::AwaitDoneAck);
            SaharaPacketHeader done;
            done.command = static_cast<uint32_t>(SaharaCommand::Done);
            done.length  = sizeof(SaharaPacketHeader);
            if (!sendPacket(&done, sizeof(done)))
                return false;
            break;
        }
        case SaharaCommand::DoneResponse: {
            if (m_state != SaharaState::AwaitDoneAck)
                return fail(EdlErrorKind::SaharaProtocol, "DoneResponse without Done");
            SaharaDoneResponsePacket resp;
            std::memcpy(&resp, pkt.constData(), sizeof(resp));
            if (resp.imageTxStatus == static_cast<uint32_t>(SaharaMode::ImageTransferPending)) {
                LOG_DEBUG_CAT(TAG, "Device wants another image");
                setState(SaharaState::SendingImage);
                break;
            }
            setState(SaharaState::Complete);
            return true;
        }
        default:
            return fail(EdlErrorKind::SaharaProtocol,
                        QString("Unexpected 0x%1 during image transfer")
                            .arg(hdr.command, 2, 16, QChar('0')));
        }
    }
}

bool SaharaClient::serveRead(const QByteArray& image, uint64_t offset, uint64_t length)
{
    const uint64_t size = static_cast<uint64_t>(image.size());
    if (offset > size || length > size - offset)
        return fail(EdlErrorKind::SaharaProtocol,
                    QString("ReadData out of range: off=%1 len=%2 image=%3")
                        .arg(offset).arg(length).arg(size));
    if (length == 0)
        return true;

    QByteArray chunk = image.mid(static_cast<int>(offset), static_cast<int>(length));
    if (m_transport->write(chunk) != static_cast<qint64>(length))
        return fail(EdlErrorKind::Transport, QString("Failed to send image bytes at %1").arg(offset));

    emit uploadProgress(static_cast<qint64>(offset + length), static_cast<qint64>(size));
    return true;
}

// ─── Memory debug ────────────────────────────────────────────────────

bool SaharaClient::memoryRead(uint64_t address, uint64_t length, QByteArray& out)
{
    if (m_use64BitMemory) {
        SaharaMemoryRead64Packet pkt{};
        pkt.header.command = static_cast<uint32_t>(SaharaCommand::MemoryRead64);
        pkt.header.length  = sizeof(pkt);
        pkt.address = address;
        pkt.length  = length;
        if (!sendPacket(&pkt, sizeof(pkt)))
            return false;
    } else {
        if (address + length > 0x100000000ULL)
            return fail(EdlErrorKind::SaharaProtocol,
                        QString("Address 0x%1 not reachable with 32-bit reads").arg(address, 0, 16));
        SaharaMemoryReadPacket pkt{};
        pkt.header.command = static_cast<uint32_t>(SaharaCommand::MemoryRead);
        pkt.header.length  = sizeof(pkt);
        pkt.address = static_cast<uint32_t>(address);
        pkt.length  = static_cast<uint32_t>(length);
        if (!sendPacket(&pkt, sizeof(pkt)))
            return false;
    }

    out = m_transport->readExact(static_cast<int>(length), READ_TIMEOUT_MS);
    if (out.size() != static_cast<int>(length))
        return fail(EdlErrorKind::Transport,
                    QString("Memory read at 0x%1: expected %2 bytes, got %3")
                        .arg(address, 0, 16).arg(length).arg(out.size()));
    return true;
}

static QString fixedString(const char* data, size_t size)
{
    size_t len = 0;
    while (len < size && data[len] != '\0')
        len++;
    return QString::fromLatin1(data, static_cast<int>(len));
}

bool SaharaClient::parseMemoryTable(const QByteArray& raw, bool is64)
{
    const int entrySize = static_cast<int>(is64 ? sizeof(SaharaMemoryTableEntry64)
                                                : sizeof(SaharaMemoryTableEntry));
    if (raw.size() % entrySize != 0)
        return fail(EdlErrorKind::SaharaProtocol,
                    QString("Memory table of %1 bytes is not a multiple of %2")
                        .arg(raw.size()).arg(entrySize));

    m_memoryTable.clear();
    for (int off = 0; off < raw.size(); off += entrySize) {
        SaharaMemoryRegion region;
        if (is64) {
            SaharaMemoryTableEntry64 e;
            std::memcpy(&e, raw.constData() + off, sizeof(e));
            region.savePref = e.savePref;
            region.base = e.base;
            region.length = e.length;
            region.description = fixedString(e.description, sizeof(e.description));
            region.filename = fixedString(e.filename, sizeof(e.filename));
        } else {
            SaharaMemoryTableEntry e;
            std::memcpy(&e, raw.constData() + off, sizeof(e));
            region.savePref = e.savePref;
            region.base = e.base;
            region.length = e.length;
            region.description = fixedString(e.description, sizeof(e.description));
            region.filename = fixedString(e.filename, sizeof(e.filename));
        }
        m_memoryTable.append(region);
    }
    return true;
}

bool SaharaClient::memoryDump(const QStringList& regionFilter, IDumpSink* sink)
{
    m_lastError = EdlError();
    m_state = SaharaState::AwaitHello;
    m_memoryTable.clear();

    if (!m_skipHello) {
        SaharaHelloPacket hello{};
        if (!awaitHello(&hello))
            return false;
        if (hello.mode != static_cast<uint32_t>(SaharaMode::MemoryDebug))
            LOG_WARNING_CAT(TAG, QString("Device announced mode %1, requesting memory debug anyway")
                                     .arg(hello.mode));
    }

    setState(SaharaState::Negotiating);
    if (!sendHelloResponse(SaharaMode::MemoryDebug))
        return false;

    QByteArray pkt;
    if (!readPacket(pkt, READ_TIMEOUT_MS))
        return false;

    SaharaPacketHeader hdr;
    std::memcpy(&hdr, pkt.constData(), sizeof(hdr));
    uint64_t tableAddress = 0;
    uint64_t tableLength = 0;
    if (hdr.command == static_cast<uint32_t>(SaharaCommand::MemoryDebug)) {
        SaharaMemoryDebugPacket dbg;
        std::memcpy(&dbg, pkt.constData(), sizeof(dbg));
        tableAddress = dbg.tableAddress;
        tableLength = dbg.tableLength;
        m_use64BitMemory = false;
    } else if (hdr.command == static_cast<uint32_t>(SaharaCommand::MemoryDebug64)) {
        SaharaMemoryDebug64Packet dbg;
        std::memcpy(&dbg, pkt.constData(), sizeof(dbg));
        tableAddress = dbg.tableAddress;
        tableLength = dbg.tableLength;
        m_use64BitMemory = true;
    } else {
        return fail(EdlErrorKind::SaharaProtocol,
                    QString("Expected MemoryDebug, got 0x%1").arg(hdr.command, 2, 16, QChar('0')));
    }

    if (tableLength == 0 || tableLength > MEMORY_READ_CHUNK)
        return fail(EdlErrorKind::SaharaProtocol, QString("Implausible memory table length %1").arg(tableLength));

    setState(SaharaState::SendingImage);
    QByteArray rawTable;
    if (!memoryRead(tableAddress, tableLength, rawTable) || !parseMemoryTable(rawTable, m_use64BitMemory))
        return false;
    LOG_INFO_CAT(TAG, QString("Device publishes %1 memory regions").arg(m_memoryTable.size()));

    QStringList unmatched = regionFilter;
    for (const auto& region : m_memoryTable) {
        const bool wanted = regionFilter.isEmpty()
                         || regionFilter.contains(region.description)
                         || regionFilter.contains(region.filename);
        if (!wanted)
            continue;
        unmatched.removeAll(region.description);
        unmatched.removeAll(region.filename);

        LOG_INFO_CAT(TAG, QString("Dumping %1 (%2): base=0x%3 size=%4")
                              .arg(region.description, region.filename)
                              .arg(region.base, 0, 16).arg(region.length));
        if (!sink->beginRegion(region))
            return fail(EdlErrorKind::Io, QString("Cannot store region %1").arg(region.filename));

        for (uint64_t done = 0; done < region.length;) {
            const uint64_t n = qMin(MEMORY_READ_CHUNK, region.length - done);
            QByteArray data;
            if (!memoryRead(region.base + done, n, data))
                return false;
            if (!sink->writeChunk(data))
                return fail(EdlErrorKind::Io, QString("Write failed for region %1").arg(region.filename));
            done += n;
            emit dumpProgress(region.filename, static_cast<qint64>(done), static_cast<qint64>(region.length));
        }

        if (!sink->endRegion())
            return fail(EdlErrorKind::Io, QString("Cannot finish region %1").arg(region.filename));
    }

    for (const auto& name : unmatched)
        LOG_WARNING_CAT(TAG, QString("No memory region named %1").arg(name));

    setState(SaharaState::Complete);
    return true;
}

// ─── Reset ───────────────────────────────────────────────────────────

bool SaharaClient::sendReset()
{
    LOG_INFO_CAT(TAG, "Sending Reset");

    SaharaPacketHeader pkt;
    pkt.command = static_cast<uint32_t>(SaharaCommand::Reset);
    pkt.length  = sizeof(SaharaPacketHeader);
    if (!sendPacket(&pkt, sizeof(pkt)))
        return false;

    QByteArray resp;
    if (!readPacket(resp, CMD_TIMEOUT_MS))
        return false;

    SaharaPacketHeader hdr;
    std::memcpy(&hdr, resp.constData(), sizeof(hdr));
    if (hdr.command != static_cast<uint32_t>(SaharaCommand::ResetResponse))
        return fail(EdlErrorKind::SaharaProtocol,
                    QString("Expected ResetResponse, got 0x%1").arg(hdr.command, 2, 16, QChar('0')));
    return true;
}

} // namespace qedl
