#include "firehose_client.h"
#include "transport/i_transport.h"
#include "core/logger.h"

#include <QElapsedTimer>
#include <QRegularExpression>
#include <QXmlStreamReader>
#include <QXmlStreamWriter>

static const QString TAG = QStringLiteral("Firehose");

namespace qedl {

QString firehoseStateName(FirehoseState state)
{
    switch (state) {
    case FirehoseState::Idle:        return QStringLiteral("Idle");
    case FirehoseState::CommandSent: return QStringLiteral("CommandSent");
    case FirehoseState::RawTransfer: return QStringLiteral("RawTransfer");
    case FirehoseState::Acked:       return QStringLiteral("Acked");
    case FirehoseState::Nakked:      return QStringLiteral("Nakked");
    }
    return QStringLiteral("?");
}

// ─── Command / response types ────────────────────────────────────────

FirehoseCommand& FirehoseCommand::set(const QString& name, const QString& value)
{
    for (auto& a : attributes) {
        if (a.first == name) {
            a.second = value;
            return *this;
        }
    }
    attributes.append(qMakePair(name, value));
    return *this;
}

FirehoseCommand& FirehoseCommand::set(const QString& name, qulonglong value)
{
    return set(name, QString::number(value));
}

QString FirehoseCommand::value(const QString& name) const
{
    for (const auto& a : attributes) {
        if (a.first == name)
            return a.second;
    }
    return {};
}

QByteArray FirehoseCommand::toXml() const
{
    QString xml;
    QXmlStreamWriter w(&xml);
    w.writeStartDocument();
    w.writeStartElement("data");
    w.writeStartElement(tag);
    for (const auto& a : attributes)
        w.writeAttribute(a.first, a.second);
    w.writeEndElement(); // tag
    w.writeEndElement(); // data
    w.writeEndDocument();
    return xml.toUtf8();
}

QString FirehoseResponse::reason() const
{
    if (!logLines.isEmpty())
        return logLines.last();
    return rawValue.isEmpty() ? QStringLiteral("no reason given") : rawValue;
}

SectorRange SectorRange::at(uint32_t lun, uint64_t start, uint64_t count)
{
    SectorRange r;
    r.physicalPartition = lun;
    r.startSector = QString::number(start);
    r.numSectors = count;
    return r;
}

bool SectorRange::numericStart(uint64_t* value) const
{
    bool ok = false;
    const qulonglong v = startSector.toULongLong(&ok, 10);
    if (ok && value)
        *value = v;
    return ok;
}

// ─── Client ──────────────────────────────────────────────────────────

FirehoseClient::FirehoseClient(ITransport* transport, QObject* parent)
    : QObject(parent)
    , m_transport(transport)
{
    Q_ASSERT(transport);
}

void FirehoseClient::setState(FirehoseState state)
{
    if (m_state == state)
        return;
    m_state = state;
    emit stateChanged(state);
}

bool FirehoseClient::fail(EdlErrorKind kind, const QString& message)
{
    m_lastError = EdlError(kind, message);
    LOG_ERROR_CAT(TAG, message);
    return false;
}

void FirehoseClient::surfaceLog(const QString& line)
{
    if (m_printDeviceLog)
        LOG_INFO_CAT(TAG, QString("[Device] %1").arg(line));
    else
        LOG_DEBUG_CAT(TAG, QString("[Device] %1").arg(line));
    emit deviceLog(line);
}

void FirehoseClient::abandon()
{
    m_rx.clear();
    m_rawRemaining = 0;
    m_transport->discardInput();
    setState(FirehoseState::Idle);
}

// ─── Framing ─────────────────────────────────────────────────────────

// Several documents can arrive in one transport read; split on </data>
bool FirehoseClient::takeDocument(QByteArray& document)
{
    static const QByteArray END("</data>");
    const int end = m_rx.indexOf(END);
    if (end < 0)
        return false;
    document = m_rx.left(end + END.size());
    m_rx.remove(0, end + END.size());
    return true;
}

bool FirehoseClient::parseDocument(const QByteArray& document, FirehoseResponse& response,
                                   bool* terminal)
{
    QByteArray clean = document;
    clean.replace(QByteArray(1, '\0'), QByteArray());
    const int start = clean.indexOf('<');
    if (start > 0)
        clean.remove(0, start);

    LOG_WIRE_IN(TAG, clean, true);

    *terminal = false;
    QXmlStreamReader reader(clean);
    while (!reader.atEnd()) {
        reader.readNext();
        if (!reader.isStartElement())
            continue;
        if (reader.name() == QStringLiteral("log")) {
            const QString line = reader.attributes().value("value").toString();
            response.logLines.append(line);
            surfaceLog(line);
        } else if (reader.name() == QStringLiteral("response")) {
            for (const auto& attr : reader.attributes())
                response.attributes.insert(attr.name().toString(), attr.value().toString());
            response.rawValue = reader.attributes().value("value").toString();
            response.rawMode = reader.attributes().value("rawmode").toString()
                                   .compare("true", Qt::CaseInsensitive) == 0;
            *terminal = true;
        }
    }

    if (reader.hasError())
        return fail(EdlErrorKind::FirehoseProtocol,
                    QString("Malformed XML from device: %1").arg(reader.errorString()));

    if (*terminal) {
        if (response.rawValue.compare("ACK", Qt::CaseInsensitive) == 0)
            response.success = true;
        else if (response.rawValue.compare("NAK", Qt::CaseInsensitive) == 0)
            response.success = false;
        else
            return fail(EdlErrorKind::FirehoseProtocol,
                        QString("Response value '%1' is neither ACK nor NAK").arg(response.rawValue));
    }
    return true;
}

// ─── Exchange ────────────────────────────────────────────────────────

bool FirehoseClient::issue(const FirehoseCommand& cmd)
{
    if (m_state != FirehoseState::Idle)
        return fail(EdlErrorKind::FirehoseProtocol,
                    QString("<%1> issued while %2").arg(cmd.tag, firehoseStateName(m_state)));

    m_lastError = EdlError();
    const QByteArray xml = cmd.toXml();
    if (m_config.maxXmlSize != 0 && static_cast<uint32_t>(xml.size()) > m_config.maxXmlSize)
        return fail(EdlErrorKind::FirehoseProtocol,
                    QString("<%1> is %2 bytes, device accepts %3")
                        .arg(cmd.tag).arg(xml.size()).arg(m_config.maxXmlSize));

    LOG_WIRE_OUT(TAG, xml, true);
    if (m_transport->write(xml, XML_TIMEOUT_MS) != xml.size())
        return fail(EdlErrorKind::Transport, QString("Failed to send <%1>").arg(cmd.tag));

    m_pendingTag = cmd.tag;
    setState(FirehoseState::CommandSent);
    return true;
}

bool FirehoseClient::awaitResponse(FirehoseResponse& response, int timeoutMs)
{
    if (m_state != FirehoseState::CommandSent && m_state != FirehoseState::RawTransfer)
        return fail(EdlErrorKind::FirehoseProtocol, "No command is waiting for a response");

    response = FirehoseResponse();
    QElapsedTimer timer;
    timer.start();

    for (;;) {
        QByteArray document;
        while (takeDocument(document)) {
            bool terminal = false;
            if (!parseDocument(document, response, &terminal))
                return false;
            if (!terminal)
                continue;

            if (response.success && response.rawMode && m_state == FirehoseState::CommandSent) {
                setState(FirehoseState::Acked);
                setState(FirehoseState::RawTransfer);
            } else {
                setState(response.success ? FirehoseState::Acked : FirehoseState::Nakked);
                setState(FirehoseState::Idle);
            }
            return true;
        }

        const qint64 remaining = timeoutMs - timer.elapsed();
        if (remaining <= 0)
            return fail(EdlErrorKind::Transport,
                        QString("Timed out waiting for the response to <%1>").arg(m_pendingTag));

        QByteArray chunk = m_transport->read(READ_CHUNK, static_cast<int>(remaining));
        if (!chunk.isEmpty())
            m_rx.append(chunk);
    }
}

bool FirehoseClient::execute(const FirehoseCommand& cmd, FirehoseResponse* response, int timeoutMs)
{
    FirehoseResponse local;
    FirehoseResponse& r = response ? *response : local;

    if (!issue(cmd) || !awaitResponse(r, timeoutMs))
        return false;
    if (m_state == FirehoseState::RawTransfer)
        return fail(EdlErrorKind::FirehoseProtocol,
                    QString("<%1> unexpectedly opened a payload phase").arg(cmd.tag));
    if (!r.success)
        return fail(EdlErrorKind::FirehoseNak, QString("<%1> NAK: %2").arg(cmd.tag, r.reason()));
    return true;
}

bool FirehoseClient::drainWelcomeLogs(int quietMs)
{
    for (;;) {
        QByteArray document;
        while (takeDocument(document)) {
            FirehoseResponse r;
            bool terminal = false;
            if (!parseDocument(document, r, &terminal))
                return false;
            if (terminal)
                LOG_DEBUG_CAT(TAG, QString("Ignoring unsolicited %1").arg(r.rawValue));
        }
        QByteArray chunk = m_transport->read(READ_CHUNK, quietMs);
        if (chunk.isEmpty())
            break;
        m_rx.append(chunk);
    }
    return true;
}

// ─── Configure ───────────────────────────────────────────────────────

bool FirehoseClient::sendConfigure(const FirehoseConfigureRequest& request, uint32_t payloadSize,
                                   FirehoseResponse& response)
{
    FirehoseCommand cmd("configure");
    cmd.set("MemoryName", storageTypeString(m_storage.type))
       .set("MaxPayloadSizeToTargetInBytes", payloadSize)
       .set("verbose", request.verbose ? "1" : "0")
       .set("ZlpAwareHost", "1")
       .set("SkipStorageInit", request.skipStorageInit ? "1" : "0")
       .set("SkipWrite", request.bypassStorage ? "1" : "0")
       .set("AlwaysValidate", request.hashPackets ? "1" : "0");

    if (!issue(cmd) || !awaitResponse(response))
        return false;
    if (m_state == FirehoseState::RawTransfer)
        return fail(EdlErrorKind::FirehoseProtocol, "<configure> opened a payload phase");
    return true;
}

static uint32_t attributeUInt(const FirehoseResponse& r, const QString& name, bool* present = nullptr)
{
    bool ok = false;
    const uint v = r.attributes.value(name).toUInt(&ok, 0);
    if (present)
        *present = ok;
    return ok ? v : 0;
}

bool FirehoseClient::configure(const FirehoseConfigureRequest& request)
{
    m_config = FirehoseConfig();
    uint32_t requested = request.maxPayloadSize;

    LOG_INFO_CAT(TAG, QString("Configuring: storage=%1, payload=%2")
                          .arg(storageTypeString(m_storage.type)).arg(requested));

    FirehoseResponse r;
    if (!sendConfigure(request, requested, r))
        return false;

    if (!r.success) {
        bool present = false;
        const uint32_t offered = attributeUInt(r, "MaxPayloadSizeToTargetInBytes", &present);
        if (!present || offered == 0)
            return fail(EdlErrorKind::FirehoseNak, QString("<configure> NAK: %1").arg(r.reason()));

        requested = qMin(requested, offered);
        LOG_INFO_CAT(TAG, QString("Device limits payloads to %1 bytes, reconfiguring").arg(offered));
        if (!sendConfigure(request, requested, r))
            return false;
        if (!r.success)
            return fail(EdlErrorKind::FirehoseNak, QString("<configure> NAK: %1").arg(r.reason()));
    }

    bool present = false;
    uint32_t accepted = attributeUInt(r, "MaxPayloadSizeToTargetInBytes", &present);
    if (!present || accepted == 0)
        accepted = requested;
    m_config.maxPayloadSupported = attributeUInt(r, "MaxPayloadSizeToTargetInBytesSupported");
    m_config.maxXmlSize = attributeUInt(r, "MaxXMLSizeInBytes");
    m_config.reportedSectorSize = attributeUInt(r, "SECTOR_SIZE_IN_BYTES");
    m_config.version = r.attributes.value("Version");
    m_config.minVersionSupported = attributeUInt(r, "MinVersionSupported");

    if (m_config.minVersionSupported > FH_PROTO_VERSION_SUPPORTED)
        return fail(EdlErrorKind::FirehoseProtocol,
                    QString("Device requires protocol version %1, only %2 is supported")
                        .arg(m_config.minVersionSupported).arg(FH_PROTO_VERSION_SUPPORTED));

    m_config.maxPayloadSize = qMin(requested, accepted);

    // The device settled below what it says it can take: ask again, but
    // never beyond what the operator requested
    if (m_config.maxPayloadSupported > m_config.maxPayloadSize
        && m_config.maxPayloadSize < request.maxPayloadSize) {
        const uint32_t target = qMin(m_config.maxPayloadSupported, request.maxPayloadSize);
        LOG_INFO_CAT(TAG, QString("Reconfiguring for a larger (%1 KiB) payload").arg(target / 1024));
        if (!sendConfigure(request, target, r))
            return false;
        if (r.success) {
            uint32_t granted = attributeUInt(r, "MaxPayloadSizeToTargetInBytes", &present);
            if (!present || granted == 0)
                granted = target;
            m_config.maxPayloadSize = qMin(target, granted);
        } else {
            LOG_WARNING_CAT(TAG, QString("Larger payload refused (%1), keeping %2")
                                     .arg(r.reason()).arg(m_config.maxPayloadSize));
        }
    }

    if (m_config.maxPayloadSize < m_storage.sectorSize)
        return fail(EdlErrorKind::FirehoseProtocol,
                    QString("Negotiated payload %1 is smaller than a %2-byte sector")
                        .arg(m_config.maxPayloadSize).arg(m_storage.sectorSize));

    LOG_INFO_CAT(TAG, QString("Configured: protocol %1, max payload %2 bytes")
                          .arg(m_config.version.isEmpty() ? QStringLiteral("?") : m_config.version)
                          .arg(m_config.maxPayloadSize));
    return true;
}

// ─── Payload phase ───────────────────────────────────────────────────

FirehoseCommand FirehoseClient::rangeCommand(const QString& tag, const SectorRange& range) const
{
    FirehoseCommand cmd(tag);
    cmd.set("SECTOR_SIZE_IN_BYTES", m_storage.sectorSize)
       .set("num_partition_sectors", range.numSectors)
       .set("physical_partition_number", range.physicalPartition)
       .set("start_sector", range.startSector)
       .set("slot", range.slot >= 0 ? static_cast<qulonglong>(range.slot) : m_storage.slot);
    return cmd;
}

bool FirehoseClient::beginRaw(const FirehoseCommand& cmd, uint64_t totalBytes)
{
    FirehoseResponse r;
    if (!issue(cmd) || !awaitResponse(r, DATA_TIMEOUT_MS))
        return false;
    if (!r.success)
        return fail(EdlErrorKind::FirehoseNak, QString("<%1> NAK: %2").arg(cmd.tag, r.reason()));
    if (m_state != FirehoseState::RawTransfer)
        return fail(EdlErrorKind::FirehoseProtocol,
                    QString("<%1> was acknowledged without raw mode").arg(cmd.tag));
    m_rawRemaining = totalBytes;
    return true;
}

bool FirehoseClient::beginProgram(const SectorRange& range)
{
    FirehoseCommand cmd = rangeCommand("program", range);
    if (!range.label.isEmpty())
        cmd.set("filename", range.label);
    m_rawIsRead = false;
    return beginRaw(cmd, range.numSectors * m_storage.sectorSize);
}

bool FirehoseClient::beginRead(const SectorRange& range)
{
    m_rawIsRead = true;
    return beginRaw(rangeCommand("read", range), range.numSectors * m_storage.sectorSize);
}

bool FirehoseClient::sendPayload(const QByteArray& data)
{
    if (m_state != FirehoseState::RawTransfer || m_rawIsRead)
        return fail(EdlErrorKind::FirehoseProtocol, "Payload sent outside a program phase");
    if (static_cast<uint64_t>(data.size()) > m_rawRemaining)
        return fail(EdlErrorKind::FirehoseProtocol,
                    QString("Payload of %1 bytes exceeds the %2 bytes still declared")
                        .arg(data.size()).arg(m_rawRemaining));
    if (static_cast<uint32_t>(data.size()) > m_config.maxPayloadSize)
        return fail(EdlErrorKind::FirehoseProtocol,
                    QString("Payload of %1 bytes exceeds the negotiated %2")
                        .arg(data.size()).arg(m_config.maxPayloadSize));

    if (m_transport->write(data, DATA_TIMEOUT_MS) != data.size())
        return fail(EdlErrorKind::Transport,
                    QString("Short write of a %1-byte payload chunk").arg(data.size()));
    m_rawRemaining -= static_cast<uint64_t>(data.size());
    return true;
}

bool FirehoseClient::sendDigest(const QByteArray& digest)
{
    if (m_state != FirehoseState::RawTransfer || m_rawIsRead)
        return fail(EdlErrorKind::FirehoseProtocol, "Digest sent outside a program phase");
    if (m_transport->write(digest, DATA_TIMEOUT_MS) != digest.size())
        return fail(EdlErrorKind::Transport, "Short write of a payload digest");
    return true;
}

bool FirehoseClient::receivePayload(int size, QByteArray& out)
{
    if (m_state != FirehoseState::RawTransfer || !m_rawIsRead)
        return fail(EdlErrorKind::FirehoseProtocol, "Payload read outside a read phase");
    if (static_cast<uint64_t>(size) > m_rawRemaining)
        return fail(EdlErrorKind::FirehoseProtocol,
                    QString("Read of %1 bytes exceeds the %2 bytes still declared")
                        .arg(size).arg(m_rawRemaining));

    // Bytes that arrived together with the ACK come first
    out = m_rx.left(size);
    m_rx.remove(0, out.size());
    if (out.size() < size) {
        out += m_transport->readExact(size - out.size(), DATA_TIMEOUT_MS);
        if (out.size() < size)
            return fail(EdlErrorKind::Transport,
                        QString("Short read: expected %1 payload bytes, got %2").arg(size).arg(out.size()));
    }
    m_rawRemaining -= static_cast<uint64_t>(size);
    return true;
}

bool FirehoseClient::finishTransfer(FirehoseResponse* response)
{
    if (m_state != FirehoseState::RawTransfer)
        return fail(EdlErrorKind::FirehoseProtocol, "No payload phase to finish");
    if (m_rawRemaining != 0)
        return fail(EdlErrorKind::FirehoseProtocol,
                    QString("<%1> still has %2 declared bytes outstanding")
                        .arg(m_pendingTag).arg(m_rawRemaining));

    FirehoseResponse local;
    FirehoseResponse& r = response ? *response : local;
    if (!awaitResponse(r, DATA_TIMEOUT_MS))
        return false;
    if (!r.success)
        return fail(EdlErrorKind::FirehoseNak, QString("<%1> NAK: %2").arg(m_pendingTag, r.reason()));
    return true;
}

// ─── Operations ──────────────────────────────────────────────────────

bool FirehoseClient::nop()
{
    return execute(FirehoseCommand("nop"));
}

bool FirehoseClient::erase(const SectorRange& range)
{
    LOG_INFO_CAT(TAG, QString("Erasing %1 sectors at %2 on LUN %3")
                          .arg(range.numSectors).arg(range.startSector).arg(range.physicalPartition));
    return execute(rangeCommand("erase", range), nullptr, DATA_TIMEOUT_MS);
}

// Peek data comes back as hex bytes in log lines, optionally prefixed
// with an address ("0x1468000: 01 02 ...")
static bool parseHexBytes(const QString& line, QByteArray& out)
{
    QString text = line.trimmed();
    const int colon = text.indexOf(':');
    if (colon >= 0)
        text = text.mid(colon + 1);

    static const QRegularExpression ws(QStringLiteral("\\s+"));
    const QStringList tokens = text.split(ws, Qt::SkipEmptyParts);
    if (tokens.isEmpty())
        return false;

    QByteArray bytes;
    for (QString t : tokens) {
        if (t.startsWith("0x", Qt::CaseInsensitive))
            t = t.mid(2);
        if (t.isEmpty() || t.size() > 2)
            return false;
        bool ok = false;
        const uint v = t.toUInt(&ok, 16);
        if (!ok)
            return false;
        bytes.append(static_cast<char>(v));
    }
    out += bytes;
    return true;
}

bool FirehoseClient::peek(uint64_t address, uint64_t size, QByteArray& out)
{
    FirehoseCommand cmd("peek");
    cmd.set("address64", QString("0x%1").arg(address, 0, 16))
       .set("SizeInBytes", size);

    FirehoseResponse r;
    if (!execute(cmd, &r))
        return false;

    out.clear();
    for (const auto& line : r.logLines)
        parseHexBytes(line, out);

    if (static_cast<uint64_t>(out.size()) < size)
        return fail(EdlErrorKind::FirehoseProtocol,
                    QString("peek returned %1 of %2 bytes").arg(out.size()).arg(size));
    out.truncate(static_cast<int>(size));
    return true;
}

bool FirehoseClient::patch(const FirehosePatch& p)
{
    FirehoseCommand cmd("patch");
    cmd.set("SECTOR_SIZE_IN_BYTES", p.sectorSize ? p.sectorSize : m_storage.sectorSize)
       .set("byte_offset", p.byteOffset)
       .set("filename", p.filename)
       .set("physical_partition_number", p.physicalPartition)
       .set("size_in_bytes", p.sizeInBytes)
       .set("start_sector", p.startSector)
       .set("value", p.value)
       .set("slot", p.slot >= 0 ? static_cast<qulonglong>(p.slot) : m_storage.slot);
    return execute(cmd);
}

bool FirehoseClient::applyPatches(const QList<FirehosePatch>& patches, QList<PatchOutcome>* failures)
{
    QList<PatchOutcome> local;
    QList<PatchOutcome>& out = failures ? *failures : local;
    out.clear();

    for (int i = 0; i < patches.size(); i++) {
        if (patch(patches.at(i)))
            continue;

        PatchOutcome outcome;
        outcome.index = i;
        outcome.error = m_lastError;
        out.append(outcome);
        LOG_ERROR_CAT(TAG, QString("Patch #%1 (%2) failed: %3")
                               .arg(i).arg(patches.at(i).what, m_lastError.message));

        // Only a refusal leaves the channel usable for the next patch
        if (m_lastError.kind != EdlErrorKind::FirehoseNak)
            break;
    }

    if (!out.isEmpty())
        m_lastError = EdlError(out.first().error.kind,
                               QString("%1 of %2 patches failed, first at #%3")
                                   .arg(out.size()).arg(patches.size()).arg(out.first().index));
    return out.isEmpty();
}

bool FirehoseClient::setBootableStorageDrive(uint32_t index)
{
    LOG_INFO_CAT(TAG, QString("Marking physical partition %1 bootable").arg(index));
    FirehoseCommand cmd("setbootablestoragedrive");
    cmd.set("value", index);
    return execute(cmd);
}

bool FirehoseClient::power(ResetMode mode, int delaySeconds)
{
    QString value;
    switch (mode) {
    case ResetMode::Edl:    value = QStringLiteral("reset_to_edl"); break;
    case ResetMode::Off:    value = QStringLiteral("off"); break;
    case ResetMode::System: value = QStringLiteral("reset"); break;
    }

    LOG_INFO_CAT(TAG, QString("Power: %1").arg(value));
    FirehoseCommand cmd("power");
    cmd.set("value", value)
       .set("DelayInSeconds", static_cast<qulonglong>(delaySeconds));
    return execute(cmd);
}

bool FirehoseClient::getSha256Digest(const SectorRange& range, QByteArray* digest)
{
    FirehoseResponse r;
    if (!execute(rangeCommand("getsha256digest", range), &r, DATA_TIMEOUT_MS))
        return false;

    static const QRegularExpression hexRe(QStringLiteral("([0-9A-Fa-f]{64})"));
    for (const auto& line : r.logLines) {
        QRegularExpressionMatch m = hexRe.match(line);
        if (m.hasMatch()) {
            if (digest)
                *digest = QByteArray::fromHex(m.captured(1).toLatin1());
            LOG_INFO_CAT(TAG, QString("SHA-256 of %1 sectors at %2: %3")
                                  .arg(range.numSectors).arg(range.startSector, m.captured(1).toLower()));
            return true;
        }
    }
    return fail(EdlErrorKind::FirehoseProtocol, "Device did not log a SHA-256 digest");
}

} // namespace qedl
