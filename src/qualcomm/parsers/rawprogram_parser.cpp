#include "rawprogram_parser.h"
#include "core/logger.h"

#include <QFile>
#include <QXmlStreamReader>

static const QString TAG = QStringLiteral("RawprogramParser");

namespace qedl {

QString flashActionTypeName(FlashActionType type)
{
    switch (type) {
    case FlashActionType::Program:         return QStringLiteral("program");
    case FlashActionType::Patch:           return QStringLiteral("patch");
    case FlashActionType::Read:            return QStringLiteral("read");
    case FlashActionType::GetSha256Digest: return QStringLiteral("getsha256digest");
    }
    return QStringLiteral("?");
}

SectorRange FlashAction::range() const
{
    SectorRange r;
    r.physicalPartition = physicalPartition;
    r.startSector = startSector;
    r.numSectors = numSectors;
    r.slot = slot;
    r.label = label;
    return r;
}

FirehosePatch FlashAction::toPatch() const
{
    FirehosePatch p;
    p.sectorSize = sectorSize;
    p.byteOffset = byteOffset;
    p.filename = filename;
    p.physicalPartition = physicalPartition;
    p.sizeInBytes = sizeInBytes;
    p.startSector = startSector;
    p.value = value;
    p.slot = slot;
    p.what = what;
    return p;
}

bool RawprogramParser::isBootableLabel(const QString& label)
{
    return label == QLatin1String("xbl")
        || label == QLatin1String("xbl_a")
        || label == QLatin1String("sbl1");
}

// ─── Attribute helpers ───────────────────────────────────────────────

static bool parseNumber(const QString& text, uint64_t* out)
{
    const QString t = text.trimmed();
    bool ok = false;
    if (t.startsWith("0x", Qt::CaseInsensitive))
        *out = t.mid(2).toULongLong(&ok, 16);
    else
        *out = t.toULongLong(&ok, 10);
    return ok;
}

namespace {

class ElementReader {
public:
    ElementReader(const QXmlStreamAttributes& attrs, const QString& tag)
        : m_attrs(attrs), m_tag(tag) {}

    bool text(const QString& name, QString* out)
    {
        if (!m_attrs.hasAttribute(name))
            return missing(name);
        *out = m_attrs.value(name).toString();
        return true;
    }

    bool number(const QString& name, uint64_t* out)
    {
        if (!m_attrs.hasAttribute(name))
            return missing(name);
        if (!parseNumber(m_attrs.value(name).toString(), out)) {
            m_error = QString("<%1> has a non-numeric %2=\"%3\"")
                          .arg(m_tag, name, m_attrs.value(name).toString());
            return false;
        }
        return true;
    }

    template <typename T>
    bool number32(const QString& name, T* out)
    {
        uint64_t v = 0;
        if (!number(name, &v))
            return false;
        if (v > 0xFFFFFFFFull) {
            m_error = QString("<%1> %2 is out of range").arg(m_tag, name);
            return false;
        }
        *out = static_cast<T>(v);
        return true;
    }

    // Absent optional attributes keep the current value
    bool optionalNumber(const QString& name, uint64_t* out)
    {
        return !m_attrs.hasAttribute(name) || m_attrs.value(name).isEmpty() || number(name, out);
    }

    QString optionalText(const QString& name) const { return m_attrs.value(name).toString(); }

    QString error() const { return m_error; }

private:
    bool missing(const QString& name)
    {
        m_error = QString("<%1> is missing the %2 attribute").arg(m_tag, name);
        return false;
    }

    const QXmlStreamAttributes& m_attrs;
    QString m_tag;
    QString m_error;
};

} // namespace

static bool readAction(const QString& tag, const QXmlStreamAttributes& attrs,
                       FlashAction& action, QString* error)
{
    ElementReader r(attrs, tag);
    uint64_t slot = 0;
    bool ok = true;

    if (tag == QLatin1String("program")) {
        action.type = FlashActionType::Program;
        ok = r.number32("SECTOR_SIZE_IN_BYTES", &action.sectorSize)
          && r.number("num_partition_sectors", &action.numSectors)
          && r.number32("physical_partition_number", &action.physicalPartition)
          && r.text("start_sector", &action.startSector)
          && r.text("filename", &action.filename)
          && r.optionalNumber("file_sector_offset", &action.fileSectorOffset);
        action.label = r.optionalText("label");
    } else if (tag == QLatin1String("patch")) {
        action.type = FlashActionType::Patch;
        uint64_t sectorSize = 0;
        ok = r.text("filename", &action.filename)
          && r.number("byte_offset", &action.byteOffset)
          && r.number32("physical_partition_number", &action.physicalPartition)
          && r.number32("size_in_bytes", &action.sizeInBytes)
          && r.text("start_sector", &action.startSector)
          && r.text("value", &action.value)
          && r.optionalNumber("SECTOR_SIZE_IN_BYTES", &sectorSize);
        action.sectorSize = static_cast<uint32_t>(sectorSize);
        action.what = r.optionalText("what");
    } else if (tag == QLatin1String("read")) {
        action.type = FlashActionType::Read;
        ok = r.number("num_partition_sectors", &action.numSectors)
          && r.number32("physical_partition_number", &action.physicalPartition)
          && r.text("start_sector", &action.startSector)
          && r.text("filename", &action.filename);
        action.label = r.optionalText("label");
    } else if (tag == QLatin1String("getsha256digest")) {
        action.type = FlashActionType::GetSha256Digest;
        ok = r.number("num_partition_sectors", &action.numSectors)
          && r.number32("physical_partition_number", &action.physicalPartition)
          && r.text("start_sector", &action.startSector)
          && r.optionalNumber("file_sector_offset", &action.fileSectorOffset);
        // Optional host image the device digest must match
        action.filename = r.optionalText("filename");
        action.label = r.optionalText("label");
    } else {
        *error = QString("Unknown instruction <%1>, refusing to continue to prevent damage").arg(tag);
        return false;
    }

    if (ok && attrs.hasAttribute("slot")) {
        ok = r.number("slot", &slot);
        action.slot = static_cast<int>(slot);
    }
    if (!ok)
        *error = r.error();
    return ok;
}

// ─── Parse ───────────────────────────────────────────────────────────

RawprogramParseResult RawprogramParser::parseFile(const QString& filePath)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        RawprogramParseResult result;
        result.success = false;
        result.errorMessage = QString("Cannot open file: %1").arg(filePath);
        LOG_ERROR_CAT(TAG, result.errorMessage);
        return result;
    }

    RawprogramParseResult result = parseXml(file.readAll());
    if (!result.success)
        result.errorMessage = QString("%1: %2").arg(filePath, result.errorMessage);
    return result;
}

RawprogramParseResult RawprogramParser::parseXml(const QByteArray& xmlData)
{
    RawprogramParseResult result;
    QXmlStreamReader reader(xmlData);
    int depth = 0;

    while (!reader.atEnd()) {
        reader.readNext();

        if (reader.isEndElement()) {
            depth--;
            continue;
        }
        if (!reader.isStartElement())
            continue;

        // Instructions are the direct children of the root element
        if (++depth != 2)
            continue;

        FlashAction action;
        action.line = static_cast<int>(reader.lineNumber());
        QString error;
        if (!readAction(reader.name().toString().toLower(), reader.attributes(), action, &error)) {
            result.errorMessage = QString("line %1: %2").arg(action.line).arg(error);
            LOG_ERROR_CAT(TAG, result.errorMessage);
            return result;
        }
        result.actions.append(action);
    }

    if (reader.hasError()) {
        result.errorMessage = QString("XML parse error at line %1: %2")
                                  .arg(reader.lineNumber()).arg(reader.errorString());
        LOG_ERROR_CAT(TAG, result.errorMessage);
        return result;
    }

    result.success = true;
    LOG_INFO_CAT(TAG, QString("Parsed %1 instructions").arg(result.actions.size()));
    return result;
}

} // namespace qedl
