#include "file_dump_sink.h"
#include "core/logger.h"

static const QString TAG = QStringLiteral("Ramdump");

namespace qedl {

FileDumpSink::FileDumpSink(const QString& outDir)
    : m_dir(outDir)
{
}

QString safeFileName(const QString& name)
{
    QString out = name;
    out.replace('/', '_');
    out.replace('\\', '_');
    if (out.isEmpty() || out == QLatin1String(".") || out == QLatin1String(".."))
        out = QStringLiteral("_");
    return out;
}

QString FileDumpSink::fileNameFor(const SaharaMemoryRegion& region)
{
    QString name = region.filename.trimmed();
    if (name.isEmpty())
        name = region.description.trimmed() + QStringLiteral(".bin");
    if (name == QLatin1String(".bin"))
        name = QString("region_%1.bin").arg(region.base, 0, 16);
    return safeFileName(name);
}

bool FileDumpSink::beginRegion(const SaharaMemoryRegion& region)
{
    if (!m_dir.mkpath(".")) {
        m_error = QString("Cannot create directory %1").arg(m_dir.absolutePath());
        return false;
    }

    m_file.setFileName(m_dir.filePath(fileNameFor(region)));
    if (!m_file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        m_error = QString("Cannot create %1: %2").arg(m_file.fileName(), m_file.errorString());
        return false;
    }
    LOG_INFO_CAT(TAG, QString("Dumping %1 (0x%2 bytes at 0x%3) to %4")
                          .arg(region.description)
                          .arg(region.length, 0, 16)
                          .arg(region.base, 0, 16)
                          .arg(m_file.fileName()));
    return true;
}

bool FileDumpSink::writeChunk(const QByteArray& data)
{
    if (m_file.write(data) != data.size()) {
        m_error = QString("Write to %1 failed: %2").arg(m_file.fileName(), m_file.errorString());
        return false;
    }
    return true;
}

bool FileDumpSink::endRegion()
{
    const bool flushed = m_file.flush();
    m_written.append(m_file.fileName());
    m_file.close();
    if (!flushed)
        m_error = QString("Flush of %1 failed").arg(m_written.last());
    return flushed;
}

} // namespace qedl
