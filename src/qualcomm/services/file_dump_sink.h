#pragma once

#include <QDir>
#include <QFile>
#include <QStringList>

#include "qualcomm/protocol/sahara_protocol.h"

namespace qedl {

// Device-supplied name turned into a single path component: separators
// become '_' and "", "." or ".." become "_"
QString safeFileName(const QString& name);

// Writes each Sahara memory region to its own file in one directory
class FileDumpSink : public IDumpSink {
public:
    explicit FileDumpSink(const QString& outDir);

    bool beginRegion(const SaharaMemoryRegion& region) override;
    bool writeChunk(const QByteArray& data) override;
    bool endRegion() override;

    QStringList writtenFiles() const { return m_written; }
    QString errorString() const { return m_error; }

    // File name used for a region: its filename, else its description
    static QString fileNameFor(const SaharaMemoryRegion& region);

private:
    QDir m_dir;
    QFile m_file;
    QStringList m_written;
    QString m_error;
};

} // namespace qedl
