#include "session_config.h"
#include "logger.h"

#include <QFileInfo>
#include <QSettings>

static const QString TAG = QStringLiteral("Config");

namespace qedl {

QString resetModeString(ResetMode mode)
{
    switch (mode) {
    case ResetMode::Edl:    return QStringLiteral("edl");
    case ResetMode::Off:    return QStringLiteral("off");
    case ResetMode::System: return QStringLiteral("system");
    }
    return QStringLiteral("edl");
}

bool parseResetMode(const QString& text, ResetMode* out)
{
    const QString t = text.trimmed().toLower();
    if (t == "edl")         *out = ResetMode::Edl;
    else if (t == "off")    *out = ResetMode::Off;
    else if (t == "system") *out = ResetMode::System;
    else return false;
    return true;
}

static bool readUInt(const QSettings& s, const QString& key, uint32_t& out, QString* error)
{
    if (!s.contains(key))
        return true;
    bool ok = false;
    uint value = s.value(key).toString().toUInt(&ok, 0);
    if (!ok) {
        if (error) *error = QString("Invalid number for %1").arg(key);
        return false;
    }
    out = value;
    return true;
}

static void readBool(const QSettings& s, const QString& key, bool& out)
{
    if (s.contains(key))
        out = s.value(key).toBool();
}

bool SessionConfig::loadFile(const QString& path, SessionOptions& options, QString* error)
{
    if (!QFileInfo::exists(path)) {
        if (error) *error = QString("Config file not found: %1").arg(path);
        return false;
    }

    QSettings s(path, QSettings::IniFormat);
    if (s.status() != QSettings::NoError) {
        if (error) *error = QString("Cannot parse config file: %1").arg(path);
        return false;
    }

    if (s.contains("transport/backend")
        && !parseTransportType(s.value("transport/backend").toString(), &options.backend)) {
        if (error) *error = QString("Unknown backend '%1'").arg(s.value("transport/backend").toString());
        return false;
    }
    if (s.contains("transport/device"))
        options.devicePath = s.value("transport/device").toString();
    if (s.contains("transport/serial_no"))
        options.serialNumber = s.value("transport/serial_no").toString();
    uint32_t baud = static_cast<uint32_t>(options.baudRate);
    if (!readUInt(s, "transport/baud_rate", baud, error))
        return false;
    options.baudRate = static_cast<qint32>(baud);

    if (s.contains("session/loader"))
        options.loaderPath = s.value("session/loader").toString();
    if (s.contains("session/reset_mode")
        && !parseResetMode(s.value("session/reset_mode").toString(), &options.resetMode)) {
        if (error) *error = QString("Unknown reset mode '%1'").arg(s.value("session/reset_mode").toString());
        return false;
    }
    if (!readUInt(s, "session/max_payload_size", options.maxPayloadSize, error))
        return false;
    readBool(s, "session/hash_packets", options.hashPackets);
    readBool(s, "session/read_back_verify", options.readBackVerify);
    readBool(s, "session/skip_hello_wait", options.skipHelloWait);
    readBool(s, "session/read_device_info", options.readDeviceInfo);

    if (s.contains("storage/type")
        && !parseStorageType(s.value("storage/type").toString(), &options.storageType)) {
        if (error) *error = QString("Unknown storage type '%1'").arg(s.value("storage/type").toString());
        return false;
    }
    if (!readUInt(s, "storage/sector_size", options.sectorSize, error)
        || !readUInt(s, "storage/physical_partition", options.physicalPartition, error)
        || !readUInt(s, "storage/slot", options.storageSlot, error))
        return false;
    readBool(s, "storage/skip_init", options.skipStorageInit);
    readBool(s, "storage/bypass", options.bypassStorage);

    readBool(s, "log/verbose_sahara", options.verboseSahara);
    readBool(s, "log/verbose_firehose", options.verboseFirehose);
    readBool(s, "log/print_firehose_log", options.printFirehoseLog);
    if (s.contains("log/file"))
        options.logFile = s.value("log/file").toString();

    LOG_DEBUG_CAT(TAG, QString("Loaded options from %1").arg(path));
    return true;
}

uint32_t SessionConfig::effectiveSectorSize(const SessionOptions& options)
{
    if (options.sectorSize != 0)
        return options.sectorSize;
    return defaultSectorSize(options.storageType);
}

} // namespace qedl
