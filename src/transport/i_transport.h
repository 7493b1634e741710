#pragma once

#include <QByteArray>
#include <QString>
#include <cstdint>

namespace qedl {

enum class TransportType {
    None = 0,
    Serial,
    USB
};

inline QString transportTypeString(TransportType type)
{
    switch (type) {
    case TransportType::Serial: return QStringLiteral("serial");
    case TransportType::USB:    return QStringLiteral("usb");
    case TransportType::None:   break;
    }
    return QStringLiteral("none");
}

inline bool parseTransportType(const QString& text, TransportType* out)
{
    const QString t = text.trimmed().toLower();
    if (t == "usb")         *out = TransportType::USB;
    else if (t == "serial") *out = TransportType::Serial;
    else return false;
    return true;
}

// ─── Qualcomm EDL device identity ────────────────────────────────────
// The same VID/PID pair shows up as a libusb device or as a QDLoader
// serial port, depending on the host driver.
namespace edl {

constexpr uint16_t QUALCOMM_VID = 0x05C6;
constexpr uint16_t EDL_PID = 0x9008;
constexpr uint16_t RAMDUMP_PID = 0x900E;

inline bool isEdlDevice(uint16_t vid, uint16_t pid)
{
    return vid == QUALCOMM_VID && (pid == EDL_PID || pid == RAMDUMP_PID);
}

// Serial number from a product string like "QUSB__BULK_CID:0402_SN:12AB34CD"
inline QString serialFromProduct(const QString& product)
{
    const int idx = product.indexOf(QStringLiteral("_SN:"));
    if (idx < 0)
        return QString();
    return product.mid(idx + 4).section(QLatin1Char(' '), 0, 0).trimmed();
}

} // namespace edl

// Byte channel to the device. Every read and write is bounded by a
// timeout; a short result means it expired or the device went away.
class ITransport {
public:
    virtual ~ITransport() = default;

    virtual bool open() = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    virtual qint64 write(const QByteArray& data, int timeoutMs = 5000) = 0;
    // Whatever is available, up to maxSize; empty on timeout
    virtual QByteArray read(int maxSize, int timeoutMs = 5000) = 0;
    // Exactly `size` bytes unless the timeout runs out first
    virtual QByteArray readExact(int size, int timeoutMs = 5000) = 0;

    // Drops unread inbound bytes (stale responses after an abort)
    virtual void discardInput() = 0;

    virtual TransportType type() const = 0;
    virtual QString description() const = 0;
};

} // namespace qedl
