#pragma once

#include "i_transport.h"
#include <QMutex>
#include <cstdint>

struct libusb_context;
struct libusb_device;
struct libusb_device_handle;

namespace qedl {

class UsbTransport : public ITransport {
public:
    // An empty serial selects the first EDL device found
    explicit UsbTransport(const QString& serialNumber = QString());
    ~UsbTransport() override;

    bool open() override;
    void close() override;
    bool isOpen() const override;

    qint64 write(const QByteArray& data, int timeoutMs = 5000) override;
    QByteArray read(int maxSize, int timeoutMs = 5000) override;
    QByteArray readExact(int size, int timeoutMs = 5000) override;

    void discardInput() override;

    TransportType type() const override { return TransportType::USB; }
    QString description() const override;

private:
    static bool initLibusb();
    static void exitLibusb();
    static QString productString(libusb_device* dev, uint8_t index);

    bool claimEdlInterface(libusb_device* dev);
    bool fillRxBuffer(int timeoutMs);

    QString m_serialNumber;
    uint16_t m_vid = 0;
    uint16_t m_pid = 0;
    uint8_t m_epIn = 0x81;
    uint8_t m_epOut = 0x01;
    int m_outPacketSize = 512;
    int m_interface = -1;

    // Bulk IN transfers must be sized for a whole device packet, so reads
    // land here first and are handed out in whatever size callers ask for.
    QByteArray m_rxBuffer;
    int m_rxPos = 0;

    libusb_device_handle* m_handle = nullptr;
    static libusb_context* s_context;
    static int s_refCount;
    QMutex m_mutex;

    static constexpr int RX_BUFFER_SIZE = 1024 * 1024;
};

} // namespace qedl
