#include "usb_transport.h"
#include "core/logger.h"
#include <QElapsedTimer>
#include <QStringList>

#include <libusb-1.0/libusb.h>

static const QString TAG = QStringLiteral("USB");

namespace qedl {

libusb_context* UsbTransport::s_context = nullptr;
int UsbTransport::s_refCount = 0;

// Interface protocol codes used by EDL and ramdump firmware
static constexpr uint8_t EDL_INTF_PROTOCOLS[] = {0x10, 0x11, 0xFF};

UsbTransport::UsbTransport(const QString& serialNumber)
    : m_serialNumber(serialNumber)
{
    initLibusb();
}

UsbTransport::~UsbTransport()
{
    close();
    exitLibusb();
}

bool UsbTransport::initLibusb()
{
    if (s_refCount++ == 0) {
        int ret = libusb_init(&s_context);
        if (ret != 0) {
            LOG_ERROR_CAT(TAG, QString("libusb_init failed: %1")
                                   .arg(libusb_strerror(static_cast<libusb_error>(ret))));
            s_context = nullptr;
            s_refCount--;
            return false;
        }
    }
    return true;
}

void UsbTransport::exitLibusb()
{
    if (--s_refCount <= 0 && s_context) {
        libusb_exit(s_context);
        s_context = nullptr;
        s_refCount = 0;
    }
}

bool UsbTransport::open()
{
    QMutexLocker lock(&m_mutex);
    if (!s_context) return false;
    if (m_handle) return true;

    libusb_device** devList = nullptr;
    ssize_t count = libusb_get_device_list(s_context, &devList);
    if (count < 0) {
        LOG_ERROR_CAT(TAG, "Failed to enumerate USB devices");
        return false;
    }

    libusb_device* target = nullptr;
    QStringList seen;
    for (ssize_t i = 0; i < count && !target; i++) {
        struct libusb_device_descriptor desc;
        if (libusb_get_device_descriptor(devList[i], &desc) != 0)
            continue;
        if (!edl::isEdlDevice(desc.idVendor, desc.idProduct))
            continue;

        if (!m_serialNumber.isEmpty()) {
            const QString serial = edl::serialFromProduct(productString(devList[i], desc.iProduct));
            seen << (serial.isEmpty() ? QStringLiteral("<no serial>") : serial);
            if (serial.compare(m_serialNumber, Qt::CaseInsensitive) != 0)
                continue;
        }
        target = devList[i];
        m_vid = desc.idVendor;
        m_pid = desc.idProduct;
    }

    if (!target) {
        libusb_free_device_list(devList, 1);
        if (m_serialNumber.isEmpty()) {
            LOG_ERROR_CAT(TAG, "Found no devices in EDL mode");
        } else {
            LOG_ERROR_CAT(TAG, QString("Found no devices in EDL mode with serial number %1")
                                   .arg(m_serialNumber));
            if (!seen.isEmpty())
                LOG_INFO_CAT(TAG, QString("EDL devices present: %1").arg(seen.join(", ")));
        }
        return false;
    }

    int ret = libusb_open(target, &m_handle);
    if (ret != 0 || !m_handle) {
        LOG_ERROR_CAT(TAG, QString("libusb_open failed: %1")
                               .arg(libusb_strerror(static_cast<libusb_error>(ret))));
        m_handle = nullptr;
        libusb_free_device_list(devList, 1);
        return false;
    }

    bool claimed = claimEdlInterface(target);
    libusb_free_device_list(devList, 1);
    if (!claimed) {
        libusb_close(m_handle);
        m_handle = nullptr;
        return false;
    }

    m_rxBuffer.clear();
    m_rxPos = 0;
    LOG_INFO_CAT(TAG, QString("USB device opened: VID=%1 PID=%2 interface=%3")
                          .arg(m_vid, 4, 16, QChar('0')).arg(m_pid, 4, 16, QChar('0'))
                          .arg(m_interface));
    return true;
}

bool UsbTransport::claimEdlInterface(libusb_device* dev)
{
    struct libusb_config_descriptor* config = nullptr;
    if (libusb_get_active_config_descriptor(dev, &config) != 0)
        return false;

    bool found = false;
    for (int i = 0; i < config->bNumInterfaces && !found; i++) {
        const struct libusb_interface& iface = config->interface[i];
        for (int j = 0; j < iface.num_altsetting && !found; j++) {
            const struct libusb_interface_descriptor& alt = iface.altsetting[j];
            if (alt.bInterfaceClass != 0xFF || alt.bInterfaceSubClass != 0xFF || alt.bNumEndpoints < 2)
                continue;

            bool protoOk = false;
            for (uint8_t p : EDL_INTF_PROTOCOLS)
                protoOk = protoOk || alt.bInterfaceProtocol == p;
            if (!protoOk)
                continue;

            bool foundIn = false, foundOut = false;
            for (int k = 0; k < alt.bNumEndpoints; k++) {
                const struct libusb_endpoint_descriptor& ep = alt.endpoint[k];
                if ((ep.bmAttributes & LIBUSB_TRANSFER_TYPE_MASK) != LIBUSB_TRANSFER_TYPE_BULK)
                    continue;
                if (ep.bEndpointAddress & LIBUSB_ENDPOINT_IN) {
                    m_epIn = ep.bEndpointAddress;
                    foundIn = true;
                } else {
                    m_epOut = ep.bEndpointAddress;
                    m_outPacketSize = ep.wMaxPacketSize;
                    foundOut = true;
                }
            }
            if (foundIn && foundOut) {
                m_interface = alt.bInterfaceNumber;
                found = true;
            }
        }
    }
    libusb_free_config_descriptor(config);

    if (!found) {
        LOG_ERROR_CAT(TAG, "No vendor-specific bulk interface on EDL device");
        return false;
    }

    if (libusb_kernel_driver_active(m_handle, m_interface) == 1) {
        int detached = libusb_detach_kernel_driver(m_handle, m_interface);
        if (detached != 0)
            LOG_WARNING_CAT(TAG, QString("Couldn't detach kernel driver: %1")
                                     .arg(libusb_strerror(static_cast<libusb_error>(detached))));
    }

    int ret = libusb_claim_interface(m_handle, m_interface);
    if (ret != 0) {
        LOG_ERROR_CAT(TAG, QString("Couldn't claim interface %1: %2")
                               .arg(m_interface).arg(libusb_strerror(static_cast<libusb_error>(ret))));
        return false;
    }
    return true;
}

void UsbTransport::close()
{
    QMutexLocker lock(&m_mutex);
    if (m_handle) {
        libusb_release_interface(m_handle, m_interface);
        libusb_close(m_handle);
        m_handle = nullptr;
        m_rxBuffer.clear();
        m_rxPos = 0;
        LOG_INFO_CAT(TAG, "USB device closed");
    }
}

bool UsbTransport::isOpen() const
{
    return m_handle != nullptr;
}

qint64 UsbTransport::write(const QByteArray& data, int timeoutMs)
{
    QMutexLocker lock(&m_mutex);
    if (!m_handle) return -1;

    int transferred = 0;
    int ret = libusb_bulk_transfer(m_handle, m_epOut,
                                   const_cast<unsigned char*>(reinterpret_cast<const unsigned char*>(data.constData())),
                                   data.size(), &transferred, timeoutMs);
    if (ret != 0) {
        LOG_ERROR_CAT(TAG, QString("USB write error: %1 (%2/%3 bytes)")
                               .arg(libusb_strerror(static_cast<libusb_error>(ret)))
                               .arg(transferred).arg(data.size()));
        return transferred > 0 ? transferred : -1;
    }

    // The programmer is told we are ZLP-aware: a transfer ending on a packet
    // boundary needs a zero-length packet to terminate it
    if (!data.isEmpty() && m_outPacketSize > 0 && data.size() % m_outPacketSize == 0) {
        int zlp = 0;
        ret = libusb_bulk_transfer(m_handle, m_epOut, nullptr, 0, &zlp, timeoutMs);
        if (ret != 0) {
            LOG_ERROR_CAT(TAG, QString("USB zero-length packet failed: %1")
                                   .arg(libusb_strerror(static_cast<libusb_error>(ret))));
            return -1;
        }
    }
    return transferred;
}

bool UsbTransport::fillRxBuffer(int timeoutMs)
{
    m_rxBuffer.resize(RX_BUFFER_SIZE);
    m_rxPos = 0;
    int transferred = 0;
    int ret = libusb_bulk_transfer(m_handle, m_epIn,
                                   reinterpret_cast<unsigned char*>(m_rxBuffer.data()),
                                   m_rxBuffer.size(), &transferred, timeoutMs);
    if (ret != 0 && ret != LIBUSB_ERROR_TIMEOUT) {
        LOG_ERROR_CAT(TAG, QString("USB read error: %1")
                               .arg(libusb_strerror(static_cast<libusb_error>(ret))));
    }
    m_rxBuffer.resize(transferred);
    return transferred > 0;
}

QByteArray UsbTransport::read(int maxSize, int timeoutMs)
{
    QMutexLocker lock(&m_mutex);
    if (!m_handle || maxSize <= 0) return {};

    if (m_rxPos >= m_rxBuffer.size() && !fillRxBuffer(timeoutMs))
        return {};

    int n = qMin(maxSize, static_cast<int>(m_rxBuffer.size()) - m_rxPos);
    QByteArray out = m_rxBuffer.mid(m_rxPos, n);
    m_rxPos += n;
    return out;
}

QByteArray UsbTransport::readExact(int size, int timeoutMs)
{
    QByteArray result;
    result.reserve(size);
    QElapsedTimer timer;
    timer.start();

    while (result.size() < size) {
        int remainingMs = timeoutMs - static_cast<int>(timer.elapsed());
        if (remainingMs <= 0) {
            LOG_WARNING_CAT(TAG, QString("readExact timeout: got %1/%2 bytes")
                                     .arg(result.size()).arg(size));
            break;
        }
        QByteArray chunk = read(size - result.size(), remainingMs);
        if (chunk.isEmpty())
            break;
        result.append(chunk);
    }
    return result;
}

void UsbTransport::discardInput()
{
    QMutexLocker lock(&m_mutex);
    m_rxBuffer.clear();
    m_rxPos = 0;
    if (m_handle) {
        while (fillRxBuffer(100)) {}
        m_rxBuffer.clear();
        m_rxPos = 0;
    }
}

QString UsbTransport::description() const
{
    return QString("USB[%1:%2]").arg(m_vid, 4, 16, QChar('0')).arg(m_pid, 4, 16, QChar('0'));
}

// Product string of a device not yet opened by us; empty when unreadable
QString UsbTransport::productString(libusb_device* dev, uint8_t index)
{
    if (index == 0)
        return QString();
    libusb_device_handle* h = nullptr;
    if (libusb_open(dev, &h) != 0 || !h)
        return QString();
    unsigned char buf[256];
    const int len = libusb_get_string_descriptor_ascii(h, index, buf, sizeof(buf));
    libusb_close(h);
    if (len <= 0)
        return QString();
    return QString::fromLatin1(reinterpret_cast<char*>(buf), len);
}

} // namespace qedl
