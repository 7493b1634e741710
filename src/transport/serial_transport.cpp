#include "serial_transport.h"
#include "core/logger.h"
#include <QSerialPortInfo>
#include <QElapsedTimer>

static const QString TAG = QStringLiteral("Serial");

namespace qedl {

SerialTransport::SerialTransport(const QString& portName, const QString& serialNumber, qint32 baudRate)
    : m_requestedPort(portName)
    , m_serialNumber(serialNumber)
    , m_baudRate(baudRate)
{
}

SerialTransport::~SerialTransport()
{
    close();
}

QString SerialTransport::locateEdlPort(const QString& serialNumber)
{
    for (const QSerialPortInfo& info : QSerialPortInfo::availablePorts()) {
        if (!info.hasVendorIdentifier() || !info.hasProductIdentifier())
            continue;
        if (!edl::isEdlDevice(info.vendorIdentifier(), info.productIdentifier()))
            continue;
        if (!serialNumber.isEmpty()) {
            // Windows drivers report the "_SN:" product string as the description
            QString serial = edl::serialFromProduct(info.description());
            if (serial.isEmpty())
                serial = info.serialNumber();
            if (serial.compare(serialNumber, Qt::CaseInsensitive) != 0)
                continue;
        }
        return info.systemLocation();
    }
    return QString();
}

bool SerialTransport::open()
{
    QMutexLocker lock(&m_mutex);
    if (m_port)
        return true;

    m_portName = m_requestedPort;
    if (m_portName.isEmpty()) {
        m_portName = locateEdlPort(m_serialNumber);
        if (m_portName.isEmpty()) {
            LOG_ERROR_CAT(TAG, m_serialNumber.isEmpty()
                                   ? QString("Serial port path unspecified and no EDL port found")
                                   : QString("No EDL port with serial number %1").arg(m_serialNumber));
            return false;
        }
        LOG_INFO_CAT(TAG, QString("Using EDL port %1").arg(m_portName));
    }

    auto port = std::make_unique<QSerialPort>();
    port->setPortName(m_portName);
    if (!port->open(QIODevice::ReadWrite)) {
        LOG_ERROR_CAT(TAG, QString("Failed to open %1: %2").arg(m_portName, port->errorString()));
        return false;
    }
    if (!port->setBaudRate(m_baudRate) || !port->setDataBits(QSerialPort::Data8)
        || !port->setParity(QSerialPort::NoParity) || !port->setStopBits(QSerialPort::OneStop)
        || !port->setFlowControl(QSerialPort::NoFlowControl)) {
        LOG_ERROR_CAT(TAG, QString("Cannot put %1 into raw 8N1: %2").arg(m_portName, port->errorString()));
        port->close();
        return false;
    }

    // Firehose read payloads arrive in bursts of up to the negotiated size
    port->setReadBufferSize(0);
    port->clear(QSerialPort::AllDirections);
    m_port = std::move(port);
    LOG_INFO_CAT(TAG, QString("Opened %1 @ %2 baud").arg(m_portName).arg(m_baudRate));
    return true;
}

void SerialTransport::close()
{
    QMutexLocker lock(&m_mutex);
    if (!m_port)
        return;
    if (m_port->isOpen()) {
        m_port->flush();
        m_port->close();
        LOG_INFO_CAT(TAG, "Closed " + m_portName);
    }
    m_port.reset();
}

bool SerialTransport::isOpen() const
{
    return m_port && m_port->isOpen();
}

qint64 SerialTransport::write(const QByteArray& data, int timeoutMs)
{
    QMutexLocker lock(&m_mutex);
    if (!m_port || !m_port->isOpen())
        return -1;

    const qint64 queued = m_port->write(data);
    if (queued < 0) {
        LOG_ERROR_CAT(TAG, QString("Write failed: %1").arg(m_port->errorString()));
        return -1;
    }

    // Report only what actually left the host
    QElapsedTimer timer;
    timer.start();
    while (m_port->bytesToWrite() > 0) {
        const int remainingMs = timeoutMs - static_cast<int>(timer.elapsed());
        if (remainingMs <= 0 || !m_port->waitForBytesWritten(remainingMs)) {
            LOG_ERROR_CAT(TAG, QString("Write timeout with %1 of %2 bytes pending")
                                   .arg(m_port->bytesToWrite()).arg(data.size()));
            return queued - m_port->bytesToWrite();
        }
    }
    return queued;
}

bool SerialTransport::waitReadable(int timeoutMs)
{
    if (m_port->bytesAvailable() > 0)
        return true;
    if (timeoutMs <= 0)
        return false;
    if (m_port->waitForReadyRead(timeoutMs))
        return true;
    if (m_port->error() != QSerialPort::NoError && m_port->error() != QSerialPort::TimeoutError) {
        LOG_ERROR_CAT(TAG, QString("Read failed: %1").arg(m_port->errorString()));
        m_port->clearError();
    }
    return false;
}

QByteArray SerialTransport::read(int maxSize, int timeoutMs)
{
    QMutexLocker lock(&m_mutex);
    if (!m_port || !m_port->isOpen() || maxSize <= 0)
        return {};
    if (!waitReadable(timeoutMs))
        return {};
    return m_port->read(maxSize);
}

QByteArray SerialTransport::readExact(int size, int timeoutMs)
{
    QMutexLocker lock(&m_mutex);
    if (!m_port || !m_port->isOpen())
        return {};

    QByteArray result;
    result.reserve(size);
    QElapsedTimer timer;
    timer.start();

    while (result.size() < size) {
        const int remainingMs = timeoutMs - static_cast<int>(timer.elapsed());
        if (!waitReadable(remainingMs)) {
            LOG_WARNING_CAT(TAG, QString("readExact timeout: got %1/%2 bytes in %3ms")
                                     .arg(result.size()).arg(size).arg(timer.elapsed()));
            break;
        }
        result.append(m_port->read(size - result.size()));
    }
    return result;
}

void SerialTransport::discardInput()
{
    QMutexLocker lock(&m_mutex);
    if (!m_port)
        return;
    while (waitReadable(50))
        m_port->readAll();
    m_port->clear(QSerialPort::Input);
}

QString SerialTransport::description() const
{
    const QString port = m_portName.isEmpty() ? m_requestedPort : m_portName;
    return QString("Serial[%1@%2]").arg(port.isEmpty() ? QStringLiteral("auto") : port).arg(m_baudRate);
}

} // namespace qedl
