#pragma once

#include "i_transport.h"
#include <QSerialPort>
#include <QMutex>
#include <memory>

namespace qedl {

// EDL over a QDLoader 9008 serial port (host driver exposes the bulk
// pipe as a COM/tty device). Raw 8N1; the baud rate is nominal.
class SerialTransport : public ITransport {
public:
    // An empty portName picks the first EDL port, matching serialNumber
    // when one is given
    SerialTransport(const QString& portName, const QString& serialNumber = QString(),
                    qint32 baudRate = 115200);
    ~SerialTransport() override;

    bool open() override;
    void close() override;
    bool isOpen() const override;

    qint64 write(const QByteArray& data, int timeoutMs = 5000) override;
    QByteArray read(int maxSize, int timeoutMs = 5000) override;
    QByteArray readExact(int size, int timeoutMs = 5000) override;

    void discardInput() override;

    TransportType type() const override { return TransportType::Serial; }
    QString description() const override;

    // System location of an EDL port, or empty
    static QString locateEdlPort(const QString& serialNumber);

private:
    bool waitReadable(int timeoutMs);

    QString m_requestedPort;
    QString m_serialNumber;
    QString m_portName;
    qint32 m_baudRate;
    std::unique_ptr<QSerialPort> m_port;
    QMutex m_mutex;
};

} // namespace qedl
