#include "transport_factory.h"
#include "serial_transport.h"
#include "usb_transport.h"
#include "core/logger.h"
#include "core/session_config.h"

namespace qedl {

std::unique_ptr<ITransport> TransportFactory::create(const SessionOptions& options)
{
    switch (options.backend) {
    case TransportType::USB:
        if (!options.devicePath.isEmpty())
            LOG_WARNING(QString("--dev-path %1 is ignored by the usb backend").arg(options.devicePath));
        return std::make_unique<UsbTransport>(options.serialNumber);
    case TransportType::Serial:
        return std::make_unique<SerialTransport>(options.devicePath, options.serialNumber,
                                                 options.baudRate);
    case TransportType::None:
        break;
    }
    LOG_ERROR(QString("Unsupported transport backend '%1'").arg(transportTypeString(options.backend)));
    return nullptr;
}

} // namespace qedl
