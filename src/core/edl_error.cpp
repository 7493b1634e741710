#include "edl_error.h"

namespace qedl {

QString errorKindName(EdlErrorKind kind)
{
    switch (kind) {
    case EdlErrorKind::None:              return QStringLiteral("None");
    case EdlErrorKind::Transport:         return QStringLiteral("TransportError");
    case EdlErrorKind::SaharaProtocol:    return QStringLiteral("SaharaProtocolError");
    case EdlErrorKind::FirehoseProtocol:  return QStringLiteral("FirehoseProtocolError");
    case EdlErrorKind::FirehoseNak:       return QStringLiteral("FirehoseNak");
    case EdlErrorKind::Gpt:               return QStringLiteral("GptError");
    case EdlErrorKind::PartitionNotFound: return QStringLiteral("PartitionNotFound");
    case EdlErrorKind::Verification:      return QStringLiteral("VerificationError");
    case EdlErrorKind::UserConfig:        return QStringLiteral("UserConfigError");
    case EdlErrorKind::Interrupted:       return QStringLiteral("Interrupted");
    case EdlErrorKind::Io:                return QStringLiteral("IoError");
    }
    return QStringLiteral("UnknownError");
}

QString EdlError::toString() const
{
    if (message.isEmpty())
        return errorKindName(kind);
    return QString("%1: %2").arg(errorKindName(kind), message);
}

int exitCodeFor(EdlErrorKind kind)
{
    switch (kind) {
    case EdlErrorKind::None:              return 0;
    case EdlErrorKind::UserConfig:        return 2;
    case EdlErrorKind::Transport:         return 3;
    case EdlErrorKind::SaharaProtocol:    return 4;
    case EdlErrorKind::FirehoseProtocol:
    case EdlErrorKind::FirehoseNak:       return 5;
    case EdlErrorKind::Gpt:
    case EdlErrorKind::PartitionNotFound: return 6;
    case EdlErrorKind::Verification:      return 7;
    case EdlErrorKind::Interrupted:       return 130;
    case EdlErrorKind::Io:                return 1;
    }
    return 1;
}

} // namespace qedl
