#pragma once

#include <QString>

namespace qedl {

// ─── Error taxonomy ──────────────────────────────────────────────────
enum class EdlErrorKind {
    None = 0,
    Transport,          // timeout, disconnect, short write
    SaharaProtocol,     // malformed packet, out-of-bounds read, unexpected state
    FirehoseProtocol,   // malformed response, command issued while busy
    FirehoseNak,        // device refused a command
    Gpt,                // bad signature / CRC / layout
    PartitionNotFound,
    Verification,       // packet hash or read-back mismatch
    UserConfig,         // bad option combination or unusable input
    Interrupted,        // operator requested stop between chunks
    Io,                 // host-side file store failure
};

struct EdlError {
    EdlErrorKind kind = EdlErrorKind::None;
    QString message;

    EdlError() = default;
    EdlError(EdlErrorKind k, const QString& msg) : kind(k), message(msg) {}

    bool isError() const { return kind != EdlErrorKind::None; }
    QString toString() const;
};

QString errorKindName(EdlErrorKind kind);

// Process exit code for a fatal error of the given kind (0 for None)
int exitCodeFor(EdlErrorKind kind);

} // namespace qedl
