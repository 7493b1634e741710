#pragma once

#include <QString>
#include <QStringList>

#include "core/session_config.h"

namespace qedl {

// Subcommand and its own arguments
struct CliCommand {
    QString name;
    QStringList args;                       // positionals after the name
    QString outDir = QStringLiteral("out/");
    QStringList programFiles;
    QStringList patchFiles;
};

struct CliParseResult {
    bool success = false;
    bool exitNow = false;                   // --help / --version handled
    QString message;                        // error, or text to print on exitNow
    SessionOptions options;
    CliCommand command;
};

class CliOptions {
public:
    // `arguments` includes the program name, as QCoreApplication::arguments()
    static CliParseResult parse(const QStringList& arguments);

    static QStringList commandNames();
    // Accepts decimal or 0x-prefixed hexadecimal
    static bool parseNumber(const QString& text, quint64* out);
};

} // namespace qedl
