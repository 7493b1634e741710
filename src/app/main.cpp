#include <QCoreApplication>
#include <QFile>
#include <QTextStream>

#include "cli_options.h"
#include "core/edl_error.h"
#include "core/interrupt_guard.h"
#include "core/logger.h"
#include "qualcomm/services/edl_session.h"
#include "transport/i_transport.h"
#include "transport/transport_factory.h"

using namespace qedl;

static const QString TAG = QStringLiteral("qedl");

static void setupLogging(const SessionOptions& options)
{
    Logger& log = Logger::instance();
    log.setMinLevel(LogLevel::Info);
    if (options.verboseSahara)
        log.setCategoryLevel("Sahara", LogLevel::Debug);
    if (options.verboseFirehose)
        log.setCategoryLevel("Firehose", LogLevel::Debug);
    if (!options.logFile.isEmpty() && !log.openLogFile(options.logFile))
        LOG_WARNING_CAT(TAG, QString("Cannot open log file %1").arg(options.logFile));
}

static QString hexDump(const QByteArray& data, quint64 base)
{
    QString text;
    for (int i = 0; i < data.size(); i += 16) {
        const QByteArray line = data.mid(i, 16);
        text += QString("%1: %2\n")
                    .arg(base + static_cast<quint64>(i), 16, 16, QChar('0'))
                    .arg(QString::fromLatin1(line.toHex(' ')));
    }
    return text;
}

static bool runCommand(EdlSession& session, const CliCommand& cmd)
{
    QTextStream out(stdout);
    const QString& name = cmd.name;

    if (name == "dump")
        return session.dump(cmd.outDir);
    if (name == "dump-part")
        return session.dumpPartition(cmd.args.at(0), cmd.outDir);
    if (name == "flasher")
        return session.flasher(cmd.programFiles, cmd.patchFiles, cmd.outDir);
    if (name == "erase")
        return session.erase(cmd.args.at(0));
    if (name == "nop") {
        const bool ok = session.nop();
        out << "Your nop was " << (ok ? "successful" : "unsuccessful") << Qt::endl;
        return ok;
    }
    if (name == "overwrite-storage")
        return session.overwriteStorage(cmd.args.at(0));
    if (name == "peek") {
        quint64 base = 0;
        quint64 len = 1;
        if (!CliOptions::parseNumber(cmd.args.at(0), &base)
            || (cmd.args.size() > 1 && !CliOptions::parseNumber(cmd.args.at(1), &len))) {
            LOG_ERROR_CAT(TAG, "peek: address and length must be numbers");
            return false;
        }
        QByteArray data;
        if (!session.peek(base, len, &data))
            return false;
        out << hexDump(data, base);
        return true;
    }
    if (name == "print-gpt") {
        QString table;
        if (!session.printGpt(&table))
            return false;
        out << table;
        return true;
    }
    if (name == "reset") {
        ResetMode mode = ResetMode::System;
        if (!cmd.args.isEmpty() && !parseResetMode(cmd.args.at(0), &mode)) {
            LOG_ERROR_CAT(TAG, QString("Unknown reset mode '%1'").arg(cmd.args.at(0)));
            return false;
        }
        return session.reset(mode);
    }
    if (name == "set-bootable-part") {
        quint64 idx = 0;
        if (!CliOptions::parseNumber(cmd.args.at(0), &idx) || idx > 0xFF) {
            LOG_ERROR_CAT(TAG, QString("Invalid physical partition index '%1'").arg(cmd.args.at(0)));
            return false;
        }
        return session.setBootablePart(static_cast<uint32_t>(idx));
    }
    if (name == "write")
        return session.write(cmd.args.at(0), cmd.args.at(1));
    return false;
}

int main(int argc, char* argv[])
{
    // Before any other thread exists, so they all inherit the blocked mask
    InterruptGuard interruptGuard;

    QCoreApplication app(argc, argv);
    app.setApplicationName("qedl");
    app.setApplicationVersion("1.0.0");

    const CliParseResult cli = CliOptions::parse(app.arguments());
    if (cli.exitNow) {
        QTextStream(stdout) << cli.message;
        return 0;
    }
    if (!cli.success) {
        LOG_ERROR_CAT(TAG, cli.message);
        return exitCodeFor(EdlErrorKind::UserConfig);
    }

    const SessionOptions& options = cli.options;
    const CliCommand& cmd = cli.command;
    setupLogging(options);

    QByteArray loader;
    if (cmd.name != "ramdump") {
        QFile file(options.loaderPath);
        if (!file.open(QIODevice::ReadOnly)) {
            LOG_ERROR_CAT(TAG, QString("Couldn't open the programmer %1: %2")
                                   .arg(options.loaderPath, file.errorString()));
            return exitCodeFor(EdlErrorKind::Io);
        }
        loader = file.readAll();
    }

    std::unique_ptr<ITransport> transport = TransportFactory::create(options);
    if (!transport) {
        LOG_ERROR_CAT(TAG, "No usable transport backend for these options");
        return exitCodeFor(EdlErrorKind::UserConfig);
    }

    EdlSession session(options, std::move(transport));
    session.setCancelFlag(interruptGuard.flag());

    int lastDecile = -1;
    QObject::connect(&session, &EdlSession::progress, [&lastDecile](qint64 done, qint64 total) {
        if (total <= 0)
            return;
        const int decile = static_cast<int>(done * 10 / total);
        if (decile == lastDecile)
            return;
        lastDecile = decile;
        LOG_INFO_CAT(TAG, QString("Progress: %1% (%2 / %3 bytes)")
                              .arg(done * 100 / total).arg(done).arg(total));
    });

    bool ok = false;
    if (cmd.name == "ramdump")
        ok = session.ramdump(cmd.args, cmd.outDir);
    else
        ok = session.start(loader) && runCommand(session, cmd);

    const bool finished = session.finish(ok);
    if (ok && finished)
        return 0;

    EdlError error = session.lastError();
    if (!error.isError())
        error = EdlError(EdlErrorKind::UserConfig, QString("%1 failed").arg(cmd.name));
    LOG_ERROR_CAT(TAG, error.toString());
    return exitCodeFor(error.kind);
}
