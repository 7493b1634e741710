#include "cli_options.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <functional>

namespace qedl {

namespace {

struct CommandSpec {
    const char* name;
    int minArgs;
    int maxArgs;        // -1 = unbounded
    bool needsLoader;
    const char* usage;
};

const CommandSpec COMMANDS[] = {
    { "dump",              0, 0,  true,  "dump [-o dir]                 Dump every partition of the LUN" },
    { "dump-part",         1, 1,  true,  "dump-part <name> [-o dir]     Dump a single partition" },
    { "flasher",           0, 0,  true,  "flasher -p <xml>... [-x <xml>...]  Run rawprogram/patch descriptors" },
    { "erase",             1, 1,  true,  "erase <name>                  Erase a partition" },
    { "nop",               0, 0,  true,  "nop                           Ask the programmer to do nothing" },
    { "overwrite-storage", 1, 1,  true,  "overwrite-storage <file>      Write a raw image from sector 0" },
    { "peek",              1, 2,  true,  "peek <address> [len]          Read device memory" },
    { "print-gpt",         0, 0,  true,  "print-gpt                     Show the partition table" },
    { "reset",             0, 1,  true,  "reset [edl|off|system]        Restart the device" },
    { "set-bootable-part", 1, 1,  true,  "set-bootable-part <idx>       Mark a physical partition bootable" },
    { "write",             2, 2,  true,  "write <name> <file>           Write an image to a partition" },
    { "ramdump",           0, -1, false, "ramdump [region...] [-o dir]  Pull memory regions of a crashed device" },
};

const CommandSpec* findCommand(const QString& name)
{
    for (const auto& c : COMMANDS) {
        if (name == QLatin1String(c.name))
            return &c;
    }
    return nullptr;
}

QString commandHelp()
{
    QString text = QStringLiteral("\nCommands:\n");
    for (const auto& c : COMMANDS)
        text += QStringLiteral("  ") + QLatin1String(c.usage) + QLatin1Char('\n');
    return text;
}

} // namespace

QStringList CliOptions::commandNames()
{
    QStringList names;
    for (const auto& c : COMMANDS)
        names << QLatin1String(c.name);
    return names;
}

bool CliOptions::parseNumber(const QString& text, quint64* out)
{
    const QString t = text.trimmed();
    bool ok = false;
    if (t.startsWith("0x", Qt::CaseInsensitive))
        *out = t.mid(2).toULongLong(&ok, 16);
    else
        *out = t.toULongLong(&ok, 10);
    return ok;
}

CliParseResult CliOptions::parse(const QStringList& arguments)
{
    CliParseResult result;
    SessionOptions& o = result.options;

    QCommandLineParser parser;
    parser.setApplicationDescription("Qualcomm Emergency Download Mode flashing tool");
    parser.setOptionsAfterPositionalArgumentsMode(QCommandLineParser::ParseAsOptions);
    const QCommandLineOption helpOpt = parser.addHelpOption();
    const QCommandLineOption versionOpt = parser.addVersionOption();

    // Session
    QCommandLineOption configOpt("config", "Preload options from an INI file.", "file");
    QCommandLineOption backendOpt("backend", "Transport backend.", "usb/serial");
    QCommandLineOption devPathOpt({"d", "dev-path"}, "Serial port (serial backend).", "path");
    QCommandLineOption serialNoOpt("serial-no", "USB device serial number.", "sn");
    QCommandLineOption baudOpt("baud-rate", "Serial baud rate.", "rate");
    QCommandLineOption loaderOpt({"l", "loader-path"}, "Firehose programmer image.", "file");
    QCommandLineOption storageOpt({"s", "storage-type"}, "Storage type.", "emmc/ufs/nvme/nand");
    QCommandLineOption sectorOpt("sector-size", "Storage sector size override.", "bytes");
    QCommandLineOption lunOpt({"L", "phys-part-idx"}, "Physical partition (e.g. UFS LUN).", "idx");
    QCommandLineOption slotOpt({"S", "storage-slot"}, "Physical device index (e.g. 1 for secondary UFS).", "idx");
    QCommandLineOption resetOpt("reset-mode", "Reset mode once done.", "edl/off/system");
    QCommandLineOption payloadOpt("max-payload-size", "Requested payload ceiling.", "bytes");
    QCommandLineOption hashOpt("hash-packets", "Validate every packet. Slow.");
    QCommandLineOption verifyOpt("read-back-verify", "Read back every written chunk. Very slow.");
    QCommandLineOption skipHelloOpt({"A", "skip-hello-wait"}, "Work around a missing Sahara Hello.");
    QCommandLineOption skipInitOpt("skip-storage-init", "Required for unprovisioned storage.");
    QCommandLineOption bypassOpt("bypass-storage", "Accept storage writes but never execute them.");
    QCommandLineOption noInfoOpt("no-device-info", "Skip the Sahara serial number / key hash query.");
    QCommandLineOption verboseSaharaOpt("verbose-sahara", "Trace Sahara packets.");
    QCommandLineOption verboseFirehoseOpt("verbose-firehose", "Trace Firehose XML.");
    QCommandLineOption printLogOpt("print-firehose-log", "Show programmer log lines.");
    QCommandLineOption logFileOpt("log-file", "Append the log to a file.", "file");

    // Subcommands
    QCommandLineOption outDirOpt({"o", "outdir"}, "Output directory.", "dir", "out/");
    QCommandLineOption programOpt({"p", "program-file"}, "rawprogram descriptor (repeatable).", "file");
    QCommandLineOption patchOpt({"x", "patch-file"}, "patch descriptor (repeatable).", "file");

    parser.addOptions({configOpt, backendOpt, devPathOpt, serialNoOpt, baudOpt, loaderOpt,
                       storageOpt, sectorOpt, lunOpt, slotOpt, resetOpt, payloadOpt, hashOpt,
                       verifyOpt, skipHelloOpt, skipInitOpt, bypassOpt, noInfoOpt,
                       verboseSaharaOpt, verboseFirehoseOpt, printLogOpt, logFileOpt,
                       outDirOpt, programOpt, patchOpt});
    parser.addPositionalArgument("command", "One of: " + commandNames().join(", "));
    parser.addPositionalArgument("args", "Command arguments.", "[args...]");

    auto failWith = [&result](const QString& message) {
        result.success = false;
        result.message = message;
        return result;
    };

    if (!parser.parse(arguments))
        return failWith(parser.errorText());

    if (parser.isSet(helpOpt)) {
        result.exitNow = true;
        result.success = true;
        result.message = parser.helpText() + commandHelp();
        return result;
    }
    if (parser.isSet(versionOpt)) {
        result.exitNow = true;
        result.success = true;
        result.message = QCoreApplication::applicationName() + QLatin1Char(' ')
                       + QCoreApplication::applicationVersion() + QLatin1Char('\n');
        return result;
    }

    // Config file first, command line on top
    if (parser.isSet(configOpt)) {
        QString error;
        if (!SessionConfig::loadFile(parser.value(configOpt), o, &error))
            return failWith(error);
    }

    if (parser.isSet(backendOpt) && !parseTransportType(parser.value(backendOpt), &o.backend))
        return failWith(QString("Unknown backend '%1'").arg(parser.value(backendOpt)));
    if (parser.isSet(devPathOpt))
        o.devicePath = parser.value(devPathOpt);
    if (parser.isSet(serialNoOpt))
        o.serialNumber = parser.value(serialNoOpt);
    if (parser.isSet(loaderOpt))
        o.loaderPath = parser.value(loaderOpt);
    if (parser.isSet(storageOpt) && !parseStorageType(parser.value(storageOpt), &o.storageType))
        return failWith(QString("Unknown storage type '%1'").arg(parser.value(storageOpt)));
    if (parser.isSet(resetOpt) && !parseResetMode(parser.value(resetOpt), &o.resetMode))
        return failWith(QString("Unknown reset mode '%1'").arg(parser.value(resetOpt)));

    struct NumericOption {
        const QCommandLineOption* option;
        quint64 max;
        std::function<void(quint64)> apply;
    };
    const NumericOption numeric[] = {
        { &baudOpt,    0x7FFFFFFF, [&o](quint64 v) { o.baudRate = static_cast<qint32>(v); } },
        { &sectorOpt,  0xFFFFFFFF, [&o](quint64 v) { o.sectorSize = static_cast<uint32_t>(v); } },
        { &lunOpt,     0xFF,       [&o](quint64 v) { o.physicalPartition = static_cast<uint32_t>(v); } },
        { &slotOpt,    0xFF,       [&o](quint64 v) { o.storageSlot = static_cast<uint32_t>(v); } },
        { &payloadOpt, 0xFFFFFFFF, [&o](quint64 v) { o.maxPayloadSize = static_cast<uint32_t>(v); } },
    };
    for (const auto& n : numeric) {
        if (!parser.isSet(*n.option))
            continue;
        quint64 v = 0;
        const QString text = parser.value(*n.option);
        if (!parseNumber(text, &v) || v > n.max)
            return failWith(QString("Invalid value '%1' for --%2").arg(text, n.option->names().last()));
        n.apply(v);
    }

    if (o.sectorSize != 0 && (o.sectorSize < 512 || (o.sectorSize & (o.sectorSize - 1)) != 0))
        return failWith(QString("Sector size %1 is not a power of two >= 512").arg(o.sectorSize));
    if (o.maxPayloadSize == 0)
        return failWith("--max-payload-size must be positive");

    if (parser.isSet(hashOpt))            o.hashPackets = true;
    if (parser.isSet(verifyOpt))          o.readBackVerify = true;
    if (parser.isSet(skipHelloOpt))       o.skipHelloWait = true;
    if (parser.isSet(skipInitOpt))        o.skipStorageInit = true;
    if (parser.isSet(bypassOpt))          o.bypassStorage = true;
    if (parser.isSet(noInfoOpt))          o.readDeviceInfo = false;
    if (parser.isSet(verboseSaharaOpt))   o.verboseSahara = true;
    if (parser.isSet(verboseFirehoseOpt)) o.verboseFirehose = true;
    if (parser.isSet(printLogOpt))        o.printFirehoseLog = true;
    if (parser.isSet(logFileOpt))
        o.logFile = parser.value(logFileOpt);

    // ── Subcommand ───────────────────────────────────────────────────
    QStringList positionals = parser.positionalArguments();
    if (positionals.isEmpty())
        return failWith("No command given. Commands: " + commandNames().join(", "));

    CliCommand& cmd = result.command;
    cmd.name = positionals.takeFirst();
    cmd.args = positionals;
    cmd.outDir = parser.value(outDirOpt);
    cmd.programFiles = parser.values(programOpt);
    cmd.patchFiles = parser.values(patchOpt);

    const CommandSpec* spec = findCommand(cmd.name);
    if (!spec)
        return failWith(QString("Unknown command '%1'").arg(cmd.name));
    if (cmd.args.size() < spec->minArgs || (spec->maxArgs >= 0 && cmd.args.size() > spec->maxArgs))
        return failWith(QString("Usage: %1 %2").arg(QCoreApplication::applicationName(),
                                                      QLatin1String(spec->usage)));
    if (spec->needsLoader && o.loaderPath.isEmpty())
        return failWith(QString("'%1' needs a programmer: pass --loader-path").arg(cmd.name));
    if (cmd.name == QLatin1String("flasher") && cmd.programFiles.isEmpty())
        return failWith("flasher needs at least one --program-file");

    result.success = true;
    return result;
}

} // namespace qedl
