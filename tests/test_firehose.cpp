#include <QtTest>

#include "fake_firehose_device.h"
#include "mock_transport.h"
#include "common/sha256.h"
#include "core/logger.h"
#include "qualcomm/protocol/firehose_client.h"

using namespace qedl;

static QByteArray document(const QString& inner)
{
    return QString("<?xml version=\"1.0\" encoding=\"UTF-8\" ?>\n<data>\n%1\n</data>\n")
        .arg(inner).toUtf8();
}

static QByteArray pattern(int size)
{
    QByteArray out(size, '\0');
    for (int i = 0; i < size; i++)
        out[i] = static_cast<char>((i * 7 + i / 4096) & 0xFF);
    return out;
}

class TestFirehose : public QObject {
    Q_OBJECT

private:
    // Fresh client on the fake device, welcome logs consumed
    static bool handshake(FakeFirehoseDevice& dev, FirehoseClient& client, uint32_t payload = 1048576)
    {
        Q_UNUSED(dev);
        if (!client.drainWelcomeLogs(0))
            return false;
        FirehoseConfigureRequest req;
        req.maxPayloadSize = payload;
        return client.configure(req);
    }

private slots:
    void initTestCase()
    {
        Logger::instance().setConsoleEnabled(false);
    }

    void cleanup()
    {
        Logger::instance().setSink(nullptr);
        Logger::instance().setCategoryLevel("Firehose", LogLevel::Info);
    }

    void wireTraceOnlyAtDebug()
    {
        QStringList lines;
        Logger::instance().setSink([&lines](const QString& msg, LogLevel) { lines << msg; });

        FakeFirehoseDevice dev;
        FirehoseClient client(&dev);
        QVERIFY(handshake(dev, client));
        QVERIFY(lines.filter("-> ").isEmpty());

        Logger::instance().setCategoryLevel("Firehose", LogLevel::Debug);
        QVERIFY(client.nop());
        QVERIFY(!lines.filter("[Firehose] -> ").filter("<nop").isEmpty());
        QVERIFY(!lines.filter("[Firehose] <- ").filter("ACK").isEmpty());

        lines.clear();
        Logger::instance().wire("Firehose", true, QByteArray(100, '\x11'), false);
        QCOMPARE(lines.size(), 1);
        QVERIFY(lines.first().endsWith("11 ... (100 bytes)"));
    }

    // ── XML encoding ─────────────────────────────────────────────────

    void commandXmlKeepsAttributeOrder()
    {
        FirehoseCommand cmd("program");
        cmd.set("SECTOR_SIZE_IN_BYTES", 4096)
           .set("num_partition_sectors", 8)
           .set("start_sector", "NUM_DISK_SECTORS-5.");
        const QString xml = QString::fromUtf8(cmd.toXml());

        QVERIFY(xml.contains("<data>"));
        QVERIFY(xml.contains("</data>"));
        const int a = xml.indexOf("SECTOR_SIZE_IN_BYTES=\"4096\"");
        const int b = xml.indexOf("num_partition_sectors=\"8\"");
        const int c = xml.indexOf("start_sector=\"NUM_DISK_SECTORS-5.\"");
        QVERIFY(a > 0);
        QVERIFY(b > a);
        QVERIFY(c > b);
        QVERIFY(!cmd.toXml().contains('\0'));

        cmd.set("num_partition_sectors", 9);
        QCOMPARE(cmd.value("num_partition_sectors"), QString("9"));
        QCOMPARE(cmd.attributes.size(), 3);
    }

    // ── Configure ────────────────────────────────────────────────────

    void configureAdoptsGrantedPayload()
    {
        FakeFirehoseDevice dev;
        dev.maxPayload = 65536;
        dev.maxPayloadSupported = 65536;
        FirehoseClient client(&dev);

        QVERIFY(handshake(dev, client));
        QCOMPARE(client.maxPayloadSize(), 65536u);
        QCOMPARE(client.config().maxXmlSize, 4096u);
        QCOMPARE(client.config().version, QString("1"));
        QCOMPARE(dev.count("configure"), 1);
        QCOMPARE(client.state(), FirehoseState::Idle);
    }

    void configureAcceptsCounterOffer()
    {
        FakeFirehoseDevice dev;
        dev.nakOversizedConfigure = true;
        dev.maxPayload = 131072;
        dev.maxPayloadSupported = 131072;
        FirehoseClient client(&dev);

        QVERIFY(handshake(dev, client));
        QCOMPARE(dev.count("configure"), 2);
        QCOMPARE(dev.commands.last().attrs.value("MaxPayloadSizeToTargetInBytes"), QString("131072"));
        QCOMPARE(client.maxPayloadSize(), 131072u);
    }

    void configureRenegotiatesUpToRequest()
    {
        FakeFirehoseDevice dev;
        dev.firstConfigureOffer = 65536;
        FirehoseClient client(&dev);

        QVERIFY(handshake(dev, client, 524288));
        QCOMPARE(dev.count("configure"), 2);
        QCOMPARE(dev.commands.last().attrs.value("MaxPayloadSizeToTargetInBytes"), QString("524288"));
        QCOMPARE(client.maxPayloadSize(), 524288u);
    }

    void configureKeepsSizeWhenLargerRefused()
    {
        FakeFirehoseDevice dev;
        dev.maxPayload = 65536;               // Supported still claims 1 MiB
        dev.nakOversizedConfigure = true;
        FirehoseClient client(&dev);

        QVERIFY(handshake(dev, client, 1048576));
        QCOMPARE(client.maxPayloadSize(), 65536u);
    }

    void configureRejectsNewerProtocol()
    {
        FakeFirehoseDevice dev;
        dev.minVersionSupported = QStringLiteral("2");
        FirehoseClient client(&dev);

        QVERIFY(!handshake(dev, client));
        QCOMPARE(client.lastError().kind, EdlErrorKind::FirehoseProtocol);
    }

    void configureSendsSessionFlags()
    {
        FakeFirehoseDevice dev;
        FirehoseClient client(&dev);
        StorageDescriptor storage;
        storage.type = StorageType::eMMC;
        storage.sectorSize = 512;
        client.setStorage(storage);

        FirehoseConfigureRequest req;
        req.hashPackets = true;
        req.skipStorageInit = true;
        QVERIFY(client.drainWelcomeLogs(0));
        QVERIFY(client.configure(req));

        const auto attrs = dev.commands.first().attrs;
        QCOMPARE(attrs.value("MemoryName"), QString("emmc"));
        QCOMPARE(attrs.value("AlwaysValidate"), QString("1"));
        QCOMPARE(attrs.value("SkipStorageInit"), QString("1"));
        QCOMPARE(attrs.value("SkipWrite"), QString("0"));
        QVERIFY(dev.alwaysValidate);
    }

    // ── Exchange ─────────────────────────────────────────────────────

    void issueRefusedWhileBusy()
    {
        FakeFirehoseDevice dev;
        FirehoseClient client(&dev);
        QVERIFY(handshake(dev, client));

        QVERIFY(client.issue(FirehoseCommand("nop")));
        QCOMPARE(client.state(), FirehoseState::CommandSent);
        QVERIFY(!client.issue(FirehoseCommand("nop")));
        QCOMPARE(client.lastError().kind, EdlErrorKind::FirehoseProtocol);
        QCOMPARE(dev.count("nop"), 1);

        FirehoseResponse r;
        QVERIFY(client.awaitResponse(r));
        QVERIFY(r.success);
        QCOMPARE(client.state(), FirehoseState::Idle);
    }

    void nakCarriesDeviceReason()
    {
        FakeFirehoseDevice dev;
        FirehoseClient client(&dev);
        QVERIFY(handshake(dev, client));

        FirehoseResponse r;
        QVERIFY(!client.execute(FirehoseCommand("frobnicate"), &r));
        QVERIFY(!r.success);
        QCOMPARE(r.reason(), QString("Unknown command frobnicate"));
        QCOMPARE(client.lastError().kind, EdlErrorKind::FirehoseNak);
        QVERIFY(client.lastError().message.contains("Unknown command frobnicate"));
        QCOMPARE(client.state(), FirehoseState::Idle);
    }

    void splitsDocumentsFromOneRead()
    {
        MockTransport mock;
        mock.push(document("<log value=\"first\" />")
                  + document("<log value=\"second\" />")
                  + document("<response value=\"ACK\" />")
                  + document("<response value=\"NAK\" />"));
        FirehoseClient client(&mock);

        FirehoseResponse r;
        QVERIFY(client.execute(FirehoseCommand("nop"), &r));
        QCOMPARE(r.logLines, QStringList({"first", "second"}));
        QVERIFY(mock.inbound.isEmpty());

        // The second response was already buffered
        QVERIFY(!client.execute(FirehoseCommand("nop"), &r));
        QCOMPARE(client.lastError().kind, EdlErrorKind::FirehoseNak);
    }

    void rejectsUnknownResponseValue()
    {
        MockTransport mock;
        mock.push(document("<response value=\"MAYBE\" />"));
        FirehoseClient client(&mock);

        QVERIFY(!client.execute(FirehoseCommand("nop")));
        QCOMPARE(client.lastError().kind, EdlErrorKind::FirehoseProtocol);
    }

    void rejectsMalformedXml()
    {
        MockTransport mock;
        mock.push(QByteArray("<data><response value=\"ACK\" <log></data>"));
        FirehoseClient client(&mock);

        QVERIFY(!client.execute(FirehoseCommand("nop")));
        QCOMPARE(client.lastError().kind, EdlErrorKind::FirehoseProtocol);
    }

    void responseTimeoutIsTransportError()
    {
        MockTransport mock;
        FirehoseClient client(&mock);

        QVERIFY(client.issue(FirehoseCommand("nop")));
        FirehoseResponse r;
        QVERIFY(!client.awaitResponse(r, 20));
        QCOMPARE(client.lastError().kind, EdlErrorKind::Transport);
    }

    void oversizedXmlRefused()
    {
        FakeFirehoseDevice dev;
        FirehoseClient client(&dev);
        QVERIFY(handshake(dev, client));

        FirehoseCommand cmd("nop");
        cmd.set("padding", QString(5000, 'x'));
        QVERIFY(!client.issue(cmd));
        QCOMPARE(client.lastError().kind, EdlErrorKind::FirehoseProtocol);
        QCOMPARE(dev.count("nop"), 0);
    }

    // ── Payload phase ────────────────────────────────────────────────

    void readUsesBytesBufferedWithAck()
    {
        FakeFirehoseDevice dev;
        const QByteArray lun = pattern(8 * 4096);
        dev.setLunData(0, lun);
        FirehoseClient client(&dev);
        QVERIFY(handshake(dev, client));

        QVERIFY(client.beginRead(SectorRange::at(0, 2, 3)));
        QCOMPARE(client.state(), FirehoseState::RawTransfer);

        QByteArray first, second;
        QVERIFY(client.receivePayload(4096, first));
        QVERIFY(client.receivePayload(2 * 4096, second));
        QCOMPARE(first + second, lun.mid(2 * 4096, 3 * 4096));

        QVERIFY(client.finishTransfer());
        QCOMPARE(client.state(), FirehoseState::Idle);
    }

    void programWritesStorage()
    {
        FakeFirehoseDevice dev;
        FirehoseClient client(&dev);
        QVERIFY(handshake(dev, client));

        SectorRange range = SectorRange::at(0, 4, 2);
        range.label = QStringLiteral("modem");
        QVERIFY(client.beginProgram(range));
        const QByteArray data = pattern(2 * 4096);
        QVERIFY(client.sendPayload(data));
        QVERIFY(client.finishTransfer());

        QCOMPARE(dev.commands.last().attrs.value("filename"), QString("modem"));
        QCOMPARE(dev.lunData(0).mid(4 * 4096, 2 * 4096), data);
    }

    void finishNeedsDeclaredBytes()
    {
        FakeFirehoseDevice dev;
        FirehoseClient client(&dev);
        QVERIFY(handshake(dev, client));

        QVERIFY(client.beginProgram(SectorRange::at(0, 0, 2)));
        QVERIFY(!client.sendPayload(pattern(3 * 4096)));
        QCOMPARE(client.lastError().kind, EdlErrorKind::FirehoseProtocol);

        QVERIFY(client.sendPayload(pattern(4096)));
        QVERIFY(!client.finishTransfer());
        QCOMPARE(client.lastError().kind, EdlErrorKind::FirehoseProtocol);
        QVERIFY(client.lastError().message.contains("outstanding"));
    }

    void payloadOutsidePhaseRefused()
    {
        FakeFirehoseDevice dev;
        FirehoseClient client(&dev);
        QVERIFY(handshake(dev, client));

        QByteArray out;
        QVERIFY(!client.sendPayload(pattern(4096)));
        QVERIFY(!client.receivePayload(4096, out));
        QVERIFY(!client.finishTransfer());
        QCOMPARE(client.lastError().kind, EdlErrorKind::FirehoseProtocol);
    }

    void abandonReturnsToIdle()
    {
        FakeFirehoseDevice dev;
        FirehoseClient client(&dev);
        QVERIFY(handshake(dev, client));

        QVERIFY(client.issue(FirehoseCommand("nop")));
        client.abandon();
        QCOMPARE(client.state(), FirehoseState::Idle);
        QVERIFY(dev.inbound.isEmpty());
        QCOMPARE(dev.discards, 1);

        QVERIFY(client.nop());
    }

    // ── Operations ───────────────────────────────────────────────────

    void peekDecodesLogLines()
    {
        FakeFirehoseDevice dev;
        FirehoseClient client(&dev);
        QVERIFY(handshake(dev, client));

        QByteArray out;
        QVERIFY(client.peek(0x1468000, 20, out));
        QCOMPARE(out.size(), 20);
        for (int i = 0; i < out.size(); i++)
            QCOMPARE(static_cast<uint8_t>(out.at(i)), static_cast<uint8_t>(i));
        QCOMPARE(dev.commands.last().attrs.value("address64"), QString("0x1468000"));
        QCOMPARE(dev.commands.last().attrs.value("SizeInBytes"), QString("20"));
    }

    void patchesFailIndependently()
    {
        FakeFirehoseDevice dev;
        dev.nakPatches = {1, 3};
        FirehoseClient client(&dev);
        QVERIFY(handshake(dev, client));

        QList<FirehosePatch> patches;
        for (int i = 0; i < 5; i++) {
            FirehosePatch p;
            p.byteOffset = static_cast<uint64_t>(i * 8);
            p.sizeInBytes = 8;
            p.startSector = QStringLiteral("1");
            p.value = QStringLiteral("NUM_DISK_SECTORS-1.");
            p.what = QString("patch %1").arg(i);
            patches.append(p);
        }

        QList<PatchOutcome> failures;
        QVERIFY(!client.applyPatches(patches, &failures));
        QCOMPARE(failures.size(), 2);
        QCOMPARE(failures.at(0).index, 1);
        QCOMPARE(failures.at(1).index, 3);
        QCOMPARE(dev.count("patch"), 5);
        QCOMPARE(client.lastError().kind, EdlErrorKind::FirehoseNak);
        QCOMPARE(client.state(), FirehoseState::Idle);
    }

    void powerModes_data()
    {
        QTest::addColumn<int>("mode");
        QTest::addColumn<QString>("value");

        QTest::newRow("edl") << static_cast<int>(ResetMode::Edl) << "reset_to_edl";
        QTest::newRow("off") << static_cast<int>(ResetMode::Off) << "off";
        QTest::newRow("system") << static_cast<int>(ResetMode::System) << "reset";
    }

    void powerModes()
    {
        QFETCH(int, mode);
        QFETCH(QString, value);

        FakeFirehoseDevice dev;
        FirehoseClient client(&dev);
        QVERIFY(handshake(dev, client));

        QVERIFY(client.power(static_cast<ResetMode>(mode), 2));
        QCOMPARE(dev.commands.last().tag, QString("power"));
        QCOMPARE(dev.commands.last().attrs.value("value"), value);
        QCOMPARE(dev.commands.last().attrs.value("DelayInSeconds"), QString("2"));
    }

    void sha256DigestFromLog()
    {
        FakeFirehoseDevice dev;
        const QByteArray lun = pattern(8 * 4096);
        dev.setLunData(0, lun);
        FirehoseClient client(&dev);
        QVERIFY(handshake(dev, client));

        QByteArray digest;
        QVERIFY(client.getSha256Digest(SectorRange::at(0, 1, 4), &digest));
        QCOMPARE(digest, Sha256::hash(lun.mid(4096, 4 * 4096)));
    }

    void bootableDriveAndErase()
    {
        FakeFirehoseDevice dev;
        dev.setLunData(0, pattern(4 * 4096));
        FirehoseClient client(&dev);
        QVERIFY(handshake(dev, client));

        QVERIFY(client.setBootableStorageDrive(1));
        QCOMPARE(dev.commands.last().attrs.value("value"), QString("1"));

        QVERIFY(client.erase(SectorRange::at(0, 1, 2)));
        QCOMPARE(dev.lunData(0).mid(4096, 2 * 4096), QByteArray(2 * 4096, '\0'));
        QCOMPARE(dev.lunData(0).left(4096), pattern(4096));
    }
};

QTEST_GUILESS_MAIN(TestFirehose)
#include "test_firehose.moc"
