#include <QtTest>

#include "mock_transport.h"
#include "core/logger.h"
#include "qualcomm/protocol/sahara_protocol.h"
#include "qualcomm/services/edl_session.h"
#include "qualcomm/services/file_dump_sink.h"

#include <QTemporaryDir>

#include <cstring>

using namespace qedl;

// Bootrom side of Sahara, driven by the packets the host writes
class FakeSaharaDevice : public MockTransport {
public:
    struct Region {
        QByteArray description;
        QByteArray filename;
        uint64_t base = 0;
        uint64_t length = 0;
    };

    // ── Knobs ────────────────────────────────────────────────────────
    QList<QPair<uint64_t, uint64_t>> reads;   // (offset, length) requested per image
    bool use64BitReads = true;
    bool acceptCommandMode = false;
    uint32_t serial = 0x12345678;
    QByteArray pkHash;
    int extraImages = 0;                      // DoneResponse asks for this many more
    uint32_t endStatus = 0;
    QList<Region> regions;
    bool use64BitMemory = true;
    uint64_t tableAddress = 0x1000;
    uint32_t version = 2;
    uint32_t versionMin = 1;

    // ── Observations ─────────────────────────────────────────────────
    QList<QPair<uint64_t, QByteArray>> served;
    QList<uint32_t> helloResponseModes;
    QList<QPair<uint32_t, uint32_t>> helloResponseVersions;   // (version, min)
    int doneCount = 0;

    void powerOn(SaharaMode mode = SaharaMode::ImageTransferPending) { pushHello(mode); }

    qint64 write(const QByteArray& data, int timeoutMs = 5000) override
    {
        MockTransport::write(data, timeoutMs);
        if (m_serving) {
            m_serving = false;
            served.append(qMakePair(m_servingOffset, data));
            nextRead();
            return data.size();
        }

        SaharaPacketHeader hdr;
        std::memcpy(&hdr, data.constData(), sizeof(hdr));
        switch (static_cast<SaharaCommand>(hdr.command)) {
        case SaharaCommand::HelloResponse: {
            SaharaHelloResponsePacket resp;
            std::memcpy(&resp, data.constData(), sizeof(resp));
            helloResponseModes.append(resp.mode);
            helloResponseVersions.append(qMakePair(resp.version, resp.versionMin));
            if (resp.mode == static_cast<uint32_t>(SaharaMode::Command) && acceptCommandMode) {
                SaharaPacketHeader ready;
                ready.command = static_cast<uint32_t>(SaharaCommand::CommandReady);
                ready.length = sizeof(ready);
                pushPacket(ready);
            } else if (resp.mode == static_cast<uint32_t>(SaharaMode::MemoryDebug)) {
                pushMemoryDebug();
            } else {
                nextRead();
            }
            break;
        }
        case SaharaCommand::Execute: {
            SaharaExecutePacket exec;
            std::memcpy(&exec, data.constData(), sizeof(exec));
            if (exec.clientCommand == static_cast<uint32_t>(SaharaExecCommand::SerialNumRead))
                m_execData = QByteArray(reinterpret_cast<const char*>(&serial), 4);
            else
                m_execData = pkHash;
            SaharaExecuteDataPacket resp{};
            resp.header.command = static_cast<uint32_t>(SaharaCommand::ExecuteData);
            resp.header.length = sizeof(resp);
            resp.clientCommand = exec.clientCommand;
            resp.dataLength = static_cast<uint32_t>(m_execData.size());
            pushPacket(resp);
            break;
        }
        case SaharaCommand::ExecuteResponse:
            push(m_execData);
            break;
        case SaharaCommand::SwitchMode:
            pushHello(SaharaMode::ImageTransferPending);
            break;
        case SaharaCommand::Done: {
            doneCount++;
            SaharaDoneResponsePacket resp{};
            resp.header.command = static_cast<uint32_t>(SaharaCommand::DoneResponse);
            resp.header.length = sizeof(resp);
            if (extraImages > 0) {
                extraImages--;
                resp.imageTxStatus = 0;
                pushPacket(resp);
                m_readIndex = 0;
                nextRead();
            } else {
                resp.imageTxStatus = 1;
                pushPacket(resp);
            }
            break;
        }
        case SaharaCommand::MemoryRead: {
            SaharaMemoryReadPacket req;
            std::memcpy(&req, data.constData(), sizeof(req));
            push(memoryAt(req.address, req.length));
            break;
        }
        case SaharaCommand::MemoryRead64: {
            SaharaMemoryRead64Packet req;
            std::memcpy(&req, data.constData(), sizeof(req));
            push(memoryAt(req.address, req.length));
            break;
        }
        case SaharaCommand::Reset: {
            SaharaPacketHeader resp;
            resp.command = static_cast<uint32_t>(SaharaCommand::ResetResponse);
            resp.length = sizeof(resp);
            pushPacket(resp);
            break;
        }
        default:
            break;
        }
        return data.size();
    }

    static uint8_t memoryByte(uint64_t address) { return static_cast<uint8_t>((address ^ (address >> 8)) & 0xFF); }

private:
    template <typename T>
    void pushPacket(const T& pkt) { push(QByteArray(reinterpret_cast<const char*>(&pkt), sizeof(pkt))); }

    void pushHello(SaharaMode mode)
    {
        SaharaHelloPacket hello{};
        hello.header.command = static_cast<uint32_t>(SaharaCommand::Hello);
        hello.header.length = sizeof(hello);
        hello.version = version;
        hello.versionMin = versionMin;
        hello.maxCmdLen = 0x1000;
        hello.mode = static_cast<uint32_t>(mode);
        pushPacket(hello);
    }

    void nextRead()
    {
        if (m_readIndex >= reads.size()) {
            SaharaEndImageTransferPacket end{};
            end.header.command = static_cast<uint32_t>(SaharaCommand::EndImageTransfer);
            end.header.length = sizeof(end);
            end.imageId = 13;
            end.status = endStatus;
            pushPacket(end);
            return;
        }

        const auto r = reads.at(m_readIndex++);
        m_serving = true;
        m_servingOffset = r.first;
        if (use64BitReads) {
            SaharaReadData64Packet req{};
            req.header.command = static_cast<uint32_t>(SaharaCommand::ReadData64);
            req.header.length = sizeof(req);
            req.imageId = 13;
            req.offset = r.first;
            req.length = r.second;
            pushPacket(req);
        } else {
            SaharaReadDataPacket req{};
            req.header.command = static_cast<uint32_t>(SaharaCommand::ReadData);
            req.header.length = sizeof(req);
            req.imageId = 13;
            req.offset = static_cast<uint32_t>(r.first);
            req.length = static_cast<uint32_t>(r.second);
            pushPacket(req);
        }
    }

    QByteArray table() const
    {
        QByteArray out;
        for (const auto& r : regions) {
            if (use64BitMemory) {
                SaharaMemoryTableEntry64 e{};
                e.base = r.base;
                e.length = r.length;
                std::memcpy(e.description, r.description.constData(), qMin<size_t>(r.description.size(), 20));
                std::memcpy(e.filename, r.filename.constData(), qMin<size_t>(r.filename.size(), 20));
                out.append(reinterpret_cast<const char*>(&e), sizeof(e));
            } else {
                SaharaMemoryTableEntry e{};
                e.base = static_cast<uint32_t>(r.base);
                e.length = static_cast<uint32_t>(r.length);
                std::memcpy(e.description, r.description.constData(), qMin<size_t>(r.description.size(), 20));
                std::memcpy(e.filename, r.filename.constData(), qMin<size_t>(r.filename.size(), 20));
                out.append(reinterpret_cast<const char*>(&e), sizeof(e));
            }
        }
        return out;
    }

    void pushMemoryDebug()
    {
        const QByteArray t = table();
        if (use64BitMemory) {
            SaharaMemoryDebug64Packet dbg{};
            dbg.header.command = static_cast<uint32_t>(SaharaCommand::MemoryDebug64);
            dbg.header.length = sizeof(dbg);
            dbg.tableAddress = tableAddress;
            dbg.tableLength = static_cast<uint64_t>(t.size());
            pushPacket(dbg);
        } else {
            SaharaMemoryDebugPacket dbg{};
            dbg.header.command = static_cast<uint32_t>(SaharaCommand::MemoryDebug);
            dbg.header.length = sizeof(dbg);
            dbg.tableAddress = static_cast<uint32_t>(tableAddress);
            dbg.tableLength = static_cast<uint32_t>(t.size());
            pushPacket(dbg);
        }
    }

    QByteArray memoryAt(uint64_t address, uint64_t length) const
    {
        if (address == tableAddress)
            return table();
        QByteArray out(static_cast<int>(length), '\0');
        for (uint64_t i = 0; i < length; i++)
            out[static_cast<int>(i)] = static_cast<char>(memoryByte(address + i));
        return out;
    }

    bool m_serving = false;
    uint64_t m_servingOffset = 0;
    int m_readIndex = 0;
    QByteArray m_execData;
};

// Collects dumped regions in memory
class RecordingSink : public IDumpSink {
public:
    QList<SaharaMemoryRegion> regions;
    QList<QByteArray> contents;
    bool failBegin = false;

    bool beginRegion(const SaharaMemoryRegion& region) override
    {
        if (failBegin)
            return false;
        regions.append(region);
        contents.append(QByteArray());
        return true;
    }
    bool writeChunk(const QByteArray& data) override
    {
        contents.last().append(data);
        return true;
    }
    bool endRegion() override { return true; }
};

static QByteArray loaderImage(int size)
{
    QByteArray out(size, '\0');
    for (int i = 0; i < size; i++)
        out[i] = static_cast<char>((i * 31) & 0xFF);
    return out;
}

class TestSahara : public QObject {
    Q_OBJECT

private slots:
    void initTestCase()
    {
        Logger::instance().setConsoleEnabled(false);
    }

    void packetLengths()
    {
        QCOMPARE(SaharaClient::expectedLength(0x01), 0x30u);
        QCOMPARE(SaharaClient::expectedLength(0x03), 0x14u);
        QCOMPARE(SaharaClient::expectedLength(0x04), 0x10u);
        QCOMPARE(SaharaClient::expectedLength(0x06), 0x0Cu);
        QCOMPARE(SaharaClient::expectedLength(0x09), 0x10u);
        QCOMPARE(SaharaClient::expectedLength(0x10), 0x18u);
        QCOMPARE(SaharaClient::expectedLength(0x12), 0x20u);
        QCOMPARE(SaharaClient::expectedLength(0x99), 0u);
        QCOMPARE(sizeof(SaharaMemoryTableEntry), size_t(52));
        QCOMPARE(sizeof(SaharaMemoryTableEntry64), size_t(64));
    }

    void helloVersionCappedAtOurs_data()
    {
        QTest::addColumn<uint>("deviceVersion");
        QTest::addColumn<uint>("deviceMin");
        QTest::addColumn<uint>("answered");
        QTest::addColumn<uint>("answeredMin");
        QTest::newRow("newer device") << 3u << 1u << 2u << 1u;
        QTest::newRow("same") << 2u << 1u << 2u << 1u;
        QTest::newRow("older device") << 1u << 1u << 1u << 1u;
    }

    void helloVersionCappedAtOurs()
    {
        QFETCH(uint, deviceVersion);
        QFETCH(uint, deviceMin);
        QFETCH(uint, answered);
        QFETCH(uint, answeredMin);

        FakeSaharaDevice dev;
        dev.version = deviceVersion;
        dev.versionMin = deviceMin;
        dev.reads = {{0, 64}};
        dev.powerOn();

        SaharaClient client(&dev);
        client.setReadDeviceInfo(false);
        QVERIFY(client.uploadLoader(loaderImage(64)));
        QCOMPARE(dev.helloResponseVersions.size(), 1);
        QCOMPARE(dev.helloResponseVersions.first().first, static_cast<uint32_t>(answered));
        QCOMPARE(dev.helloResponseVersions.first().second, static_cast<uint32_t>(answeredMin));
    }

    void servesReadsInAnyOrder_data()
    {
        QTest::addColumn<bool>("wide");
        QTest::newRow("64-bit") << true;
        QTest::newRow("32-bit") << false;
    }

    void servesReadsInAnyOrder()
    {
        QFETCH(bool, wide);

        FakeSaharaDevice dev;
        dev.use64BitReads = wide;
        dev.reads = {{500, 200}, {0, 300}, {100, 400}, {999, 1}};
        dev.powerOn();

        const QByteArray image = loaderImage(1000);
        SaharaClient client(&dev);
        client.setReadDeviceInfo(false);
        QVERIFY(client.uploadLoader(image));
        QCOMPARE(client.state(), SaharaState::Complete);

        QCOMPARE(dev.served.size(), 4);
        for (const auto& s : dev.served)
            QCOMPARE(s.second, image.mid(static_cast<int>(s.first), s.second.size()));
        QCOMPARE(dev.served.at(2).second.size(), 400);
        QCOMPARE(dev.doneCount, 1);
        QCOMPARE(dev.helloResponseModes, QList<uint32_t>({0u}));
    }

    void readsDeviceInfoInCommandMode()
    {
        FakeSaharaDevice dev;
        dev.acceptCommandMode = true;
        dev.reads = {{0, 64}};
        const QByteArray hash = QByteArray::fromHex(QByteArray(96, 'a'));
        dev.pkHash = hash + hash;
        dev.powerOn();

        SaharaClient client(&dev);
        QVERIFY(client.uploadLoader(loaderImage(64)));

        const SaharaDeviceInfo info = client.deviceInfo();
        QVERIFY(info.chipInfoRead);
        QCOMPARE(info.serial, 0x12345678u);
        QCOMPARE(info.serialHex, QString("0x12345678"));
        QCOMPARE(info.pkHash, hash);
        QCOMPARE(info.saharaVersion, 2u);
        QCOMPARE(dev.helloResponseModes, QList<uint32_t>({3u, 0u}));
    }

    void continuesWhenCommandModeDeclined()
    {
        FakeSaharaDevice dev;
        dev.reads = {{0, 128}};
        dev.powerOn();

        SaharaClient client(&dev);
        client.setReadDeviceInfo(true);
        QVERIFY(client.uploadLoader(loaderImage(128)));
        QVERIFY(!client.deviceInfo().chipInfoRead);
        QCOMPARE(dev.served.size(), 1);
    }

    void servesFurtherImagesAfterDoneResponse()
    {
        FakeSaharaDevice dev;
        dev.reads = {{0, 100}, {100, 100}};
        dev.extraImages = 1;
        dev.powerOn();

        SaharaClient client(&dev);
        client.setReadDeviceInfo(false);
        QVERIFY(client.uploadLoader(loaderImage(200)));
        QCOMPARE(dev.served.size(), 4);
        QCOMPARE(dev.doneCount, 2);
        QCOMPARE(client.state(), SaharaState::Complete);
    }

    void skipHelloAnswersBlindly()
    {
        FakeSaharaDevice dev;
        dev.reads = {{0, 32}};

        SaharaClient client(&dev);
        client.setSkipHello(true);
        client.setReadDeviceInfo(false);
        QVERIFY(client.uploadLoader(loaderImage(32)));
        QCOMPARE(dev.helloResponseModes.size(), 1);
    }

    void outOfBoundsReadFails()
    {
        FakeSaharaDevice dev;
        dev.reads = {{900, 200}};
        dev.powerOn();

        SaharaClient client(&dev);
        client.setReadDeviceInfo(false);
        QVERIFY(!client.uploadLoader(loaderImage(1000)));
        QCOMPARE(client.lastError().kind, EdlErrorKind::SaharaProtocol);
        QCOMPARE(client.state(), SaharaState::Errored);
        QVERIFY(dev.served.isEmpty());
    }

    void rejectedImageFails()
    {
        FakeSaharaDevice dev;
        dev.reads = {{0, 16}};
        dev.endStatus = 0x13;
        dev.powerOn();

        SaharaClient client(&dev);
        client.setReadDeviceInfo(false);
        QVERIFY(!client.uploadLoader(loaderImage(16)));
        QCOMPARE(client.lastError().kind, EdlErrorKind::SaharaProtocol);
        QCOMPARE(dev.doneCount, 0);
    }

    void lengthMismatchFails()
    {
        MockTransport mock;
        SaharaHelloPacket hello{};
        hello.header.command = static_cast<uint32_t>(SaharaCommand::Hello);
        hello.header.length = sizeof(hello) + 4;
        QByteArray raw(reinterpret_cast<const char*>(&hello), sizeof(hello));
        raw.append(QByteArray(4, '\0'));
        mock.push(raw);

        SaharaClient client(&mock);
        QVERIFY(!client.uploadLoader(loaderImage(16)));
        QCOMPARE(client.lastError().kind, EdlErrorKind::SaharaProtocol);
        QVERIFY(client.lastError().message.contains("expected 48"));
    }

    void unknownCommandFails()
    {
        MockTransport mock;
        SaharaPacketHeader hdr;
        hdr.command = 0x99;
        hdr.length = sizeof(hdr);
        mock.push(QByteArray(reinterpret_cast<const char*>(&hdr), sizeof(hdr)));

        SaharaClient client(&mock);
        QVERIFY(!client.uploadLoader(loaderImage(16)));
        QCOMPARE(client.lastError().kind, EdlErrorKind::SaharaProtocol);
        QCOMPARE(client.state(), SaharaState::Errored);
    }

    void helloTimeoutIsTransportError()
    {
        MockTransport mock;
        SaharaClient client(&mock);
        QVERIFY(!client.uploadLoader(loaderImage(16)));
        QCOMPARE(client.lastError().kind, EdlErrorKind::Transport);
    }

    void emptyLoaderRefused()
    {
        FakeSaharaDevice dev;
        dev.powerOn();
        SaharaClient client(&dev);
        QVERIFY(!client.uploadLoader(QByteArray()));
        QCOMPARE(client.lastError().kind, EdlErrorKind::UserConfig);
        QVERIFY(dev.writes.isEmpty());
    }

    void crashedDeviceRefusesUpload()
    {
        FakeSaharaDevice dev;
        dev.powerOn(SaharaMode::MemoryDebug);
        SaharaClient client(&dev);
        QVERIFY(!client.uploadLoader(loaderImage(16)));
        QCOMPARE(client.lastError().kind, EdlErrorKind::SaharaProtocol);
    }

    // ── Memory debug ─────────────────────────────────────────────────

    void memoryDump_data()
    {
        QTest::addColumn<bool>("wide");
        QTest::newRow("64-bit") << true;
        QTest::newRow("32-bit") << false;
    }

    void memoryDump()
    {
        QFETCH(bool, wide);

        FakeSaharaDevice dev;
        dev.use64BitMemory = wide;
        dev.regions = {
            {"DDR CS0", "DDRCS0.BIN", 0x80000000, 0x18000},
            {"OCIMEM", "OCIMEM.BIN", 0x14680000, 0x100},
        };
        dev.powerOn(SaharaMode::MemoryDebug);

        SaharaClient client(&dev);
        RecordingSink sink;
        QVERIFY(client.memoryDump({}, &sink));
        QCOMPARE(client.memoryTable().size(), 2);
        QCOMPARE(sink.regions.size(), 2);
        QCOMPARE(sink.regions.at(0).filename, QString("DDRCS0.BIN"));
        QCOMPARE(sink.regions.at(0).description, QString("DDR CS0"));
        QCOMPARE(sink.contents.at(0).size(), 0x18000);
        QCOMPARE(sink.contents.at(1).size(), 0x100);
        for (int i : {0, 0xFFFF, 0x10000, 0x17FFF})
            QCOMPARE(static_cast<uint8_t>(sink.contents.at(0).at(i)),
                     FakeSaharaDevice::memoryByte(0x80000000ULL + static_cast<uint64_t>(i)));
        QCOMPARE(client.state(), SaharaState::Complete);
    }

    void memoryDumpFiltersRegions()
    {
        FakeSaharaDevice dev;
        dev.regions = {
            {"DDR CS0", "DDRCS0.BIN", 0x80000000, 0x18000},
            {"OCIMEM", "OCIMEM.BIN", 0x14680000, 0x100},
        };
        dev.powerOn(SaharaMode::MemoryDebug);

        SaharaClient client(&dev);
        RecordingSink sink;
        QVERIFY(client.memoryDump({"OCIMEM.BIN", "MISSING.BIN"}, &sink));
        QCOMPARE(sink.regions.size(), 1);
        QCOMPARE(sink.regions.first().base, static_cast<uint64_t>(0x14680000));
        QCOMPARE(sink.contents.first().size(), 0x100);
    }

    void memoryDumpSinkFailureIsIo()
    {
        FakeSaharaDevice dev;
        dev.regions = {{"OCIMEM", "OCIMEM.BIN", 0x14680000, 0x100}};
        dev.powerOn(SaharaMode::MemoryDebug);

        SaharaClient client(&dev);
        RecordingSink sink;
        sink.failBegin = true;
        QVERIFY(!client.memoryDump({}, &sink));
        QCOMPARE(client.lastError().kind, EdlErrorKind::Io);
    }

    void dumpFileNames()
    {
        SaharaMemoryRegion r;
        r.base = 0x14680000;
        r.filename = QStringLiteral("OCIMEM.BIN");
        QCOMPARE(FileDumpSink::fileNameFor(r), QString("OCIMEM.BIN"));
        r.filename.clear();
        r.description = QStringLiteral("CODERAM");
        QCOMPARE(FileDumpSink::fileNameFor(r), QString("CODERAM.bin"));
        r.description = QStringLiteral("a/b");
        QCOMPARE(FileDumpSink::fileNameFor(r), QString("a_b.bin"));
        r.description.clear();
        QCOMPARE(FileDumpSink::fileNameFor(r), QString("region_14680000.bin"));
    }

    void sessionRamdumpWritesFiles()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());

        auto* dev = new FakeSaharaDevice;
        dev->use64BitMemory = false;
        dev->regions = {
            {"OCIMEM", "OCIMEM.BIN", 0x14680000, 0x100},
            {"CODERAM", "", 0x00220000, 0x40},
        };
        dev->powerOn(SaharaMode::MemoryDebug);

        SessionOptions options;
        EdlSession session(options, std::unique_ptr<ITransport>(dev));
        QVERIFY(session.ramdump({}, dir.path()));
        QVERIFY(session.finish(true));
        QVERIFY(!dev->isOpen());

        QFile ocimem(dir.filePath("OCIMEM.BIN"));
        QVERIFY(ocimem.open(QIODevice::ReadOnly));
        const QByteArray data = ocimem.readAll();
        QCOMPARE(data.size(), 0x100);
        QCOMPARE(static_cast<uint8_t>(data.at(0x42)), FakeSaharaDevice::memoryByte(0x14680042));
        QVERIFY(QFileInfo::exists(dir.filePath("CODERAM.bin")));
    }

    void resetIsAcknowledged()
    {
        FakeSaharaDevice dev;
        SaharaClient client(&dev);
        QVERIFY(client.sendReset());
    }
};

QTEST_GUILESS_MAIN(TestSahara)
#include "test_sahara.moc"
