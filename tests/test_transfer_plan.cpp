#include <QtTest>

#include "fake_firehose_device.h"
#include "core/logger.h"
#include "qualcomm/protocol/transfer_coordinator.h"

#include <atomic>

using namespace qedl;

static QByteArray pattern(int size)
{
    QByteArray out(size, '\0');
    for (int i = 0; i < size; i++)
        out[i] = static_cast<char>((i * 13 + i / 4096) & 0xFF);
    return out;
}

static ChunkSource sourceOf(const QByteArray& data)
{
    return [data](qint64 offset, qint64 length, QByteArray& out) {
        out = data.mid(static_cast<int>(offset), static_cast<int>(length));
        return true;
    };
}

class TestTransferPlan : public QObject {
    Q_OBJECT

private:
    struct Rig {
        FakeFirehoseDevice dev;
        FirehoseClient client{&dev};
        TransferCoordinator coordinator{&client};
        QList<qint64> progress;

        bool start(uint32_t payload, bool hashPackets = false)
        {
            dev.maxPayload = payload;
            dev.maxPayloadSupported = payload;
            coordinator.setHashPackets(hashPackets);
            QObject::connect(&coordinator, &TransferCoordinator::progress,
                             [this](qint64 done, qint64) { progress.append(done); });
            FirehoseConfigureRequest req;
            req.hashPackets = hashPackets;
            return client.drainWelcomeLogs(0) && client.configure(req);
        }
    };

private slots:
    void initTestCase()
    {
        Logger::instance().setConsoleEnabled(false);
    }

    // ── Plan ─────────────────────────────────────────────────────────

    void planCoversRange_data()
    {
        QTest::addColumn<qint64>("total");
        QTest::addColumn<qint64>("maxChunk");
        QTest::addColumn<int>("count");
        QTest::addColumn<qint64>("lastLength");

        QTest::newRow("empty") << qint64(0) << qint64(65536) << 0 << qint64(0);
        QTest::newRow("one short") << qint64(4096) << qint64(65536) << 1 << qint64(4096);
        QTest::newRow("exact") << qint64(131072) << qint64(65536) << 2 << qint64(65536);
        QTest::newRow("tail") << qint64(204800) << qint64(65536) << 4 << qint64(8192);
        QTest::newRow("512 sectors") << qint64(1536) << qint64(1024) << 2 << qint64(512);
    }

    void planCoversRange()
    {
        QFETCH(qint64, total);
        QFETCH(qint64, maxChunk);
        QFETCH(int, count);
        QFETCH(qint64, lastLength);

        const TransferPlan plan = TransferPlan::build(total, maxChunk);
        QCOMPARE(plan.size(), count);
        QCOMPARE(plan.totalLength(), total);
        QCOMPARE(plan.isEmpty(), count == 0);

        qint64 expected = 0;
        for (int i = 0; i < plan.size(); i++) {
            const TransferChunk& c = plan.chunks().at(i);
            QCOMPARE(c.offset, expected);
            QVERIFY(c.length > 0);
            QVERIFY(c.length <= maxChunk);
            if (i + 1 < plan.size())
                QCOMPARE(c.length, maxChunk);
            expected += c.length;
        }
        QCOMPARE(expected, total);
        if (count > 0)
            QCOMPARE(plan.chunks().last().length, lastLength);
    }

    // ── Coordinator ──────────────────────────────────────────────────

    void chunkSizeIsWholeSectors()
    {
        Rig rig;
        QVERIFY(rig.start(65536 + 1000));
        QCOMPARE(rig.coordinator.chunkSize(), qint64(65536));
    }

    void writeSplitsIntoPayloadChunks()
    {
        Rig rig;
        QVERIFY(rig.start(65536));
        const QByteArray image = pattern(50 * 4096);

        QVERIFY(rig.coordinator.write(SectorRange::at(0, 10, 50), sourceOf(image)));
        QCOMPARE(rig.dev.count("program"), 1);
        QCOMPARE(rig.dev.programChunkSizes, QList<int>({65536, 65536, 65536, 8192}));
        QCOMPARE(rig.dev.lunData(0).mid(10 * 4096, image.size()), image);
        QCOMPARE(rig.progress.last(), qint64(image.size()));
        QCOMPARE(rig.client.state(), FirehoseState::Idle);
    }

    void shortSourceIsZeroPadded()
    {
        Rig rig;
        QVERIFY(rig.start(65536));
        rig.dev.setLunData(0, QByteArray(4 * 4096, '\x55'));

        QVERIFY(rig.coordinator.write(SectorRange::at(0, 1, 2), sourceOf(pattern(5000))));
        const QByteArray written = rig.dev.lunData(0).mid(4096, 2 * 4096);
        QCOMPARE(written.left(5000), pattern(5000));
        QCOMPARE(written.mid(5000), QByteArray(2 * 4096 - 5000, '\0'));
    }

    void hashPacketsProgramPerChunk()
    {
        Rig rig;
        QVERIFY(rig.start(65536, true));
        const QByteArray image = pattern(40 * 4096);

        QVERIFY(rig.coordinator.write(SectorRange::at(0, 0, 40), sourceOf(image)));
        QCOMPARE(rig.dev.count("program"), 3);
        QCOMPARE(rig.dev.digestsReceived, 3);
        QCOMPARE(rig.dev.commands.at(2).attrs.value("start_sector"), QString("16"));
        QCOMPARE(rig.dev.lunData(0).left(image.size()), image);
    }

    void rejectedDigestRetriedOnce()
    {
        Rig rig;
        QVERIFY(rig.start(65536, true));
        rig.dev.rejectDigests = 1;
        const QByteArray image = pattern(20 * 4096);

        QVERIFY(rig.coordinator.write(SectorRange::at(0, 0, 20), sourceOf(image)));
        QCOMPARE(rig.dev.count("program"), 3);
        QCOMPARE(rig.dev.lunData(0).left(image.size()), image);
    }

    void persistentDigestFailureIsVerification()
    {
        Rig rig;
        QVERIFY(rig.start(65536, true));
        rig.dev.rejectDigests = 2;

        QVERIFY(!rig.coordinator.write(SectorRange::at(0, 0, 20), sourceOf(pattern(20 * 4096))));
        QCOMPARE(rig.coordinator.lastError().kind, EdlErrorKind::Verification);
        QCOMPARE(rig.dev.count("program"), 2);
    }

    void readBackVerifiesExpressionRange()
    {
        Rig rig;
        QVERIFY(rig.start(65536));
        rig.coordinator.setReadBackVerify(true);
        const QByteArray image = pattern(5 * 4096);

        SectorRange range;
        range.startSector = QStringLiteral("NUM_DISK_SECTORS-5.");
        range.numSectors = 5;
        QVERIFY(rig.coordinator.write(range, sourceOf(image)));
        QCOMPARE(rig.dev.tags().filter("program").size(), 1);
        QCOMPARE(rig.dev.count("read"), 1);
        QCOMPARE(rig.dev.lunData(0).mid(static_cast<int>((rig.dev.diskSectors - 5) * 4096)), image);
    }

    void cancelledBeforeFirstChunk()
    {
        Rig rig;
        QVERIFY(rig.start(65536));
        std::atomic_bool cancel(true);
        rig.coordinator.setCancelFlag(&cancel);

        QVERIFY(!rig.coordinator.write(SectorRange::at(0, 0, 4), sourceOf(pattern(4 * 4096))));
        QCOMPARE(rig.coordinator.lastError().kind, EdlErrorKind::Interrupted);
        QCOMPARE(rig.dev.count("program"), 0);

        QByteArray got;
        QVERIFY(!rig.coordinator.read(SectorRange::at(0, 0, 4), [&got](const QByteArray& d) {
            got += d;
            return true;
        }));
        QCOMPARE(rig.coordinator.lastError().kind, EdlErrorKind::Interrupted);
        QCOMPARE(rig.dev.count("read"), 0);
    }

    void readTruncatesToKeptBytes()
    {
        Rig rig;
        QVERIFY(rig.start(8192));
        const QByteArray lun = pattern(16 * 4096);
        rig.dev.setLunData(0, lun);

        QList<int> sizes;
        QByteArray got;
        QVERIFY(rig.coordinator.read(SectorRange::at(0, 2, 5), [&](const QByteArray& d) {
            sizes.append(d.size());
            got += d;
            return true;
        }, 10000));
        QCOMPARE(got, lun.mid(2 * 4096, 10000));
        QCOMPARE(sizes, QList<int>({8192, 1808}));
        QCOMPARE(rig.progress, QList<qint64>({8192, 16384, 20480}));
        QCOMPARE(rig.client.state(), FirehoseState::Idle);
    }

    void sinkFailureIsIo()
    {
        Rig rig;
        QVERIFY(rig.start(65536));
        QVERIFY(!rig.coordinator.read(SectorRange::at(0, 0, 2), [](const QByteArray&) { return false; }));
        QCOMPARE(rig.coordinator.lastError().kind, EdlErrorKind::Io);
    }
};

QTEST_GUILESS_MAIN(TestTransferPlan)
#include "test_transfer_plan.moc"
