#include <QTest>
#include <QSignalSpy>
#include <QJsonDocument>
#include "core/events/PwDumpEventSource.hpp"

// Drives the source with ordinary shell tools standing in for pw-dump.
class TestPwDumpEventSource : public QObject {
    Q_OBJECT

private slots:
    void framesMonitorOutput()
    {
        pwa::PwDumpEventSource source("cat", {QStringLiteral(TEST_DATA_DIR "/pw-dump-monitor.txt")});
        QSignalSpy started(&source, &pwa::IEventSource::started);
        QSignalSpy batches(&source, &pwa::IEventSource::batchReceived);
        QSignalSpy finished(&source, &pwa::IEventSource::finished);

        source.start();

        QTRY_COMPARE(finished.count(), 1);
        QCOMPARE(started.count(), 1);
        QCOMPARE(batches.count(), 3);
        for (const auto& args : batches)
            QVERIFY(QJsonDocument::fromJson(args.first().toByteArray()).isArray());
        QVERIFY(finished.first().first().toString().contains("exited with code 0"));
    }

    void missingProgramFinishesOnce()
    {
        pwa::PwDumpEventSource source("/nonexistent/pw-dump", {});
        QSignalSpy finished(&source, &pwa::IEventSource::finished);

        source.start();

        QTRY_COMPARE(finished.count(), 1);
        QVERIFY(finished.first().first().toString().startsWith("failed to start"));
        QTest::qWait(50);
        QCOMPARE(finished.count(), 1);
    }

    void unexpectedExitIsReported()
    {
        pwa::PwDumpEventSource source("/bin/sh", {"-c", "printf '[1]\\n[2'; exit 3"});
        QSignalSpy batches(&source, &pwa::IEventSource::batchReceived);
        QSignalSpy finished(&source, &pwa::IEventSource::finished);

        source.start();

        QTRY_COMPARE(finished.count(), 1);
        QCOMPARE(batches.count(), 1);
        QVERIFY(finished.first().first().toString().contains("exited with code 3"));
        QVERIFY(!source.isRunning());
    }

    void garbageOnStdoutBreaksTheStream()
    {
        pwa::PwDumpEventSource source("/bin/sh", {"-c", "printf 'oops\\n'; sleep 10"});
        QSignalSpy finished(&source, &pwa::IEventSource::finished);

        source.start();

        QTRY_COMPARE(finished.count(), 1);
        QVERIFY(finished.first().first().toString().startsWith("event stream broken"));
        QTRY_VERIFY(!source.isRunning());
    }

    void stopDoesNotReportExit()
    {
        pwa::PwDumpEventSource source("/bin/sh", {"-c", "sleep 10"});
        QSignalSpy started(&source, &pwa::IEventSource::started);
        QSignalSpy finished(&source, &pwa::IEventSource::finished);

        source.start();
        QTRY_COMPARE(started.count(), 1);
        QVERIFY(source.isRunning());

        source.stop();
        QTest::qWait(50);
        QVERIFY(!source.isRunning());
        QCOMPARE(finished.count(), 0);
    }
};

QTEST_MAIN(TestPwDumpEventSource)
#include "test_pw_dump_event_source.moc"
