#include <QTest>
#include <QSignalSpy>
#include "core/mitigation/PauseBatch.hpp"

class TestPauseBatch : public QObject {
    Q_OBJECT

private:
    static pwa::PlayerPauseResult result(const QString& service, bool ok)
    {
        pwa::PlayerPauseResult r;
        r.service = service;
        r.ok = ok;
        if (!ok)
            r.error = QStringLiteral("NoReply");
        return r;
    }

private slots:
    void initTestCase()
    {
        qRegisterMetaType<pwa::PauseReport>();
    }

    void zeroPlayersCompletes()
    {
        pwa::PauseBatch batch;
        QSignalSpy spy(&batch, &pwa::PauseBatch::finished);

        batch.expectResults(0);

        QVERIFY(batch.isFinished());
        QCOMPARE(spy.count(), 0);   // never from inside the call
        QTRY_COMPARE(spy.count(), 1);
        QVERIFY(batch.report().results.isEmpty());
        QVERIFY(!batch.report().connectionError);
    }

    void completesWhenAllResultsArrive()
    {
        pwa::PauseBatch batch;
        QSignalSpy spy(&batch, &pwa::PauseBatch::finished);

        batch.expectResults(2);
        batch.addResult(result("org.mpris.MediaPlayer2.vlc", true));
        QVERIFY(!batch.isFinished());
        batch.addResult(result("org.mpris.MediaPlayer2.spotify", false));
        QVERIFY(batch.isFinished());

        QTRY_COMPARE(spy.count(), 1);
        const auto report = spy.first().first().value<pwa::PauseReport>();
        QCOMPARE(report.results.size(), 2);
        QCOMPARE(report.failures(), 1);
    }

    void resultsBeforeExpectationCount()
    {
        pwa::PauseBatch batch;
        batch.addResult(result("a", true));
        QVERIFY(!batch.isFinished());
        batch.expectResults(1);
        QVERIFY(batch.isFinished());
    }

    void failureFinishesOnce()
    {
        pwa::PauseBatch batch;
        QSignalSpy spy(&batch, &pwa::PauseBatch::finished);

        batch.fail("bus gone");
        batch.fail("again");
        batch.addResult(result("a", true));

        QTRY_COMPARE(spy.count(), 1);
        QTest::qWait(20);
        QCOMPARE(spy.count(), 1);
        QVERIFY(batch.report().connectionError);
        QCOMPARE(batch.report().error, QString("bus gone"));
        QVERIFY(batch.report().results.isEmpty());
    }
};

QTEST_MAIN(TestPauseBatch)
#include "test_pause_batch.moc"
