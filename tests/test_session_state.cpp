#include <QTest>
#include "core/detect/SessionState.hpp"

class TestSessionState : public QObject {
    Q_OBJECT

private slots:
    void startsEmpty()
    {
        pwa::SessionState state;
        QVERIFY(state.defaultSink().isEmpty());
        QVERIFY(!state.userInitiated());
    }

    void firstAdoptionReportsNoPrevious()
    {
        pwa::SessionState state;
        auto change = state.adoptDefaultSink("sink.headset");

        QVERIFY(change.previousSink.isEmpty());
        QVERIFY(!change.userInitiated);
        QCOMPARE(state.defaultSink(), QString("sink.headset"));
    }

    void adoptionReturnsPreviousSink()
    {
        pwa::SessionState state;
        state.adoptDefaultSink("sink.headset");
        auto change = state.adoptDefaultSink("sink.hdmi");

        QCOMPARE(change.previousSink, QString("sink.headset"));
        QCOMPARE(state.defaultSink(), QString("sink.hdmi"));
    }

    void userFlagIsConsumedByNextAdoption()
    {
        pwa::SessionState state;
        state.adoptDefaultSink("sink.headset");
        state.markUserInitiated();
        QVERIFY(state.userInitiated());

        auto change = state.adoptDefaultSink("sink.hdmi");
        QVERIFY(change.userInitiated);
        QVERIFY(!state.userInitiated());

        change = state.adoptDefaultSink("sink.headset");
        QVERIFY(!change.userInitiated);
    }
};

QTEST_MAIN(TestSessionState)
#include "test_session_state.moc"
