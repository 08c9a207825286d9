#include <QTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QFile>
#include "core/mitigation/PwCliMuteActuator.hpp"

class TestPwCliMuteActuator : public QObject {
    Q_OBJECT

private slots:
    void commandFormat()
    {
        QCOMPARE(pwa::PwCliMuteActuator::formatCommand(57, true),
                 QByteArray("set-param 57 Props { channelVolumes: [0.0, 0.0] }\n"));
        QCOMPARE(pwa::PwCliMuteActuator::formatCommand(57, false),
                 QByteArray("set-param 57 Props { channelVolumes: [1.0, 1.0] }\n"));
    }

    void setMutedBeforeStartIsDropped()
    {
        pwa::PwCliMuteActuator actuator("/bin/cat");
        QVERIFY(!actuator.isReady());
        actuator.setMuted(10, true);
        QVERIFY(!actuator.isReady());
    }

    void writesCommandsToControlProcess()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString out = dir.filePath("commands.txt");

        pwa::PwCliMuteActuator actuator("/bin/sh", {"-c", QStringLiteral("cat > '%1'").arg(out)});
        QSignalSpy started(&actuator, &pwa::IMuteActuator::started);
        QSignalSpy finished(&actuator, &pwa::IMuteActuator::finished);

        QVERIFY(actuator.start());
        QCOMPARE(started.count(), 1);
        QVERIFY(actuator.isReady());

        actuator.setMuted(10, true);
        actuator.setMuted(10, false);
        actuator.stop();

        QCOMPARE(finished.count(), 0);
        QFile file(out);
        QVERIFY(file.open(QIODevice::ReadOnly));
        QCOMPARE(file.readAll(), pwa::PwCliMuteActuator::formatCommand(10, true)
                                     + pwa::PwCliMuteActuator::formatCommand(10, false));
    }

    void startFailure()
    {
        pwa::PwCliMuteActuator actuator("/nonexistent/pw-cli");
        QSignalSpy started(&actuator, &pwa::IMuteActuator::started);
        QVERIFY(!actuator.start());
        QCOMPARE(started.count(), 0);
        QVERIFY(!actuator.isReady());
    }

    void unexpectedExitEmitsFinished()
    {
        pwa::PwCliMuteActuator actuator("/bin/sh", {"-c", "exit 2"});
        QSignalSpy finished(&actuator, &pwa::IMuteActuator::finished);

        QVERIFY(actuator.start());
        QTRY_COMPARE(finished.count(), 1);
        QVERIFY(finished.first().first().toString().contains("exited with code 2"));
    }
};

QTEST_MAIN(TestPwCliMuteActuator)
#include "test_pw_cli_mute_actuator.moc"
