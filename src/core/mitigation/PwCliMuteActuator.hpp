#pragma once

#include "IMuteActuator.hpp"
#include <QMutex>
#include <QProcess>
#include <QStringList>

namespace pwa {

/// Mutes nodes through a long-lived `pw-cli` process by writing
/// `set-param <id> Props { channelVolumes: [...] }` lines to its stdin.
class PwCliMuteActuator : public IMuteActuator {
    Q_OBJECT
public:
    explicit PwCliMuteActuator(const QString& program = QStringLiteral("pw-cli"),
                               const QStringList& arguments = {},
                               QObject* parent = nullptr);
    ~PwCliMuteActuator() override;

    bool start() override;
    void stop() override;
    bool isReady() const override;
    void setMuted(int nodeId, bool muted) override;

    static QByteArray formatCommand(int nodeId, bool muted);

private:
    void onProcessFinished(int exitCode, QProcess::ExitStatus status);
    void writeCommand(int nodeId, bool muted);

    QProcess* process_ = nullptr;
    QString program_;
    QStringList arguments_;
    QMutex writeMutex_;
    bool stopping_ = false;
};

} // namespace pwa
