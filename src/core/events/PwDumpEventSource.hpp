#pragma once

#include "IEventSource.hpp"
#include "JsonBatchFramer.hpp"
#include <QProcess>
#include <QStringList>

namespace pwa {

/// Runs `pw-dump --monitor --no-colors` and emits every JSON array it
/// prints as one batch.
class PwDumpEventSource : public IEventSource {
    Q_OBJECT
public:
    explicit PwDumpEventSource(const QString& program = QStringLiteral("pw-dump"),
                               const QStringList& arguments = {QStringLiteral("--monitor"),
                                                               QStringLiteral("--no-colors")},
                               QObject* parent = nullptr);
    ~PwDumpEventSource() override;

    void start() override;
    void stop() override;
    bool isRunning() const override;

private:
    void onStarted();
    void onReadyRead();
    void onStandardError();
    void onErrorOccurred(QProcess::ProcessError error);
    void onProcessFinished(int exitCode, QProcess::ExitStatus status);
    void onFramingError(const QString& message);
    void finish(const QString& reason);

    QProcess* process_ = nullptr;
    JsonBatchFramer framer_;
    QString program_;
    QStringList arguments_;
    bool stopping_ = false;
    bool finished_ = false;
};

} // namespace pwa
