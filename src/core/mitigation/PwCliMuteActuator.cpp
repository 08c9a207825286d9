#include "PwCliMuteActuator.hpp"
#include <QThread>
#include <boost/log/trivial.hpp>

namespace pwa {

PwCliMuteActuator::PwCliMuteActuator(const QString& program, const QStringList& arguments,
                                     QObject* parent)
    : IMuteActuator(parent)
    , process_(new QProcess(this))
    , program_(program)
    , arguments_(arguments)
{
    process_->setProcessChannelMode(QProcess::ForwardedErrorChannel);
    process_->setStandardOutputFile(QProcess::nullDevice());
    connect(process_, &QProcess::finished, this, &PwCliMuteActuator::onProcessFinished);
}

PwCliMuteActuator::~PwCliMuteActuator()
{
    stop();
}

bool PwCliMuteActuator::start()
{
    if (isReady())
        return true;

    BOOST_LOG_TRIVIAL(info) << "[PwCliMuteActuator] starting control process "
                            << program_.toStdString();
    stopping_ = false;
    process_->start(program_, arguments_);
    if (!process_->waitForStarted(3000)) {
        BOOST_LOG_TRIVIAL(error) << "[PwCliMuteActuator] failed to start "
                                 << program_.toStdString() << ": "
                                 << process_->errorString().toStdString();
        return false;
    }

    BOOST_LOG_TRIVIAL(info) << "[PwCliMuteActuator] control process running, pid "
                            << process_->processId();
    emit started();
    return true;
}

void PwCliMuteActuator::stop()
{
    if (process_->state() == QProcess::NotRunning)
        return;

    stopping_ = true;
    process_->closeWriteChannel();
    if (!process_->waitForFinished(1000)) {
        process_->kill();
        process_->waitForFinished(1000);
    }
}

bool PwCliMuteActuator::isReady() const
{
    return process_->state() == QProcess::Running;
}

void PwCliMuteActuator::setMuted(int nodeId, bool muted)
{
    // QProcess may only be touched from its own thread
    if (QThread::currentThread() != thread()) {
        QMetaObject::invokeMethod(this, [this, nodeId, muted]() {
            writeCommand(nodeId, muted);
        }, Qt::QueuedConnection);
        return;
    }
    writeCommand(nodeId, muted);
}

QByteArray PwCliMuteActuator::formatCommand(int nodeId, bool muted)
{
    const char* volumes = muted ? "[0.0, 0.0]" : "[1.0, 1.0]";
    return QStringLiteral("set-param %1 Props { channelVolumes: %2 }\n")
        .arg(nodeId)
        .arg(QLatin1String(volumes))
        .toUtf8();
}

void PwCliMuteActuator::writeCommand(int nodeId, bool muted)
{
    if (!isReady()) {
        BOOST_LOG_TRIVIAL(warning) << "[PwCliMuteActuator] control process not ready, dropping "
                                   << (muted ? "mute" : "unmute") << " for node " << nodeId;
        return;
    }

    const QByteArray command = formatCommand(nodeId, muted);

    QMutexLocker lock(&writeMutex_);
    if (process_->write(command) != command.size()) {
        BOOST_LOG_TRIVIAL(error) << "[PwCliMuteActuator] write to control process failed: "
                                 << process_->errorString().toStdString();
        return;
    }
    BOOST_LOG_TRIVIAL(info) << "[PwCliMuteActuator] " << (muted ? "muted" : "unmuted")
                            << " node " << nodeId;
}

void PwCliMuteActuator::onProcessFinished(int exitCode, QProcess::ExitStatus status)
{
    if (stopping_)
        return;

    const QString reason = status == QProcess::CrashExit
        ? QStringLiteral("%1 crashed").arg(program_)
        : QStringLiteral("%1 exited with code %2").arg(program_).arg(exitCode);
    BOOST_LOG_TRIVIAL(warning) << "[PwCliMuteActuator] " << reason.toStdString();
    emit finished(reason);
}

} // namespace pwa
