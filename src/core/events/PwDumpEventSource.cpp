#include "PwDumpEventSource.hpp"
#include <boost/log/trivial.hpp>

namespace pwa {

PwDumpEventSource::PwDumpEventSource(const QString& program, const QStringList& arguments,
                                     QObject* parent)
    : IEventSource(parent)
    , process_(new QProcess(this))
    , program_(program)
    , arguments_(arguments)
{
    connect(process_, &QProcess::started, this, &PwDumpEventSource::onStarted);
    connect(process_, &QProcess::readyReadStandardOutput, this, &PwDumpEventSource::onReadyRead);
    connect(process_, &QProcess::readyReadStandardError, this, &PwDumpEventSource::onStandardError);
    connect(process_, &QProcess::errorOccurred, this, &PwDumpEventSource::onErrorOccurred);
    connect(process_, &QProcess::finished, this, &PwDumpEventSource::onProcessFinished);

    connect(&framer_, &JsonBatchFramer::batchFramed, this, &IEventSource::batchReceived);
    connect(&framer_, &JsonBatchFramer::framingError, this, &PwDumpEventSource::onFramingError);
}

PwDumpEventSource::~PwDumpEventSource()
{
    stop();
}

void PwDumpEventSource::start()
{
    if (process_->state() != QProcess::NotRunning)
        return;

    stopping_ = false;
    finished_ = false;
    framer_.reset();

    BOOST_LOG_TRIVIAL(info) << "[PwDumpEventSource] starting monitor process "
                            << program_.toStdString() << " "
                            << arguments_.join(QLatin1Char(' ')).toStdString();
    process_->start(program_, arguments_);
}

void PwDumpEventSource::stop()
{
    if (process_->state() == QProcess::NotRunning)
        return;

    stopping_ = true;
    process_->terminate();
    if (!process_->waitForFinished(1000)) {
        process_->kill();
        process_->waitForFinished(1000);
    }
}

bool PwDumpEventSource::isRunning() const
{
    return process_->state() == QProcess::Running;
}

void PwDumpEventSource::onStarted()
{
    BOOST_LOG_TRIVIAL(info) << "[PwDumpEventSource] monitor process running, pid "
                            << process_->processId() << ", listening for events";
    emit started();
}

void PwDumpEventSource::onReadyRead()
{
    framer_.onData(process_->readAllStandardOutput());
}

void PwDumpEventSource::onStandardError()
{
    const QByteArray text = process_->readAllStandardError().trimmed();
    if (!text.isEmpty())
        BOOST_LOG_TRIVIAL(warning) << "[PwDumpEventSource] " << text.toStdString();
}

void PwDumpEventSource::onErrorOccurred(QProcess::ProcessError error)
{
    if (error != QProcess::FailedToStart)
        return;
    finish(QStringLiteral("failed to start %1: %2").arg(program_, process_->errorString()));
}

void PwDumpEventSource::onProcessFinished(int exitCode, QProcess::ExitStatus status)
{
    if (stopping_)
        return;

    // Drain whatever is still buffered before reporting the exit
    framer_.onData(process_->readAllStandardOutput());

    if (status == QProcess::CrashExit)
        finish(QStringLiteral("%1 crashed").arg(program_));
    else
        finish(QStringLiteral("%1 exited with code %2").arg(program_).arg(exitCode));
}

void PwDumpEventSource::onFramingError(const QString& message)
{
    finish(QStringLiteral("event stream broken: %1").arg(message));
    stop();
}

void PwDumpEventSource::finish(const QString& reason)
{
    if (finished_)
        return;
    finished_ = true;
    BOOST_LOG_TRIVIAL(warning) << "[PwDumpEventSource] " << reason.toStdString();
    emit finished(reason);
}

} // namespace pwa
