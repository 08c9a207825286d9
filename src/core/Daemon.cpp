#include "core/Daemon.hpp"
#include "core/events/IEventSource.hpp"
#include "core/mitigation/IMuteActuator.hpp"
#include <boost/log/trivial.hpp>

namespace pwa {

Daemon::Daemon(IEventSource* source, IMuteActuator* actuator, IPlayerControl* players,
               const MitigationSettings& settings, QObject* parent)
    : QObject(parent)
    , source_(source)
    , actuator_(actuator)
    , detector_(registry_, session_)
    , orchestrator_(actuator, players, settings)
    , dispatcher_(registry_, detector_)
{
    connect(&detector_, &TransitionDetector::transitionDetected,
            &orchestrator_, &MitigationOrchestrator::onTransition);

    connect(source_, &IEventSource::batchReceived, this, &Daemon::onBatch);
    connect(source_, &IEventSource::started, this, []() {
        BOOST_LOG_TRIVIAL(info) << "[Daemon] event source started";
    });
    connect(source_, &IEventSource::finished, this, [this](const QString& reason) {
        fail(QStringLiteral("event source stopped: %1").arg(reason));
    });
    connect(actuator_, &IMuteActuator::finished, this, [this](const QString& reason) {
        fail(QStringLiteral("mute control stopped: %1").arg(reason));
    });
}

Daemon::~Daemon()
{
    stop();
}

bool Daemon::start()
{
    BOOST_LOG_TRIVIAL(info) << "[Daemon] starting mute control";
    if (!actuator_->start()) {
        BOOST_LOG_TRIVIAL(fatal) << "[Daemon] mute control could not be started";
        return false;
    }
    BOOST_LOG_TRIVIAL(info) << "[Daemon] mute control started";

    BOOST_LOG_TRIVIAL(info) << "[Daemon] starting event source";
    source_->start();
    return true;
}

void Daemon::stop()
{
    // Block first so intentional shutdown is not reported as a failure
    source_->blockSignals(true);
    actuator_->blockSignals(true);
    source_->stop();
    actuator_->stop();
    source_->blockSignals(false);
    actuator_->blockSignals(false);
}

void Daemon::onBatch(const QByteArray& batch)
{
    if (failed_)
        return;
    if (!dispatcher_.dispatchBatch(batch))
        fail(QStringLiteral("unparseable event batch"));
}

void Daemon::fail(const QString& reason)
{
    if (failed_)
        return;
    failed_ = true;
    BOOST_LOG_TRIVIAL(fatal) << "[Daemon] " << reason.toStdString();
    emit fatal(reason);
}

} // namespace pwa
