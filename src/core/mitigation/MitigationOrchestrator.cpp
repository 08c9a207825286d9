#include "MitigationOrchestrator.hpp"
#include "IMuteActuator.hpp"
#include "PauseBatch.hpp"
#include <QTimer>
#include <boost/log/trivial.hpp>

namespace pwa {

// Owns the timers and the pause batch of one cycle; deleting it cancels
// every pending wait of that cycle.
class MitigationOrchestrator::Cycle : public QObject {
public:
    Cycle(quint64 cycleId, int node, QObject* parent)
        : QObject(parent), id(cycleId), nodeId(node) {}

    const quint64 id;
    const int nodeId;
    QTimer* deadline = nullptr;
    bool done = false;
};

const char* outcomeName(MitigationOutcome outcome)
{
    switch (outcome) {
    case MitigationOutcome::Completed: return "completed";
    case MitigationOutcome::TimedOut:  return "timed out";
    }
    return "unknown";
}

MitigationOrchestrator::MitigationOrchestrator(IMuteActuator* actuator, IPlayerControl* players,
                                               const MitigationSettings& settings,
                                               QObject* parent)
    : QObject(parent)
    , actuator_(actuator)
    , players_(players)
    , settings_(settings)
{
}

MitigationOrchestrator::~MitigationOrchestrator()
{
    // Cycles are children and go away with us; nothing is unmuted here.
    cycles_.clear();
}

int MitigationOrchestrator::targetNode(const Transition& transition) const
{
    if (transition.trigger == TransitionTrigger::DefaultSinkChange
        && settings_.muteTarget == MuteTarget::Outgoing) {
        return transition.previousNodeId;
    }
    return transition.currentNodeId;
}

void MitigationOrchestrator::onTransition(const Transition& transition)
{
    const int nodeId = targetNode(transition);
    if (nodeId < 0) {
        BOOST_LOG_TRIVIAL(warning) << "[Mitigation] no node to mute for "
                                   << triggerName(transition.trigger) << " transition";
        return;
    }
    mitigate(nodeId);
}

quint64 MitigationOrchestrator::mitigate(int nodeId)
{
    auto* cycle = new Cycle(nextCycleId_++, nodeId, this);
    cycles_.insert(cycle->id, cycle);
    emit cycleStarted(cycle->id, nodeId);

    BOOST_LOG_TRIVIAL(info) << "[Mitigation] cycle " << cycle->id << ": muting node " << nodeId;
    actuator_->setMuted(nodeId, true);

    cycle->deadline = new QTimer(cycle);
    cycle->deadline->setSingleShot(true);
    connect(cycle->deadline, &QTimer::timeout, this, [this, cycle]() { onDeadline(cycle); });
    cycle->deadline->start(settings_.deadlineMs);

    PauseBatch* batch = players_->pauseAll(settings_.callTimeoutMs);
    batch->setParent(cycle);
    connect(batch, &PauseBatch::finished, this, [this, cycle](const PauseReport& report) {
        onPauseFinished(cycle, report);
    });

    return cycle->id;
}

void MitigationOrchestrator::onPauseFinished(Cycle* cycle, const PauseReport& report)
{
    if (cycle->done)
        return;

    if (report.connectionError) {
        BOOST_LOG_TRIVIAL(error) << "[Mitigation] cycle " << cycle->id
                                 << ": could not reach players: " << report.error.toStdString();
    } else {
        BOOST_LOG_TRIVIAL(info) << "[Mitigation] cycle " << cycle->id << ": paused "
                                << report.results.size() - report.failures() << " of "
                                << report.results.size() << " player(s)";
    }

    QTimer::singleShot(settings_.graceMs, cycle, [this, cycle]() {
        finish(cycle, MitigationOutcome::Completed);
    });
}

void MitigationOrchestrator::onDeadline(Cycle* cycle)
{
    if (cycle->done)
        return;

    BOOST_LOG_TRIVIAL(warning) << "[Mitigation] cycle " << cycle->id
                               << ": timed out after " << settings_.deadlineMs
                               << " ms waiting for players";
    finish(cycle, MitigationOutcome::TimedOut);
}

void MitigationOrchestrator::finish(Cycle* cycle, MitigationOutcome outcome)
{
    if (cycle->done)
        return;
    cycle->done = true;
    cycle->deadline->stop();

    if (outcome == MitigationOutcome::Completed || settings_.unmuteOnTimeout) {
        BOOST_LOG_TRIVIAL(info) << "[Mitigation] cycle " << cycle->id
                                << ": unmuting node " << cycle->nodeId;
        actuator_->setMuted(cycle->nodeId, false);
    } else {
        BOOST_LOG_TRIVIAL(warning) << "[Mitigation] cycle " << cycle->id
                                   << ": leaving node " << cycle->nodeId
                                   << " muted, player state unknown";
    }

    const quint64 id = cycle->id;
    const int nodeId = cycle->nodeId;
    cycles_.remove(id);
    cycle->deleteLater();

    emit cycleFinished(id, nodeId, outcome);
}

} // namespace pwa
