#pragma once

#include "core/detect/TransitionDetector.hpp"
#include <QHash>
#include <QMetaType>
#include <QObject>

namespace pwa {

class IMuteActuator;
class IPlayerControl;
struct PauseReport;

/// Which node of a default-sink transition gets muted.
///
/// The two settings disagree on a headset -> HDMI switch: Incoming (the
/// default, and the historical pw-autopaused behaviour) mutes the HDMI node
/// that is now playing out loud, Outgoing mutes the headset node that was
/// default before. Deployments that expect the previous sink to be muted
/// must set `mitigation.mute_target: outgoing`.
enum class MuteTarget {
    Incoming,   ///< the node that just became default (the public one)
    Outgoing    ///< the node that was default before the switch
};

struct MitigationSettings {
    int deadlineMs = 3000;       ///< overall bound for pause + grace
    int graceMs = 1000;          ///< wait after the pause broadcast before unmuting
    int callTimeoutMs = 1000;    ///< per D-Bus call
    bool unmuteOnTimeout = false;
    MuteTarget muteTarget = MuteTarget::Incoming;
};

enum class MitigationOutcome {
    Completed,   ///< players paused (or tried), grace elapsed, node unmuted
    TimedOut     ///< deadline hit first; unmuted only with unmuteOnTimeout
};

const char* outcomeName(MitigationOutcome outcome);

/// Mute, pause every player, wait, unmute.
///
/// Each mitigate() call runs its own independent cycle; overlapping cycles
/// on the same node are not coalesced. All work happens on the thread the
/// orchestrator lives in; waiting is timer driven, never blocking.
class MitigationOrchestrator : public QObject {
    Q_OBJECT
public:
    MitigationOrchestrator(IMuteActuator* actuator, IPlayerControl* players,
                           const MitigationSettings& settings = {},
                           QObject* parent = nullptr);
    ~MitigationOrchestrator() override;

    const MitigationSettings& settings() const { return settings_; }
    int activeCycles() const { return cycles_.size(); }

    /// Start a cycle for `nodeId`; returns its id.
    quint64 mitigate(int nodeId);

    /// Node to mute for a transition, or -1 if it could not be resolved.
    int targetNode(const Transition& transition) const;

public slots:
    void onTransition(const pwa::Transition& transition);

signals:
    void cycleStarted(quint64 cycleId, int nodeId);
    void cycleFinished(quint64 cycleId, int nodeId, pwa::MitigationOutcome outcome);

private:
    class Cycle;

    void onPauseFinished(Cycle* cycle, const PauseReport& report);
    void onDeadline(Cycle* cycle);
    void finish(Cycle* cycle, MitigationOutcome outcome);

    IMuteActuator* actuator_;
    IPlayerControl* players_;
    MitigationSettings settings_;
    quint64 nextCycleId_ = 1;
    QHash<quint64, Cycle*> cycles_;
};

} // namespace pwa

Q_DECLARE_METATYPE(pwa::MitigationOutcome)
