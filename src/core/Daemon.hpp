#pragma once

#include "core/detect/SessionState.hpp"
#include "core/detect/TransitionDetector.hpp"
#include "core/events/EventDispatcher.hpp"
#include "core/mitigation/MitigationOrchestrator.hpp"
#include "core/topology/TopologyRegistry.hpp"
#include <QObject>

namespace pwa {

class IEventSource;
class IMuteActuator;
class IPlayerControl;

/// Wires the event source through the dispatcher and detector to the
/// mitigation orchestrator, and watches both external processes.
///
/// The collaborators are not owned. Losing either of them is fatal: the
/// daemon would otherwise keep running without protecting anything.
class Daemon : public QObject {
    Q_OBJECT
public:
    Daemon(IEventSource* source, IMuteActuator* actuator, IPlayerControl* players,
           const MitigationSettings& settings, QObject* parent = nullptr);
    ~Daemon() override;

    /// Start the mute actuator, then the event source. Returns false if
    /// the actuator cannot be started.
    bool start();
    void stop();

    bool hasFailed() const { return failed_; }

    TopologyRegistry& registry() { return registry_; }
    SessionState& session() { return session_; }
    TransitionDetector& detector() { return detector_; }
    MitigationOrchestrator& orchestrator() { return orchestrator_; }
    const EventDispatcher& dispatcher() const { return dispatcher_; }

signals:
    void fatal(const QString& reason);

private:
    void onBatch(const QByteArray& batch);
    void fail(const QString& reason);

    IEventSource* source_;
    IMuteActuator* actuator_;

    TopologyRegistry registry_;
    SessionState session_;
    TransitionDetector detector_;
    MitigationOrchestrator orchestrator_;
    EventDispatcher dispatcher_;
    bool failed_ = false;
};

} // namespace pwa
