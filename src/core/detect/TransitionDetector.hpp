#pragma once

#include "core/topology/TopologyTypes.hpp"
#include <QMetaType>
#include <QObject>
#include <QString>

namespace pwa {

class TopologyRegistry;
class SessionState;

enum class TransitionTrigger {
    RouteChange,        ///< dominant route of the default sink's device changed
    DefaultSinkChange   ///< default.audio.sink moved to another node
};

/// A private -> public move of the active output.
struct Transition {
    TransitionTrigger trigger = TransitionTrigger::DefaultSinkChange;
    QString previousSink;
    int previousNodeId = -1;
    QString currentSink;
    int currentNodeId = -1;
};

const char* triggerName(TransitionTrigger trigger);

/// Decides whether an incoming update moved the default output from a
/// private to a public device.
///
/// Every decision diffs the incoming snapshot against what the registry held
/// *before* the update; device snapshots are written back only after the
/// decision. Node updates go straight to the registry and are not handled
/// here.
///
/// Known limitation: muting after a route change on the same device (e.g.
/// headphones unplugged from a laptop jack) does not reliably stop audio
/// that is already in flight through the device's own reconfiguration.
class TransitionDetector : public QObject {
    Q_OBJECT

public:
    TransitionDetector(TopologyRegistry& registry, SessionState& session,
                       QObject* parent = nullptr);

    void onDeviceUpdate(const DeviceInfo& device);
    void onMetadataUpdate(const MetadataUpdate& update);

    quint64 transitionCount() const { return transitionCount_; }

signals:
    void transitionDetected(const pwa::Transition& transition);

private:
    void checkRouteChange(const DeviceInfo& previous, const DeviceInfo& current);
    void handleDefaultSink(const QString& sinkName);
    void declare(const Transition& transition);

    TopologyRegistry& registry_;
    SessionState& session_;
    quint64 transitionCount_ = 0;
};

} // namespace pwa

Q_DECLARE_METATYPE(pwa::Transition)
