#include "TransitionDetector.hpp"
#include "SessionState.hpp"
#include "core/topology/PwDumpDecoder.hpp"
#include "core/topology/RouteClassifier.hpp"
#include "core/topology/TopologyRegistry.hpp"
#include <boost/log/trivial.hpp>

namespace pwa {

namespace {

const QString DEFAULT_SINK_KEY = QStringLiteral("default.audio.sink");
const QString CONFIGURED_SINK_KEY = QStringLiteral("default.configured.audio.sink");

bool isPrivateToPublic(const DeviceInfo& from, const DeviceInfo& to)
{
    return classifyDevice(from) == DeviceCategory::Private
        && classifyDevice(to) == DeviceCategory::Public;
}

} // namespace

const char* triggerName(TransitionTrigger trigger)
{
    switch (trigger) {
    case TransitionTrigger::RouteChange:       return "route change";
    case TransitionTrigger::DefaultSinkChange: return "default sink change";
    }
    return "unknown";
}

TransitionDetector::TransitionDetector(TopologyRegistry& registry, SessionState& session,
                                       QObject* parent)
    : QObject(parent)
    , registry_(registry)
    , session_(session)
{
}

void TransitionDetector::onDeviceUpdate(const DeviceInfo& device)
{
    auto previous = registry_.device(device.id);
    if (previous)
        checkRouteChange(*previous, device);

    registry_.upsertDevice(device);
}

void TransitionDetector::checkRouteChange(const DeviceInfo& previous, const DeviceInfo& current)
{
    const auto oldPort = dominantPortType(previous);
    const auto newPort = dominantPortType(current);
    if (oldPort != newPort) {
        BOOST_LOG_TRIVIAL(debug) << "[TransitionDetector] device " << current.id
                                 << " route port.type '" << oldPort.value_or(QString()).toStdString()
                                 << "' -> '" << newPort.value_or(QString()).toStdString() << "'";
    }

    const QString sink = session_.defaultSink();
    if (sink.isEmpty())
        return;

    auto sinkDeviceId = registry_.deviceIdForNodeName(sink);
    if (!sinkDeviceId || *sinkDeviceId != current.id)
        return;

    auto nodeId = registry_.findNodeIdByName(sink);
    if (!nodeId)
        return;

    if (!isPrivateToPublic(previous, current))
        return;

    Transition t;
    t.trigger = TransitionTrigger::RouteChange;
    t.previousSink = sink;
    t.previousNodeId = *nodeId;
    t.currentSink = sink;
    t.currentNodeId = *nodeId;
    declare(t);
}

void TransitionDetector::onMetadataUpdate(const MetadataUpdate& update)
{
    for (const auto& entry : update.entries) {
        if (entry.key == CONFIGURED_SINK_KEY) {
            // Desktop environments write this key on every manual switch;
            // hardware-driven switches never do.
            session_.markUserInitiated();
            BOOST_LOG_TRIVIAL(debug) << "[TransitionDetector] user-configured sink change noted";
            continue;
        }
        if (entry.key != DEFAULT_SINK_KEY)
            continue;

        const QString sinkName = metadataValueName(entry.value);
        if (sinkName.isEmpty())
            continue;

        handleDefaultSink(sinkName);
    }
}

void TransitionDetector::handleDefaultSink(const QString& sinkName)
{
    const SessionState::SinkChange change = session_.adoptDefaultSink(sinkName);

    if (change.previousSink.isEmpty()) {
        BOOST_LOG_TRIVIAL(info) << "[TransitionDetector] default sink initialised to "
                                << sinkName.toStdString();
        return;
    }
    if (change.previousSink == sinkName)
        return;

    BOOST_LOG_TRIVIAL(debug) << "[TransitionDetector] default sink "
                             << change.previousSink.toStdString() << " -> "
                             << sinkName.toStdString()
                             << (change.userInitiated ? " (user)" : "");

    auto oldDevice = registry_.deviceForNodeName(change.previousSink);
    auto newDevice = registry_.deviceForNodeName(sinkName);
    auto oldNode = registry_.findNodeIdByName(change.previousSink);
    auto newNode = registry_.findNodeIdByName(sinkName);
    if (!oldDevice || !newDevice || !oldNode || !newNode)
        return;

    if (change.userInitiated)
        return;

    if (!isPrivateToPublic(*oldDevice, *newDevice))
        return;

    Transition t;
    t.trigger = TransitionTrigger::DefaultSinkChange;
    t.previousSink = change.previousSink;
    t.previousNodeId = *oldNode;
    t.currentSink = sinkName;
    t.currentNodeId = *newNode;
    declare(t);
}

void TransitionDetector::declare(const Transition& transition)
{
    ++transitionCount_;
    BOOST_LOG_TRIVIAL(info) << "[TransitionDetector] private -> public transition, trigger: "
                            << triggerName(transition.trigger)
                            << ", " << transition.previousSink.toStdString()
                            << " (node " << transition.previousNodeId << ") -> "
                            << transition.currentSink.toStdString()
                            << " (node " << transition.currentNodeId << ")";
    emit transitionDetected(transition);
}

} // namespace pwa
