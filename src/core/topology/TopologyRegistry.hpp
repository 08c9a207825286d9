#pragma once

#include "TopologyTypes.hpp"
#include <QMap>
#include <QReadWriteLock>
#include <optional>

namespace pwa {

/// Latest known node and device snapshots, keyed by PipeWire id.
///
/// Updates replace the stored snapshot wholesale (last write wins, no field
/// merge). Each map has its own reader/writer lock; no operation spans both
/// maps atomically. Nothing is ever removed: the monitor feed does not tell
/// us about destruction in a form we consume.
class TopologyRegistry {
public:
    void upsertNode(const NodeInfo& node);
    void upsertDevice(const DeviceInfo& device);

    std::optional<NodeInfo> node(int id) const;
    std::optional<DeviceInfo> device(int id) const;

    /// Linear scan by node.name; lowest id wins if names collide.
    std::optional<int> findNodeIdByName(const QString& name) const;

    /// device.id recorded on the node called `name`.
    std::optional<int> deviceIdForNodeName(const QString& name) const;

    /// Device snapshot backing the node called `name`.
    std::optional<DeviceInfo> deviceForNodeName(const QString& name) const;

    int nodeCount() const;
    int deviceCount() const;

private:
    mutable QReadWriteLock nodesLock_;
    QMap<int, NodeInfo> nodes_;

    mutable QReadWriteLock devicesLock_;
    QMap<int, DeviceInfo> devices_;
};

} // namespace pwa
