#include "TopologyRegistry.hpp"

namespace pwa {

void TopologyRegistry::upsertNode(const NodeInfo& node)
{
    QWriteLocker lock(&nodesLock_);
    nodes_.insert(node.id, node);
}

void TopologyRegistry::upsertDevice(const DeviceInfo& device)
{
    QWriteLocker lock(&devicesLock_);
    devices_.insert(device.id, device);
}

std::optional<NodeInfo> TopologyRegistry::node(int id) const
{
    QReadLocker lock(&nodesLock_);
    auto it = nodes_.constFind(id);
    if (it == nodes_.constEnd())
        return std::nullopt;
    return it.value();
}

std::optional<DeviceInfo> TopologyRegistry::device(int id) const
{
    QReadLocker lock(&devicesLock_);
    auto it = devices_.constFind(id);
    if (it == devices_.constEnd())
        return std::nullopt;
    return it.value();
}

std::optional<int> TopologyRegistry::findNodeIdByName(const QString& name) const
{
    QReadLocker lock(&nodesLock_);
    for (auto it = nodes_.constBegin(); it != nodes_.constEnd(); ++it) {
        if (it.value().name == name)
            return it.key();
    }
    return std::nullopt;
}

std::optional<int> TopologyRegistry::deviceIdForNodeName(const QString& name) const
{
    QReadLocker lock(&nodesLock_);
    for (const auto& node : nodes_) {
        if (node.name == name)
            return node.deviceId;
    }
    return std::nullopt;
}

std::optional<DeviceInfo> TopologyRegistry::deviceForNodeName(const QString& name) const
{
    auto deviceId = deviceIdForNodeName(name);
    if (!deviceId)
        return std::nullopt;
    return device(*deviceId);
}

int TopologyRegistry::nodeCount() const
{
    QReadLocker lock(&nodesLock_);
    return nodes_.size();
}

int TopologyRegistry::deviceCount() const
{
    QReadLocker lock(&devicesLock_);
    return devices_.size();
}

} // namespace pwa
