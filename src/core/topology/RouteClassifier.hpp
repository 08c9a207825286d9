#pragma once

#include "TopologyTypes.hpp"
#include <QHash>
#include <QStringList>
#include <optional>

namespace pwa {

enum class DeviceCategory {
    Private,   ///< headphones, headsets
    Public,    ///< speakers, HDMI, DisplayPort
    Unknown
};

const QStringList& publicKeywords();
const QStringList& privateKeywords();

/// Output route with the numerically highest priority. Direction is matched
/// case-insensitively; on equal priority the first route encountered wins.
std::optional<RouteInfo> highestPriorityOutputRoute(const DeviceInfo& device);

/// Key/value view over a route's flat info list. Pairs start at index 1;
/// lists with fewer than 3 entries yield an empty view. For repeated keys
/// the first occurrence wins.
QHash<QString, QString> routeProperties(const RouteInfo& route);

/// port.type of the dominant output route, if any.
std::optional<QString> dominantPortType(const DeviceInfo& device);

/// True if the dominant route's port.type contains any of the keywords
/// (case-insensitive substring match).
bool matchesCategory(const DeviceInfo& device, const QStringList& keywords);

bool isPublicDevice(const DeviceInfo& device);
bool isPrivateDevice(const DeviceInfo& device);

/// Single category for a device. A port.type matching both keyword sets
/// (e.g. "headset-speaker") is classified Private.
DeviceCategory classifyDevice(const DeviceInfo& device);

const char* categoryName(DeviceCategory category);

} // namespace pwa
