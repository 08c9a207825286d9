#include "RouteClassifier.hpp"
#include <QJsonValue>

namespace pwa {

namespace {

const QString PORT_TYPE_KEY = QStringLiteral("port.type");

} // namespace

const QStringList& publicKeywords()
{
    static const QStringList keywords = {
        QStringLiteral("speaker"),
        QStringLiteral("hdmi"),
        QStringLiteral("displayport"),
    };
    return keywords;
}

const QStringList& privateKeywords()
{
    static const QStringList keywords = {
        QStringLiteral("headphones"),
        QStringLiteral("headset"),
    };
    return keywords;
}

std::optional<RouteInfo> highestPriorityOutputRoute(const DeviceInfo& device)
{
    const RouteInfo* best = nullptr;
    for (const auto& route : device.routes) {
        if (route.direction.compare(QLatin1String("output"), Qt::CaseInsensitive) != 0)
            continue;
        if (!best || route.priority > best->priority)
            best = &route;
    }
    if (!best)
        return std::nullopt;
    return *best;
}

QHash<QString, QString> routeProperties(const RouteInfo& route)
{
    QHash<QString, QString> props;
    const QJsonArray& info = route.info;
    if (info.size() < 3)
        return props;

    for (int i = 1; i + 1 < info.size(); i += 2) {
        const QJsonValue key = info.at(i);
        const QJsonValue value = info.at(i + 1);
        if (!key.isString() || !value.isString())
            continue;
        if (!props.contains(key.toString()))
            props.insert(key.toString(), value.toString());
    }
    return props;
}

std::optional<QString> dominantPortType(const DeviceInfo& device)
{
    auto route = highestPriorityOutputRoute(device);
    if (!route)
        return std::nullopt;

    const auto props = routeProperties(*route);
    auto it = props.constFind(PORT_TYPE_KEY);
    if (it == props.constEnd())
        return std::nullopt;
    return it.value();
}

bool matchesCategory(const DeviceInfo& device, const QStringList& keywords)
{
    auto portType = dominantPortType(device);
    if (!portType)
        return false;

    const QString lowered = portType->toLower();
    for (const auto& keyword : keywords) {
        if (lowered.contains(keyword))
            return true;
    }
    return false;
}

bool isPublicDevice(const DeviceInfo& device)
{
    return matchesCategory(device, publicKeywords());
}

bool isPrivateDevice(const DeviceInfo& device)
{
    return matchesCategory(device, privateKeywords());
}

DeviceCategory classifyDevice(const DeviceInfo& device)
{
    if (isPrivateDevice(device))
        return DeviceCategory::Private;
    if (isPublicDevice(device))
        return DeviceCategory::Public;
    return DeviceCategory::Unknown;
}

const char* categoryName(DeviceCategory category)
{
    switch (category) {
    case DeviceCategory::Private: return "private";
    case DeviceCategory::Public:  return "public";
    case DeviceCategory::Unknown: break;
    }
    return "unknown";
}

} // namespace pwa
