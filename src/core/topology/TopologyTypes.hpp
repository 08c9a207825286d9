#pragma once

#include <QJsonArray>
#include <QList>
#include <QString>
#include <variant>

namespace pwa {

/// Snapshot of a PipeWire node as last reported by the monitor.
struct NodeInfo {
    int id = 0;            // session-scoped, reused after destruction
    QString name;          // node.name, join key towards DeviceInfo
    int deviceId = 0;      // device.id of the owning device
    QString mediaClass;    // "Audio/Sink", "Stream/Output/Audio", ...
};

/// One entry of a device's Route param.
struct RouteInfo {
    int index = 0;
    QString name;
    QString direction;     // "Output" / "Input"
    int priority = 0;
    // Flat alternating list: [count, key, value, key, value, ...]
    QJsonArray info;
};

struct DeviceInfo {
    int id = 0;
    QString name;          // device.name
    QString alias;         // device.alias
    QList<RouteInfo> routes;
};

// Encodings observed for metadata values.
struct NamedValue {        // {"name": "alsa_output..."}
    QString name;
};
struct EncodedValue {      // "{\"name\": \"alsa_output...\"}"
    QString name;
};
struct RawValue {          // "alsa_output..." or "\"alsa_output...\""
    QString text;
};
using MetadataValue = std::variant<std::monostate, NamedValue, EncodedValue, RawValue>;

struct MetadataEntry {
    int subject = 0;
    QString key;
    QString type;
    MetadataValue value;
};

struct MetadataUpdate {
    int id = 0;
    QList<MetadataEntry> entries;
};

} // namespace pwa
