#include "PwDumpDecoder.hpp"
#include <QJsonArray>
#include <QJsonDocument>

namespace pwa {

const QString NODE_INTERFACE_TYPE = QStringLiteral("PipeWire:Interface:Node");
const QString DEVICE_INTERFACE_TYPE = QStringLiteral("PipeWire:Interface:Device");
const QString METADATA_INTERFACE_TYPE = QStringLiteral("PipeWire:Interface:Metadata");

namespace {

// pw-dump writes ids as numbers, but some props (device.id on older
// versions) arrive as strings.
std::optional<int> toInt(const QJsonValue& value)
{
    if (value.isDouble())
        return value.toInt();
    if (value.isString()) {
        bool ok = false;
        int v = value.toString().toInt(&ok);
        if (ok)
            return v;
    }
    return std::nullopt;
}

QJsonObject propsOf(const QJsonObject& record)
{
    return record.value(QStringLiteral("info")).toObject()
                 .value(QStringLiteral("props")).toObject();
}

} // namespace

PwDumpDecoder::RecordType PwDumpDecoder::recordType(const QJsonValue& record)
{
    if (!record.isObject())
        return RecordType::Invalid;

    const QJsonObject obj = record.toObject();
    const QJsonValue type = obj.value(QStringLiteral("type"));
    if (!type.isString())
        return RecordType::Invalid;

    const QString tag = type.toString();
    if (tag == NODE_INTERFACE_TYPE)
        return RecordType::Node;
    if (tag == DEVICE_INTERFACE_TYPE)
        return RecordType::Device;
    if (tag == METADATA_INTERFACE_TYPE)
        return RecordType::Metadata;
    return RecordType::Other;
}

std::optional<NodeInfo> PwDumpDecoder::decodeNode(const QJsonObject& record)
{
    auto id = toInt(record.value(QStringLiteral("id")));
    if (!id)
        return std::nullopt;

    const QJsonObject props = propsOf(record);

    NodeInfo node;
    node.id = *id;
    node.name = props.value(QStringLiteral("node.name")).toString();
    node.deviceId = toInt(props.value(QStringLiteral("device.id"))).value_or(0);
    node.mediaClass = props.value(QStringLiteral("media.class")).toString();
    return node;
}

std::optional<DeviceInfo> PwDumpDecoder::decodeDevice(const QJsonObject& record)
{
    auto id = toInt(record.value(QStringLiteral("id")));
    if (!id)
        return std::nullopt;

    const QJsonObject info = record.value(QStringLiteral("info")).toObject();
    const QJsonObject props = info.value(QStringLiteral("props")).toObject();

    DeviceInfo device;
    device.id = *id;
    device.name = props.value(QStringLiteral("device.name")).toString();
    device.alias = props.value(QStringLiteral("device.alias")).toString();

    const QJsonArray routes = info.value(QStringLiteral("params")).toObject()
                                  .value(QStringLiteral("Route")).toArray();
    for (const auto& entry : routes) {
        if (!entry.isObject())
            continue;
        const QJsonObject r = entry.toObject();

        RouteInfo route;
        route.index = r.value(QStringLiteral("index")).toInt();
        route.name = r.value(QStringLiteral("name")).toString();
        route.direction = r.value(QStringLiteral("direction")).toString();
        route.priority = r.value(QStringLiteral("priority")).toInt();
        route.info = r.value(QStringLiteral("info")).toArray();
        device.routes.append(route);
    }
    return device;
}

std::optional<MetadataUpdate> PwDumpDecoder::decodeMetadata(const QJsonObject& record)
{
    auto id = toInt(record.value(QStringLiteral("id")));
    if (!id)
        return std::nullopt;

    MetadataUpdate update;
    update.id = *id;

    const QJsonArray entries = record.value(QStringLiteral("metadata")).toArray();
    for (const auto& e : entries) {
        if (!e.isObject())
            continue;
        const QJsonObject obj = e.toObject();

        MetadataEntry entry;
        entry.subject = obj.value(QStringLiteral("subject")).toInt();
        entry.key = obj.value(QStringLiteral("key")).toString();
        entry.type = obj.value(QStringLiteral("type")).toString();
        entry.value = decodeMetadataValue(obj.value(QStringLiteral("value")));
        update.entries.append(entry);
    }
    return update;
}

MetadataValue PwDumpDecoder::decodeMetadataValue(const QJsonValue& value)
{
    if (value.isObject())
        return NamedValue{value.toObject().value(QStringLiteral("name")).toString()};

    if (!value.isString())
        return std::monostate{};

    const QString text = value.toString();

    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(text.toUtf8(), &err);
    if (err.error == QJsonParseError::NoError && doc.isObject())
        return EncodedValue{doc.object().value(QStringLiteral("name")).toString()};

    // Plain string, possibly still wrapped in quotes
    int begin = 0;
    int end = text.size();
    while (begin < end && text.at(begin) == QLatin1Char('"'))
        ++begin;
    while (end > begin && text.at(end - 1) == QLatin1Char('"'))
        --end;
    return RawValue{text.mid(begin, end - begin)};
}

QString metadataValueName(const MetadataValue& value)
{
    if (auto* named = std::get_if<NamedValue>(&value))
        return named->name;
    if (auto* encoded = std::get_if<EncodedValue>(&value))
        return encoded->name;
    if (auto* raw = std::get_if<RawValue>(&value))
        return raw->text;
    return {};
}

} // namespace pwa
