#pragma once

#include "TopologyTypes.hpp"
#include <QJsonObject>
#include <QJsonValue>
#include <optional>

namespace pwa {

/// Decodes individual pw-dump records into topology snapshots.
///
/// Every function works on a single record so that one malformed record
/// never prevents its siblings in the same batch from being applied.
class PwDumpDecoder {
public:
    enum class RecordType {
        Node,
        Device,
        Metadata,
        Other,     ///< well-formed, but a type we do not track
        Invalid    ///< not an object, or no usable id/type
    };

    static RecordType recordType(const QJsonValue& record);

    static std::optional<NodeInfo> decodeNode(const QJsonObject& record);
    static std::optional<DeviceInfo> decodeDevice(const QJsonObject& record);
    static std::optional<MetadataUpdate> decodeMetadata(const QJsonObject& record);

    static MetadataValue decodeMetadataValue(const QJsonValue& value);
};

/// Node name carried by a metadata value, whatever its encoding.
/// Empty when the value carries none.
QString metadataValueName(const MetadataValue& value);

extern const QString NODE_INTERFACE_TYPE;
extern const QString DEVICE_INTERFACE_TYPE;
extern const QString METADATA_INTERFACE_TYPE;

} // namespace pwa
