#include "EventDispatcher.hpp"
#include "core/detect/TransitionDetector.hpp"
#include "core/topology/PwDumpDecoder.hpp"
#include "core/topology/TopologyRegistry.hpp"
#include <QJsonDocument>
#include <QJsonObject>
#include <boost/log/trivial.hpp>

namespace pwa {

EventDispatcher::EventDispatcher(TopologyRegistry& registry, TransitionDetector& detector)
    : registry_(registry)
    , detector_(detector)
{
}

bool EventDispatcher::dispatchBatch(const QByteArray& json)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &err);
    if (err.error != QJsonParseError::NoError) {
        BOOST_LOG_TRIVIAL(error) << "[EventDispatcher] failed to parse batch at offset "
                                 << err.offset << ": " << err.errorString().toStdString();
        return false;
    }
    if (!doc.isArray()) {
        BOOST_LOG_TRIVIAL(error) << "[EventDispatcher] batch is not a JSON array";
        return false;
    }

    dispatchRecords(doc.array());
    return true;
}

void EventDispatcher::dispatchRecords(const QJsonArray& records)
{
    ++stats_.batches;

    for (const auto& record : records) {
        switch (PwDumpDecoder::recordType(record)) {
        case PwDumpDecoder::RecordType::Node:
            if (auto node = PwDumpDecoder::decodeNode(record.toObject())) {
                registry_.upsertNode(*node);
                ++stats_.nodes;
            } else {
                ++stats_.malformed;
            }
            break;

        case PwDumpDecoder::RecordType::Device:
            if (auto device = PwDumpDecoder::decodeDevice(record.toObject())) {
                detector_.onDeviceUpdate(*device);
                ++stats_.devices;
            } else {
                ++stats_.malformed;
            }
            break;

        case PwDumpDecoder::RecordType::Metadata:
            if (auto update = PwDumpDecoder::decodeMetadata(record.toObject())) {
                detector_.onMetadataUpdate(*update);
                ++stats_.metadata;
            } else {
                ++stats_.malformed;
            }
            break;

        case PwDumpDecoder::RecordType::Other:
            ++stats_.ignored;
            break;

        case PwDumpDecoder::RecordType::Invalid:
            // Removal notices ({"id": N, "info": null}) land here too
            ++stats_.malformed;
            BOOST_LOG_TRIVIAL(trace) << "[EventDispatcher] skipping record without type";
            break;
        }
    }
}

} // namespace pwa
