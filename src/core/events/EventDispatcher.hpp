#pragma once

#include <QByteArray>
#include <QJsonArray>

namespace pwa {

class TopologyRegistry;
class TransitionDetector;

/// Routes decoded pw-dump records by their type tag: nodes to the
/// registry, devices and metadata to the transition detector.
///
/// Records are handled strictly in the order they appear in a batch. A
/// malformed record is skipped; only a batch that is not a JSON array at
/// all is rejected.
class EventDispatcher {
public:
    struct Stats {
        quint64 batches = 0;
        quint64 nodes = 0;
        quint64 devices = 0;
        quint64 metadata = 0;
        quint64 ignored = 0;
        quint64 malformed = 0;
    };

    EventDispatcher(TopologyRegistry& registry, TransitionDetector& detector);

    /// Parse and dispatch one batch. Returns false if it is not a JSON array.
    bool dispatchBatch(const QByteArray& json);
    void dispatchRecords(const QJsonArray& records);

    const Stats& stats() const { return stats_; }

private:
    TopologyRegistry& registry_;
    TransitionDetector& detector_;
    Stats stats_;
};

} // namespace pwa
