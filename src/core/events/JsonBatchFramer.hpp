#pragma once

#include <QByteArray>
#include <QObject>

namespace pwa {

/// Splits a byte stream of concatenated top-level JSON arrays into one
/// chunk per array. Only bracket depth and string literals are tracked;
/// validating the JSON is left to the consumer.
class JsonBatchFramer : public QObject {
    Q_OBJECT

public:
    explicit JsonBatchFramer(QObject* parent = nullptr);

    void reset();
    bool hasFailed() const { return failed_; }
    int pendingBytes() const { return current_.size(); }

public slots:
    void onData(const QByteArray& data);

signals:
    void batchFramed(const QByteArray& batch);
    void framingError(const QString& message);

private:
    enum class State {
        BetweenBatches,
        InBatch,
        InString,
        InEscape
    };

    State state_ = State::BetweenBatches;
    QByteArray current_;
    int depth_ = 0;
    bool failed_ = false;
};

} // namespace pwa
