#pragma once

#include "IEventSource.hpp"
#include <QJsonArray>

namespace pwa {

/// In-memory event source: batches are injected by the caller.
class ReplayEventSource : public IEventSource {
    Q_OBJECT
public:
    explicit ReplayEventSource(QObject* parent = nullptr);
    ~ReplayEventSource() override;

    // IEventSource interface
    void start() override;
    void stop() override;
    bool isRunning() const override;

    // Test API
    void feedBatch(const QByteArray& batch);
    void feedRecords(const QJsonArray& records);
    void simulateExit(const QString& reason);

private:
    bool running_ = false;
};

} // namespace pwa
