#pragma once

#include <QByteArray>
#include <QObject>
#include <QString>

namespace pwa {

/// Source of pw-dump style update batches. Each batch is the raw text of
/// one top-level JSON array; batches arrive in emission order.
class IEventSource : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;
    ~IEventSource() override = default;

    virtual void start() = 0;
    virtual void stop() = 0;
    virtual bool isRunning() const = 0;

signals:
    void started();
    void batchReceived(const QByteArray& batch);
    /// The stream ended or broke; no further batches will follow.
    void finished(const QString& reason);
};

} // namespace pwa
