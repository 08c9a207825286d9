#pragma once

#include <QObject>
#include <QString>

namespace pwa {

/// Sets a node's output gain to silence or nominal level.
///
/// setMuted() never blocks on the audio server and may be called before
/// start() has succeeded (the request is dropped and logged). Requests for
/// different nodes are serialized by the implementation.
class IMuteActuator : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;
    ~IMuteActuator() override = default;

    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool isReady() const = 0;
    virtual void setMuted(int nodeId, bool muted) = 0;

signals:
    void started();
    /// The control channel went away; muting is no longer possible.
    void finished(const QString& reason);
};

} // namespace pwa
