#pragma once

#include <QList>
#include <QMetaType>
#include <QObject>
#include <QString>

namespace pwa {

struct PlayerPauseResult {
    QString service;
    bool ok = false;
    QString error;
};

struct PauseReport {
    bool connectionError = false;   ///< bus or enumeration failure, nothing paused
    QString error;
    QList<PlayerPauseResult> results;

    int failures() const;
};

/// One "pause every player" broadcast in flight.
///
/// finished() is emitted exactly once and always from the event loop,
/// never from inside the call that created the batch, so callers can
/// connect after pauseAll() returns. Deleting the batch abandons the wait
/// but does not retract calls already on the bus.
class PauseBatch : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;

    bool isFinished() const { return finished_; }
    PauseReport report() const { return report_; }

    /// Number of per-player results to wait for. Zero completes the batch.
    void expectResults(int count);
    void addResult(const PlayerPauseResult& result);
    void fail(const QString& error);

signals:
    void finished(const pwa::PauseReport& report);

private:
    void complete();

    PauseReport report_;
    int expected_ = -1;
    bool finished_ = false;
};

/// Discovers running media players and asks each to pause.
class IPlayerControl {
public:
    virtual ~IPlayerControl() = default;

    /// Start a broadcast; each per-player call is bounded by callTimeoutMs.
    /// The caller owns the returned batch.
    virtual PauseBatch* pauseAll(int callTimeoutMs) = 0;
};

} // namespace pwa

Q_DECLARE_METATYPE(pwa::PauseReport)
