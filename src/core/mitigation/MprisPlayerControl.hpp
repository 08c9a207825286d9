#pragma once

#include "PauseBatch.hpp"
#include <QDBusConnection>
#include <QObject>
#include <QString>

namespace pwa {

struct PlayerControlSettings {
    QString servicePrefix = QStringLiteral("org.mpris.MediaPlayer2.");
    QString objectPath = QStringLiteral("/org/mpris/MediaPlayer2");
    QString interface = QStringLiteral("org.mpris.MediaPlayer2.Player");
    QString method = QStringLiteral("Pause");
};

/// MPRIS player control over a D-Bus connection (the session bus in the
/// daemon). Enumeration and every Pause call are asynchronous; each player
/// is paused independently so one unresponsive player cannot hold up or
/// fail the others.
class MprisPlayerControl : public QObject, public IPlayerControl {
    Q_OBJECT
public:
    explicit MprisPlayerControl(const QDBusConnection& bus,
                                const PlayerControlSettings& settings = {},
                                QObject* parent = nullptr);

    PauseBatch* pauseAll(int callTimeoutMs) override;

    /// Bus names that belong to players, in the order given.
    QStringList filterPlayers(const QStringList& busNames) const;

private:
    void pausePlayers(PauseBatch* batch, const QStringList& players, int callTimeoutMs);

    QDBusConnection bus_;
    PlayerControlSettings settings_;
};

} // namespace pwa
