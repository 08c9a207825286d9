#include "MprisPlayerControl.hpp"
#include <QDBusMessage>
#include <QDBusPendingCall>
#include <QDBusPendingCallWatcher>
#include <QDBusPendingReply>
#include <boost/log/trivial.hpp>

namespace pwa {

MprisPlayerControl::MprisPlayerControl(const QDBusConnection& bus,
                                       const PlayerControlSettings& settings,
                                       QObject* parent)
    : QObject(parent)
    , bus_(bus)
    , settings_(settings)
{
}

QStringList MprisPlayerControl::filterPlayers(const QStringList& busNames) const
{
    QStringList players;
    for (const auto& name : busNames) {
        if (name.startsWith(settings_.servicePrefix))
            players.append(name);
    }
    return players;
}

PauseBatch* MprisPlayerControl::pauseAll(int callTimeoutMs)
{
    auto* batch = new PauseBatch();

    if (!bus_.isConnected()) {
        const QString error = QStringLiteral("D-Bus connection unavailable: %1")
                                  .arg(bus_.lastError().message());
        BOOST_LOG_TRIVIAL(error) << "[MprisPlayerControl] " << error.toStdString();
        batch->fail(error);
        return batch;
    }

    QDBusMessage listNames = QDBusMessage::createMethodCall(
        QStringLiteral("org.freedesktop.DBus"),
        QStringLiteral("/org/freedesktop/DBus"),
        QStringLiteral("org.freedesktop.DBus"),
        QStringLiteral("ListNames"));

    QDBusPendingCall pending = bus_.asyncCall(listNames, callTimeoutMs);
    auto* watcher = new QDBusPendingCallWatcher(pending, batch);
    connect(watcher, &QDBusPendingCallWatcher::finished, batch,
            [this, batch, watcher, callTimeoutMs]() {
        watcher->deleteLater();

        QDBusPendingReply<QStringList> reply = *watcher;
        if (reply.isError()) {
            const QString error = QStringLiteral("ListNames failed: %1")
                                      .arg(reply.error().message());
            BOOST_LOG_TRIVIAL(error) << "[MprisPlayerControl] " << error.toStdString();
            batch->fail(error);
            return;
        }

        pausePlayers(batch, filterPlayers(reply.value()), callTimeoutMs);
    });

    return batch;
}

void MprisPlayerControl::pausePlayers(PauseBatch* batch, const QStringList& players,
                                      int callTimeoutMs)
{
    BOOST_LOG_TRIVIAL(debug) << "[MprisPlayerControl] pausing " << players.size() << " player(s)";

    for (const auto& player : players) {
        QDBusMessage msg = QDBusMessage::createMethodCall(
            player, settings_.objectPath, settings_.interface, settings_.method);

        QDBusPendingCall pending = bus_.asyncCall(msg, callTimeoutMs);
        auto* watcher = new QDBusPendingCallWatcher(pending, batch);
        connect(watcher, &QDBusPendingCallWatcher::finished, batch,
                [batch, watcher, player]() {
            watcher->deleteLater();

            PlayerPauseResult result;
            result.service = player;
            result.ok = !watcher->isError();
            if (!result.ok) {
                result.error = watcher->error().message();
                BOOST_LOG_TRIVIAL(warning) << "[MprisPlayerControl] pause failed for "
                                           << player.toStdString() << ": "
                                           << result.error.toStdString();
            }
            batch->addResult(result);
        });
    }

    batch->expectResults(players.size());
}

} // namespace pwa
