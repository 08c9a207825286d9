#pragma once

#include "core/mitigation/IMuteActuator.hpp"
#include "core/mitigation/PauseBatch.hpp"
#include "core/topology/TopologyTypes.hpp"
#include <QJsonArray>
#include <QJsonObject>
#include <QList>
#include <QStringList>
#include <QTimer>

namespace testing {

// ---- Topology builders ----

inline pwa::RouteInfo makeRoute(const QString& direction, int priority,
                                const QString& portType, int index = 0)
{
    pwa::RouteInfo route;
    route.index = index;
    route.name = QStringLiteral("route-%1").arg(index);
    route.direction = direction;
    route.priority = priority;
    route.info = QJsonArray{2, "port.type", portType, "port.availability", "yes"};
    return route;
}

inline pwa::DeviceInfo makeDevice(int id, const QString& portType, int priority = 5)
{
    pwa::DeviceInfo device;
    device.id = id;
    device.name = QStringLiteral("alsa_card.%1").arg(id);
    device.routes.append(makeRoute(QStringLiteral("Output"), priority, portType));
    return device;
}

inline pwa::NodeInfo makeNode(int id, const QString& name, int deviceId)
{
    pwa::NodeInfo node;
    node.id = id;
    node.name = name;
    node.deviceId = deviceId;
    node.mediaClass = QStringLiteral("Audio/Sink");
    return node;
}

inline pwa::MetadataUpdate makeMetadata(const QList<QPair<QString, QString>>& entries)
{
    pwa::MetadataUpdate update;
    update.id = 40;
    for (const auto& e : entries) {
        pwa::MetadataEntry entry;
        entry.key = e.first;
        entry.type = QStringLiteral("Spa:String:JSON");
        entry.value = pwa::NamedValue{e.second};
        update.entries.append(entry);
    }
    return update;
}

// ---- pw-dump record builders ----

inline QJsonObject nodeRecord(int id, const QString& name, int deviceId)
{
    QJsonObject props{
        {"node.name", name},
        {"device.id", deviceId},
        {"media.class", "Audio/Sink"},
    };
    return QJsonObject{
        {"id", id},
        {"type", "PipeWire:Interface:Node"},
        {"info", QJsonObject{{"props", props}}},
    };
}

inline QJsonObject deviceRecord(int id, const QString& portType, int priority = 5)
{
    QJsonObject route{
        {"index", 0},
        {"name", "analog-output"},
        {"direction", "Output"},
        {"priority", priority},
        {"info", QJsonArray{2, "port.type", portType, "port.availability", "yes"}},
    };
    QJsonObject info{
        {"props", QJsonObject{{"device.name", QStringLiteral("alsa_card.%1").arg(id)}}},
        {"params", QJsonObject{{"Route", QJsonArray{route}}}},
    };
    return QJsonObject{
        {"id", id},
        {"type", "PipeWire:Interface:Device"},
        {"info", info},
    };
}

inline QJsonObject metadataRecord(const QString& key, const QString& sinkName)
{
    QJsonObject entry{
        {"subject", 0},
        {"key", key},
        {"type", "Spa:String:JSON"},
        {"value", QJsonObject{{"name", sinkName}}},
    };
    return QJsonObject{
        {"id", 40},
        {"type", "PipeWire:Interface:Metadata"},
        {"metadata", QJsonArray{entry}},
    };
}

// ---- Collaborator fakes ----

class FakeMuteActuator : public pwa::IMuteActuator {
public:
    struct Call {
        int nodeId;
        bool muted;
    };

    bool start() override
    {
        ready = startResult;
        if (ready)
            emit started();
        return startResult;
    }
    void stop() override { ready = false; }
    bool isReady() const override { return ready; }
    void setMuted(int nodeId, bool muted) override { calls.append({nodeId, muted}); }

    void simulateExit(const QString& reason)
    {
        ready = false;
        emit finished(reason);
    }

    bool lastMuted(int nodeId) const
    {
        for (int i = calls.size() - 1; i >= 0; --i) {
            if (calls.at(i).nodeId == nodeId)
                return calls.at(i).muted;
        }
        return false;
    }

    QList<Call> calls;
    bool ready = false;
    bool startResult = true;
};

class FakePlayerControl : public pwa::IPlayerControl {
public:
    enum class Mode {
        Respond,          ///< every player answers after delayMs
        NeverRespond,     ///< batch never finishes
        ConnectionError   ///< bus unreachable
    };

    pwa::PauseBatch* pauseAll(int callTimeoutMs) override
    {
        ++broadcasts;
        lastCallTimeoutMs = callTimeoutMs;
        auto* batch = new pwa::PauseBatch();

        switch (mode) {
        case Mode::Respond: {
            const QStringList names = players;
            const QStringList broken = failing;
            auto respond = [batch, names, broken]() {
                for (const auto& name : names) {
                    pwa::PlayerPauseResult r;
                    r.service = name;
                    r.ok = !broken.contains(name);
                    if (!r.ok)
                        r.error = QStringLiteral("org.freedesktop.DBus.Error.NoReply");
                    batch->addResult(r);
                }
                batch->expectResults(names.size());
            };
            if (delayMs > 0)
                QTimer::singleShot(delayMs, batch, respond);
            else
                respond();
            break;
        }
        case Mode::NeverRespond:
            break;
        case Mode::ConnectionError:
            batch->fail(QStringLiteral("session bus unavailable"));
            break;
        }
        return batch;
    }

    Mode mode = Mode::Respond;
    QStringList players = {QStringLiteral("org.mpris.MediaPlayer2.vlc")};
    QStringList failing;
    int delayMs = 0;
    int broadcasts = 0;
    int lastCallTimeoutMs = 0;
};

} // namespace testing
