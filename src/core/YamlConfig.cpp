#include "core/YamlConfig.hpp"
#include <QDir>
#include <fstream>

namespace pwa {

namespace {

// Copies the user's values over the defaults in place. Maps recurse; any
// other value replaces the default, unless it would replace a map with a
// scalar or sequence, in which case the default section is kept.
void overlay(YAML::Node target, const YAML::Node& source)
{
    for (auto it = source.begin(); it != source.end(); ++it) {
        const std::string key = it->first.as<std::string>();
        const YAML::Node value = it->second;
        YAML::Node current = target[key];

        if (current.IsMap()) {
            if (value.IsMap())
                overlay(current, value);
            continue;
        }
        if (!value.IsNull())
            target[key] = YAML::Clone(value);
    }
}

// Walks a dotted path; an invalid node if any segment is missing.
YAML::Node descend(YAML::Node node, const QStringList& parts)
{
    for (const auto& part : parts) {
        if (!node.IsMap())
            return YAML::Node(YAML::NodeType::Undefined);
        node.reset(node[part.toStdString()]);
        if (!node.IsDefined())
            return node;
    }
    return node;
}

QVariant scalarToVariant(const YAML::Node& node)
{
    const QString text = QString::fromStdString(node.Scalar());
    if (text == QLatin1String("true"))
        return true;
    if (text == QLatin1String("false"))
        return false;

    bool ok = false;
    const int i = text.toInt(&ok);
    if (ok)
        return i;
    const double d = text.toDouble(&ok);
    if (ok)
        return d;
    return text;
}

} // namespace

YamlConfig::YamlConfig()
{
    initDefaults();
}

void YamlConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["logging"]["level"] = "info";

    root_["event_source"]["program"] = "pw-dump";
    root_["event_source"]["arguments"] = YAML::Node(YAML::NodeType::Sequence);
    root_["event_source"]["arguments"].push_back("--monitor");
    root_["event_source"]["arguments"].push_back("--no-colors");

    root_["mute"]["backend"] = "pw-cli";
    root_["mute"]["program"] = "pw-cli";

    root_["mitigation"]["deadline_ms"] = 3000;
    root_["mitigation"]["grace_ms"] = 1000;
    root_["mitigation"]["call_timeout_ms"] = 1000;
    root_["mitigation"]["unmute_on_timeout"] = false;
    root_["mitigation"]["mute_target"] = "incoming";

    root_["players"]["service_prefix"] = "org.mpris.MediaPlayer2.";
    root_["players"]["object_path"] = "/org/mpris/MediaPlayer2";
    root_["players"]["interface"] = "org.mpris.MediaPlayer2.Player";

    root_["supervision"]["exit_grace_ms"] = 500;
}

void YamlConfig::load(const QString& filePath)
{
    const YAML::Node loaded = YAML::LoadFile(filePath.toStdString());

    // Overlay onto a scratch copy; root_ only changes if the whole file applies
    YAML::Node merged = buildDefaultsNode();
    if (loaded.IsMap())
        overlay(merged, loaded);
    root_ = merged;
}

void YamlConfig::save(const QString& filePath) const
{
    std::ofstream fout(filePath.toStdString());
    fout << root_;
}

QString YamlConfig::defaultPath()
{
    QString base = qEnvironmentVariable("XDG_CONFIG_HOME");
    if (base.isEmpty())
        base = QDir::homePath() + QStringLiteral("/.config");
    return base + QStringLiteral("/pw-autopaused/config.yaml");
}

QString YamlConfig::stringAt(const char* section, const char* key, const char* fallback) const
{
    return QString::fromStdString(root_[section][key].as<std::string>(fallback));
}

QStringList YamlConfig::stringListAt(const char* section, const char* key) const
{
    QStringList result;
    YAML::Node list = root_[section][key];
    if (list && list.IsSequence()) {
        for (const auto& item : list) {
            if (item.IsScalar())
                result.append(QString::fromStdString(item.Scalar()));
        }
    }
    return result;
}

// --- Logging ---

QString YamlConfig::logLevel() const
{
    return stringAt("logging", "level", "info");
}

void YamlConfig::setLogLevel(const QString& v)
{
    root_["logging"]["level"] = v.toStdString();
}

// --- Event source ---

QString YamlConfig::eventSourceProgram() const
{
    return stringAt("event_source", "program", "pw-dump");
}

QStringList YamlConfig::eventSourceArguments() const
{
    return stringListAt("event_source", "arguments");
}

// --- Mute actuator ---

QString YamlConfig::muteBackend() const
{
    return stringAt("mute", "backend", "pw-cli");
}

void YamlConfig::setMuteBackend(const QString& v)
{
    root_["mute"]["backend"] = v.toStdString();
}

QString YamlConfig::muteProgram() const
{
    return stringAt("mute", "program", "pw-cli");
}

// --- Mitigation ---

int YamlConfig::deadlineMs() const
{
    return root_["mitigation"]["deadline_ms"].as<int>(3000);
}

void YamlConfig::setDeadlineMs(int v)
{
    root_["mitigation"]["deadline_ms"] = v;
}

int YamlConfig::graceMs() const
{
    return root_["mitigation"]["grace_ms"].as<int>(1000);
}

void YamlConfig::setGraceMs(int v)
{
    root_["mitigation"]["grace_ms"] = v;
}

int YamlConfig::callTimeoutMs() const
{
    return root_["mitigation"]["call_timeout_ms"].as<int>(1000);
}

bool YamlConfig::unmuteOnTimeout() const
{
    return root_["mitigation"]["unmute_on_timeout"].as<bool>(false);
}

void YamlConfig::setUnmuteOnTimeout(bool v)
{
    root_["mitigation"]["unmute_on_timeout"] = v;
}

QString YamlConfig::muteTarget() const
{
    return stringAt("mitigation", "mute_target", "incoming");
}

// --- Players ---

QString YamlConfig::playerServicePrefix() const
{
    return stringAt("players", "service_prefix", "org.mpris.MediaPlayer2.");
}

QString YamlConfig::playerObjectPath() const
{
    return stringAt("players", "object_path", "/org/mpris/MediaPlayer2");
}

QString YamlConfig::playerInterface() const
{
    return stringAt("players", "interface", "org.mpris.MediaPlayer2.Player");
}

// --- Supervision ---

int YamlConfig::exitGraceMs() const
{
    return root_["supervision"]["exit_grace_ms"].as<int>(500);
}

// --- Generic access ---

QVariant YamlConfig::valueByPath(const QString& dottedKey) const
{
    if (dottedKey.isEmpty())
        return {};

    const YAML::Node node = descend(YAML::Clone(root_), dottedKey.split(QLatin1Char('.')));
    if (!node.IsDefined() || !node.IsScalar())
        return {};
    return scalarToVariant(node);
}

YAML::Node YamlConfig::buildDefaultsNode()
{
    YamlConfig tmp;
    return YAML::Clone(tmp.root_);
}

bool YamlConfig::setValueByPath(const QString& dottedKey, const QVariant& value)
{
    if (dottedKey.isEmpty())
        return false;

    const QStringList parts = dottedKey.split(QLatin1Char('.'));

    // Only leaves that exist in the defaults are writable
    const YAML::Node known = descend(buildDefaultsNode(), parts);
    if (!known.IsDefined() || !known.IsScalar())
        return false;

    YAML::Node parent = descend(root_, parts.mid(0, parts.size() - 1));
    if (!parent.IsMap())
        return false;

    const std::string leaf = parts.last().toStdString();
    switch (value.typeId()) {
    case QMetaType::Bool:
        parent[leaf] = value.toBool();
        break;
    case QMetaType::Int:
        parent[leaf] = value.toInt();
        break;
    case QMetaType::Double:
    case QMetaType::Float:
        parent[leaf] = value.toDouble();
        break;
    default:
        parent[leaf] = value.toString().toStdString();
        break;
    }
    return true;
}

} // namespace pwa
