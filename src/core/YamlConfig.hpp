#pragma once

#include <QString>
#include <QStringList>
#include <QVariant>
#include <yaml-cpp/yaml.h>

namespace pwa {

/// Daemon configuration: built-in defaults deep-merged with the user's
/// YAML file. load() throws YAML::Exception on unreadable or malformed
/// files and leaves the current values untouched; a file either applies
/// completely or not at all. Accessors never throw: values of the wrong
/// shape read as their defaults.
class YamlConfig {
public:
    YamlConfig();

    void load(const QString& filePath);
    void save(const QString& filePath) const;

    /// $XDG_CONFIG_HOME/pw-autopaused/config.yaml, or ~/.config/... if unset.
    static QString defaultPath();

    // Logging
    QString logLevel() const;
    void setLogLevel(const QString& v);

    // Event source
    QString eventSourceProgram() const;
    QStringList eventSourceArguments() const;

    // Mute actuator
    QString muteBackend() const;
    void setMuteBackend(const QString& v);
    QString muteProgram() const;

    // Mitigation
    int deadlineMs() const;
    void setDeadlineMs(int v);
    int graceMs() const;
    void setGraceMs(int v);
    int callTimeoutMs() const;
    bool unmuteOnTimeout() const;
    void setUnmuteOnTimeout(bool v);
    QString muteTarget() const;

    // Players
    QString playerServicePrefix() const;
    QString playerObjectPath() const;
    QString playerInterface() const;

    // Supervision
    int exitGraceMs() const;

    // Generic dot-path access (e.g. "mitigation.deadline_ms")
    QVariant valueByPath(const QString& dottedKey) const;
    bool setValueByPath(const QString& dottedKey, const QVariant& value);

private:
    YAML::Node root_;

    void initDefaults();
    static YAML::Node buildDefaultsNode();
    QString stringAt(const char* section, const char* key, const char* fallback) const;
    QStringList stringListAt(const char* section, const char* key) const;
};

} // namespace pwa
