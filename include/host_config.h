#pragma once

#include <QJsonObject>
#include <QString>
#include <QVersionNumber>

namespace geocore {

/**
 * @brief Host-level configuration for PluginManager
 *
 * Values come from defaults, then an optional JSON file, then environment
 * overrides:
 * - GEOCORE_ENGINE_VERSION
 * - GEOCORE_PLUGIN_DATA
 * - GEOCORE_SETTINGS_DIR
 */
struct HostConfig {
    QVersionNumber engineVersion{1, 0, 0};
    QString pluginDataRoot;         // per-plugin directories are <root>/<pluginId>
    QString settingsDirectory;      // empty disables settings persistence
    int workerThreads = 0;          // 0 keeps the Qt default

    static HostConfig fromJson(const QJsonObject& json);
    QJsonObject toJson() const;

    // Returns defaults (with environment overrides) and sets errorMessage
    // when the file cannot be read or parsed
    static HostConfig fromFile(const QString& path, QString* errorMessage = nullptr);

    void applyEnvironment();

    QString pluginDataDirectory(const QString& pluginId) const;
    QString settingsFilePath(const QString& pluginId) const;
};

} // namespace geocore
