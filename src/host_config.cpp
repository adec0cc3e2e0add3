#include "host_config.h"

#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QDebug>

namespace geocore {

HostConfig HostConfig::fromJson(const QJsonObject& json)
{
    HostConfig config;

    if (json.contains(QLatin1String("engineVersion"))) {
        QVersionNumber version =
            QVersionNumber::fromString(json.value(QLatin1String("engineVersion")).toString());
        if (!version.isNull()) {
            config.engineVersion = version;
        } else {
            qWarning() << "HostConfig: Ignoring invalid engineVersion"
                       << json.value(QLatin1String("engineVersion"));
        }
    }
    config.pluginDataRoot = json.value(QLatin1String("pluginDataRoot")).toString();
    config.settingsDirectory = json.value(QLatin1String("settingsDirectory")).toString();
    config.workerThreads = qMax(0, json.value(QLatin1String("workerThreads")).toInt(0));

    return config;
}

QJsonObject HostConfig::toJson() const
{
    QJsonObject json;
    json[QLatin1String("engineVersion")] = engineVersion.toString();
    json[QLatin1String("pluginDataRoot")] = pluginDataRoot;
    json[QLatin1String("settingsDirectory")] = settingsDirectory;
    json[QLatin1String("workerThreads")] = workerThreads;
    return json;
}

HostConfig HostConfig::fromFile(const QString& path, QString* errorMessage)
{
    auto fallback = [errorMessage](const QString& message) {
        qWarning() << "HostConfig:" << message;
        if (errorMessage) {
            *errorMessage = message;
        }
        HostConfig config;
        config.applyEnvironment();
        return config;
    };

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return fallback(QStringLiteral("Cannot open %1: %2").arg(path, file.errorString()));
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return fallback(QStringLiteral("Malformed %1 at offset %2: %3")
                            .arg(path)
                            .arg(parseError.offset)
                            .arg(parseError.errorString()));
    }
    if (!doc.isObject()) {
        return fallback(QStringLiteral("%1 does not contain a JSON object").arg(path));
    }

    if (errorMessage) {
        errorMessage->clear();
    }

    HostConfig config = fromJson(doc.object());
    config.applyEnvironment();
    return config;
}

void HostConfig::applyEnvironment()
{
    QByteArray version = qgetenv("GEOCORE_ENGINE_VERSION");
    if (!version.isEmpty()) {
        QVersionNumber parsed = QVersionNumber::fromString(QString::fromUtf8(version));
        if (!parsed.isNull()) {
            engineVersion = parsed;
        } else {
            qWarning() << "HostConfig: Ignoring invalid GEOCORE_ENGINE_VERSION" << version;
        }
    }

    QByteArray dataRoot = qgetenv("GEOCORE_PLUGIN_DATA");
    if (!dataRoot.isEmpty()) {
        pluginDataRoot = QString::fromUtf8(dataRoot);
    }

    QByteArray settingsDir = qgetenv("GEOCORE_SETTINGS_DIR");
    if (!settingsDir.isEmpty()) {
        settingsDirectory = QString::fromUtf8(settingsDir);
    }
}

QString HostConfig::pluginDataDirectory(const QString& pluginId) const
{
    if (pluginDataRoot.isEmpty() || pluginId.isEmpty()) {
        return {};
    }
    return QDir(pluginDataRoot).filePath(pluginId);
}

QString HostConfig::settingsFilePath(const QString& pluginId) const
{
    if (settingsDirectory.isEmpty() || pluginId.isEmpty()) {
        return {};
    }
    return QDir(settingsDirectory).filePath(pluginId + QStringLiteral(".json"));
}

} // namespace geocore
