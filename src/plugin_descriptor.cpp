#include <geocore/interfaces/iplugin.h>

#include <QJsonArray>
#include <QSet>

namespace geocore {

namespace {

struct TypeName {
    PluginType type;
    const char* name;
};

const TypeName kTypeNames[] = {
    {PluginType::Tool, "Tool"},
    {PluginType::DataProvider, "DataProvider"},
    {PluginType::Analysis, "Analysis"},
    {PluginType::Renderer, "Renderer"},
    {PluginType::Converter, "Converter"},
    {PluginType::UIExtension, "UIExtension"},
    {PluginType::Service, "Service"},
};

} // namespace

QString pluginStateName(PluginState state)
{
    switch (state) {
    case PluginState::NotInitialized: return QStringLiteral("NotInitialized");
    case PluginState::Initializing:   return QStringLiteral("Initializing");
    case PluginState::Initialized:    return QStringLiteral("Initialized");
    case PluginState::Started:        return QStringLiteral("Started");
    case PluginState::Stopped:        return QStringLiteral("Stopped");
    case PluginState::Error:          return QStringLiteral("Error");
    case PluginState::Disabled:       return QStringLiteral("Disabled");
    }
    return QStringLiteral("Unknown");
}

QStringList pluginTypeNames(PluginTypes types)
{
    QStringList names;
    for (const TypeName& entry : kTypeNames) {
        if (types.testFlag(entry.type)) {
            names.append(QString::fromLatin1(entry.name));
        }
    }
    return names;
}

PluginTypes pluginTypesFromNames(const QStringList& names)
{
    PluginTypes types;
    for (const QString& name : names) {
        for (const TypeName& entry : kTypeNames) {
            if (name.compare(QLatin1String(entry.name), Qt::CaseInsensitive) == 0) {
                types |= entry.type;
            }
        }
    }
    return types;
}

PluginDescriptor PluginDescriptor::fromJson(const QJsonObject& json)
{
    PluginDescriptor descriptor;
    descriptor.id = json.value(QLatin1String("id")).toString();
    descriptor.name = json.value(QLatin1String("name")).toString(descriptor.id);
    descriptor.description = json.value(QLatin1String("description")).toString();
    descriptor.author = json.value(QLatin1String("author")).toString();

    if (json.contains(QLatin1String("version"))) {
        descriptor.version = QVersionNumber::fromString(json.value(QLatin1String("version")).toString());
    }
    if (json.contains(QLatin1String("minEngineVersion"))) {
        descriptor.minEngineVersion =
            QVersionNumber::fromString(json.value(QLatin1String("minEngineVersion")).toString());
    }

    QStringList typeNames;
    for (const QJsonValue& value : json.value(QLatin1String("types")).toArray()) {
        typeNames.append(value.toString());
    }
    descriptor.types = pluginTypesFromNames(typeNames);

    for (const QJsonValue& value : json.value(QLatin1String("dependencies")).toArray()) {
        descriptor.dependencies.append(value.toString());
    }

    return descriptor;
}

QJsonObject PluginDescriptor::toJson() const
{
    QJsonObject json;
    json[QLatin1String("id")] = id;
    json[QLatin1String("name")] = name;
    json[QLatin1String("description")] = description;
    json[QLatin1String("version")] = version.toString();
    json[QLatin1String("author")] = author;
    json[QLatin1String("minEngineVersion")] = minEngineVersion.toString();
    json[QLatin1String("types")] = QJsonArray::fromStringList(pluginTypeNames(types));
    json[QLatin1String("dependencies")] = QJsonArray::fromStringList(dependencies);
    return json;
}

QStringList PluginDescriptor::validate() const
{
    QStringList errors;

    if (id.isEmpty()) {
        errors.append(QStringLiteral("Plugin id is empty"));
    }
    if (version.isNull()) {
        errors.append(QStringLiteral("Plugin %1 has no valid version").arg(id));
    }

    QSet<QString> seen;
    for (const QString& dependency : dependencies) {
        if (dependency.isEmpty()) {
            errors.append(QStringLiteral("Plugin %1 declares an empty dependency").arg(id));
        } else if (seen.contains(dependency)) {
            errors.append(QStringLiteral("Plugin %1 lists dependency %2 twice").arg(id, dependency));
        }
        seen.insert(dependency);
    }

    return errors;
}

} // namespace geocore
