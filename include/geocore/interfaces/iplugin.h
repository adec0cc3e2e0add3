#pragma once

#include <geocore/errors.h>

#include <QFlags>
#include <QJsonObject>
#include <QMetaType>
#include <QSharedPointer>
#include <QStringList>
#include <QVersionNumber>

namespace geocore {

class IPluginContext;
class IPluginSettings;
class IToolCapability;
class IAnalysisCapability;
class IDataProviderCapability;

/**
 * @brief Plugin lifecycle states
 *
 *   NotInitialized -> Initializing -> Initialized -> Started <-> Stopped
 *
 * Error and Disabled are reachable from any other state.
 */
enum class PluginState {
    NotInitialized,
    Initializing,
    Initialized,
    Started,
    Stopped,
    Error,
    Disabled
};

QString pluginStateName(PluginState state);

enum class PluginType {
    Tool         = 0x01,
    DataProvider = 0x02,
    Analysis     = 0x04,
    Renderer     = 0x08,
    Converter    = 0x10,
    UIExtension  = 0x20,
    Service      = 0x40
};
Q_DECLARE_FLAGS(PluginTypes, PluginType)

QStringList pluginTypeNames(PluginTypes types);
PluginTypes pluginTypesFromNames(const QStringList& names);

/**
 * @brief Self-description of a plugin
 *
 * Can be filled in code or read from the JSON metadata shipped with a
 * plugin:
 * @code
 * {
 *     "id": "com.example.measure",
 *     "name": "Measure",
 *     "version": "1.2.0",
 *     "minEngineVersion": "1.0",
 *     "types": ["Tool"],
 *     "dependencies": ["com.example.units"]
 * }
 * @endcode
 */
struct PluginDescriptor {
    QString id;
    QString name;
    QString description;
    QVersionNumber version{1, 0, 0};
    QString author;
    PluginTypes types;
    QVersionNumber minEngineVersion{1, 0};
    QStringList dependencies;

    static PluginDescriptor fromJson(const QJsonObject& json);
    QJsonObject toJson() const;

    // Empty when the descriptor is usable
    QStringList validate() const;
};

/**
 * @brief Contract every plugin exposes to the host
 *
 * Lifecycle calls are made by PluginManager only. Disallowed transitions
 * throw Error(InvalidState); a failing hook leaves the plugin in Error and
 * throws Error(ExecutionError).
 *
 * Category-specific behaviour is reached through the capability accessors,
 * which return null when the plugin does not support that category.
 */
class IPlugin
{
public:
    virtual ~IPlugin() = default;

    virtual const PluginDescriptor& descriptor() const = 0;

    QString id() const { return descriptor().id; }
    QString name() const { return descriptor().name; }
    PluginTypes types() const { return descriptor().types; }
    QStringList dependencies() const { return descriptor().dependencies; }

    virtual PluginState state() const = 0;
    virtual PluginError lastError() const = 0;

    virtual void initialize(IPluginContext* context) = 0;
    virtual void start() = 0;
    virtual void stop() = 0;
    virtual void disable() = 0;
    virtual void enable() = 0;
    virtual void fail(const PluginError& error) = 0;

    // Settings may be read and applied in any state
    virtual QSharedPointer<IPluginSettings> settings() const = 0;
    virtual void applySettings(const IPluginSettings& settings) = 0;

    virtual IToolCapability* toolCapability() { return nullptr; }
    virtual IAnalysisCapability* analysisCapability() { return nullptr; }
    virtual IDataProviderCapability* dataProviderCapability() { return nullptr; }
};

using PluginPtr = QSharedPointer<IPlugin>;

} // namespace geocore

Q_DECLARE_OPERATORS_FOR_FLAGS(geocore::PluginTypes)
Q_DECLARE_METATYPE(geocore::PluginState)
