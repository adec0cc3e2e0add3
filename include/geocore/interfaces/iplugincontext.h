#pragma once

#include <QSharedPointer>
#include <QString>
#include <QStringList>

namespace geocore {

class FeatureStore;
class IEventBus;
class IPluginLogger;
class PluginManager;

/**
 * @brief Map canvas owned by the host UI; opaque to the core
 */
class IMapCanvas
{
public:
    virtual ~IMapCanvas() = default;
};

/**
 * @brief Layers of the current map, each backed by a feature store
 */
class ILayerCollection
{
public:
    virtual ~ILayerCollection() = default;

    virtual QStringList layerNames() const = 0;
    virtual QSharedPointer<FeatureStore> featureStore(const QString& layerName) const = 0;
};

/**
 * @brief Host services handed to a plugin at initialize()
 *
 * Every plugin receives its own context; the canvas, layers, event bus and
 * plugin manager behind it are shared by all plugins. Any handle except the
 * logger may be null when the host does not provide that service.
 */
class IPluginContext
{
public:
    virtual ~IPluginContext() = default;

    virtual IMapCanvas* mapCanvas() const = 0;
    virtual ILayerCollection* layers() const = 0;
    virtual PluginManager* pluginManager() const = 0;
    virtual IEventBus* eventBus() const = 0;
    virtual IPluginLogger* logger() const = 0;
    virtual QString pluginDataDirectory() const = 0;
};

} // namespace geocore
