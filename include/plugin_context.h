#pragma once

#include "plugin_logger.h"

#include <geocore/interfaces/iplugincontext.h>

namespace geocore {

/**
 * @brief Per-plugin context created by PluginManager
 *
 * Shares the host services and owns the plugin's logger.
 */
class PluginContext : public IPluginContext
{
public:
    PluginContext(const QString& pluginId,
                  PluginManager* manager,
                  IEventBus* eventBus,
                  IMapCanvas* mapCanvas,
                  ILayerCollection* layers,
                  const QString& dataDirectory);

    IMapCanvas* mapCanvas() const override { return m_mapCanvas; }
    ILayerCollection* layers() const override { return m_layers; }
    PluginManager* pluginManager() const override { return m_manager; }
    IEventBus* eventBus() const override { return m_eventBus; }
    IPluginLogger* logger() const override { return &m_logger; }
    QString pluginDataDirectory() const override { return m_dataDirectory; }

private:
    PluginManager* m_manager;
    IEventBus* m_eventBus;
    IMapCanvas* m_mapCanvas;
    ILayerCollection* m_layers;
    QString m_dataDirectory;
    mutable PluginLogger m_logger;
};

} // namespace geocore
