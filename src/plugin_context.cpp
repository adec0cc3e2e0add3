#include "plugin_context.h"

namespace geocore {

PluginContext::PluginContext(const QString& pluginId,
                             PluginManager* manager,
                             IEventBus* eventBus,
                             IMapCanvas* mapCanvas,
                             ILayerCollection* layers,
                             const QString& dataDirectory)
    : m_manager(manager)
    , m_eventBus(eventBus)
    , m_mapCanvas(mapCanvas)
    , m_layers(layers)
    , m_dataDirectory(dataDirectory)
    , m_logger(pluginId)
{
}

} // namespace geocore
