#include "plugin_logger.h"

namespace geocore {

Q_LOGGING_CATEGORY(lcPlugin, "geocore.plugin")

PluginLogger::PluginLogger(const QString& pluginId)
    : m_pluginId(pluginId)
{
}

void PluginLogger::debug(const QString& message)
{
    qCDebug(lcPlugin).noquote() << "[" + m_pluginId + "]" << message;
}

void PluginLogger::info(const QString& message)
{
    qCInfo(lcPlugin).noquote() << "[" + m_pluginId + "]" << message;
}

void PluginLogger::warning(const QString& message)
{
    qCWarning(lcPlugin).noquote() << "[" + m_pluginId + "]" << message;
}

void PluginLogger::error(const QString& message, const std::exception* exception)
{
    if (exception) {
        qCCritical(lcPlugin).noquote() << "[" + m_pluginId + "]" << message
                                       << ":" << exception->what();
    } else {
        qCCritical(lcPlugin).noquote() << "[" + m_pluginId + "]" << message;
    }
}

} // namespace geocore
