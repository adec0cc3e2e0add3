#pragma once

#include <geocore/interfaces/ipluginlogger.h>

#include <QLoggingCategory>

namespace geocore {

Q_DECLARE_LOGGING_CATEGORY(lcPlugin)

/**
 * @brief IPluginLogger routed to the "geocore.plugin" logging category
 *
 * Every message is prefixed with the owning plugin's id so output of
 * several plugins can be told apart.
 */
class PluginLogger : public IPluginLogger
{
public:
    explicit PluginLogger(const QString& pluginId);

    QString pluginId() const { return m_pluginId; }

    void debug(const QString& message) override;
    void info(const QString& message) override;
    void warning(const QString& message) override;
    void error(const QString& message, const std::exception* exception = nullptr) override;

private:
    QString m_pluginId;
};

} // namespace geocore
