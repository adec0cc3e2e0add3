#pragma once

#include <QString>

#include <exception>

namespace geocore {

class IPluginLogger
{
public:
    virtual ~IPluginLogger() = default;

    virtual void debug(const QString& message) = 0;
    virtual void info(const QString& message) = 0;
    virtual void warning(const QString& message) = 0;
    virtual void error(const QString& message, const std::exception* exception = nullptr) = 0;
};

} // namespace geocore
