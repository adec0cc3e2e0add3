#pragma once

#include <QSharedPointer>
#include <QString>

namespace geocore {

/**
 * @brief Persistable plugin configuration
 *
 * The serialized form is JSON text; it is the only persisted state the
 * core defines.
 */
class IPluginSettings
{
public:
    virtual ~IPluginSettings() = default;

    virtual QString toSerializedForm() const = 0;

    // Returns false and leaves the settings unchanged on malformed input
    virtual bool fromSerializedForm(const QString& text) = 0;

    virtual void resetToDefaults() = 0;
    virtual bool validate(QString* errorMessage = nullptr) const = 0;

    virtual QSharedPointer<IPluginSettings> clone() const = 0;
};

} // namespace geocore
