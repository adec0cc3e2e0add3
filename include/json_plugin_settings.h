#pragma once

#include <geocore/interfaces/ipluginsettings.h>

#include <QJsonObject>
#include <QJsonValue>
#include <QStringList>

#include <functional>

namespace geocore {

/**
 * @brief Default settings implementation backed by a JSON object
 *
 * Holds the current values and the defaults they are reset to. An optional
 * validator decides whether a set of values is acceptable; without one every
 * object validates.
 */
class JsonPluginSettings : public IPluginSettings
{
public:
    using Validator = std::function<bool(const QJsonObject&, QString*)>;

    explicit JsonPluginSettings(const QJsonObject& defaults = {});

    QJsonValue value(const QString& key, const QJsonValue& defaultValue = {}) const;
    void setValue(const QString& key, const QJsonValue& value);
    bool contains(const QString& key) const { return m_values.contains(key); }
    void remove(const QString& key) { m_values.remove(key); }
    QStringList keys() const { return m_values.keys(); }

    QJsonObject values() const { return m_values; }
    QJsonObject defaults() const { return m_defaults; }

    void setValidator(Validator validator) { m_validator = std::move(validator); }

    // IPluginSettings
    QString toSerializedForm() const override;
    bool fromSerializedForm(const QString& text) override;
    void resetToDefaults() override;
    bool validate(QString* errorMessage = nullptr) const override;
    QSharedPointer<IPluginSettings> clone() const override;

private:
    QJsonObject m_defaults;
    QJsonObject m_values;
    Validator m_validator;
};

} // namespace geocore
