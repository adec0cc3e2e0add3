#include "json_plugin_settings.h"

#include <QJsonDocument>
#include <QJsonParseError>
#include <QDebug>

namespace geocore {

JsonPluginSettings::JsonPluginSettings(const QJsonObject& defaults)
    : m_defaults(defaults)
    , m_values(defaults)
{
}

QJsonValue JsonPluginSettings::value(const QString& key, const QJsonValue& defaultValue) const
{
    auto it = m_values.constFind(key);
    if (it == m_values.constEnd()) {
        return defaultValue;
    }
    return it.value();
}

void JsonPluginSettings::setValue(const QString& key, const QJsonValue& value)
{
    m_values.insert(key, value);
}

QString JsonPluginSettings::toSerializedForm() const
{
    return QString::fromUtf8(QJsonDocument(m_values).toJson(QJsonDocument::Indented));
}

bool JsonPluginSettings::fromSerializedForm(const QString& text)
{
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(text.toUtf8(), &parseError);

    if (parseError.error != QJsonParseError::NoError) {
        qWarning() << "PluginSettings: Malformed settings at offset" << parseError.offset
                   << ":" << parseError.errorString();
        return false;
    }
    if (!doc.isObject()) {
        qWarning() << "PluginSettings: Settings must be a JSON object";
        return false;
    }

    m_values = doc.object();
    return true;
}

void JsonPluginSettings::resetToDefaults()
{
    m_values = m_defaults;
}

bool JsonPluginSettings::validate(QString* errorMessage) const
{
    if (!m_validator) {
        if (errorMessage) {
            errorMessage->clear();
        }
        return true;
    }
    return m_validator(m_values, errorMessage);
}

QSharedPointer<IPluginSettings> JsonPluginSettings::clone() const
{
    return QSharedPointer<JsonPluginSettings>::create(*this);
}

} // namespace geocore
