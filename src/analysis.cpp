#include <geocore/interfaces/ianalysiscapability.h>

namespace geocore {

AnalysisResult AnalysisResult::succeeded(const QVariantMap& results)
{
    AnalysisResult result;
    result.success = true;
    result.results = results;
    return result;
}

AnalysisResult AnalysisResult::failed(ErrorCode code, const QString& message)
{
    AnalysisResult result;
    result.success = false;
    result.errorCode = code;
    result.errorMessage = message;
    return result;
}

bool validateParameterValues(const QList<AnalysisParameter>& parameters,
                             const QVariantMap& values,
                             QString* errorMessage)
{
    auto reject = [errorMessage](const QString& message) {
        if (errorMessage) {
            *errorMessage = message;
        }
        return false;
    };

    for (const AnalysisParameter& parameter : parameters) {
        auto it = values.constFind(parameter.name);
        if (it == values.constEnd()) {
            if (parameter.required) {
                return reject(QStringLiteral("Missing required parameter '%1'").arg(parameter.name));
            }
            continue;
        }

        QVariant value = it.value();
        if (parameter.type != QMetaType::UnknownType && !value.convert(QMetaType(parameter.type))) {
            return reject(QStringLiteral("Parameter '%1' must be of type %2")
                              .arg(parameter.name,
                                   QString::fromLatin1(QMetaType(parameter.type).name())));
        }

        if (parameter.minValue.isValid() && value.toDouble() < parameter.minValue.toDouble()) {
            return reject(QStringLiteral("Parameter '%1' is below the minimum %2")
                              .arg(parameter.name, parameter.minValue.toString()));
        }
        if (parameter.maxValue.isValid() && value.toDouble() > parameter.maxValue.toDouble()) {
            return reject(QStringLiteral("Parameter '%1' is above the maximum %2")
                              .arg(parameter.name, parameter.maxValue.toString()));
        }
        if (!parameter.allowedValues.isEmpty() && !parameter.allowedValues.contains(value)) {
            return reject(QStringLiteral("Parameter '%1' has a value outside the allowed set")
                              .arg(parameter.name));
        }
    }

    if (errorMessage) {
        errorMessage->clear();
    }
    return true;
}

} // namespace geocore
