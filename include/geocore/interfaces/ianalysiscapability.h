#pragma once

#include <geocore/cancellation.h>
#include <geocore/errors.h>

#include <QList>
#include <QMetaType>
#include <QString>
#include <QVariant>
#include <QVariantList>
#include <QVariantMap>

#include <functional>

namespace geocore {

/**
 * @brief Declared input of an analysis
 */
struct AnalysisParameter {
    QString name;
    QString displayName;
    QString description;
    QMetaType::Type type = QMetaType::UnknownType;
    QVariant defaultValue;
    bool required = false;
    QVariant minValue;
    QVariant maxValue;
    QVariantList allowedValues;
};

struct ProgressInfo {
    int progress = 0;       // 0..100
    QString message;
    bool canCancel = true;
};

using ProgressHandler = std::function<void(const ProgressInfo&)>;

struct AnalysisResult {
    bool success = false;
    ErrorCode errorCode = ErrorCode::None;
    QString errorMessage;
    QVariantMap results;
    qint64 executionTimeMs = 0;

    bool isCancelled() const { return errorCode == ErrorCode::Cancelled; }

    static AnalysisResult succeeded(const QVariantMap& results);
    static AnalysisResult failed(ErrorCode code, const QString& message);
};

/**
 * @brief Checks @p values against declared parameters
 *
 * Required parameters must be present, values must convert to the declared
 * type, lie within min/max and belong to the allowed set when one is given.
 * Has no side effects.
 */
bool validateParameterValues(const QList<AnalysisParameter>& parameters,
                             const QVariantMap& values,
                             QString* errorMessage = nullptr);

/**
 * @brief Long-running, cancellable analysis behaviour
 *
 * execute() runs on a worker thread. It should poll @p token and report
 * progress through @p progress; returning normally after observing the
 * token is enough, the host turns that into a Cancelled result.
 */
class IAnalysisCapability
{
public:
    virtual ~IAnalysisCapability() = default;

    virtual QString analysisName() const = 0;
    virtual QList<AnalysisParameter> parameters() const = 0;

    virtual bool validateParameters(const QVariantMap& values, QString* errorMessage) const
    {
        return validateParameterValues(parameters(), values, errorMessage);
    }

    virtual AnalysisResult execute(const QVariantMap& values,
                                   const CancellationToken& token,
                                   const ProgressHandler& progress) = 0;
};

} // namespace geocore

Q_DECLARE_METATYPE(geocore::ProgressInfo)
Q_DECLARE_METATYPE(geocore::AnalysisResult)
