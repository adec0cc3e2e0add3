#include <geocore/errors.h>

namespace geocore {

QString errorCodeName(ErrorCode code)
{
    switch (code) {
    case ErrorCode::None:            return QStringLiteral("None");
    case ErrorCode::InvalidArgument: return QStringLiteral("InvalidArgument");
    case ErrorCode::InvalidState:    return QStringLiteral("InvalidState");
    case ErrorCode::DependencyError: return QStringLiteral("DependencyError");
    case ErrorCode::VersionError:    return QStringLiteral("VersionError");
    case ErrorCode::ExecutionError:  return QStringLiteral("ExecutionError");
    case ErrorCode::Cancelled:       return QStringLiteral("Cancelled");
    }
    return QStringLiteral("Unknown");
}

Error::Error(ErrorCode code, const QString& message)
    : std::runtime_error(message.toStdString())
    , m_code(code)
{
}

QString PluginError::toString() const
{
    if (!isError()) {
        return QString();
    }
    return QStringLiteral("%1: %2").arg(errorCodeName(code), message);
}

PluginError PluginError::fromException(const std::exception& e, ErrorCode fallback)
{
    if (const auto* error = dynamic_cast<const Error*>(&e)) {
        return {error->code(), error->message()};
    }
    return {fallback, QString::fromUtf8(e.what())};
}

} // namespace geocore
