#pragma once

#include <QMetaType>
#include <QString>

#include <stdexcept>

namespace geocore {

/**
 * @brief Error kinds shared by the data model and the plugin runtime
 */
enum class ErrorCode {
    None,
    InvalidArgument,    // null/absent required input, index out of range
    InvalidState,       // lifecycle call from a disallowed state
    DependencyError,    // missing, disabled, failed or cyclic dependency
    VersionError,       // host older than the plugin's minimum engine version
    ExecutionError,     // plugin hook, analysis or provider operation failed
    Cancelled           // cooperative cancellation observed
};

QString errorCodeName(ErrorCode code);

/**
 * @brief Exception thrown for contract violations
 *
 * "Not found" is never reported through this type; lookups return
 * null/empty results instead.
 */
class Error : public std::runtime_error
{
public:
    Error(ErrorCode code, const QString& message);

    ErrorCode code() const noexcept { return m_code; }
    QString message() const { return QString::fromUtf8(what()); }

private:
    ErrorCode m_code;
};

/**
 * @brief Structured failure record used for supervision results
 */
struct PluginError {
    ErrorCode code = ErrorCode::None;
    QString message;

    bool isError() const { return code != ErrorCode::None; }
    QString toString() const;

    static PluginError fromException(const std::exception& e,
                                     ErrorCode fallback = ErrorCode::ExecutionError);
};

} // namespace geocore

Q_DECLARE_METATYPE(geocore::ErrorCode)
Q_DECLARE_METATYPE(geocore::PluginError)
