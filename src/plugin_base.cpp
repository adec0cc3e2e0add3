#include "plugin_base.h"
#include "json_plugin_settings.h"

#include <QDebug>

namespace geocore {

PluginBase::PluginBase(const PluginDescriptor& descriptor,
                       QSharedPointer<IPluginSettings> settings)
    : m_descriptor(descriptor)
    , m_settings(settings ? std::move(settings)
                          : QSharedPointer<IPluginSettings>(QSharedPointer<JsonPluginSettings>::create()))
{
}

PluginBase::~PluginBase() = default;

// =============================================================================
// State
// =============================================================================

PluginState PluginBase::state() const
{
    return static_cast<PluginState>(m_state.loadAcquire());
}

PluginError PluginBase::lastError() const
{
    QMutexLocker locker(&m_dataMutex);
    return m_lastError;
}

void PluginBase::setState(PluginState state)
{
    m_state.storeRelease(static_cast<int>(state));
}

void PluginBase::setLastError(const PluginError& error)
{
    QMutexLocker locker(&m_dataMutex);
    m_lastError = error;
}

void PluginBase::requireState(bool allowed, const char* operation) const
{
    if (!allowed) {
        throw Error(ErrorCode::InvalidState,
                    QStringLiteral("Cannot %1 plugin %2 in state %3")
                        .arg(QLatin1String(operation), m_descriptor.id, pluginStateName(state())));
    }
}

bool PluginBase::runHook(const char* name, const std::function<bool()>& hook)
{
    try {
        if (hook()) {
            return true;
        }
        setLastError({ErrorCode::ExecutionError,
                      QStringLiteral("%1 of %2 reported failure").arg(QLatin1String(name), m_descriptor.id)});
    } catch (const std::exception& e) {
        setLastError({ErrorCode::ExecutionError,
                      QStringLiteral("%1 of %2 threw: %3")
                          .arg(QLatin1String(name), m_descriptor.id, QString::fromUtf8(e.what()))});
    }
    return false;
}

// =============================================================================
// Lifecycle
// =============================================================================

void PluginBase::initialize(IPluginContext* context)
{
    QMutexLocker locker(&m_lifecycleMutex);

    requireState(state() == PluginState::NotInitialized, "initialize");
    if (!context) {
        throw Error(ErrorCode::InvalidArgument,
                    QStringLiteral("Plugin %1 needs a context to initialize").arg(m_descriptor.id));
    }

    m_context = context;
    setLastError({});
    setState(PluginState::Initializing);

    if (!runHook("initialize", [this] { return onInitialize(); })) {
        setState(PluginState::Error);
        throw Error(ErrorCode::ExecutionError, lastError().message);
    }

    setState(PluginState::Initialized);
}

void PluginBase::start()
{
    QMutexLocker locker(&m_lifecycleMutex);

    const PluginState current = state();
    requireState(current == PluginState::Initialized || current == PluginState::Stopped, "start");

    {
        QMutexLocker dataLocker(&m_dataMutex);
        m_stopSource = CancellationSource();
    }

    if (!runHook("start", [this] { return onStart(); })) {
        setState(PluginState::Error);
        throw Error(ErrorCode::ExecutionError, lastError().message);
    }

    setState(PluginState::Started);
}

void PluginBase::stop()
{
    QMutexLocker locker(&m_lifecycleMutex);

    requireState(state() == PluginState::Started, "stop");
    stopLocked();

    if (state() == PluginState::Error) {
        throw Error(ErrorCode::ExecutionError, lastError().message);
    }
}

void PluginBase::stopLocked()
{
    {
        QMutexLocker dataLocker(&m_dataMutex);
        m_stopSource.cancel();
    }

    if (runHook("stop", [this] { return onStop(); })) {
        setState(PluginState::Stopped);
    } else {
        setState(PluginState::Error);
    }
}

void PluginBase::disable()
{
    QMutexLocker locker(&m_lifecycleMutex);

    requireState(state() != PluginState::Disabled, "disable");

    if (state() == PluginState::Started) {
        stopLocked();
    } else {
        QMutexLocker dataLocker(&m_dataMutex);
        m_stopSource.cancel();
    }

    try {
        onDisable();
    } catch (const std::exception& e) {
        qWarning() << "Plugin:" << m_descriptor.id << "disable hook threw:" << e.what();
    }

    m_context = nullptr;
    setState(PluginState::Disabled);
}

void PluginBase::enable()
{
    QMutexLocker locker(&m_lifecycleMutex);

    requireState(state() == PluginState::Disabled, "enable");

    setLastError({});
    setState(PluginState::NotInitialized);
}

void PluginBase::fail(const PluginError& error)
{
    QMutexLocker locker(&m_lifecycleMutex);

    requireState(state() != PluginState::Disabled, "fail");

    {
        QMutexLocker dataLocker(&m_dataMutex);
        m_stopSource.cancel();
        m_lastError = error;
    }
    setState(PluginState::Error);
}

CancellationToken PluginBase::stopToken() const
{
    QMutexLocker locker(&m_dataMutex);
    return m_stopSource.token();
}

// =============================================================================
// Settings
// =============================================================================

QSharedPointer<IPluginSettings> PluginBase::settings() const
{
    QMutexLocker locker(&m_dataMutex);
    return m_settings->clone();
}

void PluginBase::applySettings(const IPluginSettings& settings)
{
    QString message;
    if (!settings.validate(&message)) {
        throw Error(ErrorCode::InvalidArgument,
                    QStringLiteral("Invalid settings for %1: %2").arg(m_descriptor.id, message));
    }

    QSharedPointer<IPluginSettings> copy = settings.clone();
    QMutexLocker locker(&m_dataMutex);
    m_settings = copy;
}

QSharedPointer<JsonPluginSettings> PluginBase::jsonSettings() const
{
    return settings().dynamicCast<JsonPluginSettings>();
}

} // namespace geocore
