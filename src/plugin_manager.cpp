#include "plugin_manager.h"
#include "event_bus_service.h"
#include "feature_store.h"
#include "plugin_context.h"

#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QSaveFile>
#include <QSet>
#include <QtConcurrent/QtConcurrentRun>
#include <QDebug>

#include <algorithm>

namespace geocore {

namespace {

const QString kHostSenderId = QStringLiteral("geocore.host");

PluginError unknownPlugin(const QString& id)
{
    return {ErrorCode::InvalidArgument, QStringLiteral("Unknown plugin %1").arg(id)};
}

bool isReady(PluginState state)
{
    return state == PluginState::Initialized
        || state == PluginState::Started
        || state == PluginState::Stopped;
}

} // namespace

PluginManager::PluginManager(const HostConfig& config, QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_eventBus(new EventBusService(this))
{
    qRegisterMetaType<geocore::PluginState>();
    qRegisterMetaType<geocore::PluginError>();
    qRegisterMetaType<geocore::ErrorCode>();
    qRegisterMetaType<geocore::ProgressInfo>();
    qRegisterMetaType<geocore::AnalysisResult>();

    if (m_config.workerThreads > 0) {
        m_pool.setMaxThreadCount(m_config.workerThreads);
    }
}

PluginManager::~PluginManager()
{
    QList<PluginPtr> remaining;
    {
        QMutexLocker locker(&m_mutex);
        for (PluginEntry& entry : m_plugins) {
            entry.work.cancel();
            remaining.append(entry.plugin);
        }
    }

    stopAll().waitForFinished();
    m_pool.waitForDone();

    // Plugins may outlive the manager; they must not keep its contexts
    for (const PluginPtr& plugin : remaining) {
        if (plugin->state() == PluginState::Disabled) {
            continue;
        }
        try {
            plugin->disable();
        } catch (const std::exception& e) {
            qWarning() << "PluginManager: Disposing" << plugin->id() << "failed:" << e.what();
        }
    }
}

void PluginManager::setMapCanvas(IMapCanvas* canvas)
{
    QMutexLocker locker(&m_mutex);
    m_mapCanvas = canvas;
}

void PluginManager::setLayerCollection(ILayerCollection* layers)
{
    QMutexLocker locker(&m_mutex);
    m_layers = layers;
}

// =============================================================================
// Registration
// =============================================================================

PluginError PluginManager::registerPlugin(const PluginPtr& plugin)
{
    auto reject = [this](const QString& id, const PluginError& error) {
        qWarning() << "PluginManager: Rejected plugin" << id << "-" << error.toString();
        emit pluginError(id, error);
        return error;
    };

    if (!plugin) {
        return reject(QString(), {ErrorCode::InvalidArgument,
                                  QStringLiteral("Cannot register a null plugin")});
    }

    const PluginDescriptor& descriptor = plugin->descriptor();
    const QString id = descriptor.id;

    const QStringList problems = descriptor.validate();
    if (!problems.isEmpty()) {
        return reject(id, {ErrorCode::InvalidArgument,
                           QStringLiteral("Invalid descriptor for %1: %2")
                               .arg(id, problems.join(QStringLiteral("; ")))});
    }

    if (descriptor.minEngineVersion.normalized() > m_config.engineVersion.normalized()) {
        return reject(id, {ErrorCode::VersionError,
                           QStringLiteral("Plugin %1 requires engine %2, host provides %3")
                               .arg(id,
                                    descriptor.minEngineVersion.toString(),
                                    m_config.engineVersion.toString())});
    }

    {
        QMutexLocker locker(&m_mutex);
        if (m_plugins.contains(id)) {
            locker.unlock();
            return reject(id, {ErrorCode::InvalidArgument,
                               QStringLiteral("Duplicate plugin ID: %1").arg(id)});
        }
        m_plugins.insert(id, PluginEntry{plugin, {}, {}});
        m_registrationOrder.append(id);
    }

    qDebug() << "PluginManager: Registered" << id << descriptor.version.toString()
             << "types:" << pluginTypeNames(descriptor.types);
    emit pluginRegistered(id);

    const QString settingsPath = m_config.settingsFilePath(id);
    if (!settingsPath.isEmpty() && QFile::exists(settingsPath)) {
        loadPluginSettings(id);
    }

    return {};
}

// =============================================================================
// Dependency resolution
// =============================================================================

QStringList PluginManager::resolveLoadOrder()
{
    QMutexLocker locker(&m_operationMutex);
    return resolveLocked();
}

QStringList PluginManager::resolveLocked()
{
    QStringList registration;
    QHash<QString, PluginPtr> all;
    {
        QMutexLocker locker(&m_mutex);
        registration = m_registrationOrder;
        for (auto it = m_plugins.constBegin(); it != m_plugins.constEnd(); ++it) {
            all.insert(it.key(), it->plugin);
        }
    }

    QHash<QString, int> rank;
    for (int i = 0; i < registration.size(); ++i) {
        rank.insert(registration.at(i), i);
    }

    QStringList candidates;
    for (const QString& id : registration) {
        const PluginState state = all.value(id)->state();
        if (state != PluginState::Disabled && state != PluginState::Error) {
            candidates.append(id);
        }
    }

    // Direct problems: missing, disabled or failed dependencies
    QHash<QString, PluginError> failures;
    for (const QString& id : candidates) {
        for (const QString& dep : all.value(id)->dependencies()) {
            QString reason;
            if (!all.contains(dep)) {
                reason = QStringLiteral("depends on missing plugin %1");
            } else if (all.value(dep)->state() == PluginState::Disabled) {
                reason = QStringLiteral("depends on disabled plugin %1");
            } else if (all.value(dep)->state() == PluginState::Error) {
                reason = QStringLiteral("depends on failed plugin %1");
            }
            if (!reason.isEmpty()) {
                failures.insert(id, {ErrorCode::DependencyError,
                                     QStringLiteral("Plugin %1 ").arg(id) + reason.arg(dep)});
                break;
            }
        }
    }

    // Anything depending on a failure fails too
    bool changed = true;
    while (changed) {
        changed = false;
        for (const QString& id : candidates) {
            if (failures.contains(id)) {
                continue;
            }
            for (const QString& dep : all.value(id)->dependencies()) {
                if (failures.contains(dep)) {
                    failures.insert(id, {ErrorCode::DependencyError,
                                         QStringLiteral("Plugin %1 depends on failed dependency %2")
                                             .arg(id, dep)});
                    changed = true;
                    break;
                }
            }
        }
    }

    // Kahn's algorithm, ready set ordered by registration
    QStringList remaining;
    QHash<QString, int> inDegree;
    QHash<QString, QStringList> dependents;
    for (const QString& id : candidates) {
        if (!failures.contains(id)) {
            remaining.append(id);
            inDegree.insert(id, 0);
        }
    }
    for (const QString& id : remaining) {
        for (const QString& dep : all.value(id)->dependencies()) {
            inDegree[id]++;
            dependents[dep].append(id);
        }
    }

    QStringList ready;
    for (const QString& id : remaining) {
        if (inDegree.value(id) == 0) {
            ready.append(id);
        }
    }

    auto byRegistration = [&rank](const QString& a, const QString& b) {
        return rank.value(a) < rank.value(b);
    };

    QStringList order;
    while (!ready.isEmpty()) {
        const QString id = ready.takeFirst();
        order.append(id);
        bool added = false;
        for (const QString& dependent : dependents.value(id)) {
            if (--inDegree[dependent] == 0) {
                ready.append(dependent);
                added = true;
            }
        }
        if (added) {
            std::sort(ready.begin(), ready.end(), byRegistration);
        }
    }

    // Whatever is left sits on a cycle or behind one
    const QSet<QString> ordered(order.cbegin(), order.cend());
    QSet<QString> leftover;
    for (const QString& id : remaining) {
        if (!ordered.contains(id)) {
            leftover.insert(id);
        }
    }

    auto onCycle = [&](const QString& start) {
        QSet<QString> visited;
        QStringList stack = all.value(start)->dependencies();
        while (!stack.isEmpty()) {
            const QString current = stack.takeLast();
            if (current == start) {
                return true;
            }
            if (!leftover.contains(current) || visited.contains(current)) {
                continue;
            }
            visited.insert(current);
            stack.append(all.value(current)->dependencies());
        }
        return false;
    };

    for (const QString& id : remaining) {
        if (!leftover.contains(id)) {
            continue;
        }
        if (onCycle(id)) {
            failures.insert(id, {ErrorCode::DependencyError,
                                 QStringLiteral("Circular dependency detected involving %1").arg(id)});
        } else {
            failures.insert(id, {ErrorCode::DependencyError,
                                 QStringLiteral("Plugin %1 depends on a circular dependency").arg(id)});
        }
    }

    for (const QString& id : candidates) {
        auto it = failures.constFind(id);
        if (it != failures.constEnd()) {
            failPlugin(all.value(id), it.value());
        }
    }

    qDebug() << "PluginManager: Load order" << order;
    return order;
}

QStringList PluginManager::dependenciesOf(const QString& id) const
{
    QStringList result;
    QSet<QString> visited;

    std::function<void(const QString&)> visit = [&](const QString& current) {
        PluginPtr plugin = findPlugin(current);
        if (!plugin) {
            return;
        }
        for (const QString& dep : plugin->dependencies()) {
            if (visited.contains(dep) || dep == id) {
                continue;
            }
            visited.insert(dep);
            visit(dep);
            if (findPlugin(dep)) {
                result.append(dep);
            }
        }
    };

    visit(id);
    return result;
}

QStringList PluginManager::dependentsOf(const QString& id) const
{
    QStringList registration;
    {
        QMutexLocker locker(&m_mutex);
        registration = m_registrationOrder;
    }

    QSet<QString> affected{id};
    bool changed = true;
    while (changed) {
        changed = false;
        for (const QString& candidate : registration) {
            if (affected.contains(candidate)) {
                continue;
            }
            PluginPtr plugin = findPlugin(candidate);
            if (!plugin) {
                continue;
            }
            for (const QString& dep : plugin->dependencies()) {
                if (affected.contains(dep)) {
                    affected.insert(candidate);
                    changed = true;
                    break;
                }
            }
        }
    }

    QStringList result;
    for (const QString& candidate : registration) {
        if (candidate != id && affected.contains(candidate)) {
            result.append(candidate);
        }
    }
    return result;
}

// =============================================================================
// Lifecycle
// =============================================================================

QFuture<bool> PluginManager::startAll()
{
    return QtConcurrent::run(&m_pool, [this]() {
        QMutexLocker locker(&m_operationMutex);

        const QStringList order = resolveLocked();

        for (const QString& id : order) {
            PluginPtr plugin = findPlugin(id);
            if (!plugin) {
                continue;
            }
            const PluginState state = plugin->state();
            if (state == PluginState::Started || state == PluginState::Error
                || state == PluginState::Disabled) {
                continue;
            }
            doStart(id);
        }

        bool allStarted = true;
        for (const PluginPtr& plugin : plugins()) {
            const PluginState state = plugin->state();
            if (state != PluginState::Started && state != PluginState::Disabled) {
                allStarted = false;
            }
        }

        qDebug() << "PluginManager: Started" << startOrder();
        return allStarted;
    });
}

QFuture<void> PluginManager::stopAll()
{
    return QtConcurrent::run(&m_pool, [this]() {
        QMutexLocker locker(&m_operationMutex);

        // Stop in reverse start order
        QStringList order = startOrder();
        std::reverse(order.begin(), order.end());

        for (const QString& id : order) {
            PluginPtr plugin = findPlugin(id);
            if (!plugin || plugin->state() != PluginState::Started) {
                continue;
            }
            cancelWork(id);
            invoke(plugin, [&plugin]() { plugin->stop(); });
        }
    });
}

QFuture<PluginError> PluginManager::initializePlugin(const QString& id)
{
    return QtConcurrent::run(&m_pool, [this, id]() {
        QMutexLocker locker(&m_operationMutex);
        return doInitialize(id);
    });
}

QFuture<PluginError> PluginManager::startPlugin(const QString& id)
{
    return QtConcurrent::run(&m_pool, [this, id]() {
        QMutexLocker locker(&m_operationMutex);
        return doStart(id);
    });
}

QFuture<PluginError> PluginManager::stopPlugin(const QString& id)
{
    return QtConcurrent::run(&m_pool, [this, id]() {
        QMutexLocker locker(&m_operationMutex);
        return doStop(id);
    });
}

QFuture<PluginError> PluginManager::disablePlugin(const QString& id)
{
    return QtConcurrent::run(&m_pool, [this, id]() {
        QMutexLocker locker(&m_operationMutex);
        return doDisable(id);
    });
}

QFuture<PluginError> PluginManager::enablePlugin(const QString& id)
{
    return QtConcurrent::run(&m_pool, [this, id]() {
        QMutexLocker locker(&m_operationMutex);
        return doEnable(id);
    });
}

QFuture<PluginError> PluginManager::unloadPlugin(const QString& id)
{
    return QtConcurrent::run(&m_pool, [this, id]() {
        QMutexLocker locker(&m_operationMutex);
        return doUnload(id);
    });
}

PluginError PluginManager::doInitialize(const QString& id)
{
    PluginPtr plugin = findPlugin(id);
    if (!plugin) {
        return unknownPlugin(id);
    }

    for (const QString& dep : plugin->dependencies()) {
        PluginPtr depPlugin = findPlugin(dep);
        if (!depPlugin || !isReady(depPlugin->state())) {
            PluginError error{ErrorCode::DependencyError,
                              QStringLiteral("Dependency %1 of %2 is not initialized").arg(dep, id)};
            recordError(id, error);
            return error;
        }
    }

    QSharedPointer<PluginContext> context = contextFor(id);
    PluginError error = invoke(plugin, [&]() { plugin->initialize(context.data()); });

    if (plugin->state() == PluginState::Error) {
        failDependents(id);
    }
    return error;
}

PluginError PluginManager::doStart(const QString& id)
{
    PluginPtr plugin = findPlugin(id);
    if (!plugin) {
        return unknownPlugin(id);
    }

    if (plugin->state() == PluginState::NotInitialized) {
        PluginError error = doInitialize(id);
        if (error.isError()) {
            return error;
        }
    }

    for (const QString& dep : plugin->dependencies()) {
        PluginPtr depPlugin = findPlugin(dep);
        if (!depPlugin || depPlugin->state() != PluginState::Started) {
            PluginError error{ErrorCode::DependencyError,
                              QStringLiteral("Dependency %1 of %2 is not started").arg(dep, id)};
            recordError(id, error);
            return error;
        }
    }

    PluginError error = invoke(plugin, [&plugin]() { plugin->start(); });

    if (plugin->state() == PluginState::Error) {
        failDependents(id);
    }
    return error;
}

PluginError PluginManager::doStop(const QString& id)
{
    PluginPtr plugin = findPlugin(id);
    if (!plugin) {
        return unknownPlugin(id);
    }

    if (plugin->state() == PluginState::Started) {
        stopStartedDependents(id);
    }
    cancelWork(id);
    return invoke(plugin, [&plugin]() { plugin->stop(); });
}

PluginError PluginManager::doDisable(const QString& id)
{
    PluginPtr plugin = findPlugin(id);
    if (!plugin) {
        return unknownPlugin(id);
    }

    if (plugin->state() == PluginState::Started) {
        stopStartedDependents(id);
    }
    cancelWork(id);

    PluginError error = invoke(plugin, [&plugin]() { plugin->disable(); });
    if (plugin->state() == PluginState::Disabled) {
        m_eventBus->unsubscribeAll(id);
        QMutexLocker locker(&m_mutex);
        auto it = m_plugins.find(id);
        if (it != m_plugins.end()) {
            it->context.reset();
        }
    }
    return error;
}

PluginError PluginManager::doEnable(const QString& id)
{
    PluginPtr plugin = findPlugin(id);
    if (!plugin) {
        return unknownPlugin(id);
    }
    return invoke(plugin, [&plugin]() { plugin->enable(); });
}

PluginError PluginManager::doUnload(const QString& id)
{
    PluginPtr plugin = findPlugin(id);
    if (!plugin) {
        return unknownPlugin(id);
    }

    if (plugin->state() == PluginState::Started) {
        PluginError error = doStop(id);
        if (error.isError()) {
            qWarning() << "PluginManager: Unloading" << id << "after failed stop:" << error.toString();
        }
    }

    if (!m_config.settingsDirectory.isEmpty()) {
        savePluginSettings(id);
    }

    // Disabling releases the context before the entry that owns it goes away
    cancelWork(id);
    if (plugin->state() != PluginState::Disabled) {
        invoke(plugin, [&plugin]() { plugin->disable(); });
    }

    m_eventBus->unsubscribeAll(id);

    {
        QMutexLocker locker(&m_mutex);
        m_plugins.remove(id);
        m_registrationOrder.removeAll(id);
        m_startOrder.removeAll(id);
        m_activeTools.removeAll(id);
        m_errors.remove(id);
    }

    qDebug() << "PluginManager: Unloaded" << id;
    emit pluginUnloaded(id);
    return {};
}

void PluginManager::stopStartedDependents(const QString& id)
{
    const QStringList dependents = dependentsOf(id);
    if (dependents.isEmpty()) {
        return;
    }

    QStringList order = startOrder();
    std::reverse(order.begin(), order.end());

    for (const QString& candidate : order) {
        if (!dependents.contains(candidate)) {
            continue;
        }
        PluginPtr plugin = findPlugin(candidate);
        if (plugin && plugin->state() == PluginState::Started) {
            cancelWork(candidate);
            invoke(plugin, [&plugin]() { plugin->stop(); });
        }
    }
}

// =============================================================================
// Supervision
// =============================================================================

PluginError PluginManager::invoke(const PluginPtr& plugin, const std::function<void()>& call)
{
    const QString id = plugin->id();
    const PluginState before = plugin->state();

    PluginError error;
    try {
        call();
    } catch (const std::exception& e) {
        error = PluginError::fromException(e);
    }

    notifyState(id, before, plugin->state());

    if (error.isError()) {
        recordError(id, error);
    } else {
        QMutexLocker locker(&m_mutex);
        m_errors.remove(id);
    }
    return error;
}

void PluginManager::notifyState(const QString& id, PluginState oldState, PluginState newState)
{
    if (oldState == newState) {
        return;
    }

    {
        QMutexLocker locker(&m_mutex);
        auto it = m_plugins.find(id);
        if (newState == PluginState::Started) {
            m_startOrder.removeAll(id);
            m_startOrder.append(id);
            if (it != m_plugins.end()) {
                it->work = CancellationSource();
            }
        } else if (oldState == PluginState::Started) {
            m_startOrder.removeAll(id);
            if (it != m_plugins.end()) {
                it->work.cancel();
            }
        }
    }

    if (oldState == PluginState::Started) {
        deactivateTool(id);
    }

    qDebug() << "PluginManager:" << id << pluginStateName(oldState) << "->" << pluginStateName(newState);

    emit pluginStateChanged(id, oldState, newState);

    switch (newState) {
    case PluginState::Initialized:
        emit pluginInitialized(id);
        break;
    case PluginState::Started:
        emit pluginStarted(id);
        break;
    case PluginState::Stopped:
        emit pluginStopped(id);
        break;
    case PluginState::Disabled:
        emit pluginDisabled(id);
        break;
    case PluginState::NotInitialized:
        if (oldState == PluginState::Disabled) {
            emit pluginEnabled(id);
        }
        break;
    default:
        break;
    }

    m_eventBus->publish(QStringLiteral("plugin/%1/state").arg(id),
                        {{QStringLiteral("old"), pluginStateName(oldState)},
                         {QStringLiteral("new"), pluginStateName(newState)}},
                        kHostSenderId);
}

void PluginManager::recordError(const QString& id, const PluginError& error)
{
    {
        QMutexLocker locker(&m_mutex);
        m_errors.insert(id, error);
    }

    qWarning() << "PluginManager:" << id << "-" << error.toString();
    emit pluginError(id, error);
}

void PluginManager::failPlugin(const PluginPtr& plugin, const PluginError& error)
{
    PluginError result = invoke(plugin, [&]() { plugin->fail(error); });
    if (!result.isError()) {
        recordError(plugin->id(), error);
    }
}

void PluginManager::failDependents(const QString& failedId)
{
    for (const QString& id : dependentsOf(failedId)) {
        PluginPtr plugin = findPlugin(id);
        if (!plugin) {
            continue;
        }
        const PluginState state = plugin->state();
        if (state == PluginState::Disabled || state == PluginState::Error) {
            continue;
        }
        failPlugin(plugin, {ErrorCode::DependencyError,
                            QStringLiteral("Dependency %1 of %2 failed").arg(failedId, id)});
    }
}

// =============================================================================
// Query
// =============================================================================

PluginPtr PluginManager::findPlugin(const QString& id) const
{
    QMutexLocker locker(&m_mutex);
    auto it = m_plugins.constFind(id);
    return it != m_plugins.constEnd() ? it->plugin : PluginPtr();
}

CancellationToken PluginManager::workToken(const QString& id) const
{
    QMutexLocker locker(&m_mutex);
    auto it = m_plugins.constFind(id);
    return it != m_plugins.constEnd() ? it->work.token() : CancellationToken();
}

void PluginManager::cancelWork(const QString& id)
{
    QMutexLocker locker(&m_mutex);
    auto it = m_plugins.find(id);
    if (it != m_plugins.end()) {
        it->work.cancel();
    }
}

QSharedPointer<PluginContext> PluginManager::contextFor(const QString& id)
{
    QMutexLocker locker(&m_mutex);

    auto it = m_plugins.find(id);
    if (it == m_plugins.end()) {
        return {};
    }

    if (!it->context) {
        const QString dataDirectory = m_config.pluginDataDirectory(id);
        if (!dataDirectory.isEmpty() && !QDir().mkpath(dataDirectory)) {
            qWarning() << "PluginManager: Cannot create data directory" << dataDirectory;
        }
        it->context = QSharedPointer<PluginContext>::create(
            id, this, m_eventBus, m_mapCanvas, m_layers, dataDirectory);
    }
    return it->context;
}

PluginPtr PluginManager::plugin(const QString& id) const
{
    return findPlugin(id);
}

QList<PluginPtr> PluginManager::plugins() const
{
    QMutexLocker locker(&m_mutex);
    QList<PluginPtr> result;
    for (const QString& id : m_registrationOrder) {
        result.append(m_plugins.value(id).plugin);
    }
    return result;
}

QList<PluginPtr> PluginManager::plugins(PluginTypes types) const
{
    QList<PluginPtr> result;
    for (const PluginPtr& plugin : plugins()) {
        if ((plugin->types() & types) == types) {
            result.append(plugin);
        }
    }
    return result;
}

bool PluginManager::isPluginEnabled(const QString& id) const
{
    PluginPtr plugin = findPlugin(id);
    return plugin && plugin->state() != PluginState::Disabled;
}

PluginError PluginManager::lastError(const QString& id) const
{
    PluginPtr plugin;
    {
        QMutexLocker locker(&m_mutex);
        auto it = m_errors.constFind(id);
        if (it != m_errors.constEnd()) {
            return it.value();
        }
        plugin = m_plugins.value(id).plugin;
    }
    return plugin ? plugin->lastError() : PluginError();
}

QStringList PluginManager::startOrder() const
{
    QMutexLocker locker(&m_mutex);
    return m_startOrder;
}

// =============================================================================
// Settings
// =============================================================================

bool PluginManager::loadPluginSettings(const QString& id)
{
    PluginPtr plugin = findPlugin(id);
    const QString path = m_config.settingsFilePath(id);
    if (!plugin || path.isEmpty()) {
        return false;
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qDebug() << "PluginManager: No settings for" << id << "at" << path;
        return false;
    }

    QSharedPointer<IPluginSettings> settings = plugin->settings();
    if (!settings->fromSerializedForm(QString::fromUtf8(file.readAll()))) {
        qWarning() << "PluginManager: Ignoring malformed settings" << path;
        return false;
    }

    try {
        plugin->applySettings(*settings);
    } catch (const std::exception& e) {
        qWarning() << "PluginManager: Ignoring settings for" << id << ":" << e.what();
        return false;
    }

    qDebug() << "PluginManager: Loaded settings for" << id;
    return true;
}

bool PluginManager::savePluginSettings(const QString& id)
{
    PluginPtr plugin = findPlugin(id);
    const QString path = m_config.settingsFilePath(id);
    if (!plugin || path.isEmpty()) {
        return false;
    }

    QSharedPointer<IPluginSettings> settings = plugin->settings();
    QString message;
    if (!settings->validate(&message)) {
        qWarning() << "PluginManager: Not saving invalid settings for" << id << ":" << message;
        return false;
    }

    if (!QDir().mkpath(m_config.settingsDirectory)) {
        qWarning() << "PluginManager: Cannot create settings directory" << m_config.settingsDirectory;
        return false;
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qWarning() << "PluginManager: Cannot write" << path << ":" << file.errorString();
        return false;
    }
    file.write(settings->toSerializedForm().toUtf8());
    return file.commit();
}

// =============================================================================
// Tools
// =============================================================================

PluginError PluginManager::activateTool(const QString& id)
{
    PluginPtr plugin = findPlugin(id);
    if (!plugin) {
        return unknownPlugin(id);
    }

    IToolCapability* tool = plugin->toolCapability();
    if (!tool) {
        return {ErrorCode::InvalidArgument, QStringLiteral("Plugin %1 is not a tool").arg(id)};
    }
    if (plugin->state() != PluginState::Started) {
        return {ErrorCode::InvalidState,
                QStringLiteral("Tool %1 is not started (state %2)")
                    .arg(id, pluginStateName(plugin->state()))};
    }

    try {
        tool->activate();
    } catch (const std::exception& e) {
        PluginError error{ErrorCode::ExecutionError,
                          QStringLiteral("Activating %1 failed: %2").arg(id, QString::fromUtf8(e.what()))};
        recordError(id, error);
        return error;
    }

    {
        QMutexLocker locker(&m_mutex);
        m_activeTools.removeAll(id);
        m_activeTools.prepend(id);
    }

    emit toolActivated(id);
    return {};
}

bool PluginManager::deactivateTool(const QString& id)
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_activeTools.removeAll(id) == 0) {
            return false;
        }
    }

    PluginPtr plugin = findPlugin(id);
    IToolCapability* tool = plugin ? plugin->toolCapability() : nullptr;
    if (tool) {
        try {
            tool->deactivate();
        } catch (const std::exception& e) {
            recordError(id, {ErrorCode::ExecutionError,
                             QStringLiteral("Deactivating %1 failed: %2").arg(id, QString::fromUtf8(e.what()))});
        }
    }

    emit toolDeactivated(id);
    return true;
}

QStringList PluginManager::activeTools() const
{
    QMutexLocker locker(&m_mutex);
    return m_activeTools;
}

template<typename Fn>
bool PluginManager::callToolHandler(const PluginPtr& plugin, Fn handler)
{
    IToolCapability* tool = plugin->toolCapability();
    if (!tool || plugin->state() != PluginState::Started) {
        return false;
    }

    try {
        return handler(tool);
    } catch (const std::exception& e) {
        recordError(plugin->id(), {ErrorCode::ExecutionError,
                                   QStringLiteral("Tool handler of %1 threw: %2")
                                       .arg(plugin->id(), QString::fromUtf8(e.what()))});
        return false;
    }
}

bool PluginManager::dispatchMouseEvent(MouseEventKind kind, MouseEvent& event)
{
    for (const QString& id : activeTools()) {
        PluginPtr plugin = findPlugin(id);
        if (!plugin) {
            continue;
        }

        const bool claimed = callToolHandler(plugin, [kind, &event](IToolCapability* tool) {
            switch (kind) {
            case MouseEventKind::Press:   return tool->onMousePress(event);
            case MouseEventKind::Move:    return tool->onMouseMove(event);
            case MouseEventKind::Release: return tool->onMouseRelease(event);
            }
            return false;
        });

        if (claimed) {
            event.handled = true;
            return true;
        }
    }
    return false;
}

bool PluginManager::dispatchKeyEvent(KeyEvent& event)
{
    for (const QString& id : activeTools()) {
        PluginPtr plugin = findPlugin(id);
        if (!plugin) {
            continue;
        }

        const bool claimed = callToolHandler(plugin, [&event](IToolCapability* tool) {
            return tool->onKeyPress(event);
        });

        if (claimed) {
            event.handled = true;
            return true;
        }
    }
    return false;
}

// =============================================================================
// Analysis
// =============================================================================

bool PluginManager::validateAnalysisParameters(const QString& id,
                                               const QVariantMap& values,
                                               QString* errorMessage) const
{
    PluginPtr plugin = findPlugin(id);
    IAnalysisCapability* analysis = plugin ? plugin->analysisCapability() : nullptr;
    if (!analysis) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Plugin %1 does not provide an analysis").arg(id);
        }
        return false;
    }

    try {
        return analysis->validateParameters(values, errorMessage);
    } catch (const std::exception& e) {
        if (errorMessage) {
            *errorMessage = QString::fromUtf8(e.what());
        }
        return false;
    }
}

QFuture<AnalysisResult> PluginManager::executeAnalysis(const QString& id,
                                                       const QVariantMap& values,
                                                       const CancellationToken& token)
{
    PluginPtr plugin = findPlugin(id);

    return QtConcurrent::run(&m_pool, [this, id, plugin, values, callerToken = token]() {
        // Stopping, disabling or unloading the plugin cancels the run as well
        const CancellationToken token = CancellationToken::linked(callerToken, workToken(id));

        QElapsedTimer timer;
        timer.start();

        auto finish = [&](AnalysisResult result) {
            result.executionTimeMs = timer.elapsed();
            if (result.errorCode == ErrorCode::ExecutionError) {
                recordError(id, {ErrorCode::ExecutionError, result.errorMessage});
            }
            emit analysisFinished(id, result);
            return result;
        };

        if (!plugin) {
            return finish(AnalysisResult::failed(ErrorCode::InvalidArgument,
                                                 unknownPlugin(id).message));
        }

        IAnalysisCapability* analysis = plugin->analysisCapability();
        if (!analysis) {
            return finish(AnalysisResult::failed(
                ErrorCode::InvalidArgument,
                QStringLiteral("Plugin %1 does not provide an analysis").arg(id)));
        }
        if (plugin->state() != PluginState::Started) {
            return finish(AnalysisResult::failed(
                ErrorCode::InvalidState,
                QStringLiteral("Analysis %1 is not started (state %2)")
                    .arg(id, pluginStateName(plugin->state()))));
        }

        QString message;
        if (!validateAnalysisParameters(id, values, &message)) {
            return finish(AnalysisResult::failed(ErrorCode::InvalidArgument, message));
        }

        if (token.isCancellationRequested()) {
            return finish(AnalysisResult::failed(ErrorCode::Cancelled,
                                                 QStringLiteral("Analysis cancelled before start")));
        }

        ProgressHandler progress = [this, id](const ProgressInfo& info) {
            ProgressInfo clamped = info;
            clamped.progress = qBound(0, info.progress, 100);
            emit analysisProgress(id, clamped);
        };

        AnalysisResult result;
        try {
            result = analysis->execute(values, token, progress);
        } catch (const std::exception& e) {
            const PluginError error = PluginError::fromException(e);
            result = AnalysisResult::failed(error.code, error.message);
        }

        if (!result.success) {
            if (token.isCancellationRequested() || result.errorCode == ErrorCode::Cancelled) {
                result.errorCode = ErrorCode::Cancelled;
                if (result.errorMessage.isEmpty()) {
                    result.errorMessage = QStringLiteral("Analysis cancelled");
                }
            } else {
                result.errorCode = ErrorCode::ExecutionError;
                if (result.errorMessage.isEmpty()) {
                    result.errorMessage = QStringLiteral("Analysis %1 failed").arg(id);
                }
            }
        } else {
            result.errorCode = ErrorCode::None;
        }

        return finish(result);
    });
}

// =============================================================================
// Data providers
// =============================================================================

DataProviderCapabilities PluginManager::providerCapabilities(const QString& id) const
{
    PluginPtr plugin = findPlugin(id);
    IDataProviderCapability* provider = plugin ? plugin->dataProviderCapability() : nullptr;
    if (!provider) {
        return {};
    }

    try {
        return provider->capabilities();
    } catch (const std::exception& e) {
        qWarning() << "PluginManager: Capabilities of" << id << "unavailable:" << e.what();
        return {};
    }
}

template<typename T, typename Fn>
QFuture<T> PluginManager::runProvider(const QString& id, const QString& operation, T fallback, Fn call)
{
    PluginPtr plugin = findPlugin(id);

    return QtConcurrent::run(&m_pool, [this, id, operation, plugin, fallback, call]() -> T {
        IDataProviderCapability* provider = plugin ? plugin->dataProviderCapability() : nullptr;
        if (!provider) {
            qWarning() << "PluginManager:" << id << "is not a data provider";
            return fallback;
        }
        if (plugin->state() != PluginState::Started) {
            qWarning() << "PluginManager: Provider" << id << "is not started";
            return fallback;
        }

        try {
            return call(provider);
        } catch (const std::exception& e) {
            const PluginError error = PluginError::fromException(e);
            recordError(id, {error.code,
                             QStringLiteral("%1 on %2 failed: %3").arg(operation, id, error.message)});
            return fallback;
        }
    });
}

QFuture<bool> PluginManager::testConnection(const QString& id, const QString& connection)
{
    return runProvider<bool>(id, QStringLiteral("testConnection"), false,
                             [connection](IDataProviderCapability* provider) {
                                 return provider->testConnection(connection);
                             });
}

QFuture<std::optional<DataSourceMetadata>> PluginManager::dataSourceMetadata(const QString& id,
                                                                             const QString& connection)
{
    return runProvider<std::optional<DataSourceMetadata>>(
        id, QStringLiteral("metadata"), std::nullopt,
        [connection](IDataProviderCapability* provider) {
            return provider->metadata(connection);
        });
}

QFuture<FeatureStorePtr> PluginManager::openFeatureStore(const QString& id,
                                                         const QString& connection,
                                                         const QVariantMap& options)
{
    return runProvider<FeatureStorePtr>(
        id, QStringLiteral("openFeatureStore"), FeatureStorePtr(),
        [id, connection, options](IDataProviderCapability* provider) {
            if (!provider->capabilities().testFlag(DataProviderCapability::Read)) {
                throw Error(ErrorCode::InvalidArgument,
                            QStringLiteral("Provider %1 cannot read").arg(id));
            }
            return provider->openFeatureStore(connection, options);
        });
}

} // namespace geocore
