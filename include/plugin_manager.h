#pragma once

#include "host_config.h"

#include <geocore/cancellation.h>
#include <geocore/interfaces/iplugin.h>
#include <geocore/interfaces/itoolcapability.h>
#include <geocore/interfaces/ianalysiscapability.h>
#include <geocore/interfaces/idataprovidercapability.h>

#include <QFuture>
#include <QHash>
#include <QMutex>
#include <QObject>
#include <QThreadPool>

#include <functional>
#include <optional>

namespace geocore {

class EventBusService;
class IMapCanvas;
class ILayerCollection;
class PluginContext;

/**
 * @brief Supervises the registered plugins
 *
 * Responsibilities:
 * - Registration with engine version negotiation
 * - Dependency resolution (topological, ties by registration order)
 * - Startup in dependency order and shutdown in reverse start order
 * - Failure isolation: a failing plugin only takes its dependents down
 * - Typed dispatch to tool, analysis and data provider capabilities
 * - Settings persistence per plugin
 *
 * Lifecycle operations, analysis runs and provider queries execute on the
 * manager's thread pool and return futures. Whole-graph operations are
 * serialized; tool dispatch runs synchronously on the calling thread.
 *
 * Every observed state change is emitted as pluginStateChanged() and
 * published on the event bus as "plugin/<id>/state" with "old" and "new"
 * state names.
 */
class PluginManager : public QObject
{
    Q_OBJECT

public:
    explicit PluginManager(const HostConfig& config = {}, QObject* parent = nullptr);
    ~PluginManager() override;

    // ===== Host services =====

    HostConfig config() const { return m_config; }
    QVersionNumber engineVersion() const { return m_config.engineVersion; }
    EventBusService* eventBus() const { return m_eventBus; }
    QThreadPool* threadPool() { return &m_pool; }

    void setMapCanvas(IMapCanvas* canvas);
    void setLayerCollection(ILayerCollection* layers);

    // ===== Registration =====

    PluginError registerPlugin(const PluginPtr& plugin);

    // ===== Lifecycle =====

    // Dependency order over enabled, non-failed plugins. Plugins with a
    // missing, disabled, failed or cyclic dependency are moved to Error.
    QStringList resolveLoadOrder();

    // Resolves to true when every plugin in the load order ended up Started
    QFuture<bool> startAll();
    QFuture<void> stopAll();

    QFuture<PluginError> initializePlugin(const QString& id);
    QFuture<PluginError> startPlugin(const QString& id);
    QFuture<PluginError> stopPlugin(const QString& id);
    QFuture<PluginError> disablePlugin(const QString& id);
    QFuture<PluginError> enablePlugin(const QString& id);
    QFuture<PluginError> unloadPlugin(const QString& id);

    // ===== Query =====

    PluginPtr plugin(const QString& id) const;
    QList<PluginPtr> plugins() const;
    QList<PluginPtr> plugins(PluginTypes types) const;
    bool isPluginEnabled(const QString& id) const;
    PluginError lastError(const QString& id) const;
    QStringList startOrder() const;
    QStringList dependenciesOf(const QString& id) const;

    // ===== Settings =====

    bool loadPluginSettings(const QString& id);
    bool savePluginSettings(const QString& id);

    // ===== Tools =====

    PluginError activateTool(const QString& id);
    bool deactivateTool(const QString& id);
    QStringList activeTools() const;

    // First active tool that claims the event wins; returns event.handled
    bool dispatchMouseEvent(MouseEventKind kind, MouseEvent& event);
    bool dispatchKeyEvent(KeyEvent& event);

    // ===== Analysis =====

    bool validateAnalysisParameters(const QString& id,
                                    const QVariantMap& values,
                                    QString* errorMessage = nullptr) const;
    QFuture<AnalysisResult> executeAnalysis(const QString& id,
                                            const QVariantMap& values,
                                            const CancellationToken& token = {});

    // ===== Data providers =====

    DataProviderCapabilities providerCapabilities(const QString& id) const;
    QFuture<bool> testConnection(const QString& id, const QString& connection);
    QFuture<std::optional<DataSourceMetadata>> dataSourceMetadata(const QString& id,
                                                                  const QString& connection);
    QFuture<FeatureStorePtr> openFeatureStore(const QString& id,
                                              const QString& connection,
                                              const QVariantMap& options = {});

signals:
    void pluginRegistered(const QString& id);
    void pluginStateChanged(const QString& id, PluginState oldState, PluginState newState);
    void pluginInitialized(const QString& id);
    void pluginStarted(const QString& id);
    void pluginStopped(const QString& id);
    void pluginDisabled(const QString& id);
    void pluginEnabled(const QString& id);
    void pluginUnloaded(const QString& id);
    void pluginError(const QString& id, const PluginError& error);

    void toolActivated(const QString& id);
    void toolDeactivated(const QString& id);

    void analysisProgress(const QString& id, const ProgressInfo& progress);
    void analysisFinished(const QString& id, const AnalysisResult& result);

private:
    struct PluginEntry {
        PluginPtr plugin;
        QSharedPointer<PluginContext> context;
        // Cancelled whenever the plugin leaves Started; analyses observe it
        CancellationSource work;
    };

    PluginPtr findPlugin(const QString& id) const;
    QSharedPointer<PluginContext> contextFor(const QString& id);
    CancellationToken workToken(const QString& id) const;
    void cancelWork(const QString& id);

    // Runs one lifecycle call, reports the state change and records failures
    PluginError invoke(const PluginPtr& plugin, const std::function<void()>& call);
    void notifyState(const QString& id, PluginState oldState, PluginState newState);
    void recordError(const QString& id, const PluginError& error);
    void failPlugin(const PluginPtr& plugin, const PluginError& error);
    void failDependents(const QString& failedId);

    QStringList dependentsOf(const QString& id) const;
    QStringList resolveLocked();

    PluginError doInitialize(const QString& id);
    PluginError doStart(const QString& id);
    PluginError doStop(const QString& id);
    PluginError doDisable(const QString& id);
    PluginError doEnable(const QString& id);
    PluginError doUnload(const QString& id);
    void stopStartedDependents(const QString& id);

    template<typename Fn>
    bool callToolHandler(const PluginPtr& plugin, Fn handler);

    // Runs a provider call on the pool; yields fallback on any failure
    template<typename T, typename Fn>
    QFuture<T> runProvider(const QString& id, const QString& operation, T fallback, Fn call);

    HostConfig m_config;
    EventBusService* m_eventBus;
    IMapCanvas* m_mapCanvas = nullptr;
    ILayerCollection* m_layers = nullptr;

    QThreadPool m_pool;

    // Serializes lifecycle operations
    QMutex m_operationMutex;

    // Guards the containers below
    mutable QMutex m_mutex;
    QHash<QString, PluginEntry> m_plugins;
    QStringList m_registrationOrder;
    QStringList m_startOrder;
    QStringList m_activeTools;
    QHash<QString, PluginError> m_errors;
};

} // namespace geocore
