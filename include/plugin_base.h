#pragma once

#include <geocore/cancellation.h>
#include <geocore/interfaces/iplugin.h>
#include <geocore/interfaces/ipluginsettings.h>

#include <QAtomicInt>
#include <QMutex>

#include <functional>

namespace geocore {

class JsonPluginSettings;

/**
 * @brief Base class implementing the plugin lifecycle state machine
 *
 * Subclasses provide a descriptor and override the on*() hooks. A hook
 * reports failure by returning false or throwing; the plugin then moves to
 * Error and the lifecycle call throws Error(ExecutionError).
 *
 * Transitions are serialized by a per-plugin mutex. state(), lastError()
 * and settings() do not take that mutex and are safe to call from inside a
 * hook.
 */
class PluginBase : public IPlugin
{
public:
    explicit PluginBase(const PluginDescriptor& descriptor,
                        QSharedPointer<IPluginSettings> settings = {});
    ~PluginBase() override;

    const PluginDescriptor& descriptor() const override { return m_descriptor; }

    PluginState state() const override;
    PluginError lastError() const override;

    void initialize(IPluginContext* context) override;
    void start() override;
    void stop() override;
    void disable() override;
    void enable() override;
    void fail(const PluginError& error) override;

    QSharedPointer<IPluginSettings> settings() const override;
    void applySettings(const IPluginSettings& settings) override;

    // Cancelled when the plugin is stopped, disabled or failed
    CancellationToken stopToken() const;

protected:
    virtual bool onInitialize() { return true; }
    virtual bool onStart() { return true; }
    virtual bool onStop() { return true; }
    virtual void onDisable() {}

    IPluginContext* context() const { return m_context; }

    // Copy of the current settings when they are JSON backed, else null
    QSharedPointer<JsonPluginSettings> jsonSettings() const;

private:
    void setState(PluginState state);
    void setLastError(const PluginError& error);
    void requireState(bool allowed, const char* operation) const;
    bool runHook(const char* name, const std::function<bool()>& hook);
    void stopLocked();

    PluginDescriptor m_descriptor;
    IPluginContext* m_context = nullptr;

    QAtomicInt m_state{static_cast<int>(PluginState::NotInitialized)};
    QMutex m_lifecycleMutex;

    mutable QMutex m_dataMutex;
    PluginError m_lastError;
    QSharedPointer<IPluginSettings> m_settings;
    CancellationSource m_stopSource;
};

} // namespace geocore
