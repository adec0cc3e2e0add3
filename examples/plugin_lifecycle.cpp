/**
 * =============================================================================
 * Example: plugin lifecycle - register, resolve, start, dispatch, stop
 * =============================================================================
 *
 * What this example shows:
 * How the host drives plugins from registration to shutdown, and what a
 * failing plugin does (and does not) take down with it.
 *
 * Lifecycle stages:
 *
 *   ┌──────────────────┐
 *   │ registerPlugin() │  descriptor checked, engine version negotiated
 *   └──────┬───────────┘
 *          ▼
 *   ┌──────────────────┐
 *   │    startAll()    │  dependency order; each plugin is initialized
 *   └──────┬───────────┘  with its own context, then started
 *          ▼
 *   ┌──────────────────┐
 *   │     running      │  tools receive map events, analyses run on the
 *   └──────┬───────────┘  worker pool
 *          ▼
 *   ┌──────────────────┐
 *   │    stopAll()     │  reverse start order
 *   └──────────────────┘
 *
 * Run with GEOCORE_PLUGIN_DATA=/tmp/geocore to see per-plugin data
 * directories being created.
 * =============================================================================
 */

#include "event_bus_service.h"
#include "plugin_base.h"
#include "plugin_manager.h"

#include <geocore/interfaces/ianalysiscapability.h>
#include <geocore/interfaces/ipluginlogger.h>
#include <geocore/interfaces/itoolcapability.h>

#include <QCoreApplication>
#include <QDebug>

#include <stdexcept>

using namespace geocore;

namespace {

PluginDescriptor describe(const QString& id, PluginTypes types, const QStringList& dependencies = {})
{
    PluginDescriptor descriptor;
    descriptor.id = id;
    descriptor.name = id;
    descriptor.types = types;
    descriptor.dependencies = dependencies;
    return descriptor;
}

/**
 * Shared service other plugins depend on. Publishes on the event bus once
 * it is running.
 */
class UnitsPlugin : public PluginBase
{
public:
    UnitsPlugin() : PluginBase(describe("org.example.units", PluginType::Service)) {}

protected:
    bool onStart() override
    {
        context()->eventBus()->publish(QStringLiteral("units/changed"),
                                       {{QStringLiteral("units"), QStringLiteral("m")}},
                                       id());
        return true;
    }
};

/**
 * Click-to-measure tool; claims left clicks only.
 */
class MeasureTool : public PluginBase, public IToolCapability
{
public:
    MeasureTool()
        : PluginBase(describe("org.example.measure", PluginType::Tool, {"org.example.units"})) {}

    IToolCapability* toolCapability() override { return this; }

    QString toolName() const override { return QStringLiteral("Measure"); }
    QString toolCategory() const override { return QStringLiteral("Inspect"); }
    void activate() override { m_active = true; }
    void deactivate() override { m_active = false; }
    bool isActive() const override { return m_active; }

    bool onMousePress(MouseEvent& event) override
    {
        if (event.button != Qt::LeftButton) {
            return false;
        }
        context()->logger()->info(QStringLiteral("Measuring from (%1, %2)")
                                      .arg(event.position.x())
                                      .arg(event.position.y()));
        return true;
    }

private:
    bool m_active = false;
};

/**
 * Counts up to "limit", reporting progress; honours cancellation each step.
 */
class CountAnalysis : public PluginBase, public IAnalysisCapability
{
public:
    CountAnalysis()
        : PluginBase(describe("org.example.count", PluginType::Analysis)) {}

    IAnalysisCapability* analysisCapability() override { return this; }

    QString analysisName() const override { return QStringLiteral("Count features"); }

    QList<AnalysisParameter> parameters() const override
    {
        AnalysisParameter limit;
        limit.name = QStringLiteral("limit");
        limit.type = QMetaType::Int;
        limit.required = true;
        limit.minValue = 1;
        return {limit};
    }

    AnalysisResult execute(const QVariantMap& values,
                           const CancellationToken& token,
                           const ProgressHandler& progress) override
    {
        const int limit = values.value(QStringLiteral("limit")).toInt();
        int counted = 0;
        for (; counted < limit; ++counted) {
            if (token.isCancellationRequested()) {
                return AnalysisResult::failed(ErrorCode::Cancelled, QString());
            }
            progress({counted * 100 / limit, QString(), true});
        }
        return AnalysisResult::succeeded({{QStringLiteral("count"), counted}});
    }
};

/**
 * Fails while starting; its dependent is taken down, nothing else is.
 */
class BrokenPlugin : public PluginBase
{
public:
    BrokenPlugin() : PluginBase(describe("org.example.broken", PluginType::Service)) {}

protected:
    bool onStart() override
    {
        throw std::runtime_error("license server unreachable");
    }
};

class BrokenDependent : public PluginBase
{
public:
    BrokenDependent()
        : PluginBase(describe("org.example.dependent", PluginType::Service, {"org.example.broken"})) {}
};

class DescribedPlugin : public PluginBase
{
public:
    explicit DescribedPlugin(const PluginDescriptor& descriptor) : PluginBase(descriptor) {}
};

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);

    HostConfig config;
    config.applyEnvironment();
    PluginManager manager(config);

    QObject::connect(&manager, &PluginManager::pluginStateChanged,
                     [](const QString& id, PluginState oldState, PluginState newState) {
                         qDebug() << "Example:" << id << pluginStateName(oldState)
                                  << "->" << pluginStateName(newState);
                     });

    manager.eventBus()->subscribe(QStringLiteral("units/*"), QStringLiteral("example"),
                                  [](const Event& event) {
                                      qDebug() << "Example: Event" << event.topic << event.data;
                                  });

    // =========================================================================
    // Registration. Order of registration only breaks ties.
    // =========================================================================
    manager.registerPlugin(QSharedPointer<MeasureTool>::create());
    manager.registerPlugin(QSharedPointer<UnitsPlugin>::create());
    manager.registerPlugin(QSharedPointer<CountAnalysis>::create());
    manager.registerPlugin(QSharedPointer<BrokenPlugin>::create());
    manager.registerPlugin(QSharedPointer<BrokenDependent>::create());

    PluginDescriptor future = describe("org.example.future", PluginType::Service);
    future.minEngineVersion = QVersionNumber(99);
    PluginError rejected = manager.registerPlugin(QSharedPointer<DescribedPlugin>::create(future));
    qDebug() << "Example: Rejected:" << rejected.toString();

    rejected = manager.registerPlugin(QSharedPointer<BrokenDependent>::create());
    qDebug() << "Example: Rejected:" << rejected.toString();

    qDebug() << "Example: Load order" << manager.resolveLoadOrder();

    // =========================================================================
    // Startup. The broken plugin and its dependent end in Error.
    // =========================================================================
    const bool allStarted = manager.startAll().result();
    qDebug() << "Example: All started:" << allStarted << "order:" << manager.startOrder();
    qDebug() << "Example: org.example.dependent error:"
             << manager.lastError(QStringLiteral("org.example.dependent")).toString();

    // =========================================================================
    // Tools and analyses
    // =========================================================================
    manager.activateTool(QStringLiteral("org.example.measure"));

    MouseEvent click;
    click.position = QPoint(120, 80);
    click.button = Qt::LeftButton;
    qDebug() << "Example: Click handled:" << manager.dispatchMouseEvent(MouseEventKind::Press, click);

    AnalysisResult result = manager.executeAnalysis(QStringLiteral("org.example.count"),
                                                    {{QStringLiteral("limit"), 250}}).result();
    qDebug() << "Example: Analysis" << (result.success ? "succeeded" : "failed")
             << result.results << "in" << result.executionTimeMs << "ms";

    // =========================================================================
    // Shutdown in reverse start order
    // =========================================================================
    manager.stopAll().waitForFinished();

    return 0;
}
