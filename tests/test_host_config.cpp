#include <QTest>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "host_config.h"
#include "json_plugin_settings.h"
#include "plugin_manager.h"
#include "test_support.h"

using namespace geocore;
using namespace geocore::testing;

class TestHostConfig : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();

    // HostConfig
    void testDefaults();
    void testFromJson();
    void testFromJsonInvalidVersion();
    void testFromFile();
    void testFromFileMissing();
    void testFromFileMalformed();
    void testEnvironmentOverrides();
    void testPaths();

    // JsonPluginSettings
    void testSettingsValues();
    void testSettingsRoundTrip();
    void testSettingsMalformedInput();
    void testSettingsReset();
    void testSettingsCloneIsIndependent();

    // Persistence through the manager
    void testSettingsSavedAndReloaded();
    void testMalformedSettingsFileIgnored();

private:
    QString writeFile(const QString& name, const QByteArray& content);

    QTemporaryDir* m_dir = nullptr;
};

void TestHostConfig::initTestCase()
{
    qDebug() << "========== Host Config Test Suite ==========";
}

void TestHostConfig::cleanupTestCase()
{
    qDebug() << "========== Tests Complete ==========";
}

void TestHostConfig::init()
{
    m_dir = new QTemporaryDir;
    QVERIFY(m_dir->isValid());
}

void TestHostConfig::cleanup()
{
    qunsetenv("GEOCORE_ENGINE_VERSION");
    qunsetenv("GEOCORE_PLUGIN_DATA");
    qunsetenv("GEOCORE_SETTINGS_DIR");

    delete m_dir;
    m_dir = nullptr;
}

QString TestHostConfig::writeFile(const QString& name, const QByteArray& content)
{
    const QString path = m_dir->filePath(name);
    QFile file(path);
    if (file.open(QIODevice::WriteOnly)) {
        file.write(content);
    }
    return path;
}

// =============================================================================
// HostConfig
// =============================================================================

void TestHostConfig::testDefaults()
{
    HostConfig config;
    QCOMPARE(config.engineVersion, QVersionNumber(1, 0, 0));
    QVERIFY(config.pluginDataRoot.isEmpty());
    QVERIFY(config.settingsDirectory.isEmpty());
    QCOMPARE(config.workerThreads, 0);
}

void TestHostConfig::testFromJson()
{
    HostConfig config = HostConfig::fromJson(QJsonObject{
        {"engineVersion", "2.3.1"},
        {"pluginDataRoot", "/var/lib/geocore"},
        {"settingsDirectory", "/etc/geocore/plugins"},
        {"workerThreads", 6},
    });

    QCOMPARE(config.engineVersion, QVersionNumber(2, 3, 1));
    QCOMPARE(config.pluginDataRoot, QString("/var/lib/geocore"));
    QCOMPARE(config.settingsDirectory, QString("/etc/geocore/plugins"));
    QCOMPARE(config.workerThreads, 6);

    HostConfig again = HostConfig::fromJson(config.toJson());
    QCOMPARE(again.engineVersion, config.engineVersion);
    QCOMPARE(again.settingsDirectory, config.settingsDirectory);
}

void TestHostConfig::testFromJsonInvalidVersion()
{
    HostConfig config = HostConfig::fromJson(QJsonObject{{"engineVersion", "not a version"},
                                                         {"workerThreads", -3}});
    QCOMPARE(config.engineVersion, QVersionNumber(1, 0, 0));
    QCOMPARE(config.workerThreads, 0);
}

void TestHostConfig::testFromFile()
{
    const QString path = writeFile("host.json", R"({"engineVersion": "1.5", "workerThreads": 2})");

    QString error = "stale";
    HostConfig config = HostConfig::fromFile(path, &error);

    QVERIFY(error.isEmpty());
    QCOMPARE(config.engineVersion, QVersionNumber(1, 5));
    QCOMPARE(config.workerThreads, 2);
}

void TestHostConfig::testFromFileMissing()
{
    QString error;
    HostConfig config = HostConfig::fromFile(m_dir->filePath("absent.json"), &error);

    QVERIFY(!error.isEmpty());
    QCOMPARE(config.engineVersion, QVersionNumber(1, 0, 0));
}

void TestHostConfig::testFromFileMalformed()
{
    QString error;
    HostConfig config = HostConfig::fromFile(writeFile("broken.json", "{\"engineVersion\": "), &error);
    QVERIFY(error.contains("Malformed"));
    QCOMPARE(config.engineVersion, QVersionNumber(1, 0, 0));

    config = HostConfig::fromFile(writeFile("array.json", "[1, 2]"), &error);
    QVERIFY(error.contains("JSON object"));
}

void TestHostConfig::testEnvironmentOverrides()
{
    const QString path = writeFile("host.json", R"({"engineVersion": "1.5", "pluginDataRoot": "/from/file"})");

    qputenv("GEOCORE_ENGINE_VERSION", "3.0");
    qputenv("GEOCORE_PLUGIN_DATA", "/from/env");
    qputenv("GEOCORE_SETTINGS_DIR", "/settings/env");

    HostConfig config = HostConfig::fromFile(path);
    QCOMPARE(config.engineVersion, QVersionNumber(3, 0));
    QCOMPARE(config.pluginDataRoot, QString("/from/env"));
    QCOMPARE(config.settingsDirectory, QString("/settings/env"));

    // Invalid override keeps the file value
    qputenv("GEOCORE_ENGINE_VERSION", "three");
    QCOMPARE(HostConfig::fromFile(path).engineVersion, QVersionNumber(1, 5));

    // Environment applies even when the file is unusable
    QCOMPARE(HostConfig::fromFile(m_dir->filePath("absent.json")).pluginDataRoot, QString("/from/env"));
}

void TestHostConfig::testPaths()
{
    HostConfig config;
    QVERIFY(config.pluginDataDirectory("com.test.a").isEmpty());
    QVERIFY(config.settingsFilePath("com.test.a").isEmpty());

    config.pluginDataRoot = "/data";
    config.settingsDirectory = "/settings";
    QCOMPARE(config.pluginDataDirectory("com.test.a"), QString("/data/com.test.a"));
    QCOMPARE(config.settingsFilePath("com.test.a"), QString("/settings/com.test.a.json"));
    QVERIFY(config.pluginDataDirectory(QString()).isEmpty());
}

// =============================================================================
// JsonPluginSettings
// =============================================================================

void TestHostConfig::testSettingsValues()
{
    JsonPluginSettings settings(QJsonObject{{"units", "m"}});
    QCOMPARE(settings.value("units").toString(), QString("m"));
    QCOMPARE(settings.value("missing", 7).toInt(), 7);

    settings.setValue("precision", 3);
    QVERIFY(settings.contains("precision"));
    QCOMPARE(settings.keys(), QStringList({"precision", "units"}));

    settings.remove("units");
    QVERIFY(!settings.contains("units"));
    QCOMPARE(settings.defaults().value("units").toString(), QString("m"));
}

void TestHostConfig::testSettingsRoundTrip()
{
    JsonPluginSettings original;
    original.setValue("name", "Rivers");
    original.setValue("opacity", 0.5);

    JsonPluginSettings restored;
    QVERIFY(restored.fromSerializedForm(original.toSerializedForm()));
    QCOMPARE(restored.values(), original.values());
}

void TestHostConfig::testSettingsMalformedInput()
{
    JsonPluginSettings settings(QJsonObject{{"keep", true}});

    QVERIFY(!settings.fromSerializedForm("{not json"));
    QVERIFY(!settings.fromSerializedForm("[1, 2, 3]"));
    QCOMPARE(settings.value("keep").toBool(), true);
}

void TestHostConfig::testSettingsReset()
{
    JsonPluginSettings settings(QJsonObject{{"radius", 5}});
    settings.setValue("radius", 50);
    settings.setValue("extra", "x");

    settings.resetToDefaults();
    QCOMPARE(settings.values(), QJsonObject({{"radius", 5}}));
}

void TestHostConfig::testSettingsCloneIsIndependent()
{
    JsonPluginSettings settings(QJsonObject{{"radius", 5}});
    settings.setValidator([](const QJsonObject& values, QString*) {
        return values.value("radius").toInt() > 0;
    });

    auto clone = settings.clone().dynamicCast<JsonPluginSettings>();
    QVERIFY(clone);
    clone->setValue("radius", 0);

    QCOMPARE(settings.value("radius").toInt(), 5);
    QVERIFY(settings.validate());
    QVERIFY(!clone->validate());
}

// =============================================================================
// Persistence through the manager
// =============================================================================

void TestHostConfig::testSettingsSavedAndReloaded()
{
    HostConfig config;
    config.settingsDirectory = m_dir->filePath("settings");

    const QJsonObject defaults{{"radius", 5}};

    {
        PluginManager manager(config);
        auto plugin = QSharedPointer<TestPlugin>::create(
            makeDescriptor("com.test.persist"), QSharedPointer<JsonPluginSettings>::create(defaults));
        manager.registerPlugin(plugin);

        JsonPluginSettings changed(defaults);
        changed.setValue("radius", 12);
        plugin->applySettings(changed);

        QVERIFY(manager.savePluginSettings("com.test.persist"));
        QVERIFY(QFile::exists(config.settingsFilePath("com.test.persist")));
    }

    PluginManager manager(config);
    auto plugin = QSharedPointer<TestPlugin>::create(
        makeDescriptor("com.test.persist"), QSharedPointer<JsonPluginSettings>::create(defaults));
    manager.registerPlugin(plugin);

    QVERIFY(!manager.startPlugin("com.test.persist").result().isError());
    QCOMPARE(plugin->settingsSeenAtStart.value("radius").toInt(), 12);
}

void TestHostConfig::testMalformedSettingsFileIgnored()
{
    HostConfig config;
    config.settingsDirectory = m_dir->path();
    writeFile("com.test.broken.json", "{ radius: ");

    PluginManager manager(config);
    auto plugin = QSharedPointer<TestPlugin>::create(
        makeDescriptor("com.test.broken"),
        QSharedPointer<JsonPluginSettings>::create(QJsonObject{{"radius", 5}}));

    QVERIFY(!manager.registerPlugin(plugin).isError());
    QVERIFY(!manager.loadPluginSettings("com.test.broken"));

    QVERIFY(!manager.startPlugin("com.test.broken").result().isError());
    QCOMPARE(plugin->settingsSeenAtStart.value("radius").toInt(), 5);
}

QTEST_GUILESS_MAIN(TestHostConfig)
#include "test_host_config.moc"
