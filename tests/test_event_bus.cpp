#include <QTest>
#include <QSignalSpy>
#include <QCoreApplication>

#include "event_bus_service.h"

#include <stdexcept>

using namespace geocore;

class TestEventBus : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();

    // Subscribe/Publish
    void testSubscribe();
    void testUnsubscribe();
    void testUnsubscribeAll();
    void testPublish();
    void testNullHandlerRejected();
    void testEmptyPatternRejected();

    // Wildcard matching
    void testSingleWildcard();
    void testDoubleWildcard();
    void testMixedWildcards();
    void testMatchesTopic();

    // Options
    void testPriority();
    void testSubscriptionOrderWithinPriority();
    void testReceiveOwnEvents();
    void testFilter();
    void testPause();

    // Failure containment
    void testThrowingHandlerDoesNotStopDelivery();

    // Query
    void testSubscriberCount();
    void testActiveTopics();
    void testEventCount();
    void testSubscriptionsFor();

    // Edge cases
    void testMultipleSubscribers();
    void testNoSubscribers();
    void testHandlerMayPublish();

private:
    EventBusService* m_bus = nullptr;
};

void TestEventBus::initTestCase()
{
    qDebug() << "========== EventBus Test Suite ==========";
}

void TestEventBus::cleanupTestCase()
{
    qDebug() << "========== Tests Complete ==========";
}

void TestEventBus::init()
{
    m_bus = new EventBusService(this);
}

void TestEventBus::cleanup()
{
    delete m_bus;
    m_bus = nullptr;
}

// =============================================================================
// Subscribe/Publish
// =============================================================================

void TestEventBus::testSubscribe()
{
    QSignalSpy addedSpy(m_bus, &EventBusService::subscriptionAdded);

    QString id = m_bus->subscribe("layer/added", "com.test.a", [](const Event&) {});

    QVERIFY(!id.isEmpty());
    QCOMPARE(addedSpy.count(), 1);
    QCOMPARE(addedSpy.at(0).at(1).toString(), QString("layer/added"));
    QCOMPARE(m_bus->totalSubscribers(), 1);
}

void TestEventBus::testUnsubscribe()
{
    QString id = m_bus->subscribe("layer/added", "com.test.a", [](const Event&) {});
    QSignalSpy removedSpy(m_bus, &EventBusService::subscriptionRemoved);

    QVERIFY(m_bus->unsubscribe(id));
    QVERIFY(!m_bus->unsubscribe(id));
    QCOMPARE(removedSpy.count(), 1);
    QCOMPARE(m_bus->subscriberCount("layer/added"), 0);
}

void TestEventBus::testUnsubscribeAll()
{
    m_bus->subscribe("layer/added", "com.test.a", [](const Event&) {});
    m_bus->subscribe("layer/removed", "com.test.a", [](const Event&) {});
    m_bus->subscribe("layer/added", "com.test.b", [](const Event&) {});

    m_bus->unsubscribeAll("com.test.a");

    QVERIFY(m_bus->subscriptionsFor("com.test.a").isEmpty());
    QCOMPARE(m_bus->subscriberCount("layer/added"), 1);
    QCOMPARE(m_bus->totalSubscribers(), 1);
}

void TestEventBus::testPublish()
{
    Event received;
    m_bus->subscribe("selection/changed", "com.test.a", [&received](const Event& event) {
        received = event;
    });

    int notified = m_bus->publish("selection/changed", {{"count", 3}}, "com.test.b");

    QCOMPARE(notified, 1);
    QCOMPARE(received.topic, QString("selection/changed"));
    QCOMPARE(received.senderId, QString("com.test.b"));
    QCOMPARE(received.data.value("count").toInt(), 3);
    QVERIFY(received.timestamp > 0);
}

void TestEventBus::testNullHandlerRejected()
{
    QString id = m_bus->subscribe("layer/added", "com.test.a", EventHandler());
    QVERIFY(id.isEmpty());
    QCOMPARE(m_bus->totalSubscribers(), 0);
}

void TestEventBus::testEmptyPatternRejected()
{
    QString id = m_bus->subscribe(QString(), "com.test.a", [](const Event&) {});
    QVERIFY(id.isEmpty());
}

// =============================================================================
// Wildcard matching
// =============================================================================

void TestEventBus::testSingleWildcard()
{
    int count = 0;
    m_bus->subscribe("plugin/*/state", "observer", [&count](const Event&) { count++; });

    m_bus->publish("plugin/com.test.a/state");
    m_bus->publish("plugin/com.test.b/state");
    m_bus->publish("plugin/com.test.a/extra/state");
    m_bus->publish("plugin/state");

    QCOMPARE(count, 2);
}

void TestEventBus::testDoubleWildcard()
{
    int count = 0;
    m_bus->subscribe("map/**", "observer", [&count](const Event&) { count++; });

    m_bus->publish("map/extent");
    m_bus->publish("map/layer/visibility/changed");
    m_bus->publish("map");
    m_bus->publish("mapping/extent");

    QCOMPARE(count, 2);
}

void TestEventBus::testMixedWildcards()
{
    int count = 0;
    m_bus->subscribe("*/layer/**", "observer", [&count](const Event&) { count++; });

    m_bus->publish("map/layer/added");
    m_bus->publish("legend/layer/style/changed");
    m_bus->publish("map/feature/added");

    QCOMPARE(count, 2);
}

void TestEventBus::testMatchesTopic()
{
    QVERIFY(m_bus->matchesTopic("a/b/c", "a/b/c"));
    QVERIFY(m_bus->matchesTopic("a/b/c", "a/*/c"));
    QVERIFY(m_bus->matchesTopic("a/b/c", "a/**"));
    QVERIFY(!m_bus->matchesTopic("a/b/c", "a/*"));
    QVERIFY(!m_bus->matchesTopic("a.b", "a*b.c"));
    QVERIFY(!m_bus->matchesTopic("axb", "a.b"));
}

// =============================================================================
// Options
// =============================================================================

void TestEventBus::testPriority()
{
    QStringList order;

    SubscriptionOptions low;
    low.priority = -5;
    SubscriptionOptions high;
    high.priority = 10;

    m_bus->subscribe("tick", "low", [&order](const Event&) { order.append("low"); }, low);
    m_bus->subscribe("tick", "normal", [&order](const Event&) { order.append("normal"); });
    m_bus->subscribe("tick", "high", [&order](const Event&) { order.append("high"); }, high);

    m_bus->publish("tick");
    QCOMPARE(order, QStringList({"high", "normal", "low"}));
}

void TestEventBus::testSubscriptionOrderWithinPriority()
{
    QStringList order;
    for (const QString& name : {QString("first"), QString("second"), QString("third")}) {
        m_bus->subscribe("tick", name, [&order, name](const Event&) { order.append(name); });
    }

    m_bus->publish("tick");
    m_bus->publish("tick");
    QCOMPARE(order, QStringList({"first", "second", "third", "first", "second", "third"}));
}

void TestEventBus::testReceiveOwnEvents()
{
    int defaultCount = 0;
    int ownCount = 0;

    m_bus->subscribe("tick", "com.test.a", [&defaultCount](const Event&) { defaultCount++; });

    SubscriptionOptions own;
    own.receiveOwnEvents = true;
    m_bus->subscribe("tick", "com.test.a", [&ownCount](const Event&) { ownCount++; }, own);

    m_bus->publish("tick", {}, "com.test.a");
    QCOMPARE(defaultCount, 0);
    QCOMPARE(ownCount, 1);

    // Anonymous events reach everyone
    m_bus->publish("tick");
    QCOMPARE(defaultCount, 1);
    QCOMPARE(ownCount, 2);
}

void TestEventBus::testFilter()
{
    QList<int> seen;

    SubscriptionOptions options;
    options.filter = [](const Event& event) { return event.data.value("zoom").toInt() >= 10; };

    m_bus->subscribe("map/zoom", "observer", [&seen](const Event& event) {
        seen.append(event.data.value("zoom").toInt());
    }, options);

    QCOMPARE(m_bus->publish("map/zoom", {{"zoom", 4}}), 0);
    QCOMPARE(m_bus->publish("map/zoom", {{"zoom", 12}}), 1);
    QCOMPARE(seen, QList<int>({12}));
}

void TestEventBus::testPause()
{
    int count = 0;
    QString id = m_bus->subscribe("tick", "observer", [&count](const Event&) { count++; });

    QVERIFY(m_bus->setSubscriptionPaused(id, true));
    m_bus->publish("tick");
    QCOMPARE(count, 0);
    QCOMPARE(m_bus->subscriberCount("tick"), 0);

    QVERIFY(m_bus->setSubscriptionPaused(id, false));
    m_bus->publish("tick");
    QCOMPARE(count, 1);

    QVERIFY(!m_bus->setSubscriptionPaused("no-such-id", true));
}

// =============================================================================
// Failure containment
// =============================================================================

void TestEventBus::testThrowingHandlerDoesNotStopDelivery()
{
    int reached = 0;
    SubscriptionOptions first;
    first.priority = 1;

    QString badId = m_bus->subscribe("tick", "bad", [](const Event&) {
        throw std::runtime_error("handler exploded");
    }, first);
    m_bus->subscribe("tick", "good", [&reached](const Event&) { reached++; });

    QSignalSpy failedSpy(m_bus, &EventBusService::handlerFailed);

    QCOMPARE(m_bus->publish("tick"), 2);
    QCOMPARE(reached, 1);
    QCOMPARE(failedSpy.count(), 1);
    QCOMPARE(failedSpy.at(0).at(0).toString(), badId);
    QCOMPARE(failedSpy.at(0).at(2).toString(), QString("handler exploded"));
}

// =============================================================================
// Query
// =============================================================================

void TestEventBus::testSubscriberCount()
{
    m_bus->subscribe("layer/added", "a", [](const Event&) {});
    m_bus->subscribe("layer/*", "b", [](const Event&) {});
    m_bus->subscribe("**", "c", [](const Event&) {});
    m_bus->subscribe("map/extent", "d", [](const Event&) {});

    QCOMPARE(m_bus->subscriberCount("layer/added"), 3);
    QCOMPARE(m_bus->subscriberCount("map/extent"), 2);
    QCOMPARE(m_bus->subscriberCount("nothing"), 1);
}

void TestEventBus::testActiveTopics()
{
    m_bus->subscribe("map/extent", "a", [](const Event&) {});
    m_bus->subscribe("layer/*", "b", [](const Event&) {});
    m_bus->subscribe("map/extent", "c", [](const Event&) {});

    QCOMPARE(m_bus->activeTopics(), QStringList({"layer/*", "map/extent"}));
}

void TestEventBus::testEventCount()
{
    m_bus->publish("map/extent");
    m_bus->publish("map/extent");
    m_bus->publish("layer/added");

    QCOMPARE(m_bus->eventCount("map/extent"), qint64(2));
    QCOMPARE(m_bus->eventCount("layer/added"), qint64(1));
    QCOMPARE(m_bus->eventCount("never"), qint64(0));
}

void TestEventBus::testSubscriptionsFor()
{
    QString first = m_bus->subscribe("a", "com.test.a", [](const Event&) {});
    QString second = m_bus->subscribe("b", "com.test.a", [](const Event&) {});
    m_bus->subscribe("c", "com.test.b", [](const Event&) {});

    QCOMPARE(m_bus->subscriptionsFor("com.test.a"), QStringList({first, second}));
    QVERIFY(m_bus->subscriptionsFor("unknown").isEmpty());
}

// =============================================================================
// Edge cases
// =============================================================================

void TestEventBus::testMultipleSubscribers()
{
    int a = 0;
    int b = 0;
    m_bus->subscribe("tick", "a", [&a](const Event&) { a++; });
    m_bus->subscribe("tick", "b", [&b](const Event&) { b++; });

    QCOMPARE(m_bus->publish("tick"), 2);
    QCOMPARE(a, 1);
    QCOMPARE(b, 1);
}

void TestEventBus::testNoSubscribers()
{
    QCOMPARE(m_bus->publish("nobody/listens"), 0);
}

void TestEventBus::testHandlerMayPublish()
{
    QStringList topics;
    m_bus->subscribe("first", "relay", [this, &topics](const Event& event) {
        topics.append(event.topic);
        m_bus->publish("second");
    });
    m_bus->subscribe("second", "sink", [&topics](const Event& event) {
        topics.append(event.topic);
    });

    m_bus->publish("first");
    QCOMPARE(topics, QStringList({"first", "second"}));
}

QTEST_GUILESS_MAIN(TestEventBus)
#include "test_event_bus.moc"
